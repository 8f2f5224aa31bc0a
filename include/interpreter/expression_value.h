#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lqv {

// Tagged value produced by expression evaluation.
//
// Coercion rules:
//  - output string: absent -> "", number -> shortest round-trip decimal form
//    ("14", "1.5", "NaN", "Infinity"), boolean -> "true"/"false", array ->
//    elements' output strings joined by ",", object -> "[object]".
//  - to_float(): leading-number parse of the output string ("14px" -> 14,
//    "abc" -> NaN); absent and booleans are NaN.
//  - to_number(): whole-string numeric conversion; "" -> 0, booleans -> 1/0,
//    absent -> NaN, trailing garbage -> NaN.
//  - truthiness: absent, "", false, 0 and NaN are falsy; everything else,
//    including empty arrays, is truthy.
//  - loose_equals(): see expression_value.cpp.
class ExpressionValue {
   public:
    enum class Kind : std::uint8_t {
        ABSENT,
        STRING,
        NUMBER,
        BOOLEAN,
        ARRAY,
        OBJECT
    };

    using Array = std::vector<ExpressionValue>;
    using Object = std::map<std::string, ExpressionValue>;

    ExpressionValue() = default;

    static ExpressionValue absent();
    static ExpressionValue from_string(std::string value);
    static ExpressionValue from_number(double value);
    static ExpressionValue from_bool(bool value);
    static ExpressionValue from_array(Array items);
    static ExpressionValue from_object(Object members);

    Kind kind() const {
        return kind_;
    }
    bool is_absent() const {
        return kind_ == Kind::ABSENT;
    }
    bool is_string() const {
        return kind_ == Kind::STRING;
    }
    bool is_number() const {
        return kind_ == Kind::NUMBER;
    }
    bool is_bool() const {
        return kind_ == Kind::BOOLEAN;
    }
    bool is_array() const {
        return kind_ == Kind::ARRAY;
    }
    bool is_object() const {
        return kind_ == Kind::OBJECT;
    }

    const std::string& string_value() const {
        return string_;
    }
    double number_value() const {
        return number_;
    }
    bool bool_value() const {
        return boolean_;
    }
    const Array& array_items() const {
        return array_;
    }

    // Member lookup on an object value; absent for other kinds or unknown keys.
    ExpressionValue member(const std::string& key) const;
    bool has_member(const std::string& key) const;

    std::string to_output_string() const;
    double to_float() const;
    double to_number() const;
    bool is_truthy() const;

    bool loose_equals(const ExpressionValue& other) const;
    bool strict_equals(const ExpressionValue& other) const;

   private:
    Kind kind_ = Kind::ABSENT;
    std::string string_;
    double number_ = 0.0;
    bool boolean_ = false;
    Array array_;
    std::shared_ptr<const Object> object_;
};

// Shortest decimal text that reads back as value.
std::string format_number(double value);

// Leading-number parse: optional whitespace, sign, digits, fraction and
// exponent, or "Infinity". Returns NaN when no number starts the text.
double parse_float_prefix(const std::string& text);

// Whole-string numeric conversion; empty or blank text is 0.
double parse_number_strict(const std::string& text);

}  // namespace lqv
