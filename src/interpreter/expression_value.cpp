/*
  expression_value.cpp

  This file is part of lqvars, a CSS custom property scanner for Liquid themes

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "expression_value.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace lqv {

namespace {

const double kNaN = std::numeric_limits<double>::quiet_NaN();

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Scans a decimal literal starting at start. On success end points one past
// the literal.
bool scan_number(const std::string& text, size_t start, size_t& end, double& out) {
    size_t i = start;
    const size_t n = text.size();
    double sign = 1.0;

    if (i < n && (text[i] == '+' || text[i] == '-')) {
        if (text[i] == '-') {
            sign = -1.0;
        }
        i++;
    }

    static const std::string kInfinity = "Infinity";
    if (text.compare(i, kInfinity.size(), kInfinity) == 0) {
        end = i + kInfinity.size();
        out = sign * std::numeric_limits<double>::infinity();
        return true;
    }

    size_t digit_count = 0;
    while (i < n && is_digit(text[i])) {
        i++;
        digit_count++;
    }

    if (i < n && text[i] == '.') {
        size_t j = i + 1;
        size_t fraction_digits = 0;
        while (j < n && is_digit(text[j])) {
            j++;
            fraction_digits++;
        }
        if (digit_count > 0 || fraction_digits > 0) {
            i = j;
            digit_count += fraction_digits;
        }
    }

    if (digit_count == 0) {
        return false;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        size_t j = i + 1;
        if (j < n && (text[j] == '+' || text[j] == '-')) {
            j++;
        }
        size_t exponent_digits = 0;
        while (j < n && is_digit(text[j])) {
            j++;
            exponent_digits++;
        }
        if (exponent_digits > 0) {
            i = j;
        }
    }

    end = i;
    out = std::strtod(text.substr(start, i - start).c_str(), nullptr);
    return true;
}

}  // namespace

double parse_float_prefix(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && is_space(text[start])) {
        start++;
    }
    size_t end = 0;
    double value = 0.0;
    if (!scan_number(text, start, end, value)) {
        return kNaN;
    }
    return value;
}

double parse_number_strict(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && is_space(text[start])) {
        start++;
    }
    size_t last = text.size();
    while (last > start && is_space(text[last - 1])) {
        last--;
    }
    if (start == last) {
        return 0.0;
    }

    std::string trimmed = text.substr(start, last - start);
    size_t end = 0;
    double value = 0.0;
    if (!scan_number(trimmed, 0, end, value) || end != trimmed.size()) {
        return kNaN;
    }
    return value;
}

std::string format_number(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == 0.0) {
        return "0";
    }

    char buffer[64];
    const double magnitude = std::fabs(value);

    if (magnitude < 1e21 && std::floor(value) == value) {
        std::snprintf(buffer, sizeof(buffer), "%.0f", value);
        return buffer;
    }

    if (magnitude >= 1e-6 && magnitude < 1e21) {
        for (int precision = 1; precision <= 25; ++precision) {
            std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
            if (std::strtod(buffer, nullptr) == value) {
                return buffer;
            }
        }
    }

    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            return buffer;
        }
    }
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    return buffer;
}

ExpressionValue ExpressionValue::absent() {
    return ExpressionValue();
}

ExpressionValue ExpressionValue::from_string(std::string value) {
    ExpressionValue result;
    result.kind_ = Kind::STRING;
    result.string_ = std::move(value);
    return result;
}

ExpressionValue ExpressionValue::from_number(double value) {
    ExpressionValue result;
    result.kind_ = Kind::NUMBER;
    result.number_ = value;
    return result;
}

ExpressionValue ExpressionValue::from_bool(bool value) {
    ExpressionValue result;
    result.kind_ = Kind::BOOLEAN;
    result.boolean_ = value;
    return result;
}

ExpressionValue ExpressionValue::from_array(Array items) {
    ExpressionValue result;
    result.kind_ = Kind::ARRAY;
    result.array_ = std::move(items);
    return result;
}

ExpressionValue ExpressionValue::from_object(Object members) {
    ExpressionValue result;
    result.kind_ = Kind::OBJECT;
    result.object_ = std::make_shared<const Object>(std::move(members));
    return result;
}

ExpressionValue ExpressionValue::member(const std::string& key) const {
    if (kind_ != Kind::OBJECT || !object_) {
        return absent();
    }
    auto it = object_->find(key);
    if (it == object_->end()) {
        return absent();
    }
    return it->second;
}

bool ExpressionValue::has_member(const std::string& key) const {
    return kind_ == Kind::OBJECT && object_ && object_->find(key) != object_->end();
}

std::string ExpressionValue::to_output_string() const {
    switch (kind_) {
        case Kind::STRING:
            return string_;
        case Kind::NUMBER:
            return format_number(number_);
        case Kind::BOOLEAN:
            return boolean_ ? "true" : "false";
        case Kind::ARRAY: {
            std::string joined;
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) {
                    joined += ',';
                }
                joined += array_[i].to_output_string();
            }
            return joined;
        }
        case Kind::OBJECT:
            return "[object]";
        case Kind::ABSENT:
        default:
            return "";
    }
}

double ExpressionValue::to_float() const {
    switch (kind_) {
        case Kind::NUMBER:
            return number_;
        case Kind::STRING:
        case Kind::ARRAY:
            return parse_float_prefix(to_output_string());
        case Kind::ABSENT:
        case Kind::BOOLEAN:
        case Kind::OBJECT:
        default:
            return kNaN;
    }
}

double ExpressionValue::to_number() const {
    switch (kind_) {
        case Kind::NUMBER:
            return number_;
        case Kind::BOOLEAN:
            return boolean_ ? 1.0 : 0.0;
        case Kind::STRING:
        case Kind::ARRAY:
            return parse_number_strict(to_output_string());
        case Kind::ABSENT:
        case Kind::OBJECT:
        default:
            return kNaN;
    }
}

bool ExpressionValue::is_truthy() const {
    switch (kind_) {
        case Kind::STRING:
            return !string_.empty();
        case Kind::NUMBER:
            return number_ != 0.0 && !std::isnan(number_);
        case Kind::BOOLEAN:
            return boolean_;
        case Kind::ARRAY:
        case Kind::OBJECT:
            return true;
        case Kind::ABSENT:
        default:
            return false;
    }
}

// Same kind: value comparison, composites never equal. Absent equals only
// absent. A boolean operand is compared as 1/0; number against string
// converts the string strictly; a composite against a primitive compares its
// output string.
bool ExpressionValue::loose_equals(const ExpressionValue& other) const {
    if (kind_ == other.kind_) {
        switch (kind_) {
            case Kind::ABSENT:
                return true;
            case Kind::STRING:
                return string_ == other.string_;
            case Kind::NUMBER:
                return number_ == other.number_;
            case Kind::BOOLEAN:
                return boolean_ == other.boolean_;
            case Kind::ARRAY:
            case Kind::OBJECT:
            default:
                return false;
        }
    }

    if (is_absent() || other.is_absent()) {
        return false;
    }

    if (is_bool()) {
        return from_number(to_number()).loose_equals(other);
    }
    if (other.is_bool()) {
        return loose_equals(from_number(other.to_number()));
    }

    if (is_number() && other.is_string()) {
        return number_ == parse_number_strict(other.string_);
    }
    if (is_string() && other.is_number()) {
        return parse_number_strict(string_) == other.number_;
    }

    const bool this_composite = is_array() || is_object();
    const bool other_composite = other.is_array() || other.is_object();
    if (this_composite && !other_composite) {
        return from_string(to_output_string()).loose_equals(other);
    }
    if (other_composite && !this_composite) {
        return loose_equals(from_string(other.to_output_string()));
    }

    return false;
}

bool ExpressionValue::strict_equals(const ExpressionValue& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::ABSENT:
            return true;
        case Kind::STRING:
            return string_ == other.string_;
        case Kind::NUMBER:
            return number_ == other.number_ || (std::isnan(number_) && std::isnan(other.number_));
        case Kind::BOOLEAN:
            return boolean_ == other.boolean_;
        case Kind::ARRAY:
        case Kind::OBJECT:
        default:
            return false;
    }
}

}  // namespace lqv
