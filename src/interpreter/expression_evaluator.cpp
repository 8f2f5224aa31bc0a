/*
  expression_evaluator.cpp

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

#include "expression_evaluator.h"

#include <cctype>
#include <cstdlib>
#include <regex>
#include <vector>

#include "filter_chain.h"
#include "quote_info.h"
#include "settings_resolver.h"

namespace lqv {

namespace {

const std::regex& index_access_pattern() {
    static const std::regex pattern(R"(^(\w+)\[([^\]]+)\]$)");
    return pattern;
}

const std::regex& member_access_pattern() {
    static const std::regex pattern(R"(^(\w+)\.(\w+)$)");
    return pattern;
}

const std::regex& identifier_pattern() {
    static const std::regex pattern(R"(^\w+$)");
    return pattern;
}

const std::regex& placeholder_pattern() {
    static const std::regex pattern(R"('?\[([^\]]+)\]'?)");
    return pattern;
}

}  // namespace

bool parse_int_prefix(const std::string& text, long long& out) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
        i++;
    }
    size_t start = i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        i++;
    }
    size_t digits_start = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        i++;
    }
    if (i == digits_start) {
        return false;
    }
    out = std::strtoll(text.substr(start, i - start).c_str(), nullptr, 10);
    return true;
}

ExpressionEvaluator::ExpressionEvaluator(SettingsResolver* resolver) : resolver_(resolver) {
}

ExpressionValue ExpressionEvaluator::evaluate(const std::string& expression,
                                              const VariableManager& variables) const {
    std::vector<std::string> parts = split_unquoted(expression, '|');
    if (parts.empty()) {
        return ExpressionValue::from_string("");
    }

    ExpressionValue value = evaluate_base(parts[0], variables);
    for (size_t i = 1; i < parts.size(); ++i) {
        value = filter_chain::apply_filter(value, parts[i], *this, variables);
    }
    return value;
}

ExpressionValue ExpressionEvaluator::lookup_setting(const std::string& key) const {
    if (resolver_ == nullptr) {
        return ExpressionValue::absent();
    }
    return resolver_->get_setting(key);
}

ExpressionValue ExpressionEvaluator::evaluate_base(const std::string& base,
                                                   const VariableManager& variables) const {
    QuoteInfo quoted(base);
    if (!quoted.is_unquoted()) {
        return ExpressionValue::from_string(quoted.value);
    }

    std::smatch match;
    if (std::regex_match(base, match, index_access_pattern())) {
        return evaluate_index_access(match[1].str(), match[2].str(), variables);
    }

    // Numeric text such as "0" or "1.50" matches one of these two and stays a string.
    if (std::regex_match(base, match, member_access_pattern())) {
        return evaluate_member_access(base, match[1].str(), match[2].str(), variables);
    }

    if (std::regex_match(base, identifier_pattern())) {
        if (variables.variable_is_set(base)) {
            return variables.get_variable_value(base);
        }
        return ExpressionValue::from_string(base);
    }

    return ExpressionValue::from_string(substitute_placeholders(base, variables));
}

ExpressionValue ExpressionEvaluator::evaluate_index_access(const std::string& name,
                                                           const std::string& index_expr,
                                                           const VariableManager& variables) const {
    ExpressionValue index = evaluate(index_expr, variables);

    if (name == "settings") {
        ExpressionValue setting = lookup_setting(index.to_output_string());
        return setting.is_absent() ? ExpressionValue::from_string("") : setting;
    }

    ExpressionValue collection = variables.get_variable_value(name);
    if (!collection.is_array()) {
        return ExpressionValue::from_string("");
    }

    long long position = 0;
    if (!parse_int_prefix(index.to_output_string(), position) || position < 0 ||
        static_cast<size_t>(position) >= collection.array_items().size()) {
        return ExpressionValue::absent();
    }
    return collection.array_items()[static_cast<size_t>(position)];
}

ExpressionValue ExpressionEvaluator::evaluate_member_access(
    const std::string& text, const std::string& name, const std::string& member,
    const VariableManager& variables) const {
    if (name == "settings") {
        ExpressionValue setting = lookup_setting(member);
        return setting.is_absent() ? ExpressionValue::from_string("") : setting;
    }

    ExpressionValue object = variables.get_variable_value(name);
    if (object.has_member(member)) {
        return object.member(member);
    }
    return ExpressionValue::from_string(text);
}

// Each "[name]" (optionally wrapped in single quotes) is replaced, first
// occurrence only, by the binding's text or by nothing when unbound.
std::string ExpressionEvaluator::substitute_placeholders(const std::string& text,
                                                         const VariableManager& variables) const {
    std::vector<std::string> placeholders;
    for (std::sregex_iterator it(text.begin(), text.end(), placeholder_pattern()), end; it != end;
         ++it) {
        placeholders.push_back(it->str());
    }

    std::string result = text;
    for (const auto& placeholder : placeholders) {
        std::string var_name;
        for (char c : placeholder) {
            if (c != '\'' && c != '"' && c != '[' && c != ']') {
                var_name += c;
            }
        }
        std::string replacement = variables.get_variable_value(var_name).to_output_string();
        size_t pos = result.find(placeholder);
        if (pos != std::string::npos) {
            result.replace(pos, placeholder.size(), replacement);
        }
    }
    return result;
}

}  // namespace lqv
