/*
  filter_chain.cpp

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

#include "filter_chain.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <vector>

#include "expression_evaluator.h"
#include "quote_info.h"
#include "string_utils.h"

namespace lqv {
namespace filter_chain {

namespace {

const std::regex& filter_pattern() {
    static const std::regex pattern(R"(^(\w+)(?::\s*(.+))?$)");
    return pattern;
}

const std::regex& replace_arguments_pattern() {
    static const std::regex pattern(R"(['"]([^'"]*)['"]\s*,\s*(.+))");
    return pattern;
}

const std::regex& quoted_text_pattern() {
    static const std::regex pattern(R"(^['"].*['"]$)");
    return pattern;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Numeric argument of times/divided_by/minus/plus; fallback when omitted.
double numeric_argument(const std::string* argument, double fallback,
                        const ExpressionEvaluator& evaluator, const VariableManager& variables) {
    if (argument == nullptr) {
        return fallback;
    }
    return evaluator.evaluate(*argument, variables).to_float();
}

ExpressionValue apply_split(const ExpressionValue& value, const std::string* argument) {
    std::string delimiter = ",";
    if (argument != nullptr) {
        delimiter = strip_outer_quotes(string_utils::trim_ascii_whitespace_copy(*argument));
    }

    std::string text = value.to_output_string();
    ExpressionValue::Array items;
    if (!(text.empty() && delimiter.empty())) {
        for (auto& piece : string_utils::split(text, delimiter)) {
            items.push_back(ExpressionValue::from_string(std::move(piece)));
        }
    }
    return ExpressionValue::from_array(std::move(items));
}

ExpressionValue apply_replace(const ExpressionValue& value, const std::string* argument,
                              const ExpressionEvaluator& evaluator,
                              const VariableManager& variables) {
    std::smatch match;
    if (argument == nullptr || !std::regex_search(*argument, match, replace_arguments_pattern())) {
        return value;
    }

    std::string search = match[1].str();
    std::string replacement_expr = string_utils::trim_ascii_whitespace_copy(match[2].str());
    std::string replacement = evaluator.evaluate(replacement_expr, variables).to_output_string();
    if (replacement == replacement_expr && std::regex_match(replacement_expr, quoted_text_pattern())) {
        replacement = strip_outer_quotes(replacement_expr);
    }

    return ExpressionValue::from_string(
        string_utils::replace_all(value.to_output_string(), search, replacement));
}

ExpressionValue apply_uniq(const ExpressionValue& value) {
    if (!value.is_array()) {
        return value;
    }
    ExpressionValue::Array unique;
    for (const auto& item : value.array_items()) {
        bool seen = std::any_of(unique.begin(), unique.end(), [&](const ExpressionValue& kept) {
            return kept.strict_equals(item);
        });
        if (!seen) {
            unique.push_back(item);
        }
    }
    return ExpressionValue::from_array(std::move(unique));
}

ExpressionValue apply_sort_natural(const ExpressionValue& value) {
    if (!value.is_array()) {
        return value;
    }
    ExpressionValue::Array sorted = value.array_items();
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ExpressionValue& a, const ExpressionValue& b) {
                         return natural_compare(a.to_output_string(), b.to_output_string()) < 0;
                     });
    return ExpressionValue::from_array(std::move(sorted));
}

ExpressionValue apply_find_index(const ExpressionValue& value, const std::string* argument,
                                 const ExpressionEvaluator& evaluator,
                                 const VariableManager& variables) {
    ExpressionValue needle = argument != nullptr ? evaluator.evaluate(*argument, variables)
                                                 : ExpressionValue::from_string("");
    if (!value.is_array()) {
        return ExpressionValue::from_number(-1);
    }

    const auto& items = value.array_items();
    const ExpressionValue needle_text = ExpressionValue::from_string(needle.to_output_string());
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].strict_equals(needle_text)) {
            return ExpressionValue::from_number(static_cast<double>(i));
        }
    }

    // "048" and "48" name the same entry
    double needle_number = parse_float_prefix(needle_text.string_value());
    if (!std::isnan(needle_number)) {
        for (size_t i = 0; i < items.size(); ++i) {
            if (items[i].to_float() == needle_number) {
                return ExpressionValue::from_number(static_cast<double>(i));
            }
        }
    }
    return ExpressionValue::from_number(-1);
}

}  // namespace

double round_to_five_places(double value) {
    return std::floor(value * 100000.0 + 0.5) / 100000.0;
}

int natural_compare(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (is_digit(a[i]) && is_digit(b[j])) {
            size_t a_end = i;
            size_t b_end = j;
            while (a_end < a.size() && is_digit(a[a_end])) {
                a_end++;
            }
            while (b_end < b.size() && is_digit(b[b_end])) {
                b_end++;
            }

            std::string a_run = a.substr(i, a_end - i);
            std::string b_run = b.substr(j, b_end - j);
            a_run.erase(0, std::min(a_run.find_first_not_of('0'), a_run.size()));
            b_run.erase(0, std::min(b_run.find_first_not_of('0'), b_run.size()));

            if (a_run.size() != b_run.size()) {
                return a_run.size() < b_run.size() ? -1 : 1;
            }
            int cmp = a_run.compare(b_run);
            if (cmp != 0) {
                return cmp < 0 ? -1 : 1;
            }
            i = a_end;
            j = b_end;
            continue;
        }

        int ca = std::tolower(static_cast<unsigned char>(a[i]));
        int cb = std::tolower(static_cast<unsigned char>(b[j]));
        if (ca != cb) {
            return ca < cb ? -1 : 1;
        }
        i++;
        j++;
    }

    if (i < a.size()) {
        return 1;
    }
    if (j < b.size()) {
        return -1;
    }
    return 0;
}

ExpressionValue apply_filter(const ExpressionValue& value, const std::string& filter,
                             const ExpressionEvaluator& evaluator,
                             const VariableManager& variables) {
    std::smatch match;
    if (!std::regex_match(filter, match, filter_pattern())) {
        return value;
    }

    const std::string name = match[1].str();
    const std::string argument_text = match[2].str();
    const std::string* argument = match[2].matched ? &argument_text : nullptr;

    if (name == "split") {
        return apply_split(value, argument);
    }
    if (name == "replace") {
        return apply_replace(value, argument, evaluator, variables);
    }
    if (name == "append") {
        std::string suffix =
            argument != nullptr ? evaluator.evaluate(*argument, variables).to_output_string() : "";
        return ExpressionValue::from_string(value.to_output_string() + suffix);
    }
    if (name == "times") {
        double result = value.to_float() * numeric_argument(argument, 1.0, evaluator, variables);
        return ExpressionValue::from_number(std::isnan(result) ? 0.0
                                                               : round_to_five_places(result));
    }
    if (name == "divided_by") {
        double divisor = numeric_argument(argument, 1.0, evaluator, variables);
        if (divisor == 0.0) {
            return ExpressionValue::from_number(0.0);
        }
        double result = value.to_float() / divisor;
        return ExpressionValue::from_number(std::isnan(result) ? 0.0
                                                               : round_to_five_places(result));
    }
    if (name == "minus") {
        double result = value.to_float() - numeric_argument(argument, 0.0, evaluator, variables);
        return ExpressionValue::from_number(std::isnan(result) ? 0.0 : result);
    }
    if (name == "plus") {
        double result = value.to_float() + numeric_argument(argument, 0.0, evaluator, variables);
        return ExpressionValue::from_number(std::isnan(result) ? 0.0 : result);
    }
    if (name == "uniq") {
        return apply_uniq(value);
    }
    if (name == "sort_natural") {
        return apply_sort_natural(value);
    }
    if (name == "find_index") {
        return apply_find_index(value, argument, evaluator, variables);
    }

    // font_modify and font_face need font metadata the settings files do not carry.
    return value;
}

}  // namespace filter_chain
}  // namespace lqv
