/*
  static_conditional_reducer.cpp

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

#include "static_conditional_reducer.h"

#include <cmath>
#include <optional>
#include <regex>
#include <vector>

#include "parser_utils.h"
#include "settings_resolver.h"
#include "template_tags.h"

namespace lqv {

namespace {

struct Branch {
    std::optional<std::string> condition;
    size_t begin;
    size_t end;
};

const std::regex& settings_comparison_pattern() {
    static const std::regex pattern(R"((?:^|[^\w.])settings\.([\w.]+)\s*(==|!=|<=|>=|<|>)\s*(.+))");
    return pattern;
}

const std::regex& settings_reference_pattern() {
    static const std::regex pattern(R"((?:^|[^\w.])settings\.([\w.]+))");
    return pattern;
}

const std::regex& generic_comparison_pattern() {
    static const std::regex pattern(R"(^[\w.]+\s*[<>=!]+\s*\d+$)");
    return pattern;
}

// First literal of the right-hand side; a quoted literal runs to its closing
// quote, anything else to the next whitespace.
ExpressionValue parse_literal(const std::string& text) {
    std::string rest = trim_whitespace(text);
    if (!rest.empty() && (rest.front() == '\'' || rest.front() == '"')) {
        size_t close = rest.find(rest.front(), 1);
        return ExpressionValue::from_string(
            rest.substr(1, close == std::string::npos ? std::string::npos : close - 1));
    }

    std::string token = rest.substr(0, rest.find_first_of(" \t\r\n"));
    if (token == "true" || token == "false") {
        return ExpressionValue::from_bool(token == "true");
    }
    if (token == "nil" || token == "null") {
        return ExpressionValue::absent();
    }
    double number = parse_number_strict(token);
    if (!token.empty() && !std::isnan(number)) {
        return ExpressionValue::from_number(number);
    }
    return ExpressionValue::from_string(token);
}

}  // namespace

bool compare_ordered(const ExpressionValue& left, const std::string& op,
                     const ExpressionValue& right) {
    if (left.is_string() && right.is_string()) {
        int cmp = left.string_value().compare(right.string_value());
        if (op == "<") {
            return cmp < 0;
        }
        if (op == ">") {
            return cmp > 0;
        }
        if (op == "<=") {
            return cmp <= 0;
        }
        return cmp >= 0;
    }

    double a = left.to_number();
    double b = right.to_number();
    if (op == "<") {
        return a < b;
    }
    if (op == ">") {
        return a > b;
    }
    if (op == "<=") {
        return a <= b;
    }
    return a >= b;
}

StaticConditionalReducer::StaticConditionalReducer(SettingsResolver* resolver)
    : resolver_(resolver) {
}

ExpressionValue StaticConditionalReducer::lookup(const std::string& key) const {
    if (resolver_ == nullptr) {
        return ExpressionValue::absent();
    }
    return resolver_->get_setting(key);
}

bool StaticConditionalReducer::handles_condition(const std::string& condition) {
    return std::regex_search(condition, settings_reference_pattern()) ||
           !std::regex_match(condition, generic_comparison_pattern());
}

bool StaticConditionalReducer::evaluate_condition(const std::string& condition) const {
    std::smatch match;
    if (std::regex_search(condition, match, settings_comparison_pattern())) {
        ExpressionValue actual = lookup(match[1].str());
        const std::string op = match[2].str();
        ExpressionValue expected = parse_literal(match[3].str());

        if (op == "==") {
            return actual.loose_equals(expected);
        }
        if (op == "!=") {
            return !actual.loose_equals(expected);
        }
        return compare_ordered(actual, op, expected);
    }

    if (std::regex_search(condition, match, settings_reference_pattern())) {
        ExpressionValue actual = lookup(match[1].str());
        if (actual.is_absent()) {
            return false;
        }
        if (actual.is_bool()) {
            return actual.bool_value();
        }
        return !(actual.is_string() && actual.string_value().empty());
    }

    return false;
}

std::string StaticConditionalReducer::reduce(const std::string& text) const {
    std::string result;
    result.reserve(text.size());
    size_t copied = 0;
    size_t pos = 0;

    while (auto tag = find_next_tag(text, pos)) {
        if (tag->name != "if" || !handles_condition(tag->markup)) {
            pos = tag->end;
            continue;
        }

        std::vector<TemplateTag> separators;
        auto end = find_block_end(text, *tag, "if", "endif", {"elsif", "else"}, &separators);
        if (!end) {
            pos = tag->end;
            continue;
        }

        std::vector<Branch> branches;
        std::optional<std::string> condition = tag->markup;
        size_t branch_begin = tag->end;
        for (const auto& separator : separators) {
            branches.push_back({condition, branch_begin, separator.begin});
            if (separator.name == "else") {
                condition.reset();
            } else {
                condition = separator.markup;
            }
            branch_begin = separator.end;
        }
        branches.push_back({condition, branch_begin, end->begin});

        std::string chosen;
        for (const auto& branch : branches) {
            if (!branch.condition || evaluate_condition(*branch.condition)) {
                chosen = reduce(text.substr(branch.begin, branch.end - branch.begin));
                break;
            }
        }

        result.append(text, copied, tag->begin - copied);
        result += chosen;
        copied = end->end;
        pos = end->end;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

}  // namespace lqv
