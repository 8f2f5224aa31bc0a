/*
  conditional_evaluator.cpp

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

#include "conditional_evaluator.h"

#include <optional>
#include <regex>

#include "interpreter_utils.h"
#include "parser_utils.h"

namespace lqv::conditional_evaluator {

namespace {

struct ConditionalBranch {
    std::optional<std::string> condition;
    std::vector<std::string> lines;
};

const std::regex& comparison_pattern() {
    static const std::regex pattern(R"((.+?)\s*(>=|<=|>|<|==)\s*(.+))");
    return pattern;
}

std::optional<std::string> parse_tag_condition(const std::string& line,
                                               const std::string& keyword) {
    std::regex pattern("^" + keyword + R"(\s+(.+))");
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }
    return trim_whitespace(match[1].str());
}

// Nested if blocks are evaluated in place so their branches never leak into
// the enclosing one.
void run_branch_lines(const std::vector<std::string>& lines, const ExpressionEvaluator& evaluator,
                      VariableManager& variables, std::string& output) {
    for (size_t i = 0; i < lines.size(); ++i) {
        if (interpreter_utils::leading_keyword(lines[i]) == "if") {
            output += handle_if_block(lines, i, evaluator, variables);
            continue;
        }
        interpreter_utils::execute_simple_statement(lines[i], evaluator, variables, output);
    }
}

}  // namespace

bool evaluate_condition(const std::string& condition, const ExpressionEvaluator& evaluator,
                        const VariableManager& variables) {
    static const std::string contains_operator = " contains ";
    size_t contains_pos = condition.find(contains_operator);
    if (contains_pos != std::string::npos) {
        size_t right_start = contains_pos + contains_operator.size();
        size_t right_end = condition.find(contains_operator, right_start);
        std::string left = trim_whitespace(condition.substr(0, contains_pos));
        std::string right = trim_whitespace(condition.substr(
            right_start, right_end == std::string::npos ? std::string::npos
                                                        : right_end - right_start));

        std::string haystack = evaluator.evaluate(left, variables).to_output_string();
        std::string needle = evaluator.evaluate(right, variables).to_output_string();
        return haystack.find(needle) != std::string::npos;
    }

    std::smatch match;
    if (std::regex_search(condition, match, comparison_pattern())) {
        ExpressionValue left = evaluator.evaluate(trim_whitespace(match[1].str()), variables);
        const std::string op = match[2].str();
        ExpressionValue right = evaluator.evaluate(trim_whitespace(match[3].str()), variables);

        if (op == "==") {
            return left.loose_equals(right);
        }

        double left_number = left.to_float();
        double right_number = right.to_float();
        if (op == ">=") {
            return left_number >= right_number;
        }
        if (op == "<=") {
            return left_number <= right_number;
        }
        if (op == ">") {
            return left_number > right_number;
        }
        return left_number < right_number;
    }

    return evaluator.evaluate(condition, variables).is_truthy();
}

std::string handle_if_block(const std::vector<std::string>& src_lines, size_t& idx,
                            const ExpressionEvaluator& evaluator, VariableManager& variables) {
    auto if_condition = parse_tag_condition(src_lines[idx], "if");
    if (!if_condition) {
        return "";
    }

    std::vector<ConditionalBranch> branches;
    branches.push_back({if_condition, {}});

    size_t j = idx + 1;
    int depth = 1;
    for (; j < src_lines.size(); ++j) {
        const std::string& line = src_lines[j];
        const std::string keyword = interpreter_utils::leading_keyword(line);

        if (keyword == "if") {
            depth++;
        } else if (keyword == "endif") {
            depth--;
            if (depth == 0) {
                break;
            }
        } else if (depth == 1 && keyword == "elsif") {
            if (auto condition = parse_tag_condition(line, "elsif")) {
                branches.push_back({condition, {}});
            }
            continue;
        } else if (depth == 1 && keyword == "else") {
            branches.push_back({std::nullopt, {}});
            continue;
        }
        branches.back().lines.push_back(line);
    }
    idx = j;

    std::string output;
    for (const auto& branch : branches) {
        if (!branch.condition || evaluate_condition(*branch.condition, evaluator, variables)) {
            run_branch_lines(branch.lines, evaluator, variables, output);
            break;
        }
    }
    return output;
}

std::string handle_unless_block(const std::vector<std::string>& src_lines, size_t& idx,
                                const ExpressionEvaluator& evaluator,
                                VariableManager& variables) {
    auto condition = parse_tag_condition(src_lines[idx], "unless");
    if (!condition) {
        return "";
    }

    std::vector<std::string> body;
    size_t j = idx + 1;
    int depth = 1;
    for (; j < src_lines.size(); ++j) {
        const std::string keyword = interpreter_utils::leading_keyword(src_lines[j]);
        if (keyword == "unless") {
            depth++;
        } else if (keyword == "endunless") {
            depth--;
            if (depth == 0) {
                break;
            }
        }
        body.push_back(src_lines[j]);
    }
    idx = j;

    std::string output;
    if (!evaluate_condition(*condition, evaluator, variables)) {
        run_branch_lines(body, evaluator, variables, output);
    }
    return output;
}

}  // namespace lqv::conditional_evaluator
