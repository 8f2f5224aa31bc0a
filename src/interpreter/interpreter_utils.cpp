/*
  interpreter_utils.cpp

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

#include "interpreter_utils.h"

#include <regex>

#include "parser_utils.h"
#include "string_utils.h"

namespace lqv::interpreter_utils {

std::string leading_keyword(const std::string& line) {
    size_t end = 0;
    while (end < line.size() && is_word_char(line[end])) {
        end++;
    }
    return line.substr(0, end);
}

bool parse_assign(const std::string& line, std::string& name, std::string& expression) {
    static const std::regex assign_pattern(R"(^assign\s+(\w+)\s*=\s*(.+))");
    std::smatch match;
    if (!std::regex_search(line, match, assign_pattern)) {
        return false;
    }
    name = match[1].str();
    expression = trim_whitespace(match[2].str());
    return true;
}

bool execute_simple_statement(const std::string& line, const ExpressionEvaluator& evaluator,
                              VariableManager& variables, std::string& output) {
    if (string_utils::starts_with(line, "echo ")) {
        output += evaluator.evaluate(trim_whitespace(line.substr(5)), variables).to_output_string();
        return true;
    }

    if (string_utils::starts_with(line, "assign ")) {
        std::string name;
        std::string expression;
        if (parse_assign(line, name, expression)) {
            variables.set_variable(name, evaluator.evaluate(expression, variables));
        }
        return true;
    }

    return false;
}

}  // namespace lqv::interpreter_utils
