/*
  block_interpreter.cpp

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

#include "block_interpreter.h"

#include <vector>

#include "conditional_evaluator.h"
#include "debug.h"
#include "interpreter_utils.h"
#include "loop_evaluator.h"
#include "string_utils.h"

namespace lqv {

LiquidBlockInterpreter::LiquidBlockInterpreter(const ExpressionEvaluator& evaluator)
    : evaluator_(evaluator) {
}

std::string LiquidBlockInterpreter::execute(const std::string& code) const {
    VariableManager variables;
    return execute(code, variables);
}

std::string LiquidBlockInterpreter::execute(const std::string& code,
                                            VariableManager& variables) const {
    const std::vector<std::string> lines = string_utils::split_statement_lines(code);
    std::string output;
    bool in_comment = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        if (line == "comment" || string_utils::starts_with(line, "comment ")) {
            in_comment = true;
            continue;
        }
        if (line == "endcomment") {
            in_comment = false;
            continue;
        }
        if (in_comment) {
            continue;
        }

        const std::string keyword = interpreter_utils::leading_keyword(line);
        if (keyword == "for") {
            output += loop_evaluator::handle_for_block(lines, i, evaluator_, variables);
        } else if (keyword == "unless") {
            output += conditional_evaluator::handle_unless_block(lines, i, evaluator_, variables);
        } else if (keyword == "if") {
            output += conditional_evaluator::handle_if_block(lines, i, evaluator_, variables);
        } else if (!interpreter_utils::execute_simple_statement(line, evaluator_, variables,
                                                                output)) {
            debug_msg("liquid: ignoring statement '%s'", line.c_str());
        }
    }
    return output;
}

}  // namespace lqv
