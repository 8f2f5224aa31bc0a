/*
  loop_evaluator.cpp

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

#include "loop_evaluator.h"

#include <regex>

#include "conditional_evaluator.h"
#include "interpreter_utils.h"

namespace lqv::loop_evaluator {

namespace {

ExpressionValue make_forloop(size_t zero_based_index) {
    ExpressionValue::Object forloop;
    forloop["index"] = ExpressionValue::from_number(static_cast<double>(zero_based_index + 1));
    return ExpressionValue::from_object(std::move(forloop));
}

}  // namespace

std::string handle_for_block(const std::vector<std::string>& src_lines, size_t& idx,
                             const ExpressionEvaluator& evaluator, VariableManager& variables) {
    static const std::regex header_pattern(R"(^for\s+(\w+)\s+in\s+(\w+))");
    std::smatch match;
    if (!std::regex_search(src_lines[idx], match, header_pattern)) {
        return "";
    }
    const std::string item_name = match[1].str();
    const std::string collection_name = match[2].str();

    std::vector<std::string> body;
    size_t j = idx + 1;
    int depth = 1;
    for (; j < src_lines.size(); ++j) {
        const std::string keyword = interpreter_utils::leading_keyword(src_lines[j]);
        if (keyword == "for") {
            depth++;
        } else if (keyword == "endfor") {
            depth--;
            if (depth == 0) {
                break;
            }
        }
        body.push_back(src_lines[j]);
    }
    idx = j;

    ExpressionValue collection = variables.get_variable_value(collection_name);
    if (!collection.is_array()) {
        return "";
    }

    std::string output;
    const auto& items = collection.array_items();
    for (size_t item_index = 0; item_index < items.size(); ++item_index) {
        variables.set_variable(item_name, items[item_index]);
        variables.set_variable("forloop", make_forloop(item_index));

        for (size_t k = 0; k < body.size(); ++k) {
            if (interpreter_utils::leading_keyword(body[k]) == "if") {
                output += conditional_evaluator::handle_if_block(body, k, evaluator, variables);
                continue;
            }
            interpreter_utils::execute_simple_statement(body[k], evaluator, variables, output);
        }
    }
    return output;
}

}  // namespace lqv::loop_evaluator
