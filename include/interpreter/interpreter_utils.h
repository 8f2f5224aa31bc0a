#pragma once

#include <string>

#include "expression_evaluator.h"
#include "variable_manager.h"

namespace lqv::interpreter_utils {

// Leading run of word characters: "endif" for "endif", "if" for "if x > 1".
std::string leading_keyword(const std::string& line);

// Splits "assign name = expr" into its parts. False for any other line.
bool parse_assign(const std::string& line, std::string& name, std::string& expression);

// Runs an "echo expr" or "assign name = expr" line. Returns false, with no
// effect, for every other line.
bool execute_simple_statement(const std::string& line, const ExpressionEvaluator& evaluator,
                              VariableManager& variables, std::string& output);

}  // namespace lqv::interpreter_utils
