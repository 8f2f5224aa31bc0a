#pragma once

#include <string>
#include <vector>

#include "expression_evaluator.h"
#include "variable_manager.h"

namespace lqv::conditional_evaluator {

// "a contains b" is a substring test on the operands' text. Otherwise the
// first ">=", "<=", ">", "<" or "==" found splits the condition; ordering
// operators compare leading-number values and "==" uses loose equality.
// Anything else is a truthiness test of the evaluated expression.
bool evaluate_condition(const std::string& condition, const ExpressionEvaluator& evaluator,
                        const VariableManager& variables);

// Runs the if/elsif/else/endif block whose "if" line is src_lines[idx] and
// returns the text echoed by the first branch whose condition holds. Echo, assign
// and nested if lines of that branch run. On return idx is the index of the
// closing endif (src_lines.size() when missing); a malformed opening line
// leaves idx unchanged and produces nothing.
std::string handle_if_block(const std::vector<std::string>& src_lines, size_t& idx,
                            const ExpressionEvaluator& evaluator, VariableManager& variables);

// Same contract as handle_if_block for unless/endunless; the body runs when the
// condition is false.
std::string handle_unless_block(const std::vector<std::string>& src_lines, size_t& idx,
                                const ExpressionEvaluator& evaluator,
                                VariableManager& variables);

}  // namespace lqv::conditional_evaluator
