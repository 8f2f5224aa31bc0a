#pragma once

#include <string>
#include <vector>

#include "expression_evaluator.h"
#include "variable_manager.h"

namespace lqv::loop_evaluator {

// Runs "for item in collection ... endfor" starting at src_lines[idx]. Each
// iteration binds item and forloop.index (1-based); the body supports echo,
// assign and if blocks. A collection that is not an array runs nothing. On
// return idx is the index of the closing endfor (src_lines.size() when
// missing); a malformed opening line leaves idx unchanged.
std::string handle_for_block(const std::vector<std::string>& src_lines, size_t& idx,
                             const ExpressionEvaluator& evaluator, VariableManager& variables);

}  // namespace lqv::loop_evaluator
