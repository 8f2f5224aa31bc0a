#pragma once

#include <string>

#include "expression_value.h"
#include "variable_manager.h"

namespace lqv {

class ExpressionEvaluator;

namespace filter_chain {

// Applies one "name" or "name: argument" filter segment. Unknown filters and
// segments that do not parse return value unchanged.
ExpressionValue apply_filter(const ExpressionValue& value, const std::string& filter,
                             const ExpressionEvaluator& evaluator,
                             const VariableManager& variables);

// Natural ordering: digit runs compare by numeric value, other characters
// case-insensitively. Negative, zero or positive like strcmp.
int natural_compare(const std::string& a, const std::string& b);

// Rounds half up to five decimal places.
double round_to_five_places(double value);

}  // namespace filter_chain
}  // namespace lqv
