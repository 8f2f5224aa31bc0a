#pragma once

#include <string>

#include "expression_value.h"

namespace lqv {

class SettingsResolver;

// Resolves "{% if %}...{% elsif %}...{% else %}...{% endif %}" regions of raw
// template text whose conditions test theme settings, keeping only the text
// of the first branch that holds (nothing when none holds and there is no
// else). Runs before any output substitution. Blocks whose condition has the
// generic "name OP number" shape and no settings reference are left for the
// optimistic pass of the transform.
class StaticConditionalReducer {
   public:
    explicit StaticConditionalReducer(SettingsResolver* resolver);

    std::string reduce(const std::string& text) const;

    // "settings.path OP literal" compares the setting with the literal
    // (quoted -> string, true/false -> boolean, nil/null -> absent, numeric ->
    // number, else string); "==" and "!=" use loose equality. A bare
    // "settings.path" is true unless the setting is false, absent or "".
    // Conditions without a settings reference are false.
    bool evaluate_condition(const std::string& condition) const;

    // True when reduce() resolves a block opened with this condition.
    static bool handles_condition(const std::string& condition);

   private:
    ExpressionValue lookup(const std::string& key) const;

    SettingsResolver* resolver_;
};

// Ordering used for "<", ">", "<=", ">=": two strings compare
// lexicographically, anything else numerically; NaN orders nothing.
bool compare_ordered(const ExpressionValue& left, const std::string& op,
                     const ExpressionValue& right);

}  // namespace lqv
