#pragma once

#include <string>

#include "expression_value.h"
#include "variable_manager.h"

namespace lqv {

class SettingsResolver;

// Evaluates "base | filter: arg | filter ..." expressions. The base is tried
// as, in order: quoted literal, name[index], name.member, bare identifier,
// and finally text with "[name]" placeholders substituted. Numeric text is
// never converted here, so "0" is a non-empty string.
// Unresolvable input comes back as text; evaluation never throws.
class ExpressionEvaluator {
   public:
    explicit ExpressionEvaluator(SettingsResolver* resolver);

    ExpressionValue evaluate(const std::string& expression,
                             const VariableManager& variables) const;

    // Setting lookup through the resolver; absent without one.
    ExpressionValue lookup_setting(const std::string& key) const;

    SettingsResolver* resolver() const {
        return resolver_;
    }

   private:
    ExpressionValue evaluate_base(const std::string& base, const VariableManager& variables) const;
    ExpressionValue evaluate_index_access(const std::string& name, const std::string& index_expr,
                                          const VariableManager& variables) const;
    ExpressionValue evaluate_member_access(const std::string& text, const std::string& name,
                                           const std::string& member,
                                           const VariableManager& variables) const;
    std::string substitute_placeholders(const std::string& text,
                                        const VariableManager& variables) const;

    SettingsResolver* resolver_;
};

// Leading-integer parse: optional sign and decimal digits after whitespace.
// False when no digit follows.
bool parse_int_prefix(const std::string& text, long long& out);

}  // namespace lqv
