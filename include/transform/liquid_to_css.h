#pragma once

#include <functional>
#include <string>
#include <vector>

#include "block_interpreter.h"
#include "expression_evaluator.h"
#include "static_conditional_reducer.h"

namespace lqv {

class SettingsResolver;

// Value substituted for "{{ identifier }}" outputs of template locals.
inline constexpr const char* kLocalOutputFallback = "0.15";

struct TransformStage {
    const char* name;
    std::function<std::string(const std::string&)> apply;
};

// Reduces one templated style block to plain CSS through a fixed sequence of
// textual stages. Each stage assumes the tags handled by earlier stages are
// gone:
//   1. execute_liquid_tags            {% liquid %} bodies -> their echo output
//   2. expand_first_color_scheme      "for x in settings.color_schemes" -> one
//                                     iteration for the first scheme
//   3. strip_assign_tags              {% assign %} -> nothing
//   4. reduce_static_conditionals     settings-driven if blocks -> one branch
//   5. take_then_branches             remaining "if name OP number" blocks ->
//                                     their then branch
//   6. substitute_scheme_references   {{ scheme.settings.* }}
//   7. substitute_settings_references {{ settings.* }}
//   8. substitute_local_outputs       {{ identifier }} -> kLocalOutputFallback
//   9. strip_template_markup          every remaining tag and output -> nothing
class LiquidToCss {
   public:
    explicit LiquidToCss(SettingsResolver* resolver);

    LiquidToCss(const LiquidToCss&) = delete;
    LiquidToCss& operator=(const LiquidToCss&) = delete;

    std::string transform(const std::string& block_text) const;

    const std::vector<TransformStage>& stages() const {
        return stages_;
    }

    std::string execute_liquid_tags(const std::string& text) const;
    std::string expand_first_color_scheme(const std::string& text) const;
    static std::string strip_assign_tags(const std::string& text);
    std::string reduce_static_conditionals(const std::string& text) const;
    static std::string take_then_branches(const std::string& text);
    std::string substitute_scheme_references(const std::string& text) const;
    std::string substitute_settings_references(const std::string& text) const;
    static std::string substitute_local_outputs(const std::string& text);
    static std::string strip_template_markup(const std::string& text);

   private:
    std::string first_iteration(const std::string& loop_variable, const std::string& body) const;

    SettingsResolver* resolver_;
    ExpressionEvaluator evaluator_;
    LiquidBlockInterpreter interpreter_;
    StaticConditionalReducer reducer_;
    std::vector<TransformStage> stages_;
};

}  // namespace lqv
