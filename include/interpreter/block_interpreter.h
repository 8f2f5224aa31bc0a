#pragma once

#include <string>

#include "expression_evaluator.h"
#include "variable_manager.h"

namespace lqv {

// Executes the statement body of a "{% liquid %}" tag and returns the text
// its echo statements produce, in document order. Lines are trimmed and blank
// lines dropped. Supported statements: comment/endcomment, assign, for,
// if/elsif/else, unless and echo. Other lines and malformed tags are ignored.
class LiquidBlockInterpreter {
   public:
    explicit LiquidBlockInterpreter(const ExpressionEvaluator& evaluator);

    // Runs with fresh bindings that are discarded afterwards.
    std::string execute(const std::string& code) const;

    std::string execute(const std::string& code, VariableManager& variables) const;

   private:
    const ExpressionEvaluator& evaluator_;
};

}  // namespace lqv
