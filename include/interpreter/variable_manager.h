#pragma once

#include <string>
#include <unordered_map>

#include "expression_value.h"

namespace lqv {

// Bindings for one execution of a template block, including the loop item
// and "forloop" object while a for body runs.
class VariableManager {
   public:
    using VariableMap = std::unordered_map<std::string, ExpressionValue>;

    VariableManager() = default;
    ~VariableManager() = default;

    VariableManager(const VariableManager&) = delete;
    VariableManager& operator=(const VariableManager&) = delete;
    VariableManager(VariableManager&&) = default;
    VariableManager& operator=(VariableManager&&) = default;

    void set_variable(const std::string& name, ExpressionValue value);

    // Absent when the name is unbound.
    ExpressionValue get_variable_value(const std::string& var_name) const;
    bool variable_is_set(const std::string& var_name) const;

   private:
    VariableMap variables;
};

}  // namespace lqv
