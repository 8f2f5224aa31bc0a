#pragma once

#include <optional>
#include <string>

#include "extension_config.h"
#include "variable_registry.h"

namespace lqv {

// Fixed-point text with half-up rounding on the exact decimal expansion of
// value, as in "toFixed".
std::string to_fixed(double value, int digits);

// Leading number of value times base_font_size, two decimals, trailing zeros
// dropped. nullopt when value does not start with a number.
std::optional<std::string> rem_to_px(const std::string& value, double base_font_size = 16.0);

// Leading number of value divided by base_font_size, four decimals, trailing
// zeros dropped.
std::optional<std::string> px_to_rem(const std::string& value, double base_font_size = 16.0);

// "24px" for a value holding "1.5rem", "1.5rem" for one holding "24px".
// Rem takes precedence; nothing when conversion is disabled.
std::optional<std::string> conversion_hint(const std::string& value, const ExtensionConfig& config);

// Multi-line hover text for one registry entry.
std::string describe_variable(const CssVariableEntry& entry, const ExtensionConfig& config);

}  // namespace lqv
