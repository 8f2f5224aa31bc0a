#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "expression_value.h"

namespace lqv {

using ordered_json = nlohmann::ordered_json;

struct ColorScheme {
    std::string id;
    ordered_json settings;
};

// Theme settings for one scan: the "current" object of settings_data.json and
// the flattened id -> default map of settings_schema.json. Immutable once a
// scan starts.
struct SettingsStore {
    ordered_json current = ordered_json::object();
    ordered_json schema_defaults = ordered_json::object();

    // First entry of current.color_schemes in declaration order.
    std::optional<ColorScheme> first_color_scheme() const;

    bool empty() const;
};

// JSON null maps to absent; objects and arrays keep their structure.
ExpressionValue value_from_json(const ordered_json& node);

}  // namespace lqv
