#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "color_utils.h"
#include "expression_value.h"
#include "settings_store.h"

namespace lqv {

// Per-scan lookup context over a SettingsStore. Owns the setting and color
// memo tables, so a new resolver is needed whenever the store changes. A null store behaves as "no settings": every lookup is
// absent.
class SettingsResolver {
   public:
    explicit SettingsResolver(std::shared_ptr<const SettingsStore> store);

    // current (dotted paths descend through objects and arrays) first, then
    // the flat schema default for the whole key. Memoized per key.
    ExpressionValue get_setting(const std::string& key);

    // Walks dotted_path from root. Absent as soon as a segment cannot be
    // followed.
    static ExpressionValue resolve_path(const ordered_json& root, const std::string& dotted_path);

    // Memoized by (hex, alpha).
    std::optional<Rgba> hex_to_rgba(const std::string& hex, double alpha = 1.0);

    // Text for "{{ settings.<path> }}".
    std::string resolve_settings_reference(const std::string& path);

    // Text for "{{ scheme.settings.<path> }}" against the first color scheme.
    std::string resolve_scheme_reference(const std::string& path);

    std::optional<ColorScheme> first_color_scheme() const;


   private:
    std::string render_terminal_value(const ordered_json& node, const std::string& last_segment,
                                      bool convert_bare_hex);

    std::shared_ptr<const SettingsStore> store_;
    std::unordered_map<std::string, ExpressionValue> setting_cache_;
    std::map<std::pair<std::string, double>, std::optional<Rgba>> color_cache_;
};

// Canonical text of a setting: numbers and booleans in their canonical form,
// strings verbatim, arrays and objects as "[object]", absent as "".
std::string format_setting_value(const ExpressionValue& value);

}  // namespace lqv
