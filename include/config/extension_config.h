#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lqv_filesystem.h"

namespace lqv {

// Workspace-relative file holding project overrides.
inline constexpr const char* kProjectConfigFile = ".lqvars.json";

struct ExtensionConfig {
    std::vector<std::string> include_patterns = {
        "**/*.liquid",
        "**/snippets/theme-styles-*.liquid",
        "**/snippets/color-schemes.liquid",
    };
    std::vector<std::string> exclude_patterns = {"**/node_modules/**"};
    bool rem_to_px_conversion = true;
    double base_font_size = 16.0;
    bool only_root = true;

    // Overrides the fields named by includePatterns, excludePatterns,
    // remToPxConversion, baseFontSize and onlyRoot. Keys with the wrong type
    // are reported and skipped. Returns the number of fields applied.
    int apply_json(const nlohmann::json& options, const std::string& source = kProjectConfigFile);

    lqv_filesystem::Result<void> load_file(const std::string& path);
};

}  // namespace lqv
