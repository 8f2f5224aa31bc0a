#pragma once

#include <optional>
#include <string>

extern const bool PRE_RELEASE;
extern const char* const c_version_base;

std::string get_version();

namespace config {
extern bool show_version;
extern bool show_help;
extern bool list_variables;
extern std::string describe_name;
extern std::string config_file;
extern std::optional<bool> only_root;
extern std::optional<double> base_font_size;
extern bool conversion_enabled;
}  // namespace config
