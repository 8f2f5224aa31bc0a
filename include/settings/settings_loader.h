#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lqv_filesystem.h"
#include "settings_store.h"

namespace lqv {
namespace settings_loader {

// Removes every "/* ... */" block comment. An unterminated comment runs to the
// end of the text.
std::string strip_block_comments(const std::string& content);

// The "current" object of a settings_data.json document, or an empty object
// when the document has none.
lqv_filesystem::Result<ordered_json> parse_settings_data(const std::string& content);

// Flattens the sections of a settings_schema.json document into id -> default.
lqv_filesystem::Result<ordered_json> parse_settings_schema(const std::string& content);

// Reads config/settings_data.json and config/settings_schema.json from the
// first workspace folder that has a usable copy of each. Failures are
// reported as warnings and leave the corresponding half of the store empty.
std::shared_ptr<const SettingsStore> load_settings(const std::vector<std::string>& folders);

}  // namespace settings_loader
}  // namespace lqv
