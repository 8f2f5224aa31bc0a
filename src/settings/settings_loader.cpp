/*
  settings_loader.cpp

  This file is part of lqvars, a CSS custom property scanner for Liquid themes

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "settings_loader.h"

#include <optional>

#include "debug.h"
#include "error_out.h"

namespace lqv {
namespace settings_loader {

namespace fs = lqv_filesystem::fs;

namespace {

using LoadFn = lqv_filesystem::Result<ordered_json> (*)(const std::string&);

// Tries folder/config/<file_name> in folder order; the first document that
// reads and parses wins.
std::optional<ordered_json> load_first_document(const std::vector<std::string>& folders,
                                                const std::string& file_name, LoadFn parse) {
    for (const auto& folder : folders) {
        fs::path path = fs::path(folder) / "config" / file_name;
        if (!lqv_filesystem::file_exists(path)) {
            continue;
        }

        auto content = lqv_filesystem::read_file_content(path.string());
        if (content.is_error()) {
            print_error({ErrorType::FILE_READ_ERROR, path.string(), content.error(), {}});
            continue;
        }

        auto parsed = parse(content.value());
        if (parsed.is_error()) {
            print_error({ErrorType::SETTINGS_PARSE_ERROR,
                         path.string(),
                         parsed.error(),
                         {"Setting lookups for this document fall back to absent values"}});
            continue;
        }
        return parsed.value();
    }
    return std::nullopt;
}

}  // namespace

std::string strip_block_comments(const std::string& content) {
    std::string result;
    result.reserve(content.size());

    size_t pos = 0;
    while (pos < content.size()) {
        size_t open = content.find("/*", pos);
        if (open == std::string::npos) {
            result.append(content, pos, std::string::npos);
            break;
        }
        result.append(content, pos, open - pos);
        size_t close = content.find("*/", open + 2);
        if (close == std::string::npos) {
            break;
        }
        pos = close + 2;
    }
    return result;
}

lqv_filesystem::Result<ordered_json> parse_settings_data(const std::string& content) {
    ordered_json document;
    try {
        document = ordered_json::parse(strip_block_comments(content));
    } catch (const nlohmann::json::exception& e) {
        return lqv_filesystem::Result<ordered_json>::error(e.what());
    }

    if (document.is_object()) {
        auto current = document.find("current");
        if (current != document.end() && current->is_object()) {
            return lqv_filesystem::Result<ordered_json>::ok(*current);
        }
    }
    return lqv_filesystem::Result<ordered_json>::ok(ordered_json::object());
}

lqv_filesystem::Result<ordered_json> parse_settings_schema(const std::string& content) {
    ordered_json document;
    try {
        document = ordered_json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        return lqv_filesystem::Result<ordered_json>::error(e.what());
    }

    if (!document.is_array()) {
        return lqv_filesystem::Result<ordered_json>::error(
            "expected an array of setting sections");
    }

    ordered_json defaults = ordered_json::object();
    for (const auto& section : document) {
        if (!section.is_object()) {
            continue;
        }
        auto settings = section.find("settings");
        if (settings == section.end() || !settings->is_array()) {
            continue;
        }
        for (const auto& setting : *settings) {
            if (!setting.is_object()) {
                continue;
            }
            auto id = setting.find("id");
            auto default_value = setting.find("default");
            if (id == setting.end() || !id->is_string() || id->get_ref<const std::string&>().empty() ||
                default_value == setting.end()) {
                continue;
            }
            defaults[id->get<std::string>()] = *default_value;
        }
    }
    return lqv_filesystem::Result<ordered_json>::ok(defaults);
}

std::shared_ptr<const SettingsStore> load_settings(const std::vector<std::string>& folders) {
    auto store = std::make_shared<SettingsStore>();

    if (auto current = load_first_document(folders, "settings_data.json", &parse_settings_data)) {
        store->current = std::move(*current);
        debug_msg("Loaded %zu settings from settings_data.json", store->current.size());
    }

    if (auto defaults =
            load_first_document(folders, "settings_schema.json", &parse_settings_schema)) {
        store->schema_defaults = std::move(*defaults);
        debug_msg("Loaded %zu defaults from settings_schema.json", store->schema_defaults.size());
    }

    return store;
}

}  // namespace settings_loader
}  // namespace lqv
