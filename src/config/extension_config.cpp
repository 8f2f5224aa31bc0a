/*
  extension_config.cpp

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

#include "extension_config.h"

#include "debug.h"
#include "error_out.h"

namespace lqv {

namespace {

void report_bad_type(const std::string& source, const std::string& key, const char* expected) {
    print_error({ErrorType::CONFIG_ERROR, ErrorSeverity::WARNING, source,
                 "option '" + key + "' must be " + expected + ", ignoring it",
                 {"Fix the value type in " + source}});
}

bool read_string_list(const nlohmann::json& options, const std::string& key,
                      const std::string& source, std::vector<std::string>& out) {
    if (!options.contains(key)) {
        return false;
    }
    const auto& node = options.at(key);
    if (!node.is_array()) {
        report_bad_type(source, key, "an array of strings");
        return false;
    }

    std::vector<std::string> patterns;
    for (const auto& item : node) {
        if (!item.is_string()) {
            report_bad_type(source, key, "an array of strings");
            return false;
        }
        patterns.push_back(item.get<std::string>());
    }
    out = std::move(patterns);
    return true;
}

bool read_bool(const nlohmann::json& options, const std::string& key, const std::string& source,
               bool& out) {
    if (!options.contains(key)) {
        return false;
    }
    const auto& node = options.at(key);
    if (!node.is_boolean()) {
        report_bad_type(source, key, "true or false");
        return false;
    }
    out = node.get<bool>();
    return true;
}

}  // namespace

int ExtensionConfig::apply_json(const nlohmann::json& options, const std::string& source) {
    if (!options.is_object()) {
        print_error({ErrorType::CONFIG_ERROR, ErrorSeverity::WARNING, source,
                     "configuration must be a JSON object, ignoring it", {}});
        return 0;
    }

    int applied = 0;
    applied += read_string_list(options, "includePatterns", source, include_patterns) ? 1 : 0;
    applied += read_string_list(options, "excludePatterns", source, exclude_patterns) ? 1 : 0;
    applied += read_bool(options, "remToPxConversion", source, rem_to_px_conversion) ? 1 : 0;
    applied += read_bool(options, "onlyRoot", source, only_root) ? 1 : 0;

    if (options.contains("baseFontSize")) {
        const auto& node = options.at("baseFontSize");
        if (node.is_number() && node.get<double>() > 0.0) {
            base_font_size = node.get<double>();
            applied++;
        } else {
            report_bad_type(source, "baseFontSize", "a positive number");
        }
    }

    debug_msg("config: applied %d option(s) from %s", applied, source.c_str());
    return applied;
}

lqv_filesystem::Result<void> ExtensionConfig::load_file(const std::string& path) {
    auto content = lqv_filesystem::read_file_content(path);
    if (content.is_error()) {
        return lqv_filesystem::Result<void>::error(content.error());
    }

    nlohmann::json options;
    try {
        options = nlohmann::json::parse(content.value());
    } catch (const nlohmann::json::exception& e) {
        return lqv_filesystem::Result<void>::error("Invalid JSON in " + path + ": " + e.what());
    }

    apply_json(options, path);
    return lqv_filesystem::Result<void>::ok();
}

}  // namespace lqv
