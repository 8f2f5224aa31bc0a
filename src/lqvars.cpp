/*
  lqvars.cpp

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

#include "lqvars.h"

#include <iostream>
#include <vector>

#include "debug.h"
#include "error_out.h"
#include "extension_config.h"
#include "flags.h"
#include "lqv_filesystem.h"
#include "unit_conversion.h"
#include "usage.h"
#include "variable_scanner.h"
#include "workspace.h"

const bool PRE_RELEASE = false;
const char* const c_version_base = "1.0.0";

std::string get_version() {
    static std::string cached_version =
        std::string(c_version_base) + (PRE_RELEASE ? " (pre-release)" : "");
    return cached_version;
}

namespace config {
bool show_version = false;
bool show_help = false;
bool list_variables = true;
std::string describe_name;
std::string config_file;
std::optional<bool> only_root;
std::optional<double> base_font_size;
bool conversion_enabled = true;
}  // namespace config

namespace {

lqv::ExtensionConfig load_extension_config(const std::vector<std::string>& folders) {
    lqv::ExtensionConfig extension_config;

    std::string path = config::config_file;
    if (path.empty()) {
        auto project_file = lqv_filesystem::fs::path(folders.front()) / lqv::kProjectConfigFile;
        if (lqv_filesystem::file_exists(project_file)) {
            path = project_file.string();
        }
    }

    if (!path.empty()) {
        auto loaded = extension_config.load_file(path);
        if (loaded.is_error()) {
            print_error({ErrorType::CONFIG_ERROR, ErrorSeverity::WARNING, path, loaded.error(),
                         {"Falling back to the default options"}});
        }
    }

    // command line flags win over the file
    if (config::only_root) {
        extension_config.only_root = *config::only_root;
    }
    if (config::base_font_size) {
        extension_config.base_font_size = *config::base_font_size;
    }
    if (!config::conversion_enabled) {
        extension_config.rem_to_px_conversion = false;
    }
    return extension_config;
}

int describe(const lqv::VariableScanner& scanner, const lqv::ExtensionConfig& extension_config) {
    std::string name = config::describe_name;
    if (name.rfind("--", 0) != 0) {
        name = "--" + name;
    }

    auto entry = scanner.lookup(name);
    if (!entry) {
        print_error({ErrorType::VARIABLE_NOT_FOUND,
                     name,
                     "no such CSS variable in the scanned files",
                     {"Run 'lqvars --list' to see every variable"}});
        return 1;
    }

    std::cout << lqv::describe_variable(*entry, extension_config);
    return 0;
}

int list(const lqv::VariableScanner& scanner) {
    auto registry = scanner.registry();
    for (const auto* entry : registry->sorted_entries()) {
        std::cout << entry->name << '\t' << entry->value << '\t' << entry->file << '\n';
    }
    std::cout << "Found " << registry->size() << " CSS variables from "
              << registry->source_file_count() << " file(s)" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // parse passed flags
    auto parse_result = flags::parse_arguments(argc, argv);
    if (parse_result.should_exit) {
        return parse_result.exit_code;
    }

    // handle simple flags
    if (config::show_version) {
        std::cout << "lqvars " << get_version() << std::endl;
        return 0;
    }
    if (config::show_help) {
        print_usage();
        return 0;
    }

    std::vector<std::string> folders = parse_result.folders;
    if (folders.empty()) {
        folders.emplace_back(".");
    }

    lqv::ExtensionConfig extension_config = load_extension_config(folders);
    lqv::Workspace workspace(folders, extension_config);
    lqv::VariableScanner scanner;

    size_t count = workspace.rescan(scanner);
    debug_msg("main: scan finished with %zu variable(s)", count);

    if (config::list_variables) {
        return list(scanner);
    }
    return describe(scanner, extension_config);
}
