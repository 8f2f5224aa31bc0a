/*
  workspace.cpp

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

#include "workspace.h"

#include <fnmatch.h>

#include "debug.h"
#include "error_out.h"
#include "lqv_filesystem.h"
#include "settings_loader.h"
#include "string_utils.h"

namespace lqv {

namespace {

bool match_segments(const std::vector<std::string>& pattern, size_t pi,
                    const std::vector<std::string>& path, size_t si) {
    if (pi == pattern.size()) {
        return si == path.size();
    }
    if (pattern[pi] == "**") {
        return match_segments(pattern, pi + 1, path, si) ||
               (si < path.size() && match_segments(pattern, pi, path, si + 1));
    }
    if (si == path.size()) {
        return false;
    }
    return fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) == 0 &&
           match_segments(pattern, pi + 1, path, si + 1);
}

bool matches_any(const std::vector<std::string>& patterns, const std::string& relative_path) {
    for (const auto& pattern : patterns) {
        if (matches_glob(pattern, relative_path)) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool matches_glob(const std::string& pattern, const std::string& relative_path) {
    return match_segments(string_utils::split(pattern, "/"), 0,
                          string_utils::split(relative_path, "/"), 0);
}

Workspace::Workspace(std::vector<std::string> folders, ExtensionConfig config)
    : folders_(std::move(folders)), config_(std::move(config)) {
}

std::vector<std::string> Workspace::discover_files() const {
    std::vector<std::string> paths;
    for (const auto& folder : folders_) {
        auto listing = lqv_filesystem::list_files_recursive(folder);
        if (listing.is_error()) {
            print_error({ErrorType::FILE_NOT_FOUND, ErrorSeverity::WARNING, folder,
                         listing.error(), {"Check that the workspace folder exists"}});
            continue;
        }

        size_t matched = 0;
        for (const auto& relative : listing.value()) {
            if (!matches_any(config_.include_patterns, relative) ||
                matches_any(config_.exclude_patterns, relative)) {
                continue;
            }
            paths.push_back((lqv_filesystem::fs::path(folder) / relative).string());
            matched++;
        }
        debug_msg("workspace: %zu of %zu file(s) selected in %s", matched, listing.value().size(),
                  folder.c_str());
    }
    return paths;
}

std::vector<SourceFile> Workspace::read_sources(const std::vector<std::string>& paths) const {
    std::vector<SourceFile> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        auto content = lqv_filesystem::read_file_content(path);
        if (content.is_error()) {
            print_error({ErrorType::FILE_READ_ERROR, path, content.error(), {}});
            continue;
        }
        sources.push_back({path, std::move(content.value())});
    }
    return sources;
}

size_t Workspace::rescan(VariableScanner& scanner) const {
    auto sources = read_sources(discover_files());
    auto settings = settings_loader::load_settings(folders_);
    return scanner.rescan(sources, std::move(settings), config_);
}

}  // namespace lqv
