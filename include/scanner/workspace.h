#pragma once

#include <string>
#include <vector>

#include "extension_config.h"
#include "variable_scanner.h"

namespace lqv {

// Glob match of a folder-relative path. "**/" also matches zero directories,
// so "**/*.liquid" matches "theme.liquid" at the folder root.
bool matches_glob(const std::string& pattern, const std::string& relative_path);

// The host side of a scan: file discovery, reading and settings loading for
// a set of workspace folders.
class Workspace {
   public:
    Workspace(std::vector<std::string> folders, ExtensionConfig config);

    // Paths of files matching an include pattern and no exclude pattern, in
    // folder order, each listed once.
    std::vector<std::string> discover_files() const;

    // Contents of paths. Unreadable files are reported and left out.
    std::vector<SourceFile> read_sources(const std::vector<std::string>& paths) const;

    size_t rescan(VariableScanner& scanner) const;

    const std::vector<std::string>& folders() const {
        return folders_;
    }
    const ExtensionConfig& config() const {
        return config_;
    }

   private:
    std::vector<std::string> folders_;
    ExtensionConfig config_;
};

}  // namespace lqv
