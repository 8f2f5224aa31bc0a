#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "extension_config.h"
#include "settings_store.h"
#include "variable_registry.h"

namespace lqv {

struct SourceFile {
    std::string path;
    std::string content;
};

// Owns the published registry and settings. Each rescan builds both from
// scratch and swaps them in together; readers hold on to the snapshot they
// took.
class VariableScanner {
   public:
    VariableScanner();

    VariableScanner(const VariableScanner&) = delete;
    VariableScanner& operator=(const VariableScanner&) = delete;

    // Extracts every source against settings with fresh lookup caches and
    // publishes the result. Returns the number of variables found.
    size_t rescan(const std::vector<SourceFile>& sources,
                  std::shared_ptr<const SettingsStore> settings, const ExtensionConfig& config);

    std::shared_ptr<const VariableRegistry> registry() const;
    std::shared_ptr<const SettingsStore> settings() const;

    // Copy of the entry for name, if the current registry has one.
    std::optional<CssVariableEntry> lookup(const std::string& name) const;

    size_t source_file_count() const;

   private:
    mutable std::mutex mutex_;
    std::shared_ptr<const VariableRegistry> registry_;
    std::shared_ptr<const SettingsStore> settings_;
};

}  // namespace lqv
