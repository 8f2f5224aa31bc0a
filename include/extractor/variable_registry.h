#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lqv {

struct MediaVariant {
    std::string query;
    std::string value;
};

struct CssVariableEntry {
    std::string name;
    std::string value;
    std::string file;
    std::string file_path;
    std::vector<MediaVariant> media;
};

// Custom properties found during one scan, in discovery order. The first
// declaration of a name fixes its value and source; later media-query
// declarations of a known name only add variants.
class VariableRegistry {
   public:
    // Records "--name: value" found in file_path. Returns true when the name
    // was new.
    bool record_declaration(const std::string& name, const std::string& value,
                            const std::string& file_path,
                            const std::optional<std::string>& media_query = std::nullopt);

    const CssVariableEntry* find(const std::string& name) const;
    bool contains(const std::string& name) const;

    size_t size() const {
        return entries_.size();
    }
    bool empty() const {
        return entries_.empty();
    }

    const std::vector<CssVariableEntry>& entries() const {
        return entries_;
    }

    // Entries ordered by name.
    std::vector<const CssVariableEntry*> sorted_entries() const;

    // Number of distinct source paths among the entries.
    size_t source_file_count() const;

   private:
    std::vector<CssVariableEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace lqv
