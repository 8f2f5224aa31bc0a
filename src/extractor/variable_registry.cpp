/*
  variable_registry.cpp

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

#include "variable_registry.h"

#include <algorithm>
#include <set>

#include "lqv_filesystem.h"

namespace lqv {

bool VariableRegistry::record_declaration(const std::string& name, const std::string& value,
                                          const std::string& file_path,
                                          const std::optional<std::string>& media_query) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        if (media_query) {
            entries_[it->second].media.push_back({*media_query, value});
        }
        return false;
    }

    CssVariableEntry entry;
    entry.name = name;
    entry.value = value;
    entry.file = lqv_filesystem::base_name(file_path);
    entry.file_path = file_path;
    if (media_query) {
        entry.media.push_back({*media_query, value});
    }

    index_.emplace(name, entries_.size());
    entries_.push_back(std::move(entry));
    return true;
}

const CssVariableEntry* VariableRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

bool VariableRegistry::contains(const std::string& name) const {
    return index_.find(name) != index_.end();
}

std::vector<const CssVariableEntry*> VariableRegistry::sorted_entries() const {
    std::vector<const CssVariableEntry*> sorted;
    sorted.reserve(entries_.size());
    for (const auto& entry : entries_) {
        sorted.push_back(&entry);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const CssVariableEntry* a, const CssVariableEntry* b) { return a->name < b->name; });
    return sorted;
}

size_t VariableRegistry::source_file_count() const {
    std::set<std::string> paths;
    for (const auto& entry : entries_) {
        paths.insert(entry.file_path);
    }
    return paths.size();
}

}  // namespace lqv
