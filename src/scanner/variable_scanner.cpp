/*
  variable_scanner.cpp

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

#include "variable_scanner.h"

#include "css_extractor.h"
#include "debug.h"
#include "liquid_to_css.h"
#include "settings_resolver.h"

namespace lqv {

VariableScanner::VariableScanner()
    : registry_(std::make_shared<VariableRegistry>()),
      settings_(std::make_shared<SettingsStore>()) {
}

size_t VariableScanner::rescan(const std::vector<SourceFile>& sources,
                               std::shared_ptr<const SettingsStore> settings,
                               const ExtensionConfig& config) {
    PerformanceTracker tracker("rescan");

    if (!settings) {
        settings = std::make_shared<SettingsStore>();
    }

    SettingsResolver resolver(settings);
    LiquidToCss transform(&resolver);
    CssExtractor extractor(transform, config);

    auto fresh = std::make_shared<VariableRegistry>();
    for (const auto& source : sources) {
        extractor.parse_css_variables(source.content, source.path, *fresh);
    }

    size_t count = fresh->size();
    debug_msg("scan: %zu variable(s) from %zu source file(s), %zu file(s) scanned", count,
              fresh->source_file_count(), sources.size());

    std::lock_guard<std::mutex> lock(mutex_);
    registry_ = std::move(fresh);
    settings_ = std::move(settings);
    return count;
}

std::shared_ptr<const VariableRegistry> VariableScanner::registry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_;
}

std::shared_ptr<const SettingsStore> VariableScanner::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

std::optional<CssVariableEntry> VariableScanner::lookup(const std::string& name) const {
    auto snapshot = registry();
    if (const auto* entry = snapshot->find(name)) {
        return *entry;
    }
    return std::nullopt;
}

size_t VariableScanner::source_file_count() const {
    return registry()->source_file_count();
}

}  // namespace lqv
