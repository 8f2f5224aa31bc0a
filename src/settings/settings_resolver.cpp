/*
  settings_resolver.cpp

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

#include "settings_resolver.h"

#include <cctype>
#include <cstdlib>
#include <vector>

#include "string_utils.h"

namespace lqv {

namespace {

bool parse_array_index(const std::string& segment, size_t& index) {
    if (segment.empty() || segment.size() > 9) {
        return false;
    }
    for (char c : segment) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    index = static_cast<size_t>(std::strtoul(segment.c_str(), nullptr, 10));
    return true;
}

const ordered_json* child_of(const ordered_json& node, const std::string& segment) {
    if (node.is_object()) {
        auto it = node.find(segment);
        return it == node.end() ? nullptr : &*it;
    }
    if (node.is_array()) {
        size_t index = 0;
        if (!parse_array_index(segment, index) || index >= node.size()) {
            return nullptr;
        }
        return &node[index];
    }
    return nullptr;
}

// Follows segments[first..] while the node is a container; a scalar reached
// early ends the walk and is the result. nullptr when a key is missing.
const ordered_json* descend_lenient(const ordered_json& start,
                                    const std::vector<std::string>& segments, size_t first) {
    const ordered_json* node = &start;
    for (size_t i = first; i < segments.size(); ++i) {
        if (!node->is_object() && !node->is_array()) {
            break;
        }
        node = child_of(*node, segments[i]);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

}  // namespace

SettingsResolver::SettingsResolver(std::shared_ptr<const SettingsStore> store)
    : store_(std::move(store)) {
}

ExpressionValue SettingsResolver::get_setting(const std::string& key) {
    auto cached = setting_cache_.find(key);
    if (cached != setting_cache_.end()) {
        return cached->second;
    }

    ExpressionValue value;
    if (store_) {
        if (key.find('.') != std::string::npos) {
            value = resolve_path(store_->current, key);
        } else if (store_->current.is_object()) {
            auto it = store_->current.find(key);
            if (it != store_->current.end()) {
                value = value_from_json(*it);
            }
        }

        if (value.is_absent() && store_->schema_defaults.is_object()) {
            auto it = store_->schema_defaults.find(key);
            if (it != store_->schema_defaults.end()) {
                value = value_from_json(*it);
            }
        }
    }

    setting_cache_.emplace(key, value);
    return value;
}

ExpressionValue SettingsResolver::resolve_path(const ordered_json& root,
                                               const std::string& dotted_path) {
    const ordered_json* node = &root;
    for (const auto& segment : string_utils::split(dotted_path, ".")) {
        node = child_of(*node, segment);
        if (node == nullptr) {
            return ExpressionValue::absent();
        }
    }
    return value_from_json(*node);
}

std::optional<Rgba> SettingsResolver::hex_to_rgba(const std::string& hex, double alpha) {
    if (hex.empty()) {
        return std::nullopt;
    }
    auto key = std::make_pair(hex, alpha);
    auto cached = color_cache_.find(key);
    if (cached != color_cache_.end()) {
        return cached->second;
    }
    auto decoded = decode_hex_color(hex, alpha);
    color_cache_.emplace(key, decoded);
    return decoded;
}

std::string SettingsResolver::render_terminal_value(const ordered_json& node,
                                                    const std::string& last_segment,
                                                    bool convert_bare_hex) {
    if (node.is_string()) {
        const std::string& text = node.get_ref<const std::string&>();
        if (string_utils::starts_with(text, "#")) {
            if (last_segment == "rgba" || last_segment == "rgb" || convert_bare_hex) {
                auto color = hex_to_rgba(text);
                if (!color) {
                    return text;
                }
                return last_segment == "rgb" ? format_rgb(*color) : format_rgba(*color);
            }
            return text;
        }
    }
    return format_setting_value(value_from_json(node));
}

std::string SettingsResolver::resolve_settings_reference(const std::string& path) {
    std::vector<std::string> segments = string_utils::split(path, ".");
    const std::string last = segments.size() > 1 ? segments.back() : std::string();

    if (store_) {
        if (store_->current.is_object()) {
            auto it = store_->current.find(segments.front());
            if (it != store_->current.end() && !it->is_null()) {
                const ordered_json* node = descend_lenient(*it, segments, 1);
                if (node == nullptr) {
                    return "";
                }
                return render_terminal_value(*node, last, false);
            }
        }

        if (store_->schema_defaults.is_object()) {
            auto it = store_->schema_defaults.find(segments.front());
            if (it != store_->schema_defaults.end() && !it->is_null()) {
                return render_terminal_value(*it, last, false);
            }
        }
    }

    return "[" + path + "]";
}

std::string SettingsResolver::resolve_scheme_reference(const std::string& path) {
    const std::string placeholder = "[scheme." + path + "]";
    auto scheme = first_color_scheme();
    if (!scheme || !scheme->settings.is_object()) {
        return placeholder;
    }

    std::vector<std::string> segments = string_utils::split(path, ".");
    const ordered_json* node = descend_lenient(scheme->settings, segments, 0);
    if (node == nullptr || node->is_null()) {
        return placeholder;
    }

    const std::string last = segments.size() > 1 ? segments.back() : std::string();
    return render_terminal_value(*node, last, true);
}

std::optional<ColorScheme> SettingsResolver::first_color_scheme() const {
    if (!store_) {
        return std::nullopt;
    }
    return store_->first_color_scheme();
}

std::string format_setting_value(const ExpressionValue& value) {
    switch (value.kind()) {
        case ExpressionValue::Kind::ARRAY:
        case ExpressionValue::Kind::OBJECT:
            return "[object]";
        case ExpressionValue::Kind::ABSENT:
        case ExpressionValue::Kind::STRING:
        case ExpressionValue::Kind::NUMBER:
        case ExpressionValue::Kind::BOOLEAN:
        default:
            return value.to_output_string();
    }
}

}  // namespace lqv
