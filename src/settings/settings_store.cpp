/*
  settings_store.cpp

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

#include "settings_store.h"

namespace lqv {

std::optional<ColorScheme> SettingsStore::first_color_scheme() const {
    if (!current.is_object()) {
        return std::nullopt;
    }
    auto schemes = current.find("color_schemes");
    if (schemes == current.end() || !schemes->is_object() || schemes->empty()) {
        return std::nullopt;
    }

    auto first = schemes->begin();
    ColorScheme scheme;
    scheme.id = first.key();
    if (first->is_object()) {
        auto settings = first->find("settings");
        if (settings != first->end()) {
            scheme.settings = *settings;
        }
    }
    return scheme;
}

bool SettingsStore::empty() const {
    return (!current.is_object() || current.empty()) &&
           (!schema_defaults.is_object() || schema_defaults.empty());
}

ExpressionValue value_from_json(const ordered_json& node) {
    switch (node.type()) {
        case ordered_json::value_t::boolean:
            return ExpressionValue::from_bool(node.get<bool>());
        case ordered_json::value_t::number_integer:
        case ordered_json::value_t::number_unsigned:
        case ordered_json::value_t::number_float:
            return ExpressionValue::from_number(node.get<double>());
        case ordered_json::value_t::string:
            return ExpressionValue::from_string(node.get<std::string>());
        case ordered_json::value_t::array: {
            ExpressionValue::Array items;
            items.reserve(node.size());
            for (const auto& item : node) {
                items.push_back(value_from_json(item));
            }
            return ExpressionValue::from_array(std::move(items));
        }
        case ordered_json::value_t::object: {
            ExpressionValue::Object members;
            for (auto it = node.begin(); it != node.end(); ++it) {
                members.emplace(it.key(), value_from_json(it.value()));
            }
            return ExpressionValue::from_object(std::move(members));
        }
        case ordered_json::value_t::null:
        case ordered_json::value_t::binary:
        case ordered_json::value_t::discarded:
        default:
            return ExpressionValue::absent();
    }
}

}  // namespace lqv
