/*
  unit_conversion.cpp

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

#include "unit_conversion.h"

#include <cmath>
#include <cstdio>
#include <regex>
#include <sstream>

#include "expression_value.h"
#include "string_utils.h"

namespace lqv {

namespace {

// Exact expansion needs far fewer digits than this for any value that can
// carry a nonzero digit at the requested precision.
constexpr int kExpansionDigits = 100;

std::string trim_fraction_zeros(std::string text) {
    if (text.find('.') == std::string::npos) {
        return text;
    }
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

std::optional<std::string> convert(const std::string& value, double factor, bool divide,
                                   int digits) {
    double number = parse_float_prefix(value);
    if (std::isnan(number)) {
        return std::nullopt;
    }
    double result = divide ? number / factor : number * factor;
    return trim_fraction_zeros(to_fixed(result, digits));
}

}  // namespace

std::string to_fixed(double value, int digits) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-Infinity" : "Infinity";
    }

    bool negative = std::signbit(value) && value != 0.0;
    double magnitude = std::fabs(value);

    char buffer[512];
    int written = std::snprintf(buffer, sizeof(buffer), "%.*f", digits + kExpansionDigits,
                                magnitude);
    if (written < 0 || static_cast<size_t>(written) >= sizeof(buffer)) {
        std::snprintf(buffer, sizeof(buffer), "%.*f", digits, value);
        return buffer;
    }

    std::string expanded(buffer);
    size_t dot = expanded.find('.');
    std::string kept = expanded.substr(0, dot + 1 + static_cast<size_t>(digits));
    bool round_up = expanded[dot + 1 + static_cast<size_t>(digits)] >= '5';

    if (round_up) {
        size_t i = kept.size();
        bool carry = true;
        while (carry && i > 0) {
            --i;
            if (kept[i] == '.') {
                continue;
            }
            if (kept[i] == '9') {
                kept[i] = '0';
            } else {
                kept[i]++;
                carry = false;
            }
        }
        if (carry) {
            kept.insert(0, "1");
        }
    }

    if (digits == 0 && !kept.empty() && kept.back() == '.') {
        kept.pop_back();
    }
    return negative ? "-" + kept : kept;
}

std::optional<std::string> rem_to_px(const std::string& value, double base_font_size) {
    return convert(value, base_font_size, false, 2);
}

std::optional<std::string> px_to_rem(const std::string& value, double base_font_size) {
    return convert(value, base_font_size, true, 4);
}

std::optional<std::string> conversion_hint(const std::string& value,
                                           const ExtensionConfig& config) {
    if (!config.rem_to_px_conversion) {
        return std::nullopt;
    }

    static const std::regex rem_pattern(R"(([\d.]+)\s*rem)");
    static const std::regex px_pattern(R"(([\d.]+)\s*px)");

    std::string trimmed = string_utils::trim_ascii_whitespace_copy(value);
    std::smatch match;
    if (std::regex_search(trimmed, match, rem_pattern)) {
        auto px = rem_to_px(match[1].str(), config.base_font_size);
        if (!px) {
            return std::nullopt;
        }
        return *px + "px";
    }
    if (std::regex_search(trimmed, match, px_pattern)) {
        auto rem = px_to_rem(match[1].str(), config.base_font_size);
        if (!rem) {
            return std::nullopt;
        }
        return *rem + "rem";
    }
    return std::nullopt;
}

std::string describe_variable(const CssVariableEntry& entry, const ExtensionConfig& config) {
    std::ostringstream out;
    out << "CSS Variable: " << entry.name << "\n";
    out << "Value: " << entry.value << "\n";
    out << "Source: " << entry.file;
    if (!entry.file_path.empty() && entry.file_path != entry.file) {
        out << " (" << entry.file_path << ")";
    }
    out << "\n";

    if (!entry.media.empty()) {
        out << "Media Query Variants:\n";
        for (const auto& variant : entry.media) {
            out << "  @media " << variant.query << ": " << variant.value << "\n";
        }
    }

    if (auto hint = conversion_hint(entry.value, config)) {
        const char* unit = string_utils::ends_with(*hint, "px") ? "px" : "rem";
        out << "Convert to " << unit << ": " << *hint << "\n";
    }
    return out.str();
}

}  // namespace lqv
