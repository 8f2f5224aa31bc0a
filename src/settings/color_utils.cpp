/*
  color_utils.cpp

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

#include "color_utils.h"

#include <cctype>

#include "expression_value.h"

namespace lqv {

namespace {

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

int byte_at(const std::string& digits, size_t pos) {
    return hex_digit_value(digits[pos]) * 16 + hex_digit_value(digits[pos + 1]);
}

}  // namespace

std::optional<Rgba> decode_hex_color(const std::string& hex, double alpha) {
    std::string digits = hex;
    size_t hash = digits.find('#');
    if (hash != std::string::npos) {
        digits.erase(hash, 1);
    }

    if (digits.size() == 3) {
        std::string expanded;
        for (char c : digits) {
            expanded += c;
            expanded += c;
        }
        digits = expanded;
    }

    if (digits.size() != 6 && digits.size() != 8) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (hex_digit_value(c) < 0) {
            return std::nullopt;
        }
    }

    Rgba color;
    color.r = byte_at(digits, 0);
    color.g = byte_at(digits, 2);
    color.b = byte_at(digits, 4);
    color.a = digits.size() == 8 ? byte_at(digits, 6) / 255.0 : alpha;
    return color;
}

std::string format_rgba(const Rgba& color) {
    return std::to_string(color.r) + ", " + std::to_string(color.g) + ", " +
           std::to_string(color.b) + ", " + format_number(color.a);
}

std::string format_rgb(const Rgba& color) {
    return std::to_string(color.r) + " " + std::to_string(color.g) + " " +
           std::to_string(color.b);
}

}  // namespace lqv
