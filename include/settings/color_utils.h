#pragma once

#include <optional>
#include <string>

namespace lqv {

struct Rgba {
    int r = 0;
    int g = 0;
    int b = 0;
    double a = 1.0;
};

// Decodes "#rgb", "#rrggbb" or "#rrggbbaa" (the '#' is optional). An 8-digit
// value carries its own alpha as byte / 255; otherwise alpha is used.
std::optional<Rgba> decode_hex_color(const std::string& hex, double alpha = 1.0);

// "r, g, b, a"
std::string format_rgba(const Rgba& color);

// "r g b"
std::string format_rgb(const Rgba& color);

}  // namespace lqv
