// SPDX-License-Identifier: GPL-3.0-or-later

#include "color_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace chartkit {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

uint8_t clamp_channel(float v) {
    return static_cast<uint8_t>(std::lround(std::min(255.0f, std::max(0.0f, v))));
}

} // namespace

std::optional<Color> parse_hex_color(const std::string& hex_str) {
    // Trim surrounding whitespace
    size_t begin = 0;
    size_t end = hex_str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(hex_str[begin])))
        begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(hex_str[end - 1])))
        end--;

    std::string s = hex_str.substr(begin, end - begin);
    if (!s.empty() && s[0] == '#') {
        s.erase(0, 1);
    } else if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.erase(0, 2);
    }

    if (s.size() != 3 && s.size() != 6 && s.size() != 8) {
        return std::nullopt;
    }

    uint32_t value = 0;
    for (char c : s) {
        int d = hex_digit(c);
        if (d < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<uint32_t>(d);
    }

    if (s.size() == 3) {
        // #RGB -> #RRGGBB
        uint32_t r = (value >> 8) & 0xF;
        uint32_t g = (value >> 4) & 0xF;
        uint32_t b = value & 0xF;
        return Color::from_rgb((r * 0x11) << 16 | (g * 0x11) << 8 | (b * 0x11));
    }
    if (s.size() == 6) {
        return Color::from_rgb(value);
    }
    return Color::from_argb(value);
}

std::string color_to_hex(const Color& color) {
    char buf[12];
    if (color.a == 255) {
        snprintf(buf, sizeof(buf), "#%06X", color.to_rgb());
    } else {
        snprintf(buf, sizeof(buf), "#%08X", color.to_argb());
    }
    return buf;
}

Color lerp_color(const Color& a, const Color& b, float t) {
    if (!(t > 0.0f)) // also catches NaN
        return a;
    if (t >= 1.0f)
        return b;
    return Color(clamp_channel(a.r + (b.r - a.r) * t), clamp_channel(a.g + (b.g - a.g) * t),
                 clamp_channel(a.b + (b.b - a.b) * t), clamp_channel(a.a + (b.a - a.a) * t));
}

Color scale_alpha(const Color& color, float factor) {
    factor = std::min(1.0f, std::max(0.0f, factor));
    return color.with_alpha(clamp_channel(color.a * factor));
}

Color average_color(const std::vector<Color>& colors) {
    if (colors.empty()) {
        return colors::BLACK;
    }
    float r = 0, g = 0, b = 0, a = 0;
    for (const auto& c : colors) {
        r += c.r;
        g += c.g;
        b += c.b;
        a += c.a;
    }
    float n = static_cast<float>(colors.size());
    return Color(clamp_channel(r / n), clamp_channel(g / n), clamp_channel(b / n),
                 clamp_channel(a / n));
}

} // namespace chartkit
