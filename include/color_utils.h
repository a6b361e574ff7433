// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_types.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @file color_utils.h
 * @brief Color parsing and blending utilities
 *
 * Parsing is used by the host (JSON chart descriptions, demo data). The
 * blending helpers are used by gradient evaluation and the LVGL backend.
 */

namespace chartkit {

/**
 * @brief Parse a hex color string
 *
 * Accepted formats (case-insensitive, surrounding whitespace ignored):
 * - "#RRGGBB", "RRGGBB", "0xRRGGBB" (opaque)
 * - "#AARRGGBB", "AARRGGBB"
 * - "#RGB", "RGB" (each digit doubled)
 *
 * @param hex_str Input string
 * @return Parsed color, or std::nullopt if the string is not a valid color
 *
 * @example
 * parse_hex_color("#FF0000");   // {255, 0, 0, 255}
 * parse_hex_color("#80FF0000"); // {255, 0, 0, 128}
 * parse_hex_color("xyz");       // std::nullopt
 */
std::optional<Color> parse_hex_color(const std::string& hex_str);

/**
 * @brief Format a color as "#RRGGBB", or "#AARRGGBB" when not opaque
 */
std::string color_to_hex(const Color& color);

/**
 * @brief Linear interpolation between two colors, all four channels
 *
 * @param t Blend factor, clamped to [0, 1] (0 = a, 1 = b)
 */
Color lerp_color(const Color& a, const Color& b, float t);

/**
 * @brief Scale a color's alpha channel by a factor in [0, 1]
 */
Color scale_alpha(const Color& color, float factor);

/**
 * @brief Channel-wise mean of a set of colors (opaque black if empty)
 */
Color average_color(const std::vector<Color>& colors);

} // namespace chartkit
