// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file chart_types.h
 * @brief Geometry and color value types shared by the chart renderers
 *
 * All coordinates are chart-local pixels: origin at the top-left corner of the
 * region passed to Chart::draw(), X to the right, Y down.
 */

#include <cstdint>

namespace chartkit {

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    Point() = default;
    Point(float x_, float y_) : x(x_), y(y_) {}

    Point operator+(const Point& o) const {
        return {x + o.x, y + o.y};
    }
    Point operator-(const Point& o) const {
        return {x - o.x, y - o.y};
    }
    bool operator==(const Point& o) const {
        return x == o.x && y == o.y;
    }
    bool operator!=(const Point& o) const {
        return !(*this == o);
    }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    Size() = default;
    Size(float w, float h) : width(w), height(h) {}

    bool is_empty() const {
        return width <= 0.0f || height <= 0.0f;
    }
    bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Rect() = default;
    Rect(float x_, float y_, float w, float h) : x(x_), y(y_), width(w), height(h) {}

    float left() const {
        return x;
    }
    float top() const {
        return y;
    }
    float right() const {
        return x + width;
    }
    float bottom() const {
        return y + height;
    }
    Point center() const {
        return {x + width / 2.0f, y + height / 2.0f};
    }
};

/**
 * @brief 8-bit RGBA color
 *
 * Hex literals use 0xAARRGGBB (from_argb) or 0xRRGGBB (from_rgb, opaque).
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r(r_), g(g_), b(b_), a(a_) {}

    static constexpr Color from_rgb(uint32_t rgb) {
        return Color(static_cast<uint8_t>((rgb >> 16) & 0xFF), static_cast<uint8_t>((rgb >> 8) & 0xFF),
                     static_cast<uint8_t>(rgb & 0xFF), 255);
    }
    static constexpr Color from_argb(uint32_t argb) {
        return Color(static_cast<uint8_t>((argb >> 16) & 0xFF),
                     static_cast<uint8_t>((argb >> 8) & 0xFF), static_cast<uint8_t>(argb & 0xFF),
                     static_cast<uint8_t>((argb >> 24) & 0xFF));
    }

    constexpr Color with_alpha(uint8_t alpha) const {
        return Color(r, g, b, alpha);
    }

    constexpr uint32_t to_rgb() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }
    constexpr uint32_t to_argb() const {
        return (static_cast<uint32_t>(a) << 24) | to_rgb();
    }

    constexpr bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const {
        return !(*this == o);
    }
};

namespace colors {
constexpr Color TRANSPARENT{0, 0, 0, 0};
constexpr Color WHITE{255, 255, 255, 255};
constexpr Color BLACK{0, 0, 0, 255};
constexpr Color GRAY{128, 128, 128, 255};
} // namespace colors

/// Direction label text runs in the header/footer rows
enum class LabelOrientation { HORIZONTAL, VERTICAL };

/// Path interpolation style of a LineChart
enum class LineMode { NONE, STRAIGHT, SPLINE };

/// Marker drawn at each plotted point
enum class PointMode { NONE, CIRCLE, SQUARE };

/// Caption placement of donut/pie charts
enum class DonutLabelMode { NONE, LEFT_AND_RIGHT, RIGHT_ONLY };

/// Closed set of chart variants (see create_chart())
enum class ChartType { BAR, POINT, LINE, DONUT, PIE, RADAR, RADIAL_GAUGE };

} // namespace chartkit
