// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_canvas.h"
#include "chart_entry.h"
#include "chart_types.h"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @file chart_layout.h
 * @brief Layout and measurement helpers shared by every chart variant
 *
 * Pure functions of their arguments. Chart and PointChart expose thin member
 * wrappers that feed in their current state.
 *
 * VERTICAL LAYOUT (point/line/bar charts):
 *
 *   y = 0               +---------------------------+
 *                       | header (value labels)     |
 *   y = header          +---------------------------+  <- value == max
 *                       |                           |
 *                       | plot area (item height)   |
 *                       |                           |
 *   y = header + item_h +---------------------------+  <- value == min
 *                       | margin                    |
 *                       | footer (labels)           |
 *   y = height          +---------------------------+
 *
 * HORIZONTAL LAYOUT: n item slots of equal width separated by (n + 1)
 * margins; entry i is centered in slot i.
 */

namespace chartkit {
namespace layout {

/// Effective [min, max] used to map values to pixel rows
struct ValueBounds {
    float min = 0.0f;
    float max = 0.0f;

    /// Span in double precision; finite float bounds never overflow it
    double range() const {
        return static_cast<double>(max) - static_cast<double>(min);
    }
    /// False for empty, inverted or non-finite bounds
    bool has_range() const {
        double r = range();
        return r > 0.0 && std::isfinite(r);
    }
    /// Position of the clamped value within [min, max], 0 at min and 1 at max
    float fraction(float value) const;
    /// Clamp a value into the bounds; non-finite values become 0 first
    float clamp(float value) const;
};

/// Everything a point-based chart needs for one draw, recomputed every draw
struct PointLayout {
    std::vector<std::string> labels;
    std::vector<std::string> value_labels;
    std::vector<Size> label_sizes;
    std::vector<Size> value_label_sizes;
    float footer_height = 0.0f;
    float header_height = 0.0f;
    Size item_size;
    float origin = 0.0f;
    std::vector<Point> points;
};

/// Copy of @p s without leading/trailing whitespace
std::string trim(const std::string& s);

/// true if the label would render any glyph
bool has_text(const std::string& label);

/**
 * @brief Measure each label with the given text style
 *
 * Labels are trimmed first. Empty labels yield {0,0} without touching the
 * canvas.
 */
std::vector<Size> measure_labels(ChartCanvas& canvas, const std::vector<std::string>& labels,
                                 const TextStyle& style);

/**
 * @brief Height of a header or footer row
 *
 * @return 0 if no label has text; otherwise margin + extent + margin where
 *         extent is @p text_size (horizontal) or the widest label (vertical)
 */
float calculate_footer_header_height(const std::vector<Size>& sizes, LabelOrientation orientation,
                                     const std::vector<std::string>& labels, float margin,
                                     float text_size);

/**
 * @brief Slot width per entry and plotting height
 *
 * Both dimensions are clamped to >= 0. With @p count == 0 the width is 0.
 */
Size calculate_item_size(int width, int height, float footer_height, float header_height,
                         size_t count, float margin);

/**
 * @brief Pixel row of value 0, or of min when 0 is outside the bounds
 *
 * A zero (or negative) range yields the bottom of the plot area.
 */
float calculate_y_origin(float item_height, float header_height, const ValueBounds& bounds);

/**
 * @brief Pixel row of a value inside the plot area
 *
 * With a zero range every value maps to @p origin.
 */
float value_to_y(float value, const ValueBounds& bounds, float item_height, float header_height,
                 float origin);

/// X coordinate of the center of item slot @p index
float slot_center_x(size_t index, float item_width, float margin);

/**
 * @brief One point per entry, in entry order
 */
std::vector<Point> calculate_points(const std::vector<ChartEntry>& entries, Size item_size,
                                    float origin, float header_height, float margin,
                                    const ValueBounds& bounds);

/// Cubic segment from points[i] to points[i + 1]
struct CubicInfo {
    Point point;
    Point control;
    Point next_point;
    Point next_control;
};

/**
 * @brief Control points for the spline segment starting at @p index
 *
 * Tangents are horizontal and symmetric: each control point is offset by 80%
 * of the item width toward the other end point. Requires index + 1 < size.
 */
CubicInfo calculate_cubic_info(const std::vector<Point>& points, size_t index, Size item_size);

/// Horizontal offset of spline control points, as a fraction of item width
constexpr float SPLINE_CONTROL_RATIO = 0.8f;

} // namespace layout
} // namespace chartkit
