// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

#include <cstddef>
#include <vector>

namespace chartkit {

/**
 * @brief Polygon over one spoke per entry
 *
 * Spokes start at 12 o'clock and go clockwise in entry order. A value at min
 * sits on the center, a value at max on the border ring.
 */
class RadarChart : public Chart {
  public:
    RadarChart() = default;

    ChartType type() const override {
        return ChartType::RADAR;
    }

    void set_line_size(float size) {
        line_size_ = size;
    }
    float line_size() const {
        return line_size_;
    }
    void set_line_area_alpha(uint8_t alpha) {
        line_area_alpha_ = alpha;
    }
    uint8_t line_area_alpha() const {
        return line_area_alpha_;
    }
    void set_point_size(float size) {
        point_size_ = size;
    }
    float point_size() const {
        return point_size_;
    }
    void set_point_mode(PointMode mode) {
        point_mode_ = mode;
    }
    PointMode point_mode() const {
        return point_mode_;
    }
    void set_border_line_size(float size) {
        border_line_size_ = size;
    }
    float border_line_size() const {
        return border_line_size_;
    }
    void set_border_line_color(Color color) {
        border_line_color_ = color;
    }
    Color border_line_color() const {
        return border_line_color_;
    }

    /// Angle of spoke @p index in degrees (0 = 3 o'clock, clockwise)
    float spoke_angle(size_t index) const;

    /// Polygon vertex per entry, progress applied; all on @p center for a zero range
    std::vector<Point> calculate_points(Point center, float radius) const;

  protected:
    void draw_content(ChartCanvas& canvas, int width, int height) override;

  private:
    void draw_border(ChartCanvas& canvas, Point center, float radius) const;
    void draw_captions(ChartCanvas& canvas, Point center, float radius) const;

    float line_size_ = 3.0f;
    uint8_t line_area_alpha_ = 32;
    float point_size_ = 14.0f;
    PointMode point_mode_ = PointMode::CIRCLE;
    float border_line_size_ = 2.0f;
    Color border_line_color_ = Color(211, 211, 211, 110);
};

} // namespace chartkit
