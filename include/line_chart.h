// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "point_chart.h"

/**
 * @file line_chart.h
 * @brief Line chart: point layout plus a stroked path and a shaded area
 *
 * Drawing order per frame: area, line, points, header, footer.
 *
 * Area fill shader precedence:
 *   1. enable_y_solid_gradient    -> vertical gradient, origin row to topmost point
 *   2. enable_y_fade_out_gradient -> SRC_OUT(dst = vertical, src = horizontal)
 *   3. otherwise                  -> horizontal gradient of the entry colors
 */

namespace chartkit {

class LineChart : public PointChart {
  public:
    LineChart();

    ChartType type() const override {
        return ChartType::LINE;
    }

    void set_line_size(float size) {
        line_size_ = size;
    }
    float line_size() const {
        return line_size_;
    }
    void set_line_mode(LineMode mode) {
        line_mode_ = mode;
    }
    LineMode line_mode() const {
        return line_mode_;
    }
    /// Alpha (0-255) of the area under the line; 0 disables the area
    void set_line_area_alpha(uint8_t alpha) {
        line_area_alpha_ = alpha;
    }
    uint8_t line_area_alpha() const {
        return line_area_alpha_;
    }
    void set_enable_y_fade_out_gradient(bool enable) {
        enable_y_fade_out_gradient_ = enable;
    }
    bool enable_y_fade_out_gradient() const {
        return enable_y_fade_out_gradient_;
    }
    void set_enable_y_solid_gradient(bool enable) {
        enable_y_solid_gradient_ = enable;
    }
    bool enable_y_solid_gradient() const {
        return enable_y_solid_gradient_;
    }
    void set_gradient_y_color_start(Color color) {
        gradient_y_color_start_ = color;
    }
    Color gradient_y_color_start() const {
        return gradient_y_color_start_;
    }
    void set_gradient_y_color_end(Color color) {
        gradient_y_color_end_ = color;
    }
    Color gradient_y_color_end() const {
        return gradient_y_color_end_;
    }

    /**
     * @brief Horizontal gradient through the entry colors
     *
     * Runs from x = 0 to the last point's x with evenly spaced stops, one per
     * entry, every stop at @p alpha. Requires at least one point.
     */
    Shader create_x_gradient(const std::vector<Point>& points, uint8_t alpha = 255) const;

    /**
     * @brief Vertical gradient between the two configured Y colors
     *
     * Solid mode spans the origin row to the topmost point; fade-out mode
     * spans row 0 to the lowest point. Color alphas are scaled by progress.
     */
    Shader create_y_gradient(const std::vector<Point>& points, float origin) const;

    /// Shader used to fill the area, following the precedence above
    Shader create_area_shader(const std::vector<Point>& points, float origin) const;

  protected:
    void draw_content(ChartCanvas& canvas, int width, int height) override;

    void draw_line(ChartCanvas& canvas, const std::vector<Point>& points, Size item_size) const;
    void draw_area(ChartCanvas& canvas, const std::vector<Point>& points, Size item_size,
                   float origin) const;

  private:
    /// Append the segments after points[0] according to the line mode
    void append_segments(Path& path, const std::vector<Point>& points, Size item_size) const;

    float line_size_ = 3.0f;
    LineMode line_mode_ = LineMode::SPLINE;
    uint8_t line_area_alpha_ = 32;
    bool enable_y_fade_out_gradient_ = false;
    bool enable_y_solid_gradient_ = false;
    Color gradient_y_color_start_ = colors::TRANSPARENT;
    Color gradient_y_color_end_ = colors::TRANSPARENT;
};

} // namespace chartkit
