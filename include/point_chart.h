// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

/**
 * @file point_chart.h
 * @brief Scatter-style chart: one marker per entry over a value axis
 *
 * Also provides the point layout pipeline reused by LineChart and BarChart:
 *
 *   labels -> measure -> footer/header height -> item size -> origin -> points
 *
 * The result is a layout::PointLayout value computed once per draw and passed
 * to each drawing step.
 */

namespace chartkit {

class PointChart : public Chart {
  public:
    PointChart() = default;

    ChartType type() const override {
        return ChartType::POINT;
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
    /// Alpha (0-255) of the bar drawn from the origin to each point; 0 disables it
    void set_point_area_alpha(uint8_t alpha) {
        point_area_alpha_ = alpha;
    }
    uint8_t point_area_alpha() const {
        return point_area_alpha_;
    }

    /**
     * @brief Pixel row of value 0 (or of min when 0 is out of range)
     *
     * Depends only on bounds and geometry, never on animation progress.
     */
    float calculate_y_origin(float item_height, float header_height) const;

    /**
     * @brief Map every entry to a pixel position, in entry order
     *
     * @param origin Baseline row, where every entry lands when min == max
     */
    std::vector<Point> calculate_points(Size item_size, float origin, float header_height) const;

    /// Run the whole layout pipeline for a region
    layout::PointLayout compute_layout(ChartCanvas& canvas, int width, int height) const;

  protected:
    void draw_content(ChartCanvas& canvas, int width, int height) override;

    void draw_points(ChartCanvas& canvas, const std::vector<Point>& points) const;
    void draw_point_areas(ChartCanvas& canvas, const std::vector<Point>& points,
                          float origin) const;
    void draw_header(ChartCanvas& canvas, const layout::PointLayout& lay) const;
    void draw_footer(ChartCanvas& canvas, const layout::PointLayout& lay, int height) const;

  private:
    void draw_label_row(ChartCanvas& canvas, const std::vector<std::string>& labels,
                        const std::vector<Size>& sizes, const std::vector<Point>& points,
                        LabelOrientation orientation, float anchor_y, bool anchor_bottom) const;

    float point_size_ = 14.0f;
    PointMode point_mode_ = PointMode::CIRCLE;
    uint8_t point_area_alpha_ = 100;
};

} // namespace chartkit
