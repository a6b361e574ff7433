// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "point_chart.h"

namespace chartkit {

/**
 * @brief Vertical bars grown from the origin row, one per item slot
 *
 * Each slot also gets a translucent full-height background bar. Bar heights
 * scale with animation progress; the background does not move.
 */
class BarChart : public PointChart {
  public:
    BarChart();

    ChartType type() const override {
        return ChartType::BAR;
    }

    /// Alpha (0-255) of the full-height slot background; 0 disables it
    void set_bar_area_alpha(uint8_t alpha) {
        bar_area_alpha_ = alpha;
    }
    uint8_t bar_area_alpha() const {
        return bar_area_alpha_;
    }

    /// Bars never collapse below this height, so zero values stay visible
    static constexpr float MIN_BAR_HEIGHT = 2.0f;

  protected:
    void draw_content(ChartCanvas& canvas, int width, int height) override;

    void draw_bar_areas(ChartCanvas& canvas, const layout::PointLayout& lay) const;
    void draw_bars(ChartCanvas& canvas, const layout::PointLayout& lay) const;

  private:
    uint8_t bar_area_alpha_ = 32;
};

} // namespace chartkit
