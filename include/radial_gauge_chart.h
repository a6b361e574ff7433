// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

namespace chartkit {

/**
 * @brief Concentric rings, one per entry, filled to the value's position in [min, max]
 *
 * Entry 0 is the outermost ring. Each ring has a translucent full circle
 * behind the foreground arc. Captions go in a column on the right.
 */
class RadialGaugeChart : public Chart {
  public:
    RadialGaugeChart() = default;

    ChartType type() const override {
        return ChartType::RADIAL_GAUGE;
    }

    /// Ring thickness; a negative value derives it from the radius and entry count
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
    void set_start_angle(float degrees) {
        start_angle_ = degrees;
    }
    float start_angle() const {
        return start_angle_;
    }

    /// Foreground sweep in degrees for a value, progress applied; 0 for a zero range
    float calculate_sweep(float value) const;

    /// Ring thickness actually used for a given outer radius
    float effective_line_size(float max_radius) const;

  protected:
    void draw_content(ChartCanvas& canvas, int width, int height) override;

  private:
    float line_size_ = -1.0f;
    uint8_t line_area_alpha_ = 52;
    float start_angle_ = -90.0f;
};

} // namespace chartkit
