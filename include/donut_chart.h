// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

#include <vector>

namespace chartkit {

/// Angular extent of one entry, in degrees (0 = 3 o'clock, clockwise)
struct Sector {
    float start_deg = 0.0f;
    float sweep_deg = 0.0f;
};

/**
 * @brief Ring of sectors proportional to |value|, with legend captions
 *
 * Sectors follow entry order clockwise from 12 o'clock. The total sweep scales
 * with animation progress, so the ring "unrolls" during animation.
 */
class DonutChart : public Chart {
  public:
    DonutChart() = default;

    ChartType type() const override {
        return ChartType::DONUT;
    }

    /// Hole radius as a fraction of the outer radius, clamped to [0, 1]
    void set_hole_radius(float ratio);
    float hole_radius() const {
        return hole_radius_;
    }
    void set_label_mode(DonutLabelMode mode) {
        label_mode_ = mode;
    }
    DonutLabelMode label_mode() const {
        return label_mode_;
    }

    /**
     * @brief Sector per entry, in entry order
     *
     * Empty if there are no entries or all values are zero. Non-finite values
     * count as zero.
     */
    std::vector<Sector> calculate_sectors() const;

    static constexpr float START_ANGLE = -90.0f;

  protected:
    void draw_content(ChartCanvas& canvas, int width, int height) override;

  private:
    float hole_radius_ = 0.5f;
    DonutLabelMode label_mode_ = DonutLabelMode::RIGHT_ONLY;
};

/// A donut without a hole
class PieChart : public DonutChart {
  public:
    PieChart() {
        set_hole_radius(0.0f);
    }

    ChartType type() const override {
        return ChartType::PIE;
    }
};

} // namespace chartkit
