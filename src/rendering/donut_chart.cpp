// SPDX-License-Identifier: GPL-3.0-or-later

#include "donut_chart.h"

#include "chart_captions.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace chartkit {

namespace {

float magnitude(float value) {
    return std::isfinite(value) ? std::fabs(value) : 0.0f;
}

} // namespace

void DonutChart::set_hole_radius(float ratio) {
    if (std::isnan(ratio)) {
        ratio = 0.0f;
    }
    hole_radius_ = std::clamp(ratio, 0.0f, 1.0f);
}

std::vector<Sector> DonutChart::calculate_sectors() const {
    std::vector<Sector> sectors;
    const auto& items = entries();

    // Summed in double so float-sized magnitudes cannot overflow
    double total = 0.0;
    for (const auto& entry : items) {
        total += magnitude(entry.value);
    }
    if (!(total > 0.0)) {
        return sectors;
    }

    const float full_sweep = 360.0f * animation_progress();
    float start = START_ANGLE;
    sectors.reserve(items.size());
    for (const auto& entry : items) {
        float sweep = static_cast<float>(magnitude(entry.value) / total) * full_sweep;
        sectors.push_back({start, sweep});
        start += sweep;
    }
    return sectors;
}

void DonutChart::draw_content(ChartCanvas& canvas, int width, int height) {
    std::vector<Sector> sectors = calculate_sectors();
    if (sectors.empty()) {
        spdlog::trace("[Chart:{}] Nothing to draw ({} entries, zero total)",
                      chart_type_name(type()), entries().size());
        return;
    }

    const auto& items = entries();
    const TextStyle style = label_style();

    // Right column takes the first half in LEFT_AND_RIGHT mode so captions
    // follow the clockwise sector order starting at 12 o'clock
    std::vector<size_t> right_indices;
    std::vector<size_t> left_indices;
    if (label_mode_ == DonutLabelMode::RIGHT_ONLY) {
        for (size_t i = 0; i < items.size(); i++) {
            right_indices.push_back(i);
        }
    } else if (label_mode_ == DonutLabelMode::LEFT_AND_RIGHT) {
        size_t split = (items.size() + 1) / 2;
        for (size_t i = 0; i < items.size(); i++) {
            (i < split ? right_indices : left_indices).push_back(i);
        }
    }

    float right_width = captions::column_width(canvas, items, right_indices, style, margin());
    float left_width = captions::column_width(canvas, items, left_indices, style, margin());
    if (label_mode_ == DonutLabelMode::LEFT_AND_RIGHT) {
        right_width = left_width = std::max(right_width, left_width);
    }

    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    Rect area(left_width, 0.0f, std::max(0.0f, w - left_width - right_width), h);

    float outer = (std::min(area.width, area.height) - 2.0f * margin()) / 2.0f;
    if (outer > 0.0f) {
        Point center = area.center();
        float inner = outer * hole_radius_;
        for (size_t i = 0; i < sectors.size(); i++) {
            if (sectors[i].sweep_deg <= 0.0f) {
                continue;
            }
            Paint paint;
            paint.style = PaintStyle::FILL;
            paint.color = items[i].color;
            canvas.draw_path(make_sector_path(center, outer, inner, sectors[i].start_deg,
                                              sectors[i].sweep_deg),
                             paint);
        }
    } else {
        spdlog::trace("[Chart:{}] No room for the ring in {}x{}", chart_type_name(type()), width,
                      height);
    }

    captions::draw_column(canvas, items, right_indices,
                          Rect(area.right(), 0.0f, right_width, h), style, margin());
    captions::draw_column(canvas, items, left_indices, Rect(0.0f, 0.0f, left_width, h), style,
                          margin());
}

} // namespace chartkit
