// SPDX-License-Identifier: GPL-3.0-or-later

#include "radial_gauge_chart.h"

#include "chart_captions.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chartkit {

float RadialGaugeChart::calculate_sweep(float value) const {
    return 360.0f * value_bounds().fraction(value) * animation_progress();
}

float RadialGaugeChart::effective_line_size(float max_radius) const {
    if (line_size_ >= 0.0f) {
        return line_size_;
    }
    float rings = static_cast<float>(entries().size() + 1);
    return std::max(0.0f, max_radius / (2.0f * rings));
}

void RadialGaugeChart::draw_content(ChartCanvas& canvas, int width, int height) {
    const auto& items = entries();
    if (items.empty()) {
        return;
    }

    const TextStyle style = label_style();
    std::vector<size_t> indices(items.size());
    for (size_t i = 0; i < items.size(); i++) {
        indices[i] = i;
    }

    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    float caption_width = captions::column_width(canvas, items, indices, style, margin());
    Rect area(0.0f, 0.0f, std::max(0.0f, w - caption_width), h);

    float max_radius = (std::min(area.width, area.height) - 2.0f * margin()) / 2.0f;
    float line = effective_line_size(max_radius);
    if (max_radius > 0.0f && line > 0.0f) {
        Point center = area.center();
        uint8_t area_alpha = line_area_alpha_;

        for (size_t i = 0; i < items.size(); i++) {
            float radius = max_radius - line / 2.0f -
                           static_cast<float>(i) * (line + margin() / 2.0f);
            if (radius - line / 2.0f <= 0.0f) {
                spdlog::debug("[Chart:{}] {} of {} rings fit", chart_type_name(type()), i,
                              items.size());
                break;
            }

            Paint background;
            background.style = PaintStyle::STROKE;
            background.stroke_width = line;
            background.color = items[i].color.with_alpha(area_alpha);
            canvas.draw_circle(center, radius, background);

            float sweep = calculate_sweep(items[i].value);
            if (sweep <= 0.0f) {
                continue;
            }
            Path arc;
            arc.arc_to(center, radius, start_angle_, sweep, false);

            Paint foreground;
            foreground.style = PaintStyle::STROKE;
            foreground.stroke_width = line;
            foreground.color = items[i].color;
            canvas.draw_path(arc, foreground);
        }
    }

    captions::draw_column(canvas, items, indices, Rect(area.right(), 0.0f, caption_width, h),
                          style, margin());
}

} // namespace chartkit
