// SPDX-License-Identifier: GPL-3.0-or-later

#include "bar_chart.h"

#include <algorithm>
#include <cmath>

namespace chartkit {

BarChart::BarChart() {
    set_point_mode(PointMode::NONE);
    set_point_area_alpha(0);
}

void BarChart::draw_content(ChartCanvas& canvas, int width, int height) {
    if (entries().empty()) {
        return;
    }

    layout::PointLayout lay = compute_layout(canvas, width, height);

    draw_bar_areas(canvas, lay);
    draw_bars(canvas, lay);
    draw_points(canvas, lay.points);
    draw_header(canvas, lay);
    draw_footer(canvas, lay, height);
}

void BarChart::draw_bar_areas(ChartCanvas& canvas, const layout::PointLayout& lay) const {
    if (bar_area_alpha_ == 0 || lay.points.empty()) {
        return;
    }

    auto alpha = static_cast<uint8_t>(bar_area_alpha_ * animation_progress());
    if (alpha == 0) {
        return;
    }

    const auto& items = entries();
    for (size_t i = 0; i < lay.points.size() && i < items.size(); i++) {
        Paint paint;
        paint.style = PaintStyle::FILL;
        paint.color = items[i].color.with_alpha(alpha);

        float x = lay.points[i].x - lay.item_size.width / 2.0f;
        canvas.draw_rect(Rect(x, lay.header_height, lay.item_size.width, lay.item_size.height),
                         paint);
    }
}

void BarChart::draw_bars(ChartCanvas& canvas, const layout::PointLayout& lay) const {
    const auto& items = entries();
    const float progress = animation_progress();

    for (size_t i = 0; i < lay.points.size() && i < items.size(); i++) {
        const Point& p = lay.points[i];

        float bar_height = std::max(MIN_BAR_HEIGHT, std::fabs(lay.origin - p.y)) * progress;
        if (bar_height <= 0.0f) {
            continue;
        }

        // Bars above the origin grow upward, bars below it grow downward
        float top = p.y < lay.origin ? lay.origin - bar_height : lay.origin;

        Paint paint;
        paint.style = PaintStyle::FILL;
        paint.color = items[i].color;

        canvas.draw_rect(Rect(p.x - lay.item_size.width / 2.0f, top, lay.item_size.width,
                              bar_height),
                         paint);
    }
}

} // namespace chartkit
