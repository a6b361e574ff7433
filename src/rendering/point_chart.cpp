// SPDX-License-Identifier: GPL-3.0-or-later

#include "point_chart.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace chartkit {

float PointChart::calculate_y_origin(float item_height, float header_height) const {
    return layout::calculate_y_origin(item_height, header_height, value_bounds());
}

std::vector<Point> PointChart::calculate_points(Size item_size, float origin,
                                                float header_height) const {
    return layout::calculate_points(entries(), item_size, origin, header_height, margin(),
                                    value_bounds());
}

layout::PointLayout PointChart::compute_layout(ChartCanvas& canvas, int width, int height) const {
    layout::PointLayout lay;

    const auto& items = entries();
    lay.labels.reserve(items.size());
    lay.value_labels.reserve(items.size());
    size_t non_finite = 0;
    for (const auto& entry : items) {
        lay.labels.push_back(entry.label);
        lay.value_labels.push_back(entry.value_label);
        if (!std::isfinite(entry.value)) {
            non_finite++;
        }
    }
    if (non_finite > 0) {
        spdlog::warn("[Chart:{}] {} non-finite value(s) plotted as 0", chart_type_name(type()),
                     non_finite);
    }

    lay.label_sizes = measure_labels(canvas, lay.labels);
    lay.footer_height =
        calculate_footer_header_height(lay.label_sizes, label_orientation(), lay.labels);

    lay.value_label_sizes = measure_labels(canvas, lay.value_labels);
    lay.header_height = calculate_footer_header_height(
        lay.value_label_sizes, value_label_orientation(), lay.value_labels);

    lay.item_size = calculate_item_size(width, height, lay.footer_height, lay.header_height);
    lay.origin = calculate_y_origin(lay.item_size.height, lay.header_height);
    lay.points = calculate_points(lay.item_size, lay.origin, lay.header_height);

    spdlog::trace("[Chart:{}] Layout {}x{}: item {:.1f}x{:.1f}, header {:.1f}, footer {:.1f}, "
                  "origin {:.1f}",
                  chart_type_name(type()), width, height, lay.item_size.width,
                  lay.item_size.height, lay.header_height, lay.footer_height, lay.origin);
    return lay;
}

void PointChart::draw_content(ChartCanvas& canvas, int width, int height) {
    if (entries().empty()) {
        return;
    }

    layout::PointLayout lay = compute_layout(canvas, width, height);

    draw_point_areas(canvas, lay.points, lay.origin);
    draw_points(canvas, lay.points);
    draw_header(canvas, lay);
    draw_footer(canvas, lay, height);
}

void PointChart::draw_points(ChartCanvas& canvas, const std::vector<Point>& points) const {
    if (points.empty() || point_mode_ == PointMode::NONE) {
        return;
    }

    float size = point_size_ * animation_progress();
    if (size <= 0.0f) {
        return;
    }

    const auto& items = entries();
    for (size_t i = 0; i < points.size() && i < items.size(); i++) {
        Paint paint;
        paint.style = PaintStyle::FILL;
        paint.color = items[i].color;

        const Point& p = points[i];
        if (point_mode_ == PointMode::CIRCLE) {
            canvas.draw_circle(p, size / 2.0f, paint);
        } else {
            canvas.draw_rect(Rect(p.x - size / 2.0f, p.y - size / 2.0f, size, size), paint);
        }
    }
}

void PointChart::draw_point_areas(ChartCanvas& canvas, const std::vector<Point>& points,
                                  float origin) const {
    if (points.empty() || point_area_alpha_ == 0) {
        return;
    }

    auto alpha = static_cast<uint8_t>(point_area_alpha_ * animation_progress());
    if (alpha == 0) {
        return;
    }

    const auto& items = entries();
    for (size_t i = 0; i < points.size() && i < items.size(); i++) {
        const Point& p = points[i];
        const Color& color = items[i].color;

        Paint paint;
        paint.style = PaintStyle::FILL;
        paint.color = color.with_alpha(alpha);
        paint.shader = Shader::linear_gradient(
            Point(0.0f, origin), Point(0.0f, p.y),
            {color.with_alpha(alpha), color.with_alpha(static_cast<uint8_t>(alpha / 3))});

        float top = std::min(origin, p.y);
        float bar_height = std::max(2.0f, std::fabs(origin - p.y));
        canvas.draw_rect(Rect(p.x - point_size_ / 2.0f, top, point_size_, bar_height), paint);
    }
}

void PointChart::draw_header(ChartCanvas& canvas, const layout::PointLayout& lay) const {
    draw_label_row(canvas, lay.value_labels, lay.value_label_sizes, lay.points,
                   value_label_orientation(), lay.header_height - margin(), true);
}

void PointChart::draw_footer(ChartCanvas& canvas, const layout::PointLayout& lay,
                             int height) const {
    draw_label_row(canvas, lay.labels, lay.label_sizes, lay.points, label_orientation(),
                   static_cast<float>(height) - lay.footer_height + margin(), false);
}

void PointChart::draw_label_row(ChartCanvas& canvas, const std::vector<std::string>& labels,
                                const std::vector<Size>& sizes, const std::vector<Point>& points,
                                LabelOrientation orientation, float anchor_y,
                                bool anchor_bottom) const {
    TextStyle style = label_style();
    style.vertical = orientation == LabelOrientation::VERTICAL;

    const size_t count = std::min({labels.size(), sizes.size(), points.size()});
    for (size_t i = 0; i < count; i++) {
        if (!layout::has_text(labels[i])) {
            continue;
        }

        const Size& size = sizes[i];
        const float x = points[i].x;
        Rect box;
        if (style.vertical) {
            // Rotated text: the box is text-height wide and text-width tall
            box = Rect(x - label_text_size() / 2.0f, anchor_y, label_text_size(), size.width);
        } else {
            box = Rect(x - size.width / 2.0f, anchor_y, size.width, label_text_size());
        }
        if (anchor_bottom) {
            box.y -= box.height;
        }

        canvas.draw_text(layout::trim(labels[i]), box, style);
    }
}

} // namespace chartkit
