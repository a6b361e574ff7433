// SPDX-License-Identifier: GPL-3.0-or-later

#include "line_chart.h"

#include "color_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chartkit {

LineChart::LineChart() {
    set_point_size(10.0f);
}

void LineChart::draw_content(ChartCanvas& canvas, int width, int height) {
    if (entries().empty()) {
        return;
    }

    layout::PointLayout lay = compute_layout(canvas, width, height);

    draw_area(canvas, lay.points, lay.item_size, lay.origin);
    draw_line(canvas, lay.points, lay.item_size);
    draw_points(canvas, lay.points);
    draw_header(canvas, lay);
    draw_footer(canvas, lay, height);
}

void LineChart::append_segments(Path& path, const std::vector<Point>& points,
                                Size item_size) const {
    switch (line_mode_) {
    case LineMode::SPLINE:
        for (size_t i = 0; i + 1 < points.size(); i++) {
            layout::CubicInfo cubic = layout::calculate_cubic_info(points, i, item_size);
            path.cubic_to(cubic.control, cubic.next_control, cubic.next_point);
        }
        break;
    case LineMode::STRAIGHT:
        for (size_t i = 1; i < points.size(); i++) {
            path.line_to(points[i]);
        }
        break;
    case LineMode::NONE:
        // No segments: a NONE area collapses to the triangle first point / baseline
        break;
    }
}

void LineChart::draw_line(ChartCanvas& canvas, const std::vector<Point>& points,
                          Size item_size) const {
    if (points.size() < 2 || line_mode_ == LineMode::NONE) {
        return;
    }

    Paint paint;
    paint.style = PaintStyle::STROKE;
    paint.color = colors::WHITE;
    paint.stroke_width = line_size_;
    paint.antialias = true;
    paint.shader = create_x_gradient(points);

    Path path;
    path.move_to(points.front());
    append_segments(path, points, item_size);

    canvas.draw_path(path, paint);
}

void LineChart::draw_area(ChartCanvas& canvas, const std::vector<Point>& points, Size item_size,
                          float origin) const {
    if (line_area_alpha_ == 0 || points.size() < 2) {
        return;
    }

    Paint paint;
    paint.style = PaintStyle::FILL;
    paint.color = colors::WHITE;
    paint.antialias = true;
    paint.shader = create_area_shader(points, origin);

    Path path;
    path.move_to(points.front().x, origin);
    path.line_to(points.front());
    append_segments(path, points, item_size);
    path.line_to(points.back().x, origin);
    path.close();

    canvas.draw_path(path, paint);
}

Shader LineChart::create_x_gradient(const std::vector<Point>& points, uint8_t alpha) const {
    const float start_x = 0.0f;
    const float end_x = points.empty() ? 0.0f : points.back().x;

    std::vector<Color> stops;
    stops.reserve(entries().size());
    for (const auto& entry : entries()) {
        stops.push_back(entry.color.with_alpha(alpha));
    }

    return Shader::linear_gradient(Point(start_x, 0.0f), Point(end_x, 0.0f), std::move(stops));
}

Shader LineChart::create_y_gradient(const std::vector<Point>& points, float origin) const {
    float top_y = 0.0f;
    float bottom_y = 0.0f;
    if (!points.empty()) {
        auto minmax = std::minmax_element(points.begin(), points.end(),
                                          [](const Point& a, const Point& b) { return a.y < b.y; });
        top_y = minmax.first->y;
        bottom_y = minmax.second->y;
    }

    const float progress = animation_progress();
    std::vector<Color> stops = {scale_alpha(gradient_y_color_start_, progress),
                                scale_alpha(gradient_y_color_end_, progress)};

    if (enable_y_solid_gradient_) {
        return Shader::linear_gradient(Point(0.0f, origin), Point(0.0f, top_y), std::move(stops));
    }
    return Shader::linear_gradient(Point(0.0f, 0.0f), Point(0.0f, bottom_y), std::move(stops));
}

Shader LineChart::create_area_shader(const std::vector<Point>& points, float origin) const {
    auto alpha = static_cast<uint8_t>(line_area_alpha_ * animation_progress());

    if (enable_y_solid_gradient_) {
        if (enable_y_fade_out_gradient_) {
            spdlog::trace("[LineChart] Solid Y gradient overrides fade-out gradient");
        }
        return create_y_gradient(points, origin);
    }
    if (enable_y_fade_out_gradient_) {
        return Shader::compose(create_y_gradient(points, origin), create_x_gradient(points, alpha),
                               BlendMode::SRC_OUT);
    }
    return create_x_gradient(points, alpha);
}

} // namespace chartkit
