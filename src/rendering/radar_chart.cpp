// SPDX-License-Identifier: GPL-3.0-or-later

#include "radar_chart.h"

#include "chart_captions.h"
#include "color_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace chartkit {

namespace {

constexpr float DEG_TO_RAD = 3.14159265358979f / 180.0f;

Point polar(Point center, float radius, float degrees) {
    float rad = degrees * DEG_TO_RAD;
    return {center.x + radius * std::cos(rad), center.y + radius * std::sin(rad)};
}

} // namespace

float RadarChart::spoke_angle(size_t index) const {
    size_t n = entries().size();
    if (n == 0) {
        return -90.0f;
    }
    return -90.0f + 360.0f * static_cast<float>(index) / static_cast<float>(n);
}

std::vector<Point> RadarChart::calculate_points(Point center, float radius) const {
    const auto& items = entries();
    layout::ValueBounds bounds = value_bounds();

    std::vector<Point> points;
    points.reserve(items.size());
    for (size_t i = 0; i < items.size(); i++) {
        float amount = bounds.fraction(items[i].value);
        points.push_back(polar(center, amount * radius * animation_progress(), spoke_angle(i)));
    }
    return points;
}

void RadarChart::draw_content(ChartCanvas& canvas, int width, int height) {
    const auto& items = entries();
    if (items.empty()) {
        return;
    }

    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);

    bool has_captions = std::any_of(items.begin(), items.end(), [](const ChartEntry& e) {
        return !captions::caption_text(e).empty();
    });
    float caption_height = has_captions ? label_text_size() : 0.0f;

    Point center(w / 2.0f, h / 2.0f);
    float radius = (std::min(w, h) - 2.0f * margin()) / 2.0f - caption_height;
    if (radius <= 0.0f) {
        spdlog::trace("[Chart:{}] No room for the radar in {}x{}", chart_type_name(type()), width,
                      height);
        return;
    }

    draw_border(canvas, center, radius);

    std::vector<Point> points = calculate_points(center, radius);

    if (points.size() >= 3) {
        std::vector<Color> entry_colors;
        entry_colors.reserve(items.size());
        for (const auto& e : items) {
            entry_colors.push_back(e.color);
        }
        Color average = average_color(entry_colors);

        Path polygon;
        polygon.move_to(points.front());
        for (size_t i = 1; i < points.size(); i++) {
            polygon.line_to(points[i]);
        }
        polygon.close();

        auto alpha = static_cast<uint8_t>(line_area_alpha_ * animation_progress());
        if (alpha > 0) {
            Paint fill;
            fill.style = PaintStyle::FILL;
            fill.color = average.with_alpha(alpha);
            canvas.draw_path(polygon, fill);
        }

        if (line_size_ > 0.0f) {
            Paint stroke;
            stroke.style = PaintStyle::STROKE;
            stroke.stroke_width = line_size_;
            stroke.color = average;
            canvas.draw_path(polygon, stroke);
        }
    }

    float marker = point_size_ * animation_progress();
    if (point_mode_ != PointMode::NONE && marker > 0.0f) {
        for (size_t i = 0; i < points.size(); i++) {
            Paint paint;
            paint.style = PaintStyle::FILL;
            paint.color = items[i].color;
            if (point_mode_ == PointMode::SQUARE) {
                canvas.draw_rect(Rect(points[i].x - marker / 2.0f, points[i].y - marker / 2.0f,
                                      marker, marker),
                                 paint);
            } else {
                canvas.draw_circle(points[i], marker / 2.0f, paint);
            }
        }
    }

    if (has_captions) {
        draw_captions(canvas, center, radius);
    }
}

void RadarChart::draw_border(ChartCanvas& canvas, Point center, float radius) const {
    if (border_line_size_ <= 0.0f) {
        return;
    }

    Paint paint;
    paint.style = PaintStyle::STROKE;
    paint.stroke_width = border_line_size_;
    paint.color = border_line_color_;

    canvas.draw_circle(center, radius, paint);

    Path spokes;
    for (size_t i = 0; i < entries().size(); i++) {
        spokes.move_to(center);
        spokes.line_to(polar(center, radius, spoke_angle(i)));
    }
    canvas.draw_path(spokes, paint);
}

void RadarChart::draw_captions(ChartCanvas& canvas, Point center, float radius) const {
    const auto& items = entries();
    TextStyle style = label_style();
    const float text_size = label_text_size();
    const float distance = radius + text_size / 2.0f + point_size_ / 2.0f;

    for (size_t i = 0; i < items.size(); i++) {
        std::string text = captions::caption_text(items[i]);
        if (text.empty()) {
            continue;
        }

        Point anchor = polar(center, distance, spoke_angle(i));
        float text_width = canvas.measure_text(text, style).width;

        Rect box(anchor.x - text_width / 2.0f, anchor.y - text_size / 2.0f, text_width, text_size);
        style.align = TextAlign::CENTER;
        if (anchor.x > center.x + 1.0f) {
            box.x = anchor.x;
            style.align = TextAlign::LEFT;
        } else if (anchor.x < center.x - 1.0f) {
            box.x = anchor.x - text_width;
            style.align = TextAlign::RIGHT;
        }
        canvas.draw_text(text, box, style);
    }
}

} // namespace chartkit
