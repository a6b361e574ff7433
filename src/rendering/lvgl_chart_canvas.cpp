// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_chart_canvas.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace chartkit {

namespace {

// Pixels sampled per color step when a gradient varies along X
constexpr int32_t GRADIENT_RUN = 4;

// Full sweep in degrees for circles filled with a shader
constexpr float CIRCLE_SWEEP = 360.0f;

lv_color_t to_lv_color(const Color& c) {
    return lv_color_make(c.r, c.g, c.b);
}

struct Edge {
    Point a;
    Point b;
};

} // namespace

LvglChartCanvas::LvglChartCanvas(lv_layer_t* layer, const lv_area_t& region)
    : layer_(layer), region_(region) {}

const lv_font_t* LvglChartCanvas::resolve_font(const TextStyle& style) {
    if (style.typeface) {
        return static_cast<const lv_font_t*>(style.typeface);
    }
    return lv_font_get_default();
}

void LvglChartCanvas::clear(const Color& color) {
    if (!layer_ || color.a == 0) {
        return;
    }
    lv_draw_fill_dsc_t fill_dsc;
    lv_draw_fill_dsc_init(&fill_dsc);
    fill_dsc.color = to_lv_color(color);
    fill_dsc.opa = color.a;
    lv_draw_fill(layer_, &fill_dsc, &region_);
}

void LvglChartCanvas::draw_path(const Path& path, const Paint& paint) {
    if (!layer_ || path.empty()) {
        return;
    }
    auto contours = path.flatten();
    if (paint.style == PaintStyle::FILL) {
        fill_polylines(contours, paint);
    } else {
        stroke_polylines(contours, paint);
    }
}

void LvglChartCanvas::draw_rect(const Rect& rect, const Paint& paint) {
    if (!layer_ || rect.width <= 0.0f || rect.height <= 0.0f) {
        return;
    }

    if (paint.style == PaintStyle::STROKE) {
        Color c = paint.shader.is_none() ? paint.color
                                         : paint.shader.color_at(rect.center().x, rect.center().y);
        lv_draw_rect_dsc_t rect_dsc;
        lv_draw_rect_dsc_init(&rect_dsc);
        rect_dsc.bg_opa = LV_OPA_TRANSP;
        rect_dsc.border_color = to_lv_color(c);
        rect_dsc.border_opa = c.a;
        rect_dsc.border_width = std::max(1, static_cast<int32_t>(std::lround(paint.stroke_width)));

        lv_area_t area;
        area.x1 = region_.x1 + static_cast<int32_t>(std::lround(rect.left()));
        area.y1 = region_.y1 + static_cast<int32_t>(std::lround(rect.top()));
        area.x2 = region_.x1 + static_cast<int32_t>(std::lround(rect.right())) - 1;
        area.y2 = region_.y1 + static_cast<int32_t>(std::lround(rect.bottom())) - 1;
        lv_draw_rect(layer_, &rect_dsc, &area);
        return;
    }

    // Rows as spans so gradients resolve like any other filled shape
    int32_t height = lv_area_get_height(&region_);
    int32_t y_first = std::max<int32_t>(0, static_cast<int32_t>(std::ceil(rect.top() - 0.5f)));
    int32_t y_last =
        std::min<int32_t>(height - 1, static_cast<int32_t>(std::ceil(rect.bottom() - 0.5f)) - 1);
    for (int32_t y = y_first; y <= y_last; y++) {
        fill_span(y, rect.left(), rect.right(), paint);
    }
}

void LvglChartCanvas::draw_circle(Point center, float radius, const Paint& paint) {
    if (!layer_ || !(radius > 0.0f)) {
        return;
    }

    if (!paint.shader.is_none()) {
        Path circle;
        circle.arc_to(center, radius, 0.0f, CIRCLE_SWEEP, false);
        circle.close();
        draw_path(circle, paint);
        return;
    }

    int32_t cx = region_.x1 + static_cast<int32_t>(std::lround(center.x));
    int32_t cy = region_.y1 + static_cast<int32_t>(std::lround(center.y));

    if (paint.style == PaintStyle::FILL) {
        int32_t r = static_cast<int32_t>(std::lround(radius));
        lv_draw_rect_dsc_t dot_dsc;
        lv_draw_rect_dsc_init(&dot_dsc);
        dot_dsc.bg_color = to_lv_color(paint.color);
        dot_dsc.bg_opa = paint.color.a;
        dot_dsc.radius = LV_RADIUS_CIRCLE;
        dot_dsc.border_width = 0;

        lv_area_t dot_area;
        dot_area.x1 = cx - r;
        dot_area.y1 = cy - r;
        dot_area.x2 = cx + r;
        dot_area.y2 = cy + r;
        lv_draw_rect(layer_, &dot_dsc, &dot_area);
        return;
    }

    // Stroke centered on the radius, as an arc whose radius is the outer edge
    int32_t width = std::max(1, static_cast<int32_t>(std::lround(paint.stroke_width)));
    lv_draw_arc_dsc_t ring_dsc;
    lv_draw_arc_dsc_init(&ring_dsc);
    ring_dsc.color = to_lv_color(paint.color);
    ring_dsc.opa = paint.color.a;
    ring_dsc.width = static_cast<uint16_t>(width);
    ring_dsc.center.x = cx;
    ring_dsc.center.y = cy;
    ring_dsc.radius = static_cast<uint16_t>(std::lround(radius + width / 2.0f));
    ring_dsc.start_angle = 0;
    ring_dsc.end_angle = 360;
    lv_draw_arc(layer_, &ring_dsc);
}

void LvglChartCanvas::draw_text(const std::string& text, const Rect& box, const TextStyle& style) {
    if (!layer_ || text.empty() || style.color.a == 0) {
        return;
    }

    lv_draw_label_dsc_t label_dsc;
    lv_draw_label_dsc_init(&label_dsc);
    label_dsc.text = text.c_str();
    label_dsc.text_local = true;
    label_dsc.font = resolve_font(style);
    label_dsc.color = to_lv_color(style.color);
    label_dsc.opa = style.color.a;
    switch (style.align) {
    case TextAlign::LEFT:
        label_dsc.align = LV_TEXT_ALIGN_LEFT;
        break;
    case TextAlign::RIGHT:
        label_dsc.align = LV_TEXT_ALIGN_RIGHT;
        break;
    case TextAlign::CENTER:
        label_dsc.align = LV_TEXT_ALIGN_CENTER;
        break;
    }

    Point c = box.center();
    float w = box.width;
    float h = box.height;
    if (style.vertical) {
        // Lay the text out unrotated in a box of swapped size, then turn it
        std::swap(w, h);
        label_dsc.rotation = 2700;
    }

    lv_area_t area;
    area.x1 = region_.x1 + static_cast<int32_t>(std::lround(c.x - w / 2.0f));
    area.y1 = region_.y1 + static_cast<int32_t>(std::lround(c.y - h / 2.0f));
    area.x2 = area.x1 + std::max(1, static_cast<int32_t>(std::lround(w))) - 1;
    area.y2 = area.y1 + std::max(1, static_cast<int32_t>(std::lround(h))) - 1;
    lv_draw_label(layer_, &label_dsc, &area);
}

Size LvglChartCanvas::measure_text(const std::string& text, const TextStyle& style) {
    if (text.empty()) {
        return {};
    }
    lv_point_t txt_size;
    lv_text_get_size(&txt_size, text.c_str(), resolve_font(style), 0, 0, LV_COORD_MAX,
                     LV_TEXT_FLAG_NONE);
    return {static_cast<float>(txt_size.x), static_cast<float>(txt_size.y)};
}

void LvglChartCanvas::fill_polylines(const std::vector<Polyline>& contours, const Paint& paint) {
    std::vector<Edge> edges;
    float min_y = 0.0f;
    float max_y = 0.0f;
    bool first = true;

    // Every contour is implicitly closed for filling
    for (const auto& contour : contours) {
        const auto& pts = contour.points;
        if (pts.size() < 2) {
            continue;
        }
        for (size_t i = 0; i < pts.size(); i++) {
            const Point& a = pts[i];
            const Point& b = pts[(i + 1) % pts.size()];
            if (first) {
                min_y = max_y = a.y;
                first = false;
            }
            min_y = std::min(min_y, a.y);
            max_y = std::max(max_y, a.y);
            if (a.y != b.y) {
                edges.push_back({a, b});
            }
        }
    }
    if (edges.empty()) {
        return;
    }

    int32_t height = lv_area_get_height(&region_);
    int32_t y_first = std::max<int32_t>(0, static_cast<int32_t>(std::ceil(min_y - 0.5f)));
    int32_t y_last =
        std::min<int32_t>(height - 1, static_cast<int32_t>(std::ceil(max_y - 0.5f)) - 1);

    std::vector<float> crossings;
    for (int32_t y = y_first; y <= y_last; y++) {
        float sample_y = static_cast<float>(y) + 0.5f;
        crossings.clear();
        for (const auto& e : edges) {
            bool down = e.a.y <= sample_y && e.b.y > sample_y;
            bool up = e.b.y <= sample_y && e.a.y > sample_y;
            if (down || up) {
                float t = (sample_y - e.a.y) / (e.b.y - e.a.y);
                crossings.push_back(e.a.x + t * (e.b.x - e.a.x));
            }
        }
        std::sort(crossings.begin(), crossings.end());
        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            fill_span(y, crossings[i], crossings[i + 1], paint);
        }
    }
}

void LvglChartCanvas::fill_span(int32_t y, float x_start, float x_end, const Paint& paint) {
    int32_t width = lv_area_get_width(&region_);
    int32_t px_first = std::max<int32_t>(0, static_cast<int32_t>(std::ceil(x_start - 0.5f)));
    int32_t px_last =
        std::min<int32_t>(width - 1, static_cast<int32_t>(std::ceil(x_end - 0.5f)) - 1);
    if (px_last < px_first) {
        return;
    }

    lv_draw_fill_dsc_t fill_dsc;
    lv_draw_fill_dsc_init(&fill_dsc);
    float sample_y = static_cast<float>(y) + 0.5f;

    // One color for the whole span unless the color changes along X
    int32_t run = (paint.shader.is_none() || paint.shader.is_vertical()) ? (px_last - px_first + 1)
                                                                         : GRADIENT_RUN;

    for (int32_t px = px_first; px <= px_last; px += run) {
        int32_t run_last = std::min(px_last, px + run - 1);
        Color c = paint.color;
        if (!paint.shader.is_none()) {
            float sample_x = (static_cast<float>(px) + static_cast<float>(run_last) + 1.0f) / 2.0f;
            c = paint.shader.color_at(sample_x, sample_y);
        }
        if (c.a == 0) {
            continue;
        }
        fill_dsc.color = to_lv_color(c);
        fill_dsc.opa = c.a;
        lv_area_t line = {region_.x1 + px, region_.y1 + y, region_.x1 + run_last, region_.y1 + y};
        lv_draw_fill(layer_, &fill_dsc, &line);
    }
}

void LvglChartCanvas::stroke_polylines(const std::vector<Polyline>& contours, const Paint& paint) {
    lv_draw_line_dsc_t line_dsc;
    lv_draw_line_dsc_init(&line_dsc);
    line_dsc.width = std::max(1, static_cast<int32_t>(std::lround(paint.stroke_width)));
    line_dsc.round_start = true;
    line_dsc.round_end = true;

    size_t segments = 0;
    for (const auto& contour : contours) {
        const auto& pts = contour.points;
        size_t count = contour.closed ? pts.size() : (pts.empty() ? 0 : pts.size() - 1);
        for (size_t i = 0; i < count && pts.size() >= 2; i++) {
            const Point& a = pts[i];
            const Point& b = pts[(i + 1) % pts.size()];

            Color c = paint.color;
            if (!paint.shader.is_none()) {
                c = paint.shader.color_at((a.x + b.x) / 2.0f, (a.y + b.y) / 2.0f);
            }
            if (c.a == 0) {
                continue;
            }
            line_dsc.color = to_lv_color(c);
            line_dsc.opa = c.a;
            line_dsc.p1.x = static_cast<lv_value_precise_t>(region_.x1 + a.x);
            line_dsc.p1.y = static_cast<lv_value_precise_t>(region_.y1 + a.y);
            line_dsc.p2.x = static_cast<lv_value_precise_t>(region_.x1 + b.x);
            line_dsc.p2.y = static_cast<lv_value_precise_t>(region_.y1 + b.y);
            lv_draw_line(layer_, &line_dsc);
            segments++;
        }
    }
    spdlog::trace("[LvglChartCanvas] Stroked {} segments", segments);
}

} // namespace chartkit
