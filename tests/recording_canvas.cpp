// SPDX-License-Identifier: GPL-3.0-or-later

#include "recording_canvas.h"

#include <cmath>

namespace chartkit {
namespace test {

namespace {

bool finite(Point p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

bool finite(const Rect& r) {
    return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.width) &&
           std::isfinite(r.height);
}

} // namespace

void RecordingCanvas::clear(const Color& color) {
    DrawCall call;
    call.op = DrawOp::CLEAR;
    call.color = color;
    calls_.push_back(call);
}

void RecordingCanvas::draw_path(const Path& path, const Paint& paint) {
    DrawCall call;
    call.op = DrawOp::PATH;
    call.color = paint.color;
    call.paint = paint;
    call.path = path;
    call.rect = path.bounds();
    calls_.push_back(call);
}

void RecordingCanvas::draw_rect(const Rect& rect, const Paint& paint) {
    DrawCall call;
    call.op = DrawOp::RECT;
    call.color = paint.color;
    call.paint = paint;
    call.rect = rect;
    calls_.push_back(call);
}

void RecordingCanvas::draw_circle(Point center, float radius, const Paint& paint) {
    DrawCall call;
    call.op = DrawOp::CIRCLE;
    call.color = paint.color;
    call.paint = paint;
    call.center = center;
    call.radius = radius;
    calls_.push_back(call);
}

void RecordingCanvas::draw_text(const std::string& text, const Rect& box,
                                const TextStyle& style) {
    DrawCall call;
    call.op = DrawOp::TEXT;
    call.color = style.color;
    call.rect = box;
    call.text = text;
    call.text_style = style;
    calls_.push_back(call);
}

Size RecordingCanvas::measure_text(const std::string& text, const TextStyle& style) {
    measure_count_++;
    if (text.empty()) {
        return {};
    }
    return {static_cast<float>(text.size()) * style.size * ADVANCE, style.size};
}

size_t RecordingCanvas::count(DrawOp op) const {
    size_t n = 0;
    for (const auto& c : calls_) {
        if (c.op == op) {
            n++;
        }
    }
    return n;
}

std::vector<DrawCall> RecordingCanvas::of(DrawOp op) const {
    std::vector<DrawCall> out;
    for (const auto& c : calls_) {
        if (c.op == op) {
            out.push_back(c);
        }
    }
    return out;
}

bool RecordingCanvas::all_finite() const {
    for (const auto& c : calls_) {
        if (!finite(c.rect) || !finite(c.center) || !std::isfinite(c.radius)) {
            return false;
        }
        for (const auto& cmd : c.path.commands()) {
            for (const auto& p : cmd.pts) {
                if (!finite(p)) {
                    return false;
                }
            }
        }
    }
    return true;
}

} // namespace test
} // namespace chartkit
