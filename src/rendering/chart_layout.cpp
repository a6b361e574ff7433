// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_layout.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace chartkit {
namespace layout {

float ValueBounds::clamp(float value) const {
    if (!std::isfinite(value)) {
        value = 0.0f;
    }
    if (max < min) {
        return min;
    }
    return std::min(max, std::max(min, value));
}

float ValueBounds::fraction(float value) const {
    if (!has_range()) {
        return 0.0f;
    }
    return static_cast<float>((static_cast<double>(clamp(value)) - min) / range());
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    return s.substr(begin, end - begin);
}

bool has_text(const std::string& label) {
    return std::any_of(label.begin(), label.end(),
                       [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
}

std::vector<Size> measure_labels(ChartCanvas& canvas, const std::vector<std::string>& labels,
                                 const TextStyle& style) {
    std::vector<Size> sizes;
    sizes.reserve(labels.size());
    for (const auto& label : labels) {
        if (!has_text(label)) {
            sizes.emplace_back();
            continue;
        }
        Size measured = canvas.measure_text(trim(label), style);
        // Canvases must not push NaN into the layout
        if (!std::isfinite(measured.width) || !std::isfinite(measured.height)) {
            measured = Size();
        }
        sizes.push_back(measured);
    }
    return sizes;
}

float calculate_footer_header_height(const std::vector<Size>& sizes, LabelOrientation orientation,
                                     const std::vector<std::string>& labels, float margin,
                                     float text_size) {
    if (!std::any_of(labels.begin(), labels.end(), has_text)) {
        return 0.0f;
    }

    float extent = text_size;
    if (orientation == LabelOrientation::VERTICAL) {
        extent = 0.0f;
        for (const auto& s : sizes) {
            extent = std::max(extent, s.width);
        }
    }
    return margin + extent + margin;
}

Size calculate_item_size(int width, int height, float footer_height, float header_height,
                         size_t count, float margin) {
    float h = static_cast<float>(height) - margin - footer_height - header_height;
    if (count == 0) {
        return Size(0.0f, std::max(0.0f, h));
    }
    float n = static_cast<float>(count);
    float w = (static_cast<float>(width) - (n + 1.0f) * margin) / n;
    return Size(std::max(0.0f, w), std::max(0.0f, h));
}

float calculate_y_origin(float item_height, float header_height, const ValueBounds& bounds) {
    if (!bounds.has_range()) {
        return header_height + item_height;
    }
    if (bounds.min > 0.0f || bounds.max < 0.0f) {
        // 0 is not representable: baseline at min (bottom)
        return header_height + item_height;
    }
    return header_height + static_cast<float>(bounds.max / bounds.range()) * item_height;
}

float value_to_y(float value, const ValueBounds& bounds, float item_height, float header_height,
                 float origin) {
    if (!bounds.has_range()) {
        return origin;
    }
    double offset = static_cast<double>(bounds.max) - bounds.clamp(value);
    return header_height + static_cast<float>(offset / bounds.range()) * item_height;
}

float slot_center_x(size_t index, float item_width, float margin) {
    return margin + item_width / 2.0f + static_cast<float>(index) * (item_width + margin);
}

std::vector<Point> calculate_points(const std::vector<ChartEntry>& entries, Size item_size,
                                    float origin, float header_height, float margin,
                                    const ValueBounds& bounds) {
    std::vector<Point> points;
    points.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); i++) {
        float x = slot_center_x(i, item_size.width, margin);
        float y = value_to_y(entries[i].value, bounds, item_size.height, header_height, origin);
        points.emplace_back(x, y);
    }
    return points;
}

CubicInfo calculate_cubic_info(const std::vector<Point>& points, size_t index, Size item_size) {
    CubicInfo info;
    info.point = points[index];
    info.next_point = points[index + 1];
    Point control_offset(item_size.width * SPLINE_CONTROL_RATIO, 0.0f);
    info.control = info.point + control_offset;
    info.next_control = info.next_point - control_offset;
    return info;
}

} // namespace layout
} // namespace chartkit
