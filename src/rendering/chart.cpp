// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace chartkit {

void Chart::draw(ChartCanvas& canvas, int width, int height) {
    canvas.clear(background_color_);

    if (width <= 0 || height <= 0) {
        spdlog::trace("[Chart] Skipping {} draw: empty region {}x{}", chart_type_name(type()),
                      width, height);
        return;
    }

    draw_content(canvas, width, height);
}

float Chart::min_value() const {
    if (min_value_) {
        return *min_value_;
    }
    if (entries_.empty()) {
        return 0.0f;
    }
    float result = 0.0f;
    for (const auto& e : entries_) {
        if (std::isfinite(e.value)) {
            result = std::min(result, e.value);
        }
    }
    return result;
}

float Chart::max_value() const {
    if (max_value_) {
        return *max_value_;
    }
    bool any = false;
    float result = 0.0f;
    for (const auto& e : entries_) {
        if (!std::isfinite(e.value)) {
            continue;
        }
        result = any ? std::max(result, e.value) : e.value;
        any = true;
    }
    return result;
}

void Chart::set_animation_progress(float progress) {
    if (!(progress > 0.0f)) {
        animation_progress_ = 0.0f;
    } else {
        animation_progress_ = std::min(1.0f, progress);
    }
}

std::vector<Size> Chart::measure_labels(ChartCanvas& canvas,
                                        const std::vector<std::string>& labels) const {
    return layout::measure_labels(canvas, labels, label_style());
}

float Chart::calculate_footer_header_height(const std::vector<Size>& sizes,
                                            LabelOrientation orientation,
                                            const std::vector<std::string>& labels) const {
    return layout::calculate_footer_header_height(sizes, orientation, labels, margin_,
                                                  label_text_size_);
}

Size Chart::calculate_item_size(int width, int height, float footer_height,
                                float header_height) const {
    return layout::calculate_item_size(width, height, footer_height, header_height,
                                       entries_.size(), margin_);
}

TextStyle Chart::label_style() const {
    TextStyle style;
    style.size = label_text_size_;
    style.typeface = typeface_;
    style.color = label_color_;
    style.align = TextAlign::CENTER;
    return style;
}

const char* chart_type_name(ChartType type) {
    switch (type) {
    case ChartType::BAR:
        return "bar";
    case ChartType::POINT:
        return "point";
    case ChartType::LINE:
        return "line";
    case ChartType::DONUT:
        return "donut";
    case ChartType::PIE:
        return "pie";
    case ChartType::RADAR:
        return "radar";
    case ChartType::RADIAL_GAUGE:
        return "radial_gauge";
    }
    return "unknown";
}

std::optional<ChartType> chart_type_from_name(const std::string& name) {
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "bar")
        return ChartType::BAR;
    if (normalized == "point")
        return ChartType::POINT;
    if (normalized == "line")
        return ChartType::LINE;
    if (normalized == "donut")
        return ChartType::DONUT;
    if (normalized == "pie")
        return ChartType::PIE;
    if (normalized == "radar")
        return ChartType::RADAR;
    if (normalized == "radial_gauge" || normalized == "gauge")
        return ChartType::RADIAL_GAUGE;

    spdlog::warn("[Chart] Unknown chart type '{}'", name);
    return std::nullopt;
}

} // namespace chartkit
