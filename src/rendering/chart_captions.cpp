// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_captions.h"

#include "chart_layout.h"

#include <algorithm>

namespace chartkit {
namespace captions {

std::string caption_text(const ChartEntry& entry) {
    std::string value = layout::trim(entry.value_label);
    std::string label = layout::trim(entry.label);
    if (value.empty()) {
        return label;
    }
    if (label.empty()) {
        return value;
    }
    return value + " " + label;
}

float swatch_size(float text_size) {
    return text_size * 0.6f;
}

float column_width(ChartCanvas& canvas, const std::vector<ChartEntry>& entries,
                   const std::vector<size_t>& indices, const TextStyle& style, float margin) {
    float widest = 0.0f;
    bool any = false;
    for (size_t idx : indices) {
        if (idx >= entries.size()) {
            continue;
        }
        std::string text = caption_text(entries[idx]);
        if (text.empty()) {
            continue;
        }
        any = true;
        widest = std::max(widest, canvas.measure_text(text, style).width);
    }
    if (!any) {
        return 0.0f;
    }
    return swatch_size(style.size) + margin / 2.0f + widest + margin;
}

void draw_column(ChartCanvas& canvas, const std::vector<ChartEntry>& entries,
                 const std::vector<size_t>& indices, const Rect& column, const TextStyle& style,
                 float margin) {
    std::vector<size_t> rows;
    for (size_t idx : indices) {
        if (idx < entries.size() && !caption_text(entries[idx]).empty()) {
            rows.push_back(idx);
        }
    }
    if (rows.empty() || column.width <= 0.0f) {
        return;
    }

    const float row_height = style.size + margin / 2.0f;
    const size_t fit = static_cast<size_t>(std::max(0.0f, column.height / row_height));
    if (rows.size() > fit) {
        rows.resize(fit);
    }

    const float swatch = swatch_size(style.size);
    float y = column.y + (column.height - row_height * static_cast<float>(rows.size())) / 2.0f;

    TextStyle text_style = style;
    text_style.align = TextAlign::LEFT;
    text_style.vertical = false;

    for (size_t idx : rows) {
        const ChartEntry& entry = entries[idx];

        Paint swatch_paint;
        swatch_paint.style = PaintStyle::FILL;
        swatch_paint.color = entry.color;
        float swatch_y = y + (style.size - swatch) / 2.0f;
        canvas.draw_rect(Rect(column.x + margin / 2.0f, swatch_y, swatch, swatch), swatch_paint);

        float text_x = column.x + margin / 2.0f + swatch + margin / 2.0f;
        Rect box(text_x, y, std::max(0.0f, column.right() - text_x), style.size);
        canvas.draw_text(caption_text(entry), box, text_style);

        y += row_height;
    }
}

} // namespace captions
} // namespace chartkit
