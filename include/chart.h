// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_canvas.h"
#include "chart_entry.h"
#include "chart_layout.h"
#include "chart_types.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @file chart.h
 * @brief Base contract shared by every chart variant
 *
 * Usage:
 * @code
 *   auto chart = chartkit::create_chart(chartkit::ChartType::LINE);
 *   chart->set_entries(entries);
 *   chart->set_min_value(1000);
 *   chart->set_max_value(17000);
 *
 *   // Host animation driver, once per frame:
 *   chart->set_animation_progress(t);
 *   chart->draw(canvas, width, height);
 * @endcode
 *
 * A chart is a single-owner object: draw() only reads state, but the caller
 * must serialize draw() against setters on the same instance.
 */

namespace chartkit {

class Chart {
  public:
    virtual ~Chart() = default;

    Chart(const Chart&) = delete;
    Chart& operator=(const Chart&) = delete;

    virtual ChartType type() const = 0;

    /**
     * @brief Clear to the background color and draw the chart content
     *
     * Never throws. Degenerate input (no entries, zero range, tiny region)
     * degrades to a smaller or empty rendering.
     *
     * @param canvas Surface borrowed for this call only
     * @param width Region width in pixels
     * @param height Region height in pixels
     */
    void draw(ChartCanvas& canvas, int width, int height);

    // Entries

    /// Replace the whole entry collection
    void set_entries(std::vector<ChartEntry> entries) {
        entries_ = std::move(entries);
    }
    const std::vector<ChartEntry>& entries() const {
        return entries_;
    }

    // Value bounds

    void set_min_value(float v) {
        min_value_ = v;
    }
    void set_max_value(float v) {
        max_value_ = v;
    }
    void clear_min_value() {
        min_value_.reset();
    }
    void clear_max_value() {
        max_value_.reset();
    }

    /// Explicit min, or min(0, min(values)); 0 without entries
    float min_value() const;
    /// Explicit max, or max(values); 0 without entries
    float max_value() const;
    layout::ValueBounds value_bounds() const {
        return {min_value(), max_value()};
    }

    // Styling

    void set_margin(float margin) {
        margin_ = margin;
    }
    float margin() const {
        return margin_;
    }
    void set_label_text_size(float size) {
        label_text_size_ = size;
    }
    float label_text_size() const {
        return label_text_size_;
    }
    void set_typeface(FontHandle typeface) {
        typeface_ = typeface;
    }
    FontHandle typeface() const {
        return typeface_;
    }
    void set_label_color(Color color) {
        label_color_ = color;
    }
    Color label_color() const {
        return label_color_;
    }
    void set_background_color(Color color) {
        background_color_ = color;
    }
    Color background_color() const {
        return background_color_;
    }
    void set_label_orientation(LabelOrientation o) {
        label_orientation_ = o;
    }
    LabelOrientation label_orientation() const {
        return label_orientation_;
    }
    void set_value_label_orientation(LabelOrientation o) {
        value_label_orientation_ = o;
    }
    LabelOrientation value_label_orientation() const {
        return value_label_orientation_;
    }

    /// Set animation progress, clamped to [0, 1] (NaN becomes 0)
    void set_animation_progress(float progress);
    float animation_progress() const {
        return animation_progress_;
    }

    // Shared measurement / layout helpers

    std::vector<Size> measure_labels(ChartCanvas& canvas,
                                     const std::vector<std::string>& labels) const;
    float calculate_footer_header_height(const std::vector<Size>& sizes,
                                         LabelOrientation orientation,
                                         const std::vector<std::string>& labels) const;
    Size calculate_item_size(int width, int height, float footer_height,
                             float header_height) const;

  protected:
    Chart() = default;

    /// Draw the variant-specific content; the region is already cleared
    virtual void draw_content(ChartCanvas& canvas, int width, int height) = 0;

    TextStyle label_style() const;

  private:
    std::vector<ChartEntry> entries_;
    std::optional<float> min_value_;
    std::optional<float> max_value_;
    float margin_ = 20.0f;
    float label_text_size_ = 16.0f;
    FontHandle typeface_ = nullptr;
    Color label_color_ = colors::GRAY;
    Color background_color_ = colors::WHITE;
    LabelOrientation label_orientation_ = LabelOrientation::HORIZONTAL;
    LabelOrientation value_label_orientation_ = LabelOrientation::HORIZONTAL;
    float animation_progress_ = 1.0f;
};

/// Lowercase name used in logs and JSON ("line", "radial_gauge", ...)
const char* chart_type_name(ChartType type);

/// Inverse of chart_type_name(); also accepts '-' for '_'
std::optional<ChartType> chart_type_from_name(const std::string& name);

} // namespace chartkit
