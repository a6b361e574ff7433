// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_canvas.h"

#include "lvgl/lvgl.h"

#include <vector>

/**
 * @file lvgl_chart_canvas.h
 * @brief ChartCanvas backend drawing onto an LVGL layer
 *
 * Used from an LV_EVENT_DRAW_MAIN callback (widget drawing) or between
 * lv_canvas_init_layer()/lv_canvas_finish_layer() (headless rendering).
 *
 * Filled paths are rasterized as horizontal spans (even-odd rule) with
 * lv_draw_fill. Gradients are sampled per span, or per small run of pixels
 * when the gradient varies along X. Strokes are flattened to lv_draw_line
 * segments.
 *
 * LVGL fonts are bitmap fonts of a fixed size, so TextStyle::size is ignored
 * and the line height of the typeface (or the default font) is used instead.
 */

namespace chartkit {

class LvglChartCanvas : public ChartCanvas {
  public:
    /**
     * @param layer Target layer, borrowed for the lifetime of this object
     * @param region Absolute area chart-local (0,0) maps to; also the clip area
     */
    LvglChartCanvas(lv_layer_t* layer, const lv_area_t& region);

    void clear(const Color& color) override;
    void draw_path(const Path& path, const Paint& paint) override;
    void draw_rect(const Rect& rect, const Paint& paint) override;
    void draw_circle(Point center, float radius, const Paint& paint) override;
    void draw_text(const std::string& text, const Rect& box, const TextStyle& style) override;
    Size measure_text(const std::string& text, const TextStyle& style) override;

    /// Font used for a style: its typeface, or the LVGL default font
    static const lv_font_t* resolve_font(const TextStyle& style);

  private:
    void fill_polylines(const std::vector<Polyline>& contours, const Paint& paint);
    void fill_span(int32_t y, float x_start, float x_end, const Paint& paint);
    void stroke_polylines(const std::vector<Polyline>& contours, const Paint& paint);

    lv_layer_t* layer_;
    lv_area_t region_;
};

} // namespace chartkit
