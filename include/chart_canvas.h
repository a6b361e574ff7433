// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_path.h"
#include "chart_shader.h"
#include "chart_types.h"

#include <string>

/**
 * @file chart_canvas.h
 * @brief Drawing surface the chart renderers draw onto
 *
 * Charts only talk to this interface. LvglChartCanvas implements it on an
 * lv_layer_t; tests use a recording implementation.
 *
 * A canvas is borrowed for the duration of one Chart::draw() call. Charts
 * never store a reference to it.
 */

namespace chartkit {

/**
 * @brief Opaque font handle, interpreted by the canvas
 *
 * LvglChartCanvas expects a `const lv_font_t*`. nullptr selects the canvas
 * default font.
 */
using FontHandle = const void*;

enum class TextAlign { LEFT, CENTER, RIGHT };

struct TextStyle {
    float size = 16.0f;          ///< Nominal text height in pixels
    FontHandle typeface = nullptr;
    Color color = colors::GRAY;
    TextAlign align = TextAlign::CENTER;
    bool vertical = false;       ///< Text runs bottom-to-top (rotated -90 degrees)
};

class ChartCanvas {
  public:
    virtual ~ChartCanvas() = default;

    /// Fill the whole drawing region
    virtual void clear(const Color& color) = 0;

    /// Fill or stroke a path according to paint.style
    virtual void draw_path(const Path& path, const Paint& paint) = 0;

    virtual void draw_rect(const Rect& rect, const Paint& paint) = 0;

    virtual void draw_circle(Point center, float radius, const Paint& paint) = 0;

    /**
     * @brief Draw a single line of text inside a box
     *
     * The box is in chart-local pixels and already accounts for rotation:
     * vertical text occupies a box that is tall and narrow.
     */
    virtual void draw_text(const std::string& text, const Rect& box, const TextStyle& style) = 0;

    /**
     * @brief Measure a single line of unrotated text
     *
     * @return Width/height of the rendered text, {0,0} for empty text
     */
    virtual Size measure_text(const std::string& text, const TextStyle& style) = 0;
};

} // namespace chartkit
