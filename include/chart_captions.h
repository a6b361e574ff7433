// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_canvas.h"
#include "chart_entry.h"

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file chart_captions.h
 * @brief Legend-style captions for the radial chart variants
 *
 * A caption row is a color swatch followed by "<value label> <label>".
 */

namespace chartkit {
namespace captions {

/// "<value label> <label>", trimmed; empty if both are empty
std::string caption_text(const ChartEntry& entry);

/// Swatch edge length for a text size
float swatch_size(float text_size);

/**
 * @brief Width needed by a caption column for the given entries
 *
 * @return 0 if no entry has caption text
 */
float column_width(ChartCanvas& canvas, const std::vector<ChartEntry>& entries,
                   const std::vector<size_t>& indices, const TextStyle& style, float margin);

/**
 * @brief Draw caption rows stacked and vertically centered in @p column
 *
 * Rows without caption text are skipped. Rows that do not fit are dropped.
 */
void draw_column(ChartCanvas& canvas, const std::vector<ChartEntry>& entries,
                 const std::vector<size_t>& indices, const Rect& column, const TextStyle& style,
                 float margin);

} // namespace captions
} // namespace chartkit
