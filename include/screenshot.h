// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

#include <cstdint>
#include <string>

namespace chartkit {

/**
 * @brief Write ARGB8888 pixels as an uncompressed 32-bit BMP
 *
 * @param stride Bytes per source row (>= width * 4)
 * @return false if the file cannot be written
 */
bool write_bmp(const char* filename, const uint8_t* data, int width, int height, uint32_t stride);

/**
 * @brief Render a chart off-screen and save it as a BMP
 *
 * Draws through LvglChartCanvas into an lv_canvas buffer. LVGL must be
 * initialized and a default display must exist.
 *
 * @return false if the buffer cannot be allocated or the file cannot be written
 */
bool render_chart_to_bmp(Chart& chart, int width, int height, const std::string& path);

} // namespace chartkit
