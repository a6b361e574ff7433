// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_types.h"

#include <string>

namespace chartkit {

/**
 * @brief One labeled data point
 *
 * Empty label / value_label strings mean "no label" and take no header or
 * footer space.
 */
struct ChartEntry {
    float value = 0.0f;
    std::string label;       ///< Category label, drawn in the footer
    std::string value_label; ///< Formatted value, drawn in the header
    Color color = Color::from_rgb(0x266489);

    ChartEntry() = default;
    explicit ChartEntry(float v) : value(v) {}
    ChartEntry(float v, std::string lbl, std::string value_lbl, Color c)
        : value(v), label(std::move(lbl)), value_label(std::move(value_lbl)), color(c) {}
};

} // namespace chartkit
