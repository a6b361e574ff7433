// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file demo_data.h
 * @brief Sample data for the demo application
 */

#include "chart.h"
#include "chart_entry.h"

#include <cstdint>
#include <vector>

namespace chartkit {
namespace demo {

constexpr float DEMO_MIN_VALUE = 1000.0f;
constexpr float DEMO_MAX_VALUE = 17000.0f;

/**
 * @brief Twelve monthly entries with random values in [1000, 16999]
 *
 * Every entry is red, labeled with its month, and carries its integer value
 * as value label. The same seed always yields the same values.
 */
std::vector<ChartEntry> generate_entries(uint32_t seed);

/// Demo chart cycle order: bar, point, line, donut, pie, radar, radial_gauge
ChartType next_chart_type(ChartType current);

/**
 * @brief Load demo data into a chart
 *
 * Sets the entries and the 1000..17000 bounds. Line charts also get the
 * vertical fade-out area.
 */
void apply_demo_data(Chart& chart, uint32_t seed);

} // namespace demo
} // namespace chartkit
