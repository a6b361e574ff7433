// SPDX-License-Identifier: GPL-3.0-or-later

#include "demo_data.h"

#include "line_chart.h"

#include <spdlog/spdlog.h>

#include <random>
#include <string>

namespace chartkit {
namespace demo {

namespace {

const char* const MONTHS[] = {"January", "February", "March",     "April",   "May",      "June",
                              "July",    "August",   "September", "October", "November", "December"};

constexpr Color DEMO_COLOR = Color::from_rgb(0xFF0000);

} // namespace

std::vector<ChartEntry> generate_entries(uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(1000, 16999);

    std::vector<ChartEntry> entries;
    entries.reserve(12);
    for (const char* month : MONTHS) {
        int value = dist(rng);
        entries.emplace_back(static_cast<float>(value), month, std::to_string(value), DEMO_COLOR);
    }
    return entries;
}

ChartType next_chart_type(ChartType current) {
    switch (current) {
    case ChartType::BAR:
        return ChartType::POINT;
    case ChartType::POINT:
        return ChartType::LINE;
    case ChartType::LINE:
        return ChartType::DONUT;
    case ChartType::DONUT:
        return ChartType::PIE;
    case ChartType::PIE:
        return ChartType::RADAR;
    case ChartType::RADAR:
        return ChartType::RADIAL_GAUGE;
    case ChartType::RADIAL_GAUGE:
        return ChartType::BAR;
    }
    return ChartType::BAR;
}

void apply_demo_data(Chart& chart, uint32_t seed) {
    chart.set_entries(generate_entries(seed));
    chart.set_min_value(DEMO_MIN_VALUE);
    chart.set_max_value(DEMO_MAX_VALUE);

    if (chart.type() == ChartType::LINE) {
        static_cast<LineChart&>(chart).set_enable_y_fade_out_gradient(true);
    }
    spdlog::debug("[Demo] Loaded 12 entries into {} chart (seed {})", chart_type_name(chart.type()),
                  seed);
}

} // namespace demo
} // namespace chartkit
