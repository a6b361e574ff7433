// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

/**
 * @file chart_config.h
 * @brief JSON chart descriptions for the demo application
 *
 * A description names the chart variant, the render size, styling and the
 * entries:
 * ```json
 * { "type": "line", "width": 480, "height": 320, "min": 1000, "max": 17000,
 *   "line": { "mode": "spline", "fade_out_gradient": true },
 *   "entries": [ { "value": 212, "label": "Jan", "color": "#266489" } ] }
 * ```
 *
 * Unknown keys are ignored. Missing keys keep the defaults of the chart
 * variant, which is why most fields are optional here.
 */

namespace chartkit {

struct ChartConfig {
    ChartType type = ChartType::LINE;
    int width = 480;
    int height = 320;

    std::optional<float> min_value;
    std::optional<float> max_value;
    std::optional<float> margin;
    std::optional<float> label_text_size;
    std::optional<float> animation_progress;
    std::optional<Color> background;
    std::optional<Color> label_color;
    std::optional<LabelOrientation> label_orientation;
    std::optional<LabelOrientation> value_label_orientation;

    // "line" section (LineChart; size/area_alpha also RadarChart and RadialGaugeChart)
    std::optional<LineMode> line_mode;
    std::optional<float> line_size;
    std::optional<uint8_t> line_area_alpha;
    std::optional<bool> fade_out_gradient;
    std::optional<bool> solid_gradient;
    std::optional<Color> gradient_start;
    std::optional<Color> gradient_end;

    // "point" section (point-based charts and RadarChart)
    std::optional<PointMode> point_mode;
    std::optional<float> point_size;
    std::optional<uint8_t> point_area_alpha;

    // "bar" section
    std::optional<uint8_t> bar_area_alpha;

    // "donut" section (DonutChart, PieChart)
    std::optional<float> hole_radius;
    std::optional<DonutLabelMode> donut_label_mode;

    // "radar" section
    std::optional<float> border_line_size;
    std::optional<Color> border_line_color;

    std::vector<ChartEntry> entries;
};

/**
 * @brief Build a ChartConfig from parsed JSON
 *
 * @return nullopt (with the reason logged) for a non-object root, an unknown
 *         chart type or enum name, an invalid color, or a malformed entry list
 */
std::optional<ChartConfig> parse_chart_config(const nlohmann::json& j);

/// Parse JSON text; syntax errors are logged and yield nullopt
std::optional<ChartConfig> parse_chart_config_string(const std::string& text);

/// Read and parse a JSON file; I/O and syntax errors are logged and yield nullopt
std::optional<ChartConfig> load_chart_config(const std::string& path);

/// Copy every field that is set onto @p chart; fields of other variants are ignored
void apply_chart_config(const ChartConfig& config, Chart& chart);

/// create_chart(config.type) followed by apply_chart_config()
std::unique_ptr<Chart> create_chart_from_config(const ChartConfig& config);

} // namespace chartkit
