// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_config.h"

#include "bar_chart.h"
#include "chart_factory.h"
#include "color_utils.h"
#include "donut_chart.h"
#include "json_utils.h"
#include "line_chart.h"
#include "radar_chart.h"
#include "radial_gauge_chart.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using nlohmann::json;

namespace chartkit {

namespace {

/// Empty object for absent sections, so lookups below need no presence checks
const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    return empty;
}

bool read_color(const json& j, const char* key, std::optional<Color>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    std::optional<Color> color;
    if (j[key].is_string()) {
        color = parse_hex_color(j[key].get<std::string>());
    }
    if (!color) {
        spdlog::error("[ChartConfig] Invalid color for '{}': {}", key, j[key].dump());
        return false;
    }
    out = color;
    return true;
}

bool read_alpha(const json& j, const char* key, std::optional<uint8_t>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    if (!j[key].is_number()) {
        spdlog::error("[ChartConfig] '{}' must be a number 0-255", key);
        return false;
    }
    double value = j[key].get<double>();
    if (value < 0.0 || value > 255.0) {
        spdlog::warn("[ChartConfig] '{}' = {} clamped to 0-255", key, value);
    }
    out = static_cast<uint8_t>(std::clamp(value, 0.0, 255.0));
    return true;
}

/// Positive pixel size; absent keeps @p out, anything else non-positive or out of range fails
bool read_dimension(const json& j, const char* key, int& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    int value = json_util::safe_int(j, key, 0);
    if (value <= 0) {
        spdlog::error("[ChartConfig] Invalid {} {}", key, j[key].dump());
        return false;
    }
    out = value;
    return true;
}

void read_bool(const json& j, const char* key, std::optional<bool>& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = json_util::safe_bool(j, key);
    }
}

/// Look up a lowercase name in a table; logs and fails on unknown names
template <typename E, size_t N>
bool read_enum(const json& j, const char* key, const std::pair<const char*, E> (&names)[N],
               std::optional<E>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    std::string name = json_util::safe_string(j, key);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '-', '_');
    for (const auto& entry : names) {
        if (name == entry.first) {
            out = entry.second;
            return true;
        }
    }
    spdlog::error("[ChartConfig] Unknown value for '{}': {}", key, j[key].dump());
    return false;
}

const std::pair<const char*, LineMode> LINE_MODES[] = {
    {"none", LineMode::NONE}, {"straight", LineMode::STRAIGHT}, {"spline", LineMode::SPLINE}};

const std::pair<const char*, PointMode> POINT_MODES[] = {
    {"none", PointMode::NONE}, {"circle", PointMode::CIRCLE}, {"square", PointMode::SQUARE}};

const std::pair<const char*, LabelOrientation> ORIENTATIONS[] = {
    {"horizontal", LabelOrientation::HORIZONTAL}, {"vertical", LabelOrientation::VERTICAL}};

const std::pair<const char*, DonutLabelMode> DONUT_LABEL_MODES[] = {
    {"none", DonutLabelMode::NONE},
    {"left_and_right", DonutLabelMode::LEFT_AND_RIGHT},
    {"both", DonutLabelMode::LEFT_AND_RIGHT},
    {"right_only", DonutLabelMode::RIGHT_ONLY},
    {"right", DonutLabelMode::RIGHT_ONLY}};

bool parse_entries(const json& j, std::vector<ChartEntry>& out) {
    if (!j.contains("entries") || j["entries"].is_null()) {
        return true;
    }
    const auto& list = j["entries"];
    if (!list.is_array()) {
        spdlog::error("[ChartConfig] 'entries' must be an array");
        return false;
    }

    out.reserve(list.size());
    for (size_t i = 0; i < list.size(); i++) {
        const auto& item = list[i];
        ChartEntry entry;
        if (item.is_number()) {
            entry.value = item.get<float>();
            out.push_back(entry);
            continue;
        }
        if (!item.is_object()) {
            spdlog::error("[ChartConfig] entries[{}] must be an object or a number", i);
            return false;
        }

        entry.value = json_util::safe_float(item, "value");
        entry.label = json_util::safe_string(item, "label");
        entry.value_label = json_util::safe_string(item, "value_label");

        std::optional<Color> color;
        if (!read_color(item, "color", color)) {
            spdlog::error("[ChartConfig] entries[{}] has an invalid color", i);
            return false;
        }
        if (color) {
            entry.color = *color;
        }
        out.push_back(std::move(entry));
    }
    return true;
}

// Shared by point, line and bar charts
void apply_point_options(const ChartConfig& config, PointChart& point) {
    if (config.point_mode)
        point.set_point_mode(*config.point_mode);
    if (config.point_size)
        point.set_point_size(*config.point_size);
    if (config.point_area_alpha)
        point.set_point_area_alpha(*config.point_area_alpha);
}

void apply_line_options(const ChartConfig& config, LineChart& line) {
    if (config.line_mode)
        line.set_line_mode(*config.line_mode);
    if (config.line_size)
        line.set_line_size(*config.line_size);
    if (config.line_area_alpha)
        line.set_line_area_alpha(*config.line_area_alpha);
    if (config.fade_out_gradient)
        line.set_enable_y_fade_out_gradient(*config.fade_out_gradient);
    if (config.solid_gradient)
        line.set_enable_y_solid_gradient(*config.solid_gradient);
    if (config.gradient_start)
        line.set_gradient_y_color_start(*config.gradient_start);
    if (config.gradient_end)
        line.set_gradient_y_color_end(*config.gradient_end);
}

} // namespace

std::optional<ChartConfig> parse_chart_config(const json& j) {
    if (!j.is_object()) {
        spdlog::error("[ChartConfig] Root must be a JSON object");
        return std::nullopt;
    }

    ChartConfig config;

    std::string type_name = json_util::safe_string(j, "type", "line");
    auto type = chart_type_from_name(type_name);
    if (!type) {
        spdlog::error("[ChartConfig] Unknown chart type '{}'", type_name);
        return std::nullopt;
    }
    config.type = *type;

    if (!read_dimension(j, "width", config.width) ||
        !read_dimension(j, "height", config.height)) {
        return std::nullopt;
    }

    config.min_value = json_util::optional_float(j, "min");
    config.max_value = json_util::optional_float(j, "max");
    config.margin = json_util::optional_float(j, "margin");
    config.label_text_size = json_util::optional_float(j, "label_text_size");
    config.animation_progress = json_util::optional_float(j, "animation_progress");

    bool ok = read_color(j, "background", config.background) &&
              read_color(j, "label_color", config.label_color) &&
              read_enum(j, "label_orientation", ORIENTATIONS, config.label_orientation) &&
              read_enum(j, "value_label_orientation", ORIENTATIONS,
                        config.value_label_orientation);

    const json& line = section(j, "line");
    ok = ok && read_enum(line, "mode", LINE_MODES, config.line_mode) &&
         read_alpha(line, "area_alpha", config.line_area_alpha) &&
         read_color(line, "gradient_start", config.gradient_start) &&
         read_color(line, "gradient_end", config.gradient_end);
    config.line_size = json_util::optional_float(line, "size");
    read_bool(line, "fade_out_gradient", config.fade_out_gradient);
    read_bool(line, "solid_gradient", config.solid_gradient);

    const json& point = section(j, "point");
    ok = ok && read_enum(point, "mode", POINT_MODES, config.point_mode) &&
         read_alpha(point, "area_alpha", config.point_area_alpha);
    config.point_size = json_util::optional_float(point, "size");

    ok = ok && read_alpha(section(j, "bar"), "area_alpha", config.bar_area_alpha);

    const json& donut = section(j, "donut");
    ok = ok && read_enum(donut, "label_mode", DONUT_LABEL_MODES, config.donut_label_mode);
    config.hole_radius = json_util::optional_float(donut, "hole_radius");

    const json& radar = section(j, "radar");
    ok = ok && read_color(radar, "border_line_color", config.border_line_color);
    config.border_line_size = json_util::optional_float(radar, "border_line_size");

    ok = ok && parse_entries(j, config.entries);
    if (!ok) {
        return std::nullopt;
    }

    spdlog::debug("[ChartConfig] Parsed {} chart {}x{} with {} entries",
                  chart_type_name(config.type), config.width, config.height,
                  config.entries.size());
    return config;
}

std::optional<ChartConfig> parse_chart_config_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::error("[ChartConfig] JSON parse error: {}", e.what());
        return std::nullopt;
    }
    return parse_chart_config(j);
}

std::optional<ChartConfig> load_chart_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("[ChartConfig] Cannot open {}", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    spdlog::info("[ChartConfig] Loading chart description from {}", path);
    return parse_chart_config_string(buffer.str());
}

void apply_chart_config(const ChartConfig& config, Chart& chart) {
    chart.set_entries(config.entries);

    if (config.min_value)
        chart.set_min_value(*config.min_value);
    if (config.max_value)
        chart.set_max_value(*config.max_value);
    if (config.margin)
        chart.set_margin(*config.margin);
    if (config.label_text_size)
        chart.set_label_text_size(*config.label_text_size);
    if (config.animation_progress)
        chart.set_animation_progress(*config.animation_progress);
    if (config.background)
        chart.set_background_color(*config.background);
    if (config.label_color)
        chart.set_label_color(*config.label_color);
    if (config.label_orientation)
        chart.set_label_orientation(*config.label_orientation);
    if (config.value_label_orientation)
        chart.set_value_label_orientation(*config.value_label_orientation);

    switch (chart.type()) {
    case ChartType::POINT:
        apply_point_options(config, static_cast<PointChart&>(chart));
        break;
    case ChartType::LINE:
        apply_point_options(config, static_cast<PointChart&>(chart));
        apply_line_options(config, static_cast<LineChart&>(chart));
        break;
    case ChartType::BAR: {
        auto& bar = static_cast<BarChart&>(chart);
        apply_point_options(config, bar);
        if (config.bar_area_alpha)
            bar.set_bar_area_alpha(*config.bar_area_alpha);
        break;
    }
    case ChartType::DONUT:
    case ChartType::PIE: {
        auto& donut = static_cast<DonutChart&>(chart);
        if (config.hole_radius)
            donut.set_hole_radius(*config.hole_radius);
        if (config.donut_label_mode)
            donut.set_label_mode(*config.donut_label_mode);
        break;
    }
    case ChartType::RADAR: {
        auto& radar = static_cast<RadarChart&>(chart);
        if (config.line_size)
            radar.set_line_size(*config.line_size);
        if (config.line_area_alpha)
            radar.set_line_area_alpha(*config.line_area_alpha);
        if (config.point_mode)
            radar.set_point_mode(*config.point_mode);
        if (config.point_size)
            radar.set_point_size(*config.point_size);
        if (config.border_line_size)
            radar.set_border_line_size(*config.border_line_size);
        if (config.border_line_color)
            radar.set_border_line_color(*config.border_line_color);
        break;
    }
    case ChartType::RADIAL_GAUGE: {
        auto& gauge = static_cast<RadialGaugeChart&>(chart);
        if (config.line_size)
            gauge.set_line_size(*config.line_size);
        if (config.line_area_alpha)
            gauge.set_line_area_alpha(*config.line_area_alpha);
        break;
    }
    }
}

std::unique_ptr<Chart> create_chart_from_config(const ChartConfig& config) {
    auto chart = create_chart(config.type);
    if (chart) {
        apply_chart_config(config, *chart);
    }
    return chart;
}

} // namespace chartkit
