// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_factory.h"

#include "bar_chart.h"
#include "donut_chart.h"
#include "line_chart.h"
#include "point_chart.h"
#include "radar_chart.h"
#include "radial_gauge_chart.h"

namespace chartkit {

std::unique_ptr<Chart> create_chart(ChartType type) {
    switch (type) {
    case ChartType::BAR:
        return std::make_unique<BarChart>();
    case ChartType::POINT:
        return std::make_unique<PointChart>();
    case ChartType::LINE:
        return std::make_unique<LineChart>();
    case ChartType::DONUT:
        return std::make_unique<DonutChart>();
    case ChartType::PIE:
        return std::make_unique<PieChart>();
    case ChartType::RADAR:
        return std::make_unique<RadarChart>();
    case ChartType::RADIAL_GAUGE:
        return std::make_unique<RadialGaugeChart>();
    }
    return nullptr;
}

} // namespace chartkit
