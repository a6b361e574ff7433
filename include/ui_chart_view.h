// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart.h"

#include "lvgl/lvgl.h"

#include <cstdint>
#include <memory>

/**
 * @file ui_chart_view.h
 * @brief LVGL widget that draws a chartkit::Chart
 *
 * The view owns its chart and draws it into its content area on
 * LV_EVENT_DRAW_MAIN through an LvglChartCanvas. The chart is released when
 * the widget is deleted.
 *
 * Usage:
 * @code
 *   lv_obj_t* view = ui_chart_view_create(parent);
 *   ui_chart_view_set_chart(view, chartkit::create_chart(chartkit::ChartType::BAR));
 *   ui_chart_view_animate(view, 1500);
 * @endcode
 */

/**
 * @brief Create a chart view
 *
 * @param parent Parent LVGL object
 * @return New view, or nullptr on allocation failure
 */
lv_obj_t* ui_chart_view_create(lv_obj_t* parent);

/**
 * @brief Replace the chart drawn by a view
 *
 * Cancels a running progress animation and redraws. Passing nullptr leaves an
 * empty view.
 */
void ui_chart_view_set_chart(lv_obj_t* view, std::unique_ptr<chartkit::Chart> chart);

/**
 * @brief Chart attached to a view
 *
 * Invalidate the view with lv_obj_invalidate() after changing the chart.
 *
 * @return Borrowed chart, nullptr if none or @p view is not a chart view
 */
chartkit::Chart* ui_chart_view_get_chart(lv_obj_t* view);

/**
 * @brief Animate the chart's progress from 0 to 1
 *
 * Restarts the animation if one is already running.
 *
 * @param duration_ms Animation length; 0 jumps straight to progress 1
 */
void ui_chart_view_animate(lv_obj_t* view, uint32_t duration_ms);
