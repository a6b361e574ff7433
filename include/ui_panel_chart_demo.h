// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_types.h"

#include "lvgl/lvgl.h"

#include <cstdint>
#include <random>

namespace chartkit {

/**
 * @brief Demo page: a chart view above "Change chart", "Generate data" and
 * "Change font" buttons
 *
 * Every chart change loads fresh demo data and replays the progress
 * animation. The panel deletes itself together with its root object.
 */
class ChartDemoPanel {
  public:
    static constexpr uint32_t ANIMATION_DURATION_MS = 1500;

    /**
     * @brief Build the page on @p parent
     *
     * @param initial_type First chart shown
     * @return Panel, owned by its root object (nullptr on failure)
     */
    static ChartDemoPanel* create(lv_obj_t* parent, ChartType initial_type);

    lv_obj_t* root() const {
        return root_;
    }
    lv_obj_t* chart_view() const {
        return chart_view_;
    }

    void change_chart();
    void generate_data();
    void change_font();

  private:
    explicit ChartDemoPanel(ChartType initial_type);

    void show_chart(ChartType type);
    lv_obj_t* add_button(lv_obj_t* row, const char* text, lv_event_cb_t cb);

    static void on_change_chart(lv_event_t* e);
    static void on_generate_data(lv_event_t* e);
    static void on_change_font(lv_event_t* e);
    static void on_delete(lv_event_t* e);

    ChartType type_;
    const lv_font_t* font_ = nullptr;
    std::mt19937 rng_;
    lv_obj_t* root_ = nullptr;
    lv_obj_t* chart_view_ = nullptr;
};

} // namespace chartkit
