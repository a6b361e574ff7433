// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_chart_view.h"

#include "lvgl_chart_canvas.h"

#include <spdlog/spdlog.h>

namespace {

// Animation values are progress in thousandths
constexpr int32_t PROGRESS_SCALE = 1000;

// Widget state (stored in LVGL object user_data)
struct ChartViewState {
    std::unique_ptr<chartkit::Chart> chart;
};

ChartViewState* get_state(lv_obj_t* obj) {
    return obj ? static_cast<ChartViewState*>(lv_obj_get_user_data(obj)) : nullptr;
}

void chart_view_draw_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    lv_layer_t* layer = lv_event_get_layer(e);
    ChartViewState* state = get_state(obj);
    if (!layer || !state || !state->chart) {
        return;
    }

    lv_area_t content;
    lv_obj_get_content_coords(obj, &content);
    int32_t width = lv_area_get_width(&content);
    int32_t height = lv_area_get_height(&content);
    if (width <= 0 || height <= 0) {
        return;
    }

    chartkit::LvglChartCanvas canvas(layer, content);
    state->chart->draw(canvas, width, height);
}

void chart_view_anim_cb(void* var, int32_t value) {
    auto* obj = static_cast<lv_obj_t*>(var);
    ChartViewState* state = get_state(obj);
    if (!state || !state->chart) {
        return;
    }
    state->chart->set_animation_progress(static_cast<float>(value) / PROGRESS_SCALE);
    lv_obj_invalidate(obj);
}

// Cleanup callback: free allocated state
void chart_view_delete_cb(lv_event_t* e) {
    lv_obj_t* obj = lv_event_get_target_obj(e);
    lv_anim_delete(obj, chart_view_anim_cb);
    std::unique_ptr<ChartViewState> state(get_state(obj));
    lv_obj_set_user_data(obj, nullptr);
    spdlog::trace("[ChartView] Widget deleted");
}

} // namespace

lv_obj_t* ui_chart_view_create(lv_obj_t* parent) {
    lv_obj_t* obj = lv_obj_create(parent);
    if (!obj) {
        spdlog::error("[ChartView] Failed to create widget");
        return nullptr;
    }

    auto state = std::make_unique<ChartViewState>();
    lv_obj_set_user_data(obj, state.release());

    lv_obj_set_style_bg_opa(obj, LV_OPA_TRANSP, 0);
    lv_obj_set_style_border_width(obj, 0, 0);
    lv_obj_set_style_pad_all(obj, 0, 0);
    lv_obj_set_style_radius(obj, 0, 0);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);

    lv_obj_add_event_cb(obj, chart_view_draw_cb, LV_EVENT_DRAW_MAIN, nullptr);
    lv_obj_add_event_cb(obj, chart_view_delete_cb, LV_EVENT_DELETE, nullptr);

    spdlog::debug("[ChartView] Widget created");
    return obj;
}

void ui_chart_view_set_chart(lv_obj_t* view, std::unique_ptr<chartkit::Chart> chart) {
    ChartViewState* state = get_state(view);
    if (!state) {
        spdlog::warn("[ChartView] set_chart on an object that is not a chart view");
        return;
    }

    lv_anim_delete(view, chart_view_anim_cb);
    if (chart) {
        spdlog::debug("[ChartView] Attached {} chart with {} entries",
                      chartkit::chart_type_name(chart->type()), chart->entries().size());
    }
    state->chart = std::move(chart);
    lv_obj_invalidate(view);
}

chartkit::Chart* ui_chart_view_get_chart(lv_obj_t* view) {
    ChartViewState* state = get_state(view);
    return state ? state->chart.get() : nullptr;
}

void ui_chart_view_animate(lv_obj_t* view, uint32_t duration_ms) {
    ChartViewState* state = get_state(view);
    if (!state || !state->chart) {
        return;
    }

    lv_anim_delete(view, chart_view_anim_cb);
    if (duration_ms == 0) {
        chart_view_anim_cb(view, PROGRESS_SCALE);
        return;
    }

    state->chart->set_animation_progress(0.0f);

    lv_anim_t anim;
    lv_anim_init(&anim);
    lv_anim_set_var(&anim, view);
    lv_anim_set_exec_cb(&anim, chart_view_anim_cb);
    lv_anim_set_values(&anim, 0, PROGRESS_SCALE);
    lv_anim_set_duration(&anim, duration_ms);
    lv_anim_set_path_cb(&anim, lv_anim_path_ease_out);
    lv_anim_start(&anim);

    spdlog::trace("[ChartView] Animating over {}ms", duration_ms);
}
