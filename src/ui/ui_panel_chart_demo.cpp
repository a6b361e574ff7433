// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_panel_chart_demo.h"

#include "chart_factory.h"
#include "demo_data.h"
#include "ui_chart_view.h"

#include <spdlog/spdlog.h>

#include <iterator>
#include <memory>

namespace chartkit {

namespace {

// Typefaces offered by "Change font"; nullptr is the display default
const lv_font_t* const DEMO_FONTS[] = {
    nullptr,
#if LV_FONT_MONTSERRAT_12
    &lv_font_montserrat_12,
#endif
#if LV_FONT_MONTSERRAT_16
    &lv_font_montserrat_16,
#endif
#if LV_FONT_MONTSERRAT_20
    &lv_font_montserrat_20,
#endif
};

constexpr int32_t BUTTON_ROW_HEIGHT = 48;
constexpr int32_t PANEL_PADDING = 8;

} // namespace

ChartDemoPanel::ChartDemoPanel(ChartType initial_type)
    : type_(initial_type), rng_(std::random_device{}()) {}

ChartDemoPanel* ChartDemoPanel::create(lv_obj_t* parent, ChartType initial_type) {
    std::unique_ptr<ChartDemoPanel> panel(new ChartDemoPanel(initial_type));

    lv_obj_t* root = lv_obj_create(parent);
    if (!root) {
        spdlog::error("[ChartDemo] Failed to create panel");
        return nullptr;
    }
    lv_obj_set_size(root, LV_PCT(100), LV_PCT(100));
    lv_obj_set_style_pad_all(root, PANEL_PADDING, 0);
    lv_obj_set_style_pad_row(root, PANEL_PADDING, 0);
    lv_obj_set_style_border_width(root, 0, 0);
    lv_obj_set_style_radius(root, 0, 0);
    lv_obj_set_flex_flow(root, LV_FLEX_FLOW_COLUMN);
    lv_obj_remove_flag(root, LV_OBJ_FLAG_SCROLLABLE);

    lv_obj_t* view = ui_chart_view_create(root);
    if (!view) {
        lv_obj_delete(root);
        return nullptr;
    }
    lv_obj_set_width(view, LV_PCT(100));
    lv_obj_set_flex_grow(view, 1);

    lv_obj_t* row = lv_obj_create(root);
    lv_obj_set_size(row, LV_PCT(100), BUTTON_ROW_HEIGHT);
    lv_obj_set_style_pad_all(row, 0, 0);
    lv_obj_set_style_border_width(row, 0, 0);
    lv_obj_set_style_bg_opa(row, LV_OPA_TRANSP, 0);
    lv_obj_set_flex_flow(row, LV_FLEX_FLOW_ROW);
    lv_obj_set_flex_align(row, LV_FLEX_ALIGN_SPACE_EVENLY, LV_FLEX_ALIGN_CENTER,
                          LV_FLEX_ALIGN_CENTER);
    lv_obj_remove_flag(row, LV_OBJ_FLAG_SCROLLABLE);

    ChartDemoPanel* self = panel.release();
    self->root_ = root;
    self->chart_view_ = view;

    self->add_button(row, "Change chart", on_change_chart);
    self->add_button(row, "Generate data", on_generate_data);
    self->add_button(row, "Change font", on_change_font);
    lv_obj_add_event_cb(root, on_delete, LV_EVENT_DELETE, self);

    self->show_chart(initial_type);
    spdlog::debug("[ChartDemo] Panel created");
    return self;
}

lv_obj_t* ChartDemoPanel::add_button(lv_obj_t* row, const char* text, lv_event_cb_t cb) {
    lv_obj_t* btn = lv_button_create(row);
    lv_obj_t* label = lv_label_create(btn);
    lv_label_set_text(label, text);
    lv_obj_center(label);
    lv_obj_add_event_cb(btn, cb, LV_EVENT_CLICKED, this);
    return btn;
}

void ChartDemoPanel::show_chart(ChartType type) {
    type_ = type;
    auto chart = create_chart(type);
    chart->set_typeface(font_);
    demo::apply_demo_data(*chart, rng_());
    ui_chart_view_set_chart(chart_view_, std::move(chart));
    ui_chart_view_animate(chart_view_, ANIMATION_DURATION_MS);
    spdlog::info("[ChartDemo] Showing {} chart", chart_type_name(type));
}

void ChartDemoPanel::change_chart() {
    show_chart(demo::next_chart_type(type_));
}

void ChartDemoPanel::generate_data() {
    Chart* chart = ui_chart_view_get_chart(chart_view_);
    if (!chart) {
        return;
    }
    demo::apply_demo_data(*chart, rng_());
    ui_chart_view_animate(chart_view_, ANIMATION_DURATION_MS);
}

void ChartDemoPanel::change_font() {
    std::uniform_int_distribution<size_t> pick(0, std::size(DEMO_FONTS) - 1);
    font_ = DEMO_FONTS[pick(rng_)];
    spdlog::debug("[ChartDemo] Font changed to line height {}",
                  lv_font_get_line_height(font_ ? font_ : lv_font_get_default()));
    change_chart();
}

void ChartDemoPanel::on_change_chart(lv_event_t* e) {
    static_cast<ChartDemoPanel*>(lv_event_get_user_data(e))->change_chart();
}

void ChartDemoPanel::on_generate_data(lv_event_t* e) {
    static_cast<ChartDemoPanel*>(lv_event_get_user_data(e))->generate_data();
}

void ChartDemoPanel::on_change_font(lv_event_t* e) {
    static_cast<ChartDemoPanel*>(lv_event_get_user_data(e))->change_font();
}

void ChartDemoPanel::on_delete(lv_event_t* e) {
    std::unique_ptr<ChartDemoPanel> self(static_cast<ChartDemoPanel*>(lv_event_get_user_data(e)));
    self->root_ = nullptr;
    self->chart_view_ = nullptr;
}

} // namespace chartkit
