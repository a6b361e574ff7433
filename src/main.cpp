// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_config.h"
#include "chart_factory.h"
#include "cli_args.h"
#include "demo_data.h"
#include "logging_init.h"
#include "screenshot.h"
#include "ui_chart_view.h"
#include "ui_panel_chart_demo.h"

#include "lvgl/lvgl.h"

#include <SDL.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <memory>
#include <random>
#include <vector>

using namespace chartkit;

namespace {

constexpr int DEFAULT_WIDTH = 800;
constexpr int DEFAULT_HEIGHT = 480;
constexpr int HEADLESS_BUFFER_ROWS = 10;

// Headless displays render nowhere; the chart is drawn into its own canvas
void headless_flush_cb(lv_display_t* disp, const lv_area_t*, uint8_t*) {
    lv_display_flush_ready(disp);
}

// Chart described by the JSON file, with CLI overrides applied
std::unique_ptr<Chart> load_configured_chart(const CliArgs& args, int& width, int& height) {
    auto config = load_chart_config(args.config_path);
    if (!config) {
        return nullptr;
    }
    if (args.type) {
        config->type = *args.type;
    }
    if (!args.width) {
        width = config->width;
        height = config->height;
    }
    return create_chart_from_config(*config);
}

int run_headless(Chart& chart, int width, int height, const std::string& output_path) {
    lv_display_t* display = lv_display_create(width, height);
    if (!display) {
        spdlog::error("Failed to create headless display {}x{}", width, height);
        return 1;
    }
    std::vector<lv_color32_t> buf(static_cast<size_t>(width) * HEADLESS_BUFFER_ROWS);
    lv_display_set_color_format(display, LV_COLOR_FORMAT_ARGB8888);
    lv_display_set_buffers(display, buf.data(), nullptr,
                           static_cast<uint32_t>(buf.size() * sizeof(lv_color32_t)),
                           LV_DISPLAY_RENDER_MODE_PARTIAL);
    lv_display_set_flush_cb(display, headless_flush_cb);

    bool ok = render_chart_to_bmp(chart, width, height, output_path);
    lv_display_delete(display);
    return ok ? 0 : 1;
}

int run_window(std::unique_ptr<Chart> configured, ChartType demo_type, int width, int height) {
    lv_display_t* display = lv_sdl_window_create(width, height);
    if (!display) {
        spdlog::error("Failed to create SDL window {}x{}", width, height);
        return 1;
    }
    lv_sdl_mouse_create();

    lv_obj_t* screen = lv_screen_active();
    if (configured) {
        // A described chart fills the window on its own
        lv_obj_t* view = ui_chart_view_create(screen);
        if (!view) {
            return 1;
        }
        lv_obj_set_size(view, LV_PCT(100), LV_PCT(100));
        ui_chart_view_set_chart(view, std::move(configured));
        ui_chart_view_animate(view, ChartDemoPanel::ANIMATION_DURATION_MS);
    } else if (!ChartDemoPanel::create(screen, demo_type)) {
        return 1;
    }

    spdlog::info("Window open ({}x{}), close it to exit", width, height);
    while (lv_display_get_next(NULL)) {
        lv_timer_handler();
        SDL_Delay(5);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return 1;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }

    {
        logging::LogConfig log_config;
        log_config.level = logging::level_from_verbosity(args.verbosity);
        log_config.file_path = args.log_file;
        logging::init(log_config);
    }

    int width = args.width.value_or(DEFAULT_WIDTH);
    int height = args.height.value_or(DEFAULT_HEIGHT);

    std::unique_ptr<Chart> configured;
    if (!args.config_path.empty()) {
        configured = load_configured_chart(args, width, height);
        if (!configured) {
            printf("Failed to load chart description: %s\n", args.config_path.c_str());
            logging::report_fatal("could not load " + args.config_path);
            spdlog::shutdown();
            return 1;
        }
    }

    ChartType demo_type = args.type.value_or(ChartType::BAR);
    spdlog::debug("Target: {}x{}", width, height);

    lv_init();

    int rc;
    if (args.headless()) {
        std::unique_ptr<Chart> chart = std::move(configured);
        if (!chart) {
            chart = create_chart(demo_type);
            demo::apply_demo_data(*chart, std::random_device{}());
        }
        rc = run_headless(*chart, width, height, args.output_path);
    } else {
        rc = run_window(std::move(configured), demo_type, width, height);
    }

    if (rc != 0) {
        logging::report_fatal(args.headless() ? "headless render failed" : "window setup failed");
    }

    lv_deinit();
    spdlog::shutdown();
    return rc;
}
