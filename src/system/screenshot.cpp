// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenshot.h"

#include "lvgl_chart_canvas.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <memory>

#include "lvgl/lvgl.h"

namespace chartkit {

bool write_bmp(const char* filename, const uint8_t* data, int width, int height, uint32_t stride) {
    // RAII for file handle - automatically closes on all return paths
    std::unique_ptr<FILE, decltype(&fclose)> f(fopen(filename, "wb"), fclose);
    if (!f)
        return false;

    uint32_t row_bytes = static_cast<uint32_t>(width) * 4U;
    uint32_t image_size = row_bytes * static_cast<uint32_t>(height);

    // BMP header (54 bytes total)
    uint32_t file_size = 54U + image_size;
    uint32_t pixel_offset = 54;
    uint32_t dib_size = 40;
    uint16_t planes = 1;
    uint16_t bpp = 32;
    uint32_t reserved = 0;
    uint32_t compression = 0;
    uint32_t ppm = 2835; // pixels per meter
    uint32_t colors = 0;

    // BMP file header (14 bytes)
    fputc('B', f.get());
    fputc('M', f.get());
    fwrite(&file_size, 4, 1, f.get());
    fwrite(&reserved, 4, 1, f.get());
    fwrite(&pixel_offset, 4, 1, f.get());

    // DIB header (40 bytes)
    fwrite(&dib_size, 4, 1, f.get());
    fwrite(&width, 4, 1, f.get());
    fwrite(&height, 4, 1, f.get());
    fwrite(&planes, 2, 1, f.get());
    fwrite(&bpp, 2, 1, f.get());
    fwrite(&compression, 4, 1, f.get());
    fwrite(&image_size, 4, 1, f.get());
    fwrite(&ppm, 4, 1, f.get());
    fwrite(&ppm, 4, 1, f.get());
    fwrite(&colors, 4, 1, f.get());
    fwrite(&colors, 4, 1, f.get());

    // BMP is bottom-up, so flip rows
    for (int y = height - 1; y >= 0; y--) {
        if (fwrite(data + static_cast<size_t>(y) * stride, 1, row_bytes, f.get()) != row_bytes) {
            return false;
        }
    }
    return true;
}

bool render_chart_to_bmp(Chart& chart, int width, int height, const std::string& path) {
    if (width <= 0 || height <= 0) {
        spdlog::error("[Screenshot] Invalid render size {}x{}", width, height);
        return false;
    }

    lv_draw_buf_t* draw_buf = lv_draw_buf_create(static_cast<uint32_t>(width),
                                                 static_cast<uint32_t>(height),
                                                 LV_COLOR_FORMAT_ARGB8888, 0);
    if (!draw_buf) {
        spdlog::error("[Screenshot] Failed to allocate {}x{} buffer", width, height);
        return false;
    }

    lv_obj_t* canvas = lv_canvas_create(lv_screen_active());
    lv_canvas_set_draw_buf(canvas, draw_buf);
    lv_canvas_fill_bg(canvas, lv_color_white(), LV_OPA_COVER);

    lv_layer_t layer;
    lv_canvas_init_layer(canvas, &layer);
    lv_area_t region = {0, 0, width - 1, height - 1};
    {
        LvglChartCanvas chart_canvas(&layer, region);
        chart.draw(chart_canvas, width, height);
    }
    lv_canvas_finish_layer(canvas, &layer);

    bool ok = write_bmp(path.c_str(), draw_buf->data, width, height, draw_buf->header.stride);
    if (ok) {
        spdlog::info("[Screenshot] Rendered {} chart ({}x{}) to {}", chart_type_name(chart.type()),
                     width, height, path);
    } else {
        spdlog::error("[Screenshot] Failed to write {}", path);
    }

    lv_obj_delete(canvas);
    lv_draw_buf_destroy(draw_buf);
    return ok;
}

} // namespace chartkit
