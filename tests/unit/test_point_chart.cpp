// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_point_chart.cpp
 * @brief Unit tests for the Chart base contract and PointChart layout/drawing
 */

#include "point_chart.h"

#include "../recording_canvas.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace chartkit;
using chartkit::test::DrawOp;
using chartkit::test::RecordingCanvas;
using Catch::Approx;

namespace {

std::vector<ChartEntry> jan_feb_entries() {
    return {ChartEntry(1000.0f, "Jan", "", Color::from_rgb(0x266489)),
            ChartEntry(17000.0f, "Feb", "", Color::from_rgb(0x68B9C0))};
}

void require_same_calls(const RecordingCanvas& a, const RecordingCanvas& b) {
    REQUIRE(a.calls().size() == b.calls().size());
    for (size_t i = 0; i < a.calls().size(); i++) {
        const auto& x = a.calls()[i];
        const auto& y = b.calls()[i];
        CHECK(x.op == y.op);
        CHECK(x.color == y.color);
        CHECK(x.rect.x == y.rect.x);
        CHECK(x.rect.y == y.rect.y);
        CHECK(x.rect.width == y.rect.width);
        CHECK(x.rect.height == y.rect.height);
        CHECK(x.center == y.center);
        CHECK(x.radius == y.radius);
        CHECK(x.text == y.text);
        REQUIRE(x.path.commands().size() == y.path.commands().size());
        for (size_t k = 0; k < x.path.commands().size(); k++) {
            CHECK(x.path.commands()[k].verb == y.path.commands()[k].verb);
            CHECK(x.path.commands()[k].pts[0] == y.path.commands()[k].pts[0]);
        }
    }
}

} // namespace

// ============================================================================
// Bounds
// ============================================================================

TEST_CASE("Chart derives bounds from entries when unset", "[chart][bounds]") {
    PointChart chart;

    SECTION("No entries") {
        CHECK(chart.min_value() == 0.0f);
        CHECK(chart.max_value() == 0.0f);
    }

    SECTION("Positive values include zero as min") {
        chart.set_entries({ChartEntry(5.0f), ChartEntry(12.0f)});
        CHECK(chart.min_value() == 0.0f);
        CHECK(chart.max_value() == 12.0f);
    }

    SECTION("Negative values lower the min") {
        chart.set_entries({ChartEntry(-8.0f), ChartEntry(3.0f)});
        CHECK(chart.min_value() == -8.0f);
        CHECK(chart.max_value() == 3.0f);
    }

    SECTION("Explicit bounds win and can be cleared") {
        chart.set_entries({ChartEntry(-8.0f), ChartEntry(3.0f)});
        chart.set_min_value(100.0f);
        chart.set_max_value(200.0f);
        CHECK(chart.min_value() == 100.0f);
        CHECK(chart.max_value() == 200.0f);

        chart.clear_min_value();
        chart.clear_max_value();
        CHECK(chart.min_value() == -8.0f);
        CHECK(chart.max_value() == 3.0f);
    }
}

TEST_CASE("Chart clamps animation progress", "[chart][animation]") {
    PointChart chart;
    CHECK(chart.animation_progress() == 1.0f);

    chart.set_animation_progress(0.25f);
    CHECK(chart.animation_progress() == Approx(0.25f));

    chart.set_animation_progress(3.0f);
    CHECK(chart.animation_progress() == 1.0f);

    chart.set_animation_progress(-1.0f);
    CHECK(chart.animation_progress() == 0.0f);

    chart.set_animation_progress(std::numeric_limits<float>::quiet_NaN());
    CHECK(chart.animation_progress() == 0.0f);
}

// ============================================================================
// Layout scenarios
// ============================================================================

TEST_CASE("PointChart Jan/Feb scenario", "[point_chart][layout]") {
    PointChart chart;
    chart.set_entries(jan_feb_entries());
    chart.set_min_value(1000.0f);
    chart.set_max_value(17000.0f);

    RecordingCanvas canvas;
    auto lay = chart.compute_layout(canvas, 200, 100);

    CHECK(lay.header_height == 0.0f);
    CHECK(lay.footer_height == Approx(56.0f));
    CHECK(lay.item_size.width == Approx(70.0f));
    CHECK(lay.item_size.height == Approx(24.0f));

    REQUIRE(lay.points.size() == 2);
    // Jan sits on the origin (value == min), Feb at the top of the plot area
    CHECK(lay.points[0].y == Approx(lay.origin));
    CHECK(lay.points[1].y == Approx(lay.header_height));
    // Two evenly split slots
    CHECK(lay.points[0].x == Approx(55.0f));
    CHECK(lay.points[1].x == Approx(145.0f));
}

TEST_CASE("PointChart min == max collapses points without NaN", "[point_chart][layout]") {
    PointChart chart;
    chart.set_entries({ChartEntry(10.0f, "a", "10", colors::BLACK),
                       ChartEntry(5000.0f, "b", "5000", colors::BLACK),
                       ChartEntry(90000.0f, "c", "90000", colors::BLACK)});
    chart.set_min_value(5000.0f);
    chart.set_max_value(5000.0f);

    RecordingCanvas canvas;
    auto lay = chart.compute_layout(canvas, 300, 200);

    REQUIRE(lay.points.size() == 3);
    for (const auto& p : lay.points) {
        CHECK(std::isfinite(p.x));
        CHECK(std::isfinite(p.y));
        CHECK(p.y == Approx(lay.points[0].y));
    }
    CHECK(lay.points[0].y == Approx(lay.origin));

    chart.draw(canvas, 300, 200);
    CHECK(canvas.all_finite());
}

TEST_CASE("PointChart origin does not depend on animation progress", "[point_chart][animation]") {
    PointChart chart;
    chart.set_entries({ChartEntry(-20.0f), ChartEntry(40.0f), ChartEntry(10.0f)});

    RecordingCanvas canvas;
    chart.set_animation_progress(1.0f);
    float full = chart.compute_layout(canvas, 240, 160).origin;

    for (float progress : {0.0f, 0.3f, 0.75f}) {
        chart.set_animation_progress(progress);
        CHECK(chart.compute_layout(canvas, 240, 160).origin == Approx(full));
    }
}

TEST_CASE("PointChart non-finite values are plotted as zero", "[point_chart][layout]") {
    PointChart chart;
    chart.set_entries({ChartEntry(std::numeric_limits<float>::quiet_NaN()), ChartEntry(10.0f),
                       ChartEntry(std::numeric_limits<float>::infinity())});

    RecordingCanvas canvas;
    auto lay = chart.compute_layout(canvas, 200, 100);
    REQUIRE(lay.points.size() == 3);
    CHECK(lay.points[0].y == Approx(lay.origin));
    CHECK(lay.points[2].y == Approx(lay.origin));

    chart.draw(canvas, 200, 100);
    CHECK(canvas.all_finite());
}

// ============================================================================
// Drawing
// ============================================================================

TEST_CASE("PointChart draw clears to background first", "[point_chart][draw]") {
    PointChart chart;
    chart.set_background_color(colors::BLACK);
    chart.set_entries(jan_feb_entries());

    RecordingCanvas canvas;
    chart.draw(canvas, 200, 100);

    REQUIRE_FALSE(canvas.calls().empty());
    CHECK(canvas.calls().front().op == DrawOp::CLEAR);
    CHECK(canvas.calls().front().color == colors::BLACK);
}

TEST_CASE("PointChart with no entries or empty region only clears", "[point_chart][draw]") {
    PointChart chart;
    RecordingCanvas canvas;

    chart.draw(canvas, 200, 100);
    CHECK(canvas.calls().size() == 1);

    canvas.reset();
    chart.set_entries(jan_feb_entries());
    chart.draw(canvas, 0, 100);
    CHECK(canvas.calls().size() == 1);
    CHECK(canvas.measure_count() == 0);
}

TEST_CASE("PointChart draws one marker and area per entry", "[point_chart][draw]") {
    PointChart chart;
    chart.set_entries(jan_feb_entries());

    RecordingCanvas canvas;
    chart.draw(canvas, 200, 100);

    CHECK(canvas.count(DrawOp::CIRCLE) == 2);
    // Point areas are rects with a vertical gradient
    auto rects = canvas.of(DrawOp::RECT);
    REQUIRE(rects.size() == 2);
    CHECK(rects[0].paint.shader.kind() == Shader::Kind::LINEAR_GRADIENT);
    CHECK(rects[0].paint.shader.is_vertical());
    CHECK(rects[0].rect.height >= 2.0f);

    auto circles = canvas.of(DrawOp::CIRCLE);
    CHECK(circles[0].radius == Approx(chart.point_size() / 2.0f));
    CHECK(circles[0].color == Color::from_rgb(0x266489));

    // Footer labels, no header
    auto texts = canvas.of(DrawOp::TEXT);
    REQUIRE(texts.size() == 2);
    CHECK(texts[0].text == "Jan");
    CHECK(texts[1].text == "Feb");
    CHECK(texts[0].rect.y == Approx(100.0f - 56.0f + 20.0f));
}

TEST_CASE("PointChart marker size scales with progress", "[point_chart][animation]") {
    PointChart chart;
    chart.set_entries(jan_feb_entries());
    chart.set_point_area_alpha(0);
    RecordingCanvas canvas;

    chart.set_animation_progress(0.5f);
    chart.draw(canvas, 200, 100);
    auto circles = canvas.of(DrawOp::CIRCLE);
    REQUIRE(circles.size() == 2);
    CHECK(circles[0].radius == Approx(chart.point_size() / 4.0f));

    canvas.reset();
    chart.set_animation_progress(0.0f);
    chart.draw(canvas, 200, 100);
    CHECK(canvas.count(DrawOp::CIRCLE) == 0);
    CHECK(canvas.count(DrawOp::RECT) == 0);
}

TEST_CASE("PointChart point modes", "[point_chart][draw]") {
    PointChart chart;
    chart.set_entries(jan_feb_entries());
    chart.set_point_area_alpha(0);
    RecordingCanvas canvas;

    SECTION("Square") {
        chart.set_point_mode(PointMode::SQUARE);
        chart.draw(canvas, 200, 100);
        CHECK(canvas.count(DrawOp::CIRCLE) == 0);
        auto rects = canvas.of(DrawOp::RECT);
        REQUIRE(rects.size() == 2);
        CHECK(rects[0].rect.width == Approx(chart.point_size()));
    }

    SECTION("None") {
        chart.set_point_mode(PointMode::NONE);
        chart.draw(canvas, 200, 100);
        CHECK(canvas.count(DrawOp::CIRCLE) == 0);
        CHECK(canvas.count(DrawOp::RECT) == 0);
    }
}

TEST_CASE("PointChart header labels sit above the plot area", "[point_chart][labels]") {
    PointChart chart;
    chart.set_entries({ChartEntry(3.0f, "", "3", colors::BLACK),
                       ChartEntry(9.0f, "", "9", colors::BLACK)});

    RecordingCanvas canvas;
    auto lay = chart.compute_layout(canvas, 200, 150);
    CHECK(lay.footer_height == 0.0f);
    CHECK(lay.header_height == Approx(56.0f));

    chart.draw(canvas, 200, 150);
    auto texts = canvas.of(DrawOp::TEXT);
    REQUIRE(texts.size() == 2);
    CHECK(texts[0].rect.bottom() == Approx(lay.header_height - chart.margin()));
    CHECK(texts[1].rect.center().x == Approx(lay.points[1].x));
}

TEST_CASE("PointChart vertical labels", "[point_chart][labels]") {
    PointChart chart;
    chart.set_label_orientation(LabelOrientation::VERTICAL);
    chart.set_entries({ChartEntry(3.0f, "March", "", colors::BLACK),
                       ChartEntry(9.0f, "Apr", "", colors::BLACK)});

    RecordingCanvas canvas;
    auto lay = chart.compute_layout(canvas, 200, 200);
    // Widest label: 5 chars * 16 * 0.5
    CHECK(lay.footer_height == Approx(20.0f + 40.0f + 20.0f));

    chart.draw(canvas, 200, 200);
    auto texts = canvas.of(DrawOp::TEXT);
    REQUIRE(texts.size() == 2);
    CHECK(texts[0].text_style.vertical);
    CHECK(texts[0].rect.width == Approx(16.0f));
    CHECK(texts[0].rect.height == Approx(40.0f));
}

TEST_CASE("PointChart draw is idempotent", "[point_chart][draw]") {
    PointChart chart;
    chart.set_entries(jan_feb_entries());

    RecordingCanvas first;
    RecordingCanvas second;
    chart.draw(first, 320, 240);
    chart.draw(second, 320, 240);

    require_same_calls(first, second);
}
