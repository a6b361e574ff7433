// SPDX-License-Identifier: GPL-3.0-or-later

#include "radial_gauge_chart.h"

#include "../recording_canvas.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace chartkit;
using chartkit::test::DrawOp;
using chartkit::test::RecordingCanvas;
using Catch::Approx;

TEST_CASE("RadialGaugeChart sweep is proportional to value", "[radial_gauge]") {
    RadialGaugeChart chart;
    chart.set_entries({ChartEntry(25.0f), ChartEntry(100.0f)});
    chart.set_min_value(0.0f);
    chart.set_max_value(100.0f);

    CHECK(chart.calculate_sweep(0.0f) == Approx(0.0f));
    CHECK(chart.calculate_sweep(25.0f) == Approx(90.0f));
    CHECK(chart.calculate_sweep(100.0f) == Approx(360.0f));
    // Clamped to the bounds
    CHECK(chart.calculate_sweep(250.0f) == Approx(360.0f));

    chart.set_animation_progress(0.5f);
    CHECK(chart.calculate_sweep(100.0f) == Approx(180.0f));
}

TEST_CASE("RadialGaugeChart zero range sweeps nothing", "[radial_gauge]") {
    RadialGaugeChart chart;
    chart.set_entries({ChartEntry(10.0f)});
    chart.set_min_value(10.0f);
    chart.set_max_value(10.0f);
    CHECK(chart.calculate_sweep(10.0f) == 0.0f);
}

TEST_CASE("RadialGaugeChart sweep stays finite at the float limits", "[radial_gauge]") {
    RadialGaugeChart chart;
    chart.set_entries({ChartEntry(0.0f), ChartEntry(3e38f)});
    chart.set_min_value(-3e38f);
    chart.set_max_value(3e38f);

    CHECK(chart.calculate_sweep(0.0f) == Approx(180.0f));
    CHECK(chart.calculate_sweep(3e38f) == Approx(360.0f));

    RecordingCanvas canvas;
    chart.draw(canvas, 200, 200);
    CHECK(canvas.count(DrawOp::PATH) > 0);
    CHECK(canvas.all_finite());
}

TEST_CASE("RadialGaugeChart draws concentric rings", "[radial_gauge]") {
    RadialGaugeChart chart;
    chart.set_entries({ChartEntry(50.0f, "CPU", "50%", Color::from_rgb(0xFF0000)),
                       ChartEntry(80.0f, "RAM", "80%", Color::from_rgb(0x00FF00))});
    chart.set_min_value(0.0f);
    chart.set_max_value(100.0f);

    RecordingCanvas canvas;
    chart.draw(canvas, 400, 300);

    auto circles = canvas.of(DrawOp::CIRCLE);
    REQUIRE(circles.size() == 2);
    CHECK(circles[0].paint.style == PaintStyle::STROKE);
    CHECK(circles[0].color.a == 52);
    CHECK(circles[1].radius < circles[0].radius);
    CHECK(circles[0].center == circles[1].center);

    auto arcs = canvas.of(DrawOp::PATH);
    REQUIRE(arcs.size() == 2);
    CHECK(arcs[0].paint.style == PaintStyle::STROKE);
    CHECK(arcs[0].color == Color::from_rgb(0xFF0000));
    CHECK(arcs[0].paint.stroke_width == Approx(circles[0].paint.stroke_width));

    // Starts at 12 o'clock
    Point start = arcs[0].path.commands()[0].pts[0];
    CHECK(start.x == Approx(circles[0].center.x).margin(0.01));
    CHECK(start.y == Approx(circles[0].center.y - circles[0].radius).margin(0.01));

    CHECK(canvas.count(DrawOp::TEXT) == 2);
}

TEST_CASE("RadialGaugeChart explicit line size", "[radial_gauge]") {
    RadialGaugeChart chart;
    CHECK(chart.effective_line_size(100.0f) == Approx(50.0f));

    chart.set_entries({ChartEntry(1.0f), ChartEntry(2.0f), ChartEntry(3.0f)});
    CHECK(chart.effective_line_size(100.0f) == Approx(12.5f));

    chart.set_line_size(6.0f);
    CHECK(chart.effective_line_size(100.0f) == Approx(6.0f));
}

TEST_CASE("RadialGaugeChart drops rings that do not fit", "[radial_gauge]") {
    RadialGaugeChart chart;
    chart.set_line_size(30.0f);
    std::vector<ChartEntry> entries;
    for (int i = 0; i < 10; i++) {
        entries.emplace_back(static_cast<float>(i + 1));
    }
    chart.set_entries(entries);

    RecordingCanvas canvas;
    chart.draw(canvas, 200, 200);
    CHECK(canvas.count(DrawOp::CIRCLE) < 10);
    CHECK(canvas.all_finite());
}
