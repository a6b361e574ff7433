// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_chart_layout.cpp
 * @brief Unit tests for the free layout functions shared by the point-based charts
 */

#include "chart_layout.h"

#include "../recording_canvas.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace chartkit;
using Catch::Approx;

// ============================================================================
// ValueBounds
// ============================================================================

TEST_CASE("ValueBounds clamps values into range", "[layout][bounds]") {
    layout::ValueBounds bounds{1000.0f, 17000.0f};

    CHECK(bounds.range() == Approx(16000.0f));
    CHECK(bounds.clamp(500.0f) == Approx(1000.0f));
    CHECK(bounds.clamp(20000.0f) == Approx(17000.0f));
    CHECK(bounds.clamp(5000.0f) == Approx(5000.0f));
}

TEST_CASE("ValueBounds treats non-finite values as zero", "[layout][bounds]") {
    layout::ValueBounds bounds{-10.0f, 10.0f};

    CHECK(bounds.clamp(std::numeric_limits<float>::quiet_NaN()) == 0.0f);
    CHECK(bounds.clamp(std::numeric_limits<float>::infinity()) == 0.0f);

    layout::ValueBounds positive{5.0f, 10.0f};
    CHECK(positive.clamp(std::numeric_limits<float>::quiet_NaN()) == Approx(5.0f));
}

TEST_CASE("ValueBounds range does not overflow near the float limits", "[layout][bounds]") {
    layout::ValueBounds wide{-3e38f, 3e38f};
    CHECK(std::isfinite(wide.range()));
    CHECK(wide.has_range());
    CHECK(wide.fraction(0.0f) == Approx(0.5f));
    CHECK(wide.fraction(3e38f) == Approx(1.0f));

    layout::ValueBounds flat{5.0f, 5.0f};
    layout::ValueBounds inverted{10.0f, 5.0f};
    layout::ValueBounds unbounded{0.0f, std::numeric_limits<float>::infinity()};
    CHECK_FALSE(flat.has_range());
    CHECK_FALSE(inverted.has_range());
    CHECK_FALSE(unbounded.has_range());
    CHECK(unbounded.fraction(1.0f) == 0.0f);
}

// ============================================================================
// Label measurement
// ============================================================================

TEST_CASE("trim and has_text", "[layout][labels]") {
    CHECK(layout::trim("  Jan \t") == "Jan");
    CHECK(layout::trim("   ").empty());
    CHECK(layout::has_text(" a "));
    CHECK_FALSE(layout::has_text(""));
    CHECK_FALSE(layout::has_text(" \n\t"));
}

TEST_CASE("measure_labels skips empty and whitespace labels", "[layout][labels]") {
    test::RecordingCanvas canvas;
    TextStyle style;
    style.size = 10.0f;

    auto sizes = layout::measure_labels(canvas, {"Jan", "", "  ", " Feb "}, style);

    REQUIRE(sizes.size() == 4);
    CHECK(sizes[0].width == Approx(15.0f));
    CHECK(sizes[0].height == Approx(10.0f));
    CHECK(sizes[1] == Size());
    CHECK(sizes[2] == Size());
    // Trimmed before measuring
    CHECK(sizes[3].width == Approx(15.0f));
    CHECK(canvas.measure_count() == 2);
}

// ============================================================================
// Footer / header height
// ============================================================================

TEST_CASE("calculate_footer_header_height", "[layout][labels]") {
    std::vector<Size> sizes = {{30.0f, 16.0f}, {50.0f, 16.0f}};

    SECTION("No label text gives zero height") {
        CHECK(layout::calculate_footer_header_height({Size(), Size()},
                                                     LabelOrientation::HORIZONTAL, {"", " "},
                                                     20.0f, 16.0f) == 0.0f);
        CHECK(layout::calculate_footer_header_height({}, LabelOrientation::VERTICAL, {}, 20.0f,
                                                     16.0f) == 0.0f);
    }

    SECTION("Horizontal labels use the text size") {
        CHECK(layout::calculate_footer_header_height(sizes, LabelOrientation::HORIZONTAL,
                                                     {"a", "b"}, 20.0f,
                                                     16.0f) == Approx(56.0f));
    }

    SECTION("Vertical labels use the widest label") {
        CHECK(layout::calculate_footer_header_height(sizes, LabelOrientation::VERTICAL,
                                                     {"a", "b"}, 20.0f,
                                                     16.0f) == Approx(90.0f));
    }
}

// ============================================================================
// Item size
// ============================================================================

TEST_CASE("calculate_item_size splits width into slots", "[layout][item_size]") {
    Size size = layout::calculate_item_size(200, 100, 56.0f, 0.0f, 2, 20.0f);
    CHECK(size.width == Approx(70.0f));
    CHECK(size.height == Approx(24.0f));
}

TEST_CASE("calculate_item_size clamps to non-negative", "[layout][item_size]") {
    Size tiny = layout::calculate_item_size(30, 40, 56.0f, 56.0f, 5, 20.0f);
    CHECK(tiny.width == 0.0f);
    CHECK(tiny.height == 0.0f);

    Size none = layout::calculate_item_size(200, 100, 0.0f, 0.0f, 0, 20.0f);
    CHECK(none.width == 0.0f);
    CHECK(none.height == Approx(80.0f));
}

// ============================================================================
// Origin and value mapping
// ============================================================================

TEST_CASE("calculate_y_origin", "[layout][origin]") {
    SECTION("Zero inside range") {
        CHECK(layout::calculate_y_origin(100.0f, 10.0f, {-50.0f, 50.0f}) == Approx(60.0f));
        CHECK(layout::calculate_y_origin(100.0f, 0.0f, {0.0f, 200.0f}) == Approx(100.0f));
    }

    SECTION("Zero outside range uses bottom of plot area") {
        CHECK(layout::calculate_y_origin(24.0f, 0.0f, {1000.0f, 17000.0f}) == Approx(24.0f));
        CHECK(layout::calculate_y_origin(24.0f, 5.0f, {-30.0f, -10.0f}) == Approx(29.0f));
    }

    SECTION("Zero range") {
        CHECK(layout::calculate_y_origin(80.0f, 12.0f, {5000.0f, 5000.0f}) == Approx(92.0f));
    }
}

TEST_CASE("value_to_y maps max to top and min to bottom", "[layout][origin]") {
    layout::ValueBounds bounds{0.0f, 100.0f};
    CHECK(layout::value_to_y(100.0f, bounds, 80.0f, 10.0f, 90.0f) == Approx(10.0f));
    CHECK(layout::value_to_y(0.0f, bounds, 80.0f, 10.0f, 90.0f) == Approx(90.0f));
    CHECK(layout::value_to_y(25.0f, bounds, 80.0f, 10.0f, 90.0f) == Approx(70.0f));
    // Clamped
    CHECK(layout::value_to_y(500.0f, bounds, 80.0f, 10.0f, 90.0f) == Approx(10.0f));
}

TEST_CASE("calculate_points returns one finite point per entry in order", "[layout][points]") {
    layout::ValueBounds bounds{0.0f, 10.0f};
    Size item(40.0f, 100.0f);

    for (size_t n : {size_t(0), size_t(1), size_t(2), size_t(7)}) {
        std::vector<ChartEntry> entries;
        for (size_t i = 0; i < n; i++) {
            entries.emplace_back(static_cast<float>(i));
        }
        auto points = layout::calculate_points(entries, item, 100.0f, 0.0f, 20.0f, bounds);
        REQUIRE(points.size() == n);
        for (size_t i = 0; i < n; i++) {
            CHECK(std::isfinite(points[i].x));
            CHECK(std::isfinite(points[i].y));
            CHECK(points[i].x == Approx(layout::slot_center_x(i, 40.0f, 20.0f)));
            if (i > 0) {
                CHECK(points[i].x > points[i - 1].x);
            }
        }
    }
}

TEST_CASE("calculate_points Y decreases as value increases", "[layout][points]") {
    layout::ValueBounds bounds{-100.0f, 100.0f};
    std::vector<ChartEntry> entries;
    for (int v = -100; v <= 100; v += 25) {
        entries.emplace_back(static_cast<float>(v));
    }
    auto points = layout::calculate_points(entries, Size(10.0f, 200.0f), 100.0f, 0.0f, 5.0f,
                                           bounds);
    for (size_t i = 1; i < points.size(); i++) {
        CHECK(points[i].y < points[i - 1].y);
    }
}

TEST_CASE("calculate_points with zero range collapses to origin", "[layout][points]") {
    layout::ValueBounds bounds{5000.0f, 5000.0f};
    std::vector<ChartEntry> entries = {ChartEntry(1.0f), ChartEntry(5000.0f),
                                       ChartEntry(90000.0f)};

    float origin = layout::calculate_y_origin(60.0f, 16.0f, bounds);
    auto points = layout::calculate_points(entries, Size(30.0f, 60.0f), origin, 16.0f, 20.0f,
                                           bounds);

    REQUIRE(points.size() == 3);
    for (const auto& p : points) {
        CHECK(std::isfinite(p.y));
        CHECK(p.y == Approx(76.0f));
    }
}

TEST_CASE("calculate_points stays finite with bounds at the float limits", "[layout][points]") {
    layout::ValueBounds bounds{-3e38f, 3e38f};
    std::vector<ChartEntry> entries = {ChartEntry(-3e38f), ChartEntry(0.0f), ChartEntry(3e38f)};

    float origin = layout::calculate_y_origin(100.0f, 10.0f, bounds);
    CHECK(origin == Approx(60.0f));

    auto points = layout::calculate_points(entries, Size(40.0f, 100.0f), origin, 10.0f, 20.0f,
                                           bounds);
    REQUIRE(points.size() == 3);
    for (const auto& p : points) {
        CHECK(std::isfinite(p.y));
    }
    CHECK(points[0].y == Approx(110.0f));
    CHECK(points[1].y == Approx(60.0f));
    CHECK(points[2].y == Approx(10.0f));
}

// ============================================================================
// Spline control points
// ============================================================================

TEST_CASE("calculate_cubic_info uses symmetric horizontal tangents", "[layout][spline]") {
    std::vector<Point> points = {{10.0f, 50.0f}, {60.0f, 20.0f}};
    auto info = layout::calculate_cubic_info(points, 0, Size(40.0f, 100.0f));

    CHECK(info.point == points[0]);
    CHECK(info.next_point == points[1]);
    CHECK(info.control.x == Approx(10.0f + 32.0f));
    CHECK(info.control.y == Approx(50.0f));
    CHECK(info.next_control.x == Approx(60.0f - 32.0f));
    CHECK(info.next_control.y == Approx(20.0f));
}
