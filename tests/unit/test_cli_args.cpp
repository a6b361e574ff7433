// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for chartkit-demo command-line parsing
 */

#include "cli_args.h"

#include <catch2/catch_test_macros.hpp>

using namespace chartkit;

namespace {

template <size_t N> bool parse(const char* const (&argv)[N], CliArgs& args) {
    return parse_cli_args(static_cast<int>(N), argv, args);
}

} // namespace

TEST_CASE("CliArgs: defaults", "[cli_args]") {
    const char* const argv[] = {"chartkit-demo"};
    CliArgs args;
    REQUIRE(parse(argv, args));

    CHECK(args.config_path.empty());
    CHECK_FALSE(args.type.has_value());
    CHECK_FALSE(args.headless());
    CHECK_FALSE(args.width.has_value());
    CHECK(args.verbosity == 0);
    CHECK_FALSE(args.show_help);
}

TEST_CASE("CliArgs: headless render options", "[cli_args]") {
    const char* const argv[] = {"chartkit-demo", "-c", "sales.json", "-t", "radar",
                                "-o", "out.bmp", "-s", "640x200"};
    CliArgs args;
    REQUIRE(parse(argv, args));

    CHECK(args.config_path == "sales.json");
    REQUIRE(args.type.has_value());
    CHECK(*args.type == ChartType::RADAR);
    CHECK(args.headless());
    CHECK(args.output_path == "out.bmp");
    CHECK(*args.width == 640);
    CHECK(*args.height == 200);
}

TEST_CASE("CliArgs: long option names", "[cli_args]") {
    const char* const argv[] = {"chartkit-demo", "--type", "radial-gauge", "--size", "large",
                                "--log-file", "/tmp/chartkit.log"};
    CliArgs args;
    REQUIRE(parse(argv, args));

    CHECK(*args.type == ChartType::RADIAL_GAUGE);
    CHECK(*args.width == 1024);
    CHECK(*args.height == 600);
    CHECK(args.log_file == "/tmp/chartkit.log");
}

TEST_CASE("CliArgs: verbosity counting", "[cli_args]") {
    SECTION("-vv") {
        const char* const argv[] = {"chartkit-demo", "-vv"};
        CliArgs args;
        REQUIRE(parse(argv, args));
        CHECK(args.verbosity == 2);
    }

    SECTION("repeated flags accumulate") {
        const char* const argv[] = {"chartkit-demo", "-v", "--verbose", "-vvv"};
        CliArgs args;
        REQUIRE(parse(argv, args));
        CHECK(args.verbosity == 5);
    }
}

TEST_CASE("CliArgs: help stops parsing", "[cli_args]") {
    const char* const argv[] = {"chartkit-demo", "-h", "--bogus"};
    CliArgs args;
    REQUIRE(parse(argv, args));
    CHECK(args.show_help);
}

TEST_CASE("CliArgs: errors", "[cli_args]") {
    CliArgs args;

    SECTION("unknown argument") {
        const char* const argv[] = {"chartkit-demo", "--bogus"};
        CHECK_FALSE(parse(argv, args));
    }

    SECTION("missing value") {
        const char* const argv[] = {"chartkit-demo", "-o"};
        CHECK_FALSE(parse(argv, args));
    }

    SECTION("unknown chart type") {
        const char* const argv[] = {"chartkit-demo", "-t", "histogram"};
        CHECK_FALSE(parse(argv, args));
    }

    SECTION("bad size") {
        const char* const argv[] = {"chartkit-demo", "-s", "640by200"};
        CHECK_FALSE(parse(argv, args));
    }
}

TEST_CASE("parse_screen_size", "[cli_args]") {
    int w = 0, h = 0;

    CHECK(parse_screen_size("small", w, h));
    CHECK(w == 480);
    CHECK(h == 320);

    CHECK(parse_screen_size("800x480", w, h));
    CHECK(w == 800);
    CHECK(h == 480);

    CHECK_FALSE(parse_screen_size("0x480", w, h));
    CHECK_FALSE(parse_screen_size("800x", w, h));
    CHECK_FALSE(parse_screen_size("800x480px", w, h));
    CHECK_FALSE(parse_screen_size("", w, h));
    // Failed parses leave the output untouched
    CHECK(w == 800);
    CHECK(h == 480);
}
