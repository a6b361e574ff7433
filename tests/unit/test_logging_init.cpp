// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace chartkit;

TEST_CASE("level_from_verbosity: CLI verbosity flags", "[logging]") {
    SECTION("0 = warn (no verbosity flags)") {
        REQUIRE(logging::level_from_verbosity(0) == spdlog::level::warn);
    }

    SECTION("-v (1) = info") {
        REQUIRE(logging::level_from_verbosity(1) == spdlog::level::info);
    }

    SECTION("-vv (2) = debug") {
        REQUIRE(logging::level_from_verbosity(2) == spdlog::level::debug);
    }

    SECTION("-vvv (3+) = trace") {
        REQUIRE(logging::level_from_verbosity(3) == spdlog::level::trace);
        REQUIRE(logging::level_from_verbosity(10) == spdlog::level::trace);
    }

    SECTION("negative counts fall back to warn") {
        REQUIRE(logging::level_from_verbosity(-1) == spdlog::level::warn);
    }
}

TEST_CASE("logging::init installs the default logger", "[logging]") {
    auto previous = spdlog::default_logger();

    logging::LogConfig config;
    config.level = spdlog::level::debug;
    config.enable_console = false;
    logging::init(config);

    auto logger = spdlog::default_logger();
    CHECK(logger->name() == "chartkit");
    CHECK(logger->level() == spdlog::level::debug);
    CHECK(logger->sinks().empty());

    spdlog::set_default_logger(previous);
}

TEST_CASE("logging::init writes to a log file", "[logging]") {
    auto previous = spdlog::default_logger();
    std::string path = "/tmp/chartkit_test_logging.log";
    std::remove(path.c_str());

    logging::LogConfig config;
    config.level = spdlog::level::info;
    config.enable_console = false;
    config.file_path = path;
    logging::init(config);

    REQUIRE(spdlog::default_logger()->sinks().size() == 1);
    spdlog::info("[Test] file sink check");
    spdlog::default_logger()->flush();

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("[Test] file sink check") != std::string::npos);

    spdlog::set_default_logger(previous);
    std::remove(path.c_str());
}

TEST_CASE("logging::init skips an unwritable log file", "[logging]") {
    auto previous = spdlog::default_logger();

    logging::LogConfig config;
    config.enable_console = false;
    config.file_path = "/nonexistent/chartkit/dir/chart.log";
    logging::init(config);

    CHECK(spdlog::default_logger()->sinks().empty());

    spdlog::set_default_logger(previous);
}

TEST_CASE("logging::report_fatal dumps messages below the log level", "[logging]") {
    auto previous = spdlog::default_logger();
    std::string path = "/tmp/chartkit_test_fatal.log";
    std::remove(path.c_str());

    logging::LogConfig config;
    config.level = spdlog::level::warn;
    config.enable_console = false;
    config.file_path = path;
    logging::init(config);

    spdlog::debug("[Test] step before failure");
    logging::report_fatal("render failed");

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("Fatal: render failed") != std::string::npos);
    CHECK(contents.find("[Test] step before failure") != std::string::npos);

    spdlog::disable_backtrace();
    spdlog::set_default_logger(previous);
    std::remove(path.c_str());
}
