// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for the chartkit demo
 *
 * Library code only calls spdlog::info() and friends. The host calls init()
 * once at startup to choose sinks and level; until then spdlog's default
 * console logger is used.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace chartkit {
namespace logging {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    std::string file_path; ///< Rotating log file; empty disables file logging
};

/**
 * @brief Replace the default logger
 *
 * Safe to call more than once; the previous default logger is dropped.
 */
void init(const LogConfig& config);

/**
 * @brief Log a fatal error followed by the recent message backtrace
 *
 * init() keeps the last 32 messages at every level, including ones below the
 * configured level, so the lead-up to a failure is visible even without -v.
 */
void report_fatal(const std::string& reason);

/// -v count to level: 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum level_from_verbosity(int verbosity);

} // namespace logging
} // namespace chartkit
