// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace chartkit {
namespace logging {

namespace {

/// Check if a path is writable (for file logging location selection)
bool is_path_writable(const std::string& path) {
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();

    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return false;
    }

    auto perms = std::filesystem::status(dir, ec).permissions();
    if (ec) {
        return false;
    }

    // Check owner write permission (simplified check)
    return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    bool file_rejected = false;
    if (!config.file_path.empty()) {
        if (is_path_writable(config.file_path)) {
            // 5MB max size, 3 rotated files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, 5 * 1024 * 1024, 3));
        } else {
            file_rejected = true;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("chartkit", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Dumped by report_fatal()
    spdlog::enable_backtrace(32);

    if (file_rejected) {
        spdlog::warn("[Logging] Log file {} is not writable, file logging disabled",
                     config.file_path);
    }
    spdlog::debug("[Logging] Initialized: console={}, file={}",
                  config.enable_console ? "yes" : "no",
                  config.file_path.empty() || file_rejected ? "none" : config.file_path);
}

void report_fatal(const std::string& reason) {
    spdlog::critical("[Logging] Fatal: {}", reason);
    spdlog::critical("=== Recent log messages (backtrace) ===");
    spdlog::dump_backtrace();
    spdlog::default_logger()->flush();
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

} // namespace logging
} // namespace chartkit
