// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for chartkit-demo
 */

#include "chart_types.h"

#include <optional>
#include <string>

namespace chartkit {

struct CliArgs {
    std::string config_path;          ///< -c: JSON chart description
    std::optional<ChartType> type;    ///< -t: overrides the description's type
    std::string output_path;          ///< -o: render headless to this BMP and exit
    std::optional<int> width;         ///< -s WxH: overrides the description's size
    std::optional<int> height;
    int verbosity = 0;                ///< Number of -v flags
    std::string log_file;             ///< --log-file
    bool show_help = false;

    bool headless() const {
        return !output_path.empty();
    }
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stdout together with a hint to use --help.
 *
 * @return true on success (including -h, check show_help), false on error
 */
bool parse_cli_args(int argc, const char* const* argv, CliArgs& args);

/// Print usage text
void print_help(const char* program_name);

/**
 * @brief Parse "WxH" or a preset name (small, medium, large)
 *
 * @return false if the text is neither or a dimension is not positive
 */
bool parse_screen_size(const std::string& text, int& width, int& height);

} // namespace chartkit
