// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "chart.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>

namespace chartkit {

namespace {

struct SizePreset {
    const char* name;
    int width;
    int height;
};

constexpr SizePreset SIZE_PRESETS[] = {
    {"small", 480, 320},
    {"medium", 800, 480},
    {"large", 1024, 600},
};

} // namespace

bool parse_screen_size(const std::string& text, int& width, int& height) {
    for (const auto& preset : SIZE_PRESETS) {
        if (text == preset.name) {
            width = preset.width;
            height = preset.height;
            return true;
        }
    }

    int w = 0, h = 0;
    char trailing = '\0';
    if (sscanf(text.c_str(), "%dx%d%c", &w, &h, &trailing) == 2 && w > 0 && h > 0) {
        width = w;
        height = h;
        return true;
    }
    return false;
}

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <file>  JSON chart description\n");
    printf("  -t, --type <type>    Chart type: bar, point, line, donut, pie, radar,\n");
    printf("                       radial_gauge\n");
    printf("  -o, --output <file>  Render headless to a 32-bit BMP and exit\n");
    printf("  -s, --size <size>    Render size: small, medium, large (or WxH)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-file <path>    Also log to a rotating file\n");
    printf("  -h, --help           Show this help\n");
    printf("\nScreen sizes:\n");
    for (const auto& preset : SIZE_PRESETS) {
        printf("  %-8s = %dx%d\n", preset.name, preset.width, preset.height);
    }
    printf("\nExamples:\n");
    printf("  %s -t radar                    # Demo page starting on a radar chart\n",
           program_name);
    printf("  %s -c sales.json -o sales.bmp  # Headless render\n", program_name);
}

bool parse_cli_args(int argc, const char* const* argv, CliArgs& args) {
    // Fetch the value of an option that requires one
    auto value_of = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            printf("Error: %s requires an argument\n", argv[i]);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            const char* value = value_of(i);
            if (!value)
                return false;
            args.config_path = value;
        } else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--type") == 0) {
            const char* value = value_of(i);
            if (!value)
                return false;
            args.type = chart_type_from_name(value);
            if (!args.type) {
                printf("Unknown chart type: %s\n", value);
                return false;
            }
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            const char* value = value_of(i);
            if (!value)
                return false;
            args.output_path = value;
        } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--size") == 0) {
            const char* value = value_of(i);
            if (!value)
                return false;
            int w = 0, h = 0;
            if (!parse_screen_size(value, w, h)) {
                printf("Unknown screen size: %s\n", value);
                printf("Available sizes: small, medium, large (or WxH like 480x320)\n");
                return false;
            }
            args.width = w;
            args.height = h;
        }
        // Verbosity
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "-vv") == 0 ||
                 strcmp(arg, "-vvv") == 0) {
            const char* p = arg;
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (strcmp(arg, "--log-file") == 0) {
            const char* value = value_of(i);
            if (!value)
                return false;
            args.log_file = value;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return true;
        } else {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace chartkit
