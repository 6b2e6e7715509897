// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace thumbkit {

static constexpr long MAX_SIZE_DIMENSION = 8192;

// Helper to parse a positive dimension with validation
static bool parse_dimension(const char* str, size_t len, int& out) {
    if (len == 0 || len > 5) {
        return false;
    }
    long val = 0;
    for (size_t i = 0; i < len; ++i) {
        if (str[i] < '0' || str[i] > '9') {
            return false;
        }
        val = val * 10 + (str[i] - '0');
    }
    if (val < 1 || val > MAX_SIZE_DIMENSION) {
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

bool parse_size_arg(const char* str, ImageSize& out) {
    if (!str) {
        return false;
    }
    const char* sep = strchr(str, 'x');
    if (!sep) {
        return false;
    }
    ImageSize parsed;
    if (!parse_dimension(str, static_cast<size_t>(sep - str), parsed.width) ||
        !parse_dimension(sep + 1, strlen(sep + 1), parsed.height)) {
        return false;
    }
    out = parsed;
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options] [url ...]\n", program_name);
    printf("Prefetch images into the thumbnail cache.\n\n");
    printf("Options:\n");
    printf("  -c, --config <path>  Config file (default: %s)\n", default_config_path().c_str());
    printf("  -s, --size <WxH>     Thumbnail box (default: %dx%d)\n",
           CliArgs::DEFAULT_THUMBNAIL_SIZE, CliArgs::DEFAULT_THUMBNAIL_SIZE);
    printf("  -o, --save-dir <dir> Also save thumbnails as JPEG by id into <dir>\n");
    printf("  -v, --verbose        Increase log verbosity (-v info, -vv debug, -vvv trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (with --log-dest=file)\n");
    printf("  --clear              Clear memory and disk caches before prefetching\n");
    printf("  --stats              Print cache statistics as JSON when done\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nEnvironment:\n");
    printf("  THUMBKIT_CACHE_DIR   Override the cache directory\n");
}

// Accepts "--opt value" and "--opt=value"
static bool take_value(int argc, char** argv, int& i, const char* short_name,
                       const char* long_name, const char*& value) {
    const char* arg = argv[i];
    size_t long_len = strlen(long_name);
    if (strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        value = arg + long_len + 1;
        return true;
    }
    if ((short_name && strcmp(arg, short_name) == 0) || strcmp(arg, long_name) == 0) {
        if (i + 1 >= argc) {
            if (short_name) {
                printf("Error: %s/%s requires an argument\n", short_name, long_name);
            } else {
                printf("Error: %s requires an argument\n", long_name);
            }
            value = nullptr;
            return true;
        }
        value = argv[++i];
        return true;
    }
    return false;
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* value = nullptr;

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help_requested = true;
            return false;
        } else if (take_value(argc, argv, i, "-c", "--config", value)) {
            if (!value)
                return false;
            args.config_path = value;
        } else if (take_value(argc, argv, i, "-s", "--size", value)) {
            if (!value)
                return false;
            if (!parse_size_arg(value, args.size)) {
                printf("Error: invalid size: %s (expected WxH, e.g. 200x200)\n", value);
                return false;
            }
        } else if (take_value(argc, argv, i, "-o", "--save-dir", value)) {
            if (!value)
                return false;
            args.save_dir = value;
        } else if (take_value(argc, argv, i, nullptr, "--log-dest", value)) {
            if (!value)
                return false;
            if (strcmp(value, "auto") != 0 && strcmp(value, "journal") != 0 &&
                strcmp(value, "syslog") != 0 && strcmp(value, "file") != 0 &&
                strcmp(value, "console") != 0) {
                printf("Error: invalid --log-dest value: %s\n", value);
                return false;
            }
            args.log_dest = value;
        } else if (take_value(argc, argv, i, nullptr, "--log-file", value)) {
            if (!value)
                return false;
            args.log_file = value;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (argv[i][0] == '-' && argv[i][1] == 'v') {
            // -v, -vv, -vvv
            const char* p = argv[i] + 1;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
            if (*p != '\0') {
                printf("Unknown argument: %s\n", argv[i]);
                printf("Use --help for usage information\n");
                return false;
            }
        } else if (strcmp(argv[i], "--clear") == 0) {
            args.clear_cache = true;
        } else if (strcmp(argv[i], "--stats") == 0) {
            args.print_stats = true;
        } else if (argv[i][0] != '-') {
            args.urls.emplace_back(argv[i]);
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/thumbkit/thumbkit.json";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/thumbkit/thumbkit.json";
    }
    return "thumbkit.json";
}

} // namespace thumbkit
