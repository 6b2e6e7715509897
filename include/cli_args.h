// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for thumbkit-prefetch
 */

#include "image_bitmap.h"

#include <string>
#include <vector>

namespace thumbkit {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    static constexpr int DEFAULT_THUMBNAIL_SIZE = 200;

    std::string config_path; ///< -c/--config (empty = default location)

    /// -s/--size WxH: target thumbnail box
    ImageSize size{DEFAULT_THUMBNAIL_SIZE, DEFAULT_THUMBNAIL_SIZE};

    /// -o/--save-dir: also save each thumbnail as JPEG by id into this directory
    std::string save_dir;

    // Logging
    int verbosity = 0;    ///< Count of -v flags
    std::string log_dest; ///< --log-dest: auto, journal, syslog, file, console
    std::string log_file; ///< --log-file: path for the file target

    // Actions
    bool clear_cache = false; ///< --clear: flush memory and disk tiers first
    bool print_stats = false; ///< --stats: print combined stats JSON when done
    bool help_requested = false;

    std::vector<std::string> urls; ///< Positional arguments

    /** @brief True if there is anything to do besides printing help */
    bool has_work() const {
        return !urls.empty() || clear_cache || print_stats;
    }
};

/**
 * @brief Parse a "WxH" string (both dimensions 1..8192)
 *
 * @return true on success
 */
bool parse_size_arg(const char* str, ImageSize& out);

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stdout.
 *
 * @return true on success, false if help was shown or an error occurred
 *         (check args.help_requested to tell them apart)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Default config file location
 *
 * $XDG_CONFIG_HOME/thumbkit/thumbkit.json, else ~/.config/thumbkit/thumbkit.json,
 * else ./thumbkit.json
 */
std::string default_config_path();

} // namespace thumbkit
