// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace thumbkit {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux) or console only
    Journal, ///< systemd journal (falls back to syslog without THUMBKIT_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file (5 MB x 3)
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< File target path (empty = $XDG_STATE_HOME/thumbkit/thumbkit.log)
};

/**
 * @brief Install the default spdlog logger
 *
 * Also forwards the level to libhv's internal logger so HTTP client
 * diagnostics follow the same verbosity.
 */
void init(const LogConfig& config);

/// "auto", "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" .. "off", "warning" alias)
 *
 * Case sensitive. Returns default_level for anything unrecognized.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v = info, -vv = debug, -vvv+ = trace, none = warn
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// Map to libhv log levels (VERBOSE=0 .. SILENT=6)
int to_hv_level(spdlog::level::level_enum level);

/**
 * @brief Pick the effective level
 *
 * CLI verbosity wins over the config value, which wins over warn.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

} // namespace logging
} // namespace thumbkit
