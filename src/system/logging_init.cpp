// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#include "hv/hlog.h"

#ifdef __linux__
#ifdef THUMBKIT_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace thumbkit {
namespace logging {

namespace {

constexpr const char* LOG_IDENT = "thumbkit";
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

constexpr std::pair<LogTarget, const char*> TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},
    {LogTarget::Journal, "journal"},
    {LogTarget::Syslog, "syslog"},
    {LogTarget::File, "file"},
    {LogTarget::Console, "console"},
};

/// `$XDG_STATE_HOME/thumbkit/thumbkit.log`, falling back to ~/.local/state, then /tmp
std::string default_log_file() {
    std::filesystem::path dir;
    const char* xdg = std::getenv("XDG_STATE_HOME");
    const char* home = std::getenv("HOME");
    if (xdg && xdg[0] != '\0') {
        dir = xdg;
    } else if (home && home[0] != '\0') {
        dir = std::filesystem::path(home) / ".local" / "state";
    } else {
        dir = "/tmp";
    }
    dir /= LOG_IDENT;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return (dir / "thumbkit.log").string();
}

/// Auto: journal when its socket exists, else syslog; console only off Linux
LogTarget resolve_target(LogTarget target) {
    if (target != LogTarget::Auto) {
        return target;
    }
#ifdef __linux__
#ifdef THUMBKIT_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Sink for a resolved non-console target, or nullptr
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    if (target == LogTarget::File) {
        const std::string path = file_path.empty() ? default_log_file() : file_path;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_MAX_BYTES,
                                                                      LOG_FILE_COUNT);
    }
#ifdef __linux__
#ifdef THUMBKIT_HAS_SYSTEMD
    if (target == LogTarget::Journal) {
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(LOG_IDENT);
    }
#endif
    // Journal falls back to syslog without libsystemd
    if (target == LogTarget::Syslog || target == LogTarget::Journal) {
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(LOG_IDENT, LOG_PID, LOG_USER,
                                                               false);
    }
#endif
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    const LogTarget effective_target = resolve_target(config.target);
    if (auto sink = make_target_sink(effective_target, config.file_path)) {
        sinks.push_back(std::move(sink));
    }

    auto logger = std::make_shared<spdlog::logger>(LOG_IDENT, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Recent messages for dump_backtrace() on fatal errors
    spdlog::enable_backtrace(32);

    hlog_set_level(to_hv_level(config.level));

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (target == entry.first) {
            return entry.second;
        }
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    case spdlog::level::off:
    default:
        return LOG_LEVEL_SILENT;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

} // namespace logging
} // namespace thumbkit
