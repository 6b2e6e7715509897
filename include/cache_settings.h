// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "load_dispatcher.h"
#include "tiered_cache.h"

#include <string>

namespace thumbkit {

class Config;

/**
 * @brief Resolve the cache directory
 *
 * Resolution order:
 * 1. THUMBKIT_CACHE_DIR environment variable
 * 2. `configured` (the /cache/directory config value) if non-empty
 * 3. $XDG_CACHE_HOME/thumbkit
 * 4. $HOME/.cache/thumbkit
 * 5. /tmp/thumbkit
 *
 * The first candidate that can be created and written is returned.
 */
std::string resolve_cache_dir(const std::string& configured);

/**
 * @brief Every tunable read from Config, with defaults applied
 */
struct CacheSettings {
    std::string cache_dir;
    std::string thumbnails_dir;
    size_t max_disk_mb = 1000;
    size_t max_memory_mb = 200;
    int concurrent_downloads = LoadDispatcherOptions::DEFAULT_MAX_CONCURRENT;
    int timeout_sec = 30;
    std::string user_agent = "thumbkit/1.0";
    int64_t min_launch_interval_ms = LoadDispatcherOptions::DEFAULT_MIN_LAUNCH_INTERVAL_MS;

    /**
     * @brief Read settings from a loaded Config
     *
     * Out-of-range numbers are clamped and logged.
     */
    static CacheSettings from_config(Config& config);

    [[nodiscard]] TieredCacheOptions cache_options() const;
    [[nodiscard]] LoadDispatcherOptions dispatcher_options() const;
};

} // namespace thumbkit
