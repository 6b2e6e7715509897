// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cache_settings.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace thumbkit {

namespace {

constexpr const char* CACHE_SUBDIR = "thumbkit";
constexpr const char* THUMBNAIL_SUBDIR = "thumbnail";

bool try_create_cache_dir(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec || !std::filesystem::is_directory(path, ec)) {
        return false;
    }

    // Verify we can actually write to the directory
    std::string test_file = path + "/.thumbkit_write_test";
    {
        std::ofstream ofs(test_file);
        if (!ofs.good()) {
            return false;
        }
    }
    std::filesystem::remove(test_file, ec);
    return true;
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? std::string(value) : std::string();
}

} // namespace

std::string resolve_cache_dir(const std::string& configured) {
    std::string env_dir = env_or_empty("THUMBKIT_CACHE_DIR");
    if (!env_dir.empty()) {
        if (try_create_cache_dir(env_dir)) {
            spdlog::info("[CacheSettings] Cache dir (THUMBKIT_CACHE_DIR): {}", env_dir);
            return env_dir;
        }
        spdlog::warn("[CacheSettings] Cannot use THUMBKIT_CACHE_DIR: {}", env_dir);
    }

    if (!configured.empty()) {
        if (try_create_cache_dir(configured)) {
            spdlog::info("[CacheSettings] Cache dir (config): {}", configured);
            return configured;
        }
        spdlog::warn("[CacheSettings] Cannot use configured directory: {}", configured);
    }

    std::string xdg_cache = env_or_empty("XDG_CACHE_HOME");
    if (!xdg_cache.empty()) {
        std::string path = xdg_cache + "/" + CACHE_SUBDIR;
        if (try_create_cache_dir(path)) {
            return path;
        }
    }

    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        std::string path = home + "/.cache/" + CACHE_SUBDIR;
        if (try_create_cache_dir(path)) {
            return path;
        }
    }

    std::string fallback = std::string("/tmp/") + CACHE_SUBDIR;
    spdlog::warn("[CacheSettings] Falling back to {}", fallback);
    try_create_cache_dir(fallback);
    return fallback;
}

CacheSettings CacheSettings::from_config(Config& config) {
    CacheSettings s;

    s.cache_dir = resolve_cache_dir(config.get<std::string>("/cache/directory", ""));
    s.thumbnails_dir = config.get<std::string>("/cache/thumbnails_directory", "");
    if (s.thumbnails_dir.empty()) {
        s.thumbnails_dir = s.cache_dir + "/" + THUMBNAIL_SUBDIR;
    }

    int disk_mb = config.get<int>("/cache/max_size", static_cast<int>(s.max_disk_mb));
    int memory_mb = config.get<int>("/cache/max_memory", static_cast<int>(s.max_memory_mb));
    if (disk_mb < static_cast<int>(TieredCache::MIN_DISK_MB)) {
        spdlog::warn("[CacheSettings] cache/max_size {} MB below minimum, using {} MB", disk_mb,
                     TieredCache::MIN_DISK_MB);
        disk_mb = static_cast<int>(TieredCache::MIN_DISK_MB);
    }
    if (memory_mb < static_cast<int>(TieredCache::MIN_MEMORY_MB)) {
        spdlog::warn("[CacheSettings] cache/max_memory {} MB below minimum, using {} MB",
                     memory_mb, TieredCache::MIN_MEMORY_MB);
        memory_mb = static_cast<int>(TieredCache::MIN_MEMORY_MB);
    }
    s.max_disk_mb = static_cast<size_t>(disk_mb);
    s.max_memory_mb = static_cast<size_t>(memory_mb);

    int concurrent = config.get<int>("/network/concurrent_downloads", s.concurrent_downloads);
    s.concurrent_downloads = std::clamp(concurrent, 1, 64);
    if (s.concurrent_downloads != concurrent) {
        spdlog::warn("[CacheSettings] network/concurrent_downloads {} out of range, using {}",
                     concurrent, s.concurrent_downloads);
    }

    s.timeout_sec = std::max(1, config.get<int>("/network/timeout_sec", s.timeout_sec));
    s.user_agent = config.get<std::string>("/network/user_agent", s.user_agent);
    s.min_launch_interval_ms = std::max<int64_t>(
        0, config.get<int64_t>("/loader/min_launch_interval_ms", s.min_launch_interval_ms));

    spdlog::debug("[CacheSettings] dir={} thumbnails={} disk={}MB memory={}MB concurrent={} "
                  "timeout={}s",
                  s.cache_dir, s.thumbnails_dir, s.max_disk_mb, s.max_memory_mb,
                  s.concurrent_downloads, s.timeout_sec);
    return s;
}

TieredCacheOptions CacheSettings::cache_options() const {
    TieredCacheOptions options;
    options.cache_dir = cache_dir;
    options.thumbnails_dir = thumbnails_dir;
    options.max_disk_bytes = max_disk_mb * 1024 * 1024;
    options.max_memory_bytes = max_memory_mb * 1024 * 1024;
    return options;
}

LoadDispatcherOptions CacheSettings::dispatcher_options() const {
    LoadDispatcherOptions options;
    options.max_concurrent = concurrent_downloads;
    options.min_launch_interval_ms = min_launch_interval_ms;
    return options;
}

} // namespace thumbkit
