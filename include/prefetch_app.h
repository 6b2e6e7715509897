// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cache_settings.h"
#include "cli_args.h"

#include <cstdint>
#include <memory>
#include <set>
#include <string>

/**
 * @file prefetch_app.h
 * @brief thumbkit-prefetch application lifecycle
 *
 * Phases: parse args, load config, init logging, build the cache stack,
 * prefetch, report, shut down in reverse order.
 */

namespace thumbkit {

class Config;
class EventLoop;
class HttpImageFetcher;
class LoadDispatcher;
class ThreadPoolExecutor;
class ThumbnailScheduler;
class TieredCache;

/**
 * @brief Derive a thumbnail id from a URL
 *
 * Last path segment without query, fragment or extension
 * ("https://h/p/abc.jpg?x=1" -> "abc"). Empty if the URL has no usable
 * segment.
 */
std::string image_id_from_url(const std::string& url);

class PrefetchApp {
  public:
    PrefetchApp();
    ~PrefetchApp();

    PrefetchApp(const PrefetchApp&) = delete;
    PrefetchApp& operator=(const PrefetchApp&) = delete;

    /**
     * @brief Run the tool
     *
     * @return 0 on success (or help), 1 if setup failed or any URL failed
     */
    int run(int argc, char** argv);

  private:
    bool parse_args(int argc, char** argv);
    bool init_config();
    bool init_logging();
    bool init_services();
    bool prefetch();
    void print_stats();
    void shutdown();

    CliArgs m_args;
    Config* m_config = nullptr;
    CacheSettings m_settings;

    // Declaration order is destruction order in reverse: the loop outlives
    // every worker, workers are joined before the dispatcher's dependencies go.
    std::unique_ptr<EventLoop> m_loop;
    std::unique_ptr<TieredCache> m_cache;
    std::unique_ptr<HttpImageFetcher> m_fetcher;
    std::unique_ptr<ThreadPoolExecutor> m_executor;
    std::unique_ptr<LoadDispatcher> m_dispatcher;
    std::unique_ptr<ThumbnailScheduler> m_scheduler;

    std::set<std::string> m_remaining;
    size_t m_loaded = 0;
    size_t m_failed = 0;
    size_t m_saved = 0;
};

} // namespace thumbkit
