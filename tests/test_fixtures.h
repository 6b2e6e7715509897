// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Reusable fixtures for thumbkit unit tests
 *
 * Available Fixtures:
 * - TempDirFixture: isolated temp directory, removed on teardown
 * - CacheTestFixture: TempDirFixture + TieredCache rooted in it
 * - LoaderTestFixture: CacheTestFixture + manual clock, EventLoop,
 *   ScriptedFetcher, ManualExecutor and a LoadDispatcher
 *
 * Usage:
 * @code
 * TEST_CASE_METHOD(LoaderTestFixture, "Test name", "[tags]") {
 *     fetcher.set_image("http://x/a.jpg", 64, 48);
 *     dispatcher().load("http://x/a.jpg");
 *     run_workers();
 * }
 * @endcode
 */

#include "event_loop.h"
#include "load_dispatcher.h"
#include "test_helpers/manual_executor.h"
#include "test_helpers/scripted_fetcher.h"
#include "tiered_cache.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thumbkit {

class TempDirFixture {
  public:
    TempDirFixture();
    ~TempDirFixture();

    TempDirFixture(const TempDirFixture&) = delete;
    TempDirFixture& operator=(const TempDirFixture&) = delete;

    [[nodiscard]] const std::filesystem::path& temp_dir() const {
        return temp_dir_;
    }

  protected:
    std::filesystem::path temp_dir_;
};

class CacheTestFixture : public TempDirFixture {
  public:
    CacheTestFixture();

    TieredCacheOptions cache_options() const;

    /// Number of `*.cache` files on disk
    size_t count_disk_files() const;

  protected:
    std::unique_ptr<TieredCache> cache_;
};

/**
 * @brief Dispatcher on a manual clock with scripted network and workers
 *
 * Nothing runs on its own: advance() moves the clock and runs due timers,
 * run_workers() executes queued workers and delivers their completions.
 */
class LoaderTestFixture : public CacheTestFixture {
  public:
    struct LoadedEvent {
        std::string url;
        std::optional<ImageSize> size;
        ImagePtr image;
    };

    struct FailedEvent {
        std::string url;
        LoadError reason;
        std::string message;
    };

    LoaderTestFixture();
    ~LoaderTestFixture();

    /// (Re)create the dispatcher with the given limits and record its events
    void make_dispatcher(int max_concurrent = 5, int64_t min_launch_interval_ms = 30);

    LoadDispatcher& dispatcher() {
        return *dispatcher_;
    }

    /// Advance the clock and run everything that became due
    void advance(int64_t ms);

    /// Run queued workers and deliver their completions
    void run_workers();

    ManualTimeSource clock;
    EventLoop loop{clock};
    ScriptedFetcher fetcher;
    ManualExecutor executor;

    std::vector<LoadedEvent> loaded;
    std::vector<FailedEvent> failed;

  protected:
    std::unique_ptr<LoadDispatcher> dispatcher_;
};

} // namespace thumbkit
