// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "thumbnail_scheduler.h"

#include "../test_fixtures.h"

#include <memory>

#include <catch2/catch_test_macros.hpp>

using namespace thumbkit;

// ============================================================================
// Fixture: scheduler on top of the manual-clock dispatcher
// ============================================================================

class SchedulerTestFixture : public LoaderTestFixture {
  public:
    struct SchedulerLoaded {
        std::string url;
        ImageSize size;
        ImagePtr image;
    };

    SchedulerTestFixture() {
        make_scheduler();
    }

    ~SchedulerTestFixture() {
        scheduler_.reset();
    }

    void make_scheduler(int max_concurrent = 5, int64_t min_launch_interval_ms = 0) {
        scheduler_.reset();
        make_dispatcher(max_concurrent, min_launch_interval_ms);
        scheduler_ = std::make_unique<ThumbnailScheduler>(loop, *cache_, *dispatcher_);
        scheduler_loaded.clear();
        scheduler_failed = 0;
        stats_updates = 0;

        scheduler_->add_loaded_listener(
            [this](const std::string& url, const ImageSize& size, const ImagePtr& image) {
                scheduler_loaded.push_back({url, size, image});
            });
        scheduler_->add_failed_listener(
            [this](const std::string&, LoadError, const std::string&) { ++scheduler_failed; });
        scheduler_->add_stats_listener([this](const SchedulerStats&) { ++stats_updates; });
    }

    ThumbnailScheduler& scheduler() {
        return *scheduler_;
    }

    static std::string url_of(int i) {
        return "http://img.test/" + std::to_string(i) + ".jpg";
    }

    /// Put a decoded full-size image for url in memory
    void seed_base(const std::string& url) {
        cache_->put_memory(TieredCache::key_of(url), make_solid_bitmap(32, 32, 9, 9, 9));
    }

    /// Advance in small steps, running workers as they are submitted
    void run_for(int64_t total_ms, int64_t step_ms = 50) {
        for (int64_t t = 0; t < total_ms; t += step_ms) {
            advance(step_ms);
            run_workers();
        }
    }

    std::vector<SchedulerLoaded> scheduler_loaded;
    int scheduler_failed = 0;
    int stats_updates = 0;

  protected:
    std::unique_ptr<ThumbnailScheduler> scheduler_;
};

const ImageSize THUMB{16, 16};

// ============================================================================
// load_thumbnail
// ============================================================================

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: memory hit is delivered immediately",
                 "[scheduler][load]") {
    cache_->put_memory(TieredCache::variant_key_of(url_of(1), THUMB),
                       make_solid_bitmap(16, 16, 0, 0, 0));

    REQUIRE(scheduler().load_thumbnail(url_of(1), THUMB, true));
    REQUIRE(scheduler_loaded.size() == 1);
    REQUIRE(scheduler().request_state(url_of(1), THUMB) == RequestState::Loaded);

    SchedulerStats s = scheduler().cache_stats();
    REQUIRE(s.cache_hits == 1);
    REQUIRE(s.total_requests == 1);
    REQUIRE(s.priority_urls == 0);
    REQUIRE(executor.submitted() == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: base in memory is rescaled on request",
                 "[scheduler][load]") {
    seed_base(url_of(1));

    REQUIRE(scheduler().load_thumbnail(url_of(1), THUMB));
    REQUIRE(scheduler_loaded.size() == 1);
    REQUIRE(scheduler_loaded[0].image->width == 16);
    REQUIRE(cache_->has_memory(TieredCache::variant_key_of(url_of(1), THUMB)));
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: miss goes Loading then Loaded",
                 "[scheduler][load]") {
    fetcher.set_image(url_of(1), 64, 48);

    REQUIRE(scheduler().request_state(url_of(1), THUMB) == RequestState::Placeholder);
    REQUIRE_FALSE(scheduler().load_thumbnail(url_of(1), THUMB, true));
    REQUIRE(scheduler().request_state(url_of(1), THUMB) == RequestState::Loading);
    REQUIRE(scheduler().cache_stats().priority_urls == 1);

    run_workers();
    REQUIRE(scheduler().request_state(url_of(1), THUMB) == RequestState::Loaded);
    REQUIRE(scheduler_loaded.size() == 1);
    REQUIRE(scheduler_loaded[0].size == THUMB);
    REQUIRE(scheduler_loaded[0].image->width == 16);
    REQUIRE(scheduler_loaded[0].image->height == 12);

    SchedulerStats s = scheduler().cache_stats();
    REQUIRE(s.cache_misses == 1);
    REQUIRE(s.priority_urls == 0);
    REQUIRE(s.preload_hits == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: failure moves request to Error",
                 "[scheduler][load]") {
    fetcher.set_error(url_of(1), 404, "HTTP 404");

    scheduler().load_thumbnail(url_of(1), THUMB, true);
    run_workers();

    REQUIRE(scheduler().request_state(url_of(1), THUMB) == RequestState::Error);
    REQUIRE(scheduler_failed == 1);
    REQUIRE(scheduler().cache_stats().priority_urls == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: a miss counts one memory lookup",
                 "[scheduler][load]") {
    fetcher.set_image(url_of(1), 64, 48);

    REQUIRE_FALSE(scheduler().load_thumbnail(url_of(1), THUMB, true));
    CacheTierStats s = cache_->stats();
    REQUIRE(s.memory_misses == 1);
    REQUIRE(s.memory_hits == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: invalid sizes are rejected",
                 "[scheduler][load]") {
    fetcher.set_image(url_of(1), 64, 48);

    REQUIRE_FALSE(scheduler().load_thumbnail(url_of(1), ImageSize{0, 0}, true));
    REQUIRE(scheduler().request_state(url_of(1), ImageSize{0, 0}) == RequestState::Placeholder);
    REQUIRE(scheduler().cache_stats().total_requests == 0);
    REQUIRE(dispatcher().active_count() == 0);

    scheduler().preload_thumbnails({url_of(1), url_of(2)}, ImageSize{16, -1});
    REQUIRE(scheduler().preload_queue_size() == 0);
    REQUIRE(scheduler().variant_queue_size() == 0);

    run_for(2000);
    REQUIRE(fetcher.total_calls() == 0);
    REQUIRE(scheduler_loaded.empty());
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: finished request states are bounded",
                 "[scheduler][state]") {
    const std::string in_flight = "http://img.test/slow.jpg";
    REQUIRE_FALSE(scheduler().load_thumbnail(in_flight, THUMB, true));

    const int total = static_cast<int>(ThumbnailScheduler::MAX_FINISHED_STATES) + 100;
    for (int i = 0; i < total; ++i) {
        seed_base(url_of(i));
        REQUIRE(scheduler().load_thumbnail(url_of(i), THUMB));
    }

    REQUIRE(scheduler().tracked_request_count() <= ThumbnailScheduler::MAX_FINISHED_STATES + 1);
    REQUIRE(scheduler().request_state(url_of(total - 1), THUMB) == RequestState::Loaded);
    REQUIRE(scheduler().request_state(url_of(0), THUMB) == RequestState::Placeholder);
    REQUIRE(scheduler().request_state(in_flight, THUMB) == RequestState::Loading);

    SECTION("reloading a request keeps it among the recent ones") {
        REQUIRE(scheduler().load_thumbnail(url_of(total - 1), THUMB));
        for (int i = total; i < total + 10; ++i) {
            seed_base(url_of(i));
            REQUIRE(scheduler().load_thumbnail(url_of(i), THUMB));
        }
        REQUIRE(scheduler().request_state(url_of(total - 1), THUMB) == RequestState::Loaded);
        REQUIRE(scheduler().tracked_request_count() <=
                ThumbnailScheduler::MAX_FINISHED_STATES + 1);
    }
}

// ============================================================================
// preload_thumbnails
// ============================================================================

TEST_CASE_METHOD(SchedulerTestFixture,
                 "ThumbnailScheduler: preload splits 100 urls into variant and network queues",
                 "[scheduler][preload]") {
    std::vector<std::string> urls;
    for (int i = 0; i < 100; ++i) {
        urls.push_back(url_of(i));
        if (i < 80) {
            seed_base(url_of(i));
        } else {
            fetcher.set_image(url_of(i), 32, 32);
        }
    }

    scheduler().preload_thumbnails(urls, THUMB);
    REQUIRE(scheduler().variant_queue_size() == 80);
    REQUIRE(scheduler().preload_queue_size() == 20);
    REQUIRE(fetcher.total_calls() == 0);

    run_for(30000);

    REQUIRE(scheduler().variant_queue_size() == 0);
    REQUIRE(scheduler().preload_queue_size() == 0);
    for (int i = 0; i < 80; ++i) {
        REQUIRE(fetcher.calls(url_of(i)) == 0);
        REQUIRE(cache_->has_memory(TieredCache::variant_key_of(url_of(i), THUMB)));
    }
    for (int i = 80; i < 100; ++i) {
        REQUIRE(fetcher.calls(url_of(i)) == 1);
    }
    REQUIRE(scheduler_loaded.size() == 100);
    REQUIRE(scheduler().cache_stats().preload_hits == 20);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: cached variants and duplicates are skipped",
                 "[scheduler][preload]") {
    cache_->put_memory(TieredCache::variant_key_of(url_of(0), THUMB),
                       make_solid_bitmap(16, 16, 0, 0, 0));

    scheduler().preload_thumbnails({url_of(0), url_of(1), url_of(2)}, THUMB);
    REQUIRE(scheduler().preload_queue_size() == 2);

    scheduler().preload_thumbnails({url_of(1), url_of(2), url_of(2)}, THUMB);
    REQUIRE(scheduler().preload_queue_size() == 2);

    // Same url at another size is a separate item
    scheduler().preload_thumbnails({url_of(1)}, ImageSize{64, 64});
    REQUIRE(scheduler().preload_queue_size() == 3);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: preload tick reserves slots",
                 "[scheduler][preload][reserve]") {
    std::vector<std::string> urls;
    for (int i = 0; i < 10; ++i) {
        urls.push_back(url_of(i));
        fetcher.set_image(url_of(i), 32, 32);
    }

    scheduler().preload_thumbnails(urls, THUMB);
    REQUIRE(executor.submitted() == 0);

    advance(ThumbnailScheduler::INITIAL_PRELOAD_DELAY_MS - 1);
    REQUIRE(executor.submitted() == 0);

    // Low hit rate: half of the 5 free slots (at least 1) stay reserved
    advance(1);
    REQUIRE(executor.submitted() == 3);
    REQUIRE(dispatcher().active_count() == 3);
    REQUIRE(scheduler().preload_queue_size() == 7);
    REQUIRE(scheduler().request_state(url_of(0), THUMB) == RequestState::Loading);

    // Quiet dispatcher: the delay shrinks
    REQUIRE(scheduler().preload_delay_ms() ==
            ThumbnailScheduler::INITIAL_PRELOAD_DELAY_MS -
                ThumbnailScheduler::PRELOAD_DELAY_STEP_DOWN_MS);

    // With every slot busy nothing else is submitted
    advance(scheduler().preload_delay_ms());
    REQUIRE(executor.submitted() == 4);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: single slot dispatcher never preloads",
                 "[scheduler][preload][reserve]") {
    make_scheduler(1, 0);
    fetcher.set_image(url_of(0), 32, 32);

    scheduler().preload_thumbnails({url_of(0)}, THUMB);
    run_for(3000);
    REQUIRE(executor.submitted() == 0);

    // The reserved slot is still there for on-screen requests
    scheduler().load_thumbnail(url_of(0), THUMB, true);
    REQUIRE(executor.submitted() == 1);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: pause holds preload but not priority",
                 "[scheduler][preload][pause]") {
    fetcher.set_image(url_of(0), 32, 32);
    fetcher.set_image(url_of(1), 32, 32);

    scheduler().set_paused(true);
    REQUIRE(scheduler().is_paused());
    scheduler().preload_thumbnails({url_of(0)}, THUMB);
    run_for(3000);
    REQUIRE(fetcher.calls(url_of(0)) == 0);
    REQUIRE(scheduler().preload_queue_size() == 1);

    scheduler().load_thumbnail(url_of(1), THUMB, true);
    run_workers();
    REQUIRE(fetcher.calls(url_of(1)) == 1);

    scheduler().set_paused(false);
    run_for(3000);
    REQUIRE(fetcher.calls(url_of(0)) == 1);
    REQUIRE(scheduler().preload_queue_size() == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: variant queue runs in batches",
                 "[scheduler][variant]") {
    std::vector<std::string> urls;
    for (int i = 0; i < 6; ++i) {
        urls.push_back(url_of(i));
        seed_base(url_of(i));
    }

    scheduler().preload_thumbnails(urls, THUMB);
    REQUIRE(scheduler().variant_queue_size() == 6);

    advance(ThumbnailScheduler::VARIANT_DELAY_MS);
    REQUIRE(scheduler_loaded.size() == ThumbnailScheduler::VARIANT_BATCH_SIZE);
    REQUIRE(scheduler().variant_queue_size() == 2);

    advance(ThumbnailScheduler::VARIANT_DELAY_MS);
    REQUIRE(scheduler_loaded.size() == 6);
    REQUIRE(scheduler().variant_queue_size() == 0);
    REQUIRE(scheduler().request_state(url_of(5), THUMB) == RequestState::Loaded);
    REQUIRE(executor.submitted() == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture,
                 "ThumbnailScheduler: variant item whose base was evicted moves to preload",
                 "[scheduler][variant]") {
    seed_base(url_of(0));
    fetcher.set_image(url_of(0), 32, 32);

    scheduler().preload_thumbnails({url_of(0)}, THUMB);
    REQUIRE(scheduler().variant_queue_size() == 1);

    cache_->remove_memory(TieredCache::key_of(url_of(0)));
    advance(ThumbnailScheduler::VARIANT_DELAY_MS);
    REQUIRE(scheduler().variant_queue_size() == 0);
    REQUIRE(scheduler().preload_queue_size() == 1);

    run_for(2000);
    REQUIRE(fetcher.calls(url_of(0)) == 1);
    REQUIRE(scheduler_loaded.size() == 1);
}

// ============================================================================
// Adaptive concurrency
// ============================================================================

TEST_CASE_METHOD(SchedulerTestFixture,
                 "ThumbnailScheduler: backlog lowers concurrency one step per tick down to 2",
                 "[scheduler][controller]") {
    for (int i = 0; i < 20; ++i) {
        dispatcher().load(url_of(i), THUMB);
    }
    REQUIRE(dispatcher().active_count() == 5);
    REQUIRE(dispatcher().pending_count() == 15);

    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 4);
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 3);
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 2);
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 2);
}

TEST_CASE_METHOD(SchedulerTestFixture,
                 "ThumbnailScheduler: sustained hit rate raises concurrency up to base",
                 "[scheduler][controller]") {
    dispatcher().set_max_concurrent(2);
    for (int i = 0; i < 10; ++i) {
        cache_->put_memory(TieredCache::variant_key_of(url_of(i), THUMB),
                           make_solid_bitmap(16, 16, 0, 0, 0));
        REQUIRE(scheduler().load_thumbnail(url_of(i), THUMB));
    }
    REQUIRE(scheduler().ema_hit_rate() > 0.7);

    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 3);
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 4);
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 5);
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(dispatcher().max_concurrent() == 5);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: EMA follows the hit rate",
                 "[scheduler][controller]") {
    REQUIRE(scheduler().ema_hit_rate() == 0.0);

    cache_->put_memory(TieredCache::variant_key_of(url_of(0), THUMB),
                       make_solid_bitmap(16, 16, 0, 0, 0));
    scheduler().load_thumbnail(url_of(0), THUMB);
    // 0.2 * 1.0 + 0.8 * 0.0
    REQUIRE(scheduler().ema_hit_rate() > 0.19);
    REQUIRE(scheduler().ema_hit_rate() < 0.21);
    REQUIRE(stats_updates >= 1);
}

// ============================================================================
// Control
// ============================================================================

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: cancel_all_loads clears everything",
                 "[scheduler][control]") {
    for (int i = 0; i < 3; ++i) {
        fetcher.set_image(url_of(i), 32, 32);
        scheduler().load_thumbnail(url_of(i), THUMB, true);
    }
    scheduler().preload_thumbnails({url_of(10), url_of(11)}, THUMB);

    scheduler().cancel_all_loads();
    REQUIRE(scheduler_failed == 3);
    REQUIRE(scheduler().preload_queue_size() == 0);
    REQUIRE(scheduler().cache_stats().priority_urls == 0);
    REQUIRE(scheduler().request_state(url_of(0), THUMB) == RequestState::Error);

    run_for(3000);
    REQUIRE(scheduler_loaded.empty());
    REQUIRE(fetcher.total_calls() == 0);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: cleanup stops the controller",
                 "[scheduler][control]") {
    advance(ThumbnailScheduler::CONTROLLER_INTERVAL_MS);
    REQUIRE(stats_updates == 1);

    scheduler().cleanup();
    int before = stats_updates;
    advance(5000);
    REQUIRE(stats_updates == before);
}

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: clear_preload_queue drops queued work",
                 "[scheduler][control]") {
    seed_base(url_of(0));
    scheduler().preload_thumbnails({url_of(0), url_of(1)}, THUMB);
    scheduler().clear_preload_queue();

    run_for(3000);
    REQUIRE(scheduler_loaded.empty());
    REQUIRE(executor.submitted() == 0);
}

// ============================================================================
// Stats
// ============================================================================

TEST_CASE_METHOD(SchedulerTestFixture, "ThumbnailScheduler: stats JSON is flat and complete",
                 "[scheduler][stats]") {
    cache_->put_memory(TieredCache::variant_key_of(url_of(0), THUMB),
                       make_solid_bitmap(16, 16, 0, 0, 0));
    scheduler().load_thumbnail(url_of(0), THUMB);
    scheduler().load_thumbnail(url_of(1), THUMB);

    nlohmann::json j = scheduler().cache_stats().to_json();
    REQUIRE(j.is_object());
    REQUIRE(j["total_requests"] == 2);
    REQUIRE(j["cache_hits"] == 1);
    REQUIRE(j["cache_misses"] == 1);
    REQUIRE(j["cache_hit_rate"].get<double>() == 0.5);
    REQUIRE(j["base_max_concurrent"] == 5);
    REQUIRE(j["active_loads"] == 1);
    REQUIRE(j["paused"] == false);
    for (const char* key : {"preload_hits", "priority_urls", "preload_queue_size",
                            "variant_queue_size", "ema_hit_rate", "ema_avg_load_ms",
                            "preload_delay_ms", "pending_loads", "max_concurrent", "loaded_count",
                            "failed_count", "cancel_count", "avg_load_ms", "memory_count",
                            "memory_bytes", "max_memory_bytes", "disk_count", "disk_bytes",
                            "max_disk_bytes"}) {
        INFO(key);
        REQUIRE(j.contains(key));
    }
}

TEST_CASE("ThumbnailScheduler: request state names", "[scheduler]") {
    REQUIRE(std::string(request_state_name(RequestState::Placeholder)) == "placeholder");
    REQUIRE(std::string(request_state_name(RequestState::Loading)) == "loading");
    REQUIRE(std::string(request_state_name(RequestState::Loaded)) == "loaded");
    REQUIRE(std::string(request_state_name(RequestState::Error)) == "error");
}
