// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_loop.h"
#include "image_bitmap.h"
#include "load_dispatcher.h"
#include "tiered_cache.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "hv/json.hpp"

/**
 * @file thumbnail_scheduler.h
 * @brief Priority vs background thumbnail loading with adaptive concurrency
 *
 * ThumbnailScheduler sits on top of LoadDispatcher and decides *when* work
 * reaches it:
 * - load_thumbnail(): on-screen requests, answered from memory when possible,
 *   otherwise sent straight to the dispatcher
 * - preload_thumbnails(): background requests, split into a rescale-only
 *   variant queue (base already in memory) and a network preload queue
 *
 * The preload tick leaves a share of the dispatcher's free slots unused so
 * on-screen requests always find capacity. A controller keeps exponential
 * moving averages of the hit rate and the load latency and nudges the
 * dispatcher's concurrency limit by one step at a time.
 *
 * ## Threading
 * Loop-thread only, like LoadDispatcher.
 *
 * ## Usage Example
 * ```cpp
 * ThumbnailScheduler scheduler(loop, cache, dispatcher);
 * scheduler.add_loaded_listener([](const std::string& url, const ImageSize& size,
 *                                  const ImagePtr& image) { show(url, image); });
 * if (!scheduler.load_thumbnail(url, {200, 200}, true)) {
 *     show_placeholder(url);
 * }
 * scheduler.preload_thumbnails(next_page_urls, {200, 200});
 * ```
 */

namespace thumbkit {

/**
 * @brief Lifecycle of one (url, size) request
 *
 * A cache hit goes straight from Placeholder to Loaded.
 */
enum class RequestState { Placeholder, Loading, Loaded, Error };

const char* request_state_name(RequestState state);

/**
 * @brief Combined scheduler, dispatcher and cache statistics
 */
struct SchedulerStats {
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t preload_hits = 0; ///< Worker completions not requested as priority
    uint64_t total_requests = 0;
    size_t priority_urls = 0;
    size_t preload_queue_size = 0;
    size_t variant_queue_size = 0;
    double cache_hit_rate = 0.0; ///< cache_hits / max(1, total_requests)
    double ema_hit_rate = 0.0;
    double ema_avg_load_ms = 0.0;
    int64_t preload_delay_ms = 0;
    bool paused = false;

    DispatcherStats dispatcher;
    CacheTierStats cache;

    /// Flat JSON object with every field (dispatcher and cache fields inlined)
    [[nodiscard]] nlohmann::json to_json() const;
};

class ThumbnailScheduler {
  public:
    // Preload tick timing
    static constexpr int64_t INITIAL_PRELOAD_DELAY_MS = 500;
    static constexpr int64_t MIN_PRELOAD_DELAY_MS = 250;
    static constexpr int64_t MAX_PRELOAD_DELAY_MS = 1400;
    static constexpr int64_t PRELOAD_DELAY_STEP_UP_MS = 200;
    static constexpr int64_t PRELOAD_DELAY_STEP_DOWN_MS = 100;

    // Variant tick
    static constexpr int64_t VARIANT_DELAY_MS = 200;
    static constexpr size_t VARIANT_BATCH_SIZE = 4;

    // Controller
    static constexpr int64_t CONTROLLER_INTERVAL_MS = 500;
    static constexpr double EMA_ALPHA = 0.2;

    // Slot reservation for on-screen requests
    static constexpr double RESERVE_RATIO_LOW = 0.3;
    static constexpr double RESERVE_RATIO_HIGH = 0.5;

    /// Loaded/Error request states kept for request_state(); older ones revert to Placeholder
    static constexpr size_t MAX_FINISHED_STATES = 512;

    using LoadedCallback = std::function<void(const std::string& url, const ImageSize& size,
                                              const ImagePtr& image)>;
    using FailedCallback = std::function<void(const std::string& url, LoadError reason,
                                              const std::string& message)>;
    using StatsCallback = std::function<void(const SchedulerStats& stats)>;

    /**
     * @brief Attach to a dispatcher
     *
     * Starts the controller timer. All three references must outlive the
     * scheduler.
     */
    ThumbnailScheduler(EventLoop& loop, TieredCache& cache, LoadDispatcher& dispatcher);
    ~ThumbnailScheduler();

    ThumbnailScheduler(const ThumbnailScheduler&) = delete;
    ThumbnailScheduler& operator=(const ThumbnailScheduler&) = delete;

    /**
     * @brief Request a thumbnail for display
     *
     * A size with a non-positive dimension is rejected: nothing is counted,
     * queued or reported.
     *
     * @param priority Mark as on-screen (not counted as a preload hit)
     * @return true if `loaded` was delivered synchronously from memory
     */
    bool load_thumbnail(const std::string& url, const ImageSize& size, bool priority = false);

    /**
     * @brief Queue background loading of a list of thumbnails
     *
     * Already-cached variants are skipped. URLs whose base image is in memory
     * go to the variant queue (rescale only); the rest go to the preload queue.
     * An invalid size is rejected as in load_thumbnail().
     */
    void preload_thumbnails(const std::vector<std::string>& urls, const ImageSize& size);

    /**
     * @brief Suspend or resume preload ticks
     *
     * Priority loads and variant ticks are unaffected.
     */
    void set_paused(bool paused);

    [[nodiscard]] bool is_paused() const {
        return paused_;
    }

    /// Drop queued preload and variant work and stop their timers
    void clear_preload_queue();

    /// clear_preload_queue() plus cancel every dispatcher load
    void cancel_all_loads();

    /// cancel_all_loads() plus stop every timer; call before shutdown
    void cleanup();

    /**
     * @brief Current state of a logical request
     *
     * Unknown requests are Placeholder, as are finished requests that fell
     * out of the most recent MAX_FINISHED_STATES.
     */
    [[nodiscard]] RequestState request_state(const std::string& url,
                                             const ImageSize& size) const;

    /// Number of requests whose state is remembered
    [[nodiscard]] size_t tracked_request_count() const {
        return states_.size();
    }

    [[nodiscard]] SchedulerStats cache_stats() const;

    [[nodiscard]] size_t preload_queue_size() const {
        return preload_queue_.size();
    }

    [[nodiscard]] size_t variant_queue_size() const {
        return variant_queue_.size();
    }

    [[nodiscard]] int64_t preload_delay_ms() const {
        return preload_delay_ms_;
    }

    [[nodiscard]] double ema_hit_rate() const {
        return ema_hit_rate_;
    }

    [[nodiscard]] double ema_avg_load_ms() const {
        return ema_avg_ms_;
    }

    /**
     * @brief Update EMAs, emit stats_updated and maybe adjust concurrency
     *
     * Runs on every request and completion and on the controller timer.
     */
    void recompute();

    uint64_t add_loaded_listener(LoadedCallback callback);
    uint64_t add_failed_listener(FailedCallback callback);
    uint64_t add_stats_listener(StatsCallback callback);
    void remove_listener(uint64_t id);

  private:
    using QueueItem = std::pair<std::string, ImageSize>;
    using RequestKey = std::pair<std::string, std::string>; ///< (url, "WxH")

    void process_preload_queue();
    void process_variant_queue();
    void adjust_concurrency(const SchedulerStats& stats);

    void on_dispatcher_loaded(const std::string& url, const std::optional<ImageSize>& size,
                              const ImagePtr& image);
    void on_dispatcher_failed(const std::string& url, LoadError reason,
                              const std::string& message);

    void set_state(const std::string& url, const ImageSize& size, RequestState state);
    void set_state(const RequestKey& key, RequestState state);

    void emit_loaded(const std::string& url, const ImageSize& size, const ImagePtr& image);

    static bool contains(const std::deque<QueueItem>& queue, const QueueItem& item);

    EventLoop& loop_;
    TieredCache& cache_;
    LoadDispatcher& dispatcher_;

    std::deque<QueueItem> preload_queue_;
    std::deque<QueueItem> variant_queue_;
    Timer preload_timer_;
    Timer variant_timer_;
    Timer controller_timer_;
    int64_t preload_delay_ms_ = INITIAL_PRELOAD_DELAY_MS;
    bool paused_ = false;

    std::set<std::string> priority_urls_;
    std::map<RequestKey, RequestState> states_;
    std::deque<RequestKey> finished_order_;

    uint64_t cache_hits_ = 0;
    uint64_t cache_misses_ = 0;
    uint64_t preload_hits_ = 0;
    uint64_t total_requests_ = 0;

    double ema_hit_rate_ = 0.0;
    double ema_avg_ms_ = 0.0;
    std::optional<TimePoint> last_adjust_;

    uint64_t dispatcher_loaded_id_ = 0;
    uint64_t dispatcher_failed_id_ = 0;

    uint64_t next_listener_id_ = 1;
    std::map<uint64_t, LoadedCallback> loaded_listeners_;
    std::map<uint64_t, FailedCallback> failed_listeners_;
    std::map<uint64_t, StatsCallback> stats_listeners_;
};

} // namespace thumbkit
