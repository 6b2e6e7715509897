// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_loop.h"
#include "image_bitmap.h"
#include "load_token.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file load_dispatcher.h
 * @brief Bounded-concurrency, deduplicating image loader
 *
 * LoadDispatcher turns `load(url, size)` requests into at most
 * `max_concurrent` simultaneous fetch workers:
 * - Memory hits are answered synchronously
 * - A request for a URL that already has a worker joins that worker, so each
 *   URL is fetched at most once at a time
 * - Worker launches are spaced by a minimum interval; requests that cannot
 *   start yet wait in a pending list (priority requests at the front)
 *
 * Workers run on a WorkerExecutor: disk tier first, then network. Decoded
 * results are cached only after a full successful decode and only if the
 * worker was not cancelled. Completions are posted back to the EventLoop,
 * where `loaded` is delivered once per joined target size.
 *
 * ## Threading
 * Every public method must be called on the EventLoop thread. Listeners are
 * invoked on the EventLoop thread.
 */

namespace thumbkit {

class ImageFetcher;
class TieredCache;
class WorkerExecutor;

/**
 * @brief Why a load did not produce an image
 */
enum class LoadError {
    Network,  ///< Fetch failed or timed out
    Decode,   ///< Bytes were not a decodable image
    Cancelled ///< cancel()/cancel_all() dropped the request
};

/// "network", "decode", "cancelled"
const char* load_error_name(LoadError error);

/**
 * @brief Result of LoadDispatcher::load()
 */
struct LoadOutcome {
    bool resolved_from_cache = false; ///< loaded was already delivered synchronously
};

/**
 * @brief Dispatcher counters and gauges
 */
struct DispatcherStats {
    size_t active_loads = 0;
    size_t pending_loads = 0;
    int max_concurrent = 0;
    int base_max_concurrent = 0;
    uint64_t loaded_count = 0;
    uint64_t failed_count = 0;
    uint64_t cancel_count = 0;
    double avg_load_ms = 0.0; ///< Mean latency of successful worker loads
};

struct LoadDispatcherOptions {
    static constexpr int DEFAULT_MAX_CONCURRENT = 5;
    static constexpr int64_t DEFAULT_MIN_LAUNCH_INTERVAL_MS = 30;

    int max_concurrent = DEFAULT_MAX_CONCURRENT; ///< Also the base (upper bound)
    int64_t min_launch_interval_ms = DEFAULT_MIN_LAUNCH_INTERVAL_MS;
};

class LoadDispatcher {
  public:
    using LoadedCallback = std::function<void(
        const std::string& url, const std::optional<ImageSize>& size, const ImagePtr& image)>;
    using FailedCallback =
        std::function<void(const std::string& url, LoadError reason, const std::string& message)>;

    /**
     * @param loop Owning event loop (must outlive the dispatcher)
     * @param cache Shared cache (must outlive every worker)
     * @param fetcher Network source (must outlive every worker)
     * @param executor Worker pool
     */
    LoadDispatcher(EventLoop& loop, TieredCache& cache, ImageFetcher& fetcher,
                   WorkerExecutor& executor, LoadDispatcherOptions options = {});
    ~LoadDispatcher();

    LoadDispatcher(const LoadDispatcher&) = delete;
    LoadDispatcher& operator=(const LoadDispatcher&) = delete;

    /**
     * @brief Request an image, optionally scaled to fit within `size`
     *
     * @param priority Queue at the front of the pending list if it cannot start
     * @return resolved_from_cache = true if `loaded` was delivered before return
     */
    LoadOutcome load(const std::string& url, std::optional<ImageSize> size = std::nullopt,
                     bool priority = false);

    /**
     * @brief Cancel the worker and pending requests for one URL
     *
     * Each cancelled request is reported via `failed` with LoadError::Cancelled.
     */
    void cancel(const std::string& url);

    /**
     * @brief Cancel every active worker and clear the pending list
     */
    void cancel_all();

    /**
     * @brief Change the concurrency limit, clamped to [1, base_max_concurrent]
     *
     * Raising the limit dispatches pending work immediately.
     */
    void set_max_concurrent(int n);

    [[nodiscard]] int max_concurrent() const {
        return max_concurrent_;
    }

    [[nodiscard]] int base_max_concurrent() const {
        return base_max_concurrent_;
    }

    [[nodiscard]] size_t active_count() const {
        return active_.size();
    }

    [[nodiscard]] size_t pending_count() const {
        return pending_.size();
    }

    /// True if a worker for `url` is running
    [[nodiscard]] bool is_active(const std::string& url) const;

    /// True if `url` has a running worker or a pending entry
    [[nodiscard]] bool is_loading(const std::string& url) const;

    [[nodiscard]] DispatcherStats stats() const;

    /// Register a `loaded` listener. Returns an id for remove_listener().
    uint64_t add_loaded_listener(LoadedCallback callback);

    /// Register a `failed` listener. Returns an id for remove_listener().
    uint64_t add_failed_listener(FailedCallback callback);

    void remove_listener(uint64_t id);

  private:
    struct PendingLoad {
        std::string url;
        std::optional<ImageSize> size;
    };

    struct ActiveLoad {
        LoadToken token;
        std::vector<std::optional<ImageSize>> targets; ///< targets[0] is the primary size
        TimePoint started;
    };

    /// Posted from the worker to the loop
    struct WorkerResult {
        bool ok = false;
        LoadError error = LoadError::Network;
        std::string message;
        ImagePtr base;    ///< Full decoded image
        ImagePtr primary; ///< base scaled to targets[0] (== base without a size)
        bool from_disk = false;
    };

    /// Body executed on the worker pool
    static WorkerResult run_worker(TieredCache& cache, ImageFetcher& fetcher,
                                   const std::string& url, const std::optional<ImageSize>& size,
                                   const LoadToken& token);

    /// Memory lookup (variant key, then base key with rescale). Delivers on hit.
    bool try_memory(const std::string& url, const std::optional<ImageSize>& size);

    /// Add a target size to an active worker (no duplicates)
    void join_active(ActiveLoad& active, const std::optional<ImageSize>& size);

    void spawn(const std::string& url, const std::optional<ImageSize>& size);
    void on_worker_done(const std::string& url, uint64_t worker_id, WorkerResult result);

    /// Launch pending work while capacity and throttle allow; arms the timer otherwise
    void dispatch_pending();

    [[nodiscard]] bool can_launch_now() const;
    [[nodiscard]] int64_t throttle_remaining_ms() const;

    void emit_loaded(const std::string& url, const std::optional<ImageSize>& size,
                     const ImagePtr& image);
    void emit_failed(const std::string& url, LoadError reason, const std::string& message);

    EventLoop& loop_;
    TieredCache& cache_;
    ImageFetcher& fetcher_;
    WorkerExecutor& executor_;

    const int base_max_concurrent_;
    int max_concurrent_;
    const int64_t min_launch_interval_ms_;

    std::unordered_map<std::string, ActiveLoad> active_;
    std::deque<PendingLoad> pending_;
    std::optional<TimePoint> last_launch_;
    Timer dispatch_timer_;

    std::shared_ptr<std::atomic<bool>> alive_;
    uint64_t next_worker_id_ = 1;

    // Stats
    uint64_t loaded_count_ = 0;
    uint64_t failed_count_ = 0;
    uint64_t cancel_count_ = 0;
    double sum_load_ms_ = 0.0;

    // Listeners (ordered so delivery order is registration order)
    uint64_t next_listener_id_ = 1;
    std::map<uint64_t, LoadedCallback> loaded_listeners_;
    std::map<uint64_t, FailedCallback> failed_listeners_;
};

} // namespace thumbkit
