// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "thumbnail_scheduler.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbkit {

const char* request_state_name(RequestState state) {
    switch (state) {
    case RequestState::Placeholder:
        return "placeholder";
    case RequestState::Loading:
        return "loading";
    case RequestState::Loaded:
        return "loaded";
    case RequestState::Error:
        return "error";
    }
    return "unknown";
}

nlohmann::json SchedulerStats::to_json() const {
    nlohmann::json j;
    j["cache_hits"] = cache_hits;
    j["cache_misses"] = cache_misses;
    j["preload_hits"] = preload_hits;
    j["total_requests"] = total_requests;
    j["priority_urls"] = priority_urls;
    j["preload_queue_size"] = preload_queue_size;
    j["variant_queue_size"] = variant_queue_size;
    j["cache_hit_rate"] = cache_hit_rate;
    j["ema_hit_rate"] = ema_hit_rate;
    j["ema_avg_load_ms"] = ema_avg_load_ms;
    j["preload_delay_ms"] = preload_delay_ms;
    j["paused"] = paused;

    j["active_loads"] = dispatcher.active_loads;
    j["pending_loads"] = dispatcher.pending_loads;
    j["max_concurrent"] = dispatcher.max_concurrent;
    j["base_max_concurrent"] = dispatcher.base_max_concurrent;
    j["loaded_count"] = dispatcher.loaded_count;
    j["failed_count"] = dispatcher.failed_count;
    j["cancel_count"] = dispatcher.cancel_count;
    j["avg_load_ms"] = dispatcher.avg_load_ms;

    j["memory_count"] = cache.memory_count;
    j["memory_bytes"] = cache.memory_bytes;
    j["max_memory_bytes"] = cache.max_memory_bytes;
    j["disk_count"] = cache.disk_count;
    j["disk_bytes"] = cache.disk_bytes;
    j["max_disk_bytes"] = cache.max_disk_bytes;
    return j;
}

// ============================================================================
// Construction
// ============================================================================

ThumbnailScheduler::ThumbnailScheduler(EventLoop& loop, TieredCache& cache,
                                       LoadDispatcher& dispatcher)
    : loop_(loop), cache_(cache), dispatcher_(dispatcher),
      preload_timer_(loop, [this]() { process_preload_queue(); }),
      variant_timer_(loop, [this]() { process_variant_queue(); }),
      controller_timer_(loop, [this]() { recompute(); }) {
    dispatcher_loaded_id_ = dispatcher_.add_loaded_listener(
        [this](const std::string& url, const std::optional<ImageSize>& size,
               const ImagePtr& image) { on_dispatcher_loaded(url, size, image); });
    dispatcher_failed_id_ = dispatcher_.add_failed_listener(
        [this](const std::string& url, LoadError reason, const std::string& message) {
            on_dispatcher_failed(url, reason, message);
        });
    controller_timer_.start(CONTROLLER_INTERVAL_MS, true);
}

ThumbnailScheduler::~ThumbnailScheduler() {
    preload_timer_.stop();
    variant_timer_.stop();
    controller_timer_.stop();
    dispatcher_.remove_listener(dispatcher_loaded_id_);
    dispatcher_.remove_listener(dispatcher_failed_id_);
}

// ============================================================================
// Requests
// ============================================================================

bool ThumbnailScheduler::load_thumbnail(const std::string& url, const ImageSize& size,
                                        bool priority) {
    if (!size.is_valid()) {
        spdlog::warn("[ThumbnailScheduler] Ignoring request for {} with invalid size {}", url,
                     size.to_string());
        return false;
    }
    ++total_requests_;

    const CacheKey variant_key = TieredCache::variant_key_of(url, size);
    if (ImagePtr image = cache_.get_memory(variant_key)) {
        ++cache_hits_;
        set_state(url, size, RequestState::Loaded);
        emit_loaded(url, size, image);
        recompute();
        return true;
    }

    if (ImagePtr base = cache_.peek_memory(TieredCache::key_of(url))) {
        ImagePtr scaled = scale_to_fit(base, size);
        if (scaled) {
            cache_.put_memory(variant_key, scaled);
            ++cache_hits_;
            set_state(url, size, RequestState::Loaded);
            emit_loaded(url, size, scaled);
            recompute();
            return true;
        }
    }

    ++cache_misses_;
    if (priority) {
        priority_urls_.insert(url);
    }
    set_state(url, size, RequestState::Loading);
    dispatcher_.load(url, size, priority);
    recompute();
    return false;
}

void ThumbnailScheduler::preload_thumbnails(const std::vector<std::string>& urls,
                                            const ImageSize& size) {
    if (!size.is_valid()) {
        spdlog::warn("[ThumbnailScheduler] Ignoring preload of {} urls with invalid size {}",
                     urls.size(), size.to_string());
        return;
    }
    size_t to_variant = 0;
    size_t to_preload = 0;

    for (const auto& url : urls) {
        if (cache_.has_memory(TieredCache::variant_key_of(url, size))) {
            continue;
        }
        QueueItem item{url, size};
        if (cache_.has_memory(TieredCache::key_of(url))) {
            if (!contains(variant_queue_, item)) {
                variant_queue_.push_back(std::move(item));
                ++to_variant;
            }
        } else if (!contains(preload_queue_, item)) {
            preload_queue_.push_back(std::move(item));
            ++to_preload;
        }
    }

    spdlog::debug("[ThumbnailScheduler] Preload {} urls @{}: {} to variant queue, {} to preload "
                  "queue",
                  urls.size(), size.to_string(), to_variant, to_preload);

    if (!preload_queue_.empty() && !preload_timer_.is_active() && !paused_) {
        preload_timer_.start(preload_delay_ms_);
    }
    if (!variant_queue_.empty() && !variant_timer_.is_active()) {
        variant_timer_.start(VARIANT_DELAY_MS);
    }
}

bool ThumbnailScheduler::contains(const std::deque<QueueItem>& queue, const QueueItem& item) {
    return std::find(queue.begin(), queue.end(), item) != queue.end();
}

// ============================================================================
// Queue ticks
// ============================================================================

void ThumbnailScheduler::process_preload_queue() {
    if (paused_ || preload_queue_.empty()) {
        return;
    }

    DispatcherStats load_stats = dispatcher_.stats();
    const int active = static_cast<int>(load_stats.active_loads);
    const int pending = static_cast<int>(load_stats.pending_loads);

    // Dispatcher already has a backlog; try again later
    if (pending > std::max(2, active * 2)) {
        spdlog::trace("[ThumbnailScheduler] Preload tick skipped (pending={}, active={})", pending,
                      active);
        preload_timer_.start(preload_delay_ms_);
        return;
    }

    const int available = std::max(load_stats.max_concurrent - active, 0);
    const double reserve_ratio = (ema_hit_rate_ < 0.4 || ema_avg_ms_ > 600.0)
                                     ? RESERVE_RATIO_HIGH
                                     : RESERVE_RATIO_LOW;
    const int reserved = std::max(1, static_cast<int>(available * reserve_ratio));
    const int preload_slots = available - reserved;

    int submitted = 0;
    while (!preload_queue_.empty() && submitted < preload_slots) {
        QueueItem item = std::move(preload_queue_.front());
        preload_queue_.pop_front();

        // May have been loaded while waiting
        if (cache_.has_memory(TieredCache::variant_key_of(item.first, item.second))) {
            continue;
        }

        set_state(item.first, item.second, RequestState::Loading);
        LoadOutcome outcome = dispatcher_.load(item.first, item.second, false);
        if (!outcome.resolved_from_cache) {
            ++submitted;
        }
    }

    spdlog::trace("[ThumbnailScheduler] Preload tick: {} submitted ({} free, {} reserved), {} "
                  "queued",
                  submitted, available, reserved, preload_queue_.size());

    if (load_stats.pending_loads > 10 || ema_avg_ms_ > 700.0) {
        preload_delay_ms_ =
            std::min(MAX_PRELOAD_DELAY_MS, preload_delay_ms_ + PRELOAD_DELAY_STEP_UP_MS);
    } else {
        preload_delay_ms_ =
            std::max(MIN_PRELOAD_DELAY_MS, preload_delay_ms_ - PRELOAD_DELAY_STEP_DOWN_MS);
    }

    if (!preload_queue_.empty()) {
        preload_timer_.start(preload_delay_ms_);
    }
}

void ThumbnailScheduler::process_variant_queue() {
    size_t processed = 0;
    size_t requeued = 0;

    while (!variant_queue_.empty() && processed < VARIANT_BATCH_SIZE) {
        QueueItem item = std::move(variant_queue_.front());
        variant_queue_.pop_front();
        const std::string& url = item.first;
        const ImageSize& size = item.second;

        const CacheKey variant_key = TieredCache::variant_key_of(url, size);
        if (cache_.has_memory(variant_key)) {
            continue;
        }

        ImagePtr base = cache_.peek_memory(TieredCache::key_of(url));
        ImagePtr scaled = base ? scale_to_fit(base, size) : nullptr;
        if (!scaled) {
            // Base evicted since it was queued: fall back to a network preload
            if (!contains(preload_queue_, item)) {
                preload_queue_.push_back(std::move(item));
                ++requeued;
            }
            continue;
        }

        cache_.put_memory(variant_key, scaled);
        set_state(url, size, RequestState::Loaded);
        emit_loaded(url, size, scaled);
        ++processed;
    }

    if (requeued > 0) {
        spdlog::debug("[ThumbnailScheduler] {} variant items lost their base, moved to preload",
                      requeued);
        if (!preload_timer_.is_active() && !paused_) {
            preload_timer_.start(preload_delay_ms_);
        }
    }

    recompute();
    if (!variant_queue_.empty()) {
        variant_timer_.start(VARIANT_DELAY_MS);
    }
}

// ============================================================================
// Dispatcher events
// ============================================================================

void ThumbnailScheduler::on_dispatcher_loaded(const std::string& url,
                                              const std::optional<ImageSize>& size,
                                              const ImagePtr& image) {
    if (priority_urls_.erase(url) == 0) {
        ++preload_hits_;
    }

    ImageSize reported = size ? *size : image->size();
    set_state(url, reported, RequestState::Loaded);
    emit_loaded(url, reported, image);
    recompute();
}

void ThumbnailScheduler::on_dispatcher_failed(const std::string& url, LoadError reason,
                                              const std::string& message) {
    priority_urls_.erase(url);

    std::vector<RequestKey> failed;
    for (const auto& entry : states_) {
        if (entry.first.first == url && entry.second == RequestState::Loading) {
            failed.push_back(entry.first);
        }
    }
    for (const auto& key : failed) {
        set_state(key, RequestState::Error);
    }

    auto listeners = failed_listeners_;
    for (const auto& listener : listeners) {
        listener.second(url, reason, message);
    }
    recompute();
}

// ============================================================================
// Controller
// ============================================================================

void ThumbnailScheduler::recompute() {
    SchedulerStats stats = cache_stats();

    ema_hit_rate_ = EMA_ALPHA * stats.cache_hit_rate + (1.0 - EMA_ALPHA) * ema_hit_rate_;
    ema_avg_ms_ = EMA_ALPHA * stats.dispatcher.avg_load_ms + (1.0 - EMA_ALPHA) * ema_avg_ms_;
    stats.ema_hit_rate = ema_hit_rate_;
    stats.ema_avg_load_ms = ema_avg_ms_;

    auto listeners = stats_listeners_;
    for (const auto& listener : listeners) {
        listener.second(stats);
    }

    adjust_concurrency(stats);
}

void ThumbnailScheduler::adjust_concurrency(const SchedulerStats& stats) {
    const TimePoint now = loop_.now();
    if (last_adjust_ && elapsed_ms(*last_adjust_, now) < CONTROLLER_INTERVAL_MS) {
        return;
    }
    last_adjust_ = now;

    const int active = static_cast<int>(stats.dispatcher.active_loads);
    const int pending = static_cast<int>(stats.dispatcher.pending_loads);
    const int current = stats.dispatcher.max_concurrent;
    const int base = stats.dispatcher.base_max_concurrent;

    int target = current;
    if (pending > 2 * std::max(active, 1)) {
        target = std::max(std::min(2, base), current - 1);
    } else if (ema_hit_rate_ > 0.7 && current < base) {
        target = current + 1;
    }

    if (target != current) {
        spdlog::debug("[ThumbnailScheduler] max_concurrent {} -> {} (active={}, pending={}, "
                      "ema_hit={:.2f})",
                      current, target, active, pending, ema_hit_rate_);
        dispatcher_.set_max_concurrent(target);
    }
}

// ============================================================================
// Control
// ============================================================================

void ThumbnailScheduler::set_paused(bool paused) {
    if (paused_ == paused) {
        return;
    }
    paused_ = paused;
    spdlog::debug("[ThumbnailScheduler] Preload {}", paused ? "paused" : "resumed");

    if (paused_) {
        preload_timer_.stop();
    } else if (!preload_queue_.empty() && !preload_timer_.is_active()) {
        preload_timer_.start(preload_delay_ms_);
    }
}

void ThumbnailScheduler::clear_preload_queue() {
    preload_queue_.clear();
    variant_queue_.clear();
    preload_timer_.stop();
    variant_timer_.stop();
}

void ThumbnailScheduler::cancel_all_loads() {
    dispatcher_.cancel_all();
    clear_preload_queue();
    priority_urls_.clear();
}

void ThumbnailScheduler::cleanup() {
    cancel_all_loads();
    controller_timer_.stop();
    states_.clear();
    finished_order_.clear();
    spdlog::debug("[ThumbnailScheduler] Cleaned up");
}

// ============================================================================
// State and stats
// ============================================================================

void ThumbnailScheduler::set_state(const std::string& url, const ImageSize& size,
                                   RequestState state) {
    set_state(RequestKey{url, size.to_string()}, state);
}

void ThumbnailScheduler::set_state(const RequestKey& key, RequestState state) {
    states_[key] = state;
    if (state != RequestState::Loaded && state != RequestState::Error) {
        return;
    }

    // Finished requests are only remembered for the most recent ones
    finished_order_.erase(std::remove(finished_order_.begin(), finished_order_.end(), key),
                          finished_order_.end());
    finished_order_.push_back(key);
    while (finished_order_.size() > MAX_FINISHED_STATES) {
        auto it = states_.find(finished_order_.front());
        finished_order_.pop_front();
        if (it != states_.end() && it->second != RequestState::Loading) {
            states_.erase(it);
        }
    }
}

RequestState ThumbnailScheduler::request_state(const std::string& url,
                                               const ImageSize& size) const {
    auto it = states_.find(RequestKey{url, size.to_string()});
    return it == states_.end() ? RequestState::Placeholder : it->second;
}

SchedulerStats ThumbnailScheduler::cache_stats() const {
    SchedulerStats s;
    s.cache_hits = cache_hits_;
    s.cache_misses = cache_misses_;
    s.preload_hits = preload_hits_;
    s.total_requests = total_requests_;
    s.priority_urls = priority_urls_.size();
    s.preload_queue_size = preload_queue_.size();
    s.variant_queue_size = variant_queue_.size();
    s.cache_hit_rate = static_cast<double>(cache_hits_) /
                       static_cast<double>(std::max<uint64_t>(1, total_requests_));
    s.ema_hit_rate = ema_hit_rate_;
    s.ema_avg_load_ms = ema_avg_ms_;
    s.preload_delay_ms = preload_delay_ms_;
    s.paused = paused_;
    s.dispatcher = dispatcher_.stats();
    s.cache = cache_.stats();
    return s;
}

// ============================================================================
// Listeners
// ============================================================================

uint64_t ThumbnailScheduler::add_loaded_listener(LoadedCallback callback) {
    uint64_t id = next_listener_id_++;
    loaded_listeners_[id] = std::move(callback);
    return id;
}

uint64_t ThumbnailScheduler::add_failed_listener(FailedCallback callback) {
    uint64_t id = next_listener_id_++;
    failed_listeners_[id] = std::move(callback);
    return id;
}

uint64_t ThumbnailScheduler::add_stats_listener(StatsCallback callback) {
    uint64_t id = next_listener_id_++;
    stats_listeners_[id] = std::move(callback);
    return id;
}

void ThumbnailScheduler::remove_listener(uint64_t id) {
    loaded_listeners_.erase(id);
    failed_listeners_.erase(id);
    stats_listeners_.erase(id);
}

void ThumbnailScheduler::emit_loaded(const std::string& url, const ImageSize& size,
                                     const ImagePtr& image) {
    auto listeners = loaded_listeners_;
    for (const auto& listener : listeners) {
        listener.second(url, size, image);
    }
}

} // namespace thumbkit
