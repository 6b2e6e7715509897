// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "load_dispatcher.h"

#include "image_fetcher.h"
#include "tiered_cache.h"
#include "worker_executor.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbkit {

const char* load_error_name(LoadError error) {
    switch (error) {
    case LoadError::Network:
        return "network";
    case LoadError::Decode:
        return "decode";
    case LoadError::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

namespace {

std::string describe(const std::string& url, const std::optional<ImageSize>& size) {
    return size ? url + " @" + size->to_string() : url;
}

CacheKey memory_key(const std::string& url, const std::optional<ImageSize>& size) {
    return size ? TieredCache::variant_key_of(url, *size) : TieredCache::key_of(url);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

LoadDispatcher::LoadDispatcher(EventLoop& loop, TieredCache& cache, ImageFetcher& fetcher,
                               WorkerExecutor& executor, LoadDispatcherOptions options)
    : loop_(loop), cache_(cache), fetcher_(fetcher), executor_(executor),
      base_max_concurrent_(std::max(options.max_concurrent, 1)),
      max_concurrent_(base_max_concurrent_),
      min_launch_interval_ms_(std::max<int64_t>(options.min_launch_interval_ms, 0)),
      dispatch_timer_(loop, [this]() { dispatch_pending(); }),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    spdlog::debug("[LoadDispatcher] max_concurrent={} min_launch_interval={}ms",
                  base_max_concurrent_, min_launch_interval_ms_);
}

LoadDispatcher::~LoadDispatcher() {
    alive_->store(false);
    dispatch_timer_.stop();
    for (auto& entry : active_) {
        entry.second.token.cancel();
    }
}

// ============================================================================
// Requests
// ============================================================================

LoadOutcome LoadDispatcher::load(const std::string& url, std::optional<ImageSize> size,
                                 bool priority) {
    LoadOutcome outcome;
    if (size && !size->is_valid()) {
        size.reset();
    }

    if (try_memory(url, size)) {
        outcome.resolved_from_cache = true;
        return outcome;
    }

    auto active = active_.find(url);
    if (active != active_.end()) {
        join_active(active->second, size);
        return outcome;
    }

    if (static_cast<int>(active_.size()) < max_concurrent_ && can_launch_now()) {
        spawn(url, size);
        return outcome;
    }

    if (priority) {
        pending_.push_front({url, size});
    } else {
        pending_.push_back({url, size});
    }
    spdlog::trace("[LoadDispatcher] Queued {} (pending={}, priority={})", describe(url, size),
                  pending_.size(), priority);

    if (!dispatch_timer_.is_active()) {
        dispatch_timer_.start(std::max<int64_t>(throttle_remaining_ms(), 1));
    }
    return outcome;
}

bool LoadDispatcher::try_memory(const std::string& url, const std::optional<ImageSize>& size) {
    // Hit/miss counters belong to the caller-facing lookup (ThumbnailScheduler)
    if (size) {
        const CacheKey variant_key = TieredCache::variant_key_of(url, *size);
        if (ImagePtr image = cache_.peek_memory(variant_key)) {
            emit_loaded(url, size, image);
            return true;
        }
    }

    ImagePtr base = cache_.peek_memory(TieredCache::key_of(url));
    if (!base) {
        return false;
    }

    if (size && base->size() != *size) {
        ImagePtr scaled = scale_to_fit(base, *size);
        if (!scaled) {
            return false;
        }
        cache_.put_memory(TieredCache::variant_key_of(url, *size), scaled);
        emit_loaded(url, size, scaled);
        return true;
    }

    emit_loaded(url, size, base);
    return true;
}

void LoadDispatcher::join_active(ActiveLoad& active, const std::optional<ImageSize>& size) {
    if (std::find(active.targets.begin(), active.targets.end(), size) == active.targets.end()) {
        active.targets.push_back(size);
        spdlog::trace("[LoadDispatcher] Joined in-flight load ({} targets)",
                      active.targets.size());
    }
}

bool LoadDispatcher::is_active(const std::string& url) const {
    return active_.count(url) > 0;
}

bool LoadDispatcher::is_loading(const std::string& url) const {
    if (is_active(url)) {
        return true;
    }
    return std::any_of(pending_.begin(), pending_.end(),
                       [&url](const PendingLoad& p) { return p.url == url; });
}

// ============================================================================
// Dispatch
// ============================================================================

bool LoadDispatcher::can_launch_now() const {
    return throttle_remaining_ms() <= 0;
}

int64_t LoadDispatcher::throttle_remaining_ms() const {
    if (!last_launch_) {
        return 0;
    }
    int64_t elapsed = elapsed_ms(*last_launch_, loop_.now());
    return min_launch_interval_ms_ - elapsed;
}

void LoadDispatcher::dispatch_pending() {
    while (!pending_.empty() && static_cast<int>(active_.size()) < max_concurrent_) {
        // Requests for a URL that started meanwhile just join it
        auto active = active_.find(pending_.front().url);
        if (active != active_.end()) {
            join_active(active->second, pending_.front().size);
            pending_.pop_front();
            continue;
        }

        if (!can_launch_now()) {
            dispatch_timer_.start(std::max<int64_t>(throttle_remaining_ms(), 1));
            return;
        }

        PendingLoad next = std::move(pending_.front());
        pending_.pop_front();
        spawn(next.url, next.size);
    }
}

void LoadDispatcher::spawn(const std::string& url, const std::optional<ImageSize>& size) {
    ActiveLoad load;
    load.token = LoadToken::create(alive_, next_worker_id_++);
    load.targets.push_back(size);
    load.started = loop_.now();
    last_launch_ = load.started;

    const LoadToken token = load.token;
    active_[url] = std::move(load);

    spdlog::debug("[LoadDispatcher] Starting worker #{} for {} (active={}/{})", token.worker_id,
                  describe(url, size), active_.size(), max_concurrent_);

    EventLoop* loop = &loop_;
    TieredCache* cache = &cache_;
    ImageFetcher* fetcher = &fetcher_;
    bool submitted = executor_.submit([this, loop, cache, fetcher, url, size, token]() {
        WorkerResult result = run_worker(*cache, *fetcher, url, size, token);
        if (!token.owner_alive()) {
            return;
        }
        loop->post([this, url, token, result = std::move(result)]() mutable {
            if (!token.owner_alive()) {
                return;
            }
            on_worker_done(url, token.worker_id, std::move(result));
        });
    });

    if (!submitted) {
        spdlog::warn("[LoadDispatcher] Executor rejected worker for {}", url);
        WorkerResult result;
        result.error = LoadError::Network;
        result.message = "Worker pool unavailable";
        auto alive = alive_;
        uint64_t worker_id = token.worker_id;
        loop_.post([this, alive, url, worker_id, result = std::move(result)]() mutable {
            if (alive->load()) {
                on_worker_done(url, worker_id, std::move(result));
            }
        });
    }
}

// ============================================================================
// Worker body
// ============================================================================

LoadDispatcher::WorkerResult LoadDispatcher::run_worker(TieredCache& cache, ImageFetcher& fetcher,
                                                        const std::string& url,
                                                        const std::optional<ImageSize>& size,
                                                        const LoadToken& token) {
    WorkerResult result;
    const CacheKey base_key = TieredCache::key_of(url);

    // Disk tier first
    if (auto bytes = cache.get_disk(base_key)) {
        DecodeResult decoded = decode_image(*bytes);
        if (decoded.image) {
            result.base = decoded.image;
            result.from_disk = true;
        } else {
            spdlog::warn("[LoadDispatcher] Discarding undecodable disk entry for {}: {}", url,
                         decoded.error);
            cache.remove_disk(base_key);
        }
    }

    std::vector<uint8_t> downloaded;
    if (!result.base) {
        if (token.is_cancelled()) {
            result.error = LoadError::Cancelled;
            result.message = "Cancelled";
            return result;
        }

        FetchResult fetched = fetcher.fetch(url);
        if (!fetched.ok) {
            result.error = LoadError::Network;
            result.message = fetched.error.empty() ? "Fetch failed" : fetched.error;
            return result;
        }

        DecodeResult decoded = decode_image(fetched.data);
        if (!decoded.image) {
            result.error = LoadError::Decode;
            result.message = decoded.error;
            return result;
        }
        result.base = decoded.image;
        downloaded = std::move(fetched.data);
    }

    result.primary = size ? scale_to_fit(result.base, *size) : result.base;
    if (!result.primary) {
        result.error = LoadError::Decode;
        result.message = "Failed to scale image to " + size->to_string();
        result.base.reset();
        return result;
    }

    if (token.is_cancelled()) {
        result.error = LoadError::Cancelled;
        result.message = "Cancelled";
        result.base.reset();
        result.primary.reset();
        return result;
    }

    if (!downloaded.empty()) {
        cache.put_disk(base_key, downloaded);
    }
    cache.put_memory(memory_key(url, size), result.primary);

    result.ok = true;
    return result;
}

// ============================================================================
// Completion
// ============================================================================

void LoadDispatcher::on_worker_done(const std::string& url, uint64_t worker_id,
                                    WorkerResult result) {
    auto it = active_.find(url);
    if (it == active_.end() || it->second.token.worker_id != worker_id) {
        // Cancelled worker finishing late; its requests were already reported
        spdlog::trace("[LoadDispatcher] Dropping stale result of worker #{} for {}", worker_id,
                      url);
        dispatch_pending();
        return;
    }

    ActiveLoad load = std::move(it->second);
    active_.erase(it);

    if (result.ok) {
        const int64_t latency = elapsed_ms(load.started, loop_.now());
        ++loaded_count_;
        sum_load_ms_ += static_cast<double>(latency);
        spdlog::debug("[LoadDispatcher] Loaded {} in {}ms ({}, {} targets)", url, latency,
                      result.from_disk ? "disk" : "network", load.targets.size());

        for (size_t i = 0; i < load.targets.size(); ++i) {
            const auto& target = load.targets[i];
            ImagePtr image = result.primary;
            if (i > 0 && target != load.targets[0]) {
                image = target ? scale_to_fit(result.base, *target) : result.base;
                if (!image) {
                    emit_failed(url, LoadError::Decode,
                                "Failed to scale image to " + target->to_string());
                    continue;
                }
                cache_.put_memory(memory_key(url, target), image);
            }
            emit_loaded(url, target, image);
        }
    } else {
        ++failed_count_;
        spdlog::warn("[LoadDispatcher] Failed to load {} ({}): {}", url,
                     load_error_name(result.error), result.message);
        emit_failed(url, result.error, result.message);
    }

    dispatch_pending();
}

// ============================================================================
// Cancellation and limits
// ============================================================================

void LoadDispatcher::cancel(const std::string& url) {
    size_t cancelled = 0;

    auto it = active_.find(url);
    if (it != active_.end()) {
        ActiveLoad load = std::move(it->second);
        active_.erase(it);
        load.token.cancel();
        cancelled += load.targets.size();
    }

    auto removed = std::remove_if(pending_.begin(), pending_.end(),
                                  [&url](const PendingLoad& p) { return p.url == url; });
    cancelled += static_cast<size_t>(std::distance(removed, pending_.end()));
    pending_.erase(removed, pending_.end());

    if (cancelled == 0) {
        return;
    }

    cancel_count_ += cancelled;
    spdlog::debug("[LoadDispatcher] Cancelled {} request(s) for {}", cancelled, url);
    for (size_t i = 0; i < cancelled; ++i) {
        emit_failed(url, LoadError::Cancelled, "Cancelled");
    }
    dispatch_pending();
}

void LoadDispatcher::cancel_all() {
    std::vector<std::string> cancelled_urls;

    for (auto& entry : active_) {
        entry.second.token.cancel();
        for (size_t i = 0; i < entry.second.targets.size(); ++i) {
            cancelled_urls.push_back(entry.first);
        }
    }
    active_.clear();

    for (const auto& pending : pending_) {
        cancelled_urls.push_back(pending.url);
    }
    pending_.clear();
    dispatch_timer_.stop();

    if (cancelled_urls.empty()) {
        return;
    }

    cancel_count_ += cancelled_urls.size();
    spdlog::info("[LoadDispatcher] Cancelled all loads ({} requests)", cancelled_urls.size());
    for (const auto& url : cancelled_urls) {
        emit_failed(url, LoadError::Cancelled, "Cancelled");
    }
}

void LoadDispatcher::set_max_concurrent(int n) {
    int clamped = std::clamp(n, 1, base_max_concurrent_);
    if (clamped == max_concurrent_) {
        return;
    }
    spdlog::debug("[LoadDispatcher] max_concurrent {} -> {}", max_concurrent_, clamped);
    bool raised = clamped > max_concurrent_;
    max_concurrent_ = clamped;
    if (raised) {
        dispatch_pending();
    }
}

DispatcherStats LoadDispatcher::stats() const {
    DispatcherStats s;
    s.active_loads = active_.size();
    s.pending_loads = pending_.size();
    s.max_concurrent = max_concurrent_;
    s.base_max_concurrent = base_max_concurrent_;
    s.loaded_count = loaded_count_;
    s.failed_count = failed_count_;
    s.cancel_count = cancel_count_;
    s.avg_load_ms = loaded_count_ > 0 ? sum_load_ms_ / static_cast<double>(loaded_count_) : 0.0;
    return s;
}

// ============================================================================
// Listeners
// ============================================================================

uint64_t LoadDispatcher::add_loaded_listener(LoadedCallback callback) {
    uint64_t id = next_listener_id_++;
    loaded_listeners_[id] = std::move(callback);
    return id;
}

uint64_t LoadDispatcher::add_failed_listener(FailedCallback callback) {
    uint64_t id = next_listener_id_++;
    failed_listeners_[id] = std::move(callback);
    return id;
}

void LoadDispatcher::remove_listener(uint64_t id) {
    loaded_listeners_.erase(id);
    failed_listeners_.erase(id);
}

void LoadDispatcher::emit_loaded(const std::string& url, const std::optional<ImageSize>& size,
                                 const ImagePtr& image) {
    // Copy: listeners may register or remove listeners while being called
    auto listeners = loaded_listeners_;
    for (const auto& entry : listeners) {
        entry.second(url, size, image);
    }
}

void LoadDispatcher::emit_failed(const std::string& url, LoadError reason,
                                 const std::string& message) {
    auto listeners = failed_listeners_;
    for (const auto& entry : listeners) {
        entry.second(url, reason, message);
    }
}

} // namespace thumbkit
