// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "image_bitmap.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file tiered_cache.h
 * @brief Content-addressed memory + disk image cache
 *
 * TieredCache combines three stores:
 * - Memory tier: decoded bitmaps keyed by URL hash (or URL+size hash for
 *   scaled variants), bounded by a byte budget with LRU eviction
 * - Disk tier: raw downloaded bytes at `{cache_dir}/{hash}.cache`, bounded by
 *   a byte budget with mtime-based eviction
 * - Thumbnail-by-id store: pre-rendered JPEGs at `{thumbnails_dir}/{id}.jpg`,
 *   never evicted by size, removed only by clear_thumbnails()
 *
 * ## Eviction policy
 * - Memory: when a put would exceed the budget, least recently accessed
 *   entries are dropped until the total is at most 50% of the budget. A single
 *   bitmap larger than 50% of the budget is never cached.
 * - Disk: sweep_disk() deletes oldest files (by mtime) until the total is at
 *   most 80% of the budget. Reads refresh mtime.
 *
 * ## Thread safety
 * All public methods are thread-safe. The memory tier is guarded by a single
 * mutex; disk writes go through a temp file + rename so readers never observe
 * a partial entry.
 *
 * ## Failure semantics
 * Disk I/O errors are logged and reported as a miss. Nothing throws.
 *
 * ## Usage Example
 * ```cpp
 * thumbkit::TieredCacheOptions opts;
 * opts.cache_dir = "/home/user/.cache/thumbkit";
 * opts.thumbnails_dir = "/home/user/.cache/thumbkit/thumbnail";
 * thumbkit::TieredCache cache(opts);
 *
 * auto key = TieredCache::key_of(url);
 * if (auto image = cache.get_memory(key)) {
 *     show(*image);
 * } else if (auto bytes = cache.get_disk(key)) {
 *     auto decoded = thumbkit::decode_image(*bytes);
 * }
 * ```
 */

namespace thumbkit {

class EventLoop;
class Timer;

using CacheKey = std::string;

/**
 * @brief Construction parameters for TieredCache
 */
struct TieredCacheOptions {
    /// Default memory budget (200 MB)
    static constexpr size_t DEFAULT_MAX_MEMORY_BYTES = 200ull * 1024 * 1024;

    /// Default disk budget (1000 MB)
    static constexpr size_t DEFAULT_MAX_DISK_BYTES = 1000ull * 1024 * 1024;

    std::string cache_dir;      ///< Directory for `{hash}.cache` files
    std::string thumbnails_dir; ///< Directory for `{id}.jpg` thumbnails
    size_t max_memory_bytes = DEFAULT_MAX_MEMORY_BYTES;
    size_t max_disk_bytes = DEFAULT_MAX_DISK_BYTES;
};

/**
 * @brief Snapshot of cache occupancy and hit counters
 */
struct CacheTierStats {
    size_t memory_count = 0;
    size_t memory_bytes = 0;
    size_t max_memory_bytes = 0;
    size_t disk_count = 0;
    size_t disk_bytes = 0;
    size_t max_disk_bytes = 0;
    uint64_t memory_hits = 0;
    uint64_t memory_misses = 0;

    /// Memory hit rate in [0, 1]
    [[nodiscard]] double hit_rate() const {
        uint64_t total = memory_hits + memory_misses;
        return total > 0 ? static_cast<double>(memory_hits) / static_cast<double>(total) : 0.0;
    }
};

class TieredCache {
  public:
    /// Fraction of the memory budget kept after an eviction pass
    static constexpr double MEMORY_EVICT_TARGET = 0.5;

    /// Fraction of the disk budget kept after a sweep
    static constexpr double DISK_SWEEP_TARGET = 0.8;

    /// Interval of the periodic disk sweep (1 hour)
    static constexpr int64_t DISK_SWEEP_INTERVAL_MS = 60 * 60 * 1000;

    /// Smallest memory budget accepted by set_max_memory_mb()
    static constexpr size_t MIN_MEMORY_MB = 50;

    /// Smallest disk budget accepted by set_max_disk_mb()
    static constexpr size_t MIN_DISK_MB = 200;

    /// Default JPEG quality for thumbnails stored by id
    static constexpr int DEFAULT_THUMBNAIL_QUALITY = 85;

    /// Extension of raw disk entries
    static constexpr const char* CACHE_EXTENSION = ".cache";

    /// Extension of thumbnails stored by id
    static constexpr const char* THUMBNAIL_EXTENSION = ".jpg";

    using CacheClearedCallback = std::function<void()>;

    /**
     * @brief Open (and create if needed) the cache directories
     *
     * Scans the disk tier once to learn its current size.
     */
    explicit TieredCache(TieredCacheOptions options);
    ~TieredCache();

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    // =========================================================================
    // KEYS
    // =========================================================================

    /**
     * @brief Cache key of a URL (lowercase hex MD5)
     */
    [[nodiscard]] static CacheKey key_of(const std::string& url);

    /**
     * @brief Cache key of a scaled variant: MD5 of "{url}|{w}x{h}"
     */
    [[nodiscard]] static CacheKey variant_key_of(const std::string& url, const ImageSize& size);

    // =========================================================================
    // MEMORY TIER
    // =========================================================================

    /**
     * @brief Look up a decoded bitmap
     *
     * Refreshes the entry's recency and counts a hit or a miss.
     */
    [[nodiscard]] ImagePtr get_memory(const CacheKey& key);

    /**
     * @brief Look up a decoded bitmap without counting a hit or a miss
     *
     * Refreshes recency. For follow-up lookups (base fallback, dispatcher
     * re-checks) that must not skew the hit rate.
     */
    [[nodiscard]] ImagePtr peek_memory(const CacheKey& key);

    /**
     * @brief Check presence without touching recency or counters
     */
    [[nodiscard]] bool has_memory(const CacheKey& key) const;

    /**
     * @brief Store a decoded bitmap
     *
     * Evicts down to 50% of the budget when the addition would exceed it.
     * Bitmaps larger than half the budget are not cached.
     *
     * @return true if the bitmap is now cached
     */
    bool put_memory(const CacheKey& key, ImagePtr image);

    /// Drop one memory entry (no-op if absent)
    void remove_memory(const CacheKey& key);

    // =========================================================================
    // DISK TIER
    // =========================================================================

    /**
     * @brief Read raw bytes for a key
     *
     * Refreshes the file's mtime on success. An unreadable file is deleted
     * and reported as a miss.
     */
    [[nodiscard]] std::optional<std::vector<uint8_t>> get_disk(const CacheKey& key);

    /**
     * @brief Write raw bytes for a key
     *
     * Sweeps first when the write would exceed the budget, deep enough that
     * the new entry fits, and emits cache_cleared after that sweep. Entries
     * larger than the whole budget are refused.
     *
     * @return true if written
     */
    bool put_disk(const CacheKey& key, const std::vector<uint8_t>& data);

    /**
     * @brief Delete one disk entry (e.g. bytes that failed to decode)
     */
    void remove_disk(const CacheKey& key);

    /**
     * @brief Evict oldest disk entries until total <= 80% of the budget
     *
     * Deletion errors are logged and skipped. Emits cache_cleared.
     *
     * @return Number of files removed
     */
    size_t sweep_disk();

    /**
     * @brief Run sweep_disk() every hour on the given loop
     *
     * Also routes cache_cleared notifications through the loop so listeners
     * always run on the loop thread. Call from the loop thread.
     */
    void start_periodic_sweep(EventLoop& loop);

    /// Stop the periodic sweep started by start_periodic_sweep()
    void stop_periodic_sweep();

    /**
     * @brief Local path of a disk entry
     */
    [[nodiscard]] std::string disk_path(const CacheKey& key) const;

    // =========================================================================
    // THUMBNAILS BY ID
    // =========================================================================

    /**
     * @brief Local path of a thumbnail stored by id
     *
     * Path separators and other unsafe characters in the id are replaced;
     * an empty id maps to "unknown".
     */
    [[nodiscard]] std::string thumbnail_path(const std::string& image_id) const;

    /**
     * @brief Load a thumbnail stored by id
     *
     * An unreadable or undecodable file is deleted and reported as a miss.
     */
    [[nodiscard]] ImagePtr get_thumbnail_by_id(const std::string& image_id);

    /**
     * @brief Save a thumbnail as JPEG under its id
     *
     * @return true on success
     */
    bool put_thumbnail_by_id(const std::string& image_id, const Bitmap& bitmap,
                             int quality = DEFAULT_THUMBNAIL_QUALITY);

    /**
     * @brief Remove every thumbnail stored by id
     *
     * @return Number of files removed
     */
    size_t clear_thumbnails();

    // =========================================================================
    // MAINTENANCE
    // =========================================================================

    /**
     * @brief Flush the memory and disk tiers (thumbnails by id are kept)
     *
     * Emits cache_cleared.
     */
    void clear_all();

    /**
     * @brief Change the memory budget (floor 50 MB), evicting if needed
     */
    void set_max_memory_mb(size_t size_mb);

    /**
     * @brief Change the disk budget (floor 200 MB)
     */
    void set_max_disk_mb(size_t size_mb);

    /**
     * @brief Change the memory budget in bytes without a floor
     *
     * Intended for tools and tests that need small budgets.
     */
    void set_max_memory_bytes(size_t max_bytes);

    /**
     * @brief Change the disk budget in bytes without a floor
     */
    void set_max_disk_bytes(size_t max_bytes);

    [[nodiscard]] size_t memory_bytes() const;
    [[nodiscard]] size_t max_memory_bytes() const;
    [[nodiscard]] size_t disk_bytes() const;
    [[nodiscard]] size_t max_disk_bytes() const;

    /**
     * @brief Recompute the disk tier size by scanning the directory
     */
    [[nodiscard]] size_t scan_disk_bytes() const;

    [[nodiscard]] CacheTierStats stats() const;

    [[nodiscard]] const std::string& cache_dir() const {
        return options_.cache_dir;
    }

    [[nodiscard]] const std::string& thumbnails_dir() const {
        return options_.thumbnails_dir;
    }

    /**
     * @brief Register a listener for cache-cleared notifications
     *
     * @return Listener id for remove_cache_cleared_listener()
     */
    uint64_t add_cache_cleared_listener(CacheClearedCallback callback);

    void remove_cache_cleared_listener(uint64_t id);

  private:
    struct MemoryEntry {
        ImagePtr image;
        size_t bytes = 0;
        std::list<CacheKey>::iterator lru_it; ///< Position in lru_ (front = most recent)
    };

    /// Drop LRU entries until memory_bytes_ <= target. Caller holds memory_mutex_.
    void evict_memory_to(size_t target_bytes);

    /// Delete oldest entries until the total is <= target_bytes. Caller holds disk_mutex_.
    size_t sweep_disk_locked(size_t target_bytes);

    /// 80% of the current disk budget
    [[nodiscard]] size_t sweep_target_bytes() const;

    /// Recount disk_bytes_/disk_count_ from the directory. Caller holds disk_mutex_.
    void rescan_disk_locked();

    void notify_cache_cleared();

    void ensure_directories() const;

    TieredCacheOptions options_;

    // Memory tier
    mutable std::mutex memory_mutex_;
    std::unordered_map<CacheKey, MemoryEntry> memory_;
    std::list<CacheKey> lru_;
    size_t memory_bytes_ = 0;
    uint64_t memory_hits_ = 0;
    uint64_t memory_misses_ = 0;

    // Disk tier (serialises size accounting and sweeps)
    mutable std::mutex disk_mutex_;
    size_t disk_bytes_ = 0;
    size_t disk_count_ = 0;
    std::atomic<size_t> max_disk_bytes_;

    // Notifications
    mutable std::mutex listeners_mutex_;
    std::unordered_map<uint64_t, CacheClearedCallback> cleared_listeners_;
    uint64_t next_listener_id_ = 1;
    EventLoop* loop_ = nullptr;
    std::unique_ptr<Timer> sweep_timer_;
};

} // namespace thumbkit
