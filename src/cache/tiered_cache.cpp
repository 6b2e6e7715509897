// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tiered_cache.h"

#include "event_loop.h"

#include <hv/md5.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace thumbkit {

namespace {

std::string md5_hex(const std::string& input) {
    char hex[33] = {0};
    hv_md5_hex(reinterpret_cast<unsigned char*>(const_cast<char*>(input.data())),
               static_cast<unsigned int>(input.size()), hex, sizeof(hex));
    return std::string(hex);
}

bool read_file(const fs::path& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

// Write to a sibling temp file, then rename over the target. Readers either
// see the old entry, no entry, or the complete new one.
bool write_file_atomic(const fs::path& path, const std::vector<uint8_t>& data) {
    static std::atomic<uint64_t> temp_counter{0};
    fs::path temp = path;
    temp += ".tmp" + std::to_string(temp_counter.fetch_add(1));

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.good()) {
            spdlog::warn("[TieredCache] Cannot open {} for writing", temp.string());
            return false;
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file.good()) {
            spdlog::warn("[TieredCache] Short write to {}", temp.string());
            file.close();
            std::error_code ec;
            fs::remove(temp, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        spdlog::warn("[TieredCache] Failed to rename {} -> {}: {}", temp.string(), path.string(),
                     ec.message());
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

std::uintmax_t file_size_or_zero(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

bool is_cache_file(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) &&
           entry.path().extension() == TieredCache::CACHE_EXTENSION;
}

std::string sanitize_id(const std::string& image_id) {
    if (image_id.empty()) {
        return "unknown";
    }
    std::string safe;
    safe.reserve(image_id.size());
    for (char c : image_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.';
        safe.push_back(ok ? c : '_');
    }
    if (safe == "." || safe == "..") {
        return "unknown";
    }
    return safe;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TieredCache::TieredCache(TieredCacheOptions options)
    : options_(std::move(options)), max_disk_bytes_(options_.max_disk_bytes) {
    ensure_directories();
    rescan_disk_locked();
    spdlog::debug("[TieredCache] Opened {} ({} KB on disk, limits: memory {} MB, disk {} MB)",
                  options_.cache_dir, disk_bytes_ / 1024, options_.max_memory_bytes / (1024 * 1024),
                  options_.max_disk_bytes / (1024 * 1024));
}

TieredCache::~TieredCache() {
    stop_periodic_sweep();
}

void TieredCache::ensure_directories() const {
    for (const auto& dir : {options_.cache_dir, options_.thumbnails_dir}) {
        if (dir.empty()) {
            continue;
        }
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::warn("[TieredCache] Failed to create directory {}: {}", dir, ec.message());
        }
    }
}

// ============================================================================
// Keys
// ============================================================================

CacheKey TieredCache::key_of(const std::string& url) {
    return md5_hex(url);
}

CacheKey TieredCache::variant_key_of(const std::string& url, const ImageSize& size) {
    return md5_hex(url + "|" + size.to_string());
}

// ============================================================================
// Memory tier
// ============================================================================

ImagePtr TieredCache::get_memory(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    auto it = memory_.find(key);
    if (it == memory_.end()) {
        ++memory_misses_;
        return nullptr;
    }
    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
    ++memory_hits_;
    return it->second.image;
}

ImagePtr TieredCache::peek_memory(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    auto it = memory_.find(key);
    if (it == memory_.end()) {
        return nullptr;
    }
    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
    return it->second.image;
}

bool TieredCache::has_memory(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    return memory_.count(key) > 0;
}

bool TieredCache::put_memory(const CacheKey& key, ImagePtr image) {
    if (!image) {
        return false;
    }
    const size_t bytes = image->byte_size();

    std::lock_guard<std::mutex> lock(memory_mutex_);
    const size_t max_bytes = options_.max_memory_bytes;
    if (bytes > max_bytes / 2) {
        spdlog::debug("[TieredCache] Not caching {} in memory: {} KB exceeds half the budget",
                      key, bytes / 1024);
        return false;
    }

    auto existing = memory_.find(key);
    if (existing != memory_.end()) {
        memory_bytes_ -= existing->second.bytes;
        lru_.erase(existing->second.lru_it);
        memory_.erase(existing);
    }

    if (memory_bytes_ + bytes > max_bytes) {
        evict_memory_to(static_cast<size_t>(max_bytes * MEMORY_EVICT_TARGET));
    }

    lru_.push_front(key);
    memory_[key] = MemoryEntry{std::move(image), bytes, lru_.begin()};
    memory_bytes_ += bytes;
    return true;
}

void TieredCache::remove_memory(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    auto it = memory_.find(key);
    if (it == memory_.end()) {
        return;
    }
    memory_bytes_ -= it->second.bytes;
    lru_.erase(it->second.lru_it);
    memory_.erase(it);
}

void TieredCache::evict_memory_to(size_t target_bytes) {
    size_t evicted = 0;
    while (memory_bytes_ > target_bytes && !lru_.empty()) {
        auto it = memory_.find(lru_.back());
        if (it != memory_.end()) {
            memory_bytes_ -= it->second.bytes;
            memory_.erase(it);
        }
        lru_.pop_back();
        ++evicted;
    }
    if (evicted > 0) {
        spdlog::debug("[TieredCache] Evicted {} memory entries, {} KB remain", evicted,
                      memory_bytes_ / 1024);
    }
}

// ============================================================================
// Disk tier
// ============================================================================

std::string TieredCache::disk_path(const CacheKey& key) const {
    return (fs::path(options_.cache_dir) / (key + CACHE_EXTENSION)).string();
}

std::optional<std::vector<uint8_t>> TieredCache::get_disk(const CacheKey& key) {
    const fs::path path = disk_path(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::vector<uint8_t> data;
    if (!read_file(path, data) || data.empty()) {
        spdlog::warn("[TieredCache] Unreadable disk entry {}, removing", path.string());
        remove_disk(key);
        return std::nullopt;
    }

    // Refresh mtime so the sweep treats this entry as recently used
    fs::last_write_time(path, fs::file_time_type::clock::now(), ec);
    if (ec) {
        spdlog::trace("[TieredCache] Could not touch {}: {}", path.string(), ec.message());
    }
    return data;
}

bool TieredCache::put_disk(const CacheKey& key, const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return false;
    }
    const fs::path path = disk_path(key);
    bool swept = false;
    bool written = false;

    {
        std::lock_guard<std::mutex> lock(disk_mutex_);
        const size_t max_bytes = max_disk_bytes_.load();
        if (data.size() > max_bytes) {
            spdlog::warn("[TieredCache] Not caching {} on disk: {} KB exceeds the whole budget",
                         key, data.size() / 1024);
            return false;
        }

        size_t previous = file_size_or_zero(path);
        if (disk_bytes_ - std::min(disk_bytes_, previous) + data.size() > max_bytes) {
            // Make room for the new entry even if 80% of the budget would not
            const size_t target = std::min(sweep_target_bytes(), max_bytes - data.size());
            sweep_disk_locked(target);
            swept = true;
            previous = file_size_or_zero(path);
        }

        if (disk_bytes_ - std::min(disk_bytes_, previous) + data.size() > max_bytes) {
            spdlog::warn("[TieredCache] Not caching {} on disk: sweep could not free {} KB", key,
                         data.size() / 1024);
        } else if (write_file_atomic(path, data)) {
            disk_bytes_ = disk_bytes_ - std::min(disk_bytes_, previous) + data.size();
            if (previous == 0) {
                ++disk_count_;
            }
            written = true;
            spdlog::trace("[TieredCache] Wrote {} ({} bytes)", path.string(), data.size());
        }
    }

    if (swept) {
        notify_cache_cleared();
    }
    return written;
}

void TieredCache::remove_disk(const CacheKey& key) {
    const fs::path path = disk_path(key);

    std::lock_guard<std::mutex> lock(disk_mutex_);
    const size_t size = file_size_or_zero(path);
    std::error_code ec;
    if (fs::remove(path, ec)) {
        disk_bytes_ -= std::min(disk_bytes_, size);
        disk_count_ -= std::min<size_t>(disk_count_, 1);
    } else if (ec) {
        spdlog::warn("[TieredCache] Failed to remove {}: {}", path.string(), ec.message());
    }
}

size_t TieredCache::sweep_disk() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(disk_mutex_);
        removed = sweep_disk_locked(sweep_target_bytes());
    }
    notify_cache_cleared();
    return removed;
}

size_t TieredCache::sweep_target_bytes() const {
    return static_cast<size_t>(max_disk_bytes_.load() * DISK_SWEEP_TARGET);
}

size_t TieredCache::sweep_disk_locked(size_t target) {
    struct DiskEntry {
        fs::path path;
        fs::file_time_type mtime;
        std::uintmax_t size;
    };
    std::vector<DiskEntry> entries;
    size_t total = 0;

    std::error_code ec;
    for (fs::directory_iterator it(options_.cache_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!is_cache_file(*it)) {
            continue;
        }
        std::error_code entry_ec;
        auto mtime = fs::last_write_time(it->path(), entry_ec);
        auto size = fs::file_size(it->path(), entry_ec);
        if (entry_ec) {
            continue;
        }
        entries.push_back({it->path(), mtime, size});
        total += size;
    }
    if (ec) {
        spdlog::warn("[TieredCache] Error scanning {} for sweep: {}", options_.cache_dir,
                     ec.message());
    }

    if (total <= target) {
        disk_bytes_ = total;
        disk_count_ = entries.size();
        return 0;
    }

    // Oldest first
    std::sort(entries.begin(), entries.end(),
              [](const DiskEntry& a, const DiskEntry& b) { return a.mtime < b.mtime; });

    size_t removed = 0;
    size_t removed_bytes = 0;
    for (const auto& entry : entries) {
        if (total <= target) {
            break;
        }
        std::error_code rm_ec;
        if (fs::remove(entry.path, rm_ec)) {
            total -= entry.size;
            removed_bytes += entry.size;
            ++removed;
        } else if (rm_ec) {
            spdlog::warn("[TieredCache] Failed to evict {}: {}", entry.path.string(),
                         rm_ec.message());
        }
    }
    disk_bytes_ = total;
    disk_count_ = entries.size() - removed;

    spdlog::info("[TieredCache] Disk sweep removed {} files ({} KB), {} KB remain", removed,
                 removed_bytes / 1024, total / 1024);
    return removed;
}

void TieredCache::start_periodic_sweep(EventLoop& loop) {
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        loop_ = &loop;
    }
    sweep_timer_ = std::make_unique<Timer>(loop, [this]() { sweep_disk(); });
    sweep_timer_->start(DISK_SWEEP_INTERVAL_MS, true);
    spdlog::debug("[TieredCache] Periodic disk sweep every {} min",
                  DISK_SWEEP_INTERVAL_MS / 60000);
}

void TieredCache::stop_periodic_sweep() {
    if (sweep_timer_) {
        sweep_timer_->stop();
        sweep_timer_.reset();
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    loop_ = nullptr;
}

size_t TieredCache::scan_disk_bytes() const {
    size_t total = 0;
    std::error_code ec;
    for (fs::directory_iterator it(options_.cache_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (is_cache_file(*it)) {
            total += file_size_or_zero(it->path());
        }
    }
    return total;
}

void TieredCache::rescan_disk_locked() {
    size_t total = 0;
    size_t count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(options_.cache_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (is_cache_file(*it)) {
            total += file_size_or_zero(it->path());
            ++count;
        }
    }
    disk_bytes_ = total;
    disk_count_ = count;
}

// ============================================================================
// Thumbnails by id
// ============================================================================

std::string TieredCache::thumbnail_path(const std::string& image_id) const {
    return (fs::path(options_.thumbnails_dir) / (sanitize_id(image_id) + THUMBNAIL_EXTENSION))
        .string();
}

ImagePtr TieredCache::get_thumbnail_by_id(const std::string& image_id) {
    const fs::path path = thumbnail_path(image_id);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return nullptr;
    }

    std::vector<uint8_t> data;
    DecodeResult decoded;
    if (read_file(path, data)) {
        decoded = decode_image(data);
    }
    if (!decoded.image) {
        spdlog::warn("[TieredCache] Corrupt thumbnail {}, removing", path.string());
        fs::remove(path, ec);
        return nullptr;
    }
    return decoded.image;
}

bool TieredCache::put_thumbnail_by_id(const std::string& image_id, const Bitmap& bitmap,
                                      int quality) {
    std::vector<uint8_t> jpeg;
    if (!encode_jpeg(bitmap, quality, jpeg)) {
        spdlog::warn("[TieredCache] Failed to encode thumbnail '{}'", image_id);
        return false;
    }
    return write_file_atomic(thumbnail_path(image_id), jpeg);
}

size_t TieredCache::clear_thumbnails() {
    size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(options_.thumbnails_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || it->path().extension() != THUMBNAIL_EXTENSION) {
            continue;
        }
        if (fs::remove(it->path(), entry_ec)) {
            ++removed;
        } else if (entry_ec) {
            spdlog::warn("[TieredCache] Failed to remove {}: {}", it->path().string(),
                         entry_ec.message());
        }
    }
    spdlog::info("[TieredCache] Cleared {} thumbnails", removed);
    return removed;
}

// ============================================================================
// Maintenance
// ============================================================================

void TieredCache::clear_all() {
    {
        std::lock_guard<std::mutex> lock(memory_mutex_);
        memory_.clear();
        lru_.clear();
        memory_bytes_ = 0;
    }

    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(disk_mutex_);
        std::error_code ec;
        for (fs::directory_iterator it(options_.cache_dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (!is_cache_file(*it)) {
                continue;
            }
            std::error_code rm_ec;
            if (fs::remove(it->path(), rm_ec)) {
                ++removed;
            } else if (rm_ec) {
                spdlog::warn("[TieredCache] Failed to remove {}: {}", it->path().string(),
                             rm_ec.message());
            }
        }
        rescan_disk_locked();
    }

    spdlog::info("[TieredCache] Cleared memory tier and {} disk entries", removed);
    notify_cache_cleared();
}

void TieredCache::set_max_memory_mb(size_t size_mb) {
    set_max_memory_bytes(std::max(size_mb, MIN_MEMORY_MB) * 1024 * 1024);
}

void TieredCache::set_max_disk_mb(size_t size_mb) {
    set_max_disk_bytes(std::max(size_mb, MIN_DISK_MB) * 1024 * 1024);
}

void TieredCache::set_max_memory_bytes(size_t max_bytes) {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    options_.max_memory_bytes = max_bytes;
    if (memory_bytes_ > max_bytes) {
        evict_memory_to(static_cast<size_t>(max_bytes * MEMORY_EVICT_TARGET));
    }
    spdlog::debug("[TieredCache] Memory limit set to {} KB", max_bytes / 1024);
}

void TieredCache::set_max_disk_bytes(size_t max_bytes) {
    max_disk_bytes_ = max_bytes;
    spdlog::debug("[TieredCache] Disk limit set to {} KB", max_bytes / 1024);
}

size_t TieredCache::memory_bytes() const {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    return memory_bytes_;
}

size_t TieredCache::max_memory_bytes() const {
    std::lock_guard<std::mutex> lock(memory_mutex_);
    return options_.max_memory_bytes;
}

size_t TieredCache::disk_bytes() const {
    std::lock_guard<std::mutex> lock(disk_mutex_);
    return disk_bytes_;
}

size_t TieredCache::max_disk_bytes() const {
    return max_disk_bytes_.load();
}

CacheTierStats TieredCache::stats() const {
    CacheTierStats s;
    {
        std::lock_guard<std::mutex> lock(memory_mutex_);
        s.memory_count = memory_.size();
        s.memory_bytes = memory_bytes_;
        s.max_memory_bytes = options_.max_memory_bytes;
        s.memory_hits = memory_hits_;
        s.memory_misses = memory_misses_;
    }
    {
        std::lock_guard<std::mutex> lock(disk_mutex_);
        s.disk_bytes = disk_bytes_;
        s.disk_count = disk_count_;
    }
    s.max_disk_bytes = max_disk_bytes_.load();
    return s;
}

// ============================================================================
// Notifications
// ============================================================================

uint64_t TieredCache::add_cache_cleared_listener(CacheClearedCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    uint64_t id = next_listener_id_++;
    cleared_listeners_[id] = std::move(callback);
    return id;
}

void TieredCache::remove_cache_cleared_listener(uint64_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    cleared_listeners_.erase(id);
}

void TieredCache::notify_cache_cleared() {
    std::vector<CacheClearedCallback> callbacks;
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& entry : cleared_listeners_) {
            callbacks.push_back(entry.second);
        }
        loop = loop_;
    }
    if (callbacks.empty()) {
        return;
    }

    auto dispatch = [callbacks]() {
        for (const auto& callback : callbacks) {
            callback();
        }
    };
    if (loop) {
        loop->post(std::move(dispatch));
    } else {
        dispatch();
    }
}

} // namespace thumbkit
