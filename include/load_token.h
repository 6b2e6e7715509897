// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

/**
 * @file load_token.h
 * @brief Cancellation and liveness context shared between a worker and its owner
 *
 * A LoadToken travels with every worker body and with the completion posted
 * back to the event loop:
 * 1. `alive` is cleared when the owning dispatcher is destroyed, so a late
 *    completion never touches freed state
 * 2. `cancelled` is set by cancel()/cancel_all(); the worker checks it before
 *    any cache write and the owner discards the result
 * 3. `worker_id` distinguishes a restarted load for the same URL from a
 *    cancelled predecessor that is still finishing
 *
 * ## Usage Example
 * ```cpp
 * auto token = LoadToken::create(alive_, next_worker_id_++);
 * executor.submit([token]() {
 *     auto bytes = fetch();
 *     if (token.is_cancelled()) return;  // drop before writing
 *     cache.put_disk(key, bytes);
 * });
 * ```
 */

namespace thumbkit {

struct LoadToken {
    /// Owner liveness flag (shared by every token the owner creates)
    std::shared_ptr<std::atomic<bool>> alive;

    /// Per-worker cancellation flag
    std::shared_ptr<std::atomic<bool>> cancelled;

    /// Identifier unique within the owner
    uint64_t worker_id = 0;

    /**
     * @brief True if the worker should stop and write nothing
     */
    [[nodiscard]] bool is_cancelled() const {
        if (!alive || !alive->load()) {
            return true;
        }
        return cancelled && cancelled->load();
    }

    /**
     * @brief True if the owner still exists (completion may be delivered)
     */
    [[nodiscard]] bool owner_alive() const {
        return alive && alive->load();
    }

    void cancel() const {
        if (cancelled) {
            cancelled->store(true);
        }
    }

    static LoadToken create(std::shared_ptr<std::atomic<bool>> alive_flag, uint64_t id) {
        LoadToken token;
        token.alive = std::move(alive_flag);
        token.cancelled = std::make_shared<std::atomic<bool>>(false);
        token.worker_id = id;
        return token;
    }
};

} // namespace thumbkit
