// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>

/**
 * @file event_loop.h
 * @brief Single-owner event loop with posted callbacks and timers
 *
 * All loader and scheduler state is owned by one thread that runs an EventLoop.
 * Worker threads never touch that state directly; they post() a callback and
 * the owner thread executes it on its next cycle. This is the same drain model
 * as a UI update queue: callbacks accumulate under a mutex and are swapped out
 * and executed together at a safe point.
 *
 * Timers are one-shot or repeating and are driven by a TimeSource. Production code
 * uses SteadyTimeSource; tests use ManualTimeSource and call run_pending() after
 * advancing time, which makes every delay in the system deterministic.
 *
 * Usage:
 * @code
 * thumbkit::EventLoop loop;
 *
 * // From any thread:
 * loop.post([] { spdlog::info("runs on the loop thread"); });
 *
 * // On the loop thread:
 * thumbkit::Timer timer(loop, [] { spdlog::info("tick"); });
 * timer.start(500);
 * loop.run();  // until loop.stop()
 * @endcode
 */

namespace thumbkit {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Time source for the event loop
 */
class TimeSource {
  public:
    virtual ~TimeSource() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

/**
 * @brief Real monotonic time
 */
class SteadyTimeSource : public TimeSource {
  public:
    [[nodiscard]] TimePoint now() const override {
        return Clock::now();
    }
};

/**
 * @brief Manually advanced time for deterministic tests
 *
 * Starts at an arbitrary non-zero epoch so "time since last launch" checks
 * behave the same as with a real clock on the very first call.
 */
class ManualTimeSource : public TimeSource {
  public:
    ManualTimeSource() : now_(TimePoint{} + std::chrono::hours(1)) {}

    [[nodiscard]] TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

  private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

/// Milliseconds elapsed between two time points (never negative)
inline int64_t elapsed_ms(TimePoint from, TimePoint to) {
    if (to <= from) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

class EventLoop {
  public:
    using Callback = std::function<void()>;
    using TimerId = uint64_t;

    /// Timer id that is never handed out
    static constexpr TimerId INVALID_TIMER = 0;

    /**
     * @brief Create a loop on real time
     */
    EventLoop();

    /**
     * @brief Create a loop on an external time source (not owned)
     *
     * @param time_source Must outlive the loop
     */
    explicit EventLoop(const TimeSource& time_source);

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Queue a callback for execution on the loop thread
     *
     * Thread-safe. Can be called from any thread. Wakes a blocked run().
     */
    void post(Callback callback);

    /**
     * @brief Schedule a callback after a delay
     *
     * @param delay_ms Delay in milliseconds (0 = next cycle)
     * @param callback Function to execute once the delay has elapsed
     * @param repeat If true, the timer re-arms itself with the same delay
     * @return Id usable with cancel_timer()
     */
    TimerId call_later(int64_t delay_ms, Callback callback, bool repeat = false);

    /**
     * @brief Cancel a pending timer
     *
     * Safe to call with an id that already fired or INVALID_TIMER.
     */
    void cancel_timer(TimerId id);

    /**
     * @brief Check whether a timer is still scheduled
     */
    [[nodiscard]] bool is_timer_active(TimerId id) const;

    /**
     * @brief Execute all posted callbacks and all timers that are due
     *
     * Callbacks posted or timers armed by the callbacks themselves with a
     * zero delay are also processed before returning.
     *
     * @return Number of callbacks executed
     */
    size_t run_pending();

    /**
     * @brief Block and process events until stop() is called
     */
    void run();

    /**
     * @brief Ask run() to return. Thread-safe.
     */
    void stop();

    /**
     * @brief Run until a predicate holds or a real-time timeout elapses
     *
     * Convenience for tools and integration tests that run real workers.
     *
     * @return true if the predicate became true
     */
    bool run_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

    [[nodiscard]] TimePoint now() const {
        return time_source_->now();
    }

    /// Number of scheduled timers (for diagnostics and tests)
    [[nodiscard]] size_t timer_count() const;

  private:
    struct TimerEntry {
        TimePoint deadline;
        int64_t interval_ms = 0;
        bool repeat = false;
        Callback callback;
    };

    /// Pop the next due timer, if any, re-arming repeating timers
    bool take_due_timer(Callback& out);

    /// Earliest deadline across all timers, if any
    bool next_deadline(TimePoint& out) const;

    std::unique_ptr<TimeSource> owned_time_source_;
    const TimeSource* time_source_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::queue<Callback> pending_;
    std::map<TimerId, TimerEntry> timers_;
    TimerId next_timer_id_ = 1;
    std::atomic<bool> stop_requested_{false};
};

/**
 * @brief Restartable timer bound to an EventLoop
 *
 * Mirrors the single-shot timer idiom: start() (re)arms, stop() disarms,
 * is_active() reports whether a shot is pending. Must be used on the loop
 * thread. Destroying the timer cancels it.
 */
class Timer {
  public:
    Timer(EventLoop& loop, EventLoop::Callback callback);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    /**
     * @brief Arm (or re-arm) the timer
     *
     * @param delay_ms Delay before the callback runs
     * @param repeat Re-arm with the same delay after each shot
     */
    void start(int64_t delay_ms, bool repeat = false);

    void stop();

    [[nodiscard]] bool is_active() const;

  private:
    EventLoop& loop_;
    EventLoop::Callback callback_;
    EventLoop::TimerId id_ = EventLoop::INVALID_TIMER;
    bool repeat_ = false;
};

} // namespace thumbkit
