// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_loop.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbkit {

// Upper bound on a single blocking wait so stop() and clock drift are noticed
static constexpr auto MAX_WAIT = std::chrono::milliseconds(100);

EventLoop::EventLoop()
    : owned_time_source_(std::make_unique<SteadyTimeSource>()),
      time_source_(owned_time_source_.get()) {}

EventLoop::EventLoop(const TimeSource& time_source) : time_source_(&time_source) {}

EventLoop::~EventLoop() {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.clear();
    std::queue<Callback> empty;
    std::swap(pending_, empty);
}

void EventLoop::post(Callback callback) {
    if (!callback) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push(std::move(callback));
    }
    wakeup_.notify_one();
}

EventLoop::TimerId EventLoop::call_later(int64_t delay_ms, Callback callback, bool repeat) {
    if (!callback) {
        return INVALID_TIMER;
    }
    delay_ms = std::max<int64_t>(delay_ms, 0);

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        TimerEntry entry;
        entry.deadline = time_source_->now() + std::chrono::milliseconds(delay_ms);
        entry.interval_ms = delay_ms;
        entry.repeat = repeat;
        entry.callback = std::move(callback);
        timers_.emplace(id, std::move(entry));
    }
    wakeup_.notify_one();
    return id;
}

void EventLoop::cancel_timer(TimerId id) {
    if (id == INVALID_TIMER) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

bool EventLoop::is_timer_active(TimerId id) const {
    if (id == INVALID_TIMER) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.count(id) > 0;
}

size_t EventLoop::timer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

bool EventLoop::take_due_timer(Callback& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = time_source_->now();

    // Earliest due timer first; ties broken by id (creation order)
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline > now) {
            continue;
        }
        if (due == timers_.end() || it->second.deadline < due->second.deadline) {
            due = it;
        }
    }
    if (due == timers_.end()) {
        return false;
    }

    if (due->second.repeat) {
        out = due->second.callback;
        // Repeating timers with zero interval would starve the loop
        int64_t interval = std::max<int64_t>(due->second.interval_ms, 1);
        due->second.deadline = now + std::chrono::milliseconds(interval);
    } else {
        out = std::move(due->second.callback);
        timers_.erase(due);
    }
    return true;
}

bool EventLoop::next_deadline(TimePoint& out) const {
    if (timers_.empty()) {
        return false;
    }
    out = std::min_element(timers_.begin(), timers_.end(), [](const auto& a, const auto& b) {
              return a.second.deadline < b.second.deadline;
          })->second.deadline;
    return true;
}

size_t EventLoop::run_pending() {
    size_t executed = 0;

    // Bounded so a repeating zero-delay chain cannot spin forever
    for (int round = 0; round < 64; ++round) {
        std::queue<Callback> to_process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(to_process, pending_);
        }

        size_t round_count = 0;
        while (!to_process.empty()) {
            Callback callback = std::move(to_process.front());
            to_process.pop();
            callback();
            ++round_count;
        }

        Callback timer_callback;
        while (take_due_timer(timer_callback)) {
            timer_callback();
            timer_callback = nullptr;
            ++round_count;
        }

        executed += round_count;
        if (round_count == 0) {
            break;
        }
    }
    return executed;
}

void EventLoop::run() {
    stop_requested_.store(false);
    spdlog::debug("[EventLoop] Running");

    while (!stop_requested_.load()) {
        run_pending();

        std::unique_lock<std::mutex> lock(mutex_);
        if (!pending_.empty() || stop_requested_.load()) {
            continue;
        }

        auto wait_for = MAX_WAIT;
        TimePoint deadline;
        if (next_deadline(deadline)) {
            int64_t remaining = elapsed_ms(time_source_->now(), deadline);
            wait_for = std::min(wait_for, std::chrono::milliseconds(remaining));
        }
        if (wait_for.count() > 0) {
            wakeup_.wait_for(lock, wait_for);
        }
    }

    spdlog::debug("[EventLoop] Stopped");
}

void EventLoop::stop() {
    stop_requested_.store(true);
    wakeup_.notify_all();
}

bool EventLoop::run_until(const std::function<bool()>& predicate,
                          std::chrono::milliseconds timeout) {
    auto give_up = Clock::now() + timeout;
    while (!predicate()) {
        if (Clock::now() >= give_up) {
            return false;
        }
        if (run_pending() == 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                wakeup_.wait_for(lock, std::chrono::milliseconds(5));
            }
        }
    }
    return true;
}

// ============================================================================
// Timer
// ============================================================================

Timer::Timer(EventLoop& loop, EventLoop::Callback callback)
    : loop_(loop), callback_(std::move(callback)) {}

Timer::~Timer() {
    stop();
}

void Timer::start(int64_t delay_ms, bool repeat) {
    stop();
    repeat_ = repeat;
    if (repeat) {
        id_ = loop_.call_later(delay_ms, callback_, true);
        return;
    }
    // One-shot: forget our id before invoking so the callback may re-arm
    id_ = loop_.call_later(delay_ms, [this] {
        id_ = EventLoop::INVALID_TIMER;
        callback_();
    });
}

void Timer::stop() {
    loop_.cancel_timer(id_);
    id_ = EventLoop::INVALID_TIMER;
}

bool Timer::is_active() const {
    return loop_.is_timer_active(id_);
}

} // namespace thumbkit
