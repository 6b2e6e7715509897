// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_loop.h"

#include <atomic>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace thumbkit;
using namespace std::chrono_literals;

// ============================================================================
// post() / run_pending()
// ============================================================================

TEST_CASE("EventLoop: posted callbacks run in order", "[event_loop]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    std::vector<int> order;

    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    loop.post([&] { order.push_back(3); });

    REQUIRE(loop.run_pending() == 3);
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(loop.run_pending() == 0);
}

TEST_CASE("EventLoop: callbacks posted from a callback run in the same pass", "[event_loop]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int runs = 0;

    loop.post([&] {
        ++runs;
        loop.post([&] { ++runs; });
    });

    loop.run_pending();
    REQUIRE(runs == 2);
}

TEST_CASE("EventLoop: post is safe from other threads", "[event_loop][threading]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int count = 0; // only touched on the loop thread

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&loop, &count] {
            for (int i = 0; i < 100; ++i) {
                loop.post([&count] { ++count; });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    loop.run_pending();
    REQUIRE(count == 400);
}

// ============================================================================
// Timers
// ============================================================================

TEST_CASE("EventLoop: one-shot timer fires once its delay elapses", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int fired = 0;

    auto id = loop.call_later(100, [&] { ++fired; });
    REQUIRE(loop.is_timer_active(id));

    loop.run_pending();
    REQUIRE(fired == 0);

    clock.advance(99ms);
    loop.run_pending();
    REQUIRE(fired == 0);

    clock.advance(1ms);
    loop.run_pending();
    REQUIRE(fired == 1);
    REQUIRE_FALSE(loop.is_timer_active(id));

    clock.advance(1000ms);
    loop.run_pending();
    REQUIRE(fired == 1);
}

TEST_CASE("EventLoop: repeating timer re-arms", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int fired = 0;

    auto id = loop.call_later(50, [&] { ++fired; }, true);

    for (int i = 0; i < 3; ++i) {
        clock.advance(50ms);
        loop.run_pending();
    }
    REQUIRE(fired == 3);

    loop.cancel_timer(id);
    clock.advance(50ms);
    loop.run_pending();
    REQUIRE(fired == 3);
    REQUIRE(loop.timer_count() == 0);
}

TEST_CASE("EventLoop: due timers run earliest deadline first", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    std::vector<int> order;

    loop.call_later(30, [&] { order.push_back(30); });
    loop.call_later(10, [&] { order.push_back(10); });
    loop.call_later(20, [&] { order.push_back(20); });

    clock.advance(100ms);
    loop.run_pending();
    REQUIRE(order == std::vector<int>{10, 20, 30});
}

TEST_CASE("EventLoop: cancel_timer ignores invalid and fired ids", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);

    loop.cancel_timer(EventLoop::INVALID_TIMER);
    auto id = loop.call_later(0, [] {});
    loop.run_pending();
    loop.cancel_timer(id);
    REQUIRE(loop.timer_count() == 0);
}

TEST_CASE("Timer: restart replaces the pending shot", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int fired = 0;
    Timer timer(loop, [&] { ++fired; });

    timer.start(100);
    clock.advance(80ms);
    timer.start(100);
    clock.advance(80ms);
    loop.run_pending();
    REQUIRE(fired == 0);
    REQUIRE(timer.is_active());

    clock.advance(20ms);
    loop.run_pending();
    REQUIRE(fired == 1);
    REQUIRE_FALSE(timer.is_active());
}

TEST_CASE("Timer: one-shot callback may re-arm itself", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int fired = 0;
    std::unique_ptr<Timer> timer;
    timer = std::make_unique<Timer>(loop, [&] {
        if (++fired < 3) {
            timer->start(10);
        }
    });

    timer->start(10);
    for (int i = 0; i < 5; ++i) {
        clock.advance(10ms);
        loop.run_pending();
    }
    REQUIRE(fired == 3);
    REQUIRE_FALSE(timer->is_active());
}

TEST_CASE("Timer: destruction cancels the shot", "[event_loop][timer]") {
    ManualTimeSource clock;
    EventLoop loop(clock);
    int fired = 0;
    {
        Timer timer(loop, [&] { ++fired; });
        timer.start(10);
    }
    clock.advance(10ms);
    loop.run_pending();
    REQUIRE(fired == 0);
}

// ============================================================================
// Blocking modes
// ============================================================================

TEST_CASE("EventLoop: run() returns after stop()", "[event_loop][slow]") {
    EventLoop loop;
    std::atomic<bool> ran{false};

    loop.call_later(5, [&] {
        ran = true;
        loop.stop();
    });
    loop.run();
    REQUIRE(ran);
}

TEST_CASE("EventLoop: run_until honours predicate and timeout", "[event_loop][slow]") {
    EventLoop loop;

    SECTION("predicate satisfied by a worker thread post") {
        bool done = false;
        std::thread worker([&loop, &done] {
            std::this_thread::sleep_for(5ms);
            loop.post([&done] { done = true; });
        });
        REQUIRE(loop.run_until([&] { return done; }, 2000ms));
        worker.join();
    }

    SECTION("timeout when nothing happens") {
        REQUIRE_FALSE(loop.run_until([] { return false; }, 20ms));
    }
}

TEST_CASE("elapsed_ms: never negative", "[event_loop]") {
    TimePoint a = Clock::now();
    TimePoint b = a + 250ms;
    REQUIRE(elapsed_ms(a, b) == 250);
    REQUIRE(elapsed_ms(b, a) == 0);
}
