// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <memory>
#include <mutex>

// Forward declarations
class HThreadPool;

/**
 * @file worker_executor.h
 * @brief Execution backend for fetch workers
 *
 * LoadDispatcher hands each worker body to a WorkerExecutor. Production code
 * uses ThreadPoolExecutor (libhv HThreadPool); tests substitute an executor
 * that queues tasks and runs them on demand.
 */

namespace thumbkit {

class WorkerExecutor {
  public:
    using Task = std::function<void()>;

    virtual ~WorkerExecutor() = default;

    /**
     * @brief Submit a task for execution
     *
     * @return false if the executor is shut down and the task was dropped
     */
    virtual bool submit(Task task) = 0;

    /// Tasks accepted but not yet started
    [[nodiscard]] virtual size_t queued_tasks() const = 0;
};

/**
 * @brief WorkerExecutor backed by a libhv thread pool
 *
 * Thread-safe: submit() can be called from any thread.
 */
class ThreadPoolExecutor : public WorkerExecutor {
  public:
    /**
     * @param min_threads Threads started immediately
     * @param max_threads Upper bound the pool may grow to under load
     */
    ThreadPoolExecutor(int min_threads, int max_threads);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    bool submit(Task task) override;

    [[nodiscard]] size_t queued_tasks() const override;

    /// Block until every submitted task has finished
    void wait_for_completion();

    /**
     * @brief Stop the pool
     *
     * Waits for running tasks. Called automatically on destruction.
     */
    void shutdown();

  private:
    std::unique_ptr<HThreadPool> thread_pool_;
    mutable std::mutex mutex_;
    bool shutdown_ = false;
};

} // namespace thumbkit
