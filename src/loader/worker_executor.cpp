// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "worker_executor.h"

#include <hv/hthreadpool.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace thumbkit {

ThreadPoolExecutor::ThreadPoolExecutor(int min_threads, int max_threads) {
    min_threads = std::max(min_threads, 1);
    max_threads = std::max(max_threads, min_threads);

    thread_pool_ = std::make_unique<HThreadPool>(min_threads, max_threads);
    thread_pool_->start(min_threads);
    spdlog::debug("[ThreadPoolExecutor] Started with {}..{} worker threads", min_threads,
                  max_threads);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

void ThreadPoolExecutor::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    if (thread_pool_) {
        thread_pool_->stop();
        thread_pool_.reset();
    }
    // Note: Don't log here - this may run during static destruction
}

bool ThreadPoolExecutor::submit(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !thread_pool_) {
        return false;
    }
    thread_pool_->commit(std::move(task));
    return true;
}

size_t ThreadPoolExecutor::queued_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_pool_) {
        return 0;
    }
    return static_cast<size_t>(thread_pool_->taskNum());
}

void ThreadPoolExecutor::wait_for_completion() {
    HThreadPool* pool = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = thread_pool_.get();
    }
    if (pool) {
        pool->wait();
    }
}

} // namespace thumbkit
