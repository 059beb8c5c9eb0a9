/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace dagpool {

using PassProcessor = std::function<void(const std::string& pool, int workerId)>;

// Runs admission passes on worker threads. A pool is queued at most once;
// a request for a pool that is already waiting folds into that pass.
class WorkerPool {
public:
    explicit WorkerPool(int workers) noexcept;
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    [[nodiscard]] bool start(PassProcessor processor);
    void stop() noexcept;
    void submit(const std::string& pool) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    PassProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable passAvailable_;
    std::deque<std::string> passQueue_;
    std::set<std::string> queuedPools_;

    std::vector<std::thread> workerThreads_;
};

}
