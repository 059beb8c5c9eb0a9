/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/worker_pool.hpp"
#include "dagpool/logger.hpp"

namespace dagpool {

WorkerPool::WorkerPool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Worker pool created with " + std::to_string(workers_) + " workers");
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::start(PassProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Worker pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid pass processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&WorkerPool::workerLoop, this, i);
        }

        LOG_INFO("Worker pool started with " + std::to_string(workers_) + " admission threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker pool: " + std::string(e.what()));
        shutdown_.store(true);
        running_.store(false);
        passAvailable_.notify_all();
        for (auto& thread : workerThreads_) {
            if (thread.joinable()) thread.join();
        }
        workerThreads_.clear();
        return false;
    }
}

void WorkerPool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping worker pool...");

    shutdown_.store(true);
    running_.store(false);
    passAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        passQueue_.clear();
        queuedPools_.clear();
    }

    LOG_INFO("Worker pool stopped");
}

void WorkerPool::submit(const std::string& pool) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot queue admission pass on stopped worker pool: " + pool);
        return;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!queuedPools_.insert(pool).second) {
                return;
            }
            passQueue_.push_back(pool);
        }
        passAvailable_.notify_one();
        LOG_TRACE("Admission pass queued: " + pool);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue admission pass for " + pool + ": " + e.what());
    }
}

std::size_t WorkerPool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return passQueue_.size();
}

void WorkerPool::workerLoop(int workerId) {
    setThreadName("Admit-" + std::to_string(workerId));
    LOG_DEBUG("Admission worker " + std::to_string(workerId) + " started");

    while (!shutdown_.load()) {
        std::string pool;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            passAvailable_.wait(lock, [this] {
                return !passQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }
            if (passQueue_.empty()) {
                continue;
            }

            pool = std::move(passQueue_.front());
            passQueue_.pop_front();
            // Requests arriving from here on need a fresh pass.
            queuedPools_.erase(pool);
        }

        try {
            processor_(pool, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Admission pass for pool " + pool + " failed: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Admission worker " + std::to_string(workerId) + " stopped");
}

}
