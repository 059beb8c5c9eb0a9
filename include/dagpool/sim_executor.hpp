/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "dagpool/executor.hpp"

namespace dagpool {

// In-process backend for the daemon. Every placed task initializes, waits at
// the barrier, then runs for its declared duration. A command of the form
// ["exit", "<code>"] ends with that exit code, anything else exits 0.
class SimExecutor final : public Executor {
public:
    using Millis = std::chrono::milliseconds;

    // DAGPOOL_SIM_INIT_MS and DAGPOOL_SIM_SPEED override the defaults.
    SimExecutor();
    SimExecutor(Millis initDelay, double speed);
    ~SimExecutor() override;

    SimExecutor(const SimExecutor&) = delete;
    SimExecutor& operator=(const SimExecutor&) = delete;
    SimExecutor(SimExecutor&&) = delete;
    SimExecutor& operator=(SimExecutor&&) = delete;

    [[nodiscard]] bool start(TaskEventSink sink);
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] bool placeGang(const std::string& groupKey, const std::vector<TaskLaunch>& tasks) override;
    void cancel(const TaskRef& task) override;
    void releaseBarrier(const std::string& groupKey, const std::vector<TaskRef>& tasks) override;
    void restart(const TaskRef& task) override;

    [[nodiscard]] std::size_t activeTasks() const;

private:
    using SteadyClock = std::chrono::steady_clock;

    struct SimTask {
        TaskLaunch launch;
        std::string node;
        bool atBarrier = false;
    };

    void schedule(SteadyClock::time_point due, TaskEvent event);
    void unschedule(const std::string& key);
    void timerLoop();
    [[nodiscard]] Millis scaled(Seconds duration) const;
    [[nodiscard]] static int exitCodeFor(const TaskSpec& spec) noexcept;

    Millis initDelay_;
    double speed_;
    TaskEventSink sink_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::multimap<SteadyClock::time_point, TaskEvent> timers_;
    std::unordered_map<std::string, SimTask> tasks_;
    std::size_t nextNode_ = 0;

    std::thread timerThread_;
};

}
