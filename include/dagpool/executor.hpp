/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "dagpool/status.hpp"
#include "dagpool/types.hpp"
#include "dagpool/workflow_spec.hpp"

namespace dagpool {

enum class ExecutorPhase : std::uint8_t {
    Initializing,  // placed on a node, pulling and preparing
    Ready,         // waiting at the start barrier
    Running,       // user command started
    Exited         // ended; outcome and exit code are set
};

[[nodiscard]] const char* toString(ExecutorPhase phase) noexcept;

struct TaskLaunch {
    TaskRef ref;
    TaskSpec spec;
    std::string platform;
};

struct TaskEvent {
    TaskRef ref;
    ExecutorPhase phase = ExecutorPhase::Initializing;
    TaskStatus outcome = TaskStatus::Completed;
    std::string reason;
    std::optional<int> exitCode;
    std::string node;
};

using TaskEventSink = std::function<void(const TaskEvent&)>;

// The backend that runs tasks. Calls never come in while the scheduler
// holds its state lock, so an implementation may report events
// synchronously from inside any of these calls.
class Executor {
public:
    virtual ~Executor() = default;

    // Places all tasks at once or none. False rejects the whole gang.
    [[nodiscard]] virtual bool placeGang(const std::string& groupKey, const std::vector<TaskLaunch>& tasks) = 0;
    // Best effort. The scheduler does not wait for confirmation.
    virtual void cancel(const TaskRef& task) = 0;
    virtual void releaseBarrier(const std::string& groupKey, const std::vector<TaskRef>& tasks) = 0;
    // Re-executes the user command of a placed task under the same instance.
    // The task reports READY again and waits for the next releaseBarrier.
    virtual void restart(const TaskRef& task) = 0;
};

}
