/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "dagpool/status.hpp"
#include "dagpool/types.hpp"

namespace dagpool {

// Read-only copies of scheduler records, safe to hold without locks.

struct TaskView {
    std::string name;
    std::string group;
    int retryId = 0;
    bool lead = false;
    bool current = true;
    TaskStatus status = TaskStatus::Submitting;
    std::string message;
    std::optional<int> exitCode;
    std::string node;
    int restarts = 0;
};

struct GroupView {
    std::string name;
    TaskStatus status = TaskStatus::Submitting;
    std::vector<std::string> upstream;
    bool queued = false;
};

struct WorkflowSummary {
    WorkflowId id;
    std::string name;
    std::string user;
    std::string pool;
    Priority priority = Priority::Normal;
    WorkflowStatus status = WorkflowStatus::Pending;
    TimePoint submitTime;
    std::optional<TimePoint> endTime;
};

struct WorkflowView {
    WorkflowSummary summary;
    bool canceled = false;
    std::string canceledBy;
    std::string failureMessage;
    std::optional<TimePoint> startTime;
    std::vector<GroupView> groups;
    // Every task instance, retired ones included.
    std::vector<TaskView> tasks;

    [[nodiscard]] const GroupView* group(const std::string& name) const noexcept;
    // Current instance of a task.
    [[nodiscard]] const TaskView* task(const std::string& name) const noexcept;
    [[nodiscard]] std::vector<const TaskView*> instances(const std::string& name) const;
};

struct HistoryFilter {
    std::string pool;
    std::string user;
    std::optional<WorkflowStatus> status;
    std::size_t limit = 20;

    [[nodiscard]] bool matches(const WorkflowSummary& summary) const noexcept;
};

}
