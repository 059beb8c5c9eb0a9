/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace dagpool {

// Task and group lifecycle. Declaration order is progress order for the
// pre-terminal states.
enum class TaskStatus : std::uint8_t {
    Submitting,
    Waiting,
    Processing,
    Scheduling,
    Initializing,
    Running,
    Completed,
    Rescheduled,
    Failed,
    FailedCanceled,
    FailedServerError,
    FailedBackendError,
    FailedExecTimeout,
    FailedQueueTimeout,
    FailedImagePull,
    FailedUpstream,
    FailedEvicted,
    FailedPreempted,
    FailedStartError,
    FailedStartTimeout,
    FailedSubmission
};

enum class WorkflowStatus : std::uint8_t {
    Pending,
    Waiting,
    Running,
    Completed,
    Failed,
    FailedCanceled,
    FailedServerError,
    FailedBackendError,
    FailedExecTimeout,
    FailedQueueTimeout,
    FailedImagePull,
    FailedUpstream,
    FailedEvicted,
    FailedPreempted,
    FailedStartError,
    FailedStartTimeout,
    FailedSubmission
};

// What happens to a task instance that ends with a given failure.
enum class RetryPolicy : std::uint8_t {
    Reschedule,     // new instance right away, bounded by the retry ceiling
    Backoff,        // new instance after an exponential delay, same ceiling
    Never,          // terminal
    AdminOverride   // terminal unless an operator resubmits
};

[[nodiscard]] const char* toString(TaskStatus status) noexcept;
[[nodiscard]] const char* toString(WorkflowStatus status) noexcept;
[[nodiscard]] const char* toString(RetryPolicy policy) noexcept;
[[nodiscard]] std::optional<TaskStatus> parseTaskStatus(const std::string& text);
[[nodiscard]] std::optional<WorkflowStatus> parseWorkflowStatus(const std::string& text);

// Completed, Rescheduled or any failure.
[[nodiscard]] bool isFinished(TaskStatus status) noexcept;
// Completed or any failure. Rescheduled is not an end state for a group.
[[nodiscard]] bool isGroupFinished(TaskStatus status) noexcept;
[[nodiscard]] bool isFailed(TaskStatus status) noexcept;
// Submitting, Waiting, Processing.
[[nodiscard]] bool isPrescheduling(TaskStatus status) noexcept;
// Prescheduling or Scheduling.
[[nodiscard]] bool isInQueue(TaskStatus status) noexcept;
// In queue or Initializing.
[[nodiscard]] bool isPrerunning(TaskStatus status) noexcept;
// Ended by a user or a deadline rather than by the task itself.
[[nodiscard]] bool isCanceled(TaskStatus status) noexcept;

[[nodiscard]] bool isFinished(WorkflowStatus status) noexcept;
[[nodiscard]] bool isFailed(WorkflowStatus status) noexcept;

// Ordinal of a pre-terminal state. Waiting and Processing share a rank.
[[nodiscard]] int progressRank(TaskStatus status) noexcept;

[[nodiscard]] RetryPolicy retryPolicy(TaskStatus status) noexcept;

// Workflow status carrying the same reason as a terminal group status.
[[nodiscard]] WorkflowStatus workflowStatusFor(TaskStatus status) noexcept;

}
