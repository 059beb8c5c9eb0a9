/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/status.hpp"
#include <array>
#include <cctype>

namespace dagpool {

namespace {

constexpr std::array<const char*, 21> kTaskStatusNames = {
    "SUBMITTING", "WAITING", "PROCESSING", "SCHEDULING", "INITIALIZING", "RUNNING",
    "COMPLETED", "RESCHEDULED", "FAILED", "FAILED_CANCELED", "FAILED_SERVER_ERROR",
    "FAILED_BACKEND_ERROR", "FAILED_EXEC_TIMEOUT", "FAILED_QUEUE_TIMEOUT",
    "FAILED_IMAGE_PULL", "FAILED_UPSTREAM", "FAILED_EVICTED", "FAILED_PREEMPTED",
    "FAILED_START_ERROR", "FAILED_START_TIMEOUT", "FAILED_SUBMISSION"
};

constexpr std::array<const char*, 17> kWorkflowStatusNames = {
    "PENDING", "WAITING", "RUNNING", "COMPLETED", "FAILED", "FAILED_CANCELED",
    "FAILED_SERVER_ERROR", "FAILED_BACKEND_ERROR", "FAILED_EXEC_TIMEOUT",
    "FAILED_QUEUE_TIMEOUT", "FAILED_IMAGE_PULL", "FAILED_UPSTREAM", "FAILED_EVICTED",
    "FAILED_PREEMPTED", "FAILED_START_ERROR", "FAILED_START_TIMEOUT", "FAILED_SUBMISSION"
};

std::string upper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

}

const char* toString(TaskStatus status) noexcept {
    const auto index = static_cast<std::size_t>(status);
    return index < kTaskStatusNames.size() ? kTaskStatusNames[index] : "UNKNOWN";
}

const char* toString(WorkflowStatus status) noexcept {
    const auto index = static_cast<std::size_t>(status);
    return index < kWorkflowStatusNames.size() ? kWorkflowStatusNames[index] : "UNKNOWN";
}

const char* toString(RetryPolicy policy) noexcept {
    switch (policy) {
        case RetryPolicy::Reschedule:    return "RESCHEDULE";
        case RetryPolicy::Backoff:       return "BACKOFF";
        case RetryPolicy::Never:         return "NEVER";
        case RetryPolicy::AdminOverride: return "ADMIN_OVERRIDE";
        default: return "UNKNOWN";
    }
}

std::optional<TaskStatus> parseTaskStatus(const std::string& text) {
    const auto wanted = upper(text);
    for (std::size_t i = 0; i < kTaskStatusNames.size(); ++i) {
        if (wanted == kTaskStatusNames[i]) return static_cast<TaskStatus>(i);
    }
    return std::nullopt;
}

std::optional<WorkflowStatus> parseWorkflowStatus(const std::string& text) {
    const auto wanted = upper(text);
    for (std::size_t i = 0; i < kWorkflowStatusNames.size(); ++i) {
        if (wanted == kWorkflowStatusNames[i]) return static_cast<WorkflowStatus>(i);
    }
    return std::nullopt;
}

bool isFinished(TaskStatus status) noexcept {
    return status >= TaskStatus::Completed;
}

bool isGroupFinished(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || isFailed(status);
}

bool isFailed(TaskStatus status) noexcept {
    return status >= TaskStatus::Failed;
}

bool isPrescheduling(TaskStatus status) noexcept {
    return status == TaskStatus::Submitting || status == TaskStatus::Waiting ||
           status == TaskStatus::Processing;
}

bool isInQueue(TaskStatus status) noexcept {
    return isPrescheduling(status) || status == TaskStatus::Scheduling;
}

bool isPrerunning(TaskStatus status) noexcept {
    return isInQueue(status) || status == TaskStatus::Initializing;
}

bool isCanceled(TaskStatus status) noexcept {
    return status == TaskStatus::FailedCanceled || status == TaskStatus::FailedExecTimeout ||
           status == TaskStatus::FailedQueueTimeout;
}

bool isFinished(WorkflowStatus status) noexcept {
    return status >= WorkflowStatus::Completed;
}

bool isFailed(WorkflowStatus status) noexcept {
    return status >= WorkflowStatus::Failed;
}

int progressRank(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Submitting:   return 0;
        case TaskStatus::Waiting:      return 1;
        case TaskStatus::Processing:   return 1;
        case TaskStatus::Scheduling:   return 2;
        case TaskStatus::Initializing: return 3;
        case TaskStatus::Running:      return 4;
        default: return 5;
    }
}

RetryPolicy retryPolicy(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::FailedBackendError:
        case TaskStatus::FailedImagePull:
        case TaskStatus::FailedEvicted:
        case TaskStatus::FailedPreempted:
        case TaskStatus::FailedStartError:
            return RetryPolicy::Reschedule;
        case TaskStatus::FailedServerError:
            return RetryPolicy::Backoff;
        case TaskStatus::FailedExecTimeout:
        case TaskStatus::FailedQueueTimeout:
        case TaskStatus::FailedStartTimeout:
            return RetryPolicy::AdminOverride;
        default:
            return RetryPolicy::Never;
    }
}

WorkflowStatus workflowStatusFor(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Completed:          return WorkflowStatus::Completed;
        case TaskStatus::FailedCanceled:     return WorkflowStatus::FailedCanceled;
        case TaskStatus::FailedServerError:  return WorkflowStatus::FailedServerError;
        case TaskStatus::FailedBackendError: return WorkflowStatus::FailedBackendError;
        case TaskStatus::FailedExecTimeout:  return WorkflowStatus::FailedExecTimeout;
        case TaskStatus::FailedQueueTimeout: return WorkflowStatus::FailedQueueTimeout;
        case TaskStatus::FailedImagePull:    return WorkflowStatus::FailedImagePull;
        case TaskStatus::FailedUpstream:     return WorkflowStatus::FailedUpstream;
        case TaskStatus::FailedEvicted:      return WorkflowStatus::FailedEvicted;
        case TaskStatus::FailedPreempted:    return WorkflowStatus::FailedPreempted;
        case TaskStatus::FailedStartError:   return WorkflowStatus::FailedStartError;
        case TaskStatus::FailedStartTimeout: return WorkflowStatus::FailedStartTimeout;
        case TaskStatus::FailedSubmission:   return WorkflowStatus::FailedSubmission;
        case TaskStatus::Running:
        case TaskStatus::Initializing:       return WorkflowStatus::Running;
        case TaskStatus::Failed:             return WorkflowStatus::Failed;
        default:                             return WorkflowStatus::Waiting;
    }
}

}
