/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dagpool/dag.hpp"
#include "dagpool/exit_actions.hpp"
#include "dagpool/gang.hpp"
#include "dagpool/status.hpp"
#include "dagpool/types.hpp"
#include "dagpool/workflow_spec.hpp"

namespace dagpool {

struct TaskInstance {
    TaskRef ref;
    std::string group;
    bool lead = false;
    TaskStatus status = TaskStatus::Submitting;
    std::string message;
    std::optional<int> exitCode;
    std::string node;
    int restarts = 0;
    TimePoint created;
    std::optional<TimePoint> scheduled;
    std::optional<TimePoint> started;
    std::optional<TimePoint> ended;
    // Earliest placement of a backed-off replacement.
    TimePoint notBefore;
};

struct GroupRecord {
    std::string name;
    std::string key;
    std::shared_ptr<const GroupSpec> spec;
    TaskStatus status = TaskStatus::Submitting;
    // Upstream groups completed and tasks released.
    bool eligible = false;
    bool queued = false;
    bool reserved = false;
    std::optional<TimePoint> queueDeadline;
    std::optional<TimePoint> execDeadline;
};

struct WorkflowRecord {
    WorkflowId id;
    std::shared_ptr<const WorkflowSpec> spec;
    std::shared_ptr<const DagResolver> dag;
    std::uint64_t sequence = 0;
    TimePoint submitTime;
    std::optional<TimePoint> startTime;
    std::optional<TimePoint> endTime;
    WorkflowStatus status = WorkflowStatus::Pending;
    bool everRan = false;
    bool canceled = false;
    std::string canceledBy;
    std::string failureMessage;
    Seconds queueTimeout{0};
    Seconds execTimeout{0};
    std::map<std::string, GroupRecord> groups;
    // Every instance of every task, oldest first. The last one is current.
    std::map<std::string, std::vector<TaskInstance>> tasks;

    [[nodiscard]] TaskInstance& current(const std::string& task);
    [[nodiscard]] const TaskInstance& current(const std::string& task) const;
    [[nodiscard]] TaskInstance* instance(const TaskRef& ref);
    [[nodiscard]] GroupRecord& group(const std::string& name);
    [[nodiscard]] const GroupRecord& group(const std::string& name) const;
    [[nodiscard]] const std::string& pool() const noexcept { return spec->pool; }
    [[nodiscard]] Priority priority() const noexcept { return spec->priority; }
};

// Maps an exit code through the task's, then the pool's, exit actions.
// Returns the reported status when no range matches.
[[nodiscard]] TaskStatus applyExitAction(TaskStatus reported, std::optional<int> exitCode,
                                         const ExitActions& taskActions, const ExitActions& poolActions);

// Group statuses in topological order.
[[nodiscard]] WorkflowStatus reduceWorkflowStatus(const std::vector<TaskStatus>& groupStatuses,
                                                  bool everRan, bool canceled);

// Owns workflow, group and task records and is the only code that changes
// their status. Not synchronized; the scheduler serializes access.
class Lifecycle {
public:
    WorkflowRecord& create(const WorkflowId& id, std::shared_ptr<const WorkflowSpec> spec,
                           std::shared_ptr<const DagResolver> dag, std::uint64_t sequence, TimePoint now);

    [[nodiscard]] WorkflowRecord* find(const WorkflowId& id) noexcept;
    [[nodiscard]] const WorkflowRecord* find(const WorkflowId& id) const noexcept;
    [[nodiscard]] std::vector<WorkflowRecord*> all();
    [[nodiscard]] std::vector<const WorkflowRecord*> all() const;
    void erase(const WorkflowId& id);
    [[nodiscard]] std::size_t size() const noexcept { return workflows_.size(); }

    // Forward-only. Returns false, and changes nothing, for a transition out
    // of a finished status or backwards in progress.
    bool transition(WorkflowRecord& workflow, TaskInstance& task, TaskStatus to,
                    const std::string& message, TimePoint now);
    // Overwrites a finished status with the executor's final word.
    void reconcile(WorkflowRecord& workflow, TaskInstance& task, TaskStatus to,
                   const std::string& message, TimePoint now);

    // Retires the current instance as RESCHEDULED and appends its successor.
    TaskInstance& reschedule(WorkflowRecord& workflow, const std::string& task, const std::string& cause,
                             TimePoint now, TimePoint notBefore);
    // Appends a successor to an instance that already ended with a failure.
    TaskInstance& resubmit(WorkflowRecord& workflow, const std::string& task, TimePoint now);
    void restart(TaskInstance& task);

    TaskStatus refreshGroup(WorkflowRecord& workflow, GroupRecord& group);
    WorkflowStatus refreshWorkflow(WorkflowRecord& workflow, TimePoint now);

    // Groups whose upstream groups all completed: their tasks leave
    // SUBMITTING/WAITING. Returns the names of the newly eligible groups.
    std::vector<std::string> releaseReadyGroups(WorkflowRecord& workflow, TimePoint now);
    // Tasks of an eligible group whose intra-group inputs completed move to
    // PROCESSING; inputs that failed for good fail them with FAILED_UPSTREAM.
    std::vector<std::string> releaseReadyTasks(WorkflowRecord& workflow, GroupRecord& group, TimePoint now);
    // Fails every group downstream of `group` that has not started.
    std::vector<std::string> failDownstream(WorkflowRecord& workflow, const std::string& group, TimePoint now);

    [[nodiscard]] std::vector<MemberStatus> memberStatuses(const WorkflowRecord& workflow,
                                                           const GroupRecord& group) const;

private:
    std::map<WorkflowId, std::unique_ptr<WorkflowRecord>> workflows_;
};

}
