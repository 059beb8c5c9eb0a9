/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/lifecycle.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include <algorithm>

namespace dagpool {

TaskInstance& WorkflowRecord::current(const std::string& task) {
    const auto it = tasks.find(task);
    if (it == tasks.end() || it->second.empty()) {
        throw NotFoundError("Unknown task '" + task + "' in workflow " + id);
    }
    return it->second.back();
}

const TaskInstance& WorkflowRecord::current(const std::string& task) const {
    const auto it = tasks.find(task);
    if (it == tasks.end() || it->second.empty()) {
        throw NotFoundError("Unknown task '" + task + "' in workflow " + id);
    }
    return it->second.back();
}

TaskInstance* WorkflowRecord::instance(const TaskRef& ref) {
    const auto it = tasks.find(ref.task);
    if (it == tasks.end()) return nullptr;
    for (auto& candidate : it->second) {
        if (candidate.ref.retryId == ref.retryId) return &candidate;
    }
    return nullptr;
}

GroupRecord& WorkflowRecord::group(const std::string& name) {
    const auto it = groups.find(name);
    if (it == groups.end()) {
        throw NotFoundError("Unknown group '" + name + "' in workflow " + id);
    }
    return it->second;
}

const GroupRecord& WorkflowRecord::group(const std::string& name) const {
    const auto it = groups.find(name);
    if (it == groups.end()) {
        throw NotFoundError("Unknown group '" + name + "' in workflow " + id);
    }
    return it->second;
}

TaskStatus applyExitAction(TaskStatus reported, std::optional<int> exitCode,
                           const ExitActions& taskActions, const ExitActions& poolActions) {
    // Only a user command's own exit is remapped; backend failures keep their reason.
    if (!exitCode || (reported != TaskStatus::Completed && reported != TaskStatus::Failed)) {
        return reported;
    }
    auto action = taskActions.lookup(*exitCode);
    if (!action) {
        action = poolActions.lookup(*exitCode);
    }
    if (!action) {
        return reported;
    }
    switch (*action) {
        case ExitAction::Complete:   return TaskStatus::Completed;
        case ExitAction::Fail:       return TaskStatus::Failed;
        case ExitAction::Reschedule: return TaskStatus::Rescheduled;
        default: return reported;
    }
}

WorkflowStatus reduceWorkflowStatus(const std::vector<TaskStatus>& groupStatuses, bool everRan, bool canceled) {
    const bool allFinished = std::all_of(groupStatuses.begin(), groupStatuses.end(), isGroupFinished);
    if (allFinished) {
        const bool allCompleted = std::all_of(groupStatuses.begin(), groupStatuses.end(),
                                              [](TaskStatus s) { return s == TaskStatus::Completed; });
        if (allCompleted) return WorkflowStatus::Completed;
        if (canceled) return WorkflowStatus::FailedCanceled;
        // The root cause, not its downstream echo.
        for (const auto status : groupStatuses) {
            if (isFailed(status) && status != TaskStatus::FailedUpstream) {
                return workflowStatusFor(status);
            }
        }
        return WorkflowStatus::FailedUpstream;
    }

    const bool active = std::any_of(groupStatuses.begin(), groupStatuses.end(), [](TaskStatus s) {
        return s == TaskStatus::Running || s == TaskStatus::Initializing;
    });
    if (active) return WorkflowStatus::Running;
    return everRan ? WorkflowStatus::Waiting : WorkflowStatus::Pending;
}

WorkflowRecord& Lifecycle::create(const WorkflowId& id, std::shared_ptr<const WorkflowSpec> spec,
                                  std::shared_ptr<const DagResolver> dag, std::uint64_t sequence, TimePoint now) {
    auto record = std::make_unique<WorkflowRecord>();
    record->id = id;
    record->dag = std::move(dag);
    record->sequence = sequence;
    record->submitTime = now;

    for (const auto& group : spec->groups) {
        GroupRecord entry;
        entry.name = group.name;
        entry.key = makeGroupKey(id, group.name);
        entry.spec = std::shared_ptr<const GroupSpec>(spec, &group);
        record->groups.emplace(group.name, std::move(entry));

        for (const auto& task : group.tasks) {
            TaskInstance instance;
            instance.ref = TaskRef{id, task.name, 0};
            instance.group = group.name;
            instance.lead = task.lead;
            instance.created = now;
            instance.notBefore = now;
            record->tasks[task.name].push_back(std::move(instance));
        }
    }
    record->spec = std::move(spec);

    auto& stored = *record;
    workflows_[id] = std::move(record);
    LOG_DEBUG("Created records for workflow " + id);
    return stored;
}

WorkflowRecord* Lifecycle::find(const WorkflowId& id) noexcept {
    const auto it = workflows_.find(id);
    return it == workflows_.end() ? nullptr : it->second.get();
}

const WorkflowRecord* Lifecycle::find(const WorkflowId& id) const noexcept {
    const auto it = workflows_.find(id);
    return it == workflows_.end() ? nullptr : it->second.get();
}

std::vector<WorkflowRecord*> Lifecycle::all() {
    std::vector<WorkflowRecord*> records;
    for (auto& [id, record] : workflows_) {
        (void)id;
        records.push_back(record.get());
    }
    return records;
}

std::vector<const WorkflowRecord*> Lifecycle::all() const {
    std::vector<const WorkflowRecord*> records;
    for (const auto& [id, record] : workflows_) {
        (void)id;
        records.push_back(record.get());
    }
    return records;
}

void Lifecycle::erase(const WorkflowId& id) {
    workflows_.erase(id);
}

bool Lifecycle::transition(WorkflowRecord& workflow, TaskInstance& task, TaskStatus to,
                           const std::string& message, TimePoint now) {
    const auto from = task.status;
    if (from == to) {
        return true;
    }
    if (isFinished(from)) {
        LOG_DEBUG("Ignoring " + std::string(toString(to)) + " for finished task " + task.ref.str() +
                  " (" + toString(from) + ")");
        return false;
    }
    if (!isFinished(to) && progressRank(to) < progressRank(from)) {
        LOG_WARN("Refusing backward transition of " + task.ref.str() + ": " + toString(from) + " -> " +
                 toString(to));
        return false;
    }

    task.status = to;
    if (!message.empty()) {
        task.message = message;
    }
    if (to == TaskStatus::Scheduling) {
        task.scheduled = now;
    } else if (to == TaskStatus::Running) {
        task.started = now;
    } else if (isFinished(to)) {
        task.ended = now;
    }
    if (to == TaskStatus::Initializing || to == TaskStatus::Running) {
        if (!workflow.everRan) {
            workflow.everRan = true;
            workflow.startTime = now;
        }
    }

    LOG_DEBUG(task.ref.str() + " " + toString(from) + " -> " + toString(to) +
              (message.empty() ? "" : " (" + message + ")"));
    return true;
}

void Lifecycle::reconcile(WorkflowRecord& workflow, TaskInstance& task, TaskStatus to,
                          const std::string& message, TimePoint now) {
    (void)workflow;
    if (task.status == to) return;
    LOG_INFO("Reconciled " + task.ref.str() + " " + toString(task.status) + " -> " + toString(to));
    task.status = to;
    if (!message.empty()) task.message = message;
    task.ended = now;
}

TaskInstance& Lifecycle::reschedule(WorkflowRecord& workflow, const std::string& task, const std::string& cause,
                                    TimePoint now, TimePoint notBefore) {
    auto& history = workflow.tasks.at(task);
    auto& retired = history.back();
    const auto from = retired.status;
    retired.status = TaskStatus::Rescheduled;
    retired.message = cause;
    retired.ended = now;
    LOG_DEBUG(retired.ref.str() + " " + toString(from) + " -> RESCHEDULED (" + cause + ")");

    TaskInstance next;
    next.ref = retired.ref;
    next.ref.retryId += 1;
    next.group = retired.group;
    next.lead = retired.lead;
    next.created = now;
    next.notBefore = notBefore;
    history.push_back(std::move(next));
    return history.back();
}

TaskInstance& Lifecycle::resubmit(WorkflowRecord& workflow, const std::string& task, TimePoint now) {
    auto& history = workflow.tasks.at(task);
    TaskInstance next;
    next.ref = history.back().ref;
    next.ref.retryId += 1;
    next.group = history.back().group;
    next.lead = history.back().lead;
    next.created = now;
    next.notBefore = now;
    history.push_back(std::move(next));
    LOG_DEBUG("Resubmitted " + history.back().ref.str());
    return history.back();
}

void Lifecycle::restart(TaskInstance& task) {
    ++task.restarts;
    LOG_DEBUG("Restarting " + task.ref.str() + " (restart " + std::to_string(task.restarts) + ")");
}

std::vector<MemberStatus> Lifecycle::memberStatuses(const WorkflowRecord& workflow, const GroupRecord& group) const {
    std::vector<MemberStatus> members;
    for (const auto& task : group.spec->tasks) {
        members.push_back({workflow.current(task.name).status, task.lead});
    }
    return members;
}

TaskStatus Lifecycle::refreshGroup(WorkflowRecord& workflow, GroupRecord& group) {
    const auto next = reduceGroupStatus(memberStatuses(workflow, group), group.spec->ignoreNonleadStatus);
    if (next != group.status) {
        LOG_DEBUG("Group " + group.key + " " + toString(group.status) + " -> " + toString(next));
        group.status = next;
    }
    return next;
}

WorkflowStatus Lifecycle::refreshWorkflow(WorkflowRecord& workflow, TimePoint now) {
    std::vector<TaskStatus> statuses;
    for (const auto& name : workflow.dag->groupOrder()) {
        statuses.push_back(workflow.group(name).status);
    }
    const auto next = reduceWorkflowStatus(statuses, workflow.everRan, workflow.canceled);
    if (next == workflow.status) {
        return next;
    }

    LOG_INFO("Workflow " + workflow.id + " " + toString(workflow.status) + " -> " + toString(next));
    workflow.status = next;
    if (isFinished(next)) {
        workflow.endTime = now;
    }
    if (isFailed(next) && workflow.failureMessage.empty()) {
        for (const auto& name : workflow.dag->groupOrder()) {
            const auto& group = workflow.group(name);
            if (workflowStatusFor(group.status) != next) continue;
            for (const auto& task : group.spec->tasks) {
                const auto& instance = workflow.current(task.name);
                if (instance.status == group.status && !instance.message.empty()) {
                    workflow.failureMessage = "Group " + name + ": task " + task.name + ": " + instance.message;
                    break;
                }
            }
            if (workflow.failureMessage.empty()) {
                workflow.failureMessage = "Group " + name + " " + toString(group.status);
            }
            break;
        }
    }
    return next;
}

std::vector<std::string> Lifecycle::releaseReadyGroups(WorkflowRecord& workflow, TimePoint now) {
    std::vector<std::string> released;
    const auto succeeded = [&](const std::string& upstream) {
        return workflow.group(upstream).status == TaskStatus::Completed;
    };

    for (const auto& name : workflow.dag->groupOrder()) {
        auto& group = workflow.group(name);
        if (group.eligible || isGroupFinished(group.status)) continue;

        if (!workflow.dag->isGroupReady(name, succeeded)) {
            for (const auto& task : group.spec->tasks) {
                auto& instance = workflow.current(task.name);
                if (instance.status == TaskStatus::Submitting) {
                    transition(workflow, instance, TaskStatus::Waiting, "", now);
                }
            }
            refreshGroup(workflow, group);
            continue;
        }

        group.eligible = true;
        for (const auto& task : group.spec->tasks) {
            auto& instance = workflow.current(task.name);
            const bool ordered = !workflow.dag->intraGroupUpstream(task.name).empty();
            transition(workflow, instance, ordered ? TaskStatus::Waiting : TaskStatus::Processing, "", now);
        }
        refreshGroup(workflow, group);
        released.push_back(name);
    }
    return released;
}

std::vector<std::string> Lifecycle::releaseReadyTasks(WorkflowRecord& workflow, GroupRecord& group, TimePoint now) {
    std::vector<std::string> released;
    if (!group.eligible) return released;

    for (const auto& task : group.spec->tasks) {
        auto& instance = workflow.current(task.name);
        if (instance.status != TaskStatus::Waiting) continue;

        bool ready = true;
        std::string failedInput;
        for (const auto& upstream : workflow.dag->intraGroupUpstream(task.name)) {
            const auto status = workflow.current(upstream).status;
            if (isFailed(status)) {
                failedInput = upstream;
                break;
            }
            if (status != TaskStatus::Completed) ready = false;
        }

        if (!failedInput.empty()) {
            transition(workflow, instance, TaskStatus::FailedUpstream, "Upstream task " + failedInput + " failed", now);
        } else if (ready) {
            transition(workflow, instance, TaskStatus::Processing, "", now);
            released.push_back(task.name);
        }
    }
    refreshGroup(workflow, group);
    return released;
}

std::vector<std::string> Lifecycle::failDownstream(WorkflowRecord& workflow, const std::string& group, TimePoint now) {
    std::vector<std::string> failed;
    const auto& cause = workflow.group(group);
    for (const auto& name : workflow.dag->downstreamClosure(group)) {
        auto& downstream = workflow.group(name);
        if (isGroupFinished(downstream.status)) continue;

        for (const auto& task : downstream.spec->tasks) {
            auto& instance = workflow.current(task.name);
            if (!isFinished(instance.status)) {
                transition(workflow, instance, TaskStatus::FailedUpstream,
                           "Upstream group " + group + " ended " + toString(cause.status), now);
            }
        }
        refreshGroup(workflow, downstream);
        failed.push_back(name);
    }
    if (!failed.empty()) {
        LOG_INFO("Workflow " + workflow.id + ": " + std::to_string(failed.size()) +
                 " groups failed upstream of " + group);
    }
    return failed;
}

}
