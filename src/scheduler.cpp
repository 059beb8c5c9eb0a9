/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/scheduler.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include <algorithm>

namespace dagpool {

namespace {

Seconds resolveTimeout(Seconds workflow, Seconds pool, Seconds fallback) {
    if (workflow.count() > 0) return workflow;
    if (pool.count() > 0) return pool;
    return fallback;
}

bool placed(TaskStatus status) {
    return !isFinished(status) && progressRank(status) >= progressRank(TaskStatus::Scheduling);
}

bool contains(const std::vector<TaskRef>& refs, const TaskRef& ref) {
    return std::find(refs.begin(), refs.end(), ref) != refs.end();
}

}

Scheduler::Scheduler(const Config& config, Executor& executor)
    : executor_(executor),
      ledger_(config.pools, config.backends),
      admission_(ledger_),
      settings_(config.scheduler),
      gangs_(config.scheduler.barrierTimeout) {
    LOG_INFO("Scheduler ready: " + std::to_string(config.pools.size()) + " pools, " +
             std::to_string(config.backends.size()) + " backends, retry ceiling " +
             std::to_string(settings_.maxRetryPerTask));
}

void Scheduler::setAdmissionTrigger(AdmissionTrigger trigger) {
    std::lock_guard<std::mutex> lock(triggerMutex_);
    trigger_ = std::move(trigger);
}

// ---------------------------------------------------------------------------
// Submission

SubmitResult Scheduler::submit(const WorkflowSpec& spec, TimePoint now, const WorkflowId& id) {
    Effects fx;
    SubmitResult result;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        result = accept(spec, now, id, fx);
    }
    finish(fx, now);
    return result;
}

SubmitResult Scheduler::accept(const WorkflowSpec& input, TimePoint now, const WorkflowId& requestedId,
                               Effects& fx) {
    SubmitResult result;
    const auto sequence = ++nextSequence_;
    result.id = requestedId.empty() ? input.name + "-" + std::to_string(sequence) : requestedId;

    if (lifecycle_.find(result.id) || archive_.count(result.id)) {
        result.error = SubmissionError::DuplicateId;
        result.message = "Workflow id already in use: " + result.id;
        LOG_WARN(result.message);
        return result;
    }

    const auto pool = ledger_.poolConfig(input.pool);
    if (!pool) {
        result.error = SubmissionError::UnknownPool;
        result.message = "Unknown pool '" + input.pool + "'";
        reject(result.id, input, result.message, now);
        return result;
    }

    std::shared_ptr<const DagResolver> dag;
    try {
        dag = std::make_shared<const DagResolver>(input);
    } catch (const CyclicDependencyError& e) {
        result.error = SubmissionError::CyclicDependency;
        result.message = e.what();
        reject(result.id, input, result.message, now);
        return result;
    } catch (const ValidationError& e) {
        result.error = SubmissionError::InvalidDefinition;
        result.message = e.what();
        reject(result.id, input, result.message, now);
        return result;
    }

    for (const auto& group : input.groups) {
        auto reason = infeasibilityReason(*pool, group);
        if (reason.empty() && !ledger_.canEverAdmit(input.pool, input.priority, group.demand())) {
            reason = "Group '" + group.name + "' demands " + group.demand().toString() +
                     ", more than pool '" + input.pool + "' can ever grant at " + toString(input.priority) +
                     " priority";
        }
        if (!reason.empty()) {
            result.error = SubmissionError::Infeasible;
            result.message = reason;
            reject(result.id, input, result.message, now);
            return result;
        }
    }

    auto& workflow = lifecycle_.create(result.id, std::make_shared<const WorkflowSpec>(input), dag, sequence, now);
    workflow.queueTimeout = resolveTimeout(input.queueTimeout, pool->defaultQueueTimeout,
                                           settings_.defaultQueueTimeout);
    workflow.execTimeout = resolveTimeout(input.execTimeout, pool->defaultExecTimeout,
                                          settings_.defaultExecTimeout);

    LOG_INFO("Accepted workflow " + result.id + " (" + toString(input.priority) + ", pool " + input.pool +
             ", " + std::to_string(input.groups.size()) + " groups, " + std::to_string(input.taskCount()) +
             " tasks)");

    releaseGroups(workflow, now, fx);
    lifecycle_.refreshWorkflow(workflow, now);
    result.ok = true;
    return result;
}

void Scheduler::reject(const WorkflowId& id, const WorkflowSpec& spec, const std::string& reason, TimePoint now) {
    LOG_WARN("Rejected workflow " + id + ": " + reason);

    WorkflowView view;
    view.summary.id = id;
    view.summary.name = spec.name;
    view.summary.user = spec.user;
    view.summary.pool = spec.pool;
    view.summary.priority = spec.priority;
    view.summary.status = WorkflowStatus::FailedSubmission;
    view.summary.submitTime = now;
    view.summary.endTime = now;
    view.failureMessage = reason;

    for (const auto& group : spec.groups) {
        GroupView groupView;
        groupView.name = group.name;
        groupView.status = TaskStatus::FailedSubmission;
        view.groups.push_back(std::move(groupView));

        for (const auto& task : group.tasks) {
            TaskView taskView;
            taskView.name = task.name;
            taskView.group = group.name;
            taskView.lead = task.lead;
            taskView.status = TaskStatus::FailedSubmission;
            taskView.message = reason;
            view.tasks.push_back(std::move(taskView));
        }
    }
    storeArchived(std::move(view));
}

void Scheduler::releaseGroups(WorkflowRecord& workflow, TimePoint now, Effects& fx) {
    for (const auto& name : lifecycle_.releaseReadyGroups(workflow, now)) {
        enqueueGroup(workflow, workflow.group(name), now, fx);
    }
}

void Scheduler::enqueueGroup(WorkflowRecord& workflow, GroupRecord& group, TimePoint now, Effects& fx) {
    requeueGroup(workflow, group, now);
    fx.pools.insert(workflow.pool());
}

void Scheduler::requeueGroup(WorkflowRecord& workflow, GroupRecord& group, TimePoint now) {
    QueueEntry entry;
    entry.groupKey = group.key;
    entry.pool = workflow.pool();
    entry.priority = workflow.priority();
    entry.submitTime = workflow.submitTime;
    entry.sequence = workflow.sequence;
    entry.group = group.spec;
    admission_.enqueue(std::move(entry));

    group.queued = true;
    group.queueDeadline.reset();
    if (workflow.queueTimeout.count() > 0) {
        group.queueDeadline = now + workflow.queueTimeout;
    }
}

// ---------------------------------------------------------------------------
// Admission

void Scheduler::admit(const std::string& pool, TimePoint now) {
    auto pass = admission_.tryAdmit(pool);
    if (pass.admitted.empty() && pass.infeasible.empty() && pass.preempted.empty()) {
        return;
    }

    Effects fx;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        for (const auto& victim : pass.preempted) {
            onPreempted(victim, now, fx);
        }
        for (const auto& [entry, reason] : pass.infeasible) {
            onInfeasible(entry, reason, now, fx);
        }
        for (const auto& outcome : pass.admitted) {
            onAdmitted(outcome.entry, now, fx);
        }
    }
    finish(fx, now);
}

void Scheduler::admitAll(TimePoint now) {
    for (const auto& pool : admission_.pools()) {
        admit(pool, now);
    }
}

void Scheduler::onAdmitted(const QueueEntry& entry, TimePoint now, Effects& fx) {
    const auto [id, name] = splitGroupKey(entry.groupKey);
    auto* workflow = lifecycle_.find(id);
    if (!workflow || !workflow->groups.count(name)) {
        ledger_.release(entry.groupKey);
        fx.capacityFreed = true;
        return;
    }

    auto& group = workflow->group(name);
    if (group.reserved) {
        LOG_DEBUG("Skipping repeated admission of " + entry.groupKey);
        return;
    }
    if (!ledger_.reservation(entry.groupKey)) {
        LOG_DEBUG("Admission of " + entry.groupKey + " was preempted before it took effect");
        return;
    }
    if (workflow->canceled || isGroupFinished(group.status) || !group.queued) {
        group.queued = false;
        ledger_.release(entry.groupKey);
        fx.capacityFreed = true;
        return;
    }

    group.queued = false;
    group.reserved = true;
    group.queueDeadline.reset();
    if (workflow->execTimeout.count() > 0) {
        group.execDeadline = now + workflow->execTimeout;
    }

    Command place{Command::Kind::Place, group.key, {}, {}, true};
    for (const auto& task : group.spec->tasks) {
        auto& instance = workflow->current(task.name);
        if (instance.status != TaskStatus::Processing && instance.status != TaskStatus::Scheduling) continue;
        if (instance.notBefore > now) continue;
        lifecycle_.transition(*workflow, instance, TaskStatus::Scheduling, "", now);
        place.refs.push_back(instance.ref);
        place.launches.push_back(makeLaunch(*workflow, group, instance));
    }
    lifecycle_.refreshGroup(*workflow, group);

    if (!place.refs.empty()) {
        gangs_.begin(group.key, place.refs, group.spec->hasBarrier(), now);
        fx.commands.push_back(std::move(place));
    }
    lifecycle_.refreshWorkflow(*workflow, now);
}

void Scheduler::onInfeasible(const QueueEntry& entry, const std::string& reason, TimePoint now, Effects& fx) {
    const auto [id, name] = splitGroupKey(entry.groupKey);
    auto* workflow = lifecycle_.find(id);
    if (!workflow || !workflow->groups.count(name)) return;
    auto& group = workflow->group(name);
    if (isGroupFinished(group.status)) return;

    group.queued = false;
    group.queueDeadline.reset();
    for (const auto& task : group.spec->tasks) {
        auto& instance = workflow->current(task.name);
        if (!isFinished(instance.status)) {
            lifecycle_.transition(*workflow, instance, TaskStatus::FailedSubmission, reason, now);
        }
    }
    updateGroup(*workflow, group, now, fx);
    lifecycle_.refreshWorkflow(*workflow, now);
}

void Scheduler::onPreempted(const Reservation& victim, TimePoint now, Effects& fx) {
    const auto [id, name] = splitGroupKey(victim.holder);
    auto* workflow = lifecycle_.find(id);
    if (!workflow || !workflow->groups.count(name)) return;
    auto& group = workflow->group(name);
    if (isGroupFinished(group.status)) return;

    LOG_WARN("Preempted group " + group.key + " (" + toString(victim.priority) + ", " +
             victim.total().toString() + " in pool " + victim.pool + ")");

    group.reserved = false;
    group.execDeadline.reset();
    gangs_.abandon(group.key);

    const std::string message = "Preempted to reclaim capacity borrowed by pool " + victim.pool;
    std::vector<std::string> preempted;
    for (const auto& task : group.spec->tasks) {
        auto& instance = workflow->current(task.name);
        if (isFinished(instance.status)) continue;
        if (placed(instance.status)) {
            fx.commands.push_back({Command::Kind::Cancel, group.key, {instance.ref}, {}, false});
        }
        lifecycle_.transition(*workflow, instance, TaskStatus::FailedPreempted, message, now);
        preempted.push_back(task.name);
    }

    if (!workflow->spec->reschedulePreempted || workflow->canceled) {
        updateGroup(*workflow, group, now, fx);
        lifecycle_.refreshWorkflow(*workflow, now);
        return;
    }

    for (const auto& task : preempted) {
        auto& next = lifecycle_.resubmit(*workflow, task, now);
        const bool ordered = !workflow->dag->intraGroupUpstream(task).empty();
        lifecycle_.transition(*workflow, next, ordered ? TaskStatus::Waiting : TaskStatus::Processing, "", now);
    }
    lifecycle_.releaseReadyTasks(*workflow, group, now);
    enqueueGroup(*workflow, group, now, fx);
    lifecycle_.refreshWorkflow(*workflow, now);
}

void Scheduler::onPlacementRejected(const Command& command, TimePoint now, Effects& fx) {
    const auto [id, name] = splitGroupKey(command.groupKey);
    auto* workflow = lifecycle_.find(id);
    if (!workflow || !workflow->groups.count(name)) return;
    auto& group = workflow->group(name);
    if (isGroupFinished(group.status)) return;

    if (command.initial) {
        LOG_WARN("Backend rejected placement of " + group.key + ", returning it to the queue");
        gangs_.abandon(group.key);
        if (group.reserved) {
            ledger_.release(group.key);
            group.reserved = false;
        }
        group.execDeadline.reset();
        // Picked up by the next tick rather than retried right away.
        requeueGroup(*workflow, group, now);
        lifecycle_.refreshWorkflow(*workflow, now);
        return;
    }

    for (const auto& ref : command.refs) {
        auto* instance = workflow->instance(ref);
        if (!instance || instance != &workflow->current(ref.task) || isFinished(instance->status)) continue;
        handleExit(*workflow, group, *instance, TaskStatus::FailedBackendError, "Placement rejected by backend",
                   std::nullopt, now, fx);
    }
    updateGroup(*workflow, group, now, fx);
    settle(*workflow, now, fx);
}

// ---------------------------------------------------------------------------
// Executor events

void Scheduler::onTaskEvent(const TaskEvent& event, TimePoint now) noexcept {
    try {
        Effects fx;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            handleEvent(event, now, fx);
        }
        finish(fx, now);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to handle " + std::string(toString(event.phase)) + " event for " + event.ref.str() +
                  ": " + e.what());
    }
}

void Scheduler::handleEvent(const TaskEvent& event, TimePoint now, Effects& fx) {
    auto* workflow = lifecycle_.find(event.ref.workflow);
    if (!workflow) {
        LOG_DEBUG("Event for unknown workflow " + event.ref.workflow);
        return;
    }
    auto* task = workflow->instance(event.ref);
    if (!task) {
        LOG_WARN("Event for unknown task " + event.ref.str());
        return;
    }
    if (task != &workflow->current(event.ref.task)) {
        LOG_DEBUG("Ignoring " + std::string(toString(event.phase)) + " from retired instance " + event.ref.str());
        return;
    }

    auto& group = workflow->group(task->group);
    LOG_TRACE(event.ref.str() + " reported " + toString(event.phase));

    switch (event.phase) {
        case ExecutorPhase::Initializing:
            if (!event.node.empty()) task->node = event.node;
            advanceGang(*workflow, group, gangs_.markPlaced(group.key, task->ref), now, fx);
            break;

        case ExecutorPhase::Ready:
            if (!event.node.empty()) task->node = event.node;
            advanceGang(*workflow, group, gangs_.markReady(group.key, task->ref), now, fx);
            break;

        case ExecutorPhase::Running:
            if (task->status == TaskStatus::Initializing) {
                if (gangs_.hasBarrier(group.key) && contains(gangs_.pending(group.key), task->ref)) {
                    LOG_WARN(task->ref.str() + " reported RUNNING before its start barrier released");
                } else {
                    lifecycle_.transition(*workflow, *task, TaskStatus::Running, "", now);
                }
            }
            break;

        case ExecutorPhase::Exited:
            handleExit(*workflow, group, *task, event.outcome, event.reason, event.exitCode, now, fx);
            break;
    }

    updateGroup(*workflow, group, now, fx);
    settle(*workflow, now, fx);
}

void Scheduler::handleExit(WorkflowRecord& workflow, GroupRecord& group, TaskInstance& task, TaskStatus reported,
                           const std::string& reason, std::optional<int> exitCode, TimePoint now, Effects& fx) {
    if (isFinished(task.status)) {
        if (isCanceled(task.status) && isGroupFinished(reported) && reported != task.status) {
            if (exitCode) task.exitCode = exitCode;
            lifecycle_.reconcile(workflow, task, reported, reason, now);
        } else {
            LOG_DEBUG("Ignoring exit of finished task " + task.ref.str());
        }
        return;
    }

    if (exitCode) task.exitCode = exitCode;

    const auto* spec = group.spec->findTask(task.ref.task);
    const auto pool = ledger_.poolConfig(workflow.pool());
    const ExitActions noActions;
    auto outcome = applyExitAction(reported, exitCode, spec ? spec->exitActions : noActions,
                                   pool ? pool->defaultExitActions : noActions);

    std::string message = reason;
    if (outcome != reported) {
        message = "Exit code " + std::to_string(*exitCode) + " mapped to " + toString(outcome);
    }
    if (!isFinished(outcome)) {
        LOG_WARN(task.ref.str() + " exited with non-terminal status " + toString(outcome));
        outcome = TaskStatus::FailedBackendError;
    }

    // Reschedule appends to the task's history, so nothing below may touch `task`.
    const TaskRef ref = task.ref;
    const bool lead = task.lead;

    bool retry = false;
    TimePoint notBefore = now;
    if (outcome == TaskStatus::Rescheduled) {
        if (ref.retryId < settings_.maxRetryPerTask && !workflow.canceled) {
            retry = true;
        } else {
            outcome = reported == TaskStatus::Rescheduled ? TaskStatus::Failed : reported;
            message += "; reschedule ignored at retry " + std::to_string(ref.retryId);
        }
    } else if (isFailed(outcome) && !workflow.canceled && ref.retryId < settings_.maxRetryPerTask) {
        switch (retryPolicy(outcome)) {
            case RetryPolicy::Reschedule:
                retry = true;
                break;
            case RetryPolicy::Backoff:
                retry = true;
                notBefore = backoffUntil(ref.retryId, now);
                break;
            default:
                break;
        }
    }

    if (retry) {
        const std::string cause = outcome == TaskStatus::Rescheduled
            ? message
            : std::string(toString(outcome)) + (message.empty() ? "" : ": " + message);
        LOG_INFO("Rescheduling " + ref.str() + " after " + cause +
                 (notBefore > now ? " (backoff " +
                     std::to_string(std::chrono::duration_cast<Seconds>(notBefore - now).count()) + "s)" : ""));
        lifecycle_.reschedule(workflow, ref.task, cause, now, notBefore);
        applyPeerAction(workflow, group, ref.task, lead, TaskStatus::Rescheduled, now, fx);
    } else {
        if (isFailed(outcome)) {
            LOG_WARN(ref.str() + " ended " + toString(outcome) + (message.empty() ? "" : ": " + message));
        }
        lifecycle_.transition(workflow, task, outcome, message, now);
        applyPeerAction(workflow, group, ref.task, lead, outcome, now, fx);
    }

    advanceGang(workflow, group, gangs_.drop(group.key, ref), now, fx);
}

void Scheduler::applyPeerAction(WorkflowRecord& workflow, GroupRecord& group, const std::string& task, bool lead,
                                TaskStatus outcome, TimePoint now, Effects& fx) {
    const auto action = peerActionFor(lead, outcome, group.spec->ignoreNonleadStatus);
    if (action == PeerAction::None) return;

    for (const auto& member : group.spec->tasks) {
        if (member.name == task) continue;
        auto& peer = workflow.current(member.name);
        if (isFinished(peer.status)) continue;

        if (action == PeerAction::Restart) {
            if (peer.status != TaskStatus::Running) continue;
            lifecycle_.restart(peer);
            gangs_.rearm(group.key, {peer.ref}, now);
            fx.commands.push_back({Command::Kind::Restart, group.key, {peer.ref}, {}, false});
            continue;
        }

        if (placed(peer.status)) {
            fx.commands.push_back({Command::Kind::Cancel, group.key, {peer.ref}, {}, false});
        }
        (void)gangs_.drop(group.key, peer.ref);
        if (action == PeerAction::Stop) {
            lifecycle_.transition(workflow, peer, stoppedPeerStatus(outcome),
                                  "Stopped after lead task " + task + " ended " + toString(outcome), now);
        } else {
            lifecycle_.transition(workflow, peer, TaskStatus::Failed,
                                  "Stopped after task " + task + " ended " + toString(outcome), now);
        }
    }
}

void Scheduler::advanceGang(WorkflowRecord& workflow, GroupRecord& group, GangProgress progress, TimePoint now,
                            Effects& fx) {
    if (progress == GangProgress::AllPlaced || progress == GangProgress::AllReady) {
        for (const auto& ref : gangs_.pending(group.key)) {
            auto* instance = workflow.instance(ref);
            if (instance && instance->status == TaskStatus::Scheduling) {
                lifecycle_.transition(workflow, *instance, TaskStatus::Initializing, "", now);
            }
        }
    }

    if (gangs_.hasBarrier(group.key)) {
        if (progress == GangProgress::AllReady) {
            startMembers(workflow, group, gangs_.release(group.key), now, fx);
        }
        return;
    }

    for (const auto& ref : gangs_.ready(group.key)) {
        auto* instance = workflow.instance(ref);
        if (!instance) continue;
        if (instance->status == TaskStatus::Initializing || instance->status == TaskStatus::Running) {
            gangs_.releaseMember(group.key, ref);
            startMembers(workflow, group, {ref}, now, fx);
        }
    }
}

void Scheduler::startMembers(WorkflowRecord& workflow, GroupRecord& group, const std::vector<TaskRef>& refs,
                             TimePoint now, Effects& fx) {
    Command release{Command::Kind::Release, group.key, {}, {}, false};
    for (const auto& ref : refs) {
        auto* instance = workflow.instance(ref);
        if (!instance || isFinished(instance->status)) continue;
        if (instance->status == TaskStatus::Initializing) {
            lifecycle_.transition(workflow, *instance, TaskStatus::Running, "", now);
        }
        if (instance->status == TaskStatus::Running) {
            release.refs.push_back(ref);
        }
    }
    if (release.refs.empty()) return;

    if (release.refs.size() > 1) {
        LOG_INFO("Releasing start barrier of " + group.key + " for " + std::to_string(release.refs.size()) +
                 " tasks");
    }
    fx.commands.push_back(std::move(release));
}

// ---------------------------------------------------------------------------
// Group and workflow progression

void Scheduler::failGroup(WorkflowRecord& workflow, GroupRecord& group, TaskStatus status,
                          const std::string& message, TimePoint now, Effects& fx) {
    LOG_WARN("Group " + group.key + " " + toString(status) + ": " + message);
    for (const auto& task : group.spec->tasks) {
        auto& instance = workflow.current(task.name);
        if (isFinished(instance.status)) continue;
        if (placed(instance.status)) {
            fx.commands.push_back({Command::Kind::Cancel, group.key, {instance.ref}, {}, false});
        }
        (void)gangs_.drop(group.key, instance.ref);
        lifecycle_.transition(workflow, instance, status, message, now);
    }
    updateGroup(workflow, group, now, fx);
}

void Scheduler::updateGroup(WorkflowRecord& workflow, GroupRecord& group, TimePoint now, Effects& fx) {
    const bool wasFinished = isGroupFinished(group.status);
    const auto status = lifecycle_.refreshGroup(workflow, group);
    if (!wasFinished && isGroupFinished(status)) {
        onGroupFinished(workflow, group, now, fx);
    }
}

void Scheduler::onGroupFinished(WorkflowRecord& workflow, GroupRecord& group, TimePoint now, Effects& fx) {
    const auto status = group.status;
    if (isFailed(status)) {
        LOG_WARN("Group " + group.key + " finished " + toString(status));
    } else {
        LOG_INFO("Group " + group.key + " finished " + toString(status));
    }

    if (group.queued) {
        admission_.remove(workflow.pool(), group.key);
        group.queued = false;
    }
    group.queueDeadline.reset();
    group.execDeadline.reset();
    if (group.reserved) {
        ledger_.release(group.key);
        group.reserved = false;
        fx.capacityFreed = true;
    }
    gangs_.abandon(group.key);

    // Members the deciding task left behind, e.g. still waiting on an input.
    for (const auto& task : group.spec->tasks) {
        auto& instance = workflow.current(task.name);
        if (isFinished(instance.status)) continue;
        if (placed(instance.status)) {
            fx.commands.push_back({Command::Kind::Cancel, group.key, {instance.ref}, {}, false});
        }
        lifecycle_.transition(workflow, instance,
                              status == TaskStatus::Completed ? TaskStatus::Completed : TaskStatus::Failed,
                              "Stopped with group " + group.name, now);
    }
    lifecycle_.refreshGroup(workflow, group);

    if (status == TaskStatus::Completed) {
        releaseGroups(workflow, now, fx);
        return;
    }
    for (const auto& name : lifecycle_.failDownstream(workflow, group.name, now)) {
        auto& downstream = workflow.group(name);
        if (downstream.queued) {
            admission_.remove(workflow.pool(), downstream.key);
            downstream.queued = false;
        }
        downstream.queueDeadline.reset();
    }
}

void Scheduler::flushPlacements(WorkflowRecord& workflow, TimePoint now, Effects& fx) {
    for (auto& [name, group] : workflow.groups) {
        (void)name;
        if (!group.reserved || isGroupFinished(group.status)) continue;

        lifecycle_.releaseReadyTasks(workflow, group, now);

        Command place{Command::Kind::Place, group.key, {}, {}, false};
        for (const auto& task : group.spec->tasks) {
            auto& instance = workflow.current(task.name);
            if (instance.notBefore > now) continue;
            if (instance.status == TaskStatus::Submitting) {
                lifecycle_.transition(workflow, instance, TaskStatus::Processing, "", now);
            }
            if (instance.status != TaskStatus::Processing) continue;
            lifecycle_.transition(workflow, instance, TaskStatus::Scheduling, "", now);
            place.refs.push_back(instance.ref);
            place.launches.push_back(makeLaunch(workflow, group, instance));
        }
        if (!place.refs.empty()) {
            gangs_.begin(group.key, place.refs, group.spec->hasBarrier(), now);
            fx.commands.push_back(std::move(place));
        }
        updateGroup(workflow, group, now, fx);
    }
}

void Scheduler::settle(WorkflowRecord& workflow, TimePoint now, Effects& fx) {
    if (!isFinished(workflow.status)) {
        flushPlacements(workflow, now, fx);
    }
    lifecycle_.refreshWorkflow(workflow, now);
}

// ---------------------------------------------------------------------------
// Deadlines and retention

void Scheduler::tick(TimePoint now) {
    Effects fx;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);

        for (auto* workflow : lifecycle_.all()) {
            if (isFinished(workflow->status)) continue;
            for (auto& [name, group] : workflow->groups) {
                (void)name;
                if (isGroupFinished(group.status)) continue;
                if (group.queued && group.queueDeadline && *group.queueDeadline <= now) {
                    failGroup(*workflow, group, TaskStatus::FailedQueueTimeout,
                              "Not admitted within " + std::to_string(workflow->queueTimeout.count()) + "s",
                              now, fx);
                } else if (group.reserved && group.execDeadline && *group.execDeadline <= now) {
                    failGroup(*workflow, group, TaskStatus::FailedExecTimeout,
                              "Did not finish within " + std::to_string(workflow->execTimeout.count()) + "s",
                              now, fx);
                }
            }
        }

        for (const auto& key : gangs_.expired(now)) {
            const auto [id, name] = splitGroupKey(key);
            auto* workflow = lifecycle_.find(id);
            if (!workflow || !workflow->groups.count(name)) {
                gangs_.abandon(key);
                continue;
            }
            auto& group = workflow->group(name);
            // No member of a timed out round may pass the barrier, and the
            // group is not placed again.
            gangs_.abandon(key);
            if (isGroupFinished(group.status)) continue;
            failGroup(*workflow, group, TaskStatus::FailedStartTimeout,
                      "Start barrier not reached within " + std::to_string(settings_.barrierTimeout.count()) + "s",
                      now, fx);
        }

        std::vector<WorkflowId> expired;
        for (auto* workflow : lifecycle_.all()) {
            settle(*workflow, now, fx);
            if (isFinished(workflow->status) && workflow->endTime &&
                *workflow->endTime + settings_.retention <= now) {
                expired.push_back(workflow->id);
            }
        }
        for (const auto& id : expired) {
            archive(*lifecycle_.find(id));
            lifecycle_.erase(id);
        }

        for (const auto& pool : admission_.pools()) {
            if (admission_.queued(pool) > 0) fx.pools.insert(pool);
        }
    }
    finish(fx, now);
}

// ---------------------------------------------------------------------------
// Cancel and configuration

CancelResult Scheduler::cancel(const WorkflowId& id, const std::string& user, TimePoint now) {
    Effects fx;
    CancelResult result;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        auto* workflow = lifecycle_.find(id);
        if (!workflow) {
            result.error = archive_.count(id) ? CancelError::AlreadyFinished : CancelError::NotFound;
            result.message = result.error == CancelError::NotFound ? "Unknown workflow " + id
                                                                   : "Workflow " + id + " already finished";
            return result;
        }
        if (isFinished(workflow->status)) {
            result.error = CancelError::AlreadyFinished;
            result.message = "Workflow " + id + " already finished " + toString(workflow->status);
            return result;
        }

        LOG_INFO("Canceling workflow " + id + (user.empty() ? "" : " on behalf of " + user));
        workflow->canceled = true;
        workflow->canceledBy = user;
        const std::string message = user.empty() ? "Canceled" : "Canceled by " + user;

        // Every task first, so no group reads as failed upstream of another.
        for (auto& [name, group] : workflow->groups) {
            (void)name;
            if (group.queued) {
                admission_.remove(workflow->pool(), group.key);
                group.queued = false;
            }
            for (const auto& task : group.spec->tasks) {
                auto& instance = workflow->current(task.name);
                if (isFinished(instance.status)) continue;
                if (placed(instance.status)) {
                    fx.commands.push_back({Command::Kind::Cancel, group.key, {instance.ref}, {}, false});
                }
                lifecycle_.transition(*workflow, instance, TaskStatus::FailedCanceled, message, now);
            }
        }
        for (const auto& name : workflow->dag->groupOrder()) {
            updateGroup(*workflow, workflow->group(name), now, fx);
        }
        lifecycle_.refreshWorkflow(*workflow, now);
        result.ok = true;
    }
    finish(fx, now);
    return result;
}

void Scheduler::reloadPools(const Config& config) {
    ledger_.configure(config.pools, config.backends);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        settings_.barrierTimeout = config.scheduler.barrierTimeout;
        gangs_.setBarrierTimeout(config.scheduler.barrierTimeout);
    }
    LOG_INFO("Reloaded pool configuration: " + std::to_string(config.pools.size()) + " pools");
    admitAll();
}

// ---------------------------------------------------------------------------
// Queries

std::optional<WorkflowView> Scheduler::getStatus(const WorkflowId& id) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (const auto* workflow = lifecycle_.find(id)) {
        return buildView(*workflow);
    }
    const auto it = archive_.find(id);
    if (it == archive_.end()) return std::nullopt;
    return it->second;
}

std::vector<WorkflowSummary> Scheduler::getHistory(const HistoryFilter& filter) const {
    std::vector<WorkflowSummary> history;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        for (const auto* workflow : lifecycle_.all()) {
            auto summary = buildView(*workflow).summary;
            if (filter.matches(summary)) history.push_back(std::move(summary));
        }
        for (const auto& [id, view] : archive_) {
            (void)id;
            if (filter.matches(view.summary)) history.push_back(view.summary);
        }
    }

    std::sort(history.begin(), history.end(), [](const WorkflowSummary& a, const WorkflowSummary& b) {
        if (a.submitTime != b.submitTime) return a.submitTime > b.submitTime;
        return a.id > b.id;
    });
    if (filter.limit > 0 && history.size() > filter.limit) {
        history.resize(filter.limit);
    }
    return history;
}

std::vector<WorkflowId> Scheduler::activeWorkflows() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    std::vector<WorkflowId> ids;
    for (const auto* workflow : lifecycle_.all()) {
        if (!isFinished(workflow->status)) ids.push_back(workflow->id);
    }
    return ids;
}

WorkflowView Scheduler::buildView(const WorkflowRecord& workflow) const {
    WorkflowView view;
    view.summary.id = workflow.id;
    view.summary.name = workflow.spec->name;
    view.summary.user = workflow.spec->user;
    view.summary.pool = workflow.pool();
    view.summary.priority = workflow.priority();
    view.summary.status = workflow.status;
    view.summary.submitTime = workflow.submitTime;
    view.summary.endTime = workflow.endTime;
    view.canceled = workflow.canceled;
    view.canceledBy = workflow.canceledBy;
    view.failureMessage = workflow.failureMessage;
    view.startTime = workflow.startTime;

    for (const auto& name : workflow.dag->groupOrder()) {
        const auto& group = workflow.group(name);
        GroupView groupView;
        groupView.name = name;
        groupView.status = group.status;
        groupView.upstream = workflow.dag->upstreamGroups(name);
        groupView.queued = group.queued;
        view.groups.push_back(std::move(groupView));

        for (const auto& task : group.spec->tasks) {
            const auto& history = workflow.tasks.at(task.name);
            for (std::size_t i = 0; i < history.size(); ++i) {
                const auto& instance = history[i];
                TaskView taskView;
                taskView.name = task.name;
                taskView.group = name;
                taskView.retryId = instance.ref.retryId;
                taskView.lead = instance.lead;
                taskView.current = i + 1 == history.size();
                taskView.status = instance.status;
                taskView.message = instance.message;
                taskView.exitCode = instance.exitCode;
                taskView.node = instance.node;
                taskView.restarts = instance.restarts;
                view.tasks.push_back(std::move(taskView));
            }
        }
    }
    return view;
}

void Scheduler::archive(const WorkflowRecord& workflow) {
    LOG_DEBUG("Archiving workflow " + workflow.id);
    storeArchived(buildView(workflow));
}

void Scheduler::storeArchived(WorkflowView view) {
    const auto id = view.summary.id;
    if (!archive_.count(id)) {
        archiveOrder_.push_back(id);
    }
    archive_[id] = std::move(view);
    while (archiveOrder_.size() > settings_.historyLimit) {
        archive_.erase(archiveOrder_.front());
        archiveOrder_.pop_front();
    }
}

TaskLaunch Scheduler::makeLaunch(const WorkflowRecord& workflow, const GroupRecord& group,
                                 const TaskInstance& task) const {
    TaskLaunch launch;
    launch.ref = task.ref;
    if (const auto* spec = group.spec->findTask(task.ref.task)) {
        launch.spec = *spec;
    }
    launch.platform = launch.spec.platform;
    if (launch.platform.empty()) {
        if (const auto pool = ledger_.poolConfig(workflow.pool())) {
            launch.platform = pool->defaultPlatform;
        }
    }
    return launch;
}

TimePoint Scheduler::backoffUntil(int retryId, TimePoint now) const {
    auto delay = settings_.backoffBase;
    for (int i = 0; i < retryId && delay < settings_.backoffMax; ++i) {
        delay *= 2;
    }
    return now + std::min(delay, settings_.backoffMax);
}

// ---------------------------------------------------------------------------
// Executor dispatch

void Scheduler::finish(Effects& fx, TimePoint now) {
    dispatch(fx, now);
    if (fx.capacityFreed) {
        for (const auto& pool : admission_.pools()) {
            fx.pools.insert(pool);
        }
    }
    for (const auto& pool : fx.pools) {
        trigger(pool, now);
    }
}

void Scheduler::dispatch(Effects& fx, TimePoint now) {
    std::vector<Command> rejected;
    for (auto& command : fx.commands) {
        try {
            switch (command.kind) {
                case Command::Kind::Place:
                    if (!executor_.placeGang(command.groupKey, command.launches)) {
                        rejected.push_back(std::move(command));
                    }
                    break;
                case Command::Kind::Cancel:
                    for (const auto& ref : command.refs) executor_.cancel(ref);
                    break;
                case Command::Kind::Release:
                    executor_.releaseBarrier(command.groupKey, command.refs);
                    break;
                case Command::Kind::Restart:
                    for (const auto& ref : command.refs) executor_.restart(ref);
                    break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Executor call for " + command.groupKey + " failed: " + e.what());
            if (command.kind == Command::Kind::Place) {
                rejected.push_back(std::move(command));
            }
        }
    }
    fx.commands.clear();
    if (rejected.empty()) return;

    Effects next;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        for (const auto& command : rejected) {
            onPlacementRejected(command, now, next);
        }
    }
    finish(next, now);
}

void Scheduler::trigger(const std::string& pool, TimePoint now) {
    AdmissionTrigger trigger;
    {
        std::lock_guard<std::mutex> lock(triggerMutex_);
        trigger = trigger_;
    }
    if (trigger) {
        trigger(pool);
    } else {
        admit(pool, now);
    }
}

}
