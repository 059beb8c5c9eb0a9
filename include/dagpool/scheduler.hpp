/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "dagpool/admission.hpp"
#include "dagpool/config.hpp"
#include "dagpool/executor.hpp"
#include "dagpool/gang.hpp"
#include "dagpool/ledger.hpp"
#include "dagpool/lifecycle.hpp"
#include "dagpool/submission.hpp"
#include "dagpool/views.hpp"

namespace dagpool {

// Front door of the scheduling core. Composes the ledger, the admission
// queues, the gang coordinator and the lifecycle records.
//
// Admission passes run without the state lock; ledger and queue locks are
// always taken last. Executor calls produced under the state lock are
// collected and made after it is released.
class Scheduler {
public:
    // Called with a pool name whenever that pool may be able to admit more.
    // Without a trigger the pass runs inline on the calling thread.
    using AdmissionTrigger = std::function<void(const std::string& pool)>;

    Scheduler(const Config& config, Executor& executor);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    void setAdmissionTrigger(AdmissionTrigger trigger);

    // Rejected definitions are recorded in history as FAILED_SUBMISSION.
    // An empty id is generated as "<name>-<sequence>".
    [[nodiscard]] SubmitResult submit(const WorkflowSpec& spec, TimePoint now = Clock::now(),
                                      const WorkflowId& id = {});
    [[nodiscard]] CancelResult cancel(const WorkflowId& id, const std::string& user,
                                      TimePoint now = Clock::now());

    void onTaskEvent(const TaskEvent& event, TimePoint now = Clock::now()) noexcept;

    // Enforces deadlines, places backed-off replacements and archives
    // finished workflows past retention.
    void tick(TimePoint now = Clock::now());

    void admit(const std::string& pool, TimePoint now = Clock::now());
    void admitAll(TimePoint now = Clock::now());

    void reloadPools(const Config& config);

    [[nodiscard]] std::optional<WorkflowView> getStatus(const WorkflowId& id) const;
    // Newest first.
    [[nodiscard]] std::vector<WorkflowSummary> getHistory(const HistoryFilter& filter) const;
    [[nodiscard]] std::vector<WorkflowId> activeWorkflows() const;

    [[nodiscard]] std::vector<std::string> pools() const { return ledger_.poolNames(); }
    [[nodiscard]] std::vector<QueueEntry> queue(const std::string& pool) const { return admission_.pending(pool); }
    [[nodiscard]] const QuotaLedger& ledger() const noexcept { return ledger_; }

private:
    struct Command {
        enum class Kind : std::uint8_t { Place, Cancel, Release, Restart };
        Kind kind;
        std::string groupKey;
        std::vector<TaskRef> refs;
        std::vector<TaskLaunch> launches;
        bool initial = false;
    };

    struct Effects {
        std::vector<Command> commands;
        std::set<std::string> pools;
        bool capacityFreed = false;
    };

    // State lock held by everything below, up to finish().
    SubmitResult accept(const WorkflowSpec& input, TimePoint now, const WorkflowId& requestedId, Effects& fx);
    void reject(const WorkflowId& id, const WorkflowSpec& spec, const std::string& reason, TimePoint now);
    void releaseGroups(WorkflowRecord& workflow, TimePoint now, Effects& fx);
    void enqueueGroup(WorkflowRecord& workflow, GroupRecord& group, TimePoint now, Effects& fx);
    void requeueGroup(WorkflowRecord& workflow, GroupRecord& group, TimePoint now);

    void onAdmitted(const QueueEntry& entry, TimePoint now, Effects& fx);
    void onInfeasible(const QueueEntry& entry, const std::string& reason, TimePoint now, Effects& fx);
    void onPreempted(const Reservation& victim, TimePoint now, Effects& fx);
    void onPlacementRejected(const Command& command, TimePoint now, Effects& fx);

    void handleEvent(const TaskEvent& event, TimePoint now, Effects& fx);
    void handleExit(WorkflowRecord& workflow, GroupRecord& group, TaskInstance& task, TaskStatus reported,
                    const std::string& reason, std::optional<int> exitCode, TimePoint now, Effects& fx);
    void applyPeerAction(WorkflowRecord& workflow, GroupRecord& group, const std::string& task, bool lead,
                         TaskStatus outcome, TimePoint now, Effects& fx);
    void advanceGang(WorkflowRecord& workflow, GroupRecord& group, GangProgress progress, TimePoint now,
                     Effects& fx);
    void startMembers(WorkflowRecord& workflow, GroupRecord& group, const std::vector<TaskRef>& refs,
                      TimePoint now, Effects& fx);

    void failGroup(WorkflowRecord& workflow, GroupRecord& group, TaskStatus status, const std::string& message,
                   TimePoint now, Effects& fx);
    void updateGroup(WorkflowRecord& workflow, GroupRecord& group, TimePoint now, Effects& fx);
    void onGroupFinished(WorkflowRecord& workflow, GroupRecord& group, TimePoint now, Effects& fx);
    void flushPlacements(WorkflowRecord& workflow, TimePoint now, Effects& fx);
    void settle(WorkflowRecord& workflow, TimePoint now, Effects& fx);

    void archive(const WorkflowRecord& workflow);
    void storeArchived(WorkflowView view);
    [[nodiscard]] WorkflowView buildView(const WorkflowRecord& workflow) const;
    [[nodiscard]] TaskLaunch makeLaunch(const WorkflowRecord& workflow, const GroupRecord& group,
                                        const TaskInstance& task) const;
    [[nodiscard]] TimePoint backoffUntil(int retryId, TimePoint now) const;

    // Without the state lock.
    void finish(Effects& fx, TimePoint now);
    void dispatch(Effects& fx, TimePoint now);
    void trigger(const std::string& pool, TimePoint now);

    Executor& executor_;
    QuotaLedger ledger_;
    AdmissionScheduler admission_;

    mutable std::mutex stateMutex_;
    SchedulerSettings settings_;
    Lifecycle lifecycle_;
    GangCoordinator gangs_;
    std::uint64_t nextSequence_ = 0;
    std::map<WorkflowId, WorkflowView> archive_;
    std::deque<WorkflowId> archiveOrder_;

    mutable std::mutex triggerMutex_;
    AdmissionTrigger trigger_;
};

}
