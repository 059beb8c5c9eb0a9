/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "dagpool/config.hpp"
#include "dagpool/scheduler.hpp"
#include "dagpool/workflow_spec.hpp"
#include "fake_executor.hpp"

using namespace dagpool;

namespace {

// One backend with a single GPU, every class allowed to use it.
constexpr const char* kSingleGpu = R"(
scheduler:
  max_retry_per_task: 2
  barrier_timeout: 60s
  backoff_base: 10s
  backoff_max: 80s
  retention: 1h
backends:
  - name: node
    capacity: {cpu: 64, gpu: 1}
pools:
  - name: P
    backend: node
    default_exit_actions:
      COMPLETE: "3"
    quota:
      low: {cpu: 64, gpu: 1}
      normal: {cpu: 64, gpu: 1}
      high: {cpu: 64, gpu: 1}
)";

constexpr const char* kWide = R"(
scheduler:
  max_retry_per_task: 2
  barrier_timeout: 60s
backends:
  - name: node
    capacity: {cpu: 64, gpu: 8}
pools:
  - name: P
    backend: node
    quota:
      low: {cpu: 64, gpu: 8}
      normal: {cpu: 64, gpu: 8}
      high: {cpu: 64, gpu: 8}
)";

// Pool A holds two GPUs for HIGH work and nothing for LOW; pool B holds
// one GPU for NORMAL work. Both share a three GPU backend.
constexpr const char* kBorrowing = R"(
scheduler:
  max_retry_per_task: 2
backends:
  - name: dgx
    capacity: {gpu: 3}
pools:
  - name: A
    backend: dgx
    quota:
      high: {gpu: 2}
      normal: {gpu: 0}
      low: {gpu: 0}
  - name: B
    backend: dgx
    quota:
      normal: {gpu: 1}
)";

constexpr const char* kTrainGroup = R"(
name: train
pool: P
priority: NORMAL
groups:
  - name: g
    tasks:
      - name: master
        lead: true
        resources: {cpu: 1, gpu: 1}
      - name: worker
        resources: {cpu: 1, gpu: 1}
)";

std::string singleTask(const std::string& name, const std::string& priority, int gpu,
                       const std::string& pool = "P", const std::string& extra = "") {
    return "name: " + name + "\npool: " + pool + "\npriority: " + priority + "\n" + extra +
           "tasks:\n  - name: t\n    resources: {cpu: 1, gpu: " + std::to_string(gpu) + "}\n";
}

TaskRef ref(const WorkflowId& id, const std::string& task = "t", int retryId = 0) {
    return TaskRef{id, task, retryId};
}

}

class SchedulerTest : public ::testing::Test {
protected:
    void configure(const std::string& yaml) {
        config_ = Config::parse(yaml);
        scheduler_ = std::make_unique<Scheduler>(config_, executor_);
    }

    WorkflowId submit(const std::string& yaml, const WorkflowId& id, TimePoint at) {
        auto result = scheduler_->submit(WorkflowSpec::parse(yaml), at, id);
        EXPECT_TRUE(result) << result.message;
        return result.id;
    }

    void report(const TaskRef& task, ExecutorPhase phase, TimePoint at,
                TaskStatus outcome = TaskStatus::Completed, std::optional<int> exitCode = std::nullopt) {
        TaskEvent event;
        event.ref = task;
        event.phase = phase;
        event.outcome = outcome;
        event.exitCode = exitCode;
        if (phase == ExecutorPhase::Initializing) {
            event.node = "node-1";
        }
        scheduler_->onTaskEvent(event, at);
    }

    void start(const TaskRef& task, TimePoint at) {
        report(task, ExecutorPhase::Initializing, at);
        report(task, ExecutorPhase::Ready, at);
    }

    void exit(const TaskRef& task, TaskStatus outcome, TimePoint at, std::optional<int> exitCode = std::nullopt) {
        report(task, ExecutorPhase::Exited, at, outcome, exitCode);
    }

    WorkflowView view(const WorkflowId& id) {
        auto status = scheduler_->getStatus(id);
        EXPECT_TRUE(status.has_value()) << id;
        return status.value_or(WorkflowView{});
    }

    TaskStatus taskStatus(const WorkflowId& id, const std::string& task = "t") {
        const auto status = view(id);
        const auto* current = status.task(task);
        EXPECT_NE(current, nullptr) << id << "/" << task;
        return current ? current->status : TaskStatus::Submitting;
    }

    TaskStatus groupStatus(const WorkflowId& id, const std::string& group) {
        const auto status = view(id);
        const auto* record = status.group(group);
        EXPECT_NE(record, nullptr) << id << "/" << group;
        return record ? record->status : TaskStatus::Submitting;
    }

    WorkflowStatus workflowStatus(const WorkflowId& id) { return view(id).summary.status; }

    std::vector<std::string> queuedKeys(const std::string& pool) {
        std::vector<std::string> keys;
        for (const auto& entry : scheduler_->queue(pool)) {
            keys.push_back(entry.groupKey);
        }
        return keys;
    }

    test::FakeExecutor executor_;
    Config config_;
    std::unique_ptr<Scheduler> scheduler_;
    const TimePoint t0 = TimePoint(Seconds(1700000000));
};

// ============================================================================
// Admission order
// ============================================================================

TEST_F(SchedulerTest, AdmitsHigherPriorityFirst) {
    configure(kSingleGpu);
    submit(singleTask("blocker", "NORMAL", 1), "blocker", t0);
    submit(singleTask("low", "LOW", 1), "low", t0 + Seconds(1));
    submit(singleTask("normal", "NORMAL", 1), "normal", t0 + Seconds(2));
    submit(singleTask("high", "HIGH", 1), "high", t0 + Seconds(3));

    ASSERT_EQ(executor_.placements.size(), 1u);
    EXPECT_EQ(executor_.placements[0].groupKey, "blocker/t");
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"high/t", "normal/t", "low/t"}));

    start(ref("blocker"), t0 + Seconds(10));
    exit(ref("blocker"), TaskStatus::Completed, t0 + Seconds(20), 0);

    ASSERT_EQ(executor_.placements.size(), 2u);
    EXPECT_EQ(executor_.placements[1].groupKey, "high/t");
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"normal/t", "low/t"}));
    EXPECT_EQ(workflowStatus("blocker"), WorkflowStatus::Completed);
}

TEST_F(SchedulerTest, AdmitsSamePriorityInSubmissionOrder) {
    configure(kSingleGpu);
    submit(singleTask("blocker", "NORMAL", 1), "blocker", t0);
    submit(singleTask("first", "NORMAL", 1), "first", t0 + Seconds(1));
    submit(singleTask("second", "NORMAL", 1), "second", t0 + Seconds(2));
    submit(singleTask("third", "NORMAL", 1), "third", t0 + Seconds(2));

    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"first/t", "second/t", "third/t"}));

    start(ref("blocker"), t0 + Seconds(10));
    exit(ref("blocker"), TaskStatus::Completed, t0 + Seconds(20), 0);

    ASSERT_EQ(executor_.placements.size(), 2u);
    EXPECT_EQ(executor_.placements[1].groupKey, "first/t");
    EXPECT_EQ(taskStatus("first"), TaskStatus::Scheduling);
    EXPECT_EQ(taskStatus("second"), TaskStatus::Processing);
}

TEST_F(SchedulerTest, BlockedHeadHoldsBackSmallerEntries) {
    configure(kWide);
    submit(singleTask("big", "NORMAL", 6), "big", t0);
    submit(singleTask("bigger", "HIGH", 4), "bigger", t0 + Seconds(1));
    submit(singleTask("small", "NORMAL", 1), "small", t0 + Seconds(2));

    EXPECT_EQ(executor_.placementsOf("small/t").size(), 0u);
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"bigger/t", "small/t"}));
}

TEST_F(SchedulerTest, NeverPreemptsWorkWithinQuota) {
    configure(R"(
backends:
  - name: node
    capacity: {cpu: 8, gpu: 1}
pools:
  - name: P
    backend: node
    quota:
      low: {cpu: 8, gpu: 1}
      normal: {cpu: 8, gpu: 0}
      high: {cpu: 8, gpu: 1}
)");
    submit(singleTask("background", "LOW", 1), "background", t0);
    start(ref("background"), t0 + Seconds(1));
    ASSERT_EQ(taskStatus("background"), TaskStatus::Running);

    submit(singleTask("urgent", "HIGH", 1), "urgent", t0 + Seconds(2));

    EXPECT_TRUE(executor_.cancels.empty());
    EXPECT_EQ(taskStatus("background"), TaskStatus::Running);
    EXPECT_TRUE(scheduler_->ledger().reservation("background/t").has_value());
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"urgent/t"}));
    EXPECT_EQ(scheduler_->ledger().canAdmit("P", Priority::High, Resources{1, 1, 0, 0}), AdmitDecision::Wait);
}

// ============================================================================
// Gang placement
// ============================================================================

TEST_F(SchedulerTest, PlacesGangAtomicallyAndReleasesBarrierTogether) {
    configure(kWide);
    const auto id = submit(R"(
name: train
pool: P
groups:
  - name: g
    tasks:
      - name: master
        lead: true
        resources: {gpu: 1}
      - name: w1
        resources: {gpu: 1}
      - name: w2
        resources: {gpu: 1}
)", "train", t0);

    ASSERT_EQ(executor_.placements.size(), 1u);
    EXPECT_EQ(executor_.placements[0].refs.size(), 3u);

    report(ref(id, "master"), ExecutorPhase::Initializing, t0 + Seconds(1));
    report(ref(id, "w1"), ExecutorPhase::Initializing, t0 + Seconds(1));
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::Scheduling);

    report(ref(id, "w2"), ExecutorPhase::Initializing, t0 + Seconds(2));
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::Initializing);
    EXPECT_EQ(taskStatus(id, "w2"), TaskStatus::Initializing);

    report(ref(id, "master"), ExecutorPhase::Ready, t0 + Seconds(3));
    report(ref(id, "w1"), ExecutorPhase::Ready, t0 + Seconds(3));
    EXPECT_TRUE(executor_.releases.empty());

    report(ref(id, "w2"), ExecutorPhase::Ready, t0 + Seconds(4));
    ASSERT_EQ(executor_.releases.size(), 1u);
    EXPECT_EQ(executor_.releases[0].refs.size(), 3u);
    EXPECT_EQ(taskStatus(id, "w1"), TaskStatus::Running);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Running);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Running);
}

TEST_F(SchedulerTest, RejectedPlacementReturnsGroupToQueue) {
    configure(kWide);
    executor_.rejectPlacements = true;
    const auto id = submit(kTrainGroup, "train", t0);

    ASSERT_EQ(executor_.placements.size(), 1u);
    EXPECT_FALSE(executor_.placements[0].accepted);
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"train/g"}));
    EXPECT_FALSE(scheduler_->ledger().reservation("train/g").has_value());
    EXPECT_DOUBLE_EQ(scheduler_->ledger().usage("P", Priority::Normal).gpu, 0.0);

    executor_.rejectPlacements = false;
    scheduler_->tick(t0 + Seconds(1));

    ASSERT_EQ(executor_.placements.size(), 2u);
    EXPECT_TRUE(executor_.placements[1].accepted);
    EXPECT_EQ(executor_.placements[1].refs.size(), 2u);
    EXPECT_TRUE(queuedKeys("P").empty());
    EXPECT_EQ(taskStatus(id, "worker"), TaskStatus::Scheduling);
}

TEST_F(SchedulerTest, StartBarrierTimeoutFailsGroup) {
    configure(kWide);
    const auto id = submit(kTrainGroup, "train", t0);
    start(ref(id, "master"), t0 + Seconds(1));
    report(ref(id, "worker"), ExecutorPhase::Initializing, t0 + Seconds(1));

    scheduler_->tick(t0 + Seconds(30));
    EXPECT_TRUE(executor_.cancels.empty());

    scheduler_->tick(t0 + Seconds(61));

    EXPECT_TRUE(executor_.canceled(ref(id, "master")));
    EXPECT_TRUE(executor_.canceled(ref(id, "worker")));
    EXPECT_TRUE(executor_.releases.empty());

    // Retries remain, yet the round is not placed again.
    EXPECT_EQ(executor_.placementsOf("train/g").size(), 1u);
    EXPECT_EQ(view(id).instances("master").size(), 1u);
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::FailedStartTimeout);
    EXPECT_EQ(taskStatus(id, "worker"), TaskStatus::FailedStartTimeout);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::FailedStartTimeout);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::FailedStartTimeout);
    EXPECT_FALSE(scheduler_->ledger().reservation("train/g").has_value());
}

TEST_F(SchedulerTest, StartBarrierTimeoutWithoutRetries) {
    configure(R"(
scheduler:
  max_retry_per_task: 0
  barrier_timeout: 60s
pools:
  - name: P
)");
    const auto id = submit(kTrainGroup, "train", t0);
    report(ref(id, "worker"), ExecutorPhase::Initializing, t0 + Seconds(1));

    scheduler_->tick(t0 + Seconds(61));

    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::FailedStartTimeout);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::FailedStartTimeout);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::FailedStartTimeout);
    EXPECT_FALSE(scheduler_->ledger().reservation("train/g").has_value());
}

// ============================================================================
// Group completion policy
// ============================================================================

TEST_F(SchedulerTest, NonLeadFailureIgnoredByDefault) {
    configure(kWide);
    const auto id = submit(kTrainGroup, "train", t0);
    start(ref(id, "master"), t0 + Seconds(1));
    start(ref(id, "worker"), t0 + Seconds(1));

    exit(ref(id, "worker"), TaskStatus::Failed, t0 + Seconds(5), 1);
    EXPECT_EQ(taskStatus(id, "worker"), TaskStatus::Failed);
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::Running);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Running);
    EXPECT_FALSE(executor_.canceled(ref(id, "master")));

    exit(ref(id, "master"), TaskStatus::Completed, t0 + Seconds(9), 0);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Completed);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Completed);
}

TEST_F(SchedulerTest, SkippedNonLeadDoesNotFailGroup) {
    configure(kWide);
    const auto id = submit(R"(
name: chain
pool: P
groups:
  - name: g
    tasks:
      - name: m
        lead: true
      - name: a
      - name: b
        inputs: [a]
)", "chain", t0);
    start(ref(id, "m"), t0 + Seconds(1));
    start(ref(id, "a"), t0 + Seconds(1));

    exit(ref(id, "a"), TaskStatus::Failed, t0 + Seconds(5), 1);
    EXPECT_EQ(taskStatus(id, "b"), TaskStatus::FailedUpstream);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Running);

    exit(ref(id, "m"), TaskStatus::Completed, t0 + Seconds(9), 0);
    EXPECT_EQ(taskStatus(id, "a"), TaskStatus::Failed);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Completed);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Completed);
}

TEST_F(SchedulerTest, NonLeadFailureFailsGroupWhenCounted) {
    configure(kWide);
    const auto id = submit(R"(
name: strict
pool: P
groups:
  - name: g
    ignore_nonlead_status: false
    tasks:
      - name: master
        lead: true
      - name: worker
)", "strict", t0);
    start(ref(id, "master"), t0 + Seconds(1));
    start(ref(id, "worker"), t0 + Seconds(1));

    exit(ref(id, "worker"), TaskStatus::Failed, t0 + Seconds(5), 1);

    EXPECT_TRUE(executor_.canceled(ref(id, "master")));
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::Failed);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Failed);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Failed);
}

TEST_F(SchedulerTest, LeadCompletionStopsRemainingMembers) {
    configure(kWide);
    const auto id = submit(kTrainGroup, "train", t0);
    start(ref(id, "master"), t0 + Seconds(1));
    start(ref(id, "worker"), t0 + Seconds(1));

    exit(ref(id, "master"), TaskStatus::Completed, t0 + Seconds(5), 0);

    EXPECT_TRUE(executor_.canceled(ref(id, "worker")));
    EXPECT_EQ(taskStatus(id, "worker"), TaskStatus::Completed);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Completed);
    EXPECT_DOUBLE_EQ(scheduler_->ledger().usage("P", Priority::Normal).gpu, 0.0);
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_F(SchedulerTest, FailedGroupShortCircuitsDownstream) {
    configure(kWide);
    const auto id = submit(R"(
name: pipe
pool: P
tasks:
  - name: prep
    resources: {gpu: 1}
  - name: train
    resources: {gpu: 1}
    inputs: [prep]
  - name: report
    inputs: [train]
)", "pipe", t0);

    ASSERT_EQ(executor_.placements.size(), 1u);
    EXPECT_EQ(taskStatus(id, "train"), TaskStatus::Waiting);

    start(ref(id, "prep"), t0 + Seconds(1));
    exit(ref(id, "prep"), TaskStatus::Failed, t0 + Seconds(2), 1);

    EXPECT_EQ(taskStatus(id, "train"), TaskStatus::FailedUpstream);
    EXPECT_EQ(groupStatus(id, "report"), TaskStatus::FailedUpstream);
    EXPECT_TRUE(executor_.placementsOf("pipe/train").empty());
    EXPECT_TRUE(executor_.placementsOf("pipe/report").empty());
    EXPECT_TRUE(queuedKeys("P").empty());
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Failed);
    EXPECT_NE(view(id).failureMessage.find("prep"), std::string::npos);
}

TEST_F(SchedulerTest, CompletedGroupReleasesDownstream) {
    configure(kWide);
    const auto id = submit(R"(
name: pipe
pool: P
tasks:
  - name: prep
  - name: train
    inputs: [prep]
)", "pipe", t0);

    start(ref(id, "prep"), t0 + Seconds(1));
    exit(ref(id, "prep"), TaskStatus::Completed, t0 + Seconds(2), 0);

    ASSERT_EQ(executor_.placementsOf("pipe/train").size(), 1u);
    EXPECT_EQ(taskStatus(id, "train"), TaskStatus::Scheduling);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Waiting);
}

// ============================================================================
// Borrowing and preemption
// ============================================================================

TEST_F(SchedulerTest, NormalWorkReclaimsGpuBorrowedByLowWork) {
    configure(kBorrowing);

    const auto wf1 = submit(singleTask("wf1", "HIGH", 2, "A"), "wf1", t0);
    ASSERT_EQ(executor_.placementsOf("wf1/t").size(), 1u);

    const auto wf2 = submit(singleTask("wf2", "LOW", 1, "A"), "wf2", t0 + Seconds(1));
    ASSERT_EQ(executor_.placementsOf("wf2/t").size(), 1u);
    const auto borrowed = scheduler_->ledger().reservation("wf2/t");
    ASSERT_TRUE(borrowed.has_value());
    EXPECT_TRUE(borrowed->borrows());
    EXPECT_DOUBLE_EQ(scheduler_->ledger().lentOut("B").gpu, 1.0);
    start(ref(wf2), t0 + Seconds(2));

    const auto wf3 = submit(singleTask("wf3", "NORMAL", 1, "B"), "wf3", t0 + Seconds(3));

    EXPECT_TRUE(executor_.canceled(ref(wf2)));
    ASSERT_EQ(executor_.placementsOf("wf3/t").size(), 1u);
    EXPECT_FALSE(scheduler_->ledger().reservation("wf2/t").has_value());
    EXPECT_EQ(taskStatus(wf1), TaskStatus::Scheduling);

    auto status = view(wf2);
    auto instances = status.instances("t");
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_EQ(instances[0]->status, TaskStatus::FailedPreempted);
    EXPECT_EQ(instances[1]->status, TaskStatus::Processing);
    EXPECT_EQ(queuedKeys("A"), (std::vector<std::string>{"wf2/t"}));

    // The replacement borrows again once the lender's quota is idle.
    start(ref(wf3), t0 + Seconds(4));
    exit(ref(wf3), TaskStatus::Completed, t0 + Seconds(5), 0);

    const auto placements = executor_.placementsOf("wf2/t");
    ASSERT_EQ(placements.size(), 2u);
    EXPECT_EQ(placements[1].refs.at(0).retryId, 1);
    EXPECT_EQ(taskStatus(wf2), TaskStatus::Scheduling);
}

TEST_F(SchedulerTest, LowWorkWaitsWhenNothingIdleToBorrow) {
    configure(kBorrowing);
    submit(singleTask("owner", "NORMAL", 1, "B"), "owner", t0);
    submit(singleTask("borrower", "LOW", 1, "A"), "borrower", t0 + Seconds(1));

    EXPECT_TRUE(executor_.placementsOf("borrower/t").empty());
    EXPECT_EQ(queuedKeys("A"), (std::vector<std::string>{"borrower/t"}));
    EXPECT_EQ(taskStatus("borrower"), TaskStatus::Processing);
}

// ============================================================================
// Task failures and retries
// ============================================================================

TEST_F(SchedulerTest, WorkerCrashReschedulesWorkerOnly) {
    configure(kWide);
    const auto id = submit(kTrainGroup, "train", t0);
    start(ref(id, "master"), t0 + Seconds(1));
    start(ref(id, "worker"), t0 + Seconds(1));
    ASSERT_EQ(executor_.releases.size(), 1u);

    exit(ref(id, "worker"), TaskStatus::FailedEvicted, t0 + Seconds(10));

    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Running);
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::Running);
    EXPECT_TRUE(executor_.restarts.empty());
    EXPECT_FALSE(executor_.canceled(ref(id, "master")));

    const auto placements = executor_.placementsOf("train/g");
    ASSERT_EQ(placements.size(), 2u);
    ASSERT_EQ(placements[1].refs.size(), 1u);
    EXPECT_EQ(placements[1].refs[0], ref(id, "worker", 1));

    start(ref(id, "worker", 1), t0 + Seconds(12));
    EXPECT_TRUE(executor_.released(ref(id, "worker", 1)));
    EXPECT_EQ(taskStatus(id, "worker"), TaskStatus::Running);
    EXPECT_EQ(view(id).task("master")->restarts, 0);
}

TEST_F(SchedulerTest, LeadRescheduleRestartsRunningWorkers) {
    configure(kWide);
    const auto id = submit(kTrainGroup, "train", t0);
    start(ref(id, "master"), t0 + Seconds(1));
    start(ref(id, "worker"), t0 + Seconds(1));

    exit(ref(id, "master"), TaskStatus::FailedEvicted, t0 + Seconds(10));

    ASSERT_EQ(executor_.restarts.size(), 1u);
    EXPECT_EQ(executor_.restarts[0], ref(id, "worker"));
    EXPECT_EQ(view(id).task("worker")->restarts, 1);

    report(ref(id, "worker"), ExecutorPhase::Ready, t0 + Seconds(11));
    start(ref(id, "master", 1), t0 + Seconds(12));

    ASSERT_EQ(executor_.releases.size(), 2u);
    EXPECT_EQ(executor_.releases[1].refs.size(), 2u);
    EXPECT_EQ(taskStatus(id, "master"), TaskStatus::Running);
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::Running);
}

TEST_F(SchedulerTest, ExitActionReschedulesUpToRetryCeiling) {
    configure(kWide);
    const auto id = submit(R"(
name: flaky
pool: P
tasks:
  - name: t
    exit_actions:
      RESCHEDULE: "137"
)", "flaky", t0);

    for (int retry = 0; retry <= 2; ++retry) {
        const auto at = t0 + Seconds(10 * (retry + 1));
        start(ref(id, "t", retry), at);
        exit(ref(id, "t", retry), TaskStatus::Failed, at + Seconds(1), 137);
    }

    EXPECT_EQ(executor_.placementsOf("flaky/t").size(), 3u);
    const auto status = view(id);
    const auto instances = status.instances("t");
    ASSERT_EQ(instances.size(), 3u);
    EXPECT_EQ(instances[0]->status, TaskStatus::Rescheduled);
    EXPECT_EQ(instances[1]->status, TaskStatus::Rescheduled);
    EXPECT_EQ(instances[2]->status, TaskStatus::Failed);
    EXPECT_EQ(instances[2]->exitCode, 137);
    EXPECT_NE(instances[2]->message.find("reschedule ignored"), std::string::npos);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Failed);
}

TEST_F(SchedulerTest, PoolExitActionsApplyWhenTaskHasNone) {
    configure(kSingleGpu);
    const auto id = submit(singleTask("tool", "NORMAL", 1), "tool", t0);
    start(ref(id), t0 + Seconds(1));
    exit(ref(id), TaskStatus::Failed, t0 + Seconds(2), 3);

    EXPECT_EQ(taskStatus(id), TaskStatus::Completed);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Completed);
}

TEST_F(SchedulerTest, ServerErrorRetriesAfterBackoff) {
    configure(kSingleGpu);
    const auto id = submit(singleTask("svc", "NORMAL", 1), "svc", t0);
    start(ref(id), t0 + Seconds(1));
    exit(ref(id), TaskStatus::FailedServerError, t0 + Seconds(2));

    EXPECT_EQ(executor_.placements.size(), 1u);
    EXPECT_EQ(view(id).instances("t").size(), 2u);

    scheduler_->tick(t0 + Seconds(7));
    EXPECT_EQ(executor_.placements.size(), 1u);
    EXPECT_EQ(taskStatus(id), TaskStatus::Submitting);

    scheduler_->tick(t0 + Seconds(12));
    ASSERT_EQ(executor_.placements.size(), 2u);
    EXPECT_EQ(executor_.placements[1].refs.at(0), ref(id, "t", 1));
    EXPECT_EQ(taskStatus(id), TaskStatus::Scheduling);
}

TEST_F(SchedulerTest, UserFailureIsNeverRetried) {
    configure(kSingleGpu);
    const auto id = submit(singleTask("job", "NORMAL", 1), "job", t0);
    start(ref(id), t0 + Seconds(1));
    exit(ref(id), TaskStatus::Failed, t0 + Seconds(2), 1);

    EXPECT_EQ(view(id).instances("t").size(), 1u);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::Failed);
}

// ============================================================================
// Deadlines
// ============================================================================

TEST_F(SchedulerTest, QueueTimeoutFailsWaitingGroup) {
    configure(kSingleGpu);
    submit(singleTask("blocker", "NORMAL", 1), "blocker", t0);
    const auto id = submit(singleTask("late", "NORMAL", 1, "P", "timeout: {queue: 30s}\n"), "late", t0);

    scheduler_->tick(t0 + Seconds(29));
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"late/t"}));

    scheduler_->tick(t0 + Seconds(31));
    EXPECT_TRUE(queuedKeys("P").empty());
    EXPECT_EQ(taskStatus(id), TaskStatus::FailedQueueTimeout);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::FailedQueueTimeout);
}

TEST_F(SchedulerTest, ExecTimeoutCancelsRunningGroup) {
    configure(kSingleGpu);
    const auto id = submit(singleTask("slow", "NORMAL", 1, "P", "timeout: {exec: 100s}\n"), "slow", t0);
    start(ref(id), t0 + Seconds(1));

    scheduler_->tick(t0 + Seconds(101));

    EXPECT_TRUE(executor_.canceled(ref(id)));
    EXPECT_EQ(taskStatus(id), TaskStatus::FailedExecTimeout);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::FailedExecTimeout);
    EXPECT_DOUBLE_EQ(scheduler_->ledger().usage("P", Priority::Normal).gpu, 0.0);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_F(SchedulerTest, CancelStopsRunningTasksAndReconcilesLateExit) {
    configure(kSingleGpu);
    const auto id = submit(singleTask("job", "NORMAL", 1), "job", t0);
    start(ref(id), t0 + Seconds(1));

    auto result = scheduler_->cancel(id, "alice", t0 + Seconds(5));
    ASSERT_TRUE(result) << result.message;
    EXPECT_TRUE(executor_.canceled(ref(id)));
    EXPECT_EQ(taskStatus(id), TaskStatus::FailedCanceled);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::FailedCanceled);
    EXPECT_EQ(view(id).canceledBy, "alice");

    exit(ref(id), TaskStatus::Failed, t0 + Seconds(6), 1);
    EXPECT_EQ(taskStatus(id), TaskStatus::Failed);
    EXPECT_EQ(view(id).task("t")->exitCode, 1);
    EXPECT_EQ(workflowStatus(id), WorkflowStatus::FailedCanceled);

    auto again = scheduler_->cancel(id, "alice", t0 + Seconds(7));
    EXPECT_FALSE(again);
    EXPECT_EQ(again.error, CancelError::AlreadyFinished);
}

TEST_F(SchedulerTest, CancelDequeuesAndMarksEveryGroup) {
    configure(kSingleGpu);
    submit(singleTask("blocker", "NORMAL", 1), "blocker", t0);
    const auto id = submit(R"(
name: pipe
pool: P
tasks:
  - name: a
    resources: {gpu: 1}
  - name: b
    inputs: [a]
)", "pipe", t0 + Seconds(1));
    ASSERT_EQ(queuedKeys("P"), (std::vector<std::string>{"pipe/a"}));

    ASSERT_TRUE(scheduler_->cancel(id, "bob", t0 + Seconds(2)));

    EXPECT_TRUE(queuedKeys("P").empty());
    EXPECT_EQ(groupStatus(id, "a"), TaskStatus::FailedCanceled);
    EXPECT_EQ(groupStatus(id, "b"), TaskStatus::FailedCanceled);
    EXPECT_TRUE(executor_.cancels.empty());
}

TEST_F(SchedulerTest, CancelUnknownWorkflow) {
    configure(kSingleGpu);
    auto result = scheduler_->cancel("missing", "alice", t0);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, CancelError::NotFound);
}

// ============================================================================
// Submission and queries
// ============================================================================

TEST_F(SchedulerTest, RejectsInvalidSubmissionsIntoHistory) {
    configure(kSingleGpu);

    auto unknown = scheduler_->submit(WorkflowSpec::parse(singleTask("x", "NORMAL", 1, "nowhere")), t0, "x");
    EXPECT_EQ(unknown.error, SubmissionError::UnknownPool);

    auto huge = scheduler_->submit(WorkflowSpec::parse(singleTask("huge", "NORMAL", 4)), t0, "huge");
    EXPECT_EQ(huge.error, SubmissionError::Infeasible);

    auto cyclic = WorkflowSpec::parse(R"(
name: loop
pool: P
tasks:
  - name: a
    inputs: [b]
  - name: b
    inputs: [a]
)");
    auto cycle = scheduler_->submit(cyclic, t0, "loop");
    EXPECT_EQ(cycle.error, SubmissionError::CyclicDependency);

    HistoryFilter filter;
    filter.status = WorkflowStatus::FailedSubmission;
    EXPECT_EQ(scheduler_->getHistory(filter).size(), 3u);
    EXPECT_EQ(view("huge").summary.status, WorkflowStatus::FailedSubmission);
    EXPECT_TRUE(executor_.placements.empty());

    auto duplicate = scheduler_->submit(WorkflowSpec::parse(singleTask("huge", "NORMAL", 1)), t0, "huge");
    EXPECT_EQ(duplicate.error, SubmissionError::DuplicateId);
}

TEST_F(SchedulerTest, HistoryIsNewestFirstAndFiltered) {
    configure(kBorrowing);
    submit(singleTask("one", "HIGH", 1, "A"), "one", t0);
    submit(singleTask("two", "NORMAL", 1, "B"), "two", t0 + Seconds(1));
    submit(singleTask("three", "HIGH", 1, "A"), "three", t0 + Seconds(2));

    HistoryFilter all;
    all.limit = 0;
    const auto history = scheduler_->getHistory(all);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, "three");
    EXPECT_EQ(history[2].id, "one");

    HistoryFilter poolA;
    poolA.pool = "A";
    poolA.limit = 1;
    const auto limited = scheduler_->getHistory(poolA);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].id, "three");
}

TEST_F(SchedulerTest, ArchivesFinishedWorkflowsAfterRetention) {
    configure(kSingleGpu);
    const auto id = submit(singleTask("done", "NORMAL", 1), "done", t0);
    start(ref(id), t0 + Seconds(1));
    exit(ref(id), TaskStatus::Completed, t0 + Seconds(2), 0);

    scheduler_->tick(t0 + Seconds(60));
    EXPECT_TRUE(scheduler_->activeWorkflows().empty());

    scheduler_->tick(t0 + Seconds(2) + std::chrono::hours(1));
    const auto archived = scheduler_->getStatus(id);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->summary.status, WorkflowStatus::Completed);

    auto result = scheduler_->cancel(id, "alice", t0 + std::chrono::hours(2));
    EXPECT_EQ(result.error, CancelError::AlreadyFinished);
}

TEST_F(SchedulerTest, OfflinePoolQueuesUntilReloaded) {
    configure(R"(
pools:
  - name: P
    status: offline
)");
    const auto id = submit(singleTask("wait", "NORMAL", 1), "wait", t0);
    EXPECT_TRUE(executor_.placements.empty());
    EXPECT_EQ(queuedKeys("P"), (std::vector<std::string>{"wait/t"}));

    scheduler_->reloadPools(Config::parse(R"(
pools:
  - name: P
)"));
    EXPECT_EQ(executor_.placementsOf("wait/t").size(), 1u);
    EXPECT_EQ(taskStatus(id), TaskStatus::Scheduling);
}

TEST_F(SchedulerTest, ReloadAppliesBarrierTimeout) {
    configure(kWide);
    scheduler_->reloadPools(Config::parse(R"(
scheduler:
  barrier_timeout: 20s
backends:
  - name: node
    capacity: {cpu: 64, gpu: 8}
pools:
  - name: P
    backend: node
    quota:
      normal: {cpu: 64, gpu: 8}
)"));
    const auto id = submit(kTrainGroup, "train", t0);
    report(ref(id, "worker"), ExecutorPhase::Initializing, t0 + Seconds(1));

    scheduler_->tick(t0 + Seconds(21));
    EXPECT_EQ(groupStatus(id, "g"), TaskStatus::FailedStartTimeout);
}
