/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dagpool/errors.hpp"
#include "dagpool/workflow_spec.hpp"

using namespace dagpool;

namespace {

constexpr const char* kDistributed = R"(
name: llm-finetune
user: alice
pool: research
priority: high
timeout:
  queue: 10m
  exec: 2h
reschedule_preempted: false
groups:
  - name: prep
    tasks:
      - name: fetch
        image: busybox
        command: [sh, -c, "wget data"]
  - name: train
    barrier: false
    ignore_nonlead_status: false
    tasks:
      - name: master
        lead: true
        duration: 30m
        inputs:
          - task: fetch
        resources:
          cpu: 8
          gpu: 4
          memory: 64Gi
          platform: a100
        exit_actions:
          COMPLETE: "0"
          RESCHEDULE: "137-140"
      - name: worker
        privileged: true
        host_network: true
        inputs: [master]
        resources: {cpu: 8, gpu: 4, storage: 512Mi}
)";

void expectInvalid(const std::string& yaml) {
    EXPECT_THROW((void)WorkflowSpec::parse(yaml), ValidationError) << yaml;
}

}

TEST(WorkflowSpecTest, ParsesGroupsForm) {
    const auto spec = WorkflowSpec::parse(kDistributed);

    EXPECT_EQ(spec.name, "llm-finetune");
    EXPECT_EQ(spec.user, "alice");
    EXPECT_EQ(spec.pool, "research");
    EXPECT_EQ(spec.priority, Priority::High);
    EXPECT_EQ(spec.queueTimeout, Seconds(600));
    EXPECT_EQ(spec.execTimeout, Seconds(7200));
    EXPECT_FALSE(spec.reschedulePreempted);
    ASSERT_EQ(spec.groups.size(), 2u);
    EXPECT_EQ(spec.taskCount(), 3u);

    const auto* prep = spec.findGroup("prep");
    ASSERT_NE(prep, nullptr);
    EXPECT_TRUE(prep->tasks.front().lead);
    EXPECT_EQ(prep->tasks.front().command, (std::vector<std::string>{"sh", "-c", "wget data"}));
    EXPECT_FALSE(prep->hasBarrier());

    const auto* train = spec.findGroup("train");
    ASSERT_NE(train, nullptr);
    EXPECT_FALSE(train->barrier);
    EXPECT_FALSE(train->ignoreNonleadStatus);
    EXPECT_EQ(train->leader().name, "master");

    const auto* master = train->findTask("master");
    ASSERT_NE(master, nullptr);
    EXPECT_EQ(master->inputs, (std::vector<std::string>{"fetch"}));
    EXPECT_EQ(master->platform, "a100");
    EXPECT_DOUBLE_EQ(master->resources.memory, 64);
    EXPECT_EQ(master->duration, Seconds(1800));
    EXPECT_EQ(master->exitActions.lookup(138), ExitAction::Reschedule);

    const auto* worker = train->findTask("worker");
    ASSERT_NE(worker, nullptr);
    EXPECT_TRUE(worker->privileged);
    EXPECT_TRUE(worker->hostNetwork);
    EXPECT_FALSE(worker->lead);
    EXPECT_DOUBLE_EQ(worker->resources.storage, 0.5);

    const auto demand = train->demand();
    EXPECT_DOUBLE_EQ(demand.cpu, 16);
    EXPECT_DOUBLE_EQ(demand.gpu, 8);
    EXPECT_EQ(train->findTask("fetch"), nullptr);
}

TEST(WorkflowSpecTest, FlatTasksBecomeSingleTaskGroups) {
    const auto spec = WorkflowSpec::parse(R"(
name: etl
pool: batch
tasks:
  - name: extract
  - name: load
    inputs: [extract]
)");
    EXPECT_EQ(spec.priority, Priority::Normal);
    EXPECT_TRUE(spec.reschedulePreempted);
    ASSERT_EQ(spec.groups.size(), 2u);
    EXPECT_EQ(spec.groups[1].name, "load");
    ASSERT_EQ(spec.groups[1].tasks.size(), 1u);
    EXPECT_TRUE(spec.groups[1].tasks.front().lead);
    EXPECT_TRUE(spec.groups[1].barrier);
}

TEST(WorkflowSpecTest, GroupsNeedExactlyOneLead) {
    expectInvalid(R"(
name: w
pool: p
groups:
  - name: g
    tasks:
      - name: a
      - name: b
)");
    expectInvalid(R"(
name: w
pool: p
groups:
  - name: g
    tasks:
      - name: a
        lead: true
      - name: b
        lead: true
)");
    expectInvalid(R"(
name: w
pool: p
groups:
  - name: g
    tasks: []
)");
}

TEST(WorkflowSpecTest, RejectsInvalidDefinitions) {
    expectInvalid("name: w\ntasks:\n  - name: a\n");
    expectInvalid("name: bad name\npool: p\ntasks:\n  - name: a\n");
    expectInvalid("name: " + std::string(64, 'x') + "\npool: p\ntasks:\n  - name: a\n");
    expectInvalid("name: w\npool: p\ntasks:\n  - name: a/b\n");
    expectInvalid("name: w\npool: p\npriority: urgent\ntasks:\n  - name: a\n");
    expectInvalid("name: w\npool: p\n");
    expectInvalid("name: w\npool: p\ntasks:\n  - name: a\n    resources: {gpu: -1}\n");
    expectInvalid("name: w\npool: p\ntasks:\n  - name: a\n    resources: {memory: 4GB}\n");
    expectInvalid("name: w\npool: p\ntasks:\n  - name: a\n    exit_actions: {RETRY: \"1\"}\n");
    expectInvalid("name: w\npool: p\ntimeout: {queue: forever}\ntasks:\n  - name: a\n");
    expectInvalid("name: w\npool: p\ntasks:\n  - name: a\ngroups:\n  - name: g\n    tasks:\n      - name: b\n");
    expectInvalid("- not\n- a map\n");
    expectInvalid("name: [unclosed\n");
    expectInvalid("");
}

TEST(WorkflowSpecTest, YamlRoundTripKeepsDefinition) {
    const auto original = WorkflowSpec::parse(kDistributed);
    const auto copy = WorkflowSpec::parse(original.toYaml());

    EXPECT_EQ(copy.name, original.name);
    EXPECT_EQ(copy.user, original.user);
    EXPECT_EQ(copy.priority, original.priority);
    EXPECT_EQ(copy.queueTimeout, original.queueTimeout);
    EXPECT_EQ(copy.execTimeout, original.execTimeout);
    EXPECT_EQ(copy.reschedulePreempted, original.reschedulePreempted);
    ASSERT_EQ(copy.groups.size(), original.groups.size());

    const auto& train = copy.groups[1];
    EXPECT_FALSE(train.barrier);
    EXPECT_FALSE(train.ignoreNonleadStatus);
    const auto* master = train.findTask("master");
    ASSERT_NE(master, nullptr);
    EXPECT_TRUE(master->lead);
    EXPECT_EQ(master->inputs, (std::vector<std::string>{"fetch"}));
    EXPECT_EQ(master->platform, "a100");
    EXPECT_EQ(master->duration, Seconds(1800));
    EXPECT_EQ(master->exitActions.lookup(0), ExitAction::Complete);
    EXPECT_EQ(master->exitActions.lookup(140), ExitAction::Reschedule);
    EXPECT_TRUE(train.findTask("worker")->privileged);
    EXPECT_EQ(copy.groups[0].tasks.front().command, original.groups[0].tasks.front().command);
}
