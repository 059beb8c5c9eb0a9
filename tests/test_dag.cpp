/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "dagpool/dag.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/workflow_spec.hpp"

using namespace dagpool;

namespace {

using Names = std::vector<std::string>;

DagResolver resolve(const std::string& yaml) {
    return DagResolver(WorkflowSpec::parse(yaml));
}

}

TEST(DagResolverTest, OrdersGroupsTopologically) {
    const auto dag = resolve(R"(
name: pipeline
pool: P
tasks:
  - name: report
    inputs: [train, eval]
  - name: prep
  - name: train
    inputs: [prep]
  - name: eval
    inputs: [prep]
)");

    EXPECT_EQ(dag.groupOrder(), (Names{"prep", "train", "eval", "report"}));
    EXPECT_EQ(dag.upstreamGroups("report"), (Names{"train", "eval"}));
    EXPECT_EQ(dag.downstreamGroups("prep"), (Names{"train", "eval"}));
    EXPECT_TRUE(dag.upstreamGroups("prep").empty());
}

TEST(DagResolverTest, IndependentGroupsKeepDefinitionOrder) {
    const auto dag = resolve(R"(
name: fanout
pool: P
tasks:
  - name: c
  - name: a
  - name: b
)");
    EXPECT_EQ(dag.groupOrder(), (Names{"c", "a", "b"}));
}

TEST(DagResolverTest, SeparatesIntraGroupInputs) {
    const auto dag = resolve(R"(
name: mixed
pool: P
groups:
  - name: data
    tasks:
      - name: fetch
  - name: train
    tasks:
      - name: master
        lead: true
        inputs: [fetch, warmup]
      - name: warmup
)");

    EXPECT_EQ(dag.groupOf("master"), "train");
    EXPECT_EQ(dag.upstreamTasks("master"), (Names{"fetch", "warmup"}));
    EXPECT_EQ(dag.intraGroupUpstream("master"), (Names{"warmup"}));
    EXPECT_EQ(dag.upstreamGroups("train"), (Names{"data"}));
    EXPECT_EQ(dag.downstreamTasks("warmup"), (Names{"master"}));
    EXPECT_TRUE(dag.intraGroupUpstream("warmup").empty());
}

TEST(DagResolverTest, DownstreamClosureIsTransitiveAndOrdered) {
    const auto dag = resolve(R"(
name: chain
pool: P
tasks:
  - name: a
  - name: b
    inputs: [a]
  - name: c
    inputs: [b]
  - name: d
    inputs: [a, c]
  - name: side
)");

    EXPECT_EQ(dag.downstreamClosure("a"), (Names{"b", "c", "d"}));
    EXPECT_EQ(dag.downstreamClosure("c"), (Names{"d"}));
    EXPECT_TRUE(dag.downstreamClosure("side").empty());
}

TEST(DagResolverTest, ReadinessFollowsUpstreamSuccess) {
    const auto dag = resolve(R"(
name: join
pool: P
tasks:
  - name: left
  - name: right
  - name: merge
    inputs: [left, right]
)");

    std::set<std::string> done{"left"};
    const auto succeeded = [&](const std::string& name) { return done.count(name) > 0; };

    EXPECT_TRUE(dag.isGroupReady("left", succeeded));
    EXPECT_FALSE(dag.isGroupReady("merge", succeeded));
    EXPECT_FALSE(dag.isTaskReady("merge", succeeded));

    done.insert("right");
    EXPECT_TRUE(dag.isGroupReady("merge", succeeded));
    EXPECT_TRUE(dag.isTaskReady("merge", succeeded));
}

TEST(DagResolverTest, ReportsTaskCycle) {
    try {
        resolve(R"(
name: loop
pool: P
tasks:
  - name: a
    inputs: [c]
  - name: b
    inputs: [a]
  - name: c
    inputs: [b]
)");
        FAIL() << "Expected CyclicDependencyError";
    } catch (const CyclicDependencyError& e) {
        const auto& cycle = e.cycle();
        ASSERT_EQ(cycle.size(), 4u);
        EXPECT_EQ(cycle.front(), cycle.back());
        EXPECT_EQ(std::set<std::string>(cycle.begin(), cycle.end()), (std::set<std::string>{"a", "b", "c"}));
    }
}

TEST(DagResolverTest, ReportsGroupCycleWithoutTaskCycle) {
    // fetch -> eval -> tune is acyclic, but data and check feed each other.
    EXPECT_THROW(resolve(R"(
name: tangled
pool: P
groups:
  - name: data
    tasks:
      - name: fetch
        lead: true
      - name: tune
        inputs: [eval]
  - name: check
    tasks:
      - name: eval
        inputs: [fetch]
)"), CyclicDependencyError);
}

TEST(DagResolverTest, RejectsBadInputs) {
    EXPECT_THROW(resolve(R"(
name: unknown
pool: P
tasks:
  - name: a
    inputs: [ghost]
)"), ValidationError);

    EXPECT_THROW(resolve(R"(
name: self
pool: P
tasks:
  - name: a
    inputs: [a]
)"), ValidationError);

    EXPECT_THROW(resolve(R"(
name: twice
pool: P
groups:
  - name: g1
    tasks:
      - name: a
  - name: g2
    tasks:
      - name: a
)"), ValidationError);
}

TEST(DagResolverTest, UnknownNamesThrowNotFound) {
    const auto dag = resolve(R"(
name: single
pool: P
tasks:
  - name: only
)");
    EXPECT_TRUE(dag.hasGroup("only"));
    EXPECT_TRUE(dag.hasTask("only"));
    EXPECT_FALSE(dag.hasTask("other"));
    EXPECT_THROW((void)dag.groupOf("other"), NotFoundError);
    EXPECT_THROW((void)dag.upstreamGroups("other"), NotFoundError);
}
