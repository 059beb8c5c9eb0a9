/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

#include "dagpool/errors.hpp"
#include "dagpool/status_store.hpp"

using namespace dagpool;
namespace fs = std::filesystem;

namespace {

const TimePoint t0 = TimePoint(Seconds(1700000000));

WorkflowView makeView(const std::string& id, const std::string& pool, const std::string& user,
                      WorkflowStatus status, int submittedAt) {
    WorkflowView view;
    view.summary.id = id;
    view.summary.name = id.substr(0, id.find('-'));
    view.summary.user = user;
    view.summary.pool = pool;
    view.summary.priority = Priority::Normal;
    view.summary.status = status;
    view.summary.submitTime = t0 + Seconds(submittedAt);
    return view;
}

std::vector<std::string> ids(const std::vector<WorkflowSummary>& summaries) {
    std::vector<std::string> out;
    for (const auto& summary : summaries) out.push_back(summary.id);
    return out;
}

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path);
    file << content;
}

}

class StatusStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace_ = fs::temp_directory_path() /
                     ("dagpool-store-" + std::to_string(getpid()) + "-" +
                      ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(workspace_);
        fs::create_directories(workspace_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(workspace_, ec);
    }

    fs::path workspace_;
};

TEST_F(StatusStoreTest, WritesAndReadsSnapshot) {
    StatusStore store(workspace_);

    auto view = makeView("train-1", "research", "alice", WorkflowStatus::FailedCanceled, 0);
    view.summary.priority = Priority::High;
    view.summary.endTime = t0 + Seconds(90);
    view.startTime = t0 + Seconds(10);
    view.canceled = true;
    view.canceledBy = "bob";
    view.failureMessage = "Group train: task master: canceled by bob";
    view.groups.push_back(GroupView{"train", TaskStatus::FailedCanceled, {"prep"}, false});
    TaskView retired{"master", "train", 0, true, false, TaskStatus::Rescheduled, "node lost", 137, "node-3", 0};
    TaskView current{"master", "train", 1, true, true, TaskStatus::FailedCanceled, "canceled", std::nullopt, "", 2};
    view.tasks = {retired, current};

    ASSERT_TRUE(store.write(view));
    EXPECT_TRUE(fs::exists(workspace_ / "status" / "train-1.yaml"));
    EXPECT_TRUE(store.exists("train-1"));
    for (const auto& entry : fs::directory_iterator(workspace_ / "status")) {
        EXPECT_NE(entry.path().extension(), ".tmp");
    }

    const auto loaded = store.get("train-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->summary.user, "alice");
    EXPECT_EQ(loaded->summary.priority, Priority::High);
    EXPECT_EQ(loaded->summary.status, WorkflowStatus::FailedCanceled);
    EXPECT_EQ(loaded->summary.submitTime, t0);
    EXPECT_EQ(loaded->summary.endTime, t0 + Seconds(90));
    EXPECT_EQ(loaded->startTime, t0 + Seconds(10));
    EXPECT_TRUE(loaded->canceled);
    EXPECT_EQ(loaded->canceledBy, "bob");
    EXPECT_EQ(loaded->failureMessage, view.failureMessage);

    const auto* group = loaded->group("train");
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->upstream, (std::vector<std::string>{"prep"}));

    const auto* master = loaded->task("master");
    ASSERT_NE(master, nullptr);
    EXPECT_EQ(master->retryId, 1);
    EXPECT_EQ(master->restarts, 2);
    EXPECT_FALSE(master->exitCode.has_value());
    const auto history = loaded->instances("master");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0]->exitCode, 137);
    EXPECT_EQ(history[0]->node, "node-3");
    EXPECT_EQ(history[0]->message, "node lost");
}

TEST_F(StatusStoreTest, MissingSnapshotIsEmpty) {
    StatusStore store(workspace_);
    EXPECT_FALSE(store.get("nope").has_value());
    EXPECT_FALSE(store.exists("nope"));
    EXPECT_TRUE(store.list(HistoryFilter{}).empty());
    EXPECT_FALSE(store.latest().has_value());
}

TEST_F(StatusStoreTest, ListsNewestFirstWithFilters) {
    StatusStore store(workspace_);
    ASSERT_TRUE(store.write(makeView("a-1", "research", "alice", WorkflowStatus::Completed, 10)));
    ASSERT_TRUE(store.write(makeView("b-1", "prod", "bob", WorkflowStatus::Running, 30)));
    ASSERT_TRUE(store.write(makeView("c-1", "research", "bob", WorkflowStatus::Running, 20)));

    HistoryFilter all;
    all.limit = 0;
    EXPECT_EQ(ids(store.list(all)), (std::vector<std::string>{"b-1", "c-1", "a-1"}));

    HistoryFilter limited;
    limited.limit = 2;
    EXPECT_EQ(ids(store.list(limited)), (std::vector<std::string>{"b-1", "c-1"}));

    HistoryFilter byPool;
    byPool.pool = "research";
    EXPECT_EQ(ids(store.list(byPool)), (std::vector<std::string>{"c-1", "a-1"}));

    HistoryFilter byUserAndStatus;
    byUserAndStatus.user = "bob";
    byUserAndStatus.status = WorkflowStatus::Running;
    EXPECT_EQ(ids(store.list(byUserAndStatus)), (std::vector<std::string>{"b-1", "c-1"}));

    const auto latest = store.latest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, "b-1");
}

TEST_F(StatusStoreTest, SkipsUnreadableAndHiddenFiles) {
    StatusStore store(workspace_);
    ASSERT_TRUE(store.write(makeView("good-1", "research", "alice", WorkflowStatus::Pending, 0)));
    writeFile(workspace_ / "status" / "broken.yaml", "id: [unclosed\n");
    writeFile(workspace_ / "status" / ".staging.yaml", "id: hidden-1\npriority: LOW\nstatus: PENDING\n");
    writeFile(workspace_ / "status" / "notes.txt", "ignored");

    HistoryFilter all;
    all.limit = 0;
    EXPECT_EQ(ids(store.list(all)), (std::vector<std::string>{"good-1"}));
    EXPECT_FALSE(store.get("broken").has_value());
}

TEST_F(StatusStoreTest, ReadsRejectionReason) {
    StatusStore store(workspace_);
    EXPECT_FALSE(store.rejection("loop-1").has_value());
    writeFile(workspace_ / "rejected" / "loop-1" / "error.txt", "Cyclic dependency: a -> b -> a\n");
    EXPECT_EQ(store.rejection("loop-1"), std::string("Cyclic dependency: a -> b -> a\n"));
}

TEST(StatusSnapshotTest, RejectsMalformedSnapshots) {
    EXPECT_THROW((void)StatusStore::fromYaml("- a\n- list\n"), ValidationError);
    EXPECT_THROW((void)StatusStore::fromYaml("name: x\npriority: LOW\nstatus: PENDING\n"), ValidationError);
    EXPECT_THROW((void)StatusStore::fromYaml("id: x-1\npriority: URGENT\nstatus: PENDING\n"), ValidationError);
    EXPECT_THROW((void)StatusStore::fromYaml("id: x-1\npriority: LOW\nstatus: DONE\n"), ValidationError);
    EXPECT_THROW((void)StatusStore::fromYaml(
                     "id: x-1\npriority: LOW\nstatus: PENDING\ntasks:\n  - name: a\n    status: LOST\n"),
                 ValidationError);
    EXPECT_THROW((void)StatusStore::fromYaml("id: [unclosed\n"), ValidationError);

    const auto minimal = StatusStore::fromYaml("id: x-1\npriority: low\nstatus: pending\n");
    EXPECT_EQ(minimal.summary.id, "x-1");
    EXPECT_FALSE(minimal.canceled);
    EXPECT_TRUE(minimal.tasks.empty());
}
