/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "dagpool/exit_actions.hpp"
#include "dagpool/types.hpp"

namespace dagpool {

struct TaskSpec {
    std::string name;
    bool lead = false;
    Resources resources;
    // Empty selects the pool's default platform.
    std::string platform;
    bool privileged = false;
    bool hostNetwork = false;
    // Names of upstream tasks, in this or other groups.
    std::vector<std::string> inputs;
    ExitActions exitActions;
    std::string image;
    std::vector<std::string> command;
    // Expected runtime, used by the simulated backend.
    Seconds duration{0};
};

struct GroupSpec {
    std::string name;
    bool barrier = true;
    bool ignoreNonleadStatus = true;
    std::vector<TaskSpec> tasks;

    [[nodiscard]] bool hasBarrier() const noexcept { return barrier && tasks.size() > 1; }
    [[nodiscard]] const TaskSpec& leader() const;
    [[nodiscard]] const TaskSpec* findTask(const std::string& task) const noexcept;
    [[nodiscard]] Resources demand() const noexcept;
};

struct WorkflowSpec {
    std::string name;
    std::string user;
    std::string pool;
    Priority priority = Priority::Normal;
    // Zero falls back to the pool, then scheduler defaults.
    Seconds queueTimeout{0};
    Seconds execTimeout{0};
    bool reschedulePreempted = true;
    std::vector<GroupSpec> groups;

    // Both throw ValidationError. A definition lists either `groups` or flat
    // `tasks`; each flat task becomes a group of its own.
    [[nodiscard]] static WorkflowSpec parse(const std::string& yaml);
    [[nodiscard]] static WorkflowSpec load(const std::filesystem::path& path);

    [[nodiscard]] std::string toYaml() const;

    [[nodiscard]] const GroupSpec* findGroup(const std::string& group) const noexcept;
    [[nodiscard]] std::size_t taskCount() const noexcept;
};

}
