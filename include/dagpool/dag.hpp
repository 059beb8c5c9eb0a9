/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dagpool/workflow_spec.hpp"

namespace dagpool {

// Dependency graph of one workflow. A task input in the same group orders
// tasks inside the group; an input from another group makes that group
// upstream of this one. Immutable once built, so it can be rebuilt from the
// stored definition at any time.
class DagResolver {
public:
    // Reports whether a group or task (by name) ended successfully.
    using SucceededFn = std::function<bool(const std::string&)>;

    // Throws ValidationError for duplicate names, unknown or self inputs,
    // and CyclicDependencyError for a cycle between tasks or between groups.
    explicit DagResolver(const WorkflowSpec& spec);

    [[nodiscard]] const std::vector<std::string>& groupOrder() const noexcept { return groupOrder_; }

    [[nodiscard]] bool hasGroup(const std::string& group) const noexcept;
    [[nodiscard]] bool hasTask(const std::string& task) const noexcept;
    [[nodiscard]] const std::string& groupOf(const std::string& task) const;

    [[nodiscard]] const std::vector<std::string>& upstreamGroups(const std::string& group) const;
    [[nodiscard]] const std::vector<std::string>& downstreamGroups(const std::string& group) const;
    [[nodiscard]] const std::vector<std::string>& upstreamTasks(const std::string& task) const;
    [[nodiscard]] const std::vector<std::string>& downstreamTasks(const std::string& task) const;

    // Upstream tasks that live in the same group.
    [[nodiscard]] std::vector<std::string> intraGroupUpstream(const std::string& task) const;

    // Every group reachable downstream of `group`, in topological order.
    [[nodiscard]] std::vector<std::string> downstreamClosure(const std::string& group) const;

    [[nodiscard]] bool isGroupReady(const std::string& group, const SucceededFn& succeeded) const;
    [[nodiscard]] bool isTaskReady(const std::string& task, const SucceededFn& succeeded) const;

private:
    struct Node {
        std::vector<std::string> upstream;
        std::vector<std::string> downstream;
    };

    static void addEdge(std::unordered_map<std::string, Node>& nodes,
                        const std::string& from, const std::string& to);
    static void checkAcyclic(const std::vector<std::string>& order,
                             const std::unordered_map<std::string, Node>& nodes);
    const Node& groupNode(const std::string& group) const;
    const Node& taskNode(const std::string& task) const;

    std::unordered_map<std::string, Node> groups_;
    std::unordered_map<std::string, Node> tasks_;
    std::unordered_map<std::string, std::string> taskGroup_;
    std::vector<std::string> groupOrder_;
};

}
