/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/dag.hpp"
#include "dagpool/errors.hpp"
#include <algorithm>
#include <set>
#include <unordered_set>

namespace dagpool {

namespace {

enum class Mark : unsigned char { White, Grey, Black };

}

DagResolver::DagResolver(const WorkflowSpec& spec) {
    std::vector<std::string> groupNames;
    std::vector<std::string> taskNames;

    for (const auto& group : spec.groups) {
        if (!groups_.emplace(group.name, Node{}).second) {
            throw ValidationError("Duplicate group name '" + group.name + "'");
        }
        groupNames.push_back(group.name);
        for (const auto& task : group.tasks) {
            if (!taskGroup_.emplace(task.name, group.name).second) {
                throw ValidationError("Duplicate task name '" + task.name + "'");
            }
            tasks_.emplace(task.name, Node{});
            taskNames.push_back(task.name);
        }
    }

    for (const auto& group : spec.groups) {
        for (const auto& task : group.tasks) {
            for (const auto& input : task.inputs) {
                if (input == task.name) {
                    throw ValidationError("Task '" + task.name + "' depends on itself");
                }
                const auto owner = taskGroup_.find(input);
                if (owner == taskGroup_.end()) {
                    throw ValidationError("Task '" + task.name + "' depends on unknown task '" + input + "'");
                }
                addEdge(tasks_, input, task.name);
                if (owner->second != group.name) {
                    addEdge(groups_, owner->second, group.name);
                }
            }
        }
    }

    checkAcyclic(taskNames, tasks_);
    checkAcyclic(groupNames, groups_);

    // Kahn's algorithm, ties broken by definition order.
    std::unordered_map<std::string, std::size_t> position;
    std::unordered_map<std::string, std::size_t> indegree;
    for (std::size_t i = 0; i < groupNames.size(); ++i) {
        position[groupNames[i]] = i;
        indegree[groupNames[i]] = groups_.at(groupNames[i]).upstream.size();
    }
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < groupNames.size(); ++i) {
        if (indegree[groupNames[i]] == 0) ready.insert(i);
    }
    while (!ready.empty()) {
        const auto& name = groupNames[*ready.begin()];
        ready.erase(ready.begin());
        groupOrder_.push_back(name);
        for (const auto& next : groups_.at(name).downstream) {
            if (--indegree[next] == 0) ready.insert(position[next]);
        }
    }
}

void DagResolver::addEdge(std::unordered_map<std::string, Node>& nodes,
                          const std::string& from, const std::string& to) {
    auto& upstream = nodes.at(to).upstream;
    if (std::find(upstream.begin(), upstream.end(), from) != upstream.end()) {
        return;
    }
    upstream.push_back(from);
    nodes.at(from).downstream.push_back(to);
}

void DagResolver::checkAcyclic(const std::vector<std::string>& order,
                               const std::unordered_map<std::string, Node>& nodes) {
    std::unordered_map<std::string, Mark> marks;
    for (const auto& name : order) marks[name] = Mark::White;

    // Iterative DFS so long chains cannot exhaust the stack.
    for (const auto& root : order) {
        if (marks[root] != Mark::White) continue;

        std::vector<std::pair<std::string, std::size_t>> stack;
        stack.emplace_back(root, 0);
        marks[root] = Mark::Grey;

        while (!stack.empty()) {
            auto& [name, next] = stack.back();
            const auto& downstream = nodes.at(name).downstream;
            if (next == downstream.size()) {
                marks[name] = Mark::Black;
                stack.pop_back();
                continue;
            }
            const std::string child = downstream[next++];
            if (marks[child] == Mark::Grey) {
                std::vector<std::string> cycle;
                auto it = std::find_if(stack.begin(), stack.end(),
                                       [&](const auto& frame) { return frame.first == child; });
                for (; it != stack.end(); ++it) cycle.push_back(it->first);
                cycle.push_back(child);
                throw CyclicDependencyError(std::move(cycle));
            }
            if (marks[child] == Mark::White) {
                marks[child] = Mark::Grey;
                stack.emplace_back(child, 0);
            }
        }
    }
}

const DagResolver::Node& DagResolver::groupNode(const std::string& group) const {
    const auto it = groups_.find(group);
    if (it == groups_.end()) {
        throw NotFoundError("Unknown group '" + group + "'");
    }
    return it->second;
}

const DagResolver::Node& DagResolver::taskNode(const std::string& task) const {
    const auto it = tasks_.find(task);
    if (it == tasks_.end()) {
        throw NotFoundError("Unknown task '" + task + "'");
    }
    return it->second;
}

bool DagResolver::hasGroup(const std::string& group) const noexcept {
    return groups_.count(group) > 0;
}

bool DagResolver::hasTask(const std::string& task) const noexcept {
    return tasks_.count(task) > 0;
}

const std::string& DagResolver::groupOf(const std::string& task) const {
    const auto it = taskGroup_.find(task);
    if (it == taskGroup_.end()) {
        throw NotFoundError("Unknown task '" + task + "'");
    }
    return it->second;
}

const std::vector<std::string>& DagResolver::upstreamGroups(const std::string& group) const {
    return groupNode(group).upstream;
}

const std::vector<std::string>& DagResolver::downstreamGroups(const std::string& group) const {
    return groupNode(group).downstream;
}

const std::vector<std::string>& DagResolver::upstreamTasks(const std::string& task) const {
    return taskNode(task).upstream;
}

const std::vector<std::string>& DagResolver::downstreamTasks(const std::string& task) const {
    return taskNode(task).downstream;
}

std::vector<std::string> DagResolver::intraGroupUpstream(const std::string& task) const {
    const auto& group = groupOf(task);
    std::vector<std::string> result;
    for (const auto& upstream : taskNode(task).upstream) {
        if (taskGroup_.at(upstream) == group) result.push_back(upstream);
    }
    return result;
}

std::vector<std::string> DagResolver::downstreamClosure(const std::string& group) const {
    std::unordered_set<std::string> reached;
    std::vector<std::string> frontier = groupNode(group).downstream;
    while (!frontier.empty()) {
        const auto name = frontier.back();
        frontier.pop_back();
        if (!reached.insert(name).second) continue;
        for (const auto& next : groups_.at(name).downstream) frontier.push_back(next);
    }

    std::vector<std::string> ordered;
    for (const auto& name : groupOrder_) {
        if (reached.count(name)) ordered.push_back(name);
    }
    return ordered;
}

bool DagResolver::isGroupReady(const std::string& group, const SucceededFn& succeeded) const {
    const auto& upstream = groupNode(group).upstream;
    return std::all_of(upstream.begin(), upstream.end(), succeeded);
}

bool DagResolver::isTaskReady(const std::string& task, const SucceededFn& succeeded) const {
    const auto& upstream = taskNode(task).upstream;
    return std::all_of(upstream.begin(), upstream.end(), succeeded);
}

}
