/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/status_store.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace dagpool {

namespace {

long long toEpoch(TimePoint time) {
    return std::chrono::duration_cast<Seconds>(time.time_since_epoch()).count();
}

TimePoint fromEpoch(long long seconds) {
    return TimePoint(Seconds(seconds));
}

void emitTime(YAML::Emitter& out, const char* key, const std::optional<TimePoint>& time) {
    if (time) {
        out << YAML::Key << key << YAML::Value << toEpoch(*time);
    }
}

std::optional<TimePoint> readTime(const YAML::Node& node) {
    if (!node) return std::nullopt;
    return fromEpoch(node.as<long long>());
}

std::string readString(const YAML::Node& node) {
    return node ? node.as<std::string>() : std::string();
}

TaskStatus readTaskStatus(const YAML::Node& node) {
    const auto text = readString(node);
    const auto status = parseTaskStatus(text);
    if (!status) {
        throw ValidationError("Unknown task status '" + text + "'");
    }
    return *status;
}

WorkflowSummary readSummary(const YAML::Node& root) {
    WorkflowSummary summary;
    summary.id = readString(root["id"]);
    if (summary.id.empty()) {
        throw ValidationError("Snapshot without id");
    }
    summary.name = readString(root["name"]);
    summary.user = readString(root["user"]);
    summary.pool = readString(root["pool"]);

    const auto priority = parsePriority(readString(root["priority"]));
    if (!priority) {
        throw ValidationError("Snapshot " + summary.id + " has an unknown priority");
    }
    summary.priority = *priority;

    const auto status = parseWorkflowStatus(readString(root["status"]));
    if (!status) {
        throw ValidationError("Snapshot " + summary.id + " has an unknown status");
    }
    summary.status = *status;
    summary.submitTime = fromEpoch(root["submit_time"] ? root["submit_time"].as<long long>() : 0);
    summary.endTime = readTime(root["end_time"]);
    return summary;
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

}

StatusStore::StatusStore(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace), statusPath_(workspace / "status") {
}

std::filesystem::path StatusStore::snapshotPath(const WorkflowId& id) const {
    return statusPath_ / (id + ".yaml");
}

bool StatusStore::write(const WorkflowView& view) const noexcept {
    try {
        std::filesystem::create_directories(statusPath_);
        const auto target = snapshotPath(view.summary.id);
        const auto temp = statusPath_ / ("." + view.summary.id + "." + std::to_string(getpid()) + ".tmp");

        {
            std::ofstream file(temp, std::ios::trunc);
            if (!file) {
                LOG_ERROR("Cannot write status snapshot: " + temp.string());
                return false;
            }
            file << toYaml(view) << "\n";
            if (!file) {
                LOG_ERROR("Failed writing status snapshot: " + temp.string());
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            LOG_ERROR("Failed to publish status of " + view.summary.id + ": " + ec.message());
            std::filesystem::remove(temp, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error writing status of " + view.summary.id + ": " + e.what());
        return false;
    }
}

std::optional<WorkflowView> StatusStore::get(const WorkflowId& id) const noexcept {
    try {
        const auto content = readFile(snapshotPath(id));
        if (!content) {
            LOG_DEBUG("No status snapshot for " + id);
            return std::nullopt;
        }
        return fromYaml(*content);
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading status of " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<WorkflowSummary> StatusStore::latest() const noexcept {
    HistoryFilter filter;
    filter.limit = 1;
    auto summaries = list(filter);
    if (summaries.empty()) {
        return std::nullopt;
    }
    return summaries.front();
}

std::vector<WorkflowSummary> StatusStore::list(const HistoryFilter& filter) const noexcept {
    std::vector<WorkflowSummary> summaries;
    try {
        if (!std::filesystem::exists(statusPath_)) {
            return summaries;
        }

        for (const auto& entry : std::filesystem::directory_iterator(statusPath_)) {
            const auto& path = entry.path();
            if (!entry.is_regular_file() || path.extension() != ".yaml") continue;
            if (path.filename().string().front() == '.') continue;

            try {
                const auto summary = readSummary(YAML::LoadFile(path.string()));
                if (filter.matches(summary)) {
                    summaries.push_back(summary);
                }
            } catch (const std::exception& e) {
                LOG_WARN("Skipping unreadable snapshot " + path.string() + ": " + e.what());
            }
        }

        std::sort(summaries.begin(), summaries.end(), [](const WorkflowSummary& a, const WorkflowSummary& b) {
            if (a.submitTime != b.submitTime) return a.submitTime > b.submitTime;
            return a.id > b.id;
        });

        if (filter.limit > 0 && summaries.size() > filter.limit) {
            summaries.resize(filter.limit);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing workflows: " + std::string(e.what()));
    }

    return summaries;
}

bool StatusStore::exists(const WorkflowId& id) const noexcept {
    std::error_code ec;
    return std::filesystem::exists(snapshotPath(id), ec);
}

std::optional<std::string> StatusStore::rejection(const WorkflowId& id) const {
    return readFile(workspace_ / "rejected" / id / "error.txt");
}

std::string StatusStore::toYaml(const WorkflowView& view) {
    const auto& summary = view.summary;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << summary.id;
    out << YAML::Key << "name" << YAML::Value << summary.name;
    out << YAML::Key << "user" << YAML::Value << summary.user;
    out << YAML::Key << "pool" << YAML::Value << summary.pool;
    out << YAML::Key << "priority" << YAML::Value << toString(summary.priority);
    out << YAML::Key << "status" << YAML::Value << toString(summary.status);
    out << YAML::Key << "submit_time" << YAML::Value << toEpoch(summary.submitTime);
    emitTime(out, "start_time", view.startTime);
    emitTime(out, "end_time", summary.endTime);
    if (view.canceled) {
        out << YAML::Key << "canceled_by" << YAML::Value << view.canceledBy;
    }
    if (!view.failureMessage.empty()) {
        out << YAML::Key << "failure_message" << YAML::Value << view.failureMessage;
    }

    out << YAML::Key << "groups" << YAML::Value << YAML::BeginSeq;
    for (const auto& group : view.groups) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << group.name;
        out << YAML::Key << "status" << YAML::Value << toString(group.status);
        out << YAML::Key << "queued" << YAML::Value << group.queued;
        out << YAML::Key << "upstream" << YAML::Value << YAML::Flow << group.upstream;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
    for (const auto& task : view.tasks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << task.name;
        out << YAML::Key << "group" << YAML::Value << task.group;
        out << YAML::Key << "retry_id" << YAML::Value << task.retryId;
        out << YAML::Key << "lead" << YAML::Value << task.lead;
        out << YAML::Key << "current" << YAML::Value << task.current;
        out << YAML::Key << "status" << YAML::Value << toString(task.status);
        if (!task.message.empty()) out << YAML::Key << "message" << YAML::Value << task.message;
        if (task.exitCode) out << YAML::Key << "exit_code" << YAML::Value << *task.exitCode;
        if (!task.node.empty()) out << YAML::Key << "node" << YAML::Value << task.node;
        if (task.restarts > 0) out << YAML::Key << "restarts" << YAML::Value << task.restarts;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

WorkflowView StatusStore::fromYaml(const std::string& yaml) {
    try {
        const auto root = YAML::Load(yaml);
        if (!root.IsMap()) {
            throw ValidationError("Snapshot is not a mapping");
        }

        WorkflowView view;
        view.summary = readSummary(root);
        view.startTime = readTime(root["start_time"]);
        if (root["canceled_by"]) {
            view.canceled = true;
            view.canceledBy = readString(root["canceled_by"]);
        }
        view.failureMessage = readString(root["failure_message"]);

        for (const auto& node : root["groups"]) {
            GroupView group;
            group.name = readString(node["name"]);
            group.status = readTaskStatus(node["status"]);
            group.queued = node["queued"] && node["queued"].as<bool>();
            if (node["upstream"]) {
                group.upstream = node["upstream"].as<std::vector<std::string>>();
            }
            view.groups.push_back(std::move(group));
        }

        for (const auto& node : root["tasks"]) {
            TaskView task;
            task.name = readString(node["name"]);
            task.group = readString(node["group"]);
            task.retryId = node["retry_id"] ? node["retry_id"].as<int>() : 0;
            task.lead = node["lead"] && node["lead"].as<bool>();
            task.current = !node["current"] || node["current"].as<bool>();
            task.status = readTaskStatus(node["status"]);
            task.message = readString(node["message"]);
            if (node["exit_code"]) task.exitCode = node["exit_code"].as<int>();
            task.node = readString(node["node"]);
            task.restarts = node["restarts"] ? node["restarts"].as<int>() : 0;
            view.tasks.push_back(std::move(task));
        }
        return view;
    } catch (const YAML::Exception& e) {
        throw ValidationError("Malformed status snapshot: " + std::string(e.what()));
    }
}

}
