/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "dagpool/types.hpp"
#include "dagpool/views.hpp"

namespace dagpool {

// Workflow status snapshots under <workspace>/status, one YAML file per
// workflow. The daemon writes them; dpstat only reads.
class StatusStore {
public:
    explicit StatusStore(const std::filesystem::path& workspace) noexcept;

    StatusStore(const StatusStore&) = delete;
    StatusStore& operator=(const StatusStore&) = delete;
    StatusStore(StatusStore&&) noexcept = default;
    StatusStore& operator=(StatusStore&&) noexcept = default;

    // Replaces the snapshot atomically.
    [[nodiscard]] bool write(const WorkflowView& view) const noexcept;

    [[nodiscard]] std::optional<WorkflowView> get(const WorkflowId& id) const noexcept;
    [[nodiscard]] std::optional<WorkflowSummary> latest() const noexcept;
    // Newest first.
    [[nodiscard]] std::vector<WorkflowSummary> list(const HistoryFilter& filter) const noexcept;
    [[nodiscard]] bool exists(const WorkflowId& id) const noexcept;
    // Contents of rejected/<id>/error.txt, for definitions the daemon refused.
    [[nodiscard]] std::optional<std::string> rejection(const WorkflowId& id) const;

    [[nodiscard]] static std::string toYaml(const WorkflowView& view);
    // Throws ValidationError on a malformed snapshot.
    [[nodiscard]] static WorkflowView fromYaml(const std::string& yaml);

private:
    std::filesystem::path workspace_;
    std::filesystem::path statusPath_;

    [[nodiscard]] std::filesystem::path snapshotPath(const WorkflowId& id) const;
};

}
