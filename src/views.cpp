/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/views.hpp"

namespace dagpool {

const GroupView* WorkflowView::group(const std::string& name) const noexcept {
    for (const auto& candidate : groups) {
        if (candidate.name == name) return &candidate;
    }
    return nullptr;
}

const TaskView* WorkflowView::task(const std::string& name) const noexcept {
    for (const auto& candidate : tasks) {
        if (candidate.name == name && candidate.current) return &candidate;
    }
    return nullptr;
}

std::vector<const TaskView*> WorkflowView::instances(const std::string& name) const {
    std::vector<const TaskView*> found;
    for (const auto& candidate : tasks) {
        if (candidate.name == name) found.push_back(&candidate);
    }
    return found;
}

bool HistoryFilter::matches(const WorkflowSummary& summary) const noexcept {
    if (!pool.empty() && summary.pool != pool) return false;
    if (!user.empty() && summary.user != user) return false;
    if (status && summary.status != *status) return false;
    return true;
}

}
