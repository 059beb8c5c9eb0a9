/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/gang.hpp"
#include "dagpool/logger.hpp"
#include <algorithm>

namespace dagpool {

namespace {

TaskStatus terminalStatus(const std::vector<MemberStatus>& members, bool ignoreNonleadStatus) {
    const auto any = [&](TaskStatus wanted) {
        return std::any_of(members.begin(), members.end(), [&](const MemberStatus& m) {
            return m.status == wanted && (!ignoreNonleadStatus || m.lead);
        });
    };

    // Group-wide events first. A non-lead that never started because its
    // own input failed is still ignored when only the lead counts.
    if (any(TaskStatus::FailedUpstream)) return TaskStatus::FailedUpstream;
    if (any(TaskStatus::FailedCanceled)) return TaskStatus::FailedCanceled;

    if (any(TaskStatus::FailedServerError)) return TaskStatus::FailedServerError;
    if (any(TaskStatus::FailedPreempted)) return TaskStatus::FailedPreempted;
    if (any(TaskStatus::FailedEvicted)) return TaskStatus::FailedEvicted;

    bool plainFailure = false;
    for (const auto& member : members) {
        if (ignoreNonleadStatus && !member.lead) continue;
        if (member.status == TaskStatus::Failed) {
            plainFailure = true;
        } else if (isFailed(member.status)) {
            return member.status;
        }
    }
    return plainFailure ? TaskStatus::Failed : TaskStatus::Completed;
}

}

TaskStatus reduceGroupStatus(const std::vector<MemberStatus>& members, bool ignoreNonleadStatus) {
    if (members.empty()) {
        return TaskStatus::Submitting;
    }

    const bool allFinished = std::all_of(members.begin(), members.end(),
                                         [](const MemberStatus& m) { return isGroupFinished(m.status); });
    if (allFinished) {
        return terminalStatus(members, ignoreNonleadStatus);
    }

    // The group ends as soon as a member that counts ends it, while the
    // remaining members are still being stopped.
    for (const auto& member : members) {
        if (ignoreNonleadStatus && member.lead && isGroupFinished(member.status)) {
            return terminalStatus(members, true);
        }
        if (!ignoreNonleadStatus && isFailed(member.status)) {
            return terminalStatus(members, false);
        }
    }

    const auto has = [&](TaskStatus wanted) {
        return std::any_of(members.begin(), members.end(),
                           [&](const MemberStatus& m) { return m.status == wanted; });
    };
    if (has(TaskStatus::Running)) return TaskStatus::Running;
    if (has(TaskStatus::Initializing)) return TaskStatus::Initializing;

    TaskStatus furthest = TaskStatus::Submitting;
    for (const auto& member : members) {
        if (isGroupFinished(member.status)) continue;
        if (progressRank(member.status) > progressRank(furthest) ||
            (progressRank(member.status) == progressRank(furthest) && member.status > furthest)) {
            furthest = member.status;
        }
    }
    return furthest;
}

PeerAction peerActionFor(bool lead, TaskStatus outcome, bool ignoreNonleadStatus) noexcept {
    if (outcome == TaskStatus::Rescheduled) {
        return (lead || !ignoreNonleadStatus) ? PeerAction::Restart : PeerAction::None;
    }
    if (!isGroupFinished(outcome)) {
        return PeerAction::None;
    }
    if (lead) {
        return PeerAction::Stop;
    }
    if (isFailed(outcome) && !ignoreNonleadStatus) {
        return PeerAction::Fail;
    }
    return PeerAction::None;
}

TaskStatus stoppedPeerStatus(TaskStatus leadOutcome) noexcept {
    return leadOutcome == TaskStatus::Completed ? TaskStatus::Completed : TaskStatus::Failed;
}

GangCoordinator::Member* GangCoordinator::find(Gang& gang, const TaskRef& member) {
    for (auto& candidate : gang.pending) {
        if (candidate.ref == member) return &candidate;
    }
    return nullptr;
}

GangProgress GangCoordinator::progress(Gang& gang) {
    if (gang.pending.empty()) {
        return GangProgress::Pending;
    }
    const bool allReady = std::all_of(gang.pending.begin(), gang.pending.end(),
                                      [](const Member& m) { return m.ready; });
    if (allReady) {
        gang.placedReported = true;
        return GangProgress::AllReady;
    }
    const bool allPlaced = std::all_of(gang.pending.begin(), gang.pending.end(),
                                       [](const Member& m) { return m.placed; });
    if (allPlaced && !gang.placedReported) {
        gang.placedReported = true;
        return GangProgress::AllPlaced;
    }
    return GangProgress::Pending;
}

void GangCoordinator::begin(const std::string& groupKey, const std::vector<TaskRef>& members,
                            bool barrier, TimePoint now) {
    auto& gang = gangs_[groupKey];
    gang.barrier = barrier;
    gang.placedReported = false;
    gang.deadline = now + barrierTimeout_;
    for (const auto& ref : members) {
        if (auto* existing = find(gang, ref)) {
            existing->placed = existing->ready = false;
        } else {
            gang.pending.push_back(Member{ref, false, false});
        }
    }
    LOG_DEBUG("Gang " + groupKey + " awaiting placement of " + std::to_string(members.size()) + " tasks");
}

void GangCoordinator::rearm(const std::string& groupKey, const std::vector<TaskRef>& members, TimePoint now) {
    auto& gang = gangs_[groupKey];
    if (gang.pending.empty()) {
        gang.deadline = now + barrierTimeout_;
    }
    for (const auto& ref : members) {
        if (auto* existing = find(gang, ref)) {
            existing->ready = false;
        } else {
            gang.pending.push_back(Member{ref, true, false});
        }
    }
}

GangProgress GangCoordinator::markPlaced(const std::string& groupKey, const TaskRef& member) {
    const auto it = gangs_.find(groupKey);
    if (it == gangs_.end()) return GangProgress::Unknown;
    auto* entry = find(it->second, member);
    if (!entry) return GangProgress::Unknown;
    entry->placed = true;
    return progress(it->second);
}

GangProgress GangCoordinator::markReady(const std::string& groupKey, const TaskRef& member) {
    const auto it = gangs_.find(groupKey);
    if (it == gangs_.end()) return GangProgress::Unknown;
    auto* entry = find(it->second, member);
    if (!entry) return GangProgress::Unknown;
    entry->placed = true;
    entry->ready = true;
    return progress(it->second);
}

GangProgress GangCoordinator::drop(const std::string& groupKey, const TaskRef& member) {
    const auto it = gangs_.find(groupKey);
    if (it == gangs_.end()) return GangProgress::Unknown;
    auto& pending = it->second.pending;
    const auto before = pending.size();
    pending.erase(std::remove_if(pending.begin(), pending.end(),
                                 [&](const Member& m) { return m.ref == member; }),
                  pending.end());
    if (pending.size() == before) return GangProgress::Unknown;
    return progress(it->second);
}

std::vector<TaskRef> GangCoordinator::release(const std::string& groupKey) {
    std::vector<TaskRef> released;
    const auto it = gangs_.find(groupKey);
    if (it == gangs_.end()) return released;
    for (const auto& member : it->second.pending) {
        released.push_back(member.ref);
    }
    it->second.pending.clear();
    it->second.placedReported = false;
    return released;
}

void GangCoordinator::releaseMember(const std::string& groupKey, const TaskRef& member) {
    (void)drop(groupKey, member);
}

void GangCoordinator::abandon(const std::string& groupKey) {
    gangs_.erase(groupKey);
}

bool GangCoordinator::tracking(const std::string& groupKey) const {
    return gangs_.count(groupKey) > 0;
}

bool GangCoordinator::hasBarrier(const std::string& groupKey) const {
    const auto it = gangs_.find(groupKey);
    return it != gangs_.end() && it->second.barrier;
}

std::vector<TaskRef> GangCoordinator::pending(const std::string& groupKey) const {
    std::vector<TaskRef> refs;
    const auto it = gangs_.find(groupKey);
    if (it == gangs_.end()) return refs;
    for (const auto& member : it->second.pending) {
        refs.push_back(member.ref);
    }
    return refs;
}

std::vector<TaskRef> GangCoordinator::ready(const std::string& groupKey) const {
    std::vector<TaskRef> refs;
    const auto it = gangs_.find(groupKey);
    if (it == gangs_.end()) return refs;
    for (const auto& member : it->second.pending) {
        if (member.ready) refs.push_back(member.ref);
    }
    return refs;
}

std::vector<std::string> GangCoordinator::expired(TimePoint now) const {
    std::vector<std::string> keys;
    for (const auto& [key, gang] : gangs_) {
        if (!gang.pending.empty() && gang.deadline <= now) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}
