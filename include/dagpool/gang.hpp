/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "dagpool/status.hpp"
#include "dagpool/types.hpp"

namespace dagpool {

enum class GangProgress : std::uint8_t {
    Unknown,    // not a pending member of a tracked gang
    Pending,
    AllPlaced,  // reported once per round, when the last member is placed
    AllReady
};

// What happens to the other members of a group when one member ends.
enum class PeerAction : std::uint8_t {
    None,
    Stop,     // lead finished
    Fail,     // member failed and non-lead status counts
    Restart   // lead, or any member when non-lead status counts, rescheduled
};

struct MemberStatus {
    TaskStatus status;
    bool lead = false;
};

// Group status from the current instance of each member.
[[nodiscard]] TaskStatus reduceGroupStatus(const std::vector<MemberStatus>& members,
                                           bool ignoreNonleadStatus);

[[nodiscard]] PeerAction peerActionFor(bool lead, TaskStatus outcome, bool ignoreNonleadStatus) noexcept;

// Status given to the members stopped after the lead finished.
[[nodiscard]] TaskStatus stoppedPeerStatus(TaskStatus leadOutcome) noexcept;

// Tracks placement rounds and start barriers. A round covers the members
// placed together: the whole group at first, replacements and restarted
// members later. Not synchronized; the scheduler serializes access.
class GangCoordinator {
public:
    explicit GangCoordinator(Seconds barrierTimeout) noexcept : barrierTimeout_(barrierTimeout) {}

    void setBarrierTimeout(Seconds timeout) noexcept { barrierTimeout_ = timeout; }

    // Adds members that still need placement to the group's round.
    void begin(const std::string& groupKey, const std::vector<TaskRef>& members, bool barrier, TimePoint now);
    // Adds placed members that must pass the barrier again after a restart.
    void rearm(const std::string& groupKey, const std::vector<TaskRef>& members, TimePoint now);

    GangProgress markPlaced(const std::string& groupKey, const TaskRef& member);
    GangProgress markReady(const std::string& groupKey, const TaskRef& member);

    // Drops a member that ended before the barrier released.
    GangProgress drop(const std::string& groupKey, const TaskRef& member);
    // Clears the round after its barrier released.
    std::vector<TaskRef> release(const std::string& groupKey);
    void releaseMember(const std::string& groupKey, const TaskRef& member);
    void abandon(const std::string& groupKey);

    [[nodiscard]] bool tracking(const std::string& groupKey) const;
    [[nodiscard]] bool hasBarrier(const std::string& groupKey) const;
    [[nodiscard]] std::vector<TaskRef> pending(const std::string& groupKey) const;
    // Pending members that reported ready.
    [[nodiscard]] std::vector<TaskRef> ready(const std::string& groupKey) const;
    [[nodiscard]] std::vector<std::string> expired(TimePoint now) const;

private:
    struct Member {
        TaskRef ref;
        bool placed = false;
        bool ready = false;
    };

    struct Gang {
        std::vector<Member> pending;
        bool barrier = true;
        bool placedReported = false;
        TimePoint deadline;
    };

    static Member* find(Gang& gang, const TaskRef& member);
    static GangProgress progress(Gang& gang);

    Seconds barrierTimeout_;
    std::unordered_map<std::string, Gang> gangs_;
};

}
