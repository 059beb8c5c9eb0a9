/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dagpool/config.hpp"
#include "dagpool/ledger.hpp"
#include "dagpool/types.hpp"
#include "dagpool/workflow_spec.hpp"

namespace dagpool {

// A ready group waiting for capacity.
struct QueueEntry {
    std::string groupKey;
    std::string pool;
    Priority priority = Priority::Normal;
    TimePoint submitTime;
    std::uint64_t sequence = 0;
    std::shared_ptr<const GroupSpec> group;

    [[nodiscard]] Resources demand() const;
};

// Priority descending, then submit time, then submission sequence.
struct QueueOrder {
    bool operator()(const QueueEntry& a, const QueueEntry& b) const noexcept;
};

// Empty when some platform of the pool can host every task of the group.
[[nodiscard]] std::string infeasibilityReason(const PoolConfig& pool, const GroupSpec& group);

struct AdmissionOutcome {
    QueueEntry entry;
    AdmitDecision decision = AdmitDecision::Admit;
};

struct AdmissionPass {
    std::string pool;
    std::vector<AdmissionOutcome> admitted;
    std::vector<std::pair<QueueEntry, std::string>> infeasible;
    // Reservations reclaimed by preemption during the pass, already released.
    std::vector<Reservation> preempted;
    std::optional<QueueEntry> blockedHead;
    AdmitDecision blockedBy = AdmitDecision::Wait;
};

// One ordered queue per pool. Passes over different pools run concurrently;
// passes over the same pool are serialized.
class AdmissionScheduler {
public:
    explicit AdmissionScheduler(QuotaLedger& ledger) noexcept : ledger_(ledger) {}

    AdmissionScheduler(const AdmissionScheduler&) = delete;
    AdmissionScheduler& operator=(const AdmissionScheduler&) = delete;

    void enqueue(QueueEntry entry);
    bool remove(const std::string& pool, const std::string& groupKey);

    [[nodiscard]] bool contains(const std::string& pool, const std::string& groupKey) const;
    [[nodiscard]] std::size_t queued(const std::string& pool) const;
    [[nodiscard]] std::vector<QueueEntry> pending(const std::string& pool) const;
    [[nodiscard]] std::vector<std::string> pools() const;

    // Admits from the head until the head is blocked. A blocked head stops
    // the pass, nothing behind it is considered.
    AdmissionPass tryAdmit(const std::string& pool);

private:
    struct PoolQueue {
        std::mutex admitMutex;
        mutable std::mutex mutex;
        std::set<QueueEntry, QueueOrder> entries;
        std::unordered_map<std::string, QueueEntry> index;
    };

    PoolQueue& queueFor(const std::string& pool);
    const PoolQueue* findQueue(const std::string& pool) const;

    QuotaLedger& ledger_;
    mutable std::mutex queuesMutex_;
    std::map<std::string, std::unique_ptr<PoolQueue>> queues_;
};

}
