/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "dagpool/config.hpp"
#include "dagpool/types.hpp"

namespace dagpool {

enum class AdmitDecision : std::uint8_t {
    Admit,       // fits the pool's own quota and physical capacity
    Borrow,      // LOW only, draws on idle quota of sibling pools
    Preempt,     // fits quota, physical capacity frees up by reclaiming borrowers
    Wait,        // stay queued
    Unavailable  // pool offline, in maintenance or unknown
};

[[nodiscard]] const char* toString(AdmitDecision decision) noexcept;

// Capacity held by one admitted group.
struct Reservation {
    std::string holder;
    std::string pool;
    Priority priority = Priority::Normal;
    Resources own;
    // Lender pool -> amount. Only LOW reservations borrow.
    std::map<std::string, Resources> borrowed;
    std::uint64_t sequence = 0;

    [[nodiscard]] Resources total() const noexcept;
    [[nodiscard]] bool borrows() const noexcept { return !borrowed.empty(); }
};

struct ReserveResult {
    AdmitDecision decision = AdmitDecision::Wait;
    // Reservations reclaimed to make room, already released.
    std::vector<Reservation> preempted;

    [[nodiscard]] bool admitted() const noexcept {
        return decision == AdmitDecision::Admit || decision == AdmitDecision::Borrow ||
               decision == AdmitDecision::Preempt;
    }
};

// Per-pool accounting of quota use, borrowed edges and physical backend
// capacity. Pools sharing a backend share physical capacity, so every
// operation locks all pools of the affected backend in name order; pools on
// different backends never contend.
class QuotaLedger {
public:
    QuotaLedger(const std::vector<PoolConfig>& pools, const std::vector<BackendConfig>& backends);

    QuotaLedger(const QuotaLedger&) = delete;
    QuotaLedger& operator=(const QuotaLedger&) = delete;

    // Replaces pool and backend definitions. Existing reservations are kept;
    // a pool dropped from the configuration turns offline until drained.
    void configure(const std::vector<PoolConfig>& pools, const std::vector<BackendConfig>& backends);

    [[nodiscard]] AdmitDecision canAdmit(const std::string& pool, Priority priority,
                                         const Resources& demand) const;

    // Plans, reclaims victims and commits in one critical section.
    [[nodiscard]] ReserveResult reserve(const std::string& holder, const std::string& pool,
                                        Priority priority, const Resources& demand);

    std::optional<Reservation> release(const std::string& holder);

    // False when no state of the ledger could ever admit the demand.
    [[nodiscard]] bool canEverAdmit(const std::string& pool, Priority priority,
                                    const Resources& demand) const;

    [[nodiscard]] std::optional<Reservation> reservation(const std::string& holder) const;
    [[nodiscard]] std::optional<PoolConfig> poolConfig(const std::string& pool) const;
    [[nodiscard]] std::vector<std::string> poolNames() const;

    // Own-quota use of one priority class.
    [[nodiscard]] Resources usage(const std::string& pool, Priority priority) const;
    [[nodiscard]] Resources borrowedIn(const std::string& pool) const;
    [[nodiscard]] Resources lentOut(const std::string& pool) const;
    [[nodiscard]] Resources backendUsage(const std::string& backend) const;
    [[nodiscard]] Resources capacity(const std::string& backend) const;

private:
    struct PoolState {
        PoolConfig config;
        std::array<Resources, kPriorityClasses> inUse{};
        Resources borrowedIn;
        Resources lentOut;
        std::map<std::string, Reservation> reservations;
        mutable std::mutex mutex;
    };

    struct BackendState {
        std::string name;
        Resources capacity;
        std::vector<std::string> pools;  // sorted
    };

    struct Plan {
        AdmitDecision decision = AdmitDecision::Wait;
        std::map<std::string, Resources> borrowed;
        std::vector<std::string> victims;
    };

    using Locks = std::vector<std::unique_lock<std::mutex>>;

    Locks lockBackend(const BackendState& backend) const;
    const PoolState* findPool(const std::string& pool) const noexcept;
    PoolState* findPool(const std::string& pool) noexcept;
    const BackendState& backendOf(const PoolState& pool) const;

    // Callers hold the backend's locks.
    Plan plan(const PoolState& pool, const BackendState& backend, Priority priority,
              const Resources& demand) const;
    Resources physicalUse(const BackendState& backend) const;
    Resources idleQuota(const PoolState& pool) const;
    std::vector<std::string> pickVictims(const std::string& blockedPool, const BackendState& backend,
                                         const Resources& shortfall) const;
    void commit(PoolState& pool, Reservation reservation);
    Reservation erase(PoolState& pool, const std::string& holder);

    void rebuildBackends(const std::vector<BackendConfig>& backends);

    mutable std::shared_mutex configMutex_;
    std::map<std::string, std::unique_ptr<PoolState>> pools_;
    std::map<std::string, BackendState> backends_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::string> holders_;

    std::atomic<std::uint64_t> sequence_{0};
};

}
