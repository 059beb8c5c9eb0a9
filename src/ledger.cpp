/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/ledger.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include <algorithm>
#include <tuple>

namespace dagpool {

namespace {

// Quotas and capacity only constrain cpu and gpu.
Resources quotaDims(const Resources& resources) {
    return {resources.cpu, resources.gpu, 0, 0};
}

Resources sumQuota(const PoolConfig& pool) {
    Resources total;
    for (const auto& quota : pool.quota) {
        total += quotaDims(quota);
    }
    return total;
}

std::size_t index(Priority priority) {
    return static_cast<std::size_t>(priority);
}

}

const char* toString(AdmitDecision decision) noexcept {
    switch (decision) {
        case AdmitDecision::Admit:       return "ADMIT";
        case AdmitDecision::Borrow:      return "BORROW";
        case AdmitDecision::Preempt:     return "PREEMPT";
        case AdmitDecision::Wait:        return "WAIT";
        case AdmitDecision::Unavailable: return "UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

Resources Reservation::total() const noexcept {
    Resources sum = own;
    for (const auto& [lender, amount] : borrowed) {
        (void)lender;
        sum += amount;
    }
    return sum;
}

QuotaLedger::QuotaLedger(const std::vector<PoolConfig>& pools, const std::vector<BackendConfig>& backends) {
    configure(pools, backends);
}

void QuotaLedger::configure(const std::vector<PoolConfig>& pools, const std::vector<BackendConfig>& backends) {
    std::unique_lock<std::shared_mutex> config(configMutex_);

    for (auto& [name, state] : pools_) {
        const bool kept = std::any_of(pools.begin(), pools.end(),
                                      [&](const PoolConfig& pool) { return pool.name == name; });
        if (!kept) {
            LOG_WARN("Pool '" + name + "' removed from configuration, offline until drained");
            state->config.status = PoolStatus::Offline;
        }
    }

    for (const auto& pool : pools) {
        auto& state = pools_[pool.name];
        if (!state) {
            state = std::make_unique<PoolState>();
        }
        state->config = pool;
    }

    rebuildBackends(backends);
    LOG_INFO("Ledger configured with " + std::to_string(pools_.size()) + " pools on " +
             std::to_string(backends_.size()) + " backends");
}

void QuotaLedger::rebuildBackends(const std::vector<BackendConfig>& backends) {
    backends_.clear();
    for (const auto& [name, state] : pools_) {
        auto& backend = backends_[state->config.backend];
        backend.name = state->config.backend;
        backend.pools.push_back(name);
    }

    for (auto& [name, backend] : backends_) {
        const auto configured = std::find_if(backends.begin(), backends.end(),
                                             [&](const BackendConfig& b) { return b.name == name; });
        if (configured != backends.end() && configured->capacity) {
            backend.capacity = quotaDims(*configured->capacity);
        } else {
            backend.capacity = Resources{};
            for (const auto& pool : backend.pools) {
                backend.capacity += sumQuota(pools_.at(pool)->config);
            }
        }
        // Memory and storage are placement concerns, not capacity.
        backend.capacity.memory = backend.capacity.storage = Resources::unlimited().memory;
        std::sort(backend.pools.begin(), backend.pools.end());
        LOG_DEBUG("Backend '" + name + "' capacity " + backend.capacity.toString());
    }
}

QuotaLedger::Locks QuotaLedger::lockBackend(const BackendState& backend) const {
    Locks locks;
    locks.reserve(backend.pools.size());
    for (const auto& name : backend.pools) {
        locks.emplace_back(pools_.at(name)->mutex);
    }
    return locks;
}

const QuotaLedger::PoolState* QuotaLedger::findPool(const std::string& pool) const noexcept {
    const auto it = pools_.find(pool);
    return it == pools_.end() ? nullptr : it->second.get();
}

QuotaLedger::PoolState* QuotaLedger::findPool(const std::string& pool) noexcept {
    const auto it = pools_.find(pool);
    return it == pools_.end() ? nullptr : it->second.get();
}

const QuotaLedger::BackendState& QuotaLedger::backendOf(const PoolState& pool) const {
    return backends_.at(pool.config.backend);
}

Resources QuotaLedger::physicalUse(const BackendState& backend) const {
    Resources used;
    for (const auto& name : backend.pools) {
        const auto& pool = *pools_.at(name);
        for (const auto& inUse : pool.inUse) used += inUse;
        used += pool.borrowedIn;
    }
    return quotaDims(used);
}

Resources QuotaLedger::idleQuota(const PoolState& pool) const {
    Resources idle = sumQuota(pool.config);
    for (const auto& inUse : pool.inUse) idle -= quotaDims(inUse);
    idle -= quotaDims(pool.lentOut);
    return idle.clampedAtZero();
}

QuotaLedger::Plan QuotaLedger::plan(const PoolState& pool, const BackendState& backend,
                                    Priority priority, const Resources& demand) const {
    Plan result;
    if (!pool.config.online()) {
        result.decision = AdmitDecision::Unavailable;
        return result;
    }

    const Resources want = quotaDims(demand);
    const Resources quota = quotaDims(pool.config.quotaFor(priority));
    const Resources used = quotaDims(pool.inUse[index(priority)]);
    const Resources free = backend.capacity - physicalUse(backend);

    if (priority != Priority::Low) {
        if (!(used + want).fitsWithin(quota)) {
            result.decision = AdmitDecision::Wait;
            return result;
        }
        if (want.fitsWithin(free)) {
            result.decision = AdmitDecision::Admit;
            return result;
        }
        result.victims = pickVictims(pool.config.name, backend, (want - free).clampedAtZero());
        result.decision = result.victims.empty() ? AdmitDecision::Wait : AdmitDecision::Preempt;
        return result;
    }

    // LOW: own quota first, then idle quota of sibling pools. Never this
    // pool's own NORMAL or HIGH ceiling.
    const Resources own = want.min((quota - used).clampedAtZero());
    Resources need = (want - own).clampedAtZero();

    if (need.anyPositive()) {
        std::vector<std::pair<Resources, std::string>> lenders;
        for (const auto& name : backend.pools) {
            const auto& lender = *pools_.at(name);
            if (name == pool.config.name || !lender.config.online()) continue;
            const Resources idle = idleQuota(lender);
            if (idle.anyPositive()) lenders.emplace_back(idle, name);
        }
        std::sort(lenders.begin(), lenders.end(), [](const auto& a, const auto& b) {
            return std::make_tuple(-a.first.gpu, -a.first.cpu, a.second) <
                   std::make_tuple(-b.first.gpu, -b.first.cpu, b.second);
        });

        for (const auto& [idle, name] : lenders) {
            if (!need.anyPositive()) break;
            const Resources take = need.min(idle);
            if (!take.anyPositive()) continue;
            result.borrowed[name] = take;
            need = (need - take).clampedAtZero();
        }
        if (need.anyPositive()) {
            result.borrowed.clear();
            result.decision = AdmitDecision::Wait;
            return result;
        }
    }

    if (!want.fitsWithin(free)) {
        result.borrowed.clear();
        result.decision = AdmitDecision::Wait;
        return result;
    }
    result.decision = result.borrowed.empty() ? AdmitDecision::Admit : AdmitDecision::Borrow;
    return result;
}

std::vector<std::string> QuotaLedger::pickVictims(const std::string& blockedPool, const BackendState& backend,
                                                  const Resources& shortfall) const {
    struct Candidate {
        const Reservation* reservation;
        bool drawsOnBlocked;
        Resources overage;
    };

    std::vector<Candidate> candidates;
    for (const auto& name : backend.pools) {
        const auto& pool = *pools_.at(name);
        const Resources overage = quotaDims(pool.inUse[index(Priority::Low)] + pool.borrowedIn) -
                                  quotaDims(pool.config.quotaFor(Priority::Low));
        for (const auto& [holder, reservation] : pool.reservations) {
            (void)holder;
            if (reservation.priority != Priority::Low || !reservation.borrows()) continue;
            candidates.push_back({&reservation, reservation.borrowed.count(blockedPool) > 0, overage});
        }
    }

    // Borrowers from the blocked pool first, then the pools furthest over
    // their own LOW quota, then the most recently admitted.
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return std::make_tuple(!a.drawsOnBlocked, -a.overage.gpu, -a.overage.cpu, ~a.reservation->sequence) <
               std::make_tuple(!b.drawsOnBlocked, -b.overage.gpu, -b.overage.cpu, ~b.reservation->sequence);
    });

    std::vector<std::string> victims;
    Resources freed;
    for (const auto& candidate : candidates) {
        if (shortfall.fitsWithin(freed)) break;
        victims.push_back(candidate.reservation->holder);
        freed += quotaDims(candidate.reservation->total());
    }
    if (!shortfall.fitsWithin(freed)) {
        return {};
    }
    return victims;
}

void QuotaLedger::commit(PoolState& pool, Reservation reservation) {
    pool.inUse[index(reservation.priority)] += reservation.own;
    for (const auto& [lender, amount] : reservation.borrowed) {
        if (auto* state = findPool(lender)) {
            state->lentOut += amount;
        }
        pool.borrowedIn += amount;
    }
    {
        std::lock_guard<std::mutex> lock(indexMutex_);
        holders_[reservation.holder] = pool.config.name;
    }
    const auto holder = reservation.holder;
    pool.reservations.emplace(holder, std::move(reservation));
}

Reservation QuotaLedger::erase(PoolState& pool, const std::string& holder) {
    auto node = pool.reservations.extract(holder);
    Reservation reservation = std::move(node.mapped());
    pool.inUse[index(reservation.priority)] -= reservation.own;
    for (const auto& [lender, amount] : reservation.borrowed) {
        if (auto* state = findPool(lender)) {
            state->lentOut -= amount;
        }
        pool.borrowedIn -= amount;
    }
    {
        std::lock_guard<std::mutex> lock(indexMutex_);
        holders_.erase(holder);
    }
    return reservation;
}

AdmitDecision QuotaLedger::canAdmit(const std::string& pool, Priority priority, const Resources& demand) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto* state = findPool(pool);
    if (!state) {
        return AdmitDecision::Unavailable;
    }
    const auto& backend = backendOf(*state);
    auto locks = lockBackend(backend);
    return plan(*state, backend, priority, demand).decision;
}

ReserveResult QuotaLedger::reserve(const std::string& holder, const std::string& pool,
                                   Priority priority, const Resources& demand) {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    ReserveResult result;

    auto* state = findPool(pool);
    if (!state) {
        LOG_WARN("Reserve for " + holder + " on unknown pool '" + pool + "'");
        result.decision = AdmitDecision::Unavailable;
        return result;
    }
    const auto& backend = backendOf(*state);
    auto locks = lockBackend(backend);

    if (state->reservations.count(holder)) {
        LOG_WARN("Reservation for " + holder + " already held");
        result.decision = AdmitDecision::Admit;
        return result;
    }

    auto planned = plan(*state, backend, priority, demand);
    result.decision = planned.decision;
    if (!result.admitted()) {
        return result;
    }

    for (const auto& victim : planned.victims) {
        std::string victimPool;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            victimPool = holders_.at(victim);
        }
        result.preempted.push_back(erase(*findPool(victimPool), victim));
        LOG_INFO("Reclaimed " + result.preempted.back().total().toString() + " from " + victim +
                 " for " + holder);
    }

    Reservation reservation;
    reservation.holder = holder;
    reservation.pool = pool;
    reservation.priority = priority;
    reservation.borrowed = planned.borrowed;
    reservation.own = demand;
    for (const auto& [lender, amount] : planned.borrowed) {
        (void)lender;
        reservation.own -= amount;
    }
    reservation.sequence = ++sequence_;
    commit(*state, std::move(reservation));

    LOG_DEBUG("Reserved " + demand.toString() + " in pool " + pool + " for " + holder + " (" +
              toString(result.decision) + ")");
    return result;
}

std::optional<Reservation> QuotaLedger::release(const std::string& holder) {
    std::shared_lock<std::shared_mutex> config(configMutex_);

    std::string poolName;
    {
        std::lock_guard<std::mutex> lock(indexMutex_);
        const auto it = holders_.find(holder);
        if (it == holders_.end()) {
            return std::nullopt;
        }
        poolName = it->second;
    }

    auto* state = findPool(poolName);
    if (!state) {
        return std::nullopt;
    }
    auto locks = lockBackend(backendOf(*state));
    if (!state->reservations.count(holder)) {
        return std::nullopt;
    }
    auto released = erase(*state, holder);
    LOG_DEBUG("Released " + released.total().toString() + " in pool " + poolName + " from " + holder);
    return released;
}

bool QuotaLedger::canEverAdmit(const std::string& pool, Priority priority, const Resources& demand) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto* state = findPool(pool);
    if (!state) {
        return false;
    }
    const auto& backend = backendOf(*state);
    const Resources want = quotaDims(demand);

    Resources ceiling = quotaDims(state->config.quotaFor(priority));
    if (priority == Priority::Low) {
        for (const auto& name : backend.pools) {
            if (name != pool) ceiling += sumQuota(pools_.at(name)->config);
        }
    }
    return want.fitsWithin(ceiling) && want.fitsWithin(backend.capacity);
}

std::optional<Reservation> QuotaLedger::reservation(const std::string& holder) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    std::string poolName;
    {
        std::lock_guard<std::mutex> lock(indexMutex_);
        const auto it = holders_.find(holder);
        if (it == holders_.end()) return std::nullopt;
        poolName = it->second;
    }
    const auto* state = findPool(poolName);
    if (!state) return std::nullopt;
    std::lock_guard<std::mutex> lock(state->mutex);
    const auto it = state->reservations.find(holder);
    if (it == state->reservations.end()) return std::nullopt;
    return it->second;
}

std::optional<PoolConfig> QuotaLedger::poolConfig(const std::string& pool) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto* state = findPool(pool);
    if (!state) return std::nullopt;
    return state->config;
}

std::vector<std::string> QuotaLedger::poolNames() const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    std::vector<std::string> names;
    for (const auto& [name, state] : pools_) {
        (void)state;
        names.push_back(name);
    }
    return names;
}

Resources QuotaLedger::usage(const std::string& pool, Priority priority) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto* state = findPool(pool);
    if (!state) throw NotFoundError("Unknown pool '" + pool + "'");
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->inUse[index(priority)];
}

Resources QuotaLedger::borrowedIn(const std::string& pool) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto* state = findPool(pool);
    if (!state) throw NotFoundError("Unknown pool '" + pool + "'");
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->borrowedIn;
}

Resources QuotaLedger::lentOut(const std::string& pool) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto* state = findPool(pool);
    if (!state) throw NotFoundError("Unknown pool '" + pool + "'");
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->lentOut;
}

Resources QuotaLedger::backendUsage(const std::string& backend) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto it = backends_.find(backend);
    if (it == backends_.end()) throw NotFoundError("Unknown backend '" + backend + "'");
    auto locks = lockBackend(it->second);
    return physicalUse(it->second);
}

Resources QuotaLedger::capacity(const std::string& backend) const {
    std::shared_lock<std::shared_mutex> config(configMutex_);
    const auto it = backends_.find(backend);
    if (it == backends_.end()) throw NotFoundError("Unknown backend '" + backend + "'");
    return it->second.capacity;
}

}
