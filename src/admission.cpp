/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/admission.hpp"
#include "dagpool/logger.hpp"

namespace dagpool {

namespace {

std::string platformMismatch(const Platform& platform, const TaskSpec& task) {
    if (!task.resources.fitsWithin(platform.allocatable)) {
        return "Task '" + task.name + "' requests " + task.resources.toString() +
               ", platform '" + platform.name + "' allocates " + platform.allocatable.toString();
    }
    if (task.privileged && !platform.privilegedAllowed) {
        return "Task '" + task.name + "' requests privileged mode, not allowed on platform '" +
               platform.name + "'";
    }
    if (task.hostNetwork && !platform.hostNetworkAllowed) {
        return "Task '" + task.name + "' requests host network, not allowed on platform '" +
               platform.name + "'";
    }
    return {};
}

std::string taskInfeasibility(const PoolConfig& pool, const TaskSpec& task) {
    const std::string& wanted = task.platform.empty() ? pool.defaultPlatform : task.platform;

    if (!wanted.empty()) {
        const auto it = pool.platforms.find(wanted);
        if (it == pool.platforms.end()) {
            return "Platform '" + wanted + "' is not available in pool '" + pool.name + "'";
        }
        return platformMismatch(it->second, task);
    }

    // No shapes configured: nodes are not constrained by the pool.
    if (pool.platforms.empty()) {
        return {};
    }

    std::string last;
    for (const auto& [name, platform] : pool.platforms) {
        (void)name;
        last = platformMismatch(platform, task);
        if (last.empty()) return {};
    }
    return "No platform in pool '" + pool.name + "' fits task '" + task.name + "': " + last;
}

}

Resources QueueEntry::demand() const {
    return group ? group->demand() : Resources{};
}

bool QueueOrder::operator()(const QueueEntry& a, const QueueEntry& b) const noexcept {
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.submitTime != b.submitTime) return a.submitTime < b.submitTime;
    if (a.sequence != b.sequence) return a.sequence < b.sequence;
    return a.groupKey < b.groupKey;
}

std::string infeasibilityReason(const PoolConfig& pool, const GroupSpec& group) {
    for (const auto& task : group.tasks) {
        auto reason = taskInfeasibility(pool, task);
        if (!reason.empty()) return reason;
    }
    return {};
}

AdmissionScheduler::PoolQueue& AdmissionScheduler::queueFor(const std::string& pool) {
    std::lock_guard<std::mutex> lock(queuesMutex_);
    auto& queue = queues_[pool];
    if (!queue) {
        queue = std::make_unique<PoolQueue>();
    }
    return *queue;
}

const AdmissionScheduler::PoolQueue* AdmissionScheduler::findQueue(const std::string& pool) const {
    std::lock_guard<std::mutex> lock(queuesMutex_);
    const auto it = queues_.find(pool);
    return it == queues_.end() ? nullptr : it->second.get();
}

void AdmissionScheduler::enqueue(QueueEntry entry) {
    auto& queue = queueFor(entry.pool);
    std::lock_guard<std::mutex> lock(queue.mutex);
    if (queue.index.count(entry.groupKey)) {
        LOG_DEBUG("Group already queued: " + entry.groupKey);
        return;
    }
    LOG_DEBUG("Queued " + entry.groupKey + " in pool " + entry.pool + " (" + toString(entry.priority) +
              ", seq " + std::to_string(entry.sequence) + ")");
    queue.index.emplace(entry.groupKey, entry);
    queue.entries.insert(std::move(entry));
}

bool AdmissionScheduler::remove(const std::string& pool, const std::string& groupKey) {
    auto& queue = queueFor(pool);
    std::lock_guard<std::mutex> lock(queue.mutex);
    const auto it = queue.index.find(groupKey);
    if (it == queue.index.end()) {
        return false;
    }
    queue.entries.erase(it->second);
    queue.index.erase(it);
    return true;
}

bool AdmissionScheduler::contains(const std::string& pool, const std::string& groupKey) const {
    const auto* queue = findQueue(pool);
    if (!queue) return false;
    std::lock_guard<std::mutex> lock(queue->mutex);
    return queue->index.count(groupKey) > 0;
}

std::size_t AdmissionScheduler::queued(const std::string& pool) const {
    const auto* queue = findQueue(pool);
    if (!queue) return 0;
    std::lock_guard<std::mutex> lock(queue->mutex);
    return queue->entries.size();
}

std::vector<QueueEntry> AdmissionScheduler::pending(const std::string& pool) const {
    const auto* queue = findQueue(pool);
    if (!queue) return {};
    std::lock_guard<std::mutex> lock(queue->mutex);
    return {queue->entries.begin(), queue->entries.end()};
}

std::vector<std::string> AdmissionScheduler::pools() const {
    std::lock_guard<std::mutex> lock(queuesMutex_);
    std::vector<std::string> names;
    for (const auto& [name, queue] : queues_) {
        (void)queue;
        names.push_back(name);
    }
    return names;
}

AdmissionPass AdmissionScheduler::tryAdmit(const std::string& pool) {
    auto& queue = queueFor(pool);
    std::lock_guard<std::mutex> admit(queue.admitMutex);

    AdmissionPass pass;
    pass.pool = pool;
    const auto config = ledger_.poolConfig(pool);

    while (true) {
        std::optional<QueueEntry> head;
        {
            std::lock_guard<std::mutex> lock(queue.mutex);
            if (queue.entries.empty()) break;
            head = *queue.entries.begin();
        }

        if (!config) {
            pass.blockedHead = head;
            pass.blockedBy = AdmitDecision::Unavailable;
            break;
        }

        std::string reason = head->group ? infeasibilityReason(*config, *head->group) : "Group has no definition";
        if (reason.empty() && !ledger_.canEverAdmit(pool, head->priority, head->demand())) {
            reason = "Group demand " + head->demand().toString() + " exceeds what pool '" + pool +
                     "' can ever grant at " + toString(head->priority) + " priority";
        }
        if (!reason.empty()) {
            remove(pool, head->groupKey);
            LOG_WARN("Group " + head->groupKey + " can never be placed: " + reason);
            pass.infeasible.emplace_back(std::move(*head), std::move(reason));
            continue;
        }

        auto result = ledger_.reserve(head->groupKey, pool, head->priority, head->demand());
        if (!result.admitted()) {
            LOG_TRACE("Head of pool " + pool + " blocked: " + head->groupKey + " (" +
                      toString(result.decision) + ")");
            pass.blockedHead = head;
            pass.blockedBy = result.decision;
            break;
        }

        for (auto& victim : result.preempted) {
            pass.preempted.push_back(std::move(victim));
        }
        if (!remove(pool, head->groupKey)) {
            // Canceled while the ledger decided.
            ledger_.release(head->groupKey);
            continue;
        }

        LOG_INFO("Admitted " + head->groupKey + " in pool " + pool + " (" + toString(result.decision) +
                 ", " + head->demand().toString() + ")");
        pass.admitted.push_back({std::move(*head), result.decision});
    }
    return pass;
}

}
