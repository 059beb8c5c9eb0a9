/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "dagpool/exit_actions.hpp"
#include "dagpool/types.hpp"

namespace dagpool {

enum class PoolStatus : std::uint8_t { Online, Offline, Maintenance };

[[nodiscard]] const char* toString(PoolStatus status) noexcept;

// A named node shape a pool can place tasks on.
struct Platform {
    std::string name;
    std::string description;
    Resources allocatable = Resources::unlimited();
    bool privilegedAllowed = false;
    bool hostNetworkAllowed = false;
};

struct PoolConfig {
    std::string name;
    std::string backend;
    PoolStatus status = PoolStatus::Online;
    std::string defaultPlatform;
    std::map<std::string, Platform> platforms;
    // Indexed by Priority. Only cpu and gpu are enforced.
    std::array<Resources, kPriorityClasses> quota{
        Resources::unlimited(), Resources::unlimited(), Resources::unlimited()};
    Seconds defaultQueueTimeout{0};
    Seconds defaultExecTimeout{0};
    ExitActions defaultExitActions;

    [[nodiscard]] const Resources& quotaFor(Priority priority) const noexcept {
        return quota[static_cast<std::size_t>(priority)];
    }
    [[nodiscard]] bool online() const noexcept { return status == PoolStatus::Online; }
};

struct BackendConfig {
    std::string name;
    // Empty means the sum of the quotas of the pools bound to this backend.
    std::optional<Resources> capacity;
};

struct SchedulerSettings {
    int maxRetryPerTask = 3;
    Seconds barrierTimeout{300};
    // Zero disables the deadline.
    Seconds defaultQueueTimeout{0};
    Seconds defaultExecTimeout{0};
    Seconds backoffBase{10};
    Seconds backoffMax{600};
    Seconds retention{86400};
    std::size_t historyLimit = 1000;
    int admissionWorkers = 2;
    Seconds scanInterval{1};
    std::string logLevel;
};

struct Config {
    SchedulerSettings scheduler;
    std::vector<BackendConfig> backends;
    std::vector<PoolConfig> pools;

    // Both throw ConfigError with the offending key in the message.
    [[nodiscard]] static Config load(const std::filesystem::path& path);
    [[nodiscard]] static Config parse(const std::string& yaml);

    // DAGPOOL_MAX_RETRY, DAGPOOL_BARRIER_TIMEOUT, DAGPOOL_SCAN_INTERVAL
    void applyEnv();

    [[nodiscard]] const PoolConfig* findPool(const std::string& name) const noexcept;
    [[nodiscard]] const BackendConfig* findBackend(const std::string& name) const noexcept;
};

}
