/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/config.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace dagpool {

namespace {

int env_int(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}

Seconds durationAt(const YAML::Node& node, const char* key, Seconds defv) {
    const auto value = node[key];
    if (!value) return defv;
    try {
        return parseDuration(value.as<std::string>());
    } catch (const ValidationError& e) {
        throw ConfigError(std::string(key) + ": " + e.what());
    }
}

double quantityAt(const YAML::Node& node, const char* key, double defv) {
    const auto value = node[key];
    if (!value) return defv;
    try {
        return parseQuantityGi(value.as<std::string>());
    } catch (const ValidationError& e) {
        throw ConfigError(std::string(key) + ": " + e.what());
    }
}

// Missing dimensions stay unlimited.
Resources parseShape(const YAML::Node& node) {
    Resources shape = Resources::unlimited();
    if (!node) return shape;
    if (node["cpu"]) shape.cpu = node["cpu"].as<double>();
    if (node["gpu"]) shape.gpu = node["gpu"].as<double>();
    shape.memory = quantityAt(node, "memory", shape.memory);
    shape.storage = quantityAt(node, "storage", shape.storage);
    return shape;
}

// Only cpu and gpu are quota dimensions. A negative value means unlimited.
Resources parseQuota(const YAML::Node& node) {
    Resources quota = Resources::unlimited();
    if (node["cpu"] && node["cpu"].as<double>() >= 0) quota.cpu = node["cpu"].as<double>();
    if (node["gpu"] && node["gpu"].as<double>() >= 0) quota.gpu = node["gpu"].as<double>();
    return quota;
}

ExitActions parseExitActions(const YAML::Node& node, const std::string& context) {
    ExitActions actions;
    if (!node) return actions;
    if (!node.IsMap()) {
        throw ConfigError(context + ": exit actions must be a map");
    }
    for (const auto& entry : node) {
        const auto name = entry.first.as<std::string>();
        const auto action = parseExitAction(name);
        if (!action) {
            throw ConfigError(context + ": unknown exit action '" + name + "'");
        }
        try {
            actions.add(*action, entry.second.as<std::string>());
        } catch (const ValidationError& e) {
            throw ConfigError(context + ": " + e.what());
        }
    }
    return actions;
}

PoolStatus parsePoolStatus(const std::string& text, const std::string& pool) {
    std::string value(text);
    for (char& c : value) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (value == "ONLINE") return PoolStatus::Online;
    if (value == "OFFLINE") return PoolStatus::Offline;
    if (value == "MAINTENANCE") return PoolStatus::Maintenance;
    throw ConfigError("pool '" + pool + "': unknown status '" + text + "'");
}

PoolConfig parsePool(const YAML::Node& node) {
    PoolConfig pool;
    pool.name = node["name"].as<std::string>("");
    if (pool.name.empty()) {
        throw ConfigError("pools: every pool needs a name");
    }
    pool.backend = node["backend"].as<std::string>("default");
    if (node["status"]) {
        pool.status = parsePoolStatus(node["status"].as<std::string>(), pool.name);
    }
    pool.defaultPlatform = node["default_platform"].as<std::string>("");
    pool.defaultQueueTimeout = durationAt(node, "default_queue_timeout", Seconds{0});
    pool.defaultExecTimeout = durationAt(node, "default_exec_timeout", Seconds{0});
    pool.defaultExitActions = parseExitActions(node["default_exit_actions"], "pool '" + pool.name + "'");

    // A declared quota block zeroes the classes it leaves out.
    if (const auto quota = node["quota"]) {
        const std::array<const char*, kPriorityClasses> keys = {"low", "normal", "high"};
        for (std::size_t i = 0; i < keys.size(); ++i) {
            pool.quota[i] = quota[keys[i]] ? parseQuota(quota[keys[i]]) : Resources{};
            pool.quota[i].memory = pool.quota[i].storage = Resources::unlimited().memory;
        }
    }

    if (const auto platforms = node["platforms"]) {
        for (const auto& item : platforms) {
            Platform platform;
            platform.name = item["name"].as<std::string>("");
            if (platform.name.empty()) {
                throw ConfigError("pool '" + pool.name + "': platform without a name");
            }
            platform.description = item["description"].as<std::string>("");
            platform.allocatable = parseShape(item["resources"]);
            platform.privilegedAllowed = item["privileged_allowed"].as<bool>(false);
            platform.hostNetworkAllowed = item["host_network_allowed"].as<bool>(false);
            if (!pool.platforms.emplace(platform.name, platform).second) {
                throw ConfigError("pool '" + pool.name + "': duplicate platform '" + platform.name + "'");
            }
        }
    }

    if (!pool.defaultPlatform.empty() && pool.platforms.count(pool.defaultPlatform) == 0) {
        throw ConfigError("pool '" + pool.name + "': default platform '" + pool.defaultPlatform +
                          "' is not defined");
    }
    return pool;
}

void parseScheduler(const YAML::Node& node, SchedulerSettings& settings) {
    if (!node) return;
    settings.maxRetryPerTask = node["max_retry_per_task"].as<int>(settings.maxRetryPerTask);
    settings.barrierTimeout = durationAt(node, "barrier_timeout", settings.barrierTimeout);
    settings.defaultQueueTimeout = durationAt(node, "default_queue_timeout", settings.defaultQueueTimeout);
    settings.defaultExecTimeout = durationAt(node, "default_exec_timeout", settings.defaultExecTimeout);
    settings.backoffBase = durationAt(node, "backoff_base", settings.backoffBase);
    settings.backoffMax = durationAt(node, "backoff_max", settings.backoffMax);
    settings.retention = durationAt(node, "retention", settings.retention);
    settings.historyLimit = node["history_limit"].as<std::size_t>(settings.historyLimit);
    settings.admissionWorkers = node["admission_workers"].as<int>(settings.admissionWorkers);
    settings.scanInterval = durationAt(node, "scan_interval", settings.scanInterval);
    settings.logLevel = node["log_level"].as<std::string>(settings.logLevel);

    if (settings.maxRetryPerTask < 0) {
        throw ConfigError("scheduler.max_retry_per_task must not be negative");
    }
    if (settings.admissionWorkers < 1) {
        throw ConfigError("scheduler.admission_workers must be at least 1");
    }
    if (!settings.logLevel.empty() && !Logger::parseLevel(settings.logLevel)) {
        throw ConfigError("scheduler.log_level: unknown level '" + settings.logLevel + "'");
    }
}

void validate(Config& config) {
    std::set<std::string> poolNames;
    for (const auto& pool : config.pools) {
        if (!poolNames.insert(pool.name).second) {
            throw ConfigError("duplicate pool '" + pool.name + "'");
        }
    }

    std::set<std::string> backendNames;
    for (const auto& backend : config.backends) {
        if (backend.name.empty()) {
            throw ConfigError("backends: every backend needs a name");
        }
        if (!backendNames.insert(backend.name).second) {
            throw ConfigError("duplicate backend '" + backend.name + "'");
        }
    }

    // Backends referenced only by pools get a derived capacity.
    for (const auto& pool : config.pools) {
        if (backendNames.insert(pool.backend).second) {
            config.backends.push_back(BackendConfig{pool.backend, std::nullopt});
        }
    }
}

Config fromNode(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a map");
    }

    parseScheduler(root["scheduler"], config.scheduler);

    if (const auto backends = root["backends"]) {
        for (const auto& item : backends) {
            BackendConfig backend;
            backend.name = item["name"].as<std::string>("");
            if (item["capacity"]) {
                backend.capacity = parseQuota(item["capacity"]);
                backend.capacity->memory = backend.capacity->storage = Resources::unlimited().memory;
            }
            config.backends.push_back(backend);
        }
    }

    if (const auto pools = root["pools"]) {
        for (const auto& item : pools) {
            config.pools.push_back(parsePool(item));
        }
    }

    validate(config);
    return config;
}

}

const char* toString(PoolStatus status) noexcept {
    switch (status) {
        case PoolStatus::Online:      return "ONLINE";
        case PoolStatus::Offline:     return "OFFLINE";
        case PoolStatus::Maintenance: return "MAINTENANCE";
        default: return "UNKNOWN";
    }
}

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    LOG_DEBUG("Loading configuration from " + path.string());
    return parse(buffer.str());
}

Config Config::parse(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }
}

void Config::applyEnv() {
    scheduler.maxRetryPerTask = env_int("DAGPOOL_MAX_RETRY", scheduler.maxRetryPerTask);
    scheduler.barrierTimeout = Seconds(env_int("DAGPOOL_BARRIER_TIMEOUT",
                                               static_cast<int>(scheduler.barrierTimeout.count())));
    scheduler.scanInterval = Seconds(env_int("DAGPOOL_SCAN_INTERVAL",
                                             static_cast<int>(scheduler.scanInterval.count())));
}

const PoolConfig* Config::findPool(const std::string& name) const noexcept {
    for (const auto& pool : pools) {
        if (pool.name == name) return &pool;
    }
    return nullptr;
}

const BackendConfig* Config::findBackend(const std::string& name) const noexcept {
    for (const auto& backend : backends) {
        if (backend.name == name) return &backend;
    }
    return nullptr;
}

}
