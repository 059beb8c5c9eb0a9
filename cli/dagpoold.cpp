/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/config.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include "dagpool/server.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace dagpool;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;
static volatile sig_atomic_t g_reload_requested = 0;

void signalHandler(int signal) {
    if (signal == SIGHUP) {
        g_reload_requested = 1;
        return;
    }
    g_shutdown_requested = 1;
}

void reloadConfig(Server& server, const std::filesystem::path& configPath) {
    try {
        Config config = Config::load(configPath);
        config.applyEnv();
        if (server.reloadPools(config)) {
            LOG_INFO("Reloaded " + configPath.string());
        }
    } catch (const ConfigError& e) {
        LOG_ERROR("Ignoring invalid configuration: " + std::string(e.what()));
    }
}

void printUsage(const char* progName) {
    std::cout << "dagpool Scheduler Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <config.yaml> <workspace> [-w <n>] [--log-level <level>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  config.yaml   Pool, backend and scheduler configuration\n";
    std::cout << "  workspace     Directory for definitions and status snapshots\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>     Admission worker threads (default: from config)\n";
    std::cout << "  --log-level <level>   ERROR, WARN, INFO, DEBUG or TRACE\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DAGPOOL_LOG_LEVEL        Log level (overrides the config file)\n";
    std::cout << "  DAGPOOL_MAX_RETRY        Retry ceiling per task\n";
    std::cout << "  DAGPOOL_BARRIER_TIMEOUT  Start barrier timeout in seconds\n";
    std::cout << "  DAGPOOL_SCAN_INTERVAL    Inbox scan interval in seconds\n";
    std::cout << "  DAGPOOL_SIM_INIT_MS      Simulated task start-up time\n";
    std::cout << "  DAGPOOL_SIM_SPEED        Simulated clock speed-up factor\n\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGHUP                   Reload pools and backends from config.yaml\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " pools.yaml ./workspace\n";
    std::cout << "  " << progName << " pools.yaml ./workspace -w 4 --log-level DEBUG\n";
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path configPath = argv[1];
    std::filesystem::path workspace = argv[2];
    int workers = 0;
    std::optional<LogLevel> cliLevel;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
            if (workers <= 0) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            cliLevel = Logger::parseLevel(argv[++i]);
            if (!cliLevel) {
                std::cerr << "Error: Unknown log level: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    setThreadName("Main");

    Config config;
    try {
        config = Config::load(configPath);
        config.applyEnv();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!config.scheduler.logLevel.empty()) {
        if (auto level = Logger::parseLevel(config.scheduler.logLevel)) {
            Logger::setLevel(*level);
        }
    }
    Logger::initFromEnv();
    if (cliLevel) {
        Logger::setLevel(*cliLevel);
    }

    std::filesystem::path pidPath = workspace / ".dagpoold.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid) && *pid != getpid()) {
        std::cerr << "Error: dagpoold already running on " << workspace.string()
                  << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    try {
        Server server(std::move(config), workspace, workers);

        if (!server.start()) {
            LOG_ERROR("Failed to start server on " + workspace.string());
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            } else {
                LOG_WARN("Cannot write pid file " + pidPath.string());
            }
        }

        LOG_INFO("dagpoold " + std::string(VERSION) + " running on " + workspace.string());

        while (!g_shutdown_requested && server.isRunning()) {
            if (g_reload_requested) {
                g_reload_requested = 0;
                reloadConfig(server, configPath);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping server...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("dagpool daemon stopped");
    return 0;
}
