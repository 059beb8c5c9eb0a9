/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "dagpool/config.hpp"
#include "dagpool/types.hpp"

namespace dagpool {

class Scanner;
class Scheduler;
class SimExecutor;
class StatusStore;
class WorkerPool;
struct Definition;

// Hosts the scheduler over a workspace: picks up definitions and cancel
// requests from the inbox, runs admission on worker threads, drives the
// simulated backend and publishes status snapshots.
class Server final {
public:
    // workers <= 0 takes scheduler.admission_workers from the configuration.
    Server(Config config, const std::filesystem::path& workspace, int workers = 0);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    // Replaces pool and backend definitions; workflows keep running.
    [[nodiscard]] bool reloadPools(const Config& config) noexcept;
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    [[nodiscard]] bool createWorkspace() noexcept;
    [[nodiscard]] bool recoverAccepted() noexcept;
    void scanLoop();
    void ingest(const Definition& definition);
    void processCancels();
    void publishStatus() noexcept;
    void rejectDefinition(const WorkflowId& id, const std::filesystem::path& from, const std::string& error) noexcept;

    Config config_;
    std::filesystem::path workspace_;
    int workers_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<Scanner> scanner_;
    std::unique_ptr<StatusStore> status_;
    std::unique_ptr<SimExecutor> executor_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<WorkerPool> pool_;

    // Workflows whose snapshot may still change.
    std::mutex trackedMutex_;
    std::set<WorkflowId> tracked_;

    std::thread scannerThread_;
};

}
