/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/server.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include "dagpool/scanner.hpp"
#include "dagpool/scheduler.hpp"
#include "dagpool/sim_executor.hpp"
#include "dagpool/status_store.hpp"
#include "dagpool/worker_pool.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <thread>
#include <vector>

namespace dagpool {

namespace {

TimePoint toSystemTime(std::filesystem::file_time_type time) {
    return std::chrono::time_point_cast<Clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + Clock::now());
}

}

// Signal handling is done by the CLI (dagpoold.cpp), not by Server

Server::Server(Config config, const std::filesystem::path& workspace, int workers)
    : config_(std::move(config)),
      workspace_(workspace),
      workers_(workers > 0 ? workers : config_.scheduler.admissionWorkers) {
    LOG_DEBUG("Server created - workspace: " + workspace_.string() + ", pools: " +
              std::to_string(config_.pools.size()) + ", workers: " + std::to_string(workers_));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting dagpool server...");

    if (!createWorkspace()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("dagpool Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + workspace_.string());
    LOG_DEBUG("Admission workers: " + std::to_string(workers_));
    for (const auto& pool : config_.pools) {
        LOG_DEBUG("Pool " + pool.name + " on " + pool.backend + " (" + toString(pool.status) + ")");
    }
    LOG_DEBUG("========================================");

    try {
        scanner_ = std::make_unique<Scanner>(workspace_);
        status_ = std::make_unique<StatusStore>(workspace_);
        executor_ = std::make_unique<SimExecutor>();
        scheduler_ = std::make_unique<Scheduler>(config_, *executor_);
        pool_ = std::make_unique<WorkerPool>(workers_);

        if (!pool_->start([this](const std::string& pool, int workerId) {
                (void)workerId;
                scheduler_->admit(pool);
            })) {
            LOG_ERROR("Failed to start admission workers");
            return false;
        }
        scheduler_->setAdmissionTrigger([this](const std::string& pool) { pool_->submit(pool); });

        if (!executor_->start([this](const TaskEvent& event) { scheduler_->onTaskEvent(event); })) {
            LOG_ERROR("Failed to start backend");
            pool_->stop();
            return false;
        }

        if (!recoverAccepted()) {
            LOG_WARN("Some accepted workflows could not be recovered");
        }

        running_.store(true);
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        if (executor_) executor_->stop();
        if (pool_) pool_->stop();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    // No more events, then no more admission passes.
    if (executor_) {
        executor_->stop();
    }
    if (pool_) {
        pool_->stop();
    }
    publishStatus();

    scheduler_.reset();
    pool_.reset();
    executor_.reset();
    status_.reset();
    scanner_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::reloadPools(const Config& config) noexcept {
    if (!running_.load() || !scheduler_) {
        return false;
    }
    try {
        scheduler_->reloadPools(config);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Pool reload failed, keeping previous pools: " + std::string(e.what()));
        return false;
    }
}

bool Server::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(workspace_ / "inbox" / "writing");
        std::filesystem::create_directories(workspace_ / "inbox" / "ready");
        std::filesystem::create_directories(workspace_ / "inbox" / "cancel");
        std::filesystem::create_directories(workspace_ / "accepted");
        std::filesystem::create_directories(workspace_ / "rejected");
        std::filesystem::create_directories(workspace_ / "status");

        LOG_DEBUG("Workspace created: " + workspace_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

bool Server::recoverAccepted() noexcept {
    try {
        const auto acceptedDir = workspace_ / "accepted";
        if (!std::filesystem::exists(acceptedDir)) {
            return true;
        }

        std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> found;
        for (const auto& entry : std::filesystem::directory_iterator(acceptedDir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
                found.emplace_back(entry.last_write_time(), entry.path());
            }
        }
        std::sort(found.begin(), found.end());

        bool allRecovered = true;
        int recovered = 0;
        for (const auto& [time, path] : found) {
            const WorkflowId id = path.stem().string();
            if (auto snapshot = status_->get(id); snapshot && isFinished(snapshot->summary.status)) {
                continue;
            }

            LOG_WARN("Recovering accepted workflow: " + id);
            try {
                const auto spec = WorkflowSpec::load(path);
                const auto result = scheduler_->submit(spec, toSystemTime(time), id);
                if (!result) {
                    LOG_ERROR("Failed to recover workflow " + id + ": " + result.message);
                    rejectDefinition(id, path, result.message);
                    allRecovered = false;
                    continue;
                }
                std::lock_guard<std::mutex> lock(trackedMutex_);
                tracked_.insert(id);
                ++recovered;
            } catch (const Error& e) {
                LOG_ERROR("Failed to recover workflow " + id + ": " + e.what());
                rejectDefinition(id, path, e.what());
                allRecovered = false;
            }
        }

        if (recovered > 0) {
            LOG_INFO("Recovered " + std::to_string(recovered) + " accepted workflow(s)");
        }
        return allRecovered;
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering accepted workflows: " + std::string(e.what()));
        return false;
    }
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    const auto scanInterval = config_.scheduler.scanInterval.count() > 0 ? config_.scheduler.scanInterval
                                                                         : Seconds(1);

    while (!shutdown_.load()) {
        try {
            const auto definitions = scanner_->scan();
            for (const auto& definition : definitions) {
                if (shutdown_.load()) break;
                ingest(definition);
            }
            if (!definitions.empty()) {
                LOG_DEBUG("Ingested " + std::to_string(definitions.size()) + " new definitions");
            }

            processCancels();
            scheduler_->tick();
            publishStatus();

            const auto sleepEnd = std::chrono::steady_clock::now() + scanInterval;
            while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
                if (scanner_->hasNewWork()) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
            std::this_thread::sleep_for(scanInterval);
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

void Server::ingest(const Definition& definition) {
    const auto acceptedPath = workspace_ / "accepted" / (definition.id + ".yaml");

    std::error_code ec;
    std::filesystem::rename(definition.path, acceptedPath, ec);
    if (ec) {
        LOG_ERROR("Failed to claim definition " + definition.id + ": " + ec.message());
        return;
    }

    WorkflowSpec spec;
    try {
        spec = WorkflowSpec::load(acceptedPath);
    } catch (const Error& e) {
        LOG_WARN("Invalid definition " + definition.id + ": " + e.what());
        rejectDefinition(definition.id, acceptedPath, e.what());

        WorkflowView view;
        view.summary.id = definition.id;
        view.summary.name = definition.id;
        view.summary.status = WorkflowStatus::FailedSubmission;
        view.summary.submitTime = Clock::now();
        view.summary.endTime = view.summary.submitTime;
        view.failureMessage = e.what();
        (void)status_->write(view);
        return;
    }

    const auto result = scheduler_->submit(spec, Clock::now(), definition.id);
    if (!result) {
        rejectDefinition(definition.id, acceptedPath, std::string(toString(result.error)) + ": " + result.message);
    }

    std::lock_guard<std::mutex> lock(trackedMutex_);
    tracked_.insert(definition.id);
}

void Server::processCancels() {
    for (const auto& request : scanner_->scanCancels()) {
        const auto result = scheduler_->cancel(request.id, request.user);
        if (result) {
            LOG_INFO("Canceled workflow " + request.id + (request.user.empty() ? "" : " for " + request.user));
        } else {
            LOG_WARN("Cancel of " + request.id + " refused: " + result.message);
        }

        std::error_code ec;
        std::filesystem::remove(request.path, ec);
        if (ec) {
            LOG_ERROR("Failed to remove cancel request " + request.path.string() + ": " + ec.message());
        }
    }
}

void Server::publishStatus() noexcept {
    if (!scheduler_ || !status_) return;

    try {
        std::vector<WorkflowId> ids;
        {
            std::lock_guard<std::mutex> lock(trackedMutex_);
            ids.assign(tracked_.begin(), tracked_.end());
        }

        for (const auto& id : ids) {
            const auto view = scheduler_->getStatus(id);
            if (!view) {
                std::lock_guard<std::mutex> lock(trackedMutex_);
                tracked_.erase(id);
                continue;
            }
            if (!status_->write(*view)) continue;

            if (isFinished(view->summary.status)) {
                LOG_DEBUG("Final status of " + id + " published: " + toString(view->summary.status));
                std::lock_guard<std::mutex> lock(trackedMutex_);
                tracked_.erase(id);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish status: " + std::string(e.what()));
    }
}

void Server::rejectDefinition(const WorkflowId& id, const std::filesystem::path& from,
                              const std::string& error) noexcept {
    try {
        const auto rejectedDir = workspace_ / "rejected" / id;
        std::filesystem::create_directories(rejectedDir);

        std::error_code ec;
        std::filesystem::rename(from, rejectedDir / "definition.yaml", ec);
        if (ec) {
            LOG_ERROR("Failed to move rejected definition " + id + ": " + ec.message());
        }

        std::ofstream file(rejectedDir / "error.txt");
        if (file) {
            file << error << "\n";
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record rejection of " + id + ": " + e.what());
    }
}

}
