/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/sim_executor.hpp"
#include "dagpool/logger.hpp"
#include <cstdlib>

namespace dagpool {

namespace {

int env_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) return std::atoi(v);
    return defv;
}

double env_double(const char* name, double defv) {
    if (const char* v = std::getenv(name)) return std::atof(v);
    return defv;
}

}

SimExecutor::SimExecutor()
    : SimExecutor(Millis(env_int("DAGPOOL_SIM_INIT_MS", 500)), env_double("DAGPOOL_SIM_SPEED", 1.0)) {
}

SimExecutor::SimExecutor(Millis initDelay, double speed)
    : initDelay_(initDelay), speed_(speed > 0 ? speed : 1.0) {
    LOG_DEBUG("Simulated backend created - init delay " + std::to_string(initDelay_.count()) + "ms, speed x" +
              std::to_string(speed_));
}

SimExecutor::~SimExecutor() {
    stop();
}

bool SimExecutor::start(TaskEventSink sink) {
    if (running_.load()) {
        LOG_WARN("Simulated backend already running");
        return false;
    }
    if (!sink) {
        LOG_ERROR("Invalid task event sink provided");
        return false;
    }

    sink_ = std::move(sink);
    shutdown_.store(false);
    running_.store(true);
    try {
        timerThread_ = std::thread(&SimExecutor::timerLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start simulated backend: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
    return true;
}

void SimExecutor::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    shutdown_.store(true);
    running_.store(false);
    wake_.notify_all();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    timers_.clear();
    tasks_.clear();
    LOG_DEBUG("Simulated backend stopped");
}

bool SimExecutor::placeGang(const std::string& groupKey, const std::vector<TaskLaunch>& tasks) {
    if (!running_.load()) {
        LOG_WARN("Simulated backend is stopped, rejecting " + groupKey);
        return false;
    }

    const auto now = SteadyClock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& launch : tasks) {
        const auto key = launch.ref.str();
        SimTask task{launch, "sim-node-" + std::to_string(nextNode_++ % 8), false};

        TaskEvent initializing{launch.ref, ExecutorPhase::Initializing};
        initializing.node = task.node;
        schedule(now, initializing);

        TaskEvent ready{launch.ref, ExecutorPhase::Ready};
        ready.node = task.node;
        schedule(now + initDelay_, ready);

        tasks_[key] = std::move(task);
    }
    LOG_DEBUG("Placed " + groupKey + " (" + std::to_string(tasks.size()) + " tasks)");
    return true;
}

void SimExecutor::cancel(const TaskRef& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = task.str();
    unschedule(key);
    if (tasks_.erase(key)) {
        LOG_DEBUG("Stopped " + key);
    }
}

void SimExecutor::releaseBarrier(const std::string& groupKey, const std::vector<TaskRef>& tasks) {
    const auto now = SteadyClock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& ref : tasks) {
        const auto it = tasks_.find(ref.str());
        if (it == tasks_.end()) continue;
        auto& task = it->second;
        task.atBarrier = false;

        schedule(now, TaskEvent{ref, ExecutorPhase::Running});

        const int code = exitCodeFor(task.launch.spec);
        TaskEvent exited{ref, ExecutorPhase::Exited};
        exited.outcome = code == 0 ? TaskStatus::Completed : TaskStatus::Failed;
        exited.exitCode = code;
        exited.node = task.node;
        exited.reason = code == 0 ? "" : "Command exited with code " + std::to_string(code);
        schedule(now + scaled(task.launch.spec.duration), exited);
    }
    LOG_TRACE("Barrier released for " + groupKey);
}

void SimExecutor::restart(const TaskRef& task) {
    const auto now = SteadyClock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = task.str();
    const auto it = tasks_.find(key);
    if (it == tasks_.end()) return;

    unschedule(key);
    it->second.atBarrier = true;
    TaskEvent ready{task, ExecutorPhase::Ready};
    ready.node = it->second.node;
    schedule(now + initDelay_, ready);
}

std::size_t SimExecutor::activeTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SimExecutor::schedule(SteadyClock::time_point due, TaskEvent event) {
    if (event.phase == ExecutorPhase::Ready) {
        const auto it = tasks_.find(event.ref.str());
        if (it != tasks_.end()) it->second.atBarrier = true;
    }
    timers_.emplace(due, std::move(event));
    wake_.notify_one();
}

void SimExecutor::unschedule(const std::string& key) {
    for (auto it = timers_.begin(); it != timers_.end();) {
        if (it->second.ref.str() == key) {
            it = timers_.erase(it);
        } else {
            ++it;
        }
    }
}

void SimExecutor::timerLoop() {
    setThreadName("Executor");
    LOG_DEBUG("Simulated backend timer started");

    while (!shutdown_.load()) {
        std::vector<TaskEvent> due;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (timers_.empty()) {
                wake_.wait(lock, [this] { return !timers_.empty() || shutdown_.load(); });
            } else {
                wake_.wait_until(lock, timers_.begin()->first);
            }
            if (shutdown_.load()) break;

            const auto now = SteadyClock::now();
            while (!timers_.empty() && timers_.begin()->first <= now) {
                auto event = std::move(timers_.begin()->second);
                timers_.erase(timers_.begin());
                if (event.phase == ExecutorPhase::Exited) {
                    tasks_.erase(event.ref.str());
                }
                due.push_back(std::move(event));
            }
        }

        // The scheduler may call back into this executor from the sink.
        for (const auto& event : due) {
            try {
                sink_(event);
            } catch (const std::exception& e) {
                LOG_ERROR("Event sink failed for " + event.ref.str() + ": " + e.what());
            }
        }
    }

    LOG_DEBUG("Simulated backend timer stopped");
}

SimExecutor::Millis SimExecutor::scaled(Seconds duration) const {
    const auto millis = std::chrono::duration_cast<Millis>(duration).count();
    return Millis(static_cast<Millis::rep>(static_cast<double>(millis) / speed_));
}

int SimExecutor::exitCodeFor(const TaskSpec& spec) noexcept {
    if (spec.command.size() >= 2 && spec.command[0] == "exit") {
        return std::atoi(spec.command[1].c_str());
    }
    return 0;
}

}
