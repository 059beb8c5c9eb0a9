/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/logger.hpp"
#include "dagpool/status_store.hpp"
#include "dagpool/submission.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace dagpool;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "dagpool Status Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [workflow_id] [-w]\n";
    std::cout << "       " << progName << " <workspace> [--pool <p>] [--user <u>] [--status <s>] [-n <limit>]\n";
    std::cout << "       " << progName << " <workspace> --cancel <workflow_id> [--user <u>]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Daemon workspace directory\n";
    std::cout << "  workflow_id   Workflow to show (optional)\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - If workflow_id provided: show its groups and task instances\n";
    std::cout << "  - If no workflow_id: list history, newest first\n";
    std::cout << "  - Exit code 2 while the workflow has not finished\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait          Wait until the workflow finishes\n";
    std::cout << "  --pool <p>          Only workflows in pool <p>\n";
    std::cout << "  --user <u>          Only workflows of <u>; with --cancel, the canceling user\n";
    std::cout << "  --status <s>        Only workflows in status <s> (e.g. RUNNING)\n";
    std::cout << "  -n <limit>          At most <limit> entries (default 20, 0 = all)\n";
    std::cout << "  --cancel <id>       Request cancellation of a workflow\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DAGPOOL_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace train-1731808123456_12345_0 -w\n";
    std::cout << "  " << progName << " ./workspace --pool gpu-a --status FAILED_PREEMPTED\n";
}

std::string formatTime(const std::optional<TimePoint>& time) {
    if (!time) return "-";
    auto t = Clock::to_time_t(*time);
    std::ostringstream out;
    out << std::put_time(std::localtime(&t), "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void printHistory(const std::vector<WorkflowSummary>& entries) {
    if (entries.empty()) {
        std::cout << "No workflows found" << std::endl;
        return;
    }
    std::cout << std::left
              << std::setw(44) << "ID"
              << std::setw(12) << "POOL"
              << std::setw(10) << "PRIORITY"
              << std::setw(12) << "USER"
              << std::setw(22) << "STATUS"
              << "SUBMITTED\n";
    for (const auto& entry : entries) {
        std::cout << std::setw(44) << entry.id
                  << std::setw(12) << entry.pool
                  << std::setw(10) << toString(entry.priority)
                  << std::setw(12) << entry.user
                  << std::setw(22) << toString(entry.status)
                  << formatTime(entry.submitTime) << "\n";
    }
}

void printWorkflow(const WorkflowView& view) {
    const auto& s = view.summary;
    std::cout << "Workflow:  " << s.id << " (" << s.name << ")\n";
    std::cout << "Status:    " << toString(s.status) << "\n";
    std::cout << "Pool:      " << s.pool << "  priority " << toString(s.priority) << "\n";
    std::cout << "User:      " << s.user << "\n";
    std::cout << "Submitted: " << formatTime(s.submitTime) << "\n";
    std::cout << "Started:   " << formatTime(view.startTime) << "\n";
    std::cout << "Ended:     " << formatTime(s.endTime) << "\n";
    if (view.canceled) {
        std::cout << "Canceled by " << view.canceledBy << "\n";
    }
    if (!view.failureMessage.empty()) {
        std::cout << "Failure:   " << view.failureMessage << "\n";
    }

    std::cout << "\nGroups:\n";
    for (const auto& group : view.groups) {
        std::cout << "  " << std::left << std::setw(24) << group.name
                  << std::setw(22) << toString(group.status);
        if (!group.upstream.empty()) {
            std::cout << "after";
            for (const auto& up : group.upstream) std::cout << " " << up;
        }
        std::cout << "\n";
    }

    std::cout << "\nTasks:\n";
    for (const auto& task : view.tasks) {
        std::cout << "  " << std::left << std::setw(24) << (task.name + "#" + std::to_string(task.retryId))
                  << std::setw(16) << task.group
                  << std::setw(22) << toString(task.status)
                  << std::setw(14) << (task.node.empty() ? "-" : task.node);
        if (task.lead) std::cout << " lead";
        if (!task.current) std::cout << " retired";
        if (task.exitCode) std::cout << " exit=" << *task.exitCode;
        if (task.restarts > 0) std::cout << " restarts=" << task.restarts;
        if (!task.message.empty()) std::cout << "  " << task.message;
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    if (!std::getenv("DAGPOOL_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string workflowId;
    std::string cancelId;
    bool wait = false;
    HistoryFilter filter;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << option << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--pool") {
            auto v = value("--pool");
            if (!v) return 1;
            filter.pool = *v;
        } else if (arg == "--user" || arg == "-u") {
            auto v = value("--user");
            if (!v) return 1;
            filter.user = *v;
        } else if (arg == "--status") {
            auto v = value("--status");
            if (!v) return 1;
            filter.status = parseWorkflowStatus(*v);
            if (!filter.status) {
                std::cerr << "Error: Unknown workflow status: " << *v << "\n";
                return 1;
            }
        } else if (arg == "-n" || arg == "--limit") {
            auto v = value("-n");
            if (!v) return 1;
            try {
                filter.limit = static_cast<std::size_t>(std::stoul(*v));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid limit: " << *v << "\n";
                return 1;
            }
        } else if (arg == "--cancel") {
            auto v = value("--cancel");
            if (!v) return 1;
            cancelId = *v;
        } else {
            workflowId = arg;
        }
    }

    try {
        if (!cancelId.empty()) {
            Submitter submitter(workspace, false);
            auto result = submitter.requestCancel(cancelId, filter.user);
            if (!result) {
                std::cerr << "Error: " << result.message << std::endl;
                return 1;
            }
            std::cout << cancelId << std::endl;
            return 0;
        }

        // Check piped input for a workflow id if none was given
        if (workflowId.empty() && wait && !isatty(fileno(stdin))) {
            std::cin >> workflowId;
        }

        StatusStore store(workspace);

        if (workflowId.empty()) {
            printHistory(store.list(filter));
            return 0;
        }

        if (wait) {
            while (true) {
                auto view = store.get(workflowId);
                if (view && isFinished(view->summary.status)) break;
                if (!view && store.rejection(workflowId)) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        auto view = store.get(workflowId);
        if (!view) {
            if (auto error = store.rejection(workflowId)) {
                std::cerr << "Workflow rejected: " << workflowId << "\n" << *error << std::endl;
                return 1;
            }
            std::cerr << "Workflow not found: " << workflowId << std::endl;
            return 1;
        }

        printWorkflow(*view);
        if (!isFinished(view->summary.status)) {
            return 2; // Different exit code for "not finished"
        }
        return view->summary.status == WorkflowStatus::Completed ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
