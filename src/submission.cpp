/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/submission.hpp"
#include "dagpool/dag.hpp"
#include "dagpool/errors.hpp"
#include "dagpool/logger.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace dagpool {

namespace {

std::string currentUser() {
    if (const char* user = std::getenv("USER")) {
        return user;
    }
    return "unknown";
}

}

const char* toString(SubmissionError error) noexcept {
    switch (error) {
        case SubmissionError::None:              return "NONE";
        case SubmissionError::IoError:           return "IO_ERROR";
        case SubmissionError::InvalidDefinition: return "INVALID_DEFINITION";
        case SubmissionError::CyclicDependency:  return "CYCLIC_DEPENDENCY";
        case SubmissionError::UnknownPool:       return "UNKNOWN_POOL";
        case SubmissionError::Infeasible:        return "INFEASIBLE";
        case SubmissionError::DuplicateId:       return "DUPLICATE_ID";
        case SubmissionError::WorkspaceError:    return "WORKSPACE_ERROR";
        default: return "UNKNOWN";
    }
}

Submitter::Submitter(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace) {
    if (!createWorkspace(createIfMissing)) {
        LOG_ERROR("Failed to initialize workspace: " + workspace_.string());
    }
}

SubmitResult Submitter::submit(const std::string& yaml, const std::string& user) {
    if (yaml.empty()) {
        return {false, "", SubmissionError::InvalidDefinition, "Workflow definition is empty"};
    }
    if (yaml.size() > maxBytes_) {
        LOG_DEBUG("Definition exceeds size limit: " + std::to_string(yaml.size()) + " > " + std::to_string(maxBytes_));
        return {false, "", SubmissionError::InvalidDefinition,
                "Workflow definition exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    WorkflowSpec spec;
    try {
        spec = WorkflowSpec::parse(yaml);
        DagResolver dag(spec);
        (void)dag;
    } catch (const CyclicDependencyError& e) {
        return {false, "", SubmissionError::CyclicDependency, e.what()};
    } catch (const ValidationError& e) {
        return {false, "", SubmissionError::InvalidDefinition, e.what()};
    }

    if (!user.empty()) {
        spec.user = user;
    } else if (spec.user.empty()) {
        spec.user = currentUser();
    }

    const WorkflowId id = spec.name + "-" + generateSuffix();
    LOG_DEBUG("Generated workflow ID: " + id);

    if (!atomicPublish(id + ".yaml", spec.toYaml(), workspace_ / "inbox" / "ready")) {
        LOG_ERROR("Failed to publish workflow: " + id);
        return {false, "", SubmissionError::IoError, "Failed to publish workflow definition"};
    }

    LOG_INFO("Workflow submitted: " + id);
    return {true, id, SubmissionError::None, ""};
}

SubmitResult Submitter::submitFile(const std::filesystem::path& path, const std::string& user) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return {false, "", SubmissionError::IoError, "Cannot read " + path.string() + ": " + ec.message()};
    }
    if (size > maxBytes_) {
        return {false, "", SubmissionError::InvalidDefinition,
                "Workflow definition exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {false, "", SubmissionError::IoError, "Cannot open " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return submit(buffer.str(), user);
}

CancelResult Submitter::requestCancel(const WorkflowId& id, const std::string& user) {
    if (id.empty() || id.find('/') != std::string::npos) {
        return {false, CancelError::NotFound, "Invalid workflow id '" + id + "'"};
    }
    const std::string who = user.empty() ? currentUser() : user;
    if (!atomicPublish(id, who + "\n", workspace_ / "inbox" / "cancel")) {
        return {false, CancelError::IoError, "Failed to publish cancel request"};
    }
    LOG_INFO("Cancel requested for " + id + " by " + who);
    return {true, CancelError::None, ""};
}

bool Submitter::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(workspace_);
        }

        std::filesystem::create_directories(workspace_ / "inbox" / "writing");
        std::filesystem::create_directories(workspace_ / "inbox" / "ready");
        std::filesystem::create_directories(workspace_ / "inbox" / "cancel");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

std::string Submitter::generateSuffix() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool Submitter::atomicPublish(const std::string& name, const std::string& content,
                              const std::filesystem::path& target) const noexcept {
    const auto staging = workspace_ / "inbox" / "writing" / name;
    try {
        {
            std::ofstream file(staging, std::ios::binary);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(staging, ec);
                return false;
            }
        }
        std::filesystem::rename(staging, target / name);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Publish of " + name + " failed: " + std::string(e.what()));
        std::error_code ec;
        std::filesystem::remove(staging, ec);
        return false;
    }
}

}
