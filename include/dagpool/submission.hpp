/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "dagpool/types.hpp"
#include "dagpool/workflow_spec.hpp"

namespace dagpool {

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidDefinition,
    CyclicDependency,
    UnknownPool,
    Infeasible,
    DuplicateId,
    WorkspaceError
};

[[nodiscard]] const char* toString(SubmissionError error) noexcept;

struct SubmitResult {
    bool ok = false;
    WorkflowId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class CancelError : uint8_t {
    None = 0,
    NotFound,
    AlreadyFinished,
    IoError
};

struct CancelResult {
    bool ok = false;
    CancelError error = CancelError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Publishes workflow definitions and cancel requests into a daemon
// workspace. Files are staged under inbox/writing and renamed into place, so
// the daemon never sees a partial file.
class Submitter final {
public:
    explicit Submitter(const std::filesystem::path& workspace, bool createIfMissing = true);

    Submitter(const Submitter&) = delete;
    Submitter& operator=(const Submitter&) = delete;
    Submitter(Submitter&&) noexcept = default;
    Submitter& operator=(Submitter&&) noexcept = default;

    // Validates the definition locally, including acyclicity, before publishing.
    [[nodiscard]] SubmitResult submit(const std::string& yaml, const std::string& user = {});
    [[nodiscard]] SubmitResult submitFile(const std::filesystem::path& path, const std::string& user = {});
    [[nodiscard]] CancelResult requestCancel(const WorkflowId& id, const std::string& user = {});

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }

private:
    std::filesystem::path workspace_;
    std::size_t maxBytes_ = 1'000'000;

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] static std::string generateSuffix();
    [[nodiscard]] bool atomicPublish(const std::string& name, const std::string& content,
                                     const std::filesystem::path& target) const noexcept;
};

}
