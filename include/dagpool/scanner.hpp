/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "dagpool/types.hpp"

namespace dagpool {

struct Definition {
    WorkflowId id;
    std::filesystem::path path;
};

struct CancelRequest {
    WorkflowId id;
    std::string user;
    std::filesystem::path path;
};

// Finds published workflow definitions (inbox/ready/<id>.yaml) and cancel
// requests (inbox/cancel/<id>). Oldest first.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    [[nodiscard]] std::vector<Definition> scan() const noexcept;
    [[nodiscard]] std::vector<CancelRequest> scanCancels() const noexcept;
    [[nodiscard]] bool hasNewWork() const noexcept;
    [[nodiscard]] std::size_t readyCount() const noexcept;

private:
    std::filesystem::path workspace_;
    std::filesystem::path readyPath_;
    std::filesystem::path cancelPath_;

    [[nodiscard]] bool isValidDefinition(const std::filesystem::path& file) const noexcept;
    [[nodiscard]] WorkflowId extractId(const std::filesystem::path& file) const noexcept;
};

}
