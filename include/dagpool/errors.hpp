/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dagpool {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The workflow's task or group graph contains a cycle. cycle() lists the
// nodes on it, first node repeated at the end.
class CyclicDependencyError : public Error {
public:
    explicit CyclicDependencyError(std::vector<std::string> cycle)
        : Error("Cyclic dependency: " + join(cycle)), cycle_(std::move(cycle)) {}

    [[nodiscard]] const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    static std::string join(const std::vector<std::string>& nodes) {
        std::string out;
        for (const auto& node : nodes) {
            if (!out.empty()) out += " -> ";
            out += node;
        }
        return out;
    }

    std::vector<std::string> cycle_;
};

class ValidationError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

}
