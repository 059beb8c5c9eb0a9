/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/scanner.hpp"
#include "dagpool/logger.hpp"
#include <algorithm>
#include <fstream>
#include <utility>

namespace dagpool {

namespace {

template <typename Entry>
void sortOldestFirst(std::vector<std::pair<std::filesystem::file_time_type, Entry>>& found) {
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second.id < b.second.id;
    });
}

}

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace),
      readyPath_(workspace / "inbox" / "ready"),
      cancelPath_(workspace / "inbox" / "cancel") {
}

std::vector<Definition> Scanner::scan() const noexcept {
    std::vector<Definition> definitions;

    try {
        if (!std::filesystem::exists(readyPath_)) {
            LOG_DEBUG("Ready directory does not exist: " + readyPath_.string());
            return definitions;
        }

        std::vector<std::pair<std::filesystem::file_time_type, Definition>> found;
        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (!isValidDefinition(entry.path())) continue;
            Definition definition{extractId(entry.path()), entry.path()};
            if (definition.id.empty()) continue;
            LOG_TRACE("Found definition: " + definition.id);
            found.emplace_back(entry.last_write_time(), std::move(definition));
        }

        sortOldestFirst(found);
        for (auto& [time, definition] : found) {
            (void)time;
            definitions.push_back(std::move(definition));
        }

        if (!definitions.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(definitions.size()) + " new definitions");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }

    return definitions;
}

std::vector<CancelRequest> Scanner::scanCancels() const noexcept {
    std::vector<CancelRequest> requests;

    try {
        if (!std::filesystem::exists(cancelPath_)) {
            return requests;
        }

        std::vector<std::pair<std::filesystem::file_time_type, CancelRequest>> found;
        for (const auto& entry : std::filesystem::directory_iterator(cancelPath_)) {
            if (!entry.is_regular_file()) continue;

            CancelRequest request;
            request.id = entry.path().filename().string();
            request.path = entry.path();
            std::ifstream file(entry.path());
            std::getline(file, request.user);
            found.emplace_back(entry.last_write_time(), std::move(request));
        }

        sortOldestFirst(found);
        for (auto& [time, request] : found) {
            (void)time;
            requests.push_back(std::move(request));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Cancel scan error: " + std::string(e.what()));
    }

    return requests;
}

bool Scanner::hasNewWork() const noexcept {
    try {
        if (std::filesystem::exists(readyPath_)) {
            for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
                if (isValidDefinition(entry.path())) return true;
            }
        }
        if (std::filesystem::exists(cancelPath_)) {
            return !std::filesystem::is_empty(cancelPath_);
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Inbox check failed: " + std::string(e.what()));
    }
    return false;
}

std::size_t Scanner::readyCount() const noexcept {
    std::size_t count = 0;

    try {
        if (!std::filesystem::exists(readyPath_)) {
            return 0;
        }
        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (isValidDefinition(entry.path())) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Ready count stopped early: " + std::string(e.what()));
    }

    return count;
}

bool Scanner::isValidDefinition(const std::filesystem::path& file) const noexcept {
    try {
        if (!std::filesystem::is_regular_file(file)) {
            return false;
        }
        if (file.extension() != ".yaml") {
            LOG_DEBUG("Ignoring non-definition file in inbox: " + file.string());
            return false;
        }
        if (std::filesystem::file_size(file) == 0) {
            LOG_DEBUG("Ignoring empty definition: " + file.string());
            return false;
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

WorkflowId Scanner::extractId(const std::filesystem::path& file) const noexcept {
    try {
        return file.stem().string();
    } catch (const std::exception&) {
        return "";
    }
}

}
