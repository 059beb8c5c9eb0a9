/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dagpool/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <new>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace dagpool {

namespace {

// Shared by every thread. One mutex guards the level, the thread names and
// the stderr writes, so lines from admission workers never interleave.
struct LogState {
    std::mutex mutex;
    LogLevel level = LogLevel::INFO;
    bool levelChosen = false;
    std::unordered_map<std::thread::id, std::string> threadNames;
};

LogState& state() {
    static LogState instance;
    return instance;
}

// Callers hold state().mutex.
std::string threadLabel(LogState& log) {
    const auto tid = std::this_thread::get_id();
    const auto it = log.threadNames.find(tid);
    if (it != log.threadNames.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

std::string formatLine(const char* level, const std::string& thread, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
         << " [" << level << "]"
         << " [" << thread << "]"
         << " " << message;
    return line.str();
}

}

void Logger::setLevel(LogLevel level) noexcept {
    auto& log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.level = level;
    log.levelChosen = true;
}

void Logger::initFromEnv() noexcept {
    const auto level = parseEnvLevel();
    auto& log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    if (level) {
        log.level = *level;
    }
    log.levelChosen = true;
}

LogLevel Logger::level() noexcept {
    auto& log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    if (!log.levelChosen) {
        log.level = parseEnvLevel().value_or(LogLevel::INFO);
        log.levelChosen = true;
    }
    return log.level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto& log = state();
        std::lock_guard<std::mutex> lock(log.mutex);
        // stdout belongs to the CLIs
        std::cerr << formatLine(levelToString(level), threadLabel(log), message) << std::endl;
    } catch (...) {
        // Logging must never throw
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    try {
        std::string name(text);
        for (char& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (name == "error") return LogLevel::ERROR;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "info") return LogLevel::INFO;
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "trace") return LogLevel::TRACE;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<LogLevel> Logger::parseEnvLevel() noexcept {
    const char* value = std::getenv("DAGPOOL_LOG_LEVEL");
    if (!value) return std::nullopt;
    return parseLevel(value);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    auto& log = state();
    std::lock_guard<std::mutex> lock(log.mutex);
    log.threadNames[std::this_thread::get_id()] = name;
}

}
