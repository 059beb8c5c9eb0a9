/*
 * dagpool - Gang-scheduled Workflow Core
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace dagpool {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Re-reads DAGPOOL_LOG_LEVEL. Config files call setLevel() first, so the
    // environment wins when the daemon calls this afterwards.
    static void initFromEnv() noexcept;

    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static std::optional<LogLevel> parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Names the calling thread in every line it logs.
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::dagpool::Logger::error(msg)
#define LOG_WARN(msg)  ::dagpool::Logger::warn(msg)
#define LOG_INFO(msg)  ::dagpool::Logger::info(msg)
#define LOG_DEBUG(msg) ::dagpool::Logger::debug(msg)
#define LOG_TRACE(msg) ::dagpool::Logger::trace(msg)
