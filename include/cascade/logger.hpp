/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace cascade {

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
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Mirror every emitted line into a file (appended). Empty path disables it.
    [[nodiscard]] static bool setLogFile(const std::filesystem::path& path) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::cascade::Logger::error(msg)
#define LOG_WARN(msg)  ::cascade::Logger::warn(msg)
#define LOG_INFO(msg)  ::cascade::Logger::info(msg)
#define LOG_DEBUG(msg) ::cascade::Logger::debug(msg)
#define LOG_TRACE(msg) ::cascade::Logger::trace(msg)
