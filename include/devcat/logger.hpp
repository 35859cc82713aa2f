/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace devcat {

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

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Accepts error|warn|warning|info|debug|trace in any case
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}

#define LOG_ERROR(msg) ::devcat::Logger::error(msg)
#define LOG_WARN(msg)  ::devcat::Logger::warn(msg)
#define LOG_INFO(msg)  ::devcat::Logger::info(msg)
#define LOG_DEBUG(msg) ::devcat::Logger::debug(msg)
#define LOG_TRACE(msg) ::devcat::Logger::trace(msg)
