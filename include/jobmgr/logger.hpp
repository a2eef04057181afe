/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace jobmgr {

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

    // Append records to a file instead of stderr. Returns false if the file cannot be opened.
    static bool setFile(const std::filesystem::path& path) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}

#define LOG_ERROR(msg) ::jobmgr::Logger::error(msg)
#define LOG_WARN(msg)  ::jobmgr::Logger::warn(msg)
#define LOG_INFO(msg)  ::jobmgr::Logger::info(msg)
#define LOG_DEBUG(msg) ::jobmgr::Logger::debug(msg)
#define LOG_TRACE(msg) ::jobmgr::Logger::trace(msg)
