/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace gpibio {

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
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

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

// Thread naming for log context (the io_context thread, blocking callers)
void setThreadName(const std::string& name);

}

// Message construction is skipped when the level is filtered out, since
// native-call tracing builds strings on every poll sample.
#define LOG_ERROR(msg) ::gpibio::Logger::error(msg)
#define LOG_WARN(msg)  ::gpibio::Logger::warn(msg)
#define LOG_INFO(msg)  ::gpibio::Logger::info(msg)
#define LOG_DEBUG(msg) \
    do { if (::gpibio::Logger::enabled(::gpibio::LogLevel::DEBUG)) ::gpibio::Logger::debug(msg); } while (0)
#define LOG_TRACE(msg) \
    do { if (::gpibio::Logger::enabled(::gpibio::LogLevel::TRACE)) ::gpibio::Logger::trace(msg); } while (0)
