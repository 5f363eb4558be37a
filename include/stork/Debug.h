/**
 * @file Debug.h
 * @brief Debug logging utilities with timestamps
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace Stork {

/**
 * @brief Severity levels understood by the LOG_* macros
 */
enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

// Global mutex for thread-safe logging.
// Concurrent writes to std::cerr from session, negotiator and server threads
// would otherwise interleave mid-line.
inline std::mutex g_logMutex;

inline std::atomic<int> g_logLevel{ static_cast<int>(LogLevel::Info) };

/**
 * @brief Set the minimum level that reaches std::cerr
 */
inline void setLogLevel(LogLevel level) {
    g_logLevel.store(static_cast<int>(level));
}

inline bool isLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_logLevel.load();
}

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

#define STORK_LOG_AT(level, tag, msg) \
    do { \
        if (Stork::isLogEnabled(level)) { \
            std::lock_guard<std::mutex> lock(Stork::g_logMutex); \
            std::cerr << Stork::getTimestamp() << " [" tag "] " << msg << std::endl; \
        } \
    } while(0)

/**
 * @brief Thread-safe logging macros with timestamp
 */
#define LOG_DEBUG(msg) STORK_LOG_AT(Stork::LogLevel::Debug, "DEBUG", msg)
#define LOG_INFO(msg) STORK_LOG_AT(Stork::LogLevel::Info, "INFO", msg)
#define LOG_WARNING(msg) STORK_LOG_AT(Stork::LogLevel::Warning, "WARNING", msg)
#define LOG_ERROR(msg) STORK_LOG_AT(Stork::LogLevel::Error, "ERROR", msg)

} // namespace Stork
