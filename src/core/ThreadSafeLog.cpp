/**
 * @file ThreadSafeLog.cpp
 * @brief Session trace implementation
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/ThreadSafeLog.h"

#include <unistd.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace Stork {

std::mutex ThreadSafeLog::s_mutex;
std::ofstream ThreadSafeLog::s_file;

bool ThreadSafeLog::initialize(const std::filesystem::path& logPath, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.close();
    }
    if (logPath.empty()) {
        return true;
    }

    if (logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (ec) {
            errorMsg = "Cannot create " + logPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    s_file.open(logPath, std::ios::app);
    if (!s_file.is_open()) {
        errorMsg = "Cannot open trace log " + logPath.string();
        return false;
    }
    writeLocked("trace opened");
    return true;
}

void ThreadSafeLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);
    writeLocked(message);
}

void ThreadSafeLog::sessionEvent(const std::string& sessionId, const std::string& event) {
    std::lock_guard<std::mutex> lock(s_mutex);
    writeLocked(sessionId + " " + event);
}

void ThreadSafeLog::close() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        writeLocked("trace closed");
        s_file.close();
    }
}

void ThreadSafeLog::writeLocked(const std::string& message) {
    if (!s_file.is_open()) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&nowT, &tmBuf);

    s_file << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
           << ms.count() << " [pid " << ::getpid() << "] " << message << '\n';
    s_file.flush();
}

} // namespace Stork
