/**
 * @file ThreadSafeLog.h
 * @brief Append-only session trace shared by every thread
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace Stork {

/**
 * @brief Session trace file
 *
 * Lifecycle events (phase transitions, outcomes, nameplates, server accept
 * and pairing events) land here so a failed transfer can be reconstructed
 * after the fact. Lines look like:
 * @code
 * 2026-03-01 14:02:11.532 [pid 4242] sess_1a2b-3c4d-5e6f-7a8b AwaitingPeer
 * @endcode
 *
 * Codes and key material must never be passed in.
 *
 * Thread Safety: every method takes the same mutex, so lines from
 * concurrent sessions never interleave. Before initialize() (or after
 * close()) all writes are dropped.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Open @p logPath for appending, creating parent directories
     * @return false if the file cannot be opened; the trace stays disabled
     *
     * An empty path disables the trace and succeeds.
     */
    static bool initialize(const std::filesystem::path& logPath, std::string& errorMsg);

    /// Append one timestamped line
    static void log(const std::string& message);

    /// Append "<sessionId> <event>"
    static void sessionEvent(const std::string& sessionId, const std::string& event);

    static void close();

private:
    static void writeLocked(const std::string& message);

    static std::mutex s_mutex;
    static std::ofstream s_file;
};

} // namespace Stork
