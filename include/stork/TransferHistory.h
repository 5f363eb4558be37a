/**
 * @file TransferHistory.h
 * @brief Persistent record of finished transfer sessions
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace Stork {

enum class TransferDirection : uint8_t {
    Send,
    Receive
};

/**
 * @brief One finished session
 *
 * Never contains the introduction code or any key material.
 */
struct TransferRecord {
    std::string id;
    TransferDirection direction = TransferDirection::Send;
    std::string fileName;
    std::string filePath;        ///< Source (send) or saved path (receive)
    uint64_t fileSize = 0;
    uint64_t bytesMoved = 0;
    std::string status;          ///< "completed", "failed", "cancelled"
    std::string errorCode;       ///< Stable id ("STK-XFER-1301"), empty on success
    std::string errorMessage;
    std::string transport;       ///< "direct-tcp-v1", "relay-v1", or empty
    std::string startedIso8601;
    std::string finishedIso8601;
};

/**
 * @class TransferHistory
 * @brief JSON-backed history list, newest last, capped at MAX_HISTORY_ENTRIES
 *
 * File layout: {"version": 1, "records": [ {...}, ... ]}. The file is
 * rewritten atomically on every append.
 *
 * Thread Safety: all methods lock an internal mutex; sessions finishing
 * concurrently may append to the same instance.
 */
class TransferHistory {
public:
    explicit TransferHistory(std::filesystem::path path);

    /**
     * @brief Load the file; a missing file is an empty history
     * @return false if the file exists but cannot be read or parsed
     */
    bool load(std::string& errorMsg);

    /**
     * @brief Append a record, trim to the cap, persist
     */
    bool append(const TransferRecord& record, std::string& errorMsg);

    std::vector<TransferRecord> records() const;
    const std::filesystem::path& path() const { return m_path; }

    nlohmann::json toJson() const;

    /**
     * @brief Parse the file layout; malformed entries are skipped
     */
    static std::vector<TransferRecord> fromJson(const nlohmann::json& j);

    /**
     * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
     */
    static std::string nowIso8601();

    static std::string directionToString(TransferDirection direction);

private:
    /// Caller must hold m_mutex
    nlohmann::json toJsonLocked() const;

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    std::vector<TransferRecord> m_records;
};

}  // namespace Stork
