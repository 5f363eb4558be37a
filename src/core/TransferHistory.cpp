/**
 * @file TransferHistory.cpp
 * @brief Transfer history persistence
 */

#include "stork/TransferHistory.h"
#include "stork/AtomicFile.h"
#include "stork/ThreadSafeLog.h"
#include "stork/config.h"

#include <ctime>
#include <fstream>
#include <sstream>

namespace Stork {

namespace {

constexpr int kHistoryVersion = 1;

std::string stringField(const nlohmann::json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

uint64_t unsignedField(const nlohmann::json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) {
        return obj[key].get<uint64_t>();
    }
    return 0;
}

}  // namespace

TransferHistory::TransferHistory(std::filesystem::path path)
    : m_path(std::move(path))
{
}

std::string TransferHistory::directionToString(TransferDirection direction) {
    return direction == TransferDirection::Send ? "send" : "receive";
}

std::string TransferHistory::nowIso8601() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);

    char buffer[32] = {};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

bool TransferHistory::load(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        return true;
    }

    std::ifstream in(m_path, std::ios::binary);
    if (!in) {
        errorMsg = "Cannot open history file " + m_path.string();
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    const nlohmann::json j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        errorMsg = "History file is not valid JSON: " + m_path.string();
        return false;
    }

    m_records = fromJson(j);
    return true;
}

bool TransferHistory::append(const TransferRecord& record, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_records.push_back(record);
    if (m_records.size() > MAX_HISTORY_ENTRIES) {
        m_records.erase(m_records.begin(),
                        m_records.begin() + static_cast<std::ptrdiff_t>(m_records.size() - MAX_HISTORY_ENTRIES));
    }

    if (!writeFileAtomically(m_path, toJsonLocked().dump(2), errorMsg)) {
        ThreadSafeLog::log("HISTORY_SAVE_ERROR: " + errorMsg);
        return false;
    }
    return true;
}

std::vector<TransferRecord> TransferHistory::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

nlohmann::json TransferHistory::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return toJsonLocked();
}

nlohmann::json TransferHistory::toJsonLocked() const {
    nlohmann::json out;
    out["version"] = kHistoryVersion;
    out["records"] = nlohmann::json::array();
    for (const auto& r : m_records) {
        out["records"].push_back({
            { "id", r.id },
            { "direction", directionToString(r.direction) },
            { "file_name", r.fileName },
            { "file_path", r.filePath },
            { "file_size", r.fileSize },
            { "bytes_moved", r.bytesMoved },
            { "status", r.status },
            { "error_code", r.errorCode },
            { "error_message", r.errorMessage },
            { "transport", r.transport },
            { "started", r.startedIso8601 },
            { "finished", r.finishedIso8601 },
        });
    }
    return out;
}

std::vector<TransferRecord> TransferHistory::fromJson(const nlohmann::json& j) {
    std::vector<TransferRecord> out;
    if (!j.is_object() || !j.contains("records") || !j["records"].is_array()) {
        return out;
    }

    for (const auto& obj : j["records"]) {
        if (!obj.is_object()) {
            continue;
        }

        TransferRecord rec;
        rec.id = stringField(obj, "id");
        const std::string direction = stringField(obj, "direction");
        if (rec.id.empty() || (direction != "send" && direction != "receive")) {
            continue;
        }
        rec.direction = direction == "send" ? TransferDirection::Send : TransferDirection::Receive;
        rec.fileName = stringField(obj, "file_name");
        rec.filePath = stringField(obj, "file_path");
        rec.fileSize = unsignedField(obj, "file_size");
        rec.bytesMoved = unsignedField(obj, "bytes_moved");
        rec.status = stringField(obj, "status");
        rec.errorCode = stringField(obj, "error_code");
        rec.errorMessage = stringField(obj, "error_message");
        rec.transport = stringField(obj, "transport");
        rec.startedIso8601 = stringField(obj, "started");
        rec.finishedIso8601 = stringField(obj, "finished");
        out.push_back(std::move(rec));
    }

    if (out.size() > MAX_HISTORY_ENTRIES) {
        out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(out.size() - MAX_HISTORY_ENTRIES));
    }
    return out;
}

}  // namespace Stork
