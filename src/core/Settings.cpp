/**
 * @file Settings.cpp
 * @brief Runtime configuration loading
 */

#include "stork/Settings.h"
#include "stork/AppPaths.h"
#include "stork/Debug.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace Stork {

namespace {

using json = nlohmann::json;

bool readEndpoint(const json& obj, const char* key, Endpoint& out, std::string& errorMsg) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj[key].is_string()) {
        errorMsg = std::string("Setting '") + key + "' must be a \"host:port\" string";
        return false;
    }
    std::string err;
    if (!Endpoint::parse(obj[key].get<std::string>(), out, err)) {
        errorMsg = std::string("Setting '") + key + "': " + err;
        return false;
    }
    return true;
}

bool readBool(const json& obj, const char* key, bool& out, std::string& errorMsg) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj[key].is_boolean()) {
        errorMsg = std::string("Setting '") + key + "' must be true or false";
        return false;
    }
    out = obj[key].get<bool>();
    return true;
}

bool readString(const json& obj, const char* key, std::string& out, std::string& errorMsg) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj[key].is_string()) {
        errorMsg = std::string("Setting '") + key + "' must be a string";
        return false;
    }
    out = obj[key].get<std::string>();
    return true;
}

bool readUnsigned(const json& obj, const char* key, uint64_t maxValue, uint64_t& out, std::string& errorMsg) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj[key].is_number_unsigned()) {
        errorMsg = std::string("Setting '") + key + "' must be a non-negative integer";
        return false;
    }
    const uint64_t value = obj[key].get<uint64_t>();
    if (value > maxValue) {
        errorMsg = std::string("Setting '") + key + "' is out of range";
        return false;
    }
    out = value;
    return true;
}

bool readMs(const json& obj, const char* key, uint32_t& out, std::string& errorMsg) {
    uint64_t value = out;
    if (!readUnsigned(obj, key, std::numeric_limits<uint32_t>::max(), value, errorMsg)) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

bool readMs(const json& obj, const char* key, std::chrono::milliseconds& out, std::string& errorMsg) {
    uint32_t value = static_cast<uint32_t>(out.count());
    if (!readMs(obj, key, value, errorMsg)) {
        return false;
    }
    out = std::chrono::milliseconds(value);
    return true;
}

bool endpointFromEnv(const char* name, Endpoint& out, std::string& errorMsg) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return true;
    }
    std::string err;
    if (!Endpoint::parse(value, out, err)) {
        errorMsg = std::string(name) + ": " + err;
        return false;
    }
    return true;
}

}  // namespace

std::filesystem::path Settings::resolveConfigPath(const std::string& cliOverride, bool& explicitPath) {
    explicitPath = true;
    if (!cliOverride.empty()) {
        return std::filesystem::path(cliOverride);
    }
    const char* env = std::getenv("STORK_CONFIG");
    if (env && *env) {
        return std::filesystem::path(env);
    }
    explicitPath = false;
    return AppPaths::configJsonPath();
}

bool Settings::loadFile(const std::filesystem::path& path, bool mustExist, std::string& errorMsg) {
    if (path.empty()) {
        if (mustExist) {
            errorMsg = "No config file path";
            return false;
        }
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (mustExist) {
            errorMsg = "Config file not found: " + path.string();
            return false;
        }
        LOG_DEBUG("[Settings] No config file at " << path.string() << ", using defaults");
        return true;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        errorMsg = "Cannot open config file " + path.string();
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    const json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        errorMsg = "Config file is not valid JSON: " + path.string();
        return false;
    }

    if (!applyJson(j, errorMsg)) {
        errorMsg = path.string() + ": " + errorMsg;
        return false;
    }
    return true;
}

bool Settings::applyJson(const json& j, std::string& errorMsg) {
    if (!j.is_object()) {
        errorMsg = "Config root must be an object";
        return false;
    }

    if (!readEndpoint(j, "mailbox", mailbox, errorMsg) ||
        !readEndpoint(j, "relay", relay, errorMsg) ||
        !readString(j, "download_dir", downloadDir, errorMsg) ||
        !readString(j, "trace_log", traceLogPath, errorMsg)) {
        return false;
    }

    if (j.contains("abilities")) {
        const json& a = j["abilities"];
        if (!a.is_object()) {
            errorMsg = "Setting 'abilities' must be an object";
            return false;
        }
        if (!readBool(a, "direct_tcp", abilities.directTcp, errorMsg) ||
            !readBool(a, "relay", abilities.relay, errorMsg)) {
            return false;
        }
        if (!abilities.any()) {
            errorMsg = "Setting 'abilities' disables every transport";
            return false;
        }
    }

    uint64_t words = codeWords;
    if (!readUnsigned(j, "code_words", MAX_CODE_WORDS, words, errorMsg)) {
        return false;
    }
    if (words == 0) {
        errorMsg = "Setting 'code_words' must be at least 1";
        return false;
    }
    codeWords = static_cast<unsigned>(words);

    if (j.contains("advertise_hosts")) {
        const json& hosts = j["advertise_hosts"];
        if (!hosts.is_array()) {
            errorMsg = "Setting 'advertise_hosts' must be an array of strings";
            return false;
        }
        std::vector<std::string> parsed;
        for (const auto& h : hosts) {
            if (!h.is_string()) {
                errorMsg = "Setting 'advertise_hosts' must be an array of strings";
                return false;
            }
            parsed.push_back(h.get<std::string>());
        }
        advertiseHosts = std::move(parsed);
    }

    if (j.contains("timeouts_ms")) {
        const json& t = j["timeouts_ms"];
        if (!t.is_object()) {
            errorMsg = "Setting 'timeouts_ms' must be an object";
            return false;
        }
        if (!readMs(t, "await_peer", timeouts.awaitPeer, errorMsg) ||
            !readMs(t, "join", timeouts.join, errorMsg) ||
            !readMs(t, "sender_negotiation", timeouts.senderNegotiation, errorMsg) ||
            !readMs(t, "receiver_negotiation", timeouts.receiverNegotiation, errorMsg) ||
            !readMs(t, "transfer_min", timeouts.transferMin, errorMsg) ||
            !readMs(t, "direct_connect", directConnectTimeoutMs, errorMsg) ||
            !readMs(t, "direct_window", directWindowMs, errorMsg) ||
            !readMs(t, "tls_handshake", handshakeTimeoutMs, errorMsg) ||
            !readMs(t, "relay_connect", relayConnectTimeoutMs, errorMsg) ||
            !readMs(t, "mailbox_connect", mailboxConnectTimeoutMs, errorMsg)) {
            return false;
        }
    }

    if (!readUnsigned(j, "min_throughput_bps", std::numeric_limits<uint64_t>::max(),
                      timeouts.minThroughputBytesPerSec, errorMsg)) {
        return false;
    }

    if (j.contains("history")) {
        const json& h = j["history"];
        if (!h.is_object()) {
            errorMsg = "Setting 'history' must be an object";
            return false;
        }
        if (!readBool(h, "enabled", historyEnabled, errorMsg) ||
            !readString(h, "path", historyPath, errorMsg)) {
            return false;
        }
    }

    return true;
}

bool Settings::applyEnvironment(std::string& errorMsg) {
    return endpointFromEnv("STORK_MAILBOX", mailbox, errorMsg) &&
           endpointFromEnv("STORK_RELAY", relay, errorMsg);
}

TransitOptions Settings::transitOptions() const {
    TransitOptions options;
    options.abilities = abilities;
    options.relayEndpoint = relay;
    options.advertiseHosts = advertiseHosts;
    options.directConnectTimeoutMs = directConnectTimeoutMs;
    options.directWindowMs = directWindowMs;
    options.handshakeTimeoutMs = handshakeTimeoutMs;
    options.relayConnectTimeoutMs = relayConnectTimeoutMs;
    return options;
}

SessionOptions Settings::sessionOptions(std::shared_ptr<MailboxConnector> connector,
                                        std::shared_ptr<TransferHistory> history) const {
    SessionOptions options;
    options.connector = std::move(connector);
    options.transit = transitOptions();
    options.timeouts = timeouts;
    options.codeWords = codeWords;
    options.history = std::move(history);
    return options;
}

std::filesystem::path Settings::effectiveHistoryPath() const {
    if (!historyPath.empty()) {
        return std::filesystem::path(historyPath);
    }
    return AppPaths::historyJsonPath();
}

std::filesystem::path Settings::effectiveTraceLogPath() const {
    if (!traceLogPath.empty()) {
        return std::filesystem::path(traceLogPath);
    }
    return AppPaths::sessionTraceLogPath();
}

}  // namespace Stork
