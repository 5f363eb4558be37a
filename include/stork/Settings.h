/**
 * @file Settings.h
 * @brief Runtime configuration: config.json, environment, command line
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "TcpSocket.h"
#include "TransferSession.h"
#include "TransitNegotiator.h"
#include "config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Stork {

/**
 * @class Settings
 * @brief Every operator-tunable value, starting from the config.h defaults
 *
 * Sources, later ones win:
 * 1. Built-in defaults (config.h)
 * 2. config.json (AppPaths::configJsonPath(), STORK_CONFIG, or --config)
 * 3. STORK_MAILBOX / STORK_RELAY environment variables ("host:port")
 * 4. Command line flags (applied by the caller)
 *
 * config.json layout (all keys optional, unknown keys ignored):
 * @code
 * {
 *   "mailbox": "127.0.0.1:4000",
 *   "relay": "127.0.0.1:4001",
 *   "abilities": { "direct_tcp": true, "relay": true },
 *   "code_words": 2,
 *   "advertise_hosts": ["192.168.1.20"],
 *   "download_dir": "/home/me/Downloads",
 *   "timeouts_ms": {
 *     "await_peer": 300000, "join": 120000,
 *     "sender_negotiation": 600000, "receiver_negotiation": 120000,
 *     "transfer_min": 600000, "direct_connect": 3000, "direct_window": 5000,
 *     "tls_handshake": 10000, "relay_connect": 10000, "mailbox_connect": 10000
 *   },
 *   "min_throughput_bps": 65536,
 *   "history": { "enabled": true, "path": "" },
 *   "trace_log": ""
 * }
 * @endcode
 * A key with the wrong type is an error naming the key.
 */
class Settings {
public:
    Endpoint mailbox{ DEFAULT_MAILBOX_HOST, DEFAULT_MAILBOX_PORT };
    Endpoint relay{ DEFAULT_RELAY_HOST, DEFAULT_RELAY_PORT };
    TransitAbilities abilities;
    unsigned codeWords = DEFAULT_CODE_WORDS;
    std::vector<std::string> advertiseHosts;
    std::string downloadDir;

    SessionTimeouts timeouts;
    uint32_t directConnectTimeoutMs = DIRECT_CONNECT_TIMEOUT_MS;
    uint32_t directWindowMs = DIRECT_WINDOW_MS;
    uint32_t handshakeTimeoutMs = TLS_HANDSHAKE_TIMEOUT_MS;
    uint32_t relayConnectTimeoutMs = RELAY_CONNECT_TIMEOUT_MS;
    uint32_t mailboxConnectTimeoutMs = MAILBOX_CONNECT_TIMEOUT_MS;

    bool historyEnabled = true;
    std::string historyPath;    ///< Empty: AppPaths::historyJsonPath()
    std::string traceLogPath;   ///< Empty: AppPaths::sessionTraceLogPath()

    /**
     * @brief Which config file to read
     * @param cliOverride Value of --config, may be empty
     * @param explicitPath Output: true if the path came from --config or STORK_CONFIG
     */
    static std::filesystem::path resolveConfigPath(const std::string& cliOverride, bool& explicitPath);

    /**
     * @brief Read and apply a config file
     * @param mustExist Fail if the file is missing (explicit paths only)
     */
    bool loadFile(const std::filesystem::path& path, bool mustExist, std::string& errorMsg);

    /**
     * @brief Apply a parsed config object
     */
    bool applyJson(const nlohmann::json& j, std::string& errorMsg);

    /**
     * @brief Apply STORK_MAILBOX and STORK_RELAY
     */
    bool applyEnvironment(std::string& errorMsg);

    /**
     * @brief Transit parameters for a TransitNegotiator
     */
    TransitOptions transitOptions() const;

    /**
     * @brief Session parameters; the connector is the caller's choice
     */
    SessionOptions sessionOptions(std::shared_ptr<MailboxConnector> connector,
                                  std::shared_ptr<TransferHistory> history) const;

    std::filesystem::path effectiveHistoryPath() const;
    std::filesystem::path effectiveTraceLogPath() const;
};

}  // namespace Stork
