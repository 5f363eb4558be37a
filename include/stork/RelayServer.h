/**
 * @file RelayServer.h
 * @brief Transit relay: pairs two connections by token and pipes bytes
 *
 * Handshake (client -> server, one line):
 *   please relay <token-hex> for side <side-hex>\n
 * Once a second connection with the same token and a different side shows
 * up, both receive "ok\n" and every later byte is forwarded verbatim. The
 * relay never sees plaintext: the peers run TLS through it.
 */

#pragma once

#include "TcpSocket.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace Stork {

class RelayServer {
public:
    /**
     * @param bindHost Address to listen on
     * @param port Port, or 0 for an ephemeral port
     * @param pairWait How long an unpaired connection is kept
     */
    RelayServer(std::string bindHost, uint16_t port, std::chrono::milliseconds pairWait);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    bool start(std::string& errorMsg);
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint16_t port() const { return m_boundPort; }

    /// Number of pairs piped so far
    uint64_t pairedCount() const { return m_pairedCount.load(); }

private:
    struct Waiter {
        int socket = INVALID_SOCKET_FD;
        std::string side;
        std::vector<uint8_t> pending;  ///< Bytes read past the handshake line
        bool paired = false;
        bool done = false;
    };

    void listenerThreadFunc();
    void handleClient(int clientSocket);
    void pipe(int a, std::vector<uint8_t> aPending, int b, std::vector<uint8_t> bPending);

    std::string m_bindHost;
    uint16_t m_requestedPort;
    uint16_t m_boundPort = 0;
    std::chrono::milliseconds m_pairWait;

    ScopedSocket m_listenSocket;
    std::thread m_listenerThread;
    std::atomic<bool> m_running{ false };
    std::atomic<bool> m_stopRequested{ false };
    std::atomic<uint64_t> m_pairedCount{ 0 };

    std::mutex m_activeClientsMutex;
    std::set<int> m_activeClientSockets;
    std::atomic<size_t> m_activeClientThreadCount{ 0 };
    std::condition_variable m_activeClientsCv;

    std::mutex m_waitersMutex;
    std::condition_variable m_waitersCv;
    std::map<std::string, std::shared_ptr<Waiter>> m_waiters;
};

/**
 * @brief Build the relay handshake line (without the trailing newline)
 */
std::string relayHandshakeLine(const std::string& tokenHex, const std::string& sideHex);

/**
 * @brief Parse a relay handshake line
 * @return false if the line is not a well-formed handshake
 */
bool parseRelayHandshake(const std::string& line, std::string& tokenHex, std::string& sideHex);

/**
 * @brief Client half of the relay handshake on a connected socket
 *
 * Blocks until the relay paired us ("ok") or the connection is dropped.
 * Reads exactly the reply bytes so nothing of the piped stream is consumed.
 */
bool relayHandshake(int socket,
                    const std::string& tokenHex,
                    const std::string& sideHex,
                    std::string& errorMsg);

}  // namespace Stork
