/**
 * @file MailboxServer.h
 * @brief TCP rendezvous server exposing a MailboxHub as newline-delimited JSON
 *
 * Wire protocol (one JSON object per line):
 *
 * client -> server
 *   {"type":"allocate","side":S}
 *   {"type":"claim","nameplate":N,"side":S}
 *   {"type":"add","phase":P,"body":B}
 *   {"type":"release"}
 *
 * server -> client
 *   {"type":"allocated","nameplate":N}
 *   {"type":"claimed","nameplate":N}
 *   {"type":"error","status":"not-found"|"full"|...,"message":M}
 *   {"type":"message","side":S,"phase":P,"body":B}
 *   {"type":"closed"}
 *   {"type":"released"}
 *
 * Replies to allocate/claim are always written before any "message" line.
 */

#pragma once

#include "MailboxHub.h"
#include "TcpSocket.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace Stork {

/**
 * @class MailboxServer
 * @brief Listener thread plus one detached handler thread per client
 *
 * Thread Safety: start()/stop() from one controlling thread.
 */
class MailboxServer {
public:
    /**
     * @param hub Shared nameplate store
     * @param bindHost Address to listen on
     * @param port Port, or 0 for an ephemeral port
     */
    MailboxServer(std::shared_ptr<MailboxHub> hub, std::string bindHost, uint16_t port);
    ~MailboxServer();

    MailboxServer(const MailboxServer&) = delete;
    MailboxServer& operator=(const MailboxServer&) = delete;

    bool start(std::string& errorMsg);

    /**
     * @brief Stop accepting, disconnect every client and wait for handlers
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint16_t port() const { return m_boundPort; }

private:
    void listenerThreadFunc();
    void handleClient(int clientSocket);

    std::shared_ptr<MailboxHub> m_hub;
    std::string m_bindHost;
    uint16_t m_requestedPort;
    uint16_t m_boundPort = 0;

    ScopedSocket m_listenSocket;
    std::thread m_listenerThread;
    std::atomic<bool> m_running{ false };
    std::atomic<bool> m_stopRequested{ false };

    std::mutex m_activeClientsMutex;
    std::set<int> m_activeClientSockets;
    std::atomic<size_t> m_activeClientThreadCount{ 0 };
    std::condition_variable m_activeClientsCv;
};

}  // namespace Stork
