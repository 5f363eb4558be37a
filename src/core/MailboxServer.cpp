/**
 * @file MailboxServer.cpp
 * @brief TCP rendezvous server implementation
 */

#include "stork/MailboxServer.h"
#include "stork/Debug.h"
#include "stork/ThreadSafeLog.h"
#include "stork/config.h"

#include <nlohmann/json.hpp>

#include <sys/socket.h>
#include <unistd.h>

namespace Stork {

namespace {

/**
 * @brief Per-client state shared by the reader and the message pump
 */
struct ClientConnection {
    int socket = INVALID_SOCKET_FD;
    std::mutex writeMutex;
    std::atomic<bool> stopPump{ false };

    bool writeJson(const nlohmann::json& j) {
        std::string err;
        std::lock_guard<std::mutex> lock(writeMutex);
        return sendLine(socket, j.dump(), err);
    }
};

nlohmann::json errorReply(MailboxStatus status, const std::string& message) {
    return nlohmann::json{
        { "type", "error" },
        { "status", mailboxStatusToString(status) },
        { "message", message }
    };
}

}  // namespace

//=============================================================================
// MailboxServer: Lifecycle
//=============================================================================

MailboxServer::MailboxServer(std::shared_ptr<MailboxHub> hub, std::string bindHost, uint16_t port)
    : m_hub(std::move(hub))
    , m_bindHost(std::move(bindHost))
    , m_requestedPort(port)
{
}

MailboxServer::~MailboxServer() {
    stop();
}

bool MailboxServer::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Mailbox server already running";
        return false;
    }

    if (!listenTcp(m_bindHost, m_requestedPort, m_listenSocket, m_boundPort, errorMsg)) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_listenerThread = std::thread(&MailboxServer::listenerThreadFunc, this);

    LOG_INFO("[Mailbox] Listening on " << m_bindHost << ":" << m_boundPort);
    ThreadSafeLog::log("Mailbox server listening on port " + std::to_string(m_boundPort));
    return true;
}

void MailboxServer::stop() {
    if (!m_running.load()) {
        return;
    }

    m_stopRequested.store(true);

    // Wakes accept() in the listener thread
    shutdownSocket(m_listenSocket.get());

    // Disconnect active clients so their handler threads exit
    {
        std::lock_guard<std::mutex> lock(m_activeClientsMutex);
        for (int s : m_activeClientSockets) {
            shutdownSocket(s);
        }
    }

    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    m_listenSocket.reset();

    // Wait for all detached client handler threads to exit
    {
        std::unique_lock<std::mutex> lock(m_activeClientsMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeClientThreadCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_running.store(false);
    ThreadSafeLog::log("Mailbox server stopped");
}

//=============================================================================
// MailboxServer: listenerThreadFunc()
//=============================================================================

void MailboxServer::listenerThreadFunc() {
    while (!m_stopRequested.load()) {
        const int clientSocket = ::accept(m_listenSocket.get(), nullptr, nullptr);
        if (clientSocket < 0) {
            if (m_stopRequested.load()) {
                break;
            }
            continue;
        }

        // Cap concurrent client handler threads before spawning
        if (m_activeClientThreadCount.load() >= MAX_CONCURRENT_CLIENT_THREADS) {
            ::close(clientSocket);
            continue;
        }

        tuneSocket(clientSocket);

        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            if (m_stopRequested.load()) {
                ::close(clientSocket);
                break;
            }
            m_activeClientSockets.insert(clientSocket);
            m_activeClientThreadCount.fetch_add(1, std::memory_order_acq_rel);
        }

        std::thread clientThread([this, clientSocket]() {
            try {
                handleClient(clientSocket);
            } catch (const std::exception& e) {
                LOG_ERROR("[Mailbox] Client handler failed: " << e.what());
                ThreadSafeLog::log(std::string("Mailbox client handler exception: ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(m_activeClientsMutex);
                m_activeClientSockets.erase(clientSocket);
                ::close(clientSocket);
                m_activeClientThreadCount.fetch_sub(1, std::memory_order_acq_rel);
            }
            m_activeClientsCv.notify_all();
        });
        clientThread.detach();
    }
}

//=============================================================================
// MailboxServer: handleClient()
//=============================================================================

void MailboxServer::handleClient(int clientSocket) {
    ClientConnection conn;
    conn.socket = clientSocket;

    LineReader reader(clientSocket);
    uint32_t nameplate = 0;
    std::string side;
    std::thread pump;

    auto startPump = [&]() {
        pump = std::thread([this, &conn, nameplate, side]() {
            while (true) {
                MailboxMessage message;
                const MailboxStatus status = m_hub->receive(nameplate, side, message, conn.stopPump);
                if (status == MailboxStatus::Ok) {
                    if (!conn.writeJson({ { "type", "message" },
                                          { "side", message.side },
                                          { "phase", message.phase },
                                          { "body", message.body } })) {
                        break;
                    }
                    continue;
                }
                if (status == MailboxStatus::Closed) {
                    conn.writeJson({ { "type", "closed" } });
                }
                break;
            }
        });
    };

    std::string line;
    std::string err;
    while (!m_stopRequested.load() && reader.readLine(line, err)) {
        nlohmann::json request;
        try {
            request = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            conn.writeJson(errorReply(MailboxStatus::ProtocolError, e.what()));
            break;
        }

        const std::string type = request.value("type", "");

        if (type == "allocate" || type == "claim") {
            if (nameplate != 0) {
                conn.writeJson(errorReply(MailboxStatus::ProtocolError, "already bound"));
                continue;
            }
            const std::string requestedSide = request.value("side", "");
            if (requestedSide.empty()) {
                conn.writeJson(errorReply(MailboxStatus::ProtocolError, "missing side"));
                continue;
            }

            uint32_t bound = 0;
            MailboxStatus status;
            if (type == "allocate") {
                status = m_hub->allocate(requestedSide, bound);
            } else {
                bound = request.value("nameplate", 0u);
                status = m_hub->claim(bound, requestedSide);
            }

            if (status != MailboxStatus::Ok) {
                conn.writeJson(errorReply(status, type + " failed"));
                continue;
            }

            nameplate = bound;
            side = requestedSide;
            conn.writeJson({ { "type", type == "allocate" ? "allocated" : "claimed" },
                             { "nameplate", nameplate } });
            LOG_DEBUG("[Mailbox] " << type << " nameplate " << nameplate);
            startPump();
            continue;
        }

        if (type == "add") {
            if (nameplate == 0) {
                conn.writeJson(errorReply(MailboxStatus::ProtocolError, "not bound"));
                continue;
            }
            const MailboxStatus status = m_hub->add(nameplate, side,
                                                    request.value("phase", ""),
                                                    request.value("body", ""));
            if (status != MailboxStatus::Ok) {
                conn.writeJson(errorReply(status, "add failed"));
            }
            continue;
        }

        if (type == "release") {
            if (nameplate != 0) {
                m_hub->release(nameplate, side);
                nameplate = 0;
            }
            conn.writeJson({ { "type", "released" } });
            break;
        }

        conn.writeJson(errorReply(MailboxStatus::ProtocolError, "unknown request type"));
    }

    // Disconnect without release still leaves the nameplate
    if (nameplate != 0) {
        m_hub->release(nameplate, side);
    }

    conn.stopPump.store(true);
    m_hub->wakeAll();
    if (pump.joinable()) {
        pump.join();
    }
}

}  // namespace Stork
