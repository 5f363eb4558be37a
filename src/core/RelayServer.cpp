/**
 * @file RelayServer.cpp
 * @brief Transit relay server and client handshake
 */

#include "stork/RelayServer.h"
#include "stork/Debug.h"
#include "stork/ThreadSafeLog.h"
#include "stork/config.h"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace Stork {

namespace {

constexpr const char* kRelayOk = "ok\n";
constexpr size_t kRelayOkSize = 3;
constexpr size_t kMaxTokenHexLength = 128;

bool isLowerHex(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

}  // namespace

//=============================================================================
// Handshake helpers
//=============================================================================

std::string relayHandshakeLine(const std::string& tokenHex, const std::string& sideHex) {
    return "please relay " + tokenHex + " for side " + sideHex;
}

bool parseRelayHandshake(const std::string& line, std::string& tokenHex, std::string& sideHex) {
    std::istringstream in(line);
    std::string please, relay, token, forWord, sideWord, side, extra;
    if (!(in >> please >> relay >> token >> forWord >> sideWord >> side) || (in >> extra)) {
        return false;
    }
    if (please != "please" || relay != "relay" || forWord != "for" || sideWord != "side") {
        return false;
    }
    if (!isLowerHex(token) || !isLowerHex(side) || token.size() > kMaxTokenHexLength ||
        side.size() > kMaxTokenHexLength) {
        return false;
    }
    tokenHex = token;
    sideHex = side;
    return true;
}

bool relayHandshake(int socket,
                    const std::string& tokenHex,
                    const std::string& sideHex,
                    std::string& errorMsg) {
    if (!sendLine(socket, relayHandshakeLine(tokenHex, sideHex), errorMsg)) {
        return false;
    }

    uint8_t reply[kRelayOkSize] = {};
    if (!recvExact(socket, reply, sizeof(reply), errorMsg)) {
        errorMsg = "Relay did not pair us: " + errorMsg;
        return false;
    }
    if (std::memcmp(reply, kRelayOk, kRelayOkSize) != 0) {
        errorMsg = "Relay sent an unexpected reply";
        return false;
    }
    return true;
}

//=============================================================================
// RelayServer: Lifecycle
//=============================================================================

RelayServer::RelayServer(std::string bindHost, uint16_t port, std::chrono::milliseconds pairWait)
    : m_bindHost(std::move(bindHost))
    , m_requestedPort(port)
    , m_pairWait(pairWait)
{
}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Relay server already running";
        return false;
    }

    if (!listenTcp(m_bindHost, m_requestedPort, m_listenSocket, m_boundPort, errorMsg)) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_listenerThread = std::thread(&RelayServer::listenerThreadFunc, this);

    LOG_INFO("[Relay] Listening on " << m_bindHost << ":" << m_boundPort);
    ThreadSafeLog::log("Relay server listening on port " + std::to_string(m_boundPort));
    return true;
}

void RelayServer::stop() {
    if (!m_running.load()) {
        return;
    }

    m_stopRequested.store(true);
    shutdownSocket(m_listenSocket.get());

    {
        std::lock_guard<std::mutex> lock(m_activeClientsMutex);
        for (int s : m_activeClientSockets) {
            shutdownSocket(s);
        }
    }
    {
        std::lock_guard<std::mutex> lock(m_waitersMutex);
        m_waitersCv.notify_all();
    }

    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    m_listenSocket.reset();

    {
        std::unique_lock<std::mutex> lock(m_activeClientsMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeClientThreadCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_running.store(false);
    ThreadSafeLog::log("Relay server stopped");
}

//=============================================================================
// RelayServer: listenerThreadFunc()
//=============================================================================

void RelayServer::listenerThreadFunc() {
    while (!m_stopRequested.load()) {
        const int clientSocket = ::accept(m_listenSocket.get(), nullptr, nullptr);
        if (clientSocket < 0) {
            if (m_stopRequested.load()) {
                break;
            }
            continue;
        }

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
                LOG_ERROR("[Relay] Client handler failed: " << e.what());
                ThreadSafeLog::log(std::string("Relay client handler exception: ") + e.what());
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
// RelayServer: handleClient()
//=============================================================================

void RelayServer::handleClient(int clientSocket) {
    // Bound how long a silent client may hold a handler thread
    setSocketRecvTimeout(clientSocket, static_cast<uint32_t>(m_pairWait.count()));

    LineReader reader(clientSocket);
    std::string line;
    std::string err;
    if (!reader.readLine(line, err)) {
        LOG_DEBUG("[Relay] No handshake: " << err);
        return;
    }

    std::string token;
    std::string side;
    if (!parseRelayHandshake(line, token, side)) {
        LOG_WARNING("[Relay] Malformed handshake dropped");
        return;
    }
    setSocketRecvTimeout(clientSocket, 0);

    std::shared_ptr<Waiter> partner;
    std::shared_ptr<Waiter> self;
    {
        std::lock_guard<std::mutex> lock(m_waitersMutex);
        auto it = m_waiters.find(token);
        if (it != m_waiters.end() && it->second->side != side) {
            partner = it->second;
            partner->paired = true;
            m_waiters.erase(it);
        } else if (it != m_waiters.end()) {
            LOG_WARNING("[Relay] Duplicate side for one token; dropping the newcomer");
            return;
        } else {
            self = std::make_shared<Waiter>();
            self->socket = clientSocket;
            self->side = side;
            self->pending = reader.takeBuffered();
            m_waiters[token] = self;
        }
    }

    if (self) {
        // First arrival: wait for the partner, who then pipes for both of us
        std::unique_lock<std::mutex> lock(m_waitersMutex);
        const bool paired = m_waitersCv.wait_for(lock, m_pairWait, [&]() {
            return self->paired || m_stopRequested.load();
        });
        if (!paired || !self->paired) {
            auto it = m_waiters.find(token);
            if (it != m_waiters.end() && it->second == self) {
                m_waiters.erase(it);
            }
            LOG_DEBUG("[Relay] Unpaired connection timed out");
            return;
        }
        m_waitersCv.wait(lock, [&]() { return self->done; });
        return;
    }

    std::string sendErr;
    const bool okA = sendExact(partner->socket, reinterpret_cast<const uint8_t*>(kRelayOk),
                               kRelayOkSize, sendErr);
    const bool okB = sendExact(clientSocket, reinterpret_cast<const uint8_t*>(kRelayOk),
                               kRelayOkSize, sendErr);

    {
        // Wake the waiting handler so it can block on "done"
        std::lock_guard<std::mutex> lock(m_waitersMutex);
        m_waitersCv.notify_all();
    }

    if (okA && okB) {
        m_pairedCount.fetch_add(1);
        LOG_INFO("[Relay] Paired two sides");
        pipe(partner->socket, std::move(partner->pending), clientSocket, reader.takeBuffered());
    }

    {
        std::lock_guard<std::mutex> lock(m_waitersMutex);
        partner->done = true;
    }
    m_waitersCv.notify_all();
}

//=============================================================================
// RelayServer: pipe()
//=============================================================================

void RelayServer::pipe(int a, std::vector<uint8_t> aPending, int b, std::vector<uint8_t> bPending) {
    std::string err;
    if ((!aPending.empty() && !sendExact(b, aPending.data(), aPending.size(), err)) ||
        (!bPending.empty() && !sendExact(a, bPending.data(), bPending.size(), err))) {
        return;
    }

    std::vector<uint8_t> buffer(CHUNK_SIZE);
    bool aOpen = true;   // a -> b still flowing
    bool bOpen = true;   // b -> a still flowing

    while ((aOpen || bOpen) && !m_stopRequested.load()) {
        pollfd fds[2] = {};
        fds[0].fd = aOpen ? a : -1;
        fds[0].events = POLLIN;
        fds[1].fd = bOpen ? b : -1;
        fds[1].events = POLLIN;

        const int ready = ::poll(fds, 2, static_cast<int>(POLL_SLICE_MS));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const int from = (i == 0) ? a : b;
            const int to = (i == 0) ? b : a;

            const ssize_t n = ::recv(from, buffer.data(), buffer.size(), 0);
            if (n <= 0) {
                // Propagate the half-close so the other side sees EOF
                ::shutdown(to, SHUT_WR);
                (i == 0 ? aOpen : bOpen) = false;
                continue;
            }
            if (!sendExact(to, buffer.data(), static_cast<size_t>(n), err)) {
                return;
            }
        }
    }
}

}  // namespace Stork
