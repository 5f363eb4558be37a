/**
 * @file TransitNegotiator.cpp
 * @brief Direct/relay transit negotiation
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/TransitNegotiator.h"
#include "stork/Debug.h"
#include "stork/HashUtils.h"
#include "stork/RelayServer.h"
#include "stork/ThreadSafeLog.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>

namespace Stork {

namespace {

constexpr const char* kPhaseTransit = "transit";
constexpr const char* kPhaseTransitResult = "transit-result";
constexpr const char* kTransitKeyPurpose = "transit-key";
constexpr const char* kRelayTokenPurpose = "transit-relay-token";

nlohmann::json endpointsToJson(const std::vector<Endpoint>& endpoints) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& ep : endpoints) {
        out.push_back({ { "host", ep.host }, { "port", ep.port } });
    }
    return out;
}

std::vector<Endpoint> endpointsFromJson(const nlohmann::json& hints, const char* key) {
    std::vector<Endpoint> out;
    if (!hints.is_object() || !hints.contains(key) || !hints[key].is_array()) {
        return out;
    }
    for (const auto& item : hints[key]) {
        if (!item.is_object() || !item.contains("host") || !item.contains("port") ||
            !item["host"].is_string() || !item["port"].is_number_unsigned()) {
            continue;
        }
        const auto port = item["port"].get<uint64_t>();
        if (port == 0 || port > 65535) {
            continue;
        }
        out.push_back(Endpoint{ item["host"].get<std::string>(), static_cast<uint16_t>(port) });
    }
    return out;
}

std::string joinNames(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "none";
    }
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

SessionError noRoute(const std::string& message, const std::vector<std::string>& attempted) {
    SessionError error = SessionError::make(ErrorCode::NoRouteAvailable, SessionPhase::Negotiating, message);
    error.attempted = attempted;
    return error;
}

}  // namespace

//=============================================================================
// TransitAbilities
//=============================================================================

std::vector<std::string> TransitAbilities::toNames() const {
    std::vector<std::string> names;
    if (directTcp) names.push_back(ABILITY_DIRECT_TCP);
    if (relay) names.push_back(ABILITY_RELAY);
    return names;
}

TransitAbilities TransitAbilities::fromNames(const std::vector<std::string>& names) {
    TransitAbilities abilities;
    abilities.directTcp = std::find(names.begin(), names.end(), ABILITY_DIRECT_TCP) != names.end();
    abilities.relay = std::find(names.begin(), names.end(), ABILITY_RELAY) != names.end();
    return abilities;
}

//=============================================================================
// TransitNegotiator: Lifecycle
//=============================================================================

TransitNegotiator::TransitNegotiator(TransitOptions options, TransitObserver* observer)
    : m_options(std::move(options))
    , m_observer(observer)
{
}

TransitNegotiator::~TransitNegotiator() {
    finish();
    CryptoUtils::secureZero(m_psk.data(), m_psk.size());
}

void TransitNegotiator::interrupt() {
    m_aborted.store(true);
    m_stopAttempts.store(true);

    std::lock_guard<std::mutex> lock(m_mutex);
    for (int s : m_liveSockets) {
        shutdownSocket(s);
    }
    if (m_listenSocket.valid()) {
        shutdownSocket(m_listenSocket.get());
    }
    m_cv.notify_all();
}

void TransitNegotiator::finish() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished = true;
        m_stopAttempts.store(true);
        for (int s : m_liveSockets) {
            shutdownSocket(s);
        }
        if (m_listenSocket.valid()) {
            shutdownSocket(m_listenSocket.get());
        }
        m_cv.notify_all();
    }

    if (m_acceptThread.joinable()) {
        m_acceptThread.join();
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        workers.swap(m_workers);
    }
    for (auto& t : workers) {
        if (t.joinable()) {
            t.join();
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_listenSocket.reset();
}

//=============================================================================
// TransitNegotiator: Bookkeeping
//=============================================================================

bool TransitNegotiator::trackSocket(int socket) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finished || m_aborted.load()) {
        return false;
    }
    m_liveSockets.insert(socket);
    return true;
}

void TransitNegotiator::untrackSocket(int socket) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_liveSockets.erase(socket);
}

void TransitNegotiator::recordAttempt(const std::string& attempt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_attempted.begin(), m_attempted.end(), attempt) == m_attempted.end()) {
        m_attempted.push_back(attempt);
    }
}

//=============================================================================
// TransitNegotiator: negotiate()
//=============================================================================

bool TransitNegotiator::negotiate(AuthenticatedChannel& channel,
                                  TransitRole role,
                                  std::unique_ptr<TransportStream>& stream,
                                  SessionError& error) {
    if (m_used.exchange(true)) {
        error = SessionError::make(ErrorCode::InvalidState, SessionPhase::Negotiating,
                                   "Transit negotiator already used");
        return false;
    }

    std::string err;
    SymmetricKey relayToken{};
    if (!channel.deriveKey(kTransitKeyPurpose, m_psk, err) ||
        !channel.deriveKey(kRelayTokenPurpose, relayToken, err)) {
        error = SessionError::make(ErrorCode::InternalError, SessionPhase::Negotiating, err);
        return false;
    }
    m_relayToken = HashUtils::toHex(relayToken);
    m_relaySide = channel.side();
    CryptoUtils::secureZero(relayToken.data(), relayToken.size());

    // Our hints
    TransitAbilities local = m_options.abilities;
    Hints ownHints;
    if (role == TransitRole::Sender && local.directTcp) {
        uint16_t port = 0;
        if (listenTcp(m_options.listenHost, 0, m_listenSocket, port, err)) {
            const std::vector<std::string> hosts = m_options.advertiseHosts.empty()
                                                       ? enumerateLocalAddresses()
                                                       : m_options.advertiseHosts;
            for (const auto& host : hosts) {
                ownHints.direct.push_back(Endpoint{ host, port });
            }
        } else {
            LOG_WARNING("[Transit] Direct listener unavailable: " << err);
            local.directTcp = false;
        }
    }
    if (local.relay) {
        ownHints.relay.push_back(m_options.relayEndpoint);
    }

    const nlohmann::json transit{
        { "abilities", local.toNames() },
        { "hints", { { ABILITY_DIRECT_TCP, endpointsToJson(ownHints.direct) },
                     { ABILITY_RELAY, endpointsToJson(ownHints.relay) } } }
    };
    if (!channel.sendMessage(kPhaseTransit, transit, SessionPhase::Negotiating, error)) {
        finish();
        return false;
    }

    nlohmann::json peerTransit;
    if (!channel.receiveMessage(kPhaseTransit, peerTransit, SessionPhase::Negotiating, error)) {
        finish();
        return false;
    }

    TransitAbilities peer;
    Hints peerHints;
    try {
        peer = TransitAbilities::fromNames(
            peerTransit.value("abilities", std::vector<std::string>()));
        const nlohmann::json hints = peerTransit.value("hints", nlohmann::json::object());
        peerHints.direct = endpointsFromJson(hints, ABILITY_DIRECT_TCP);
        peerHints.relay = endpointsFromJson(hints, ABILITY_RELAY);
    } catch (const nlohmann::json::exception& e) {
        finish();
        error = noRoute(std::string("Malformed transit message: ") + e.what(), {});
        return false;
    }

    const TransitAbilities common = local.intersect(peer);
    if (!common.any()) {
        finish();
        error = noRoute("No transport in common (local: " + joinNames(local.toNames())
                            + "; peer: " + joinNames(peer.toNames()) + ")",
                        {});
        return false;
    }

    LOG_DEBUG("[Transit] Common abilities: " << joinNames(common.toNames()));

    const bool ok = (role == TransitRole::Sender)
                        ? negotiateAsSender(channel, common, peerHints, stream, error)
                        : negotiateAsReceiver(channel, common, peerHints, stream, error);
    if (ok && m_observer) {
        m_observer->onTransitEstablished(stream->transport(), stream->peer());
    }
    if (ok) {
        LOG_INFO("[Transit] Established via " << stream->transport() << " (" << stream->peer() << ")");
        ThreadSafeLog::log("Transit established via " + stream->transport());
    }
    return ok;
}

//=============================================================================
// TransitNegotiator: Sender
//=============================================================================

bool TransitNegotiator::negotiateAsSender(AuthenticatedChannel& channel,
                                          const TransitAbilities& common,
                                          const Hints& peerHints,
                                          std::unique_ptr<TransportStream>& stream,
                                          SessionError& error) {
    if (common.directTcp && m_listenSocket.valid()) {
        m_acceptThread = std::thread(&TransitNegotiator::acceptLoop, this);
    }

    if (common.relay) {
        // Both ends use the sender's relay when it advertised one
        const Endpoint relay = m_options.relayEndpoint;
        const uint32_t delay = common.directTcp ? m_options.directWindowMs : 0;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_workers.emplace_back(&TransitNegotiator::dialRelay, this, relay, TlsRole::SERVER, delay);
    }

    nlohmann::json result;
    if (!channel.receiveMessage(kPhaseTransitResult, result, SessionPhase::Negotiating, error)) {
        finish();
        return false;
    }

    std::vector<std::string> attempted;
    bool peerOk = false;
    std::string peerTransport;
    try {
        peerOk = result.value("ok", false);
        peerTransport = result.value("transport", std::string());
        attempted = result.value("attempted", std::vector<std::string>());
    } catch (const nlohmann::json::exception& e) {
        finish();
        error = noRoute(std::string("Malformed transit result: ") + e.what(), {});
        return false;
    }

    if (!peerOk) {
        finish();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& a : m_attempted) {
                if (std::find(attempted.begin(), attempted.end(), a) == attempted.end()) {
                    attempted.push_back(a);
                }
            }
        }
        error = noRoute("Receiver could not reach us", attempted);
        return false;
    }

    std::unique_ptr<TlsTransportStream> winner;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, std::chrono::milliseconds(m_options.handshakeTimeoutMs), [this]() {
            return m_winner != nullptr || m_aborted.load();
        });
        winner = std::move(m_winner);
    }
    finish();

    if (!winner) {
        error = noRoute("Receiver selected " + peerTransport + " but the stream never reached us",
                        attempted);
        return false;
    }

    stream = std::move(winner);
    return true;
}

void TransitNegotiator::acceptLoop() {
    while (!m_stopAttempts.load()) {
        sockaddr_in addr{};
        socklen_t addrLen = sizeof(addr);
        const int fd = ::accept(m_listenSocket.get(), reinterpret_cast<sockaddr*>(&addr), &addrLen);
        if (fd < 0) {
            if (errno == EINTR && !m_stopAttempts.load()) {
                continue;
            }
            break;
        }

        ScopedSocket socket(fd);
        tuneSocket(fd);

        char host[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
        const std::string peer = std::string(host) + ":" + std::to_string(ntohs(addr.sin_port));

        if (m_observer) {
            m_observer->onTransitAttempt(ABILITY_DIRECT_TCP, peer);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_finished || m_winner) {
            break;
        }
        m_workers.emplace_back(&TransitNegotiator::runCandidate, this, std::move(socket),
                               TlsRole::SERVER, std::string(ABILITY_DIRECT_TCP), peer);
    }
}

//=============================================================================
// TransitNegotiator: Receiver
//=============================================================================

bool TransitNegotiator::negotiateAsReceiver(AuthenticatedChannel& channel,
                                            const TransitAbilities& common,
                                            const Hints& peerHints,
                                            std::unique_ptr<TransportStream>& stream,
                                            SessionError& error) {
    const std::vector<Endpoint> direct = common.directTcp ? peerHints.direct : std::vector<Endpoint>();

    // The sender's relay is preferred; ours is the fallback
    std::vector<Endpoint> relays;
    if (common.relay) {
        relays = peerHints.relay;
        if (relays.empty()) {
            relays.push_back(m_options.relayEndpoint);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_directOutstanding = direct.size();
        m_outstanding = direct.size() + (relays.empty() ? 0 : 1);

        for (const auto& ep : direct) {
            m_workers.emplace_back(&TransitNegotiator::dialDirect, this, ep);
        }
        if (!relays.empty()) {
            const uint32_t delay = direct.empty() ? 0 : m_options.directWindowMs;
            m_workers.emplace_back(&TransitNegotiator::dialRelay, this, relays.front(), TlsRole::CLIENT, delay);
        }
    }

    std::unique_ptr<TlsTransportStream> winner;
    std::vector<std::string> attempted;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() {
            return m_winner != nullptr || m_outstanding == 0 || m_aborted.load();
        });
        winner = std::move(m_winner);
    }
    finish();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        attempted = m_attempted;
    }

    if (m_aborted.load()) {
        error = noRoute("Negotiation interrupted", attempted);
        return false;
    }

    nlohmann::json result{
        { "ok", winner != nullptr },
        { "transport", winner ? winner->transport() : std::string() },
        { "attempted", attempted }
    };
    SessionError sendError;
    const bool reported = channel.sendMessage(kPhaseTransitResult, result, SessionPhase::Negotiating, sendError);

    if (!winner) {
        error = noRoute("No transport reached the sender", attempted);
        return false;
    }
    if (!reported) {
        error = sendError;
        return false;
    }

    stream = std::move(winner);
    return true;
}

void TransitNegotiator::dialDirect(Endpoint endpoint) {
    const std::string peer = endpoint.toString();
    recordAttempt(std::string(ABILITY_DIRECT_TCP) + " " + peer);
    if (m_observer) {
        m_observer->onTransitAttempt(ABILITY_DIRECT_TCP, peer);
    }

    std::string err;
    ScopedSocket socket;
    if (connectWithTimeout(endpoint, m_options.directConnectTimeoutMs, &m_stopAttempts, socket, err)) {
        runCandidate(std::move(socket), TlsRole::CLIENT, ABILITY_DIRECT_TCP, peer);
    } else {
        LOG_DEBUG("[Transit] Direct " << peer << " failed: " << err);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    --m_directOutstanding;
    --m_outstanding;
    m_cv.notify_all();
}

//=============================================================================
// TransitNegotiator: Relay
//=============================================================================

void TransitNegotiator::dialRelay(Endpoint endpoint, TlsRole role, uint32_t delayMs) {
    const bool isReceiver = (role == TlsRole::CLIENT);

    auto done = [this]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_outstanding > 0) {
            --m_outstanding;
        }
        m_cv.notify_all();
    };

    if (delayMs > 0) {
        std::unique_lock<std::mutex> lock(m_mutex);
        // The receiver knows when every direct dial has failed; start early then
        m_cv.wait_for(lock, std::chrono::milliseconds(delayMs), [&]() {
            return m_winner != nullptr || m_claimed || m_finished || m_aborted.load() ||
                   (isReceiver && m_directOutstanding == 0);
        });
        const bool skip = m_winner != nullptr || m_claimed || m_finished || m_aborted.load();
        lock.unlock();
        if (skip) {
            done();
            return;
        }
    }

    const std::string peer = endpoint.toString();
    recordAttempt(std::string(ABILITY_RELAY) + " " + peer);
    if (m_observer) {
        m_observer->onTransitAttempt(ABILITY_RELAY, peer);
    }

    std::string err;
    ScopedSocket socket;
    if (!connectWithTimeout(endpoint, m_options.relayConnectTimeoutMs, &m_stopAttempts, socket, err)) {
        LOG_DEBUG("[Transit] Relay " << peer << " unreachable: " << err);
        done();
        return;
    }

    if (!trackSocket(socket.get())) {
        done();
        return;
    }
    setSocketRecvTimeout(socket.get(), m_options.relayPairWaitMs);
    const bool paired = relayHandshake(socket.get(), m_relayToken, m_relaySide, err);
    untrackSocket(socket.get());

    if (!paired) {
        LOG_DEBUG("[Transit] Relay " << peer << " handshake failed: " << err);
        done();
        return;
    }

    runCandidate(std::move(socket), role, ABILITY_RELAY, peer);
    done();
}

//=============================================================================
// TransitNegotiator: runCandidate()
//=============================================================================

void TransitNegotiator::runCandidate(ScopedSocket socket,
                                     TlsRole role,
                                     std::string transport,
                                     std::string peer) {
    const int fd = socket.get();
    if (!trackSocket(fd)) {
        return;
    }

    setSocketRecvTimeout(fd, m_options.handshakeTimeoutMs);
    auto tls = std::make_unique<TlsSocket>(fd, role, m_psk);

    std::string err;
    bool ok = tls->handshake(err);

    if (ok && role == TlsRole::SERVER) {
        // Sender: the receiver decides; wait for its GO on this stream
        uint8_t marker = 0;
        ok = tls->recvExact(&marker, 1, err);
        if (ok && marker != TRANSIT_GO_MARKER) {
            err = "Unexpected transit marker";
            ok = false;
        }
        if (ok) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_winner && !m_finished && !m_aborted.load()) {
                setSocketRecvTimeout(fd, 0);
                m_liveSockets.erase(fd);
                m_winner = std::make_unique<TlsTransportStream>(std::move(socket), std::move(tls),
                                                                transport, peer);
                m_stopAttempts.store(true);
                m_cv.notify_all();
                return;
            }
            err = "Negotiation already settled";
            ok = false;
        }
    } else if (ok) {
        // Receiver: first completed handshake wins and gets GO
        bool mine = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            mine = !m_claimed && !m_winner && !m_finished && !m_aborted.load();
            if (mine) {
                m_claimed = true;
            }
        }

        if (mine) {
            const uint8_t marker = TRANSIT_GO_MARKER;
            ok = tls->sendExact(&marker, 1, err);

            std::lock_guard<std::mutex> lock(m_mutex);
            if (ok && !m_finished && !m_aborted.load()) {
                setSocketRecvTimeout(fd, 0);
                m_liveSockets.erase(fd);
                m_winner = std::make_unique<TlsTransportStream>(std::move(socket), std::move(tls),
                                                                transport, peer);
                m_stopAttempts.store(true);
                m_cv.notify_all();
                return;
            }
            m_claimed = false;
            m_cv.notify_all();
            ok = false;
        } else {
            err = "Another candidate won";
            ok = false;
        }
    }

    if (!ok) {
        LOG_DEBUG("[Transit] " << transport << " " << peer << " dropped: " << err);
    }

    // TLS state first, then forget the descriptor before it is closed
    tls.reset();
    untrackSocket(fd);
}

}  // namespace Stork
