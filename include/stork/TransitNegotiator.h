/**
 * @file TransitNegotiator.h
 * @brief Agree on a byte-stream transport and secure it with the session key
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "AuthenticatedChannel.h"
#include "ProgressSink.h"
#include "SessionError.h"
#include "TcpSocket.h"
#include "TransportStream.h"
#include "config.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace Stork {

/**
 * @brief Transport capabilities one side is willing to use
 *
 * Fixed for the process lifetime (taken from Settings at startup).
 */
struct TransitAbilities {
    bool directTcp = true;
    bool relay = true;

    /// Wire names, strongest first
    std::vector<std::string> toNames() const;

    static TransitAbilities fromNames(const std::vector<std::string>& names);

    /// Abilities both sides share
    TransitAbilities intersect(const TransitAbilities& other) const {
        TransitAbilities common;
        common.directTcp = directTcp && other.directTcp;
        common.relay = relay && other.relay;
        return common;
    }

    bool any() const { return directTcp || relay; }
};

/**
 * @brief Which peer is negotiating
 *
 * The sender listens for direct connections and plays the TLS server; the
 * receiver dials and picks the winning stream.
 */
enum class TransitRole {
    Sender,
    Receiver
};

/**
 * @brief Negotiation parameters
 */
struct TransitOptions {
    TransitAbilities abilities;

    /// Relay we advertise (used only if abilities.relay)
    Endpoint relayEndpoint{ DEFAULT_RELAY_HOST, DEFAULT_RELAY_PORT };

    /// Address the sender's direct listener binds to
    std::string listenHost = "0.0.0.0";

    /// Addresses advertised as direct candidates; empty = every local IPv4
    std::vector<std::string> advertiseHosts;

    uint32_t directConnectTimeoutMs = DIRECT_CONNECT_TIMEOUT_MS;
    uint32_t directWindowMs = DIRECT_WINDOW_MS;
    uint32_t handshakeTimeoutMs = TLS_HANDSHAKE_TIMEOUT_MS;
    uint32_t relayConnectTimeoutMs = RELAY_CONNECT_TIMEOUT_MS;
    uint32_t relayPairWaitMs = RELAY_PAIR_WAIT_MS;
};

/**
 * @class TransitNegotiator
 * @brief One-shot transit negotiation for one session
 *
 * Protocol over the authenticated channel:
 * - Both sides send "transit" {abilities, hints}.
 * - Direct: the receiver dials every sender candidate concurrently; each
 *   connection runs a full TLS 1.3 PSK handshake. The first to finish gets
 *   the GO byte, the rest are closed. The sender keeps the stream on which
 *   GO arrives.
 * - Relay: if both sides advertise it and no direct stream won within the
 *   direct window, both connect to the relay with a token derived from the
 *   session key and run the same handshake through it.
 * - The receiver reports "transit-result" {ok, transport, attempted} so a
 *   failed negotiation fails on both ends with NoRouteAvailable.
 *
 * Only TLS streams are ever returned.
 *
 * Thread Safety: negotiate() is called once from the session thread;
 * interrupt() may be called from any thread and is sticky.
 */
class TransitNegotiator {
public:
    explicit TransitNegotiator(TransitOptions options, TransitObserver* observer = nullptr);
    ~TransitNegotiator();

    TransitNegotiator(const TransitNegotiator&) = delete;
    TransitNegotiator& operator=(const TransitNegotiator&) = delete;

    /**
     * @brief Negotiate and return a ready-to-use encrypted stream
     * @param channel Authenticated channel owned by the session
     * @param role Sender or receiver
     * @param stream Output stream
     * @param error Output error (phase Negotiating)
     */
    bool negotiate(AuthenticatedChannel& channel,
                   TransitRole role,
                   std::unique_ptr<TransportStream>& stream,
                   SessionError& error);

    /// Abort every attempt (sticky)
    void interrupt();

private:
    struct Hints {
        std::vector<Endpoint> direct;
        std::vector<Endpoint> relay;
    };

    bool negotiateAsSender(AuthenticatedChannel& channel,
                           const TransitAbilities& common,
                           const Hints& peerHints,
                           std::unique_ptr<TransportStream>& stream,
                           SessionError& error);
    bool negotiateAsReceiver(AuthenticatedChannel& channel,
                             const TransitAbilities& common,
                             const Hints& peerHints,
                             std::unique_ptr<TransportStream>& stream,
                             SessionError& error);

    void acceptLoop();
    void runCandidate(ScopedSocket socket, TlsRole role, std::string transport, std::string peer);
    void dialDirect(Endpoint endpoint);
    void dialRelay(Endpoint endpoint, TlsRole role, uint32_t delayMs);

    /// Register a socket so interrupt() can shut it down
    bool trackSocket(int socket);
    void untrackSocket(int socket);

    void recordAttempt(const std::string& attempt);

    /// Stop all attempts and join every worker thread
    void finish();

    TransitOptions m_options;
    TransitObserver* m_observer;

    SymmetricKey m_psk{};
    std::string m_relayToken;
    std::string m_relaySide;

    std::atomic<bool> m_aborted{ false };
    std::atomic<bool> m_stopAttempts{ false };
    std::atomic<bool> m_used{ false };

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_finished = false;
    bool m_claimed = false;
    size_t m_outstanding = 0;
    size_t m_directOutstanding = 0;
    std::set<int> m_liveSockets;
    std::vector<std::string> m_attempted;
    std::unique_ptr<TlsTransportStream> m_winner;

    ScopedSocket m_listenSocket;
    std::thread m_acceptThread;
    std::vector<std::thread> m_workers;
};

}  // namespace Stork
