/**
 * @file AuthenticatedChannel.h
 * @brief Encrypted, authenticated message channel over a mailbox connection
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "CryptoUtils.h"
#include "Mailbox.h"
#include "SessionError.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace Stork {

/**
 * @class AuthenticatedChannel
 * @brief The product of a successful rendezvous
 *
 * Messages are JSON objects sealed with AES-256-GCM. Each (sender side,
 * phase) pair gets its own key derived from the session key, and the phase
 * name is bound as associated data, so a message cannot be replayed into
 * another phase or reflected back to its sender.
 *
 * Both peers hold an AuthenticatedChannel keyed identically. It is also the
 * root of every later secret (transit PSK, relay token) via deriveKey().
 *
 * Thread Safety:
 * - interrupt() may be called from any thread (sticky)
 * - Everything else belongs to the owning session thread
 */
class AuthenticatedChannel {
public:
    /**
     * @param connection Bound mailbox connection (ownership taken)
     * @param sessionKey Key agreed by KeyExchange
     * @param codeText Canonical code this channel was built from
     */
    AuthenticatedChannel(std::unique_ptr<MailboxConnection> connection,
                         const SymmetricKey& sessionKey,
                         std::string codeText);

    /// Zeroes the session key and releases the nameplate
    ~AuthenticatedChannel();

    AuthenticatedChannel(const AuthenticatedChannel&) = delete;
    AuthenticatedChannel& operator=(const AuthenticatedChannel&) = delete;

    /**
     * @brief Seal and send one message
     * @param phase Message phase, e.g. "offer"
     */
    bool sendMessage(const std::string& phase,
                     const nlohmann::json& payload,
                     SessionPhase sessionPhase,
                     SessionError& error);

    /**
     * @brief Receive the next message, which must be of @p phase
     *
     * Fails with MailboxClosed when the peer left, KeyExchangeFailed when a
     * message does not authenticate or arrives out of order.
     */
    bool receiveMessage(const std::string& phase,
                        nlohmann::json& payload,
                        SessionPhase sessionPhase,
                        SessionError& error);

    /**
     * @brief Derive an independent 32-byte secret for @p purpose
     *
     * Both peers obtain the same value for the same purpose.
     */
    bool deriveKey(const std::string& purpose, SymmetricKey& out, std::string& errorMsg) const;

    /// Unblock a pending receiveMessage() (sticky)
    void interrupt();

    /// Release the nameplate. Idempotent.
    void close();

    const std::string& side() const { return m_connection->side(); }
    const std::string& codeText() const { return m_codeText; }

private:
    bool phaseKey(const std::string& senderSide,
                  const std::string& phase,
                  SymmetricKey& out,
                  std::string& errorMsg) const;

    std::unique_ptr<MailboxConnection> m_connection;
    SymmetricKey m_sessionKey;
    std::string m_codeText;
};

}  // namespace Stork
