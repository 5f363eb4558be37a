/**
 * @file AuthenticatedChannel.cpp
 * @brief AuthenticatedChannel implementation
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/AuthenticatedChannel.h"
#include "stork/Debug.h"
#include "stork/HashUtils.h"

namespace Stork {

namespace {

constexpr const char* kPhaseKeyInfo = "Stork Phase Key v1:";
constexpr const char* kDerivedKeyInfo = "Stork Derived Key v1:";

SessionError mailboxFailure(MailboxStatus status,
                            SessionPhase phase,
                            const std::string& detail) {
    if (status == MailboxStatus::Unreachable) {
        return SessionError::make(ErrorCode::MailboxUnreachable, phase, detail);
    }
    if (status == MailboxStatus::ProtocolError) {
        return SessionError::make(ErrorCode::KeyExchangeFailed, phase, detail);
    }
    // Closed, Interrupted, NotFound, Full
    return SessionError::make(ErrorCode::MailboxClosed, phase, detail);
}

}  // namespace

AuthenticatedChannel::AuthenticatedChannel(std::unique_ptr<MailboxConnection> connection,
                                           const SymmetricKey& sessionKey,
                                           std::string codeText)
    : m_connection(std::move(connection))
    , m_sessionKey(sessionKey)
    , m_codeText(std::move(codeText))
{
}

AuthenticatedChannel::~AuthenticatedChannel() {
    close();
    CryptoUtils::secureZero(m_sessionKey.data(), m_sessionKey.size());
}

bool AuthenticatedChannel::phaseKey(const std::string& senderSide,
                                    const std::string& phase,
                                    SymmetricKey& out,
                                    std::string& errorMsg) const {
    const std::vector<uint8_t> ikm(m_sessionKey.begin(), m_sessionKey.end());
    return CryptoUtils::hkdfSha256(ikm, {}, std::string(kPhaseKeyInfo) + senderSide + ":" + phase,
                                   out, errorMsg);
}

bool AuthenticatedChannel::deriveKey(const std::string& purpose,
                                     SymmetricKey& out,
                                     std::string& errorMsg) const {
    const std::vector<uint8_t> ikm(m_sessionKey.begin(), m_sessionKey.end());
    return CryptoUtils::hkdfSha256(ikm, {}, std::string(kDerivedKeyInfo) + purpose, out, errorMsg);
}

bool AuthenticatedChannel::sendMessage(const std::string& phase,
                                       const nlohmann::json& payload,
                                       SessionPhase sessionPhase,
                                       SessionError& error) {
    std::string err;
    SymmetricKey key{};
    if (!phaseKey(m_connection->side(), phase, key, err)) {
        error = SessionError::make(ErrorCode::InternalError, sessionPhase, err);
        return false;
    }

    std::vector<uint8_t> sealed;
    const bool sealedOk = CryptoUtils::aeadSeal(key, payload.dump(), phase, sealed, err);
    CryptoUtils::secureZero(key.data(), key.size());
    if (!sealedOk) {
        error = SessionError::make(ErrorCode::InternalError, sessionPhase, err);
        return false;
    }

    const MailboxStatus status =
        m_connection->send(phase, HashUtils::toHex(sealed.data(), sealed.size()), err);
    if (status != MailboxStatus::Ok) {
        error = mailboxFailure(status, sessionPhase, "Failed to send '" + phase + "': " + err);
        return false;
    }
    return true;
}

bool AuthenticatedChannel::receiveMessage(const std::string& phase,
                                          nlohmann::json& payload,
                                          SessionPhase sessionPhase,
                                          SessionError& error) {
    std::string err;
    MailboxMessage message;
    const MailboxStatus status = m_connection->receive(message, err);
    if (status != MailboxStatus::Ok) {
        error = mailboxFailure(status, sessionPhase, "Waiting for '" + phase + "': " + err);
        return false;
    }

    if (message.phase != phase) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, sessionPhase,
                                   "Expected '" + phase + "' message, got '" + message.phase + "'");
        return false;
    }

    std::vector<uint8_t> sealed;
    if (!HashUtils::fromHex(message.body, sealed)) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, sessionPhase,
                                   "Malformed '" + phase + "' message");
        return false;
    }

    SymmetricKey key{};
    if (!phaseKey(message.side, phase, key, err)) {
        error = SessionError::make(ErrorCode::InternalError, sessionPhase, err);
        return false;
    }

    std::string plaintext;
    const bool opened = CryptoUtils::aeadOpen(key, sealed, phase, plaintext, err);
    CryptoUtils::secureZero(key.data(), key.size());
    if (!opened) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, sessionPhase,
                                   "'" + phase + "' message failed authentication: " + err);
        return false;
    }

    try {
        payload = nlohmann::json::parse(plaintext);
    } catch (const nlohmann::json::exception& e) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, sessionPhase,
                                   "'" + phase + "' message is not valid JSON: " + e.what());
        return false;
    }
    if (!payload.is_object()) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, sessionPhase,
                                   "'" + phase + "' message is not an object");
        return false;
    }

    LOG_DEBUG("[Channel] Received '" << phase << "'");
    return true;
}

void AuthenticatedChannel::interrupt() {
    m_connection->interrupt();
}

void AuthenticatedChannel::close() {
    if (m_connection) {
        m_connection->release();
    }
}

}  // namespace Stork
