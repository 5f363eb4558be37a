/**
 * @file CodeChannel.cpp
 * @brief CodeChannel and PendingRendezvous implementation
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/CodeChannel.h"
#include "stork/Debug.h"
#include "stork/HashUtils.h"
#include "stork/ThreadSafeLog.h"
#include "stork/config.h"

namespace Stork {

namespace {

constexpr const char* kPhasePake = "pake";
constexpr const char* kPhaseConfirm = "confirm";

SessionError fromMailboxStatus(MailboxStatus status,
                               SessionPhase phase,
                               const std::string& detail) {
    switch (status) {
        case MailboxStatus::NotFound:
        case MailboxStatus::Full:
            return SessionError::make(ErrorCode::PeerNotFound, phase, detail);
        case MailboxStatus::Unreachable:
            return SessionError::make(ErrorCode::MailboxUnreachable, phase, detail);
        case MailboxStatus::ProtocolError:
            return SessionError::make(ErrorCode::KeyExchangeFailed, phase, detail);
        default:
            return SessionError::make(ErrorCode::MailboxClosed, phase, detail);
    }
}

bool receivePhase(MailboxConnection& connection,
                  const char* phase,
                  SessionPhase sessionPhase,
                  std::string& body,
                  SessionError& error) {
    std::string err;
    MailboxMessage message;
    const MailboxStatus status = connection.receive(message, err);
    if (status != MailboxStatus::Ok) {
        error = fromMailboxStatus(status, sessionPhase, err);
        return false;
    }
    if (message.phase != phase) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, sessionPhase,
                                   std::string("Expected '") + phase + "' message, got '"
                                       + message.phase + "'");
        return false;
    }
    body = message.body;
    return true;
}

/**
 * @brief Bind the code and queue our SPAKE2 message on the nameplate
 */
bool startKeyExchange(MailboxConnection& connection,
                      KeyExchange& keyExchange,
                      const std::string& codeText,
                      SessionPhase phase,
                      SessionError& error) {
    std::string err;
    std::string messageHex;
    if (!keyExchange.begin(codeText, messageHex, err)) {
        error = SessionError::make(ErrorCode::InternalError, phase, err);
        return false;
    }
    const MailboxStatus status = connection.send(kPhasePake, messageHex, err);
    if (status != MailboxStatus::Ok) {
        error = fromMailboxStatus(status, phase, err);
        return false;
    }
    return true;
}

}  // namespace

//=============================================================================
// completeKeyExchange()
//=============================================================================

bool completeKeyExchange(MailboxConnection& connection,
                         KeyExchange& keyExchange,
                         SessionPhase phase,
                         SymmetricKey& sessionKey,
                         SessionError& error) {
    std::string peerMessageHex;
    if (!receivePhase(connection, kPhasePake, phase, peerMessageHex, error)) {
        return false;
    }

    std::string err;
    if (!keyExchange.finish(peerMessageHex, sessionKey, err)) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, phase, err);
        return false;
    }

    ConfirmTag ownTag{};
    if (!keyExchange.computeConfirmTag(sessionKey, ownTag, err)) {
        error = SessionError::make(ErrorCode::InternalError, phase, err);
        return false;
    }
    const MailboxStatus status = connection.send(kPhaseConfirm, HashUtils::toHex(ownTag), err);
    if (status != MailboxStatus::Ok) {
        error = fromMailboxStatus(status, phase, err);
        return false;
    }

    std::string peerTagHex;
    if (!receivePhase(connection, kPhaseConfirm, phase, peerTagHex, error)) {
        return false;
    }

    ConfirmTag peerTag{};
    if (!HashUtils::fromHex(peerTagHex, peerTag)) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, phase, "Malformed confirm tag");
        return false;
    }
    if (!keyExchange.verifyConfirmTag(sessionKey, peerTag, err)) {
        error = SessionError::make(ErrorCode::KeyExchangeFailed, phase, err);
        return false;
    }

    return true;
}

//=============================================================================
// PendingRendezvous
//=============================================================================

PendingRendezvous::PendingRendezvous(std::unique_ptr<MailboxConnection> connection,
                                     std::unique_ptr<KeyExchange> keyExchange,
                                     std::string codeText)
    : m_connection(std::move(connection))
    , m_keyExchange(std::move(keyExchange))
    , m_codeText(std::move(codeText))
{
}

PendingRendezvous::~PendingRendezvous() {
    abandon();
}

bool PendingRendezvous::wait(std::unique_ptr<AuthenticatedChannel>& channel, SessionError& error) {
    MailboxConnection* connection = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        connection = m_connection.get();
    }
    if (!connection || !m_keyExchange) {
        error = SessionError::make(ErrorCode::InvalidState, SessionPhase::AwaitingPeer,
                                   "Rendezvous already completed or abandoned");
        return false;
    }

    SymmetricKey sessionKey{};
    if (!completeKeyExchange(*connection, *m_keyExchange, SessionPhase::AwaitingPeer, sessionKey, error)) {
        return false;
    }

    std::unique_ptr<MailboxConnection> owned;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        owned = std::move(m_connection);
    }
    channel = std::make_unique<AuthenticatedChannel>(std::move(owned), sessionKey, m_codeText);
    CryptoUtils::secureZero(sessionKey.data(), sessionKey.size());
    m_keyExchange.reset();

    LOG_DEBUG("[Rendezvous] Peer joined and confirmed");
    return true;
}

void PendingRendezvous::interrupt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connection) {
        m_connection->interrupt();
    }
}

void PendingRendezvous::abandon() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connection) {
        m_connection->release();
        m_connection.reset();
    }
}

//=============================================================================
// CodeChannel
//=============================================================================

CodeChannel::CodeChannel(std::shared_ptr<MailboxConnector> connector, unsigned wordCount)
    : m_connector(std::move(connector))
    , m_wordCount(wordCount)
{
}

bool CodeChannel::allocate(IntroductionCode& code,
                           std::unique_ptr<PendingRendezvous>& pending,
                           SessionError& error) {
    std::string err;
    std::unique_ptr<MailboxConnection> connection;
    if (!m_connector->connect(connection, err)) {
        error = SessionError::make(ErrorCode::MailboxUnreachable, SessionPhase::Rendezvous, err);
        return false;
    }

    uint32_t nameplate = 0;
    const MailboxStatus status = connection->allocate(nameplate, err);
    if (status != MailboxStatus::Ok) {
        error = fromMailboxStatus(status, SessionPhase::Rendezvous, "Nameplate allocation failed: " + err);
        // A full nameplate table is a service problem, not an unknown code
        if (status == MailboxStatus::Full) {
            error = SessionError::make(ErrorCode::MailboxUnreachable, SessionPhase::Rendezvous, error.message);
        }
        return false;
    }

    IntroductionCode generated;
    if (!IntroductionCode::generate(nameplate, m_wordCount, generated, err)) {
        connection->release();
        error = SessionError::make(ErrorCode::InternalError, SessionPhase::Rendezvous, err);
        return false;
    }

    auto keyExchange = std::make_unique<KeyExchange>();
    if (!startKeyExchange(*connection, *keyExchange, generated.toString(), SessionPhase::Rendezvous, error)) {
        connection->release();
        return false;
    }

    LOG_INFO("[Rendezvous] Allocated nameplate " << nameplate << " via " << m_connector->describe());
    ThreadSafeLog::log("Allocated nameplate " + std::to_string(nameplate));

    code = generated;
    pending = std::make_unique<PendingRendezvous>(std::move(connection), std::move(keyExchange),
                                                  generated.toString());
    return true;
}

bool CodeChannel::join(const std::string& codeText,
                       std::unique_ptr<AuthenticatedChannel>& channel,
                       SessionError& error) {
    std::string err;
    IntroductionCode code;
    if (!IntroductionCode::parse(codeText, code, err)) {
        error = SessionError::make(ErrorCode::InvalidCode, SessionPhase::Setup, err);
        return false;
    }

    std::unique_ptr<MailboxConnection> connection;
    if (!m_connector->connect(connection, err)) {
        error = SessionError::make(ErrorCode::MailboxUnreachable, SessionPhase::Rendezvous, err);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_activeConnection = connection.get();
        if (m_interrupted) {
            connection->interrupt();
        }
    }

    bool ok = false;
    SymmetricKey sessionKey{};
    do {
        const MailboxStatus status = connection->claim(code.nameplate(), err);
        if (status != MailboxStatus::Ok) {
            error = fromMailboxStatus(status, SessionPhase::Rendezvous,
                                      "Nameplate " + std::to_string(code.nameplate()) + " is not open: " + err);
            break;
        }

        KeyExchange keyExchange;
        if (!startKeyExchange(*connection, keyExchange, code.toString(), SessionPhase::Rendezvous, error)) {
            break;
        }
        if (!completeKeyExchange(*connection, keyExchange, SessionPhase::Rendezvous, sessionKey, error)) {
            break;
        }
        ok = true;
    } while (false);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_activeConnection = nullptr;
    }

    if (!ok) {
        connection->release();
        CryptoUtils::secureZero(sessionKey.data(), sessionKey.size());
        return false;
    }

    channel = std::make_unique<AuthenticatedChannel>(std::move(connection), sessionKey, code.toString());
    CryptoUtils::secureZero(sessionKey.data(), sessionKey.size());

    LOG_INFO("[Rendezvous] Joined nameplate " << code.nameplate());
    ThreadSafeLog::log("Joined nameplate " + std::to_string(code.nameplate()));
    return true;
}

void CodeChannel::interrupt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_interrupted = true;
    if (m_activeConnection) {
        m_activeConnection->interrupt();
    }
}

}  // namespace Stork
