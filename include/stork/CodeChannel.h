/**
 * @file CodeChannel.h
 * @brief Introduction-code rendezvous: allocate a code or join one
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "AuthenticatedChannel.h"
#include "IntroductionCode.h"
#include "KeyExchange.h"
#include "Mailbox.h"
#include "SessionError.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace Stork {

/**
 * @class PendingRendezvous
 * @brief Sender half of a rendezvous whose code was already handed out
 *
 * Owns the mailbox connection between allocate() and the moment the peer
 * joins. Our key-exchange message is already queued on the nameplate, so
 * wait() only has to collect the peer's half.
 */
class PendingRendezvous {
public:
    PendingRendezvous(std::unique_ptr<MailboxConnection> connection,
                      std::unique_ptr<KeyExchange> keyExchange,
                      std::string codeText);
    ~PendingRendezvous();

    PendingRendezvous(const PendingRendezvous&) = delete;
    PendingRendezvous& operator=(const PendingRendezvous&) = delete;

    /**
     * @brief Block until a peer joined and key confirmation succeeded
     *
     * Can only be called once; the connection moves into @p channel.
     */
    bool wait(std::unique_ptr<AuthenticatedChannel>& channel, SessionError& error);

    /// Unblock wait() from another thread (sticky)
    void interrupt();

    /// Give the nameplate back so the code can no longer be used
    void abandon();

private:
    std::unique_ptr<MailboxConnection> m_connection;
    std::unique_ptr<KeyExchange> m_keyExchange;
    std::string m_codeText;
    std::mutex m_mutex;
};

/**
 * @class CodeChannel
 * @brief Builds an AuthenticatedChannel from an introduction code
 *
 * One CodeChannel per session. interrupt() aborts whichever join() is
 * blocked in the mailbox.
 */
class CodeChannel {
public:
    /**
     * @param connector Mailbox service access
     * @param wordCount Words per generated code (1..MAX_CODE_WORDS)
     */
    CodeChannel(std::shared_ptr<MailboxConnector> connector, unsigned wordCount);

    CodeChannel(const CodeChannel&) = delete;
    CodeChannel& operator=(const CodeChannel&) = delete;

    /**
     * @brief Allocate a fresh code and start the rendezvous
     * @param code Output code to show to the user
     * @param pending Output handle that later yields the channel
     *
     * Returns as soon as the nameplate is allocated; it never waits for a
     * peer.
     */
    bool allocate(IntroductionCode& code,
                  std::unique_ptr<PendingRendezvous>& pending,
                  SessionError& error);

    /**
     * @brief Join the rendezvous named by @p codeText
     *
     * A malformed code fails with InvalidCode before the mailbox is
     * contacted.
     */
    bool join(const std::string& codeText,
              std::unique_ptr<AuthenticatedChannel>& channel,
              SessionError& error);

    /// Abort a blocked join() (sticky)
    void interrupt();

private:
    std::shared_ptr<MailboxConnector> m_connector;
    unsigned m_wordCount;

    std::mutex m_mutex;
    bool m_interrupted = false;
    MailboxConnection* m_activeConnection = nullptr;
};

/**
 * @brief Finish the key exchange on a bound connection
 *
 * Our SPAKE2 message must already be on the nameplate. Collects the peer's
 * message, derives the session key, then swaps and verifies confirm tags.
 */
bool completeKeyExchange(MailboxConnection& connection,
                         KeyExchange& keyExchange,
                         SessionPhase phase,
                         SymmetricKey& sessionKey,
                         SessionError& error);

}  // namespace Stork
