/**
 * @file TransferSession.h
 * @brief Per-role transfer session: rendezvous, negotiation, streaming
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "CancelToken.h"
#include "FileStreamer.h"
#include "IntroductionCode.h"
#include "Mailbox.h"
#include "ProgressSink.h"
#include "SessionError.h"
#include "SessionSupervisor.h"
#include "TransferHistory.h"
#include "TransitNegotiator.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace Stork {

//=============================================================================
// Session Type and Status Enums
//=============================================================================

/**
 * @brief Which side of the transfer this session is
 */
enum class SessionType : uint8_t {
    OUTGOING,  ///< Sender: allocates the code
    INCOMING   ///< Receiver: joins with a code
};

/**
 * @brief Status of a transfer session
 *
 * Sender: IDLE -> AWAITING_PEER -> NEGOTIATING -> TRANSFERRING -> terminal
 * Receiver: IDLE -> NEGOTIATING -> TRANSFERRING -> terminal
 * Every non-terminal status may go straight to FAILED or CANCELLED.
 */
enum class SessionStatus : uint8_t {
    IDLE,          ///< Session created, not started
    AWAITING_PEER, ///< Code handed out, waiting for the receiver
    NEGOTIATING,   ///< Key exchange done (both roles); offer and transit
    TRANSFERRING,  ///< File bytes on the wire
    COMPLETED,
    FAILED,
    CANCELLED
};

inline bool isTerminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::FAILED ||
           status == SessionStatus::CANCELLED;
}

std::string sessionStatusToString(SessionStatus status);

//=============================================================================
// Outcome and Options
//=============================================================================

/**
 * @brief Terminal result of a session, produced exactly once
 */
struct TransferOutcome {
    enum class Result : uint8_t {
        Completed,
        Failed,
        Cancelled
    };

    Result result = Result::Failed;
    std::string path;       ///< Saved file (receiver) or source file (sender) on Completed
    SessionError error;     ///< Set for Failed and Cancelled
    std::string transport;  ///< Transport used, if negotiation got that far
    uint64_t bytesMoved = 0;

    bool completed() const { return result == Result::Completed; }
};

/**
 * @brief Phase timeouts; the sender and receiver keep their own values
 */
struct SessionTimeouts {
    std::chrono::milliseconds awaitPeer{ AWAIT_PEER_TIMEOUT_MS };
    std::chrono::milliseconds join{ JOIN_TIMEOUT_MS };
    std::chrono::milliseconds senderNegotiation{ SENDER_NEGOTIATION_TIMEOUT_MS };
    std::chrono::milliseconds receiverNegotiation{ RECEIVER_NEGOTIATION_TIMEOUT_MS };
    std::chrono::milliseconds transferMin{ TRANSFER_TIMEOUT_MIN_MS };
    uint64_t minThroughputBytesPerSec = MIN_TRANSFER_THROUGHPUT_BPS;

    /// max(transferMin, size / minThroughput)
    std::chrono::milliseconds transferFor(uint64_t fileSize) const;
};

struct SessionOptions {
    std::shared_ptr<MailboxConnector> connector;
    TransitOptions transit;
    SessionTimeouts timeouts;
    unsigned codeWords = DEFAULT_CODE_WORDS;

    /// Optional; one record is appended per finished session
    std::shared_ptr<TransferHistory> history;
};

//=============================================================================
// Callback Types
//=============================================================================

using SessionStatusCallback = std::function<void(const std::string& sessionId, SessionStatus status)>;

using SessionCompletionCallback = std::function<void(const std::string& sessionId,
                                                     const TransferOutcome& outcome)>;

/**
 * @brief Receiver-side decision on an offer, after the built-in checks
 * @param reason Output: shown to the sender when returning false
 */
using OfferPolicy = std::function<bool(const TransferOffer& offer, std::string& reason)>;

//=============================================================================
// TransferSession Class
//=============================================================================

/**
 * @class TransferSession
 * @brief One file transfer between two peers that share an introduction code
 *
 * Sender:
 * @code
 * TransferSession session(options, supervisor);
 * IntroductionCode code;
 * SessionError error;
 * if (session.beginSend("/tmp/report.pdf", code, error)) {
 *     std::cout << code.toString() << std::endl;   // returned right away
 *     TransferOutcome outcome = session.outcome().get();
 * }
 * @endcode
 *
 * Receiver:
 * @code
 * std::string savedPath;
 * bool ok = session.beginReceive("7-guitar-orbit", "", savedPath, error);
 * @endcode
 *
 * beginSend() returns as soon as the code is allocated; the rest runs as a
 * task owned by the SessionSupervisor, which holds a shared reference to the
 * session state, so destroying this handle does not abort the transfer.
 * beginReceive() blocks through every phase in the calling thread.
 *
 * Each phase runs under its own PhaseGuard: the timeout for that phase or
 * cancel() unblocks it and decides the error. The outcome is published once
 * through outcome() (registered at construction) and the completion
 * callback, whichever path ends the session.
 *
 * Thread Safety:
 * - cancel(), getStatus(), outcome() are thread-safe
 * - setters must be called before beginSend()/beginReceive()
 * - each handle may start at most one session
 */
class TransferSession {
public:
    TransferSession(SessionOptions options, SessionSupervisor& supervisor);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /**
     * @brief Allocate a code for @p filePath and start the sender task
     * @param code Output: the code to hand to the receiver
     * @param error InvalidInput (file), RendezvousFailed (mailbox)
     * @return true once the code is allocated
     */
    bool beginSend(const std::string& filePath, IntroductionCode& code, SessionError& error);

    /**
     * @brief Join with @p codeText and receive into @p destinationDir
     * @param destinationDir Target directory; empty selects AppPaths::defaultDownloadDir()
     * @param savedPath Output: final path of the received file
     */
    bool beginReceive(const std::string& codeText,
                      const std::string& destinationDir,
                      std::string& savedPath,
                      SessionError& error);

    /// Cancel from any non-terminal status. Idempotent.
    void cancel();

    SessionStatus getStatus() const;
    SessionType getType() const;
    const std::string& getSessionId() const;

    /// Resolves once with the terminal outcome
    std::shared_future<TransferOutcome> outcome() const;

    void setProgressSink(std::shared_ptr<ProgressSink> sink);
    void setTransitObserver(std::shared_ptr<TransitObserver> observer);
    void setStatusCallback(SessionStatusCallback callback);
    void setCompletionCallback(SessionCompletionCallback callback);
    void setOfferPolicy(OfferPolicy policy);

    struct Core;

private:
    std::shared_ptr<Core> m_core;
    SessionSupervisor& m_supervisor;
};

}  // namespace Stork
