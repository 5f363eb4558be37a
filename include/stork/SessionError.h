/**
 * @file SessionError.h
 * @brief Error taxonomy reported by every Stork session
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Stork {

/**
 * @brief Coarse error category. Drives CLI exit status and retry decisions.
 */
enum class ErrorKind : uint8_t {
    None,
    InvalidInput,       ///< Rejected before any network call
    RendezvousFailed,   ///< Mailbox unreachable, code unknown, key mismatch
    NegotiationFailed,  ///< No viable transport, offer refused
    TransferFailed,     ///< Stream error, truncation, I/O failure
    TimedOut,           ///< A phase exceeded its own timeout
    Cancelled,          ///< Caller cancelled; never shown as an error
    Internal            ///< Bug or unexpected exception
};

/**
 * @brief Fine-grained error code
 */
enum class ErrorCode : uint8_t {
    None,
    InvalidCode,
    FileNotFound,
    InvalidDestination,
    MailboxUnreachable,
    PeerNotFound,
    KeyExchangeFailed,
    MailboxClosed,
    NoRouteAvailable,
    OfferRejected,
    StreamError,
    TruncatedTransfer,
    IntegrityMismatch,
    FileIoError,
    NoPeerJoined,
    JoinTimedOut,
    NegotiationTimedOut,
    TransferTimedOut,
    Cancelled,
    InvalidState,
    InternalError
};

/**
 * @brief Session phase an error occurred in
 */
enum class SessionPhase : uint8_t {
    Setup,          ///< Argument validation, before the network
    Rendezvous,     ///< Allocate/join and key exchange
    AwaitingPeer,   ///< Sender waiting for the receiver to join
    Negotiating,    ///< Offer/answer and transit negotiation
    Transferring    ///< File bytes on the wire
};

/**
 * @brief Error value carried out of every fallible session operation
 *
 * Every lower-level failure is wrapped with the phase it happened in before
 * it reaches the caller. TransferFailed errors carry bytes moved vs expected;
 * NegotiationFailed errors carry the transports that were attempted.
 */
struct SessionError {
    ErrorKind kind = ErrorKind::None;
    ErrorCode code = ErrorCode::None;
    SessionPhase phase = SessionPhase::Setup;
    std::string message;

    uint64_t bytesMoved = 0;
    uint64_t bytesExpected = 0;
    std::vector<std::string> attempted;

    /**
     * @brief Build an error; the kind is derived from the code
     */
    static SessionError make(ErrorCode code, SessionPhase phase, const std::string& message);

    bool isSet() const { return code != ErrorCode::None; }

    /**
     * @brief Stable identifier from ErrorCodes.h (e.g. "STK-REND-1101")
     */
    const char* stableId() const;

    /**
     * @brief One-line description for users and logs
     *
     * Format: "[STK-XFER-1301] Transferring: <message> (moved 10 of 20 bytes)"
     */
    std::string describe() const;
};

/**
 * @brief Map an error code to its category
 */
ErrorKind errorKindFor(ErrorCode code);

std::string errorKindToString(ErrorKind kind);
std::string errorCodeToString(ErrorCode code);
std::string sessionPhaseToString(SessionPhase phase);

}  // namespace Stork
