/**
 * @file SessionError.cpp
 * @brief Error taxonomy helpers
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/SessionError.h"
#include "stork/ErrorCodes.h"

#include <sstream>

namespace Stork {

ErrorKind errorKindFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorKind::None;
        case ErrorCode::InvalidCode:
        case ErrorCode::FileNotFound:
        case ErrorCode::InvalidDestination:
            return ErrorKind::InvalidInput;
        case ErrorCode::MailboxUnreachable:
        case ErrorCode::PeerNotFound:
        case ErrorCode::KeyExchangeFailed:
        case ErrorCode::MailboxClosed:
            return ErrorKind::RendezvousFailed;
        case ErrorCode::NoRouteAvailable:
        case ErrorCode::OfferRejected:
            return ErrorKind::NegotiationFailed;
        case ErrorCode::StreamError:
        case ErrorCode::TruncatedTransfer:
        case ErrorCode::IntegrityMismatch:
        case ErrorCode::FileIoError:
            return ErrorKind::TransferFailed;
        case ErrorCode::NoPeerJoined:
        case ErrorCode::JoinTimedOut:
        case ErrorCode::NegotiationTimedOut:
        case ErrorCode::TransferTimedOut:
            return ErrorKind::TimedOut;
        case ErrorCode::Cancelled:
            return ErrorKind::Cancelled;
        case ErrorCode::InvalidState:
        case ErrorCode::InternalError:
            return ErrorKind::Internal;
    }
    return ErrorKind::Internal;
}

SessionError SessionError::make(ErrorCode code, SessionPhase phase, const std::string& message) {
    SessionError error;
    error.kind = errorKindFor(code);
    error.code = code;
    error.phase = phase;
    error.message = message;
    return error;
}

const char* SessionError::stableId() const {
    switch (code) {
        case ErrorCode::InvalidCode:         return ErrorCodes::INVALID_CODE;
        case ErrorCode::FileNotFound:        return ErrorCodes::FILE_NOT_FOUND;
        case ErrorCode::InvalidDestination:  return ErrorCodes::INVALID_DESTINATION;
        case ErrorCode::MailboxUnreachable:  return ErrorCodes::MAILBOX_UNREACHABLE;
        case ErrorCode::PeerNotFound:        return ErrorCodes::PEER_NOT_FOUND;
        case ErrorCode::KeyExchangeFailed:   return ErrorCodes::KEY_EXCHANGE_FAILED;
        case ErrorCode::MailboxClosed:       return ErrorCodes::MAILBOX_CLOSED;
        case ErrorCode::NoRouteAvailable:    return ErrorCodes::NO_ROUTE_AVAILABLE;
        case ErrorCode::OfferRejected:       return ErrorCodes::OFFER_REJECTED;
        case ErrorCode::StreamError:         return ErrorCodes::STREAM_ERROR;
        case ErrorCode::TruncatedTransfer:   return ErrorCodes::TRUNCATED_TRANSFER;
        case ErrorCode::IntegrityMismatch:   return ErrorCodes::INTEGRITY_MISMATCH;
        case ErrorCode::FileIoError:         return ErrorCodes::FILE_IO_ERROR;
        case ErrorCode::NoPeerJoined:        return ErrorCodes::NO_PEER_JOINED;
        case ErrorCode::JoinTimedOut:        return ErrorCodes::JOIN_TIMED_OUT;
        case ErrorCode::NegotiationTimedOut: return ErrorCodes::NEGOTIATION_TIMED_OUT;
        case ErrorCode::TransferTimedOut:    return ErrorCodes::TRANSFER_TIMED_OUT;
        case ErrorCode::Cancelled:           return ErrorCodes::CANCELLED;
        case ErrorCode::InvalidState:        return ErrorCodes::INVALID_STATE;
        case ErrorCode::InternalError:       return ErrorCodes::INTERNAL_ERROR;
        case ErrorCode::None:                break;
    }
    return "";
}

std::string SessionError::describe() const {
    std::ostringstream oss;
    const char* id = stableId();
    if (id[0] != '\0') {
        oss << "[" << id << "] ";
    }
    oss << sessionPhaseToString(phase) << ": " << message;

    if (kind == ErrorKind::TransferFailed && bytesExpected > 0) {
        oss << " (moved " << bytesMoved << " of " << bytesExpected << " bytes)";
    }

    if (kind == ErrorKind::NegotiationFailed && code == ErrorCode::NoRouteAvailable) {
        oss << " (attempted: ";
        if (attempted.empty()) {
            oss << "none";
        }
        for (size_t i = 0; i < attempted.size(); ++i) {
            if (i > 0) {
                oss << ", ";
            }
            oss << attempted[i];
        }
        oss << ")";
    }

    return oss.str();
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::InvalidInput:      return "InvalidInput";
        case ErrorKind::RendezvousFailed:  return "RendezvousFailed";
        case ErrorKind::NegotiationFailed: return "NegotiationFailed";
        case ErrorKind::TransferFailed:    return "TransferFailed";
        case ErrorKind::TimedOut:          return "TimedOut";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::Internal:          return "Internal";
        default:                           return "Unknown";
    }
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "None";
        case ErrorCode::InvalidCode:         return "InvalidCode";
        case ErrorCode::FileNotFound:        return "FileNotFound";
        case ErrorCode::InvalidDestination:  return "InvalidDestination";
        case ErrorCode::MailboxUnreachable:  return "MailboxUnreachable";
        case ErrorCode::PeerNotFound:        return "PeerNotFound";
        case ErrorCode::KeyExchangeFailed:   return "KeyExchangeFailed";
        case ErrorCode::MailboxClosed:       return "MailboxClosed";
        case ErrorCode::NoRouteAvailable:    return "NoRouteAvailable";
        case ErrorCode::OfferRejected:       return "OfferRejected";
        case ErrorCode::StreamError:         return "StreamError";
        case ErrorCode::TruncatedTransfer:   return "TruncatedTransfer";
        case ErrorCode::IntegrityMismatch:   return "IntegrityMismatch";
        case ErrorCode::FileIoError:         return "FileIoError";
        case ErrorCode::NoPeerJoined:        return "NoPeerJoined";
        case ErrorCode::JoinTimedOut:        return "JoinTimedOut";
        case ErrorCode::NegotiationTimedOut: return "NegotiationTimedOut";
        case ErrorCode::TransferTimedOut:    return "TransferTimedOut";
        case ErrorCode::Cancelled:           return "Cancelled";
        case ErrorCode::InvalidState:        return "InvalidState";
        case ErrorCode::InternalError:       return "InternalError";
        default:                             return "Unknown";
    }
}

std::string sessionPhaseToString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Setup:        return "Setup";
        case SessionPhase::Rendezvous:   return "Rendezvous";
        case SessionPhase::AwaitingPeer: return "AwaitingPeer";
        case SessionPhase::Negotiating:  return "Negotiating";
        case SessionPhase::Transferring: return "Transferring";
        default:                         return "Unknown";
    }
}

}  // namespace Stork
