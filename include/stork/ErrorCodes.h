/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace Stork {
namespace ErrorCodes {

// Input validation (nothing touched the network)
inline constexpr const char* INVALID_CODE = "STK-INPUT-1000";
inline constexpr const char* FILE_NOT_FOUND = "STK-INPUT-1001";
inline constexpr const char* INVALID_DESTINATION = "STK-INPUT-1002";

// Rendezvous (mailbox, key exchange)
inline constexpr const char* MAILBOX_UNREACHABLE = "STK-REND-1100";
inline constexpr const char* PEER_NOT_FOUND = "STK-REND-1101";
inline constexpr const char* KEY_EXCHANGE_FAILED = "STK-REND-1102";
inline constexpr const char* MAILBOX_CLOSED = "STK-REND-1103";

// Transit negotiation
inline constexpr const char* NO_ROUTE_AVAILABLE = "STK-NEG-1200";
inline constexpr const char* OFFER_REJECTED = "STK-NEG-1201";

// Streaming
inline constexpr const char* STREAM_ERROR = "STK-XFER-1300";
inline constexpr const char* TRUNCATED_TRANSFER = "STK-XFER-1301";
inline constexpr const char* INTEGRITY_MISMATCH = "STK-XFER-1302";
inline constexpr const char* FILE_IO_ERROR = "STK-XFER-1303";

// Phase timeouts
inline constexpr const char* NO_PEER_JOINED = "STK-TIME-1400";
inline constexpr const char* JOIN_TIMED_OUT = "STK-TIME-1401";
inline constexpr const char* NEGOTIATION_TIMED_OUT = "STK-TIME-1402";
inline constexpr const char* TRANSFER_TIMED_OUT = "STK-TIME-1403";

// Cancellation and internal faults
inline constexpr const char* CANCELLED = "STK-CANCEL-1500";
inline constexpr const char* INVALID_STATE = "STK-INT-1600";
inline constexpr const char* INTERNAL_ERROR = "STK-INT-1601";

}  // namespace ErrorCodes
}  // namespace Stork
