/**
 * @file config.h
 * @brief Configuration constants for Stork
 *
 * This file contains the compile-time configuration constants used throughout
 * Stork: streaming chunk sizes, protocol identifiers, default endpoints,
 * per-phase timeout defaults and TLS configuration.
 *
 * Runtime overrides for the values that operators are expected to tune
 * (endpoints, timeouts, abilities) live in Settings; the constants here are
 * the defaults Settings starts from.
 *
 * @note Changes to the protocol constants affect wire compatibility.
 *       Ensure both peers use compatible builds.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace Stork
 * @brief Stork namespace containing all public APIs
 */
namespace Stork {

//=========================================================================
// File Streaming
//=========================================================================

/** @defgroup Streaming File Streaming Configuration
 * @brief Chunking and integrity constants used by FileStreamer
 * @{
 */

/**
 * @brief Fixed chunk size for file streaming.
 *
 * Every progress event corresponds to exactly one chunk, so this also bounds
 * how often a ProgressSink can be called. Not negotiated between peers.
 */
constexpr size_t CHUNK_SIZE = 64 * 1024;

/**
 * @brief SHA-256 digest size in bytes.
 */
constexpr size_t HASH_SIZE = 32;

/**
 * @brief Verdict bytes written by the receiver after the trailing digest.
 */
constexpr uint8_t VERDICT_OK = 0x01;
constexpr uint8_t VERDICT_DIGEST_MISMATCH = 0x02;
constexpr uint8_t VERDICT_STORAGE_FAILED = 0x03;

/**
 * @brief Maximum accepted file name length (bytes) in a transfer offer.
 */
constexpr size_t MAX_FILENAME_LENGTH = 255;

/**
 * @brief Minimum free space kept on the destination volume beyond the file.
 */
constexpr uint64_t DISK_SPACE_RESERVE_BYTES = 1024 * 1024;

/** @} */ // end of Streaming

//=========================================================================
// Introduction Codes
//=========================================================================

/** @defgroup Codes Introduction Code Configuration
 * @{
 */

/**
 * @brief Default number of words in the secret suffix of a code.
 *
 * Each word carries one byte of entropy (256-word list).
 */
constexpr unsigned DEFAULT_CODE_WORDS = 2;

/**
 * @brief Upper bound accepted for the configured word count.
 */
constexpr unsigned MAX_CODE_WORDS = 8;

/**
 * @brief Highest nameplate accepted when parsing a code.
 */
constexpr uint32_t MAX_NAMEPLATE = 999999;

/** @} */ // end of Codes

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Phase timeouts and network timeouts (in milliseconds)
 *
 * Each phase of a TransferSession is guarded by its own timeout. The sender
 * and the receiver keep separate values for the negotiation phase so that
 * deployments can tune them independently.
 * @{
 */

/**
 * @brief Sender: how long an allocated code waits for a receiver to join.
 */
constexpr uint32_t AWAIT_PEER_TIMEOUT_MS = 300000;

/**
 * @brief Receiver: bound on joining the rendezvous and finishing key exchange.
 */
constexpr uint32_t JOIN_TIMEOUT_MS = 120000;

/**
 * @brief Sender: bound on the offer/answer exchange plus transit negotiation.
 *
 * Includes the time the receiving user may take to look at the offer.
 */
constexpr uint32_t SENDER_NEGOTIATION_TIMEOUT_MS = 600000;

/**
 * @brief Receiver: bound on the offer exchange plus transit negotiation.
 */
constexpr uint32_t RECEIVER_NEGOTIATION_TIMEOUT_MS = 120000;

/**
 * @brief Floor for the transfer phase timeout.
 */
constexpr uint32_t TRANSFER_TIMEOUT_MIN_MS = 600000;

/**
 * @brief Slowest throughput (bytes/second) tolerated before the transfer
 *        phase is considered stalled. Scales the transfer timeout with size.
 */
constexpr uint64_t MIN_TRANSFER_THROUGHPUT_BPS = 64 * 1024;

/**
 * @brief Per-candidate TCP connect timeout for direct transit.
 */
constexpr uint32_t DIRECT_CONNECT_TIMEOUT_MS = 3000;

/**
 * @brief How long direct candidates get before relay attempts start.
 */
constexpr uint32_t DIRECT_WINDOW_MS = 5000;

/**
 * @brief Bound on a TLS handshake (and the GO marker) on one candidate.
 */
constexpr uint32_t TLS_HANDSHAKE_TIMEOUT_MS = 10000;

/**
 * @brief Connect timeout towards the mailbox server.
 */
constexpr uint32_t MAILBOX_CONNECT_TIMEOUT_MS = 10000;

/**
 * @brief Connect timeout towards the relay server.
 */
constexpr uint32_t RELAY_CONNECT_TIMEOUT_MS = 10000;

/**
 * @brief Relay server: how long an unpaired connection waits for its peer.
 */
constexpr uint32_t RELAY_PAIR_WAIT_MS = 60000;

/**
 * @brief Mailbox server: lifetime of a nameplate nobody claimed.
 */
constexpr uint32_t NAMEPLATE_TTL_MS = 600000;

/**
 * @brief Minimum interval between throttled progress callbacks.
 */
constexpr int64_t PROGRESS_THROTTLE_MS = 50;

/**
 * @brief Interval at which blocking connect loops re-check their abort flag.
 */
constexpr int POLL_SLICE_MS = 100;

/** @} */ // end of Timing

//=========================================================================
// Network
//=========================================================================

/** @defgroup Network Network Configuration
 * @{
 */

constexpr const char* DEFAULT_MAILBOX_HOST = "127.0.0.1";
constexpr uint16_t DEFAULT_MAILBOX_PORT = 4000;
constexpr const char* DEFAULT_RELAY_HOST = "127.0.0.1";
constexpr uint16_t DEFAULT_RELAY_PORT = 4001;

/**
 * @brief Longest line accepted on the mailbox and relay line protocols.
 */
constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

/**
 * @brief Listen backlog for mailbox, relay and transit listeners.
 */
constexpr int LISTEN_BACKLOG = 16;

/**
 * @brief Maximum concurrent client handler threads on the servers.
 */
constexpr size_t MAX_CONCURRENT_CLIENT_THREADS = 256;

/**
 * @brief Transit ability identifiers exchanged during negotiation.
 */
constexpr const char* ABILITY_DIRECT_TCP = "direct-tcp-v1";
constexpr const char* ABILITY_RELAY = "relay-v1";

/**
 * @brief Marker byte the receiver writes on the winning transit candidate.
 */
constexpr uint8_t TRANSIT_GO_MARKER = 0x01;

/** @} */ // end of Network

//=========================================================================
// TLS Configuration
//=========================================================================

/** @defgroup TlsConfig TLS Configuration
 * @brief Transit streams run TLS 1.3 with an external PSK, no certificates
 * @{
 */

/**
 * @brief The only TLS 1.3 suite offered. Its hash must match the PSK session.
 */
constexpr const char* TLS13_CIPHER_SUITES = "TLS_AES_128_GCM_SHA256";

/**
 * @brief Wire id of TLS_AES_128_GCM_SHA256, used to bind the PSK session.
 */
constexpr unsigned char TLS13_AES_128_GCM_SHA256_ID[2] = { 0x13, 0x01 };

/**
 * @brief Key exchange groups for the (EC)DHE part of psk_dhe_ke.
 */
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256";

/**
 * @brief PSK identity both transit peers present.
 */
constexpr const char* TLS_PSK_IDENTITY = "stork-transit";

/**
 * @brief Largest single SSL_write.
 */
constexpr size_t TLS_MAX_PACKET_SIZE = 16384;

/** @} */ // end of TlsConfig

//=========================================================================
// History
//=========================================================================

/**
 * @brief Maximum records kept in the transfer history file.
 */
constexpr size_t MAX_HISTORY_ENTRIES = 1000;

}  // namespace Stork
