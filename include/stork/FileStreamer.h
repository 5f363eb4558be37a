/**
 * @file FileStreamer.h
 * @brief Chunked file streaming with SHA-256 verification over a TransportStream
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "CancelToken.h"
#include "ProgressSink.h"
#include "SessionError.h"
#include "TransportStream.h"
#include "config.h"

#include <cstdint>
#include <functional>
#include <string>

namespace Stork {

/**
 * @brief What the sender proposes before any transit is opened
 */
struct TransferOffer {
    std::string fileName;   ///< Base name only, sanitized by the receiver
    uint64_t fileSize = 0;
};

/**
 * @class FileStreamer
 * @brief Moves one file's bytes across an established stream
 *
 * Wire format (after transit negotiation, inside TLS):
 * @code
 * sender   -> receiver : fileSize bytes of content, in CHUNK_SIZE pieces
 * sender   -> receiver : 32-byte SHA-256 of the content
 * receiver -> sender   : 1-byte verdict (VERDICT_OK / _DIGEST_MISMATCH /
 *                        _STORAGE_FAILED)
 * @endcode
 *
 * The size is known to both sides from the TransferOffer, so the content is
 * not framed. Progress is reported once per chunk (exactly one (0, 0) event
 * for an empty file); cancellation is polled between chunks. A phase
 * interrupt (stream->interrupt()) makes a blocked call fail, which the
 * session's PhaseGuard maps to the winning cause.
 *
 * The receiver writes to "<destination>.part", never holds more than one
 * chunk in memory, and renames into place only after the digest matched. On
 * every failure path the .part file is removed.
 */
class FileStreamer {
public:
    /// Claims the transfer before the verified file is published; false aborts
    using CommitFn = std::function<bool()>;

    /**
     * @brief Stream a local file
     * @param stream Negotiated stream
     * @param filePath File to read
     * @param fileSize Size announced in the offer; the file must still have it
     * @param progress Optional sink
     * @param cancel Session cancel token
     * @param error Output error (phase Transferring)
     * @return true once the receiver confirmed the digest
     */
    static bool send(TransportStream& stream,
                     const std::string& filePath,
                     uint64_t fileSize,
                     ProgressSink* progress,
                     CancelToken& cancel,
                     SessionError& error);

    /**
     * @brief Receive exactly offer.fileSize bytes into @p destinationPath
     * @param destinationPath Final path; must not exist yet
     * @param commit Optional; when it returns false the .part file is
     *        discarded instead of published
     */
    static bool receive(TransportStream& stream,
                        const TransferOffer& offer,
                        const std::string& destinationPath,
                        ProgressSink* progress,
                        CancelToken& cancel,
                        SessionError& error,
                        const CommitFn& commit = CommitFn());

    /**
     * @brief Turn an offered name into a safe local base name
     *
     * Path separators become '_', ".." sequences become "__", trailing dots
     * and spaces are trimmed. Control characters, empty names, names made of
     * dots/underscores only, and names longer than MAX_FILENAME_LENGTH are
     * rejected.
     *
     * @return false if the name cannot be used
     */
    static bool sanitizeFileName(std::string& fileName);

    /**
     * @brief First free "<dir>/<name>", "<dir>/<name> (1).<ext>", ...
     *
     * A name counts as taken if either it or its ".part" sibling exists.
     */
    static std::string uniqueDestination(const std::string& directory, const std::string& fileName);

    /**
     * @brief Check that @p directory can take a file of @p requiredBytes
     *
     * The directory must exist, be a directory, be writable, and have
     * requiredBytes + DISK_SPACE_RESERVE_BYTES available.
     */
    static bool validateDestination(const std::string& directory,
                                    uint64_t requiredBytes,
                                    std::string& errorMsg);
};

}  // namespace Stork
