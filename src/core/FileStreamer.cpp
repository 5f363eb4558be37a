/**
 * @file FileStreamer.cpp
 * @brief Chunked file streaming implementation
 */

#include "stork/FileStreamer.h"
#include "stork/AtomicFile.h"
#include "stork/Debug.h"
#include "stork/HashUtils.h"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace Stork {

namespace {

constexpr size_t kFileIoBufferSize = 1024 * 1024;

SessionError transferError(ErrorCode code, const std::string& message,
                           uint64_t moved, uint64_t expected) {
    SessionError error = SessionError::make(code, SessionPhase::Transferring, message);
    error.bytesMoved = moved;
    error.bytesExpected = expected;
    return error;
}

SessionError cancelledError(uint64_t moved, uint64_t expected) {
    return transferError(ErrorCode::Cancelled, "Transfer cancelled", moved, expected);
}

/**
 * @brief Output file that removes itself unless committed
 */
class PartialOutput {
public:
    explicit PartialOutput(std::filesystem::path tempPath)
        : m_tempPath(std::move(tempPath))
        , m_ioBuffer(kFileIoBufferSize)
    {
    }

    ~PartialOutput() {
        if (!m_committed) {
            discard();
        }
    }

    PartialOutput(const PartialOutput&) = delete;
    PartialOutput& operator=(const PartialOutput&) = delete;

    bool open() {
        // Larger stream buffer for long sequential writes
        m_file.rdbuf()->pubsetbuf(m_ioBuffer.data(), static_cast<std::streamsize>(m_ioBuffer.size()));
        m_file.open(m_tempPath, std::ios::binary | std::ios::trunc);
        m_created = m_file.is_open();
        return m_created;
    }

    bool write(const uint8_t* data, size_t size) {
        m_file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        return static_cast<bool>(m_file);
    }

    bool close() {
        m_file.flush();
        const bool ok = static_cast<bool>(m_file);
        m_file.close();
        return ok && !m_file.fail();
    }

    void discard() {
        if (m_file.is_open()) {
            m_file.close();
        }
        if (m_created && !removePartialFile(m_tempPath)) {
            LOG_WARNING("[FileStreamer] Could not remove partial file " << m_tempPath.string());
        }
    }

    void commit() { m_committed = true; }

private:
    std::filesystem::path m_tempPath;
    std::vector<char> m_ioBuffer;
    std::ofstream m_file;
    bool m_created = false;
    bool m_committed = false;
};

void sendVerdict(TransportStream& stream, uint8_t verdict) {
    std::string err;
    if (!stream.sendExact(&verdict, 1, err)) {
        LOG_WARNING("[FileStreamer] Could not send verdict " << static_cast<int>(verdict) << ": " << err);
    }
}

void trimTrailingDotsAndSpaces(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '.')) {
        s.pop_back();
    }
}

}  // namespace

//=============================================================================
// FileStreamer::send()
//=============================================================================

bool FileStreamer::send(TransportStream& stream,
                        const std::string& filePath,
                        uint64_t fileSize,
                        ProgressSink* progress,
                        CancelToken& cancel,
                        SessionError& error) {
    std::ifstream file;
    std::vector<char> fileIoBuffer(kFileIoBufferSize);
    file.rdbuf()->pubsetbuf(fileIoBuffer.data(), static_cast<std::streamsize>(fileIoBuffer.size()));
    file.open(filePath, std::ios::binary);
    if (!file) {
        error = transferError(ErrorCode::FileIoError, "Failed to open file for reading: " + filePath,
                              0, fileSize);
        return false;
    }

    HashUtils::IncrementalHash hash;
    std::vector<uint8_t> buffer(CHUNK_SIZE);
    std::string err;
    uint64_t totalSent = 0;

    if (fileSize == 0 && progress) {
        progress->onProgress(0, 0);
    }

    while (totalSent < fileSize) {
        if (cancel.isCancelled()) {
            error = cancelledError(totalSent, fileSize);
            return false;
        }

        const size_t toRead = static_cast<size_t>(
            std::min<uint64_t>(CHUNK_SIZE, fileSize - totalSent));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(toRead));
        if (static_cast<size_t>(file.gcount()) != toRead) {
            error = transferError(ErrorCode::FileIoError,
                                  "File shrank or became unreadable during transfer: " + filePath,
                                  totalSent, fileSize);
            return false;
        }

        if (!stream.sendExact(buffer.data(), toRead, err)) {
            error = transferError(ErrorCode::StreamError, "Failed to send file chunk: " + err,
                                  totalSent, fileSize);
            return false;
        }

        if (!hash.update(buffer.data(), toRead)) {
            error = transferError(ErrorCode::InternalError, "Failed to update hash", totalSent, fileSize);
            return false;
        }

        totalSent += toRead;
        if (progress) {
            progress->onProgress(totalSent, fileSize);
        }
    }

    Sha256Digest digest{};
    if (!hash.finalize(digest)) {
        error = transferError(ErrorCode::InternalError, "Failed to finalize hash", totalSent, fileSize);
        return false;
    }

    if (!stream.sendExact(digest.data(), digest.size(), err)) {
        error = transferError(ErrorCode::StreamError, "Failed to send digest: " + err, totalSent, fileSize);
        return false;
    }

    uint8_t verdict = 0;
    if (!stream.recvExact(&verdict, 1, err)) {
        error = transferError(ErrorCode::StreamError,
                              "Failed to receive verification verdict: " + err, totalSent, fileSize);
        return false;
    }

    switch (verdict) {
    case VERDICT_OK:
        LOG_DEBUG("[FileStreamer] Receiver confirmed digest " << HashUtils::toHex(digest));
        return true;
    case VERDICT_DIGEST_MISMATCH:
        error = transferError(ErrorCode::IntegrityMismatch,
                              "Receiver reported SHA-256 mismatch", totalSent, fileSize);
        return false;
    case VERDICT_STORAGE_FAILED:
        error = transferError(ErrorCode::FileIoError,
                              "Receiver could not store the file", totalSent, fileSize);
        return false;
    default:
        error = transferError(ErrorCode::StreamError,
                              "Unexpected verification verdict " + std::to_string(verdict),
                              totalSent, fileSize);
        return false;
    }
}

//=============================================================================
// FileStreamer::receive()
//=============================================================================

bool FileStreamer::receive(TransportStream& stream,
                           const TransferOffer& offer,
                           const std::string& destinationPath,
                           ProgressSink* progress,
                           CancelToken& cancel,
                           SessionError& error,
                           const CommitFn& commit) {
    const uint64_t expectedSize = offer.fileSize;
    const AtomicFilePaths paths = computeAtomicFilePaths(std::filesystem::path(destinationPath));

    PartialOutput output(paths.tempPath);
    if (!output.open()) {
        error = transferError(ErrorCode::FileIoError,
                              "Failed to create output file: " + paths.tempPath.string(), 0, expectedSize);
        return false;
    }

    HashUtils::IncrementalHash hash;
    std::vector<uint8_t> buffer(CHUNK_SIZE);
    std::string err;
    uint64_t bytesReceived = 0;

    if (expectedSize == 0 && progress) {
        progress->onProgress(0, 0);
    }

    while (bytesReceived < expectedSize) {
        if (cancel.isCancelled()) {
            error = cancelledError(bytesReceived, expectedSize);
            return false;
        }

        const size_t toRead = static_cast<size_t>(
            std::min<uint64_t>(CHUNK_SIZE, expectedSize - bytesReceived));

        if (!stream.recvExact(buffer.data(), toRead, err)) {
            error = transferError(ErrorCode::TruncatedTransfer,
                                  "Stream ended after " + std::to_string(bytesReceived) + " of " +
                                      std::to_string(expectedSize) + " bytes: " + err,
                                  bytesReceived, expectedSize);
            return false;
        }

        if (!output.write(buffer.data(), toRead)) {
            error = transferError(ErrorCode::FileIoError,
                                  "Failed to write to " + paths.tempPath.string(),
                                  bytesReceived, expectedSize);
            sendVerdict(stream, VERDICT_STORAGE_FAILED);
            return false;
        }

        if (!hash.update(buffer.data(), toRead)) {
            error = transferError(ErrorCode::InternalError, "Failed to update hash",
                                  bytesReceived, expectedSize);
            return false;
        }

        bytesReceived += toRead;
        if (progress) {
            progress->onProgress(bytesReceived, expectedSize);
        }
    }

    Sha256Digest localDigest{};
    if (!hash.finalize(localDigest)) {
        error = transferError(ErrorCode::InternalError, "Failed to finalize hash",
                              bytesReceived, expectedSize);
        return false;
    }

    Sha256Digest senderDigest{};
    if (!stream.recvExact(senderDigest.data(), senderDigest.size(), err)) {
        error = transferError(ErrorCode::TruncatedTransfer, "Stream ended before the digest: " + err,
                              bytesReceived, expectedSize);
        return false;
    }

    if (!HashUtils::constantTimeEquals(localDigest.data(), senderDigest.data(), localDigest.size())) {
        sendVerdict(stream, VERDICT_DIGEST_MISMATCH);
        error = transferError(ErrorCode::IntegrityMismatch,
                              "SHA-256 mismatch: transfer corrupted or tampered",
                              bytesReceived, expectedSize);
        return false;
    }

    // Past this point the file appears at its final path
    if (commit && !commit()) {
        error = cancelledError(bytesReceived, expectedSize);
        error.message = "Transfer ended before the file was published";
        return false;
    }

    // Rename into place only after the digest matched
    std::string renameError;
    if (!output.close() ||
        !atomicRenameToFinal(paths.tempPath, paths.finalPath, renameError)) {
        sendVerdict(stream, VERDICT_STORAGE_FAILED);
        error = transferError(ErrorCode::FileIoError,
                              "Failed to finalize received file: " +
                                  (renameError.empty() ? std::string("flush failed") : renameError),
                              bytesReceived, expectedSize);
        return false;
    }
    output.commit();

    // The file is complete and verified even if the sender misses the ack
    sendVerdict(stream, VERDICT_OK);
    return true;
}

//=============================================================================
// Destination helpers
//=============================================================================

bool FileStreamer::sanitizeFileName(std::string& fileName) {
    if (fileName.empty()) {
        return false;
    }

    for (char& ch : fileName) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (uch < 32 || uch == 127) {
            return false;
        }
        if (ch == '/' || ch == '\\') {
            ch = '_';
        }
    }

    size_t pos = 0;
    while ((pos = fileName.find("..", pos)) != std::string::npos) {
        fileName.replace(pos, 2, "__");
    }

    trimTrailingDotsAndSpaces(fileName);

    if (fileName.empty()) return false;
    if (fileName.find_first_not_of("._") == std::string::npos) return false;
    if (fileName.size() > MAX_FILENAME_LENGTH) return false;
    return true;
}

std::string FileStreamer::uniqueDestination(const std::string& directory, const std::string& fileName) {
    const std::filesystem::path dir(directory);

    auto taken = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::exists(candidate, ec) ||
               std::filesystem::exists(computeAtomicFilePaths(candidate).tempPath, ec);
    };

    std::filesystem::path candidate = dir / fileName;
    if (!taken(candidate)) {
        return candidate.string();
    }

    // A leading dot (".bashrc") is not an extension separator
    const size_t dotPos = fileName.find_last_of('.');
    std::string name = fileName;
    std::string ext;
    if (dotPos != std::string::npos && dotPos != 0) {
        name = fileName.substr(0, dotPos);
        ext = fileName.substr(dotPos);
    }

    for (int counter = 1;; ++counter) {
        candidate = dir / (name + " (" + std::to_string(counter) + ")" + ext);
        if (!taken(candidate)) {
            return candidate.string();
        }
    }
}

bool FileStreamer::validateDestination(const std::string& directory,
                                       uint64_t requiredBytes,
                                       std::string& errorMsg) {
    if (directory.empty()) {
        errorMsg = "No destination directory";
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec) || ec) {
        errorMsg = "Destination is not a directory: " + directory;
        return false;
    }

    if (::access(directory.c_str(), W_OK | X_OK) != 0) {
        errorMsg = "Destination directory is not writable: " + directory;
        return false;
    }

    const std::filesystem::space_info space = std::filesystem::space(directory, ec);
    if (ec) {
        // Some filesystems do not report space; the write itself will tell
        LOG_DEBUG("[FileStreamer] Cannot query free space for " << directory << ": " << ec.message());
        return true;
    }
    if (space.available < requiredBytes ||
        space.available - requiredBytes < DISK_SPACE_RESERVE_BYTES) {
        errorMsg = "Insufficient disk space in " + directory + " for " +
                   std::to_string(requiredBytes) + " bytes";
        return false;
    }
    return true;
}

}  // namespace Stork
