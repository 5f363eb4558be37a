/**
 * @file CryptoUtils.h
 * @brief HKDF, HMAC, AEAD and CSPRNG helpers over OpenSSL.
 *
 * Security notes:
 * - Key material handled here must never be logged.
 * - Callers zero derived keys they no longer need with secureZero().
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Stork {

using SymmetricKey = std::array<uint8_t, 32>;

class CryptoUtils {
public:
    /**
     * @brief Fill a buffer from the OpenSSL CSPRNG (RAND_bytes)
     */
    static bool randomBytes(uint8_t* out, size_t size, std::string& errorMsg);

    /**
     * @brief Random lowercase hex string of @p byteCount bytes
     * @return Empty string if the CSPRNG fails
     */
    static std::string randomHex(size_t byteCount);

    /**
     * @brief HKDF-SHA256 (RFC 5869) extract-and-expand
     * @param ikm Input keying material
     * @param salt Optional salt (may be empty)
     * @param info Context label binding the output to one purpose
     * @param out Output key (32 bytes)
     */
    static bool hkdfSha256(const std::vector<uint8_t>& ikm,
                           const std::vector<uint8_t>& salt,
                           const std::string& info,
                           SymmetricKey& out,
                           std::string& errorMsg);

    /**
     * @brief HMAC-SHA256 of @p msg under @p key
     */
    static bool hmacSha256(const SymmetricKey& key,
                           const std::vector<uint8_t>& msg,
                           std::array<uint8_t, 32>& outTag,
                           std::string& errorMsg);

    /**
     * @brief AES-256-GCM seal
     * @param plaintext Data to encrypt
     * @param aad Additional authenticated data (not encrypted)
     * @param out nonce(12) || ciphertext || tag(16)
     *
     * A fresh random nonce is drawn per call.
     */
    static bool aeadSeal(const SymmetricKey& key,
                         const std::string& plaintext,
                         const std::string& aad,
                         std::vector<uint8_t>& out,
                         std::string& errorMsg);

    /**
     * @brief AES-256-GCM open; fails on any tag mismatch
     */
    static bool aeadOpen(const SymmetricKey& key,
                         const std::vector<uint8_t>& sealed,
                         const std::string& aad,
                         std::string& plaintext,
                         std::string& errorMsg);

    /**
     * @brief Zero memory in a way the compiler will not elide
     */
    static void secureZero(void* data, size_t size);

    /**
     * @brief Text of the oldest entry on the OpenSSL error queue
     */
    static std::string lastOpenSslError();

private:
    CryptoUtils() = delete;
};

}  // namespace Stork
