/**
 * @file HashUtils.h
 * @brief SHA-256 digests and hex helpers
 */

#pragma once

#include "config.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace Stork {

/**
 * @brief Fixed-size SHA-256 digest
 */
using Sha256Digest = std::array<uint8_t, HASH_SIZE>;

/**
 * @class HashUtils
 * @brief SHA-256 hashing utilities for transfer integrity and key derivation
 *
 * Thread Safety:
 * - All static methods are thread-safe (no shared state)
 * - IncrementalHash instances must not be shared between threads
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a memory buffer
     */
    static Sha256Digest computeBufferHash(const uint8_t* data, size_t size);

    /**
     * @brief Lowercase hex encoding of arbitrary bytes
     */
    static std::string toHex(const uint8_t* data, size_t size);

    template <size_t N>
    static std::string toHex(const std::array<uint8_t, N>& bytes) {
        return toHex(bytes.data(), bytes.size());
    }

    /**
     * @brief Decode a hex string (either case)
     * @return false on odd length or non-hex characters
     */
    static bool fromHex(const std::string& hex, std::vector<uint8_t>& out);

    /**
     * @brief Decode a hex string that must encode exactly N bytes
     */
    template <size_t N>
    static bool fromHex(const std::string& hex, std::array<uint8_t, N>& out) {
        std::vector<uint8_t> bytes;
        if (!fromHex(hex, bytes) || bytes.size() != N) {
            return false;
        }
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return true;
    }

    /**
     * @brief Constant-time comparison of two equal-length buffers
     */
    static bool constantTimeEquals(const uint8_t* a, const uint8_t* b, size_t size);

    /**
     * @brief SHA-256 hash context for incremental hashing
     *
     * Used while a file streams chunk by chunk.
     */
    class IncrementalHash {
    public:
        IncrementalHash();

        IncrementalHash(IncrementalHash&&) noexcept = default;
        IncrementalHash& operator=(IncrementalHash&&) noexcept = default;

        /**
         * @brief Add data to the hash computation
         * @return false after finalize() or on an OpenSSL failure
         */
        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Write the digest; update() fails until reset()
         */
        bool finalize(Sha256Digest& digest);

        bool reset();

    private:
        struct ContextDeleter {
            void operator()(evp_md_ctx_st* ctx) const;
        };

        std::unique_ptr<evp_md_ctx_st, ContextDeleter> m_ctx;
        bool m_finalized = false;
    };
};

}  // namespace Stork
