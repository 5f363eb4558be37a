/**
 * @file HashUtils.cpp
 * @brief SHA-256 over OpenSSL EVP, hex codec, constant-time compare
 */

#include "stork/HashUtils.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace Stork {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

//=============================================================================
// Digests
//=============================================================================

Sha256Digest HashUtils::computeBufferHash(const uint8_t* data, size_t size)
{
    Sha256Digest digest{};
    IncrementalHash hash;
    const bool fed = !data || size == 0 || hash.update(data, size);
    if (!fed || !hash.finalize(digest)) {
        digest.fill(0);
    }
    return digest;
}

std::string HashUtils::toHex(const uint8_t* data, size_t size)
{
    static const char kDigits[] = "0123456789abcdef";

    std::string out;
    if (!data) {
        return out;
    }
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[(data[i] >> 4) & 0x0F]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

bool HashUtils::fromHex(const std::string& hex, std::vector<uint8_t>& out)
{
    out.clear();
    if (hex.size() % 2 != 0) {
        return false;
    }

    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexValue(hex[i]);
        const int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

bool HashUtils::constantTimeEquals(const uint8_t* a, const uint8_t* b, size_t size)
{
    if (!a || !b) {
        return false;
    }
    return CRYPTO_memcmp(a, b, size) == 0;
}

//=============================================================================
// IncrementalHash
//=============================================================================

void HashUtils::IncrementalHash::ContextDeleter::operator()(evp_md_ctx_st* ctx) const
{
    EVP_MD_CTX_free(ctx);
}

HashUtils::IncrementalHash::IncrementalHash()
    : m_ctx(EVP_MD_CTX_new())
{
    reset();
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size)
{
    if (m_finalized || !m_ctx) {
        return false;
    }
    if (!data || size == 0) {
        return true;
    }
    return EVP_DigestUpdate(m_ctx.get(), data, size) == 1;
}

bool HashUtils::IncrementalHash::finalize(Sha256Digest& digest)
{
    if (m_finalized || !m_ctx) {
        return false;
    }
    m_finalized = true;

    unsigned int length = 0;
    return EVP_DigestFinal_ex(m_ctx.get(), digest.data(), &length) == 1 && length == digest.size();
}

bool HashUtils::IncrementalHash::reset()
{
    m_finalized = false;
    return m_ctx && EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) == 1;
}

}  // namespace Stork
