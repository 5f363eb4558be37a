/**
 * @file KeyExchange.cpp
 * @brief Symmetric SPAKE2 over P-256 with OpenSSL EC primitives.
 */

#include "stork/KeyExchange.h"
#include "stork/HashUtils.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cstring>

namespace Stork {

namespace {

constexpr size_t kPointSize = 33;   // Compressed P-256 point
constexpr const char* kBlindingSeed = "Stork SPAKE2 P-256 symmetric point S v1";
constexpr const char* kPasswordDomain = "Stork SPAKE2 password v1";
constexpr const char* kTranscriptDomain = "Stork SPAKE2 transcript v1";
constexpr const char* kSessionInfo = "Stork Session Key v1";
constexpr const char* kConfirmInfo = "Stork Confirm Key v1";
constexpr const char* kConfirmDomain = "Stork Confirm Tag v1";

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

struct PointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

std::vector<uint8_t> bytesOf(const char* text) {
    std::vector<uint8_t> out(text, text + std::strlen(text));
    out.push_back(0);
    return out;
}

std::string openSslFailure(const std::string& what) {
    return what + " failed: " + CryptoUtils::lastOpenSslError();
}

bool encodePoint(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx, std::vector<uint8_t>& out) {
    const size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED, nullptr, 0, ctx);
    if (len != kPointSize) {
        return false;
    }
    out.assign(len, 0);
    return EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED, out.data(), out.size(), ctx) == len;
}

/**
 * @brief Try-and-increment hash to curve for the blinding point S
 *
 * SHA-256(seed || counter) is taken as the x coordinate of a compressed
 * point until it decodes. Nobody knows log_G(S). P-256 has cofactor 1, so
 * any decoded point is in the prime-order group.
 */
bool deriveBlindingPoint(const EC_GROUP* group, EC_POINT* out, BN_CTX* ctx, std::string& errorMsg) {
    std::vector<uint8_t> seed = bytesOf(kBlindingSeed);
    seed.push_back(0);

    for (unsigned counter = 0; counter < 256; ++counter) {
        seed.back() = static_cast<uint8_t>(counter);
        const Sha256Digest digest = HashUtils::computeBufferHash(seed.data(), seed.size());

        std::array<uint8_t, kPointSize> encoded{};
        encoded[0] = 0x02;
        std::copy(digest.begin(), digest.end(), encoded.begin() + 1);

        if (EC_POINT_oct2point(group, out, encoded.data(), encoded.size(), ctx) == 1 &&
            EC_POINT_is_at_infinity(group, out) == 0) {
            ERR_clear_error();
            return true;
        }
    }

    ERR_clear_error();
    errorMsg = "Could not derive the SPAKE2 blinding point";
    return false;
}

}  // namespace

//=============================================================================
// State
//=============================================================================

struct KeyExchange::State {
    EC_GROUP* group = nullptr;
    EC_POINT* blind = nullptr;     ///< S
    BIGNUM* secret = nullptr;      ///< x
    BIGNUM* password = nullptr;    ///< w
    Sha256Digest passwordHash{};

    ~State() {
        BN_clear_free(secret);
        BN_clear_free(password);
        EC_POINT_free(blind);
        EC_GROUP_free(group);
        CryptoUtils::secureZero(passwordHash.data(), passwordHash.size());
    }
};

KeyExchange::KeyExchange() = default;

KeyExchange::~KeyExchange() = default;

//=============================================================================
// begin()
//=============================================================================

bool KeyExchange::begin(const std::string& codeText, std::string& messageHex, std::string& errorMsg) {
    if (m_state) {
        errorMsg = "Key exchange already started";
        return false;
    }
    if (codeText.empty()) {
        errorMsg = "Key exchange needs a code";
        return false;
    }

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        errorMsg = openSslFailure("BN_CTX_new");
        return false;
    }

    auto state = std::make_unique<State>();
    state->group = EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1);
    if (!state->group) {
        errorMsg = openSslFailure("EC_GROUP_new_by_curve_name(P-256)");
        return false;
    }
    const EC_GROUP* group = state->group;
    const BIGNUM* order = EC_GROUP_get0_order(group);

    state->blind = EC_POINT_new(group);
    if (!state->blind) {
        errorMsg = openSslFailure("EC_POINT_new");
        return false;
    }
    if (!deriveBlindingPoint(group, state->blind, ctx.get(), errorMsg)) {
        return false;
    }

    // w = H(domain || code) mod n
    std::vector<uint8_t> passwordInput = bytesOf(kPasswordDomain);
    passwordInput.insert(passwordInput.end(), codeText.begin(), codeText.end());
    state->passwordHash = HashUtils::computeBufferHash(passwordInput.data(), passwordInput.size());
    CryptoUtils::secureZero(passwordInput.data(), passwordInput.size());

    BIGNUM* raw = BN_bin2bn(state->passwordHash.data(), static_cast<int>(state->passwordHash.size()), nullptr);
    state->password = BN_new();
    const bool reduced = raw && state->password && BN_nnmod(state->password, raw, order, ctx.get()) == 1;
    BN_clear_free(raw);
    if (!reduced) {
        errorMsg = openSslFailure("Password scalar");
        return false;
    }

    state->secret = BN_new();
    if (!state->secret) {
        errorMsg = openSslFailure("BN_new");
        return false;
    }
    do {
        if (BN_priv_rand_range(state->secret, order) != 1) {
            errorMsg = openSslFailure("BN_priv_rand_range");
            return false;
        }
    } while (BN_is_zero(state->secret));

    // X = x*G + w*S
    PointPtr blinded(EC_POINT_new(group));
    if (!blinded ||
        EC_POINT_mul(group, blinded.get(), state->secret, state->blind, state->password, ctx.get()) != 1) {
        errorMsg = openSslFailure("EC_POINT_mul");
        return false;
    }

    std::vector<uint8_t> message;
    if (!encodePoint(group, blinded.get(), ctx.get(), message)) {
        errorMsg = openSslFailure("EC_POINT_point2oct");
        return false;
    }

    m_state = std::move(state);
    m_message = std::move(message);
    messageHex = HashUtils::toHex(m_message.data(), m_message.size());
    return true;
}

//=============================================================================
// finish()
//=============================================================================

bool KeyExchange::finish(const std::string& peerMessageHex, SymmetricKey& sessionKey, std::string& errorMsg) {
    if (!m_state) {
        errorMsg = "Key exchange not started";
        return false;
    }
    if (!m_peerMessage.empty()) {
        errorMsg = "Key exchange already finished";
        return false;
    }

    std::vector<uint8_t> peerMessage;
    if (!HashUtils::fromHex(peerMessageHex, peerMessage) || peerMessage.size() != kPointSize) {
        errorMsg = "Peer key exchange message is malformed";
        return false;
    }
    if (peerMessage == m_message) {
        errorMsg = "Peer echoed our own key exchange message";
        return false;
    }

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        errorMsg = openSslFailure("BN_CTX_new");
        return false;
    }
    const EC_GROUP* group = m_state->group;

    PointPtr peerPoint(EC_POINT_new(group));
    if (!peerPoint ||
        EC_POINT_oct2point(group, peerPoint.get(), peerMessage.data(), peerMessage.size(), ctx.get()) != 1) {
        ERR_clear_error();
        errorMsg = "Peer key exchange message is not a P-256 point";
        return false;
    }

    // Y - w*S
    PointPtr unblinded(EC_POINT_new(group));
    PointPtr mask(EC_POINT_new(group));
    if (!unblinded || !mask ||
        EC_POINT_mul(group, mask.get(), nullptr, m_state->blind, m_state->password, ctx.get()) != 1 ||
        EC_POINT_invert(group, mask.get(), ctx.get()) != 1 ||
        EC_POINT_add(group, unblinded.get(), peerPoint.get(), mask.get(), ctx.get()) != 1) {
        errorMsg = openSslFailure("SPAKE2 unblinding");
        return false;
    }
    if (EC_POINT_is_at_infinity(group, unblinded.get()) == 1) {
        errorMsg = "Peer key exchange message is degenerate";
        return false;
    }

    // K = x*(Y - w*S)
    PointPtr shared(EC_POINT_new(group));
    if (!shared ||
        EC_POINT_mul(group, shared.get(), nullptr, unblinded.get(), m_state->secret, ctx.get()) != 1) {
        errorMsg = openSslFailure("EC_POINT_mul");
        return false;
    }

    std::vector<uint8_t> ikm;
    if (!encodePoint(group, shared.get(), ctx.get(), ikm)) {
        errorMsg = openSslFailure("EC_POINT_point2oct");
        return false;
    }

    // Order-independent transcript: both sides hash the same bytes
    const std::vector<uint8_t>& low = std::min(m_message, peerMessage);
    const std::vector<uint8_t>& high = std::max(m_message, peerMessage);
    std::vector<uint8_t> transcript = bytesOf(kTranscriptDomain);
    transcript.insert(transcript.end(), m_state->passwordHash.begin(), m_state->passwordHash.end());
    transcript.insert(transcript.end(), low.begin(), low.end());
    transcript.insert(transcript.end(), high.begin(), high.end());
    const Sha256Digest transcriptHash = HashUtils::computeBufferHash(transcript.data(), transcript.size());
    const std::vector<uint8_t> salt(transcriptHash.begin(), transcriptHash.end());
    CryptoUtils::secureZero(transcript.data(), transcript.size());

    const bool ok = CryptoUtils::hkdfSha256(ikm, salt, kSessionInfo, sessionKey, errorMsg);
    CryptoUtils::secureZero(ikm.data(), ikm.size());

    if (ok) {
        m_peerMessage = std::move(peerMessage);
    }
    return ok;
}

//=============================================================================
// Key confirmation
//=============================================================================

bool KeyExchange::confirmTagFor(const SymmetricKey& sessionKey,
                                const std::vector<uint8_t>& message,
                                ConfirmTag& tag,
                                std::string& errorMsg) {
    const std::vector<uint8_t> ikm(sessionKey.begin(), sessionKey.end());
    SymmetricKey confirmKey{};
    if (!CryptoUtils::hkdfSha256(ikm, {}, kConfirmInfo, confirmKey, errorMsg)) {
        return false;
    }

    std::vector<uint8_t> msg = bytesOf(kConfirmDomain);
    msg.insert(msg.end(), message.begin(), message.end());

    const bool ok = CryptoUtils::hmacSha256(confirmKey, msg, tag, errorMsg);
    CryptoUtils::secureZero(confirmKey.data(), confirmKey.size());
    return ok;
}

bool KeyExchange::computeConfirmTag(const SymmetricKey& sessionKey,
                                    ConfirmTag& tag,
                                    std::string& errorMsg) const {
    if (m_peerMessage.empty()) {
        errorMsg = "Key exchange not finished";
        return false;
    }
    return confirmTagFor(sessionKey, m_message, tag, errorMsg);
}

bool KeyExchange::verifyConfirmTag(const SymmetricKey& sessionKey,
                                   const ConfirmTag& peerTag,
                                   std::string& errorMsg) const {
    if (m_peerMessage.empty()) {
        errorMsg = "Key exchange not finished";
        return false;
    }

    ConfirmTag expected{};
    if (!confirmTagFor(sessionKey, m_peerMessage, expected, errorMsg)) {
        return false;
    }
    if (CRYPTO_memcmp(expected.data(), peerTag.data(), expected.size()) != 0) {
        errorMsg = "Key confirmation failed (codes do not match)";
        return false;
    }
    return true;
}

}  // namespace Stork
