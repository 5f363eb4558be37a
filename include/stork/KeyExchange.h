/**
 * @file KeyExchange.h
 * @brief Code-authenticated key agreement (symmetric SPAKE2 over P-256)
 *
 * Both peers hold the same short code and run the symmetric SPAKE2 variant:
 *
 *   w = SHA-256("Stork SPAKE2 password v1" || code) mod n
 *   S = fixed P-256 point with unknown discrete log (hash-to-curve)
 *   X = x*G + w*S                    (published, compressed point)
 *   K = x*(Y - w*S)                  (Y = the peer's published point)
 *
 *   session key = HKDF-SHA256(ikm  = K,
 *                             salt = SHA-256(domain || w || min(X,Y) || max(X,Y)),
 *                             info = "Stork Session Key v1")
 *
 * Each published point commits to one password guess. An active mailbox
 * operator that substitutes its own point learns nothing it can test
 * offline: every wrong guess costs one failed confirmation with a live peer.
 * Each side then proves possession with an HMAC confirm tag over its own
 * point; a wrong code surfaces as a confirm mismatch before any payload.
 *
 * Security notes:
 * - Scalars are cleared and freed on destruction.
 * - The code text is mixed into w and the salt, never sent.
 */

#pragma once

#include "CryptoUtils.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Stork {

using ConfirmTag = std::array<uint8_t, 32>;

class KeyExchange {
public:
    KeyExchange();
    ~KeyExchange();

    KeyExchange(const KeyExchange&) = delete;
    KeyExchange& operator=(const KeyExchange&) = delete;

    /**
     * @brief Bind the code and produce our blinded point
     * @param codeText Canonical code, e.g. "7-acorn-banjo"
     * @param messageHex Output: our point to publish (hex, compressed)
     */
    bool begin(const std::string& codeText, std::string& messageHex, std::string& errorMsg);

    /**
     * @brief Combine the peer's point into the session key
     * @param peerMessageHex Peer's published point (hex, 33 bytes)
     * @param sessionKey Output session key
     */
    bool finish(const std::string& peerMessageHex, SymmetricKey& sessionKey, std::string& errorMsg);

    /**
     * @brief Our confirm tag (valid after finish())
     */
    bool computeConfirmTag(const SymmetricKey& sessionKey, ConfirmTag& tag, std::string& errorMsg) const;

    /**
     * @brief Check the peer's confirm tag in constant time
     */
    bool verifyConfirmTag(const SymmetricKey& sessionKey,
                          const ConfirmTag& peerTag,
                          std::string& errorMsg) const;

private:
    struct State;

    static bool confirmTagFor(const SymmetricKey& sessionKey,
                              const std::vector<uint8_t>& message,
                              ConfirmTag& tag,
                              std::string& errorMsg);

    std::unique_ptr<State> m_state;
    std::vector<uint8_t> m_message;
    std::vector<uint8_t> m_peerMessage;
};

}  // namespace Stork
