/**
 * @file CryptoUtils.cpp
 * @brief CryptoUtils implementation.
 */

#include "stork/CryptoUtils.h"
#include "stork/HashUtils.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstring>

namespace Stork {

namespace {

constexpr size_t kGcmNonceSize = 12;
constexpr size_t kGcmTagSize = 16;

}  // namespace

std::string CryptoUtils::lastOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

bool CryptoUtils::randomBytes(uint8_t* out, size_t size, std::string& errorMsg) {
    if (!out || size == 0) {
        errorMsg = "Invalid random buffer";
        return false;
    }
    if (RAND_bytes(out, static_cast<int>(size)) != 1) {
        errorMsg = "RAND_bytes failed: " + lastOpenSslError();
        return false;
    }
    return true;
}

std::string CryptoUtils::randomHex(size_t byteCount) {
    std::vector<uint8_t> bytes(byteCount);
    std::string err;
    if (byteCount == 0 || !randomBytes(bytes.data(), bytes.size(), err)) {
        return {};
    }
    return HashUtils::toHex(bytes.data(), bytes.size());
}

bool CryptoUtils::hkdfSha256(const std::vector<uint8_t>& ikm,
                             const std::vector<uint8_t>& salt,
                             const std::string& info,
                             SymmetricKey& out,
                             std::string& errorMsg) {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        errorMsg = "EVP_PKEY_CTX_new_id(HKDF) failed: " + lastOpenSslError();
        return false;
    }

    bool ok = false;
    do {
        if (EVP_PKEY_derive_init(pctx) != 1) {
            errorMsg = "EVP_PKEY_derive_init failed: " + lastOpenSslError();
            break;
        }
        if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) != 1) {
            errorMsg = "EVP_PKEY_CTX_set_hkdf_md failed: " + lastOpenSslError();
            break;
        }
        if (!salt.empty() &&
            EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) != 1) {
            errorMsg = "EVP_PKEY_CTX_set1_hkdf_salt failed: " + lastOpenSslError();
            break;
        }
        if (EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) != 1) {
            errorMsg = "EVP_PKEY_CTX_set1_hkdf_key failed: " + lastOpenSslError();
            break;
        }
        if (EVP_PKEY_CTX_add1_hkdf_info(pctx,
                                        reinterpret_cast<const unsigned char*>(info.data()),
                                        static_cast<int>(info.size())) != 1) {
            errorMsg = "EVP_PKEY_CTX_add1_hkdf_info failed: " + lastOpenSslError();
            break;
        }

        size_t outLen = out.size();
        if (EVP_PKEY_derive(pctx, out.data(), &outLen) != 1 || outLen != out.size()) {
            errorMsg = "EVP_PKEY_derive(HKDF) failed: " + lastOpenSslError();
            break;
        }

        ok = true;
    } while (false);

    EVP_PKEY_CTX_free(pctx);

    if (!ok) {
        std::fill(out.begin(), out.end(), 0);
    }
    return ok;
}

bool CryptoUtils::hmacSha256(const SymmetricKey& key,
                             const std::vector<uint8_t>& msg,
                             std::array<uint8_t, 32>& outTag,
                             std::string& errorMsg) {
    unsigned int outLen = 0;
    unsigned char* result = HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        msg.data(),
        msg.size(),
        outTag.data(),
        &outLen
    );

    if (!result || outLen != outTag.size()) {
        errorMsg = "HMAC-SHA256 failed: " + lastOpenSslError();
        std::fill(outTag.begin(), outTag.end(), 0);
        return false;
    }
    return true;
}

bool CryptoUtils::aeadSeal(const SymmetricKey& key,
                           const std::string& plaintext,
                           const std::string& aad,
                           std::vector<uint8_t>& out,
                           std::string& errorMsg) {
    out.assign(kGcmNonceSize + plaintext.size() + kGcmTagSize, 0);
    if (!randomBytes(out.data(), kGcmNonceSize, errorMsg)) {
        return false;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        errorMsg = "EVP_CIPHER_CTX_new failed: " + lastOpenSslError();
        return false;
    }

    bool ok = false;
    do {
        int len = 0;
        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key.data(), out.data()) != 1) {
            errorMsg = "EVP_EncryptInit_ex failed: " + lastOpenSslError();
            break;
        }
        if (!aad.empty() &&
            EVP_EncryptUpdate(ctx, nullptr, &len,
                              reinterpret_cast<const unsigned char*>(aad.data()),
                              static_cast<int>(aad.size())) != 1) {
            errorMsg = "AEAD AAD update failed: " + lastOpenSslError();
            break;
        }

        uint8_t* cipherOut = out.data() + kGcmNonceSize;
        int written = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx, cipherOut, &len,
                                  reinterpret_cast<const unsigned char*>(plaintext.data()),
                                  static_cast<int>(plaintext.size())) != 1) {
                errorMsg = "EVP_EncryptUpdate failed: " + lastOpenSslError();
                break;
            }
            written = len;
        }
        if (EVP_EncryptFinal_ex(ctx, cipherOut + written, &len) != 1) {
            errorMsg = "EVP_EncryptFinal_ex failed: " + lastOpenSslError();
            break;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize),
                                out.data() + kGcmNonceSize + plaintext.size()) != 1) {
            errorMsg = "Failed to read GCM tag: " + lastOpenSslError();
            break;
        }
        ok = true;
    } while (false);

    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        out.clear();
    }
    return ok;
}

bool CryptoUtils::aeadOpen(const SymmetricKey& key,
                           const std::vector<uint8_t>& sealed,
                           const std::string& aad,
                           std::string& plaintext,
                           std::string& errorMsg) {
    plaintext.clear();
    if (sealed.size() < kGcmNonceSize + kGcmTagSize) {
        errorMsg = "Sealed message too short";
        return false;
    }

    const size_t cipherLen = sealed.size() - kGcmNonceSize - kGcmTagSize;
    std::vector<uint8_t> tag(sealed.end() - kGcmTagSize, sealed.end());
    std::vector<uint8_t> buffer(cipherLen + 1);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        errorMsg = "EVP_CIPHER_CTX_new failed: " + lastOpenSslError();
        return false;
    }

    bool ok = false;
    do {
        int len = 0;
        if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key.data(), sealed.data()) != 1) {
            errorMsg = "EVP_DecryptInit_ex failed: " + lastOpenSslError();
            break;
        }
        if (!aad.empty() &&
            EVP_DecryptUpdate(ctx, nullptr, &len,
                              reinterpret_cast<const unsigned char*>(aad.data()),
                              static_cast<int>(aad.size())) != 1) {
            errorMsg = "AEAD AAD update failed: " + lastOpenSslError();
            break;
        }

        int written = 0;
        if (cipherLen > 0) {
            if (EVP_DecryptUpdate(ctx, buffer.data(), &len,
                                  sealed.data() + kGcmNonceSize,
                                  static_cast<int>(cipherLen)) != 1) {
                errorMsg = "EVP_DecryptUpdate failed: " + lastOpenSslError();
                break;
            }
            written = len;
        }
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize),
                                tag.data()) != 1) {
            errorMsg = "Failed to set GCM tag: " + lastOpenSslError();
            break;
        }
        if (EVP_DecryptFinal_ex(ctx, buffer.data() + written, &len) != 1) {
            errorMsg = "Message authentication failed";
            break;
        }
        written += len;
        plaintext.assign(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));
        ok = true;
    } while (false);

    EVP_CIPHER_CTX_free(ctx);
    secureZero(buffer.data(), buffer.size());
    return ok;
}

void CryptoUtils::secureZero(void* data, size_t size) {
    if (data && size > 0) {
        OPENSSL_cleanse(data, size);
    }
}

}  // namespace Stork
