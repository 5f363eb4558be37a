/**
 * @file TlsSocket.cpp
 * @brief TLS 1.3 PSK wrapper for transit streams
 */

#include "stork/TlsSocket.h"
#include "stork/config.h"

#include <openssl/err.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace Stork {

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int socket, TlsRole role, const SymmetricKey& psk)
    : m_socket(socket)
    , m_ctx(nullptr)
    , m_ssl(nullptr)
    , m_role(role)
    , m_psk(psk)
    , m_connected(false)
{
}

TlsSocket::~TlsSocket() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }
    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    CryptoUtils::secureZero(m_psk.data(), m_psk.size());
}

//=============================================================================
// TlsSocket: SSL Context Creation
//=============================================================================

bool TlsSocket::createContext(std::string& errorMsg) {
    const SSL_METHOD* method = (m_role == TlsRole::SERVER) ? TLS_server_method()
                                                           : TLS_client_method();

    m_ctx = SSL_CTX_new(method);
    if (!m_ctx) {
        errorMsg = "Failed to create SSL context: " + getLastError();
        return false;
    }

    // TLS 1.3 only: external PSKs are a TLS 1.3 feature
    if (SSL_CTX_set_min_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set minimum TLS version: " + getLastError();
        return false;
    }
    if (SSL_CTX_set_max_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set maximum TLS version: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_ciphersuites(m_ctx, TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + getLastError();
        return false;
    }

    if (SSL_CTX_set1_groups_list(m_ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + getLastError();
        return false;
    }

    SSL_CTX_set_options(m_ctx, SSL_OP_NO_COMPRESSION | SSL_OP_NO_TICKET);

    // One stream per session; resumption tickets would only add round trips
    SSL_CTX_set_num_tickets(m_ctx, 0);

    // The PSK authenticates both ends; there are no certificates to verify
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);

    if (m_role == TlsRole::SERVER) {
        SSL_CTX_set_psk_find_session_callback(m_ctx, &TlsSocket::pskFindSessionCallback);
    } else {
        SSL_CTX_set_psk_use_session_callback(m_ctx, &TlsSocket::pskUseSessionCallback);
    }

    return true;
}

bool TlsSocket::createSsl(std::string& errorMsg) {
    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }

    SSL_set_app_data(m_ssl, this);

    if (SSL_set_fd(m_ssl, m_socket) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }

    return true;
}

//=============================================================================
// TlsSocket: External PSK
//=============================================================================

SSL_SESSION* TlsSocket::buildPskSession(SSL* ssl) const {
    const SSL_CIPHER* cipher = SSL_CIPHER_find(ssl, TLS13_AES_128_GCM_SHA256_ID);
    if (!cipher) {
        return nullptr;
    }

    SSL_SESSION* session = SSL_SESSION_new();
    if (!session) {
        return nullptr;
    }

    if (SSL_SESSION_set1_master_key(session, m_psk.data(), m_psk.size()) != 1 ||
        SSL_SESSION_set_cipher(session, cipher) != 1 ||
        SSL_SESSION_set_protocol_version(session, TLS1_3_VERSION) != 1) {
        SSL_SESSION_free(session);
        return nullptr;
    }

    return session;
}

int TlsSocket::pskUseSessionCallback(SSL* ssl, const EVP_MD* md,
                                     const unsigned char** id, size_t* idlen,
                                     SSL_SESSION** sess) {
    *sess = nullptr;

    auto* self = static_cast<TlsSocket*>(SSL_get_app_data(ssl));
    if (!self) {
        return 0;
    }

    SSL_SESSION* session = self->buildPskSession(ssl);
    if (!session) {
        return 0;
    }

    // Called again after HelloRetryRequest with the negotiated digest
    if (md != nullptr && SSL_CIPHER_get_handshake_digest(SSL_SESSION_get0_cipher(session)) != md) {
        SSL_SESSION_free(session);
        return 1;
    }

    *id = reinterpret_cast<const unsigned char*>(TLS_PSK_IDENTITY);
    *idlen = std::strlen(TLS_PSK_IDENTITY);
    *sess = session;
    return 1;
}

int TlsSocket::pskFindSessionCallback(SSL* ssl, const unsigned char* identity,
                                      size_t identityLen, SSL_SESSION** sess) {
    *sess = nullptr;

    auto* self = static_cast<TlsSocket*>(SSL_get_app_data(ssl));
    if (!self) {
        return 0;
    }

    const size_t expectedLen = std::strlen(TLS_PSK_IDENTITY);
    if (identityLen != expectedLen || std::memcmp(identity, TLS_PSK_IDENTITY, expectedLen) != 0) {
        // Unknown identity: abort instead of falling back to certificates
        return 0;
    }

    *sess = self->buildPskSession(ssl);
    return *sess ? 1 : 0;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(std::string& errorMsg) {
    if (m_connected) {
        return true;
    }

    if (!createContext(errorMsg)) {
        return false;
    }
    if (!createSsl(errorMsg)) {
        return false;
    }

    ERR_clear_error();
    const int result = (m_role == TlsRole::SERVER) ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
    if (result != 1) {
        errorMsg = "TLS handshake failed: " + describeFailure(result);
        return false;
    }

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Send / Receive
//=============================================================================

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }
    if (!data || size == 0) {
        return true;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const size_t chunkSize = std::min(size - totalSent, TLS_MAX_PACKET_SIZE);
        const int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));
        if (sent <= 0) {
            const int err = SSL_get_error(m_ssl, sent);
            if (err == SSL_ERROR_WANT_WRITE) {
                continue;
            }
            errorMsg = "TLS send failed: " + describeFailure(sent);
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

bool TlsSocket::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }
    if (!buffer || size == 0) {
        return true;
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        const int received = SSL_read(m_ssl, buffer + totalReceived,
                                      static_cast<int>(std::min(size - totalReceived, TLS_MAX_PACKET_SIZE)));
        if (received <= 0) {
            const int err = SSL_get_error(m_ssl, received);
            if (err == SSL_ERROR_ZERO_RETURN) {
                errorMsg = "Connection closed by peer";
                return false;
            }
            if (err == SSL_ERROR_WANT_READ) {
                continue;
            }
            if (err == SSL_ERROR_SYSCALL && received == 0) {
                errorMsg = "Connection closed by peer";
                return false;
            }
            errorMsg = "TLS recv failed: " + describeFailure(received);
            return false;
        }
        totalReceived += static_cast<size_t>(received);
    }

    return true;
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        SSL_shutdown(m_ssl);
        m_connected = false;
    }
}

std::string TlsSocket::cipherName() const {
    if (!m_ssl || !m_connected) {
        return "none";
    }
    const char* name = SSL_get_cipher_name(m_ssl);
    return name ? name : "unknown";
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::getLastError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::getErrorDescription(int sslError) {
    switch (sslError) {
        case SSL_ERROR_NONE:             return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:      return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:        return "SSL_ERROR_WANT_READ";
        case SSL_ERROR_WANT_WRITE:       return "SSL_ERROR_WANT_WRITE";
        case SSL_ERROR_WANT_CONNECT:     return "SSL_ERROR_WANT_CONNECT";
        case SSL_ERROR_WANT_ACCEPT:      return "SSL_ERROR_WANT_ACCEPT";
        case SSL_ERROR_SYSCALL:          return "SSL_ERROR_SYSCALL";
        case SSL_ERROR_SSL:              return "SSL_ERROR_SSL";
        default:                         return "SSL error " + std::to_string(sslError);
    }
}

std::string TlsSocket::describeFailure(int result) const {
    const int savedErrno = errno;
    const int sslError = SSL_get_error(m_ssl, result);

    std::string details = getErrorDescription(sslError);
    if (sslError == SSL_ERROR_SSL) {
        details += ": " + getLastError();
    } else if (sslError == SSL_ERROR_SYSCALL) {
        if (result == 0 || savedErrno == 0) {
            details += ": unexpected EOF";
        } else {
            details += std::string(": ") + std::strerror(savedErrno);
        }
    }
    ERR_clear_error();
    return details;
}

}  // namespace Stork
