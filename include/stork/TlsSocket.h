/**
 * @file TlsSocket.h
 * @brief TLS 1.3 external-PSK wrapper for transit streams
 */

#pragma once

#include "CryptoUtils.h"

#include <openssl/ssl.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace Stork {

/**
 * @brief Which end of the handshake this socket plays
 *
 * The sending peer is always SERVER, the receiving peer CLIENT, on direct
 * and relayed streams alike.
 */
enum class TlsRole {
    SERVER,
    CLIENT
};

/**
 * @class TlsSocket
 * @brief TLS 1.3 session over a connected TCP socket, keyed by a PSK
 *
 * Both ends derive the same 32-byte PSK from the authenticated channel, so
 * a completed handshake proves the peer holds the session key. No
 * certificates are involved. (EC)DHE is still used for forward secrecy.
 *
 * The TlsSocket does not own the file descriptor.
 *
 * Thread Safety: not thread-safe; one thread drives a TlsSocket. Another
 * thread may shut the underlying socket down to abort blocking calls.
 */
class TlsSocket {
public:
    TlsSocket(int socket, TlsRole role, const SymmetricKey& psk);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Run the full handshake (SSL_accept / SSL_connect)
     */
    bool handshake(std::string& errorMsg);

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Receive exactly @p size bytes
     *
     * Reports "Connection closed by peer" on close_notify or TCP EOF.
     */
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg);

    /// Send close_notify (if connected)
    void shutdown();

    bool isConnected() const { return m_connected; }

    /// Negotiated suite name, or "none" before the handshake
    std::string cipherName() const;

    static std::string getLastError();
    static std::string getErrorDescription(int sslError);

private:
    bool createContext(std::string& errorMsg);
    bool createSsl(std::string& errorMsg);

    /// New PSK session for TLS_AES_128_GCM_SHA256 (caller owns the result)
    SSL_SESSION* buildPskSession(SSL* ssl) const;

    static int pskUseSessionCallback(SSL* ssl, const EVP_MD* md,
                                     const unsigned char** id, size_t* idlen,
                                     SSL_SESSION** sess);
    static int pskFindSessionCallback(SSL* ssl, const unsigned char* identity,
                                      size_t identityLen, SSL_SESSION** sess);

    std::string describeFailure(int result) const;

    int m_socket;
    SSL_CTX* m_ctx;
    SSL* m_ssl;
    TlsRole m_role;
    SymmetricKey m_psk;
    bool m_connected;
};

}  // namespace Stork
