/**
 * @file TransportStream.h
 * @brief Minimal transport abstraction for plain sockets and TLS sockets
 */

#pragma once

#include "TcpSocket.h"
#include "TlsSocket.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Stork {

/**
 * @brief Minimal stream interface used by the file streaming protocol.
 *
 * The protocol needs exact-length reads and writes for the fixed-size digest
 * and verdict frames as well as for streaming chunks. This interface hides
 * whether the bytes travel over plain TCP (tests) or TLS (every negotiated
 * transit).
 *
 * interrupt() may be called from any thread and makes blocked or later
 * calls fail; everything else belongs to one thread.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;
    virtual void shutdown() {}
    virtual void interrupt() = 0;
    virtual bool isTls() const { return false; }

    /// Transport ability name ("direct-tcp-v1", "relay-v1", "plain")
    virtual std::string transport() const = 0;

    /// Remote endpoint as "host:port"
    virtual std::string peer() const = 0;
};

/**
 * @brief Unencrypted stream over a socket it does not own (tests only)
 */
class PlainSocketStream final : public TransportStream {
public:
    explicit PlainSocketStream(int socket) : m_socket(socket) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    void interrupt() override;
    std::string transport() const override { return "plain"; }
    std::string peer() const override { return "socket:" + std::to_string(m_socket); }

private:
    int m_socket;
};

/**
 * @brief TLS stream produced by transit negotiation
 *
 * Owns both the TCP socket and the TLS session on top of it.
 */
class TlsTransportStream final : public TransportStream {
public:
    TlsTransportStream(ScopedSocket socket,
                       std::unique_ptr<TlsSocket> tls,
                       std::string transport,
                       std::string peer);
    ~TlsTransportStream() override;

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    void shutdown() override;
    void interrupt() override;
    bool isTls() const override { return true; }
    std::string transport() const override { return m_transport; }
    std::string peer() const override { return m_peer; }

private:
    ScopedSocket m_socket;
    std::unique_ptr<TlsSocket> m_tls;
    std::string m_transport;
    std::string m_peer;
};

}  // namespace Stork
