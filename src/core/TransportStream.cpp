/**
 * @file TransportStream.cpp
 * @brief PlainSocketStream and TlsTransportStream
 */

#include "stork/TransportStream.h"

namespace Stork {

//=============================================================================
// PlainSocketStream
//=============================================================================

bool PlainSocketStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return Stork::sendExact(m_socket, data, size, errorMsg);
}

bool PlainSocketStream::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return Stork::recvExact(m_socket, buffer, size, errorMsg);
}

void PlainSocketStream::interrupt() {
    shutdownSocket(m_socket);
}

//=============================================================================
// TlsTransportStream
//=============================================================================

TlsTransportStream::TlsTransportStream(ScopedSocket socket,
                                       std::unique_ptr<TlsSocket> tls,
                                       std::string transport,
                                       std::string peer)
    : m_socket(std::move(socket))
    , m_tls(std::move(tls))
    , m_transport(std::move(transport))
    , m_peer(std::move(peer))
{
}

TlsTransportStream::~TlsTransportStream() {
    // TLS state goes before the descriptor it writes to
    m_tls.reset();
    m_socket.reset();
}

bool TlsTransportStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return m_tls->sendExact(data, size, errorMsg);
}

bool TlsTransportStream::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return m_tls->recvExact(buffer, size, errorMsg);
}

void TlsTransportStream::shutdown() {
    m_tls->shutdown();
}

void TlsTransportStream::interrupt() {
    shutdownSocket(m_socket.get());
}

}  // namespace Stork
