/**
 * @file TcpMailboxClient.h
 * @brief MailboxConnector speaking the MailboxServer JSON-lines protocol
 */

#pragma once

#include "Mailbox.h"
#include "TcpSocket.h"

#include <string>

namespace Stork {

/**
 * @class TcpMailboxConnector
 * @brief Opens one TCP connection to a mailbox server per MailboxConnection
 *
 * Each connection gets a fresh random side id. interrupt() half-closes the
 * read side so a blocked receive() returns while release() can still be
 * written to the server.
 */
class TcpMailboxConnector final : public MailboxConnector {
public:
    TcpMailboxConnector(Endpoint endpoint, uint32_t connectTimeoutMs);

    bool connect(std::unique_ptr<MailboxConnection>& out, std::string& errorMsg) override;
    std::string describe() const override { return "tcp://" + m_endpoint.toString(); }

private:
    Endpoint m_endpoint;
    uint32_t m_connectTimeoutMs;
};

}  // namespace Stork
