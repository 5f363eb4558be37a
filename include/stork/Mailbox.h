/**
 * @file Mailbox.h
 * @brief Rendezvous (mailbox) service contract
 *
 * The mailbox is a low-bandwidth relay for the handshake messages of two
 * peers that share a nameplate. It never sees file content. CodeChannel
 * consumes it only through these two interfaces, so the wire protocol behind
 * them (in-process hub, TCP JSON lines) is interchangeable.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace Stork {

/**
 * @brief Result of a mailbox operation
 */
enum class MailboxStatus : uint8_t {
    Ok,
    NotFound,       ///< Nameplate unknown, expired or released
    Full,           ///< Nameplate already has two sides
    Unreachable,    ///< Service could not be contacted
    Closed,         ///< Peer left, or the connection dropped
    Interrupted,    ///< interrupt() was called
    ProtocolError   ///< Unexpected or malformed reply
};

std::string mailboxStatusToString(MailboxStatus status);

/**
 * @brief One message relayed through the mailbox
 *
 * @p body is opaque to the mailbox (hex or sealed payloads).
 */
struct MailboxMessage {
    std::string side;
    std::string phase;
    std::string body;
};

/**
 * @brief One side's attachment to the mailbox service
 *
 * A connection is bound to at most one nameplate, either by allocate() or by
 * claim(). Messages sent by this side are delivered to the other side only;
 * messages sent before the other side arrives are kept for it.
 *
 * Thread Safety:
 * - interrupt() may be called from any thread and is sticky: a receive()
 *   that starts after interrupt() returns Interrupted immediately.
 * - All other methods are called from the owning session thread.
 */
class MailboxConnection {
public:
    virtual ~MailboxConnection() = default;

    /// Random per-connection side id (hex)
    virtual const std::string& side() const = 0;

    /// Create a new nameplate and bind this connection to it
    virtual MailboxStatus allocate(uint32_t& nameplate, std::string& errorMsg) = 0;

    /// Bind this connection to an existing nameplate as the second side
    virtual MailboxStatus claim(uint32_t nameplate, std::string& errorMsg) = 0;

    /// Queue a message for the other side
    virtual MailboxStatus send(const std::string& phase,
                               const std::string& body,
                               std::string& errorMsg) = 0;

    /// Block until the other side's next message arrives
    virtual MailboxStatus receive(MailboxMessage& message, std::string& errorMsg) = 0;

    /// Unblock receive() (sticky)
    virtual void interrupt() = 0;

    /**
     * @brief Leave the nameplate
     *
     * A nameplate released before a second side claimed it is deleted, so
     * its code can no longer be used. Idempotent.
     */
    virtual void release() = 0;
};

/**
 * @brief Factory for mailbox connections
 */
class MailboxConnector {
public:
    virtual ~MailboxConnector() = default;

    /**
     * @brief Open a new connection to the mailbox service
     * @return false (with errorMsg) if the service is unreachable
     */
    virtual bool connect(std::unique_ptr<MailboxConnection>& out, std::string& errorMsg) = 0;

    /// Human-readable location, e.g. "tcp://127.0.0.1:4000"
    virtual std::string describe() const = 0;
};

}  // namespace Stork
