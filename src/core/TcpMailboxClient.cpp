/**
 * @file TcpMailboxClient.cpp
 * @brief TCP mailbox client implementation
 */

#include "stork/TcpMailboxClient.h"
#include "stork/CryptoUtils.h"
#include "stork/Debug.h"

#include <nlohmann/json.hpp>

#include <sys/socket.h>

#include <atomic>

namespace Stork {

namespace {

MailboxStatus statusFromString(const std::string& status) {
    if (status == "not-found") return MailboxStatus::NotFound;
    if (status == "full")      return MailboxStatus::Full;
    if (status == "closed")    return MailboxStatus::Closed;
    return MailboxStatus::ProtocolError;
}

class TcpMailboxConnection final : public MailboxConnection {
public:
    explicit TcpMailboxConnection(ScopedSocket socket)
        : m_socket(std::move(socket))
        , m_reader(m_socket.get())
        , m_side(CryptoUtils::randomHex(8))
    {
    }

    ~TcpMailboxConnection() override { release(); }

    const std::string& side() const override { return m_side; }

    MailboxStatus allocate(uint32_t& nameplate, std::string& errorMsg) override {
        return bind({ { "type", "allocate" }, { "side", m_side } }, "allocated", nameplate, errorMsg);
    }

    MailboxStatus claim(uint32_t nameplate, std::string& errorMsg) override {
        uint32_t bound = nameplate;
        return bind({ { "type", "claim" }, { "nameplate", nameplate }, { "side", m_side } },
                    "claimed", bound, errorMsg);
    }

    MailboxStatus send(const std::string& phase, const std::string& body, std::string& errorMsg) override {
        if (!m_bound) {
            errorMsg = "Connection not bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }
        const nlohmann::json request{ { "type", "add" }, { "phase", phase }, { "body", body } };
        if (!sendLine(m_socket.get(), request.dump(), errorMsg)) {
            return m_interrupted.load() ? MailboxStatus::Interrupted : MailboxStatus::Closed;
        }
        return MailboxStatus::Ok;
    }

    MailboxStatus receive(MailboxMessage& message, std::string& errorMsg) override {
        if (!m_bound) {
            errorMsg = "Connection not bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }

        while (true) {
            nlohmann::json reply;
            const MailboxStatus status = readReply(reply, errorMsg);
            if (status != MailboxStatus::Ok) {
                return status;
            }

            const std::string type = reply.value("type", "");
            if (type == "message") {
                message.side = reply.value("side", "");
                message.phase = reply.value("phase", "");
                message.body = reply.value("body", "");
                return MailboxStatus::Ok;
            }
            if (type == "closed") {
                errorMsg = "Peer left the mailbox";
                return MailboxStatus::Closed;
            }
            if (type == "error") {
                errorMsg = "Mailbox error: " + reply.value("message", std::string("unknown"));
                return statusFromString(reply.value("status", ""));
            }
            LOG_DEBUG("[Mailbox] Ignoring unexpected reply type '" << type << "'");
        }
    }

    void interrupt() override {
        m_interrupted.store(true);
        if (m_socket.valid()) {
            ::shutdown(m_socket.get(), SHUT_RD);
        }
    }

    void release() override {
        if (!m_bound || !m_socket.valid()) {
            return;
        }
        m_bound = false;

        // Best effort: the server also releases on disconnect
        std::string err;
        const nlohmann::json request{ { "type", "release" } };
        if (!sendLine(m_socket.get(), request.dump(), err)) {
            LOG_DEBUG("[Mailbox] Release not delivered: " << err);
        }
        ::shutdown(m_socket.get(), SHUT_WR);
    }

private:
    MailboxStatus readReply(nlohmann::json& reply, std::string& errorMsg) {
        if (m_interrupted.load()) {
            errorMsg = "Mailbox connection interrupted";
            return MailboxStatus::Interrupted;
        }

        std::string line;
        if (!m_reader.readLine(line, errorMsg)) {
            if (m_interrupted.load()) {
                errorMsg = "Mailbox connection interrupted";
                return MailboxStatus::Interrupted;
            }
            return MailboxStatus::Closed;
        }

        try {
            reply = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            errorMsg = std::string("Malformed mailbox reply: ") + e.what();
            return MailboxStatus::ProtocolError;
        }
        return MailboxStatus::Ok;
    }

    MailboxStatus bind(const nlohmann::json& request,
                       const std::string& expectedType,
                       uint32_t& nameplate,
                       std::string& errorMsg) {
        if (m_bound) {
            errorMsg = "Connection already bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }
        if (!sendLine(m_socket.get(), request.dump(), errorMsg)) {
            return MailboxStatus::Unreachable;
        }

        nlohmann::json reply;
        const MailboxStatus status = readReply(reply, errorMsg);
        if (status != MailboxStatus::Ok) {
            return status;
        }

        const std::string type = reply.value("type", "");
        if (type == "error") {
            errorMsg = "Mailbox refused " + request.value("type", std::string()) + ": "
                       + reply.value("status", std::string("unknown"));
            return statusFromString(reply.value("status", ""));
        }
        if (type != expectedType || !reply.contains("nameplate")) {
            errorMsg = "Unexpected mailbox reply '" + type + "'";
            return MailboxStatus::ProtocolError;
        }

        nameplate = reply["nameplate"].get<uint32_t>();
        m_bound = true;
        return MailboxStatus::Ok;
    }

    ScopedSocket m_socket;
    LineReader m_reader;
    std::string m_side;
    bool m_bound = false;
    std::atomic<bool> m_interrupted{ false };
};

}  // namespace

TcpMailboxConnector::TcpMailboxConnector(Endpoint endpoint, uint32_t connectTimeoutMs)
    : m_endpoint(std::move(endpoint))
    , m_connectTimeoutMs(connectTimeoutMs)
{
}

bool TcpMailboxConnector::connect(std::unique_ptr<MailboxConnection>& out, std::string& errorMsg) {
    ScopedSocket socket;
    if (!connectWithTimeout(m_endpoint, m_connectTimeoutMs, nullptr, socket, errorMsg)) {
        errorMsg = "Cannot reach mailbox at " + m_endpoint.toString() + ": " + errorMsg;
        return false;
    }
    out = std::make_unique<TcpMailboxConnection>(std::move(socket));
    return true;
}

}  // namespace Stork
