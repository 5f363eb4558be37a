/**
 * @file mailbox_server_test.cpp
 * @brief Loopback tests for the TCP mailbox server and client
 */

#include "stork/MailboxServer.h"
#include "stork/TcpMailboxClient.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace Stork;
using namespace std::chrono_literals;

class MailboxServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_hub = std::make_shared<MailboxHub>();
        m_server = std::make_unique<MailboxServer>(m_hub, "127.0.0.1", 0);
        std::string err;
        ASSERT_TRUE(m_server->start(err)) << err;
        m_connector = std::make_unique<TcpMailboxConnector>(
            Endpoint{ "127.0.0.1", m_server->port() }, 2000);
    }

    void TearDown() override {
        m_server->stop();
    }

    std::unique_ptr<MailboxConnection> connect() {
        std::unique_ptr<MailboxConnection> connection;
        std::string err;
        EXPECT_TRUE(m_connector->connect(connection, err)) << err;
        return connection;
    }

    std::shared_ptr<MailboxHub> m_hub;
    std::unique_ptr<MailboxServer> m_server;
    std::unique_ptr<TcpMailboxConnector> m_connector;
};

TEST_F(MailboxServerTest, AllocateClaimAndExchange)
{
    auto sender = connect();
    auto receiver = connect();
    ASSERT_TRUE(sender && receiver);

    std::string err;
    uint32_t nameplate = 0;
    ASSERT_EQ(sender->allocate(nameplate, err), MailboxStatus::Ok) << err;
    EXPECT_EQ(nameplate, 1u);

    ASSERT_EQ(sender->send("pake", "abcd", err), MailboxStatus::Ok) << err;
    ASSERT_EQ(receiver->claim(nameplate, err), MailboxStatus::Ok) << err;
    ASSERT_EQ(receiver->send("pake", "ef01", err), MailboxStatus::Ok) << err;

    MailboxMessage m;
    ASSERT_EQ(receiver->receive(m, err), MailboxStatus::Ok) << err;
    EXPECT_EQ(m.phase, "pake");
    EXPECT_EQ(m.body, "abcd");
    EXPECT_EQ(m.side, sender->side());

    ASSERT_EQ(sender->receive(m, err), MailboxStatus::Ok) << err;
    EXPECT_EQ(m.body, "ef01");
}

TEST_F(MailboxServerTest, ClaimUnknownNameplateFails)
{
    auto receiver = connect();
    ASSERT_TRUE(receiver);

    std::string err;
    EXPECT_EQ(receiver->claim(77, err), MailboxStatus::NotFound);
    EXPECT_FALSE(err.empty());
}

TEST_F(MailboxServerTest, ThirdSideIsRefused)
{
    auto a = connect();
    auto b = connect();
    auto c = connect();
    std::string err;
    uint32_t nameplate = 0;
    ASSERT_EQ(a->allocate(nameplate, err), MailboxStatus::Ok) << err;
    ASSERT_EQ(b->claim(nameplate, err), MailboxStatus::Ok) << err;
    EXPECT_EQ(c->claim(nameplate, err), MailboxStatus::Full);
}

TEST_F(MailboxServerTest, ReleaseBeforeClaimDeletesNameplate)
{
    auto sender = connect();
    std::string err;
    uint32_t nameplate = 0;
    ASSERT_EQ(sender->allocate(nameplate, err), MailboxStatus::Ok) << err;
    sender->release();

    // The server processes the release asynchronously
    for (int i = 0; i < 50 && m_hub->hasNameplate(nameplate); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(m_hub->hasNameplate(nameplate));

    auto receiver = connect();
    EXPECT_EQ(receiver->claim(nameplate, err), MailboxStatus::NotFound);
}

TEST_F(MailboxServerTest, PeerDisconnectSurfacesAsClosed)
{
    auto sender = connect();
    auto receiver = connect();
    std::string err;
    uint32_t nameplate = 0;
    ASSERT_EQ(sender->allocate(nameplate, err), MailboxStatus::Ok) << err;
    ASSERT_EQ(receiver->claim(nameplate, err), MailboxStatus::Ok) << err;

    sender.reset();

    MailboxMessage m;
    EXPECT_EQ(receiver->receive(m, err), MailboxStatus::Closed);
}

TEST_F(MailboxServerTest, InterruptUnblocksReceive)
{
    auto sender = connect();
    std::string err;
    uint32_t nameplate = 0;
    ASSERT_EQ(sender->allocate(nameplate, err), MailboxStatus::Ok) << err;

    std::thread interrupter([&]() {
        std::this_thread::sleep_for(50ms);
        sender->interrupt();
    });

    MailboxMessage m;
    EXPECT_EQ(sender->receive(m, err), MailboxStatus::Interrupted);
    interrupter.join();
}

TEST(MailboxServerStandaloneTest, UnreachableServerFailsToConnect)
{
    // Reserve a port, then free it so nothing listens there
    ScopedSocket reserved;
    uint16_t port = 0;
    std::string err;
    ASSERT_TRUE(listenTcp("127.0.0.1", 0, reserved, port, err)) << err;
    reserved.reset();

    TcpMailboxConnector connector(Endpoint{ "127.0.0.1", port }, 500);
    std::unique_ptr<MailboxConnection> connection;
    EXPECT_FALSE(connector.connect(connection, err));
    EXPECT_NE(err.find("Cannot reach mailbox"), std::string::npos);
}

TEST(MailboxServerStandaloneTest, StopIsIdempotent)
{
    MailboxServer server(std::make_shared<MailboxHub>(), "127.0.0.1", 0);
    std::string err;
    ASSERT_TRUE(server.start(err)) << err;
    EXPECT_TRUE(server.isRunning());
    EXPECT_NE(server.port(), 0);
    server.stop();
    server.stop();
    EXPECT_FALSE(server.isRunning());
}
