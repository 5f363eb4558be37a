/**
 * @file mailbox_hub_test.cpp
 * @brief Unit tests for the in-process nameplate store
 */

#include "stork/MailboxHub.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace Stork;
using namespace std::chrono_literals;

TEST(MailboxHubTest, AllocatesLowestFreeNameplate)
{
    MailboxHub hub;
    uint32_t a = 0;
    uint32_t b = 0;
    uint32_t c = 0;
    ASSERT_EQ(hub.allocate("s1", a), MailboxStatus::Ok);
    ASSERT_EQ(hub.allocate("s2", b), MailboxStatus::Ok);
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);

    hub.release(a, "s1");
    ASSERT_EQ(hub.allocate("s3", c), MailboxStatus::Ok);
    EXPECT_EQ(c, 1u);
}

TEST(MailboxHubTest, NameplateHoldsAtMostTwoSides)
{
    MailboxHub hub;
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    EXPECT_EQ(hub.claim(n, "receiver"), MailboxStatus::Ok);
    EXPECT_EQ(hub.claim(n, "intruder"), MailboxStatus::Full);
    EXPECT_EQ(hub.claim(n, "receiver"), MailboxStatus::Ok);  // idempotent for the same side
}

TEST(MailboxHubTest, ClaimUnknownNameplateIsNotFound)
{
    MailboxHub hub;
    EXPECT_EQ(hub.claim(99, "receiver"), MailboxStatus::NotFound);
}

TEST(MailboxHubTest, MessagesQueuedBeforeClaimAreDelivered)
{
    MailboxHub hub;
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    ASSERT_EQ(hub.add(n, "sender", "pake", "aa"), MailboxStatus::Ok);
    ASSERT_EQ(hub.add(n, "sender", "confirm", "bb"), MailboxStatus::Ok);
    ASSERT_EQ(hub.claim(n, "receiver"), MailboxStatus::Ok);

    std::atomic<bool> interrupted{ false };
    MailboxMessage m;
    ASSERT_EQ(hub.receive(n, "receiver", m, interrupted), MailboxStatus::Ok);
    EXPECT_EQ(m.phase, "pake");
    EXPECT_EQ(m.body, "aa");
    ASSERT_EQ(hub.receive(n, "receiver", m, interrupted), MailboxStatus::Ok);
    EXPECT_EQ(m.phase, "confirm");
}

TEST(MailboxHubTest, SideNeverReceivesItsOwnMessages)
{
    MailboxHub hub;
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    ASSERT_EQ(hub.claim(n, "receiver"), MailboxStatus::Ok);
    ASSERT_EQ(hub.add(n, "sender", "offer", "x"), MailboxStatus::Ok);
    ASSERT_EQ(hub.add(n, "receiver", "answer", "y"), MailboxStatus::Ok);

    std::atomic<bool> interrupted{ false };
    MailboxMessage m;
    ASSERT_EQ(hub.receive(n, "sender", m, interrupted), MailboxStatus::Ok);
    EXPECT_EQ(m.side, "receiver");
    EXPECT_EQ(m.phase, "answer");
}

TEST(MailboxHubTest, ReleasingUnclaimedNameplateDeletesIt)
{
    MailboxHub hub;
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    hub.release(n, "sender");
    EXPECT_FALSE(hub.hasNameplate(n));
    EXPECT_EQ(hub.claim(n, "receiver"), MailboxStatus::NotFound);
}

TEST(MailboxHubTest, UnclaimedNameplateExpires)
{
    MailboxHub hub(50ms);
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(hub.claim(n, "receiver"), MailboxStatus::NotFound);
}

TEST(MailboxHubTest, ClaimedNameplateDoesNotExpire)
{
    MailboxHub hub(50ms);
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    ASSERT_EQ(hub.claim(n, "receiver"), MailboxStatus::Ok);
    std::this_thread::sleep_for(80ms);

    uint32_t other = 0;
    ASSERT_EQ(hub.allocate("third", other), MailboxStatus::Ok);  // triggers the purge
    EXPECT_TRUE(hub.hasNameplate(n));
}

TEST(MailboxHubTest, PeerDepartureDrainsThenCloses)
{
    MailboxHub hub;
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);
    ASSERT_EQ(hub.claim(n, "receiver"), MailboxStatus::Ok);
    ASSERT_EQ(hub.add(n, "sender", "offer", "x"), MailboxStatus::Ok);
    hub.release(n, "sender");

    std::atomic<bool> interrupted{ false };
    MailboxMessage m;
    EXPECT_EQ(hub.receive(n, "receiver", m, interrupted), MailboxStatus::Ok);
    EXPECT_EQ(hub.receive(n, "receiver", m, interrupted), MailboxStatus::Closed);
}

TEST(MailboxHubTest, InterruptUnblocksReceive)
{
    MailboxHub hub;
    uint32_t n = 0;
    ASSERT_EQ(hub.allocate("sender", n), MailboxStatus::Ok);

    std::atomic<bool> interrupted{ false };
    std::thread waker([&]() {
        std::this_thread::sleep_for(50ms);
        interrupted.store(true);
        hub.wakeAll();
    });

    MailboxMessage m;
    EXPECT_EQ(hub.receive(n, "sender", m, interrupted), MailboxStatus::Interrupted);
    waker.join();
}

TEST(MailboxHubTest, LocalConnectorRoundTrip)
{
    auto hub = std::make_shared<MailboxHub>();
    LocalMailboxConnector connector(hub);

    std::unique_ptr<MailboxConnection> a;
    std::unique_ptr<MailboxConnection> b;
    std::string err;
    ASSERT_TRUE(connector.connect(a, err)) << err;
    ASSERT_TRUE(connector.connect(b, err)) << err;
    EXPECT_NE(a->side(), b->side());

    uint32_t n = 0;
    ASSERT_EQ(a->allocate(n, err), MailboxStatus::Ok) << err;
    ASSERT_EQ(b->claim(n, err), MailboxStatus::Ok) << err;
    ASSERT_EQ(a->send("hello", "body", err), MailboxStatus::Ok) << err;

    MailboxMessage m;
    ASSERT_EQ(b->receive(m, err), MailboxStatus::Ok) << err;
    EXPECT_EQ(m.phase, "hello");
    EXPECT_EQ(m.body, "body");

    a.reset();  // destructor releases
    EXPECT_EQ(b->receive(m, err), MailboxStatus::Closed);
}
