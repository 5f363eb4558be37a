/**
 * @file session_error_test.cpp
 * @brief Unit tests for the error taxonomy
 */

#include "stork/ErrorCodes.h"
#include "stork/SessionError.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace Stork;

TEST(SessionErrorTest, KindFollowsCode)
{
    EXPECT_EQ(errorKindFor(ErrorCode::InvalidCode), ErrorKind::InvalidInput);
    EXPECT_EQ(errorKindFor(ErrorCode::FileNotFound), ErrorKind::InvalidInput);
    EXPECT_EQ(errorKindFor(ErrorCode::MailboxUnreachable), ErrorKind::RendezvousFailed);
    EXPECT_EQ(errorKindFor(ErrorCode::KeyExchangeFailed), ErrorKind::RendezvousFailed);
    EXPECT_EQ(errorKindFor(ErrorCode::NoRouteAvailable), ErrorKind::NegotiationFailed);
    EXPECT_EQ(errorKindFor(ErrorCode::OfferRejected), ErrorKind::NegotiationFailed);
    EXPECT_EQ(errorKindFor(ErrorCode::TruncatedTransfer), ErrorKind::TransferFailed);
    EXPECT_EQ(errorKindFor(ErrorCode::IntegrityMismatch), ErrorKind::TransferFailed);
    EXPECT_EQ(errorKindFor(ErrorCode::NoPeerJoined), ErrorKind::TimedOut);
    EXPECT_EQ(errorKindFor(ErrorCode::TransferTimedOut), ErrorKind::TimedOut);
    EXPECT_EQ(errorKindFor(ErrorCode::Cancelled), ErrorKind::Cancelled);
    EXPECT_EQ(errorKindFor(ErrorCode::InternalError), ErrorKind::Internal);
}

TEST(SessionErrorTest, MakeFillsEveryField)
{
    const SessionError e = SessionError::make(ErrorCode::PeerNotFound, SessionPhase::Rendezvous, "gone");
    EXPECT_TRUE(e.isSet());
    EXPECT_EQ(e.kind, ErrorKind::RendezvousFailed);
    EXPECT_EQ(e.phase, SessionPhase::Rendezvous);
    EXPECT_STREQ(e.stableId(), ErrorCodes::PEER_NOT_FOUND);
}

TEST(SessionErrorTest, StableIdsAreUnique)
{
    std::set<std::string> ids;
    for (int c = static_cast<int>(ErrorCode::InvalidCode); c <= static_cast<int>(ErrorCode::InternalError); ++c) {
        SessionError e = SessionError::make(static_cast<ErrorCode>(c), SessionPhase::Setup, "x");
        const std::string id = e.stableId();
        EXPECT_EQ(id.rfind("STK-", 0), 0u) << errorCodeToString(e.code);
        EXPECT_TRUE(ids.insert(id).second) << "duplicate " << id;
    }
}

TEST(SessionErrorTest, DescribeIncludesByteCountsForTransferFailures)
{
    SessionError e = SessionError::make(ErrorCode::TruncatedTransfer, SessionPhase::Transferring,
                                        "Connection closed by peer");
    e.bytesMoved = 10;
    e.bytesExpected = 20;

    const std::string text = e.describe();
    EXPECT_NE(text.find(ErrorCodes::TRUNCATED_TRANSFER), std::string::npos);
    EXPECT_NE(text.find("Transferring"), std::string::npos);
    EXPECT_NE(text.find("moved 10 of 20 bytes"), std::string::npos);
}

TEST(SessionErrorTest, DescribeListsAttemptedTransports)
{
    SessionError e = SessionError::make(ErrorCode::NoRouteAvailable, SessionPhase::Negotiating, "no route");
    e.attempted = { "direct-tcp-v1 10.0.0.2:5000", "relay-v1 127.0.0.1:4001" };

    const std::string text = e.describe();
    EXPECT_NE(text.find("direct-tcp-v1 10.0.0.2:5000"), std::string::npos);
    EXPECT_NE(text.find("relay-v1"), std::string::npos);

    e.attempted.clear();
    EXPECT_NE(e.describe().find("attempted: none"), std::string::npos);
}
