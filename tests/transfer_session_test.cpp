/**
 * @file transfer_session_test.cpp
 * @brief End-to-end sessions over an in-process mailbox and loopback TCP
 */

#include "stork/MailboxHub.h"
#include "stork/TransferSession.h"

#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace Stork;
using namespace std::chrono_literals;

namespace {

class CountingConnector final : public MailboxConnector {
public:
    explicit CountingConnector(std::shared_ptr<MailboxHub> hub) : m_inner(std::move(hub)) {}

    bool connect(std::unique_ptr<MailboxConnection>& out, std::string& errorMsg) override {
        connects.fetch_add(1);
        return m_inner.connect(out, errorMsg);
    }
    std::string describe() const override { return "counting"; }

    std::atomic<int> connects{ 0 };

private:
    LocalMailboxConnector m_inner;
};

void writePattern(const std::filesystem::path& path, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::vector<char> block(64 * 1024);
    for (size_t i = 0; i < block.size(); ++i) {
        block[i] = static_cast<char>(i % 251);
    }
    size_t left = size;
    while (left > 0) {
        const size_t n = std::min(left, block.size());
        out.write(block.data(), static_cast<std::streamsize>(n));
        left -= n;
    }
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool hasPartFiles(const std::filesystem::path& dir) {
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".part") {
            return true;
        }
    }
    return false;
}

}  // namespace

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_hub = std::make_shared<MailboxHub>();
        m_connector = std::make_shared<CountingConnector>(m_hub);

        m_dir = std::filesystem::temp_directory_path() /
                ("stork_session_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir / "in");
        std::filesystem::create_directories(m_dir / "out");
    }

    void TearDown() override {
        m_supervisor.shutdown();
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    SessionOptions options() const {
        SessionOptions opts;
        opts.connector = m_connector;
        opts.transit.abilities.relay = false;
        opts.transit.listenHost = "127.0.0.1";
        opts.transit.advertiseHosts = { "127.0.0.1" };
        opts.timeouts.awaitPeer = 10s;
        opts.timeouts.join = 10s;
        opts.timeouts.senderNegotiation = 10s;
        opts.timeouts.receiverNegotiation = 10s;
        opts.timeouts.transferMin = 30s;
        return opts;
    }

    std::filesystem::path inDir() const { return m_dir / "in"; }
    std::filesystem::path outDir() const { return m_dir / "out"; }

    std::shared_ptr<MailboxHub> m_hub;
    std::shared_ptr<CountingConnector> m_connector;
    SessionSupervisor m_supervisor;
    std::filesystem::path m_dir;
};

TEST_F(TransferSessionTest, SendAndReceiveDeliversIdenticalFile)
{
    const auto source = inDir() / "report.pdf";
    writePattern(source, 300 * 1024 + 17);

    auto history = std::make_shared<TransferHistory>(m_dir / "history.json");
    SessionOptions senderOptions = options();
    senderOptions.history = history;

    TransferSession sender(senderOptions, m_supervisor);
    std::atomic<int> senderCompletions{ 0 };
    sender.setCompletionCallback([&](const std::string&, const TransferOutcome&) {
        senderCompletions.fetch_add(1);
    });

    IntroductionCode code;
    SessionError error;
    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_TRUE(code.isValid());
    EXPECT_EQ(sender.getStatus(), SessionStatus::AWAITING_PEER);
    EXPECT_EQ(sender.getType(), SessionType::OUTGOING);

    TransferSession receiver(options(), m_supervisor);
    std::string savedPath;
    ASSERT_TRUE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error))
        << error.describe();
    EXPECT_EQ(receiver.getStatus(), SessionStatus::COMPLETED);
    EXPECT_EQ(std::filesystem::path(savedPath), outDir() / "report.pdf");
    EXPECT_EQ(readAll(savedPath), readAll(source));

    const TransferOutcome outcome = sender.outcome().get();
    EXPECT_TRUE(outcome.completed());
    EXPECT_EQ(outcome.transport, ABILITY_DIRECT_TCP);
    EXPECT_EQ(outcome.bytesMoved, std::filesystem::file_size(source));
    EXPECT_EQ(sender.getStatus(), SessionStatus::COMPLETED);

    // A late cancel changes nothing
    sender.cancel();
    EXPECT_EQ(sender.getStatus(), SessionStatus::COMPLETED);
    ASSERT_TRUE(m_supervisor.waitIdle(5s));
    EXPECT_EQ(senderCompletions.load(), 1);

    const auto records = history->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].status, "completed");
    EXPECT_EQ(records[0].direction, TransferDirection::Send);
    EXPECT_EQ(records[0].transport, ABILITY_DIRECT_TCP);
}

TEST_F(TransferSessionTest, CollidingNameGetsSuffix)
{
    const auto source = inDir() / "notes.txt";
    writePattern(source, 100);
    writePattern(outDir() / "notes.txt", 5);

    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    TransferSession receiver(options(), m_supervisor);
    std::string savedPath;
    ASSERT_TRUE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error))
        << error.describe();
    EXPECT_EQ(std::filesystem::path(savedPath), outDir() / "notes (1).txt");
    EXPECT_EQ(std::filesystem::file_size(outDir() / "notes.txt"), 5u);
    EXPECT_TRUE(sender.outcome().get().completed());
}

TEST_F(TransferSessionTest, MissingFileFailsBeforeAnyCode)
{
    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    EXPECT_FALSE(sender.beginSend((inDir() / "missing.bin").string(), code, error));
    EXPECT_EQ(error.code, ErrorCode::FileNotFound);
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
    EXPECT_FALSE(code.isValid());
    EXPECT_EQ(m_connector->connects.load(), 0);

    const TransferOutcome outcome = sender.outcome().get();
    EXPECT_EQ(outcome.result, TransferOutcome::Result::Failed);
    EXPECT_EQ(sender.getStatus(), SessionStatus::FAILED);
}

TEST_F(TransferSessionTest, MalformedCodeFailsWithoutNetwork)
{
    TransferSession receiver(options(), m_supervisor);
    std::string savedPath;
    SessionError error;
    EXPECT_FALSE(receiver.beginReceive("not a code", outDir().string(), savedPath, error));
    EXPECT_EQ(error.code, ErrorCode::InvalidCode);
    EXPECT_EQ(error.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(error.phase, SessionPhase::Setup);
    EXPECT_EQ(m_connector->connects.load(), 0);
    EXPECT_TRUE(savedPath.empty());
}

TEST_F(TransferSessionTest, UnjoinedCodeTimesOutAndIsReleased)
{
    const auto source = inDir() / "lonely.bin";
    writePattern(source, 10);

    SessionOptions senderOptions = options();
    senderOptions.timeouts.awaitPeer = 200ms;
    TransferSession sender(senderOptions, m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    auto outcome = sender.outcome();
    ASSERT_EQ(outcome.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(outcome.get().error.code, ErrorCode::NoPeerJoined);
    EXPECT_EQ(outcome.get().error.kind, ErrorKind::TimedOut);
    EXPECT_EQ(outcome.get().error.phase, SessionPhase::AwaitingPeer);
    ASSERT_TRUE(m_supervisor.waitIdle(5s));

    TransferSession receiver(options(), m_supervisor);
    std::string savedPath;
    EXPECT_FALSE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error));
    EXPECT_EQ(error.kind, ErrorKind::RendezvousFailed);
}

TEST_F(TransferSessionTest, CancelWhileAwaitingPeer)
{
    const auto source = inDir() / "pending.bin";
    writePattern(source, 10);

    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    sender.cancel();
    auto outcome = sender.outcome();
    ASSERT_EQ(outcome.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(outcome.get().result, TransferOutcome::Result::Cancelled);
    EXPECT_EQ(outcome.get().error.kind, ErrorKind::Cancelled);
    EXPECT_EQ(sender.getStatus(), SessionStatus::CANCELLED);
}

TEST_F(TransferSessionTest, CancelMidTransferLeavesNoFile)
{
    const auto source = inDir() / "big.bin";
    writePattern(source, 8 * 1024 * 1024);

    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    TransferSession receiver(options(), m_supervisor);
    std::atomic<bool> cancelled{ false };
    receiver.setProgressSink(std::make_shared<CallbackProgressSink>([&](uint64_t moved, uint64_t) {
        if (moved > 0 && !cancelled.exchange(true)) {
            receiver.cancel();
        }
    }));

    std::string savedPath;
    EXPECT_FALSE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error));
    EXPECT_EQ(error.code, ErrorCode::Cancelled);
    EXPECT_EQ(receiver.getStatus(), SessionStatus::CANCELLED);
    EXPECT_EQ(receiver.outcome().get().result, TransferOutcome::Result::Cancelled);

    EXPECT_FALSE(std::filesystem::exists(outDir() / "big.bin"));
    EXPECT_FALSE(hasPartFiles(outDir()));

    auto senderOutcome = sender.outcome();
    ASSERT_EQ(senderOutcome.wait_for(30s), std::future_status::ready);
    EXPECT_FALSE(senderOutcome.get().completed());
}

TEST_F(TransferSessionTest, DeclinedOfferIsRejectedOnBothSides)
{
    const auto source = inDir() / "unwanted.iso";
    writePattern(source, 1000);

    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    TransferSession receiver(options(), m_supervisor);
    TransferOffer seen;
    receiver.setOfferPolicy([&](const TransferOffer& offer, std::string& reason) {
        seen = offer;
        reason = "no disk images";
        return false;
    });

    std::string savedPath;
    EXPECT_FALSE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error));
    EXPECT_EQ(error.code, ErrorCode::OfferRejected);
    EXPECT_EQ(seen.fileName, "unwanted.iso");
    EXPECT_EQ(seen.fileSize, 1000u);

    const TransferOutcome outcome = sender.outcome().get();
    EXPECT_EQ(outcome.error.code, ErrorCode::OfferRejected);
    EXPECT_EQ(outcome.error.kind, ErrorKind::NegotiationFailed);
    EXPECT_NE(outcome.error.message.find("no disk images"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(outDir() / "unwanted.iso"));
}

TEST_F(TransferSessionTest, ConcurrentSessionsAreIndependent)
{
    const auto sourceA = inDir() / "a.bin";
    const auto sourceB = inDir() / "b.bin";
    writePattern(sourceA, 200 * 1024);
    writePattern(sourceB, 50 * 1024 + 3);

    TransferSession senderA(options(), m_supervisor);
    TransferSession senderB(options(), m_supervisor);
    IntroductionCode codeA;
    IntroductionCode codeB;
    SessionError error;
    ASSERT_TRUE(senderA.beginSend(sourceA.string(), codeA, error)) << error.describe();
    ASSERT_TRUE(senderB.beginSend(sourceB.string(), codeB, error)) << error.describe();
    EXPECT_NE(codeA.nameplate(), codeB.nameplate());
    EXPECT_NE(senderA.getSessionId(), senderB.getSessionId());

    auto receive = [&](const IntroductionCode& code) {
        TransferSession receiver(options(), m_supervisor);
        std::string savedPath;
        SessionError e;
        return receiver.beginReceive(code.toString(), outDir().string(), savedPath, e) ? savedPath
                                                                                        : std::string();
    };
    auto pathB = std::async(std::launch::async, receive, codeB);
    auto pathA = std::async(std::launch::async, receive, codeA);

    EXPECT_EQ(std::filesystem::path(pathA.get()), outDir() / "a.bin");
    EXPECT_EQ(std::filesystem::path(pathB.get()), outDir() / "b.bin");
    EXPECT_TRUE(senderA.outcome().get().completed());
    EXPECT_TRUE(senderB.outcome().get().completed());
    EXPECT_EQ(readAll(outDir() / "a.bin"), readAll(sourceA));
    EXPECT_EQ(readAll(outDir() / "b.bin"), readAll(sourceB));
}

TEST_F(TransferSessionTest, SenderTaskOutlivesHandle)
{
    const auto source = inDir() / "detached.bin";
    writePattern(source, 4096);

    IntroductionCode code;
    std::shared_future<TransferOutcome> outcome;
    {
        TransferSession sender(options(), m_supervisor);
        SessionError error;
        ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();
        outcome = sender.outcome();
    }
    EXPECT_EQ(m_supervisor.activeCount(), 1u);

    TransferSession receiver(options(), m_supervisor);
    std::string savedPath;
    SessionError error;
    ASSERT_TRUE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error))
        << error.describe();
    EXPECT_TRUE(outcome.get().completed());
}

TEST_F(TransferSessionTest, HandleStartsAtMostOneSession)
{
    const auto source = inDir() / "once.bin";
    writePattern(source, 10);

    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    IntroductionCode second;
    EXPECT_FALSE(sender.beginSend(source.string(), second, error));
    EXPECT_EQ(error.code, ErrorCode::InvalidState);
    sender.cancel();
}

TEST_F(TransferSessionTest, SilentNameplateOwnerGivesJoinTimeout)
{
    // The owner allocates but never starts the key exchange
    std::unique_ptr<MailboxConnection> owner;
    std::string err;
    ASSERT_TRUE(m_connector->connect(owner, err)) << err;
    uint32_t nameplate = 0;
    ASSERT_EQ(owner->allocate(nameplate, err), MailboxStatus::Ok) << err;
    IntroductionCode code;
    ASSERT_TRUE(IntroductionCode::generate(nameplate, 2, code, err)) << err;

    SessionOptions receiverOptions = options();
    receiverOptions.timeouts.join = 300ms;
    TransferSession receiver(receiverOptions, m_supervisor);
    std::vector<SessionStatus> statuses;
    receiver.setStatusCallback([&](const std::string&, SessionStatus status) {
        statuses.push_back(status);
    });

    std::string savedPath;
    SessionError error;
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(error.code, ErrorCode::JoinTimedOut);
    EXPECT_EQ(error.kind, ErrorKind::TimedOut);
    EXPECT_EQ(error.phase, SessionPhase::Rendezvous);
    EXPECT_EQ(receiver.getStatus(), SessionStatus::FAILED);
    EXPECT_EQ(receiver.outcome().get().error.code, ErrorCode::JoinTimedOut);

    // Negotiating is entered only after a successful join
    EXPECT_EQ(statuses, (std::vector<SessionStatus>{ SessionStatus::FAILED }));

    owner->release();
}

TEST_F(TransferSessionTest, SlowOfferDecisionGivesNegotiationTimeout)
{
    const auto source = inDir() / "pondered.bin";
    writePattern(source, 1000);

    SessionOptions senderOptions = options();
    senderOptions.timeouts.senderNegotiation = 3s;
    TransferSession sender(senderOptions, m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    SessionOptions receiverOptions = options();
    receiverOptions.timeouts.receiverNegotiation = 300ms;
    TransferSession receiver(receiverOptions, m_supervisor);
    receiver.setOfferPolicy([](const TransferOffer&, std::string&) {
        std::this_thread::sleep_for(800ms);
        return true;
    });

    std::vector<SessionStatus> statuses;
    receiver.setStatusCallback([&](const std::string&, SessionStatus status) {
        statuses.push_back(status);
    });

    std::string savedPath;
    EXPECT_FALSE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error));
    EXPECT_EQ(error.code, ErrorCode::NegotiationTimedOut);
    EXPECT_EQ(error.kind, ErrorKind::TimedOut);
    EXPECT_EQ(error.phase, SessionPhase::Negotiating);
    EXPECT_EQ(receiver.outcome().get().result, TransferOutcome::Result::Failed);
    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses.front(), SessionStatus::NEGOTIATING);
    EXPECT_EQ(statuses.back(), SessionStatus::FAILED);

    auto senderOutcome = sender.outcome();
    ASSERT_EQ(senderOutcome.wait_for(15s), std::future_status::ready);
    EXPECT_FALSE(senderOutcome.get().completed());
    EXPECT_FALSE(std::filesystem::exists(outDir() / "pondered.bin"));
}

TEST_F(TransferSessionTest, SlowReceiverGivesTransferTimeout)
{
    const auto source = inDir() / "crawl.bin";
    writePattern(source, 2 * 1024 * 1024);

    TransferSession sender(options(), m_supervisor);
    IntroductionCode code;
    SessionError error;
    ASSERT_TRUE(sender.beginSend(source.string(), code, error)) << error.describe();

    SessionOptions receiverOptions = options();
    receiverOptions.timeouts.transferMin = 300ms;
    receiverOptions.timeouts.minThroughputBytesPerSec = 0;
    TransferSession receiver(receiverOptions, m_supervisor);
    receiver.setProgressSink(std::make_shared<CallbackProgressSink>([](uint64_t, uint64_t) {
        std::this_thread::sleep_for(100ms);
    }));

    std::string savedPath;
    EXPECT_FALSE(receiver.beginReceive(code.toString(), outDir().string(), savedPath, error));
    EXPECT_EQ(error.code, ErrorCode::TransferTimedOut);
    EXPECT_EQ(error.kind, ErrorKind::TimedOut);
    EXPECT_EQ(error.phase, SessionPhase::Transferring);
    EXPECT_LT(error.bytesMoved, std::filesystem::file_size(source));
    EXPECT_EQ(receiver.getStatus(), SessionStatus::FAILED);

    EXPECT_FALSE(std::filesystem::exists(outDir() / "crawl.bin"));
    EXPECT_FALSE(hasPartFiles(outDir()));

    auto senderOutcome = sender.outcome();
    ASSERT_EQ(senderOutcome.wait_for(30s), std::future_status::ready);
    EXPECT_FALSE(senderOutcome.get().completed());
}

TEST(SessionTimeoutsTest, TransferTimeoutScalesWithSize)
{
    SessionTimeouts t;
    t.transferMin = 1000ms;
    t.minThroughputBytesPerSec = 1000;
    EXPECT_EQ(t.transferFor(0), 1000ms);
    EXPECT_EQ(t.transferFor(500), 1000ms);
    EXPECT_EQ(t.transferFor(10000), 10000ms);
}
