/**
 * @file file_streamer_test.cpp
 * @brief Streaming, verification, and destination-naming tests
 */

#include "stork/FileStreamer.h"
#include "stork/HashUtils.h"
#include "stork/TcpSocket.h"

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace Stork;

namespace {

std::vector<uint8_t> patternBytes(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

class RecordingSink final : public ProgressSink {
public:
    void onProgress(uint64_t moved, uint64_t total) override {
        events.emplace_back(moved, total);
    }
    std::vector<std::pair<uint64_t, uint64_t>> events;
};

}  // namespace

class FileStreamerTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2] = { -1, -1 };
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        m_senderSocket.reset(fds[0]);
        m_receiverSocket.reset(fds[1]);
        ignoreSigpipe();

        m_dir = std::filesystem::temp_directory_path() /
                ("stork_file_streamer_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir / "out");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path outDir() const { return m_dir / "out"; }

    ScopedSocket m_senderSocket;
    ScopedSocket m_receiverSocket;
    std::filesystem::path m_dir;
};

TEST_F(FileStreamerTest, RoundTripProducesIdenticalFile)
{
    const auto content = patternBytes(3 * CHUNK_SIZE + 123);
    const auto source = m_dir / "source.bin";
    writeFile(source, content);
    const std::string dest = (outDir() / "source.bin").string();

    PlainSocketStream senderStream(m_senderSocket.get());
    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken senderCancel;
    CancelToken receiverCancel;
    RecordingSink progress;

    auto sent = std::async(std::launch::async, [&]() {
        SessionError e;
        return FileStreamer::send(senderStream, source.string(), content.size(), nullptr, senderCancel, e);
    });

    SessionError error;
    TransferOffer offer{ "source.bin", content.size() };
    ASSERT_TRUE(FileStreamer::receive(receiverStream, offer, dest, &progress, receiverCancel, error))
        << error.describe();
    EXPECT_TRUE(sent.get());

    EXPECT_EQ(std::filesystem::file_size(dest), content.size());
    EXPECT_EQ(readFile(dest), content);
    EXPECT_FALSE(std::filesystem::exists(dest + ".part"));

    ASSERT_EQ(progress.events.size(), 4u);
    EXPECT_EQ(progress.events.back().first, content.size());
    for (size_t i = 1; i < progress.events.size(); ++i) {
        EXPECT_GT(progress.events[i].first, progress.events[i - 1].first);
    }
}

TEST_F(FileStreamerTest, EmptyFileReportsSingleProgressEvent)
{
    const auto source = m_dir / "empty.txt";
    writeFile(source, {});
    const std::string dest = (outDir() / "empty.txt").string();

    PlainSocketStream senderStream(m_senderSocket.get());
    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken senderCancel;
    CancelToken receiverCancel;
    RecordingSink senderProgress;
    RecordingSink receiverProgress;

    auto sent = std::async(std::launch::async, [&]() {
        SessionError e;
        return FileStreamer::send(senderStream, source.string(), 0, &senderProgress, senderCancel, e);
    });

    SessionError error;
    ASSERT_TRUE(FileStreamer::receive(receiverStream, TransferOffer{ "empty.txt", 0 }, dest,
                                      &receiverProgress, receiverCancel, error))
        << error.describe();
    EXPECT_TRUE(sent.get());

    EXPECT_TRUE(std::filesystem::exists(dest));
    EXPECT_EQ(std::filesystem::file_size(dest), 0u);
    ASSERT_EQ(receiverProgress.events.size(), 1u);
    EXPECT_EQ(receiverProgress.events[0], std::make_pair(uint64_t{ 0 }, uint64_t{ 0 }));
    ASSERT_EQ(senderProgress.events.size(), 1u);
}

TEST_F(FileStreamerTest, EarlyCloseIsTruncatedAndLeavesNothing)
{
    const auto content = patternBytes(1000);
    const std::string dest = (outDir() / "short.bin").string();

    // Peer writes half the announced bytes, then goes away
    std::string err;
    ASSERT_TRUE(sendExact(m_senderSocket.get(), content.data(), 500, err)) << err;
    m_senderSocket.reset();

    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken cancel;
    SessionError error;
    EXPECT_FALSE(FileStreamer::receive(receiverStream, TransferOffer{ "short.bin", 1000 }, dest,
                                       nullptr, cancel, error));
    EXPECT_EQ(error.code, ErrorCode::TruncatedTransfer);
    EXPECT_EQ(error.kind, ErrorKind::TransferFailed);
    EXPECT_EQ(error.bytesMoved, 500u);
    EXPECT_EQ(error.bytesExpected, 1000u);
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dest + ".part"));
}

TEST_F(FileStreamerTest, WrongDigestIsIntegrityMismatch)
{
    const auto content = patternBytes(4096);
    const std::string dest = (outDir() / "tampered.bin").string();

    std::string err;
    ASSERT_TRUE(sendExact(m_senderSocket.get(), content.data(), content.size(), err)) << err;
    Sha256Digest digest = HashUtils::computeBufferHash(content.data(), content.size());
    digest[0] ^= 0xFF;
    ASSERT_TRUE(sendExact(m_senderSocket.get(), digest.data(), digest.size(), err)) << err;

    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken cancel;
    SessionError error;
    EXPECT_FALSE(FileStreamer::receive(receiverStream, TransferOffer{ "tampered.bin", content.size() },
                                       dest, nullptr, cancel, error));
    EXPECT_EQ(error.code, ErrorCode::IntegrityMismatch);
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dest + ".part"));

    uint8_t verdict = 0;
    ASSERT_TRUE(recvExact(m_senderSocket.get(), &verdict, 1, err)) << err;
    EXPECT_EQ(verdict, VERDICT_DIGEST_MISMATCH);
}

TEST_F(FileStreamerTest, SenderSeesMismatchVerdict)
{
    const auto content = patternBytes(2048);
    const auto source = m_dir / "a.bin";
    writeFile(source, content);

    // Fake receiver: drain content and digest, then reject
    auto fakeReceiver = std::async(std::launch::async, [&]() {
        std::vector<uint8_t> sink(content.size() + HASH_SIZE);
        std::string e;
        if (!recvExact(m_receiverSocket.get(), sink.data(), sink.size(), e)) {
            return false;
        }
        const uint8_t verdict = VERDICT_DIGEST_MISMATCH;
        return sendExact(m_receiverSocket.get(), &verdict, 1, e);
    });

    PlainSocketStream senderStream(m_senderSocket.get());
    CancelToken cancel;
    SessionError error;
    EXPECT_FALSE(FileStreamer::send(senderStream, source.string(), content.size(), nullptr, cancel, error));
    EXPECT_TRUE(fakeReceiver.get());
    EXPECT_EQ(error.code, ErrorCode::IntegrityMismatch);
}

TEST_F(FileStreamerTest, CancelledReceiveLeavesNoPartFile)
{
    const std::string dest = (outDir() / "big.bin").string();
    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken cancel;
    cancel.cancel();

    SessionError error;
    EXPECT_FALSE(FileStreamer::receive(receiverStream, TransferOffer{ "big.bin", 10 * CHUNK_SIZE }, dest,
                                       nullptr, cancel, error));
    EXPECT_EQ(error.code, ErrorCode::Cancelled);
    EXPECT_EQ(error.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dest + ".part"));
}

TEST_F(FileStreamerTest, InterruptedStreamStopsReceive)
{
    const std::string dest = (outDir() / "stalled.bin").string();
    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken cancel;
    InterruptRegistration hook(cancel, [&]() { receiverStream.interrupt(); });

    auto canceller = std::async(std::launch::async, [&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    SessionError error;
    EXPECT_FALSE(FileStreamer::receive(receiverStream, TransferOffer{ "stalled.bin", 1000 }, dest,
                                       nullptr, cancel, error));
    canceller.get();
    EXPECT_FALSE(std::filesystem::exists(dest + ".part"));
}

TEST_F(FileStreamerTest, MissingSourceIsFileIoError)
{
    PlainSocketStream senderStream(m_senderSocket.get());
    CancelToken cancel;
    SessionError error;
    EXPECT_FALSE(FileStreamer::send(senderStream, (m_dir / "nope.bin").string(), 10, nullptr, cancel, error));
    EXPECT_EQ(error.code, ErrorCode::FileIoError);
}

TEST_F(FileStreamerTest, UniqueDestinationSkipsTakenNames)
{
    const std::string dir = outDir().string();
    EXPECT_EQ(FileStreamer::uniqueDestination(dir, "report.pdf"), (outDir() / "report.pdf").string());

    writeFile(outDir() / "report.pdf", { 1 });
    EXPECT_EQ(FileStreamer::uniqueDestination(dir, "report.pdf"), (outDir() / "report (1).pdf").string());

    // An in-progress download also holds its name
    writeFile(outDir() / "report (1).pdf.part", { 1 });
    EXPECT_EQ(FileStreamer::uniqueDestination(dir, "report.pdf"), (outDir() / "report (2).pdf").string());

    writeFile(outDir() / ".bashrc", { 1 });
    EXPECT_EQ(FileStreamer::uniqueDestination(dir, ".bashrc"), (outDir() / ".bashrc (1)").string());
}

TEST(FileNameSanitizeTest, SeparatorsAndTraversalAreNeutralized)
{
    std::string name = "../../etc/passwd";
    ASSERT_TRUE(FileStreamer::sanitizeFileName(name));
    EXPECT_EQ(name.find('/'), std::string::npos);
    EXPECT_EQ(name.find(".."), std::string::npos);

    name = "dir\\file.txt";
    ASSERT_TRUE(FileStreamer::sanitizeFileName(name));
    EXPECT_EQ(name, "dir_file.txt");

    name = "notes.txt. . ";
    ASSERT_TRUE(FileStreamer::sanitizeFileName(name));
    EXPECT_EQ(name, "notes.txt");

    name = "photo.jpg";
    ASSERT_TRUE(FileStreamer::sanitizeFileName(name));
    EXPECT_EQ(name, "photo.jpg");
}

TEST(FileNameSanitizeTest, UnusableNamesAreRejected)
{
    std::string empty;
    EXPECT_FALSE(FileStreamer::sanitizeFileName(empty));

    std::string dots = "...";
    EXPECT_FALSE(FileStreamer::sanitizeFileName(dots));

    std::string control = std::string("bad") + '\n' + "name";
    EXPECT_FALSE(FileStreamer::sanitizeFileName(control));

    std::string tooLong(MAX_FILENAME_LENGTH + 1, 'a');
    EXPECT_FALSE(FileStreamer::sanitizeFileName(tooLong));
}

TEST(DestinationValidationTest, RejectsMissingDirectoryAndHugeFiles)
{
    std::string err;
    EXPECT_FALSE(FileStreamer::validateDestination("", 1, err));
    EXPECT_FALSE(FileStreamer::validateDestination("/nonexistent/stork/dir", 1, err));
    EXPECT_NE(err.find("not a directory"), std::string::npos);

    const std::string tmp = std::filesystem::temp_directory_path().string();
    EXPECT_TRUE(FileStreamer::validateDestination(tmp, 1, err)) << err;
    EXPECT_FALSE(FileStreamer::validateDestination(tmp, UINT64_MAX / 2, err));
}

TEST_F(FileStreamerTest, RefusedCommitDiscardsVerifiedFile)
{
    const auto content = patternBytes(2 * CHUNK_SIZE);
    const auto source = m_dir / "late.bin";
    writeFile(source, content);
    const std::string dest = (outDir() / "late.bin").string();

    PlainSocketStream senderStream(m_senderSocket.get());
    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken senderCancel;
    CancelToken receiverCancel;

    auto sent = std::async(std::launch::async, [&]() {
        SessionError e;
        return FileStreamer::send(senderStream, source.string(), content.size(), nullptr, senderCancel, e);
    });

    // The phase deadline won while the digest was being checked
    int commitCalls = 0;
    bool sawFullPart = false;
    auto commit = [&]() {
        ++commitCalls;
        std::error_code ec;
        sawFullPart = std::filesystem::exists(dest + ".part", ec);
        return false;
    };

    SessionError error;
    EXPECT_FALSE(FileStreamer::receive(receiverStream, TransferOffer{ "late.bin", content.size() }, dest,
                                       nullptr, receiverCancel, error, commit));
    EXPECT_EQ(commitCalls, 1);
    EXPECT_TRUE(sawFullPart);
    EXPECT_EQ(error.bytesMoved, content.size());

    // No verdict was sent; closing the stream releases the sender
    m_receiverSocket.reset();
    EXPECT_FALSE(sent.get());

    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dest + ".part"));
}

TEST_F(FileStreamerTest, GrantedCommitPublishesFile)
{
    const auto content = patternBytes(1000);
    const auto source = m_dir / "ontime.bin";
    writeFile(source, content);
    const std::string dest = (outDir() / "ontime.bin").string();

    PlainSocketStream senderStream(m_senderSocket.get());
    PlainSocketStream receiverStream(m_receiverSocket.get());
    CancelToken senderCancel;
    CancelToken receiverCancel;

    auto sent = std::async(std::launch::async, [&]() {
        SessionError e;
        return FileStreamer::send(senderStream, source.string(), content.size(), nullptr, senderCancel, e);
    });

    bool finalExistedAtCommit = true;
    auto commit = [&]() {
        finalExistedAtCommit = std::filesystem::exists(dest);
        return true;
    };

    SessionError error;
    ASSERT_TRUE(FileStreamer::receive(receiverStream, TransferOffer{ "ontime.bin", content.size() }, dest,
                                      nullptr, receiverCancel, error, commit))
        << error.describe();
    EXPECT_TRUE(sent.get());
    EXPECT_FALSE(finalExistedAtCommit);
    EXPECT_EQ(readFile(dest), content);
}
