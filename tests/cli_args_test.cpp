#include <gtest/gtest.h>

#include "stork/CliArgs.h"
#include "stork/config.h"

#include <vector>

using namespace Stork;

namespace {

CliArgs parse(std::vector<const char*> args) {
    args.insert(args.begin(), "stork");
    return CliArgs::parseOrThrow(static_cast<int>(args.size()), args.data());
}

ServerArgs parseServer(std::vector<const char*> args) {
    args.insert(args.begin(), "stork-mailbox");
    return ServerArgs::parseOrThrow(static_cast<int>(args.size()), args.data(), 4000, 1234);
}

}  // namespace

TEST(CliArgsTest, SendTakesFilePathAndOverrides)
{
    const CliArgs a = parse({ "send", "/tmp/report.pdf", "--mailbox", "10.0.0.1:5000", "--words", "3", "--no-relay" });
    EXPECT_EQ(a.command, CliCommand::Send);
    EXPECT_EQ(a.filePath, "/tmp/report.pdf");
    EXPECT_EQ(a.mailbox, "10.0.0.1:5000");
    EXPECT_EQ(a.codeWords, 3u);
    EXPECT_TRUE(a.noRelay);
    EXPECT_FALSE(a.noDirect);
}

TEST(CliArgsTest, ReceiveAcceptsAliasAndOutputDir)
{
    const CliArgs a = parse({ "recv", "7-guitar-orbit", "-o", "/tmp/in", "--verbose" });
    EXPECT_EQ(a.command, CliCommand::Receive);
    EXPECT_EQ(a.code, "7-guitar-orbit");
    EXPECT_EQ(a.outputDir, "/tmp/in");
    EXPECT_TRUE(a.verbose);
}

TEST(CliArgsTest, HelpSkipsValidation)
{
    const CliArgs a = parse({ "--help" });
    EXPECT_TRUE(a.showHelp);
    EXPECT_EQ(a.command, CliCommand::None);
}

TEST(CliArgsTest, RejectsBadInput)
{
    EXPECT_THROW(parse({}), std::runtime_error);
    EXPECT_THROW(parse({ "send" }), std::runtime_error);
    EXPECT_THROW(parse({ "receive" }), std::runtime_error);
    EXPECT_THROW(parse({ "fly", "x" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "b" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--bogus" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--mailbox" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--mailbox", "no-port" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--words", "0" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--words", "99" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--no-direct", "--no-relay" }), std::runtime_error);
    EXPECT_THROW(parse({ "send", "a", "--output-dir", "/tmp" }), std::runtime_error);
}

TEST(ServerArgsTest, DefaultsAndOverrides)
{
    const ServerArgs d = parseServer({});
    EXPECT_EQ(d.listenHost, "0.0.0.0");
    EXPECT_EQ(d.listenPort, 4000);
    EXPECT_EQ(d.waitMs, 1234u);

    const ServerArgs o = parseServer({ "--listen", "127.0.0.1:9000", "--wait-ms", "50", "--trace-log", "/tmp/t.txt" });
    EXPECT_EQ(o.listenHost, "127.0.0.1");
    EXPECT_EQ(o.listenPort, 9000);
    EXPECT_EQ(o.waitMs, 50u);
    EXPECT_EQ(o.traceLogPath, "/tmp/t.txt");

    EXPECT_THROW(parseServer({ "--wait-ms", "0" }), std::runtime_error);
    EXPECT_THROW(parseServer({ "--listen", "nowhere" }), std::runtime_error);
    EXPECT_THROW(parseServer({ "extra" }), std::runtime_error);
}
