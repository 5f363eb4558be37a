/**
 * @file settings_test.cpp
 * @brief config.json parsing and environment overrides
 */

#include "stork/Settings.h"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdlib>
#include <fstream>

using namespace Stork;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(SettingsTest, DefaultsComeFromConfig)
{
    Settings s;
    EXPECT_EQ(s.mailbox.host, DEFAULT_MAILBOX_HOST);
    EXPECT_EQ(s.mailbox.port, DEFAULT_MAILBOX_PORT);
    EXPECT_EQ(s.relay.port, DEFAULT_RELAY_PORT);
    EXPECT_TRUE(s.abilities.directTcp);
    EXPECT_TRUE(s.abilities.relay);
    EXPECT_EQ(s.codeWords, DEFAULT_CODE_WORDS);
    EXPECT_EQ(s.timeouts.awaitPeer, std::chrono::milliseconds(AWAIT_PEER_TIMEOUT_MS));
    EXPECT_TRUE(s.historyEnabled);
}

TEST(SettingsTest, AppliesEveryKey)
{
    const json j = json::parse(R"({
        "mailbox": "10.1.2.3:5000",
        "relay": "relay.example.org:6000",
        "abilities": { "direct_tcp": false },
        "code_words": 4,
        "advertise_hosts": ["192.168.1.20", "10.0.0.5"],
        "download_dir": "/srv/incoming",
        "timeouts_ms": { "await_peer": 1000, "join": 2000, "direct_window": 250 },
        "min_throughput_bps": 1024,
        "history": { "enabled": false, "path": "/tmp/h.json" },
        "trace_log": "/tmp/trace.txt",
        "some_future_key": 1
    })");

    Settings s;
    std::string err;
    ASSERT_TRUE(s.applyJson(j, err)) << err;
    EXPECT_EQ(s.mailbox.host, "10.1.2.3");
    EXPECT_EQ(s.mailbox.port, 5000);
    EXPECT_EQ(s.relay.host, "relay.example.org");
    EXPECT_FALSE(s.abilities.directTcp);
    EXPECT_TRUE(s.abilities.relay);
    EXPECT_EQ(s.codeWords, 4u);
    EXPECT_EQ(s.advertiseHosts.size(), 2u);
    EXPECT_EQ(s.downloadDir, "/srv/incoming");
    EXPECT_EQ(s.timeouts.awaitPeer, 1000ms);
    EXPECT_EQ(s.timeouts.join, 2000ms);
    EXPECT_EQ(s.directWindowMs, 250u);
    EXPECT_EQ(s.timeouts.minThroughputBytesPerSec, 1024u);
    EXPECT_FALSE(s.historyEnabled);
    EXPECT_EQ(s.effectiveHistoryPath(), std::filesystem::path("/tmp/h.json"));
    EXPECT_EQ(s.effectiveTraceLogPath(), std::filesystem::path("/tmp/trace.txt"));

    const TransitOptions t = s.transitOptions();
    EXPECT_FALSE(t.abilities.directTcp);
    EXPECT_EQ(t.relayEndpoint.port, 6000);
    EXPECT_EQ(t.directWindowMs, 250u);
}

TEST(SettingsTest, WrongTypesNameTheKey)
{
    const char* bad[] = {
        R"({"mailbox": 4000})",
        R"({"mailbox": "no-port"})",
        R"({"abilities": { "direct_tcp": "yes" }})",
        R"({"abilities": { "direct_tcp": false, "relay": false }})",
        R"({"code_words": 0})",
        R"({"code_words": 99})",
        R"({"code_words": -1})",
        R"({"advertise_hosts": "10.0.0.1"})",
        R"({"timeouts_ms": { "join": "soon" }})",
        R"({"history": []})",
        R"([1, 2])",
    };
    for (const char* text : bad) {
        Settings s;
        std::string err;
        EXPECT_FALSE(s.applyJson(json::parse(text), err)) << text;
        EXPECT_FALSE(err.empty()) << text;
    }

    Settings s;
    std::string err;
    EXPECT_FALSE(s.applyJson(json::parse(R"({"code_words": "two"})"), err));
    EXPECT_NE(err.find("code_words"), std::string::npos);
}

TEST(SettingsTest, LoadFileHandlesMissingAndInvalid)
{
    const auto dir = std::filesystem::temp_directory_path() /
                     ("stork_settings_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);

    Settings s;
    std::string err;
    EXPECT_TRUE(s.loadFile(dir / "absent.json", false, err)) << err;
    EXPECT_FALSE(s.loadFile(dir / "absent.json", true, err));

    const auto broken = dir / "broken.json";
    std::ofstream(broken) << "{ not json";
    EXPECT_FALSE(s.loadFile(broken, false, err));
    EXPECT_NE(err.find("not valid JSON"), std::string::npos);

    const auto good = dir / "good.json";
    std::ofstream(good) << R"({"code_words": 3})";
    EXPECT_TRUE(s.loadFile(good, true, err)) << err;
    EXPECT_EQ(s.codeWords, 3u);

    std::filesystem::remove_all(dir);
}

TEST(SettingsTest, EnvironmentOverridesEndpoints)
{
    ::setenv("STORK_MAILBOX", "192.0.2.1:7000", 1);
    ::setenv("STORK_RELAY", "192.0.2.2:7001", 1);

    Settings s;
    std::string err;
    EXPECT_TRUE(s.applyEnvironment(err)) << err;
    EXPECT_EQ(s.mailbox.host, "192.0.2.1");
    EXPECT_EQ(s.mailbox.port, 7000);
    EXPECT_EQ(s.relay.port, 7001);

    ::setenv("STORK_MAILBOX", "garbage", 1);
    EXPECT_FALSE(s.applyEnvironment(err));
    EXPECT_NE(err.find("STORK_MAILBOX"), std::string::npos);

    ::unsetenv("STORK_MAILBOX");
    ::unsetenv("STORK_RELAY");
}

TEST(SettingsTest, ConfigPathResolution)
{
    bool explicitPath = false;
    EXPECT_EQ(Settings::resolveConfigPath("/etc/stork.json", explicitPath), std::filesystem::path("/etc/stork.json"));
    EXPECT_TRUE(explicitPath);

    ::setenv("STORK_CONFIG", "/opt/stork/config.json", 1);
    EXPECT_EQ(Settings::resolveConfigPath("", explicitPath), std::filesystem::path("/opt/stork/config.json"));
    EXPECT_TRUE(explicitPath);
    ::unsetenv("STORK_CONFIG");

    Settings::resolveConfigPath("", explicitPath);
    EXPECT_FALSE(explicitPath);
}
