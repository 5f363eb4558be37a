#include <gtest/gtest.h>

#include "stork/AppPaths.h"

#include <cstdlib>
#include <string>

namespace {

/**
 * @brief Set an environment variable for one test, restore it afterwards
 */
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        const char* old = std::getenv(name);
        m_hadValue = old != nullptr;
        if (m_hadValue) {
            m_oldValue = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (m_hadValue) {
            ::setenv(m_name.c_str(), m_oldValue.c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

private:
    std::string m_name;
    std::string m_oldValue;
    bool m_hadValue = false;
};

}  // namespace

TEST(AppPathsTest, XdgVariablesWin)
{
    ScopedEnv config("XDG_CONFIG_HOME", "/tmp/stork-cfg");
    ScopedEnv data("XDG_DATA_HOME", "/tmp/stork-data");

    EXPECT_EQ(Stork::AppPaths::configJsonPath(), std::filesystem::path("/tmp/stork-cfg/stork/config.json"));
    EXPECT_EQ(Stork::AppPaths::historyJsonPath(), std::filesystem::path("/tmp/stork-data/stork/history.json"));
    EXPECT_EQ(Stork::AppPaths::sessionTraceLogPath(),
              std::filesystem::path("/tmp/stork-data/stork/logs/session_trace.txt"));
}

TEST(AppPathsTest, FallsBackToHome)
{
    ScopedEnv config("XDG_CONFIG_HOME", nullptr);
    ScopedEnv data("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", "/home/tester");

    EXPECT_EQ(Stork::AppPaths::configHome(), std::filesystem::path("/home/tester/.config"));
    EXPECT_EQ(Stork::AppPaths::dataHome(), std::filesystem::path("/home/tester/.local/share"));
    EXPECT_EQ(Stork::AppPaths::storkDataDir(), std::filesystem::path("/home/tester/.local/share/stork"));
}

TEST(AppPathsTest, NoHomeMeansNoPaths)
{
    ScopedEnv config("XDG_CONFIG_HOME", nullptr);
    ScopedEnv data("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);

    EXPECT_TRUE(Stork::AppPaths::configJsonPath().empty());
    EXPECT_TRUE(Stork::AppPaths::historyJsonPath().empty());
}

TEST(AppPathsTest, DownloadDirFromEnvironment)
{
    const auto dir = std::filesystem::temp_directory_path() / "stork_app_paths_downloads";
    std::filesystem::create_directories(dir);
    ScopedEnv download("XDG_DOWNLOAD_DIR", dir.c_str());
    EXPECT_EQ(Stork::AppPaths::defaultDownloadDir(), dir);

    // A variable naming a missing directory is ignored
    ScopedEnv missing("XDG_DOWNLOAD_DIR", "/nonexistent/stork/downloads");
    EXPECT_NE(Stork::AppPaths::defaultDownloadDir(), std::filesystem::path("/nonexistent/stork/downloads"));
    std::filesystem::remove_all(dir);
}
