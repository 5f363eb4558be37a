/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for Stork.
 */

#include "stork/AppPaths.h"

#include <cstdlib>
#include <fstream>
#include <string>

namespace Stork {

static std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return {};
    }
    return std::filesystem::path(value);
}

static std::filesystem::path homeDir() {
    return envPath("HOME");
}

/**
 * @brief Read XDG_DOWNLOAD_DIR from user-dirs.dirs
 *
 * Lines look like: XDG_DOWNLOAD_DIR="$HOME/Downloads"
 */
static std::filesystem::path userDirsDownload() {
    const auto config = AppPaths::configHome();
    if (config.empty()) {
        return {};
    }

    std::ifstream in(config / "user-dirs.dirs");
    if (!in) {
        return {};
    }

    const std::string key = "XDG_DOWNLOAD_DIR=";
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, key.size(), key) != 0) {
            continue;
        }
        std::string value = line.substr(key.size());
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        const std::string homeVar = "$HOME";
        if (value.compare(0, homeVar.size(), homeVar) == 0) {
            const auto home = homeDir();
            if (home.empty()) {
                return {};
            }
            value = home.string() + value.substr(homeVar.size());
        }
        return std::filesystem::path(value);
    }
    return {};
}

std::filesystem::path AppPaths::configHome() {
    const auto xdg = envPath("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return xdg;
    }
    const auto home = homeDir();
    if (home.empty()) {
        return {};
    }
    return home / ".config";
}

std::filesystem::path AppPaths::dataHome() {
    const auto xdg = envPath("XDG_DATA_HOME");
    if (!xdg.empty()) {
        return xdg;
    }
    const auto home = homeDir();
    if (home.empty()) {
        return {};
    }
    return home / ".local" / "share";
}

std::filesystem::path AppPaths::configJsonPath() {
    const auto root = configHome();
    if (root.empty()) {
        return {};
    }
    return root / "stork" / "config.json";
}

std::filesystem::path AppPaths::storkDataDir() {
    const auto root = dataHome();
    if (root.empty()) {
        return {};
    }
    return root / "stork";
}

std::filesystem::path AppPaths::historyJsonPath() {
    const auto dir = storkDataDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "history.json";
}

std::filesystem::path AppPaths::logsDir() {
    const auto dir = storkDataDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "logs";
}

std::filesystem::path AppPaths::sessionTraceLogPath() {
    const auto dir = logsDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "session_trace.txt";
}

std::filesystem::path AppPaths::defaultDownloadDir() {
    std::error_code ec;

    const auto fromEnv = envPath("XDG_DOWNLOAD_DIR");
    if (!fromEnv.empty() && std::filesystem::is_directory(fromEnv, ec)) {
        return fromEnv;
    }

    const auto fromUserDirs = userDirsDownload();
    if (!fromUserDirs.empty() && std::filesystem::is_directory(fromUserDirs, ec)) {
        return fromUserDirs;
    }

    const auto home = homeDir();
    if (!home.empty() && std::filesystem::is_directory(home / "Downloads", ec)) {
        return home / "Downloads";
    }

    const auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

}  // namespace Stork
