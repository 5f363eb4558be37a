/**
 * @file AppPaths.h
 * @brief Canonical storage paths for Stork (XDG base directories).
 *
 * Path contract:
 * - Config:  $XDG_CONFIG_HOME/stork/config.json  (~/.config/stork/config.json)
 * - Data:    $XDG_DATA_HOME/stork/                (~/.local/share/stork/)
 * - History: <data>/history.json
 * - Logs:    <data>/logs/session_trace.txt
 *
 * Environment overrides for a single file (STORK_CONFIG) are implemented by
 * callers.
 */

#pragma once

#include <filesystem>

namespace Stork {

class AppPaths {
public:
    /**
     * @brief $XDG_CONFIG_HOME, else $HOME/.config, else empty.
     */
    static std::filesystem::path configHome();

    /**
     * @brief $XDG_DATA_HOME, else $HOME/.local/share, else empty.
     */
    static std::filesystem::path dataHome();

    /**
     * @brief Canonical config.json path.
     * @return <configHome>/stork/config.json
     */
    static std::filesystem::path configJsonPath();

    /**
     * @brief Canonical data directory.
     * @return <dataHome>/stork
     */
    static std::filesystem::path storkDataDir();

    /**
     * @brief Transfer history file.
     * @return <dataHome>/stork/history.json
     */
    static std::filesystem::path historyJsonPath();

    /**
     * @brief Canonical logs directory.
     */
    static std::filesystem::path logsDir();

    /**
     * @brief Session trace log path.
     * @return <dataHome>/stork/logs/session_trace.txt
     */
    static std::filesystem::path sessionTraceLogPath();

    /**
     * @brief Where received files go when no directory was given.
     *
     * Order: $XDG_DOWNLOAD_DIR, the XDG_DOWNLOAD_DIR entry of
     * <configHome>/user-dirs.dirs, $HOME/Downloads if it exists, the current
     * directory.
     */
    static std::filesystem::path defaultDownloadDir();
};

}  // namespace Stork
