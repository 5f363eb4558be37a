/**
 * @file CliArgs.h
 * @brief Command line parsing for the stork, stork-mailbox and stork-relay tools.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Stork {

enum class CliCommand : uint8_t {
    None,
    Send,
    Receive,
    History
};

/**
 * @brief Arguments of the "stork" tool
 *
 *   stork send FILE [common]
 *   stork receive CODE [--output-dir DIR] [common]
 *   stork history [common]
 *
 * common: --mailbox HOST:PORT --relay HOST:PORT --no-direct --no-relay
 *         --words N --config PATH --verbose --help
 */
struct CliArgs {
    bool showHelp = false;
    bool verbose = false;

    CliCommand command = CliCommand::None;
    std::string filePath;
    std::string code;
    std::string outputDir;

    std::string mailbox;     ///< Empty: from settings
    std::string relay;       ///< Empty: from settings
    std::string configPath;  ///< Empty: STORK_CONFIG or the default path
    bool noDirect = false;
    bool noRelay = false;
    unsigned codeWords = 0;  ///< 0: from settings

    static CliArgs parseOrThrow(int argc, const char* const* argv);
};

/**
 * @brief Arguments of the stork-mailbox and stork-relay servers
 *
 *   --listen HOST:PORT  --wait-ms N  --trace-log PATH  --verbose  --help
 *
 * --wait-ms is the nameplate TTL (mailbox) or the pairing wait (relay).
 */
struct ServerArgs {
    bool showHelp = false;
    bool verbose = false;
    std::string listenHost = "0.0.0.0";
    uint16_t listenPort = 0;
    uint32_t waitMs = 0;
    std::string traceLogPath;

    static ServerArgs parseOrThrow(int argc, const char* const* argv,
                                   uint16_t defaultPort, uint32_t defaultWaitMs);
};

}  // namespace Stork
