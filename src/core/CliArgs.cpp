/**
 * @file CliArgs.cpp
 * @brief Command line parsing for the Stork tools.
 */

#include "stork/CliArgs.h"
#include "stork/TcpSocket.h"
#include "stork/config.h"

#include <limits>

namespace Stork {

namespace {

std::string requireValue(int argc, const char* const* argv, int& i, const std::string& flag) {
    if (i + 1 >= argc || !argv[i + 1]) {
        throw std::runtime_error("Missing value for " + flag);
    }
    ++i;
    return std::string(argv[i]);
}

uint64_t parseUnsigned(const std::string& text, const std::string& flag, uint64_t maxValue) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 19) {
        throw std::runtime_error("Invalid number for " + flag + ": " + text);
    }
    const uint64_t value = std::stoull(text);
    if (value > maxValue) {
        throw std::runtime_error("Value out of range for " + flag + ": " + text);
    }
    return value;
}

void requireEndpoint(const std::string& text, const std::string& flag) {
    Endpoint ep;
    std::string err;
    if (!Endpoint::parse(text, ep, err)) {
        throw std::runtime_error("Invalid " + flag + " endpoint: " + err);
    }
}

}  // namespace

CliArgs CliArgs::parseOrThrow(int argc, const char* const* argv) {
    CliArgs out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--verbose" || a == "-v") {
            out.verbose = true;
            continue;
        }

        if (a == "--no-direct") {
            out.noDirect = true;
            continue;
        }

        if (a == "--no-relay") {
            out.noRelay = true;
            continue;
        }

        if (a == "--mailbox") {
            out.mailbox = requireValue(argc, argv, i, a);
            requireEndpoint(out.mailbox, a);
            continue;
        }

        if (a == "--relay") {
            out.relay = requireValue(argc, argv, i, a);
            requireEndpoint(out.relay, a);
            continue;
        }

        if (a == "--config") {
            out.configPath = requireValue(argc, argv, i, a);
            continue;
        }

        if (a == "--output-dir" || a == "-o") {
            out.outputDir = requireValue(argc, argv, i, a);
            continue;
        }

        if (a == "--words") {
            out.codeWords = static_cast<unsigned>(parseUnsigned(requireValue(argc, argv, i, a), a, MAX_CODE_WORDS));
            if (out.codeWords == 0) {
                throw std::runtime_error("--words must be at least 1");
            }
            continue;
        }

        if (!a.empty() && a[0] == '-') {
            throw std::runtime_error("Unknown argument: " + a);
        }

        // Positionals: command, then its operand
        if (out.command == CliCommand::None) {
            if (a == "send") {
                out.command = CliCommand::Send;
            } else if (a == "receive" || a == "recv") {
                out.command = CliCommand::Receive;
            } else if (a == "history") {
                out.command = CliCommand::History;
            } else {
                throw std::runtime_error("Unknown command: " + a);
            }
            continue;
        }

        if (out.command == CliCommand::Send && out.filePath.empty()) {
            out.filePath = a;
            continue;
        }

        if (out.command == CliCommand::Receive && out.code.empty()) {
            out.code = a;
            continue;
        }

        throw std::runtime_error("Unexpected argument: " + a);
    }

    if (out.showHelp) {
        return out;
    }

    if (out.command == CliCommand::None) {
        throw std::runtime_error("No command given. Use send, receive or history.");
    }
    if (out.command == CliCommand::Send && out.filePath.empty()) {
        throw std::runtime_error("send needs a file path");
    }
    if (out.command == CliCommand::Receive && out.code.empty()) {
        throw std::runtime_error("receive needs a code");
    }
    if (out.noDirect && out.noRelay) {
        throw std::runtime_error("--no-direct and --no-relay leave no transport");
    }
    if (!out.outputDir.empty() && out.command != CliCommand::Receive) {
        throw std::runtime_error("--output-dir only applies to receive");
    }

    return out;
}

ServerArgs ServerArgs::parseOrThrow(int argc, const char* const* argv,
                                    uint16_t defaultPort, uint32_t defaultWaitMs) {
    ServerArgs out;
    out.listenPort = defaultPort;
    out.waitMs = defaultWaitMs;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--verbose" || a == "-v") {
            out.verbose = true;
            continue;
        }

        if (a == "--listen") {
            Endpoint ep;
            std::string err;
            if (!Endpoint::parse(requireValue(argc, argv, i, a), ep, err)) {
                throw std::runtime_error("Invalid --listen endpoint: " + err);
            }
            out.listenHost = ep.host;
            out.listenPort = ep.port;
            continue;
        }

        if (a == "--wait-ms") {
            out.waitMs = static_cast<uint32_t>(parseUnsigned(requireValue(argc, argv, i, a), a,
                                                             std::numeric_limits<uint32_t>::max()));
            if (out.waitMs == 0) {
                throw std::runtime_error("--wait-ms must be positive");
            }
            continue;
        }

        if (a == "--trace-log") {
            out.traceLogPath = requireValue(argc, argv, i, a);
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    return out;
}

}  // namespace Stork
