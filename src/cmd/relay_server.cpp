/**
 * @file relay_server.cpp
 * @brief stork-relay: transit relay for peers that cannot reach each other
 *
 * Usage:
 *   stork-relay [--listen HOST:PORT] [--wait-ms N] [--trace-log PATH] [--verbose]
 *
 * The relay only pipes TLS records between two peers holding the same token.
 */

#include "stork/CliArgs.h"
#include "stork/Debug.h"
#include "stork/RelayServer.h"
#include "stork/ThreadSafeLog.h"
#include "stork/config.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace Stork;

namespace {

std::atomic<bool> g_stopRequested{ false };

extern "C" void onStopSignal(int) {
    g_stopRequested.store(true);
}

void printUsage() {
    std::cout
        << "Usage: stork-relay [options]\n"
        << "\n"
        << "Options:\n"
        << "  --listen HOST:PORT  Address to listen on (default 0.0.0.0:" << DEFAULT_RELAY_PORT << ")\n"
        << "  --wait-ms N         How long an unpaired peer is kept (default " << RELAY_PAIR_WAIT_MS << ")\n"
        << "  --trace-log PATH    Append pairing events to PATH\n"
        << "  --verbose           Debug logging\n"
        << "  --help              Show this help\n";
}

}  // namespace

int main(int argc, char** argv) {
    ServerArgs args;
    try {
        args = ServerArgs::parseOrThrow(argc, argv, DEFAULT_RELAY_PORT, RELAY_PAIR_WAIT_MS);
    } catch (const std::exception& e) {
        std::cerr << "Argument error: " << e.what() << "\n\n";
        printUsage();
        return 1;
    }

    if (args.showHelp) {
        printUsage();
        return 0;
    }

    setLogLevel(args.verbose ? LogLevel::Debug : LogLevel::Info);
    std::string traceError;
    if (!ThreadSafeLog::initialize(args.traceLogPath, traceError)) {
        LOG_WARNING("Trace log disabled: " << traceError);
    }

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    RelayServer server(args.listenHost, args.listenPort, std::chrono::milliseconds(args.waitMs));

    std::string err;
    if (!server.start(err)) {
        LOG_ERROR("[Relay] " << err);
        return 1;
    }
    LOG_INFO("[Relay] Listening on " << args.listenHost << ":" << server.port());

    while (!g_stopRequested.load() && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_SLICE_MS));
    }

    LOG_INFO("[Relay] Shutting down after " << server.pairedCount() << " relayed transfers");
    server.stop();
    return 0;
}
