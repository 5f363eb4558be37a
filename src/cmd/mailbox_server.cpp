/**
 * @file mailbox_server.cpp
 * @brief stork-mailbox: rendezvous server for introduction codes
 *
 * Usage:
 *   stork-mailbox [--listen HOST:PORT] [--wait-ms N] [--trace-log PATH] [--verbose]
 *
 * --wait-ms is how long an allocated nameplate waits for its second side.
 */

#include "stork/CliArgs.h"
#include "stork/Debug.h"
#include "stork/MailboxHub.h"
#include "stork/MailboxServer.h"
#include "stork/ThreadSafeLog.h"
#include "stork/config.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
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
        << "Usage: stork-mailbox [options]\n"
        << "\n"
        << "Options:\n"
        << "  --listen HOST:PORT  Address to listen on (default 0.0.0.0:" << DEFAULT_MAILBOX_PORT << ")\n"
        << "  --wait-ms N         Unclaimed nameplate lifetime (default " << NAMEPLATE_TTL_MS << ")\n"
        << "  --trace-log PATH    Append lifecycle events to PATH\n"
        << "  --verbose           Debug logging\n"
        << "  --help              Show this help\n";
}

}  // namespace

int main(int argc, char** argv) {
    ServerArgs args;
    try {
        args = ServerArgs::parseOrThrow(argc, argv, DEFAULT_MAILBOX_PORT, NAMEPLATE_TTL_MS);
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

    auto hub = std::make_shared<MailboxHub>(std::chrono::milliseconds(args.waitMs));
    MailboxServer server(hub, args.listenHost, args.listenPort);

    std::string err;
    if (!server.start(err)) {
        LOG_ERROR("[Mailbox] " << err);
        return 1;
    }
    LOG_INFO("[Mailbox] Listening on " << args.listenHost << ":" << server.port());

    while (!g_stopRequested.load() && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_SLICE_MS));
    }

    LOG_INFO("[Mailbox] Shutting down");
    server.stop();
    return 0;
}
