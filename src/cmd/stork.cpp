/**
 * @file stork.cpp
 * @brief Command line front end: send, receive and list past transfers
 *
 * Usage:
 *   stork send <file>
 *   stork receive <code> [--output-dir <dir>]
 *   stork history
 *
 * Example:
 *   stork send ~/report.pdf           (prints "7-guitar-orbit")
 *   stork receive 7-guitar-orbit      (on the other machine)
 */

#include "stork/CliArgs.h"
#include "stork/Debug.h"
#include "stork/Settings.h"
#include "stork/SessionSupervisor.h"
#include "stork/TcpMailboxClient.h"
#include "stork/ThreadSafeLog.h"
#include "stork/TransferHistory.h"
#include "stork/TransferSession.h"
#include "stork/config.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace Stork;

namespace {

// Exit statuses
constexpr int EXIT_OK = 0;
constexpr int EXIT_INTERNAL = 1;
constexpr int EXIT_INVALID_INPUT = 2;
constexpr int EXIT_RENDEZVOUS = 3;
constexpr int EXIT_NEGOTIATION = 4;
constexpr int EXIT_TRANSFER = 5;
constexpr int EXIT_TIMED_OUT = 6;
constexpr int EXIT_CANCELLED = 7;

std::atomic<bool> g_interrupted{ false };

extern "C" void onInterruptSignal(int) {
    g_interrupted.store(true);
}

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  stork send <file> [options]\n"
        << "  stork receive <code> [--output-dir <dir>] [options]\n"
        << "  stork history [options]\n"
        << "\n"
        << "Options:\n"
        << "  --mailbox HOST:PORT   Rendezvous server (default " << DEFAULT_MAILBOX_HOST << ":"
        << DEFAULT_MAILBOX_PORT << ")\n"
        << "  --relay HOST:PORT     Transit relay (default " << DEFAULT_RELAY_HOST << ":"
        << DEFAULT_RELAY_PORT << ")\n"
        << "  --no-direct           Never connect peer to peer\n"
        << "  --no-relay            Never use the relay\n"
        << "  --words N             Words per generated code (1-" << MAX_CODE_WORDS << ")\n"
        << "  --config PATH         Settings file (default $XDG_CONFIG_HOME/stork/config.json)\n"
        << "  --verbose             Log to stderr\n"
        << "  --help                Show this help\n"
        << "\n"
        << "Exit status: 0 ok, 2 invalid input, 3 rendezvous, 4 negotiation,\n"
        << "             5 transfer, 6 timed out, 7 cancelled, 1 other errors\n";
}

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return EXIT_OK;
        case ErrorKind::InvalidInput:      return EXIT_INVALID_INPUT;
        case ErrorKind::RendezvousFailed:  return EXIT_RENDEZVOUS;
        case ErrorKind::NegotiationFailed: return EXIT_NEGOTIATION;
        case ErrorKind::TransferFailed:    return EXIT_TRANSFER;
        case ErrorKind::TimedOut:          return EXIT_TIMED_OUT;
        case ErrorKind::Cancelled:         return EXIT_CANCELLED;
        case ErrorKind::Internal:          return EXIT_INTERNAL;
    }
    return EXIT_INTERNAL;
}

int reportFailure(const SessionError& error) {
    if (error.kind == ErrorKind::Cancelled) {
        std::cerr << "Cancelled." << std::endl;
    } else {
        std::cerr << "Error: " << error.describe() << std::endl;
    }
    return exitCodeFor(error.kind);
}

std::string formatBytes(uint64_t bytes) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    if (bytes >= GB) {
        oss << std::fixed << std::setprecision(2) << (bytes / GB) << " GB";
    } else if (bytes >= MB) {
        oss << std::fixed << std::setprecision(2) << (bytes / MB) << " MB";
    } else if (bytes >= KB) {
        oss << std::fixed << std::setprecision(2) << (bytes / KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Progress bar on stderr, one carriage-return-refreshed line
 */
class ConsoleProgress final : public ProgressSink {
public:
    void onProgress(uint64_t bytesMoved, uint64_t bytesTotal) override {
        const int percent = bytesTotal == 0
            ? 100
            : static_cast<int>((bytesMoved * 100) / bytesTotal);
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cerr << "\r  " << std::setw(3) << percent << "%  "
                  << formatBytes(bytesMoved) << " / " << formatBytes(bytesTotal) << "   "
                  << std::flush;
        if (bytesMoved == bytesTotal) {
            std::cerr << std::endl;
        }
    }
};

/**
 * @brief Sink that owns its throttle and the console sink behind it
 */
class CliProgress final : public ProgressSink {
public:
    CliProgress() : m_throttle(m_console) {}

    void onProgress(uint64_t bytesMoved, uint64_t bytesTotal) override {
        m_throttle.onProgress(bytesMoved, bytesTotal);
    }

private:
    ConsoleProgress m_console;
    ThrottledProgress m_throttle;
};

/**
 * @brief Reports which transport carried the file
 */
class CliTransitObserver final : public TransitObserver {
public:
    void onTransitEstablished(const std::string& transport, const std::string& endpoint) override {
        LOG_INFO("[CLI] Connected via " << transport << " (" << endpoint << ")");
    }
};

/**
 * @brief Turns SIGINT/SIGTERM into TransferSession::cancel()
 *
 * The signal handler only raises a flag; this thread polls it so cancel()
 * never runs in signal context.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(TransferSession& session)
        : m_session(session)
        , m_thread(&InterruptWatcher::run, this)
    {
    }

    ~InterruptWatcher() {
        m_done.store(true);
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void run() {
        while (!m_done.load()) {
            if (g_interrupted.load()) {
                LOG_INFO("[CLI] Interrupt received, cancelling " << m_session.getSessionId());
                m_session.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_SLICE_MS));
        }
    }

    TransferSession& m_session;
    std::atomic<bool> m_done{ false };
    std::thread m_thread;
};

bool loadSettings(const CliArgs& args, Settings& settings, std::string& errorMsg) {
    bool explicitPath = false;
    const std::filesystem::path configPath = Settings::resolveConfigPath(args.configPath, explicitPath);
    if (!settings.loadFile(configPath, explicitPath, errorMsg)) {
        return false;
    }
    if (!settings.applyEnvironment(errorMsg)) {
        return false;
    }

    if (!args.mailbox.empty() && !Endpoint::parse(args.mailbox, settings.mailbox, errorMsg)) {
        return false;
    }
    if (!args.relay.empty() && !Endpoint::parse(args.relay, settings.relay, errorMsg)) {
        return false;
    }
    if (args.noDirect) {
        settings.abilities.directTcp = false;
    }
    if (args.noRelay) {
        settings.abilities.relay = false;
    }
    if (!settings.abilities.any()) {
        errorMsg = "Both direct and relay transports are disabled";
        return false;
    }
    if (args.codeWords != 0) {
        settings.codeWords = args.codeWords;
    }
    return true;
}

std::shared_ptr<TransferHistory> openHistory(const Settings& settings) {
    if (!settings.historyEnabled) {
        return nullptr;
    }
    auto history = std::make_shared<TransferHistory>(settings.effectiveHistoryPath());
    std::string err;
    if (!history->load(err)) {
        LOG_WARNING("[CLI] Transfer history unavailable: " << err);
        return nullptr;
    }
    return history;
}

int runSend(const CliArgs& args, SessionOptions options) {
    SessionSupervisor supervisor;
    TransferSession session(std::move(options), supervisor);
    session.setProgressSink(std::make_shared<CliProgress>());
    session.setTransitObserver(std::make_shared<CliTransitObserver>());

    InterruptWatcher watcher(session);

    IntroductionCode code;
    SessionError error;
    if (!session.beginSend(args.filePath, code, error)) {
        return reportFailure(error);
    }

    std::cout << "Sending '" << std::filesystem::path(args.filePath).filename().string() << "'\n"
              << "On the other computer, run:\n\n"
              << "    stork receive " << code.toString() << "\n"
              << std::endl;

    const TransferOutcome outcome = session.outcome().get();
    if (!outcome.completed()) {
        return reportFailure(outcome.error);
    }

    std::cout << "Transfer complete (" << formatBytes(outcome.bytesMoved) << " via "
              << outcome.transport << ")" << std::endl;
    return EXIT_OK;
}

int runReceive(const CliArgs& args, const Settings& settings, SessionOptions options) {
    SessionSupervisor supervisor;
    TransferSession session(std::move(options), supervisor);
    session.setProgressSink(std::make_shared<CliProgress>());
    session.setTransitObserver(std::make_shared<CliTransitObserver>());

    InterruptWatcher watcher(session);

    const std::string destination = args.outputDir.empty() ? settings.downloadDir : args.outputDir;

    std::string savedPath;
    SessionError error;
    if (!session.beginReceive(args.code, destination, savedPath, error)) {
        return reportFailure(error);
    }

    std::cout << savedPath << std::endl;
    return EXIT_OK;
}

int runHistory(const Settings& settings) {
    TransferHistory history(settings.effectiveHistoryPath());
    std::string err;
    if (!history.load(err)) {
        std::cerr << "Error: " << err << std::endl;
        return EXIT_INTERNAL;
    }

    const auto records = history.records();
    if (records.empty()) {
        std::cout << "No transfers yet." << std::endl;
        return EXIT_OK;
    }

    for (const auto& record : records) {
        std::cout << record.finishedIso8601 << "  "
                  << std::left << std::setw(7) << TransferHistory::directionToString(record.direction)
                  << " " << std::setw(9) << record.status
                  << " " << record.fileName << " (" << formatBytes(record.fileSize) << ")";
        if (!record.transport.empty()) {
            std::cout << " via " << record.transport;
        }
        if (!record.errorCode.empty()) {
            std::cout << " [" << record.errorCode << "] " << record.errorMessage;
        }
        std::cout << std::endl;
    }
    return EXIT_OK;
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs args;
    try {
        args = CliArgs::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Argument error: " << e.what() << "\n\n";
        printUsage();
        return EXIT_INTERNAL;
    }

    if (args.showHelp || args.command == CliCommand::None) {
        printUsage();
        return args.showHelp ? EXIT_OK : EXIT_INTERNAL;
    }

    setLogLevel(args.verbose ? LogLevel::Debug : LogLevel::Warning);

    Settings settings;
    std::string err;
    if (!loadSettings(args, settings, err)) {
        std::cerr << "Configuration error: " << err << std::endl;
        return EXIT_INTERNAL;
    }

    if (args.command == CliCommand::History) {
        return runHistory(settings);
    }

    std::string traceError;
    if (!ThreadSafeLog::initialize(settings.effectiveTraceLogPath(), traceError)) {
        LOG_DEBUG("Trace log disabled: " << traceError);
    }

    std::signal(SIGINT, onInterruptSignal);
    std::signal(SIGTERM, onInterruptSignal);

    auto connector = std::make_shared<TcpMailboxConnector>(settings.mailbox,
                                                           settings.mailboxConnectTimeoutMs);
    SessionOptions options = settings.sessionOptions(connector, openHistory(settings));

    LOG_DEBUG("[CLI] Mailbox " << connector->describe() << ", relay " << settings.relay.toString());

    if (args.command == CliCommand::Send) {
        return runSend(args, std::move(options));
    }
    return runReceive(args, settings, std::move(options));
}
