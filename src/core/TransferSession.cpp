/**
 * @file TransferSession.cpp
 * @brief Transfer session state machine
 */

#include "stork/TransferSession.h"
#include "stork/AppPaths.h"
#include "stork/CodeChannel.h"
#include "stork/CryptoUtils.h"
#include "stork/Debug.h"
#include "stork/HashUtils.h"
#include "stork/PhaseGuard.h"
#include "stork/ThreadSafeLog.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace Stork {

namespace {

constexpr const char* kPhaseOffer = "offer";
constexpr const char* kPhaseAnswer = "answer";

/**
 * @brief "sess_" + 16 random hex digits in groups of four
 *
 * Falls back to a process-local counter if the CSPRNG fails; the id only
 * has to be unique within this process and its history file.
 */
std::string newSessionId() {
    std::array<uint8_t, 8> bytes{};
    std::string err;
    std::string hex;
    if (CryptoUtils::randomBytes(bytes.data(), bytes.size(), err)) {
        hex = HashUtils::toHex(bytes);
    } else {
        static std::atomic<uint64_t> s_fallback{ 0 };
        LOG_WARNING("[Session] Random id unavailable (" << err << "), using a counter");
        std::ostringstream oss;
        oss << std::hex << std::setw(16) << std::setfill('0') << ++s_fallback;
        hex = oss.str();
    }

    std::string id = "sess_";
    for (size_t i = 0; i < hex.size(); i += 4) {
        if (i > 0) {
            id += '-';
        }
        id += hex.substr(i, 4);
    }
    return id;
}

}  // namespace

std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:          return "Idle";
        case SessionStatus::AWAITING_PEER: return "AwaitingPeer";
        case SessionStatus::NEGOTIATING:   return "Negotiating";
        case SessionStatus::TRANSFERRING:  return "Transferring";
        case SessionStatus::COMPLETED:     return "Completed";
        case SessionStatus::FAILED:        return "Failed";
        case SessionStatus::CANCELLED:     return "Cancelled";
        default:                           return "Unknown";
    }
}

std::chrono::milliseconds SessionTimeouts::transferFor(uint64_t fileSize) const {
    if (minThroughputBytesPerSec == 0) {
        return transferMin;
    }
    // Whole seconds, rounded up; no overflow for any 64-bit size
    const uint64_t seconds = fileSize / minThroughputBytesPerSec +
                             (fileSize % minThroughputBytesPerSec != 0 ? 1 : 0);
    const uint64_t capSeconds = static_cast<uint64_t>(std::chrono::milliseconds::max().count() / 1000);
    const std::chrono::milliseconds scaled(static_cast<int64_t>(std::min(seconds, capSeconds)) * 1000);
    return std::max(transferMin, scaled);
}

//=============================================================================
// TransferSession::Core
//=============================================================================

/**
 * @brief Session state shared by the handle and the supervised task
 */
struct TransferSession::Core {
    explicit Core(SessionOptions opts)
        : options(std::move(opts))
        , sessionId(newSessionId())
        , future(promise.get_future().share())
    {
    }

    SessionOptions options;
    const std::string sessionId;

    std::atomic<SessionType> type{ SessionType::OUTGOING };
    std::atomic<SessionStatus> status{ SessionStatus::IDLE };
    std::atomic<bool> started{ false };
    std::atomic<bool> finished{ false };
    CancelToken cancel;

    std::promise<TransferOutcome> promise;
    std::shared_future<TransferOutcome> future;

    std::shared_ptr<ProgressSink> progress;
    std::shared_ptr<TransitObserver> observer;
    SessionStatusCallback statusCallback;
    SessionCompletionCallback completionCallback;
    OfferPolicy offerPolicy;

    // Written by the thread running the session only
    std::string filePath;
    TransferOffer offer;
    std::string transport;
    std::string startedIso8601;

    void setStatus(SessionStatus next);
    void finish(const TransferOutcome& outcome);
    void recordHistory(const TransferOutcome& outcome);
};

void TransferSession::Core::setStatus(SessionStatus next) {
    if (finished.load()) {
        return;
    }
    status.store(next);
    ThreadSafeLog::sessionEvent(sessionId, sessionStatusToString(next));
    LOG_DEBUG("[Session] " << sessionId << " -> " << sessionStatusToString(next));

    if (statusCallback) {
        try {
            statusCallback(sessionId, next);
        } catch (const std::exception& e) {
            LOG_WARNING("[Session] Status callback threw: " << e.what());
        }
    }
}

void TransferSession::Core::finish(const TransferOutcome& outcome) {
    bool expected = false;
    if (!finished.compare_exchange_strong(expected, true)) {
        return;  // Outcome already published
    }

    SessionStatus terminal = SessionStatus::FAILED;
    if (outcome.result == TransferOutcome::Result::Completed) {
        terminal = SessionStatus::COMPLETED;
    } else if (outcome.result == TransferOutcome::Result::Cancelled) {
        terminal = SessionStatus::CANCELLED;
    }
    status.store(terminal);

    if (outcome.result == TransferOutcome::Result::Failed) {
        ThreadSafeLog::sessionEvent(sessionId, "Failed " + outcome.error.describe());
        LOG_WARNING("[Session] " << sessionId << " failed: " << outcome.error.describe());
    } else {
        ThreadSafeLog::sessionEvent(sessionId, sessionStatusToString(terminal));
        LOG_INFO("[Session] " << sessionId << " " << sessionStatusToString(terminal));
    }

    recordHistory(outcome);
    promise.set_value(outcome);

    try {
        if (statusCallback) {
            statusCallback(sessionId, terminal);
        }
        if (completionCallback) {
            completionCallback(sessionId, outcome);
        }
    } catch (const std::exception& e) {
        LOG_WARNING("[Session] Completion callback threw: " << e.what());
    }
}

void TransferSession::Core::recordHistory(const TransferOutcome& outcome) {
    if (!options.history || !started.load()) {
        return;
    }

    TransferRecord record;
    record.id = sessionId;
    record.direction = type.load() == SessionType::OUTGOING ? TransferDirection::Send
                                                            : TransferDirection::Receive;
    record.fileName = offer.fileName;
    record.filePath = outcome.completed() ? outcome.path : filePath;
    record.fileSize = offer.fileSize;
    record.bytesMoved = outcome.bytesMoved;
    switch (outcome.result) {
        case TransferOutcome::Result::Completed: record.status = "completed"; break;
        case TransferOutcome::Result::Cancelled: record.status = "cancelled"; break;
        default:                                 record.status = "failed"; break;
    }
    if (outcome.result == TransferOutcome::Result::Failed) {
        record.errorCode = outcome.error.stableId();
        record.errorMessage = outcome.error.message;
    }
    record.transport = outcome.transport;
    record.startedIso8601 = startedIso8601;
    record.finishedIso8601 = TransferHistory::nowIso8601();

    std::string err;
    if (!options.history->append(record, err)) {
        LOG_WARNING("[Session] Could not record history: " << err);
    }
}

namespace {

using Core = TransferSession::Core;

TransferOutcome outcomeFromError(const Core& core, const SessionError& error) {
    TransferOutcome outcome;
    outcome.result = error.code == ErrorCode::Cancelled ? TransferOutcome::Result::Cancelled
                                                        : TransferOutcome::Result::Failed;
    outcome.error = error;
    outcome.transport = core.transport;
    outcome.bytesMoved = error.bytesMoved;
    return outcome;
}

TransferOutcome internalFailure(const Core& core, const std::string& what) {
    return outcomeFromError(core, SessionError::make(ErrorCode::InternalError, SessionPhase::Setup,
                                                     "Unexpected exception: " + what));
}

/**
 * @brief Keep the byte counters when a timer or cancel wins the transfer phase
 */
void carryByteCounts(const SessionError& phaseError, SessionError& error) {
    if (phaseError.isSet() && error.bytesExpected == 0) {
        error.bytesMoved = phaseError.bytesMoved;
        error.bytesExpected = phaseError.bytesExpected;
    }
}

//=============================================================================
// Offer / answer
//=============================================================================

bool sendOffer(AuthenticatedChannel& channel, const TransferOffer& offer, SessionError& error) {
    const nlohmann::json message{ { "name", offer.fileName }, { "size", offer.fileSize } };
    if (!channel.sendMessage(kPhaseOffer, message, SessionPhase::Negotiating, error)) {
        return false;
    }

    nlohmann::json answer;
    if (!channel.receiveMessage(kPhaseAnswer, answer, SessionPhase::Negotiating, error)) {
        return false;
    }

    if (!answer.is_object() || !answer.contains("accept") || !answer["accept"].is_boolean()) {
        error = SessionError::make(ErrorCode::OfferRejected, SessionPhase::Negotiating,
                                   "Malformed answer from receiver");
        return false;
    }
    if (!answer["accept"].get<bool>()) {
        std::string reason = "no reason given";
        if (answer.contains("reason") && answer["reason"].is_string()) {
            reason = answer["reason"].get<std::string>();
        }
        error = SessionError::make(ErrorCode::OfferRejected, SessionPhase::Negotiating,
                                   "Receiver declined the file: " + reason);
        return false;
    }
    return true;
}

bool sendAnswer(AuthenticatedChannel& channel, bool accept, const std::string& reason, SessionError& error) {
    nlohmann::json answer{ { "accept", accept } };
    if (!accept) {
        answer["reason"] = reason;
    }
    return channel.sendMessage(kPhaseAnswer, answer, SessionPhase::Negotiating, error);
}

/**
 * @brief Decline the offer, then report @p local as this side's error
 */
bool declineOffer(AuthenticatedChannel& channel, const std::string& reason,
                  const SessionError& local, SessionError& error) {
    SessionError sendError;
    if (!sendAnswer(channel, false, reason, sendError)) {
        LOG_WARNING("[Session] Could not deliver rejection: " << sendError.message);
    }
    error = local;
    return false;
}

/**
 * @brief Receive the offer, validate it against the destination and answer
 * @param destination Output: collision-free final path on acceptance
 */
bool receiveOffer(Core& core, AuthenticatedChannel& channel, const std::string& directory,
                  TransferOffer& offer, std::string& destination, SessionError& error) {
    nlohmann::json message;
    if (!channel.receiveMessage(kPhaseOffer, message, SessionPhase::Negotiating, error)) {
        return false;
    }

    if (!message.is_object() || !message.contains("name") || !message["name"].is_string() ||
        !message.contains("size") || !message["size"].is_number_unsigned()) {
        return declineOffer(channel, "malformed offer",
                            SessionError::make(ErrorCode::OfferRejected, SessionPhase::Negotiating,
                                               "Sender made a malformed offer"),
                            error);
    }

    offer.fileName = message["name"].get<std::string>();
    offer.fileSize = message["size"].get<uint64_t>();

    if (!FileStreamer::sanitizeFileName(offer.fileName)) {
        return declineOffer(channel, "file name not accepted",
                            SessionError::make(ErrorCode::OfferRejected, SessionPhase::Negotiating,
                                               "Offered file name cannot be stored safely"),
                            error);
    }
    core.offer = offer;

    std::string err;
    if (!FileStreamer::validateDestination(directory, offer.fileSize, err)) {
        return declineOffer(channel, "receiver cannot store the file",
                            SessionError::make(ErrorCode::InvalidDestination, SessionPhase::Negotiating, err),
                            error);
    }

    std::string reason;
    if (core.offerPolicy && !core.offerPolicy(offer, reason)) {
        if (reason.empty()) {
            reason = "declined";
        }
        return declineOffer(channel, reason,
                            SessionError::make(ErrorCode::OfferRejected, SessionPhase::Negotiating,
                                               "Offer declined: " + reason),
                            error);
    }

    destination = FileStreamer::uniqueDestination(directory, offer.fileName);
    return sendAnswer(channel, true, std::string(), error);
}

//=============================================================================
// Sender continuation
//=============================================================================

TransferOutcome runSender(Core& core, PendingRendezvous& pending) {
    const SessionOptions& opts = core.options;
    SessionError error;

    // AwaitingPeer: until the receiver joined and key confirmation passed
    std::unique_ptr<AuthenticatedChannel> channel;
    {
        PhaseGuard guard(SessionPhase::AwaitingPeer, ErrorCode::NoPeerJoined,
                         opts.timeouts.awaitPeer, core.cancel,
                         [&pending]() { pending.interrupt(); });
        SessionError phaseError;
        const bool ok = pending.wait(channel, phaseError);
        if (!guard.conclude(ok, phaseError, error)) {
            // Give the nameplate back so the code cannot be used any more
            pending.abandon();
            return outcomeFromError(core, error);
        }
    }

    // Negotiating: offer/answer, then transit
    core.setStatus(SessionStatus::NEGOTIATING);
    TransitNegotiator negotiator(opts.transit, core.observer.get());
    std::unique_ptr<TransportStream> stream;
    {
        PhaseGuard guard(SessionPhase::Negotiating, ErrorCode::NegotiationTimedOut,
                         opts.timeouts.senderNegotiation, core.cancel,
                         [&channel, &negotiator]() {
                             channel->interrupt();
                             negotiator.interrupt();
                         });
        SessionError phaseError;
        const bool ok = sendOffer(*channel, core.offer, phaseError) &&
                        negotiator.negotiate(*channel, TransitRole::Sender, stream, phaseError);
        if (!guard.conclude(ok, phaseError, error)) {
            channel->close();
            return outcomeFromError(core, error);
        }
    }
    core.transport = stream->transport();

    // Transferring
    core.setStatus(SessionStatus::TRANSFERRING);
    {
        TransportStream* raw = stream.get();
        PhaseGuard guard(SessionPhase::Transferring, ErrorCode::TransferTimedOut,
                         opts.timeouts.transferFor(core.offer.fileSize), core.cancel,
                         [raw]() { raw->interrupt(); });
        SessionError phaseError;
        const bool delivered = FileStreamer::send(*stream, core.filePath, core.offer.fileSize,
                                                  core.progress.get(), core.cancel, phaseError);
        // The receiver's OK verdict means the file is already published there
        if (!guard.conclude(delivered, phaseError, error) && !delivered) {
            carryByteCounts(phaseError, error);
            channel->close();
            return outcomeFromError(core, error);
        }
    }

    stream->shutdown();
    channel->close();

    TransferOutcome outcome;
    outcome.result = TransferOutcome::Result::Completed;
    outcome.path = core.filePath;
    outcome.transport = core.transport;
    outcome.bytesMoved = core.offer.fileSize;
    return outcome;
}

void runSenderTask(const std::shared_ptr<Core>& core, const std::shared_ptr<PendingRendezvous>& pending) {
    try {
        core->finish(runSender(*core, *pending));
    } catch (const std::exception& e) {
        core->finish(internalFailure(*core, e.what()));
    } catch (...) {
        core->finish(internalFailure(*core, "unknown exception"));
    }
    pending->abandon();
}

//=============================================================================
// Receiver
//=============================================================================

TransferOutcome runReceiver(Core& core, const std::string& codeText, const std::string& destinationDir) {
    const SessionOptions& opts = core.options;
    SessionError error;
    std::string err;

    // Setup: nothing here touches the network
    IntroductionCode code;
    if (!IntroductionCode::parse(codeText, code, err)) {
        return outcomeFromError(core, SessionError::make(ErrorCode::InvalidCode, SessionPhase::Setup, err));
    }

    const std::string directory = destinationDir.empty() ? AppPaths::defaultDownloadDir().string()
                                                          : destinationDir;
    if (!FileStreamer::validateDestination(directory, 0, err)) {
        return outcomeFromError(core, SessionError::make(ErrorCode::InvalidDestination, SessionPhase::Setup, err));
    }

    if (!opts.connector) {
        return outcomeFromError(core, SessionError::make(ErrorCode::InternalError, SessionPhase::Setup,
                                                         "No mailbox connector configured"));
    }

    // Join and key exchange
    CodeChannel codeChannel(opts.connector, opts.codeWords);
    std::unique_ptr<AuthenticatedChannel> channel;
    {
        PhaseGuard guard(SessionPhase::Rendezvous, ErrorCode::JoinTimedOut, opts.timeouts.join,
                         core.cancel, [&codeChannel]() { codeChannel.interrupt(); });
        SessionError phaseError;
        const bool ok = codeChannel.join(codeText, channel, phaseError);
        if (!guard.conclude(ok, phaseError, error)) {
            return outcomeFromError(core, error);
        }
    }
    core.setStatus(SessionStatus::NEGOTIATING);

    // Offer and transit
    TransitNegotiator negotiator(opts.transit, core.observer.get());
    std::unique_ptr<TransportStream> stream;
    TransferOffer offer;
    std::string destination;
    {
        PhaseGuard guard(SessionPhase::Negotiating, ErrorCode::NegotiationTimedOut,
                         opts.timeouts.receiverNegotiation, core.cancel,
                         [&channel, &negotiator]() {
                             channel->interrupt();
                             negotiator.interrupt();
                         });
        SessionError phaseError;
        const bool ok = receiveOffer(core, *channel, directory, offer, destination, phaseError) &&
                        negotiator.negotiate(*channel, TransitRole::Receiver, stream, phaseError);
        if (!guard.conclude(ok, phaseError, error)) {
            channel->close();
            return outcomeFromError(core, error);
        }
    }
    core.transport = stream->transport();
    core.filePath = destination;

    // Transferring
    core.setStatus(SessionStatus::TRANSFERRING);
    {
        TransportStream* raw = stream.get();
        PhaseGuard guard(SessionPhase::Transferring, ErrorCode::TransferTimedOut,
                         opts.timeouts.transferFor(offer.fileSize), core.cancel,
                         [raw]() { raw->interrupt(); });
        SessionError phaseError;
        const bool ok = FileStreamer::receive(*stream, offer, destination, core.progress.get(),
                                              core.cancel, phaseError,
                                              [&guard]() { return guard.tryCommit(); });
        if (!guard.conclude(ok, phaseError, error)) {
            carryByteCounts(phaseError, error);
            channel->close();
            return outcomeFromError(core, error);
        }
    }

    stream->shutdown();
    channel->close();

    TransferOutcome outcome;
    outcome.result = TransferOutcome::Result::Completed;
    outcome.path = destination;
    outcome.transport = core.transport;
    outcome.bytesMoved = offer.fileSize;
    return outcome;
}

}  // namespace

//=============================================================================
// TransferSession
//=============================================================================

TransferSession::TransferSession(SessionOptions options, SessionSupervisor& supervisor)
    : m_core(std::make_shared<Core>(std::move(options)))
    , m_supervisor(supervisor)
{
}

TransferSession::~TransferSession() = default;

bool TransferSession::beginSend(const std::string& filePath, IntroductionCode& code, SessionError& error) {
    if (m_core->cancel.isCancelled()) {
        error = SessionError::make(ErrorCode::Cancelled, SessionPhase::Setup, "Session was cancelled");
        return false;
    }
    if (m_core->started.exchange(true)) {
        error = SessionError::make(ErrorCode::InvalidState, SessionPhase::Setup, "Session already started");
        return false;
    }

    Core& core = *m_core;
    core.type.store(SessionType::OUTGOING);
    core.startedIso8601 = TransferHistory::nowIso8601();
    core.filePath = filePath;

    auto failNow = [&core, &error](const SessionError& e) {
        error = e;
        core.finish(outcomeFromError(core, e));
        return false;
    };

    // Setup: the file must be there and readable before a code is handed out
    std::error_code ec;
    const std::filesystem::path path(filePath);
    if (!std::filesystem::is_regular_file(path, ec)) {
        return failNow(SessionError::make(ErrorCode::FileNotFound, SessionPhase::Setup,
                                          "File not found: " + filePath));
    }
    const uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return failNow(SessionError::make(ErrorCode::FileNotFound, SessionPhase::Setup,
                                          "Cannot read file size of " + filePath + ": " + ec.message()));
    }
    {
        std::ifstream input(filePath, std::ios::binary);
        if (!input) {
            return failNow(SessionError::make(ErrorCode::FileNotFound, SessionPhase::Setup,
                                              "File is not readable: " + filePath));
        }
    }
    std::string fileName = path.filename().string();
    if (!FileStreamer::sanitizeFileName(fileName)) {
        return failNow(SessionError::make(ErrorCode::FileNotFound, SessionPhase::Setup,
                                          "File name cannot be sent: " + filePath));
    }
    core.offer = TransferOffer{ fileName, size };

    if (!core.options.connector) {
        return failNow(SessionError::make(ErrorCode::InternalError, SessionPhase::Setup,
                                          "No mailbox connector configured"));
    }

    // Rendezvous: allocate the nameplate, return the code
    CodeChannel codeChannel(core.options.connector, core.options.codeWords);
    std::unique_ptr<PendingRendezvous> pending;
    SessionError phaseError;
    bool ok = false;
    {
        InterruptRegistration registration(core.cancel, [&codeChannel]() { codeChannel.interrupt(); });
        ok = codeChannel.allocate(code, pending, phaseError);
    }
    if (core.cancel.isCancelled()) {
        if (pending) {
            pending->abandon();
        }
        return failNow(SessionError::make(ErrorCode::Cancelled, SessionPhase::Rendezvous, "Cancelled by user"));
    }
    if (!ok) {
        return failNow(phaseError);
    }

    core.setStatus(SessionStatus::AWAITING_PEER);

    std::shared_ptr<PendingRendezvous> sharedPending(std::move(pending));
    std::shared_ptr<Core> shared = m_core;
    std::string err;
    if (!m_supervisor.spawn("send " + core.sessionId,
                            [shared, sharedPending]() { runSenderTask(shared, sharedPending); },
                            [shared]() { shared->cancel.cancel(); },
                            err)) {
        sharedPending->abandon();
        return failNow(SessionError::make(ErrorCode::InternalError, SessionPhase::Rendezvous, err));
    }
    return true;
}

bool TransferSession::beginReceive(const std::string& codeText,
                                   const std::string& destinationDir,
                                   std::string& savedPath,
                                   SessionError& error) {
    if (m_core->cancel.isCancelled()) {
        error = SessionError::make(ErrorCode::Cancelled, SessionPhase::Setup, "Session was cancelled");
        return false;
    }
    if (m_core->started.exchange(true)) {
        error = SessionError::make(ErrorCode::InvalidState, SessionPhase::Setup, "Session already started");
        return false;
    }

    Core& core = *m_core;
    core.type.store(SessionType::INCOMING);
    core.startedIso8601 = TransferHistory::nowIso8601();

    TransferOutcome outcome;
    try {
        outcome = runReceiver(core, codeText, destinationDir);
    } catch (const std::exception& e) {
        outcome = internalFailure(core, e.what());
    } catch (...) {
        outcome = internalFailure(core, "unknown exception");
    }
    core.finish(outcome);

    if (outcome.completed()) {
        savedPath = outcome.path;
        return true;
    }
    error = outcome.error;
    return false;
}

void TransferSession::cancel() {
    m_core->cancel.cancel();

    // Never started: nothing else will publish the outcome
    if (!m_core->started.load()) {
        m_core->finish(outcomeFromError(*m_core, SessionError::make(ErrorCode::Cancelled, SessionPhase::Setup,
                                                                    "Cancelled before start")));
    }
}

SessionStatus TransferSession::getStatus() const {
    return m_core->status.load();
}

SessionType TransferSession::getType() const {
    return m_core->type.load();
}

const std::string& TransferSession::getSessionId() const {
    return m_core->sessionId;
}

std::shared_future<TransferOutcome> TransferSession::outcome() const {
    return m_core->future;
}

void TransferSession::setProgressSink(std::shared_ptr<ProgressSink> sink) {
    m_core->progress = std::move(sink);
}

void TransferSession::setTransitObserver(std::shared_ptr<TransitObserver> observer) {
    m_core->observer = std::move(observer);
}

void TransferSession::setStatusCallback(SessionStatusCallback callback) {
    m_core->statusCallback = std::move(callback);
}

void TransferSession::setCompletionCallback(SessionCompletionCallback callback) {
    m_core->completionCallback = std::move(callback);
}

void TransferSession::setOfferPolicy(OfferPolicy policy) {
    m_core->offerPolicy = std::move(policy);
}

}  // namespace Stork
