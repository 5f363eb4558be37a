/**
 * @file ProgressSink.h
 * @brief Narrow observer interfaces for progress and transit events
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace Stork {

//=============================================================================
// ProgressSink
//=============================================================================

/**
 * @brief Receives (bytesMoved, bytesTotal) events from FileStreamer
 *
 * Called at most once per chunk, from the thread that moves the bytes.
 * Implementations must be cheap and must not throw.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void onProgress(uint64_t bytesMoved, uint64_t bytesTotal) = 0;
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(uint64_t bytesMoved, uint64_t bytesTotal)>;

/**
 * @brief Adapts a std::function to the ProgressSink interface
 */
class CallbackProgressSink final : public ProgressSink {
public:
    explicit CallbackProgressSink(ProgressCallback callback)
        : m_callback(std::move(callback)) {}

    void onProgress(uint64_t bytesMoved, uint64_t bytesTotal) override {
        if (m_callback) {
            m_callback(bytesMoved, bytesTotal);
        }
    }

private:
    ProgressCallback m_callback;
};

/**
 * @class ThrottledProgress
 * @brief Forwards progress to another sink at most every PROGRESS_THROTTLE_MS
 *
 * Used in front of UI sinks so a fast local transfer does not flood a
 * terminal or event queue. The final event (moved == total) is always
 * forwarded so observers see completion.
 *
 * Thread Safety: operator calls are serialized by an internal mutex.
 */
class ThrottledProgress final : public ProgressSink {
public:
    ThrottledProgress(ProgressSink& downstream, std::chrono::milliseconds interval);
    explicit ThrottledProgress(ProgressSink& downstream);

    void onProgress(uint64_t bytesMoved, uint64_t bytesTotal) override;

private:
    ProgressSink& m_downstream;
    std::chrono::milliseconds m_interval;
    std::chrono::steady_clock::time_point m_lastUpdate;
    bool m_hasForwarded = false;
    std::mutex m_mutex;
};

//=============================================================================
// TransitObserver
//=============================================================================

/**
 * @brief Receives transit negotiation events
 *
 * @p transport is one of the ability names ("direct-tcp-v1", "relay-v1");
 * @p endpoint is "host:port". All methods have empty defaults.
 */
class TransitObserver {
public:
    virtual ~TransitObserver() = default;

    /// A candidate connection attempt started
    virtual void onTransitAttempt(const std::string& transport, const std::string& endpoint) {
        (void)transport;
        (void)endpoint;
    }

    /// A candidate completed its handshake and was selected
    virtual void onTransitEstablished(const std::string& transport, const std::string& endpoint) {
        (void)transport;
        (void)endpoint;
    }
};

}  // namespace Stork
