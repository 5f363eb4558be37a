/**
 * @file PhaseGuard.h
 * @brief Phase-scoped timeout combinator
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include "CancelToken.h"
#include "SessionError.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace Stork {

/**
 * @brief How a guarded phase was resolved
 */
enum class PhaseResolution : uint8_t {
    Running,
    Completed,
    TimedOut,
    Cancelled
};

/**
 * @class PhaseGuard
 * @brief Races one blocking phase against its own timer and a CancelToken
 *
 * The guard is created right before a phase blocks. A watchdog thread waits
 * for the deadline; the CancelToken hook waits for cancellation. Whichever
 * of {phase result, deadline, cancellation} is recorded first wins:
 *
 * - If the timer or the token wins, the interrupt function is called once
 *   (e.g. shut down the socket the phase is blocked on) and conclude()
 *   reports the phase-specific timeout error or Cancelled, whatever the
 *   phase itself returned.
 * - If the phase concludes first, later timer or cancel signals are no-ops
 *   for this phase.
 * - A phase with a point of no return (publishing a received file) calls
 *   tryCommit() right before it. Once that succeeds the phase owns its
 *   result, and conclude() reports whatever the phase returns.
 *
 * Usage:
 * @code
 * PhaseGuard guard(SessionPhase::AwaitingPeer, ErrorCode::NoPeerJoined,
 *                  timeout, cancel, [&]() { pending->interrupt(); });
 * SessionError phaseError;
 * bool ok = pending->wait(channel, phaseError);
 * if (!guard.conclude(ok, phaseError, error)) { ... }
 * @endcode
 *
 * The interrupt function must be safe to call from another thread and must
 * be sticky (a phase that starts blocking after the interrupt still returns).
 */
class PhaseGuard {
public:
    using InterruptFn = std::function<void()>;

    /**
     * @param phase Phase reported in the resulting error
     * @param timeoutCode Error code used when the deadline wins
     * @param timeout Phase timeout; zero disables the timer
     * @param cancel Session cancel token
     * @param interrupt Unblocks the phase; called at most once
     */
    PhaseGuard(SessionPhase phase,
               ErrorCode timeoutCode,
               std::chrono::milliseconds timeout,
               CancelToken& cancel,
               InterruptFn interrupt);

    /**
     * @brief Stops the watchdog and detaches from the token
     *
     * Blocks until any in-flight interrupt call has returned.
     */
    ~PhaseGuard();

    PhaseGuard(const PhaseGuard&) = delete;
    PhaseGuard& operator=(const PhaseGuard&) = delete;

    /**
     * @brief Record the phase result and map it to the session result
     * @param phaseOk What the phase itself returned
     * @param phaseError Error from the phase (used when phaseOk is false)
     * @param error Output: the error that stands for this phase
     * @return true only if the phase succeeded before the timer and the token
     */
    bool conclude(bool phaseOk, const SessionError& phaseError, SessionError& error);

    /**
     * @brief Claim the phase before an irreversible step
     * @return false if the timer or the token already won; the step must not run
     */
    bool tryCommit();

    PhaseResolution resolution() const { return m_state.load(std::memory_order_acquire); }

private:
    void watchdogThreadFunc();

    /// Caller must hold m_mutex
    void fireLocked(PhaseResolution resolution);

    SessionPhase m_phase;
    ErrorCode m_timeoutCode;
    std::chrono::milliseconds m_timeout;
    InterruptFn m_interrupt;

    std::atomic<PhaseResolution> m_state{ PhaseResolution::Running };
    std::atomic<bool> m_committed{ false };

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop = false;

    std::thread m_watchdog;
    std::unique_ptr<InterruptRegistration> m_cancelRegistration;
};

}  // namespace Stork
