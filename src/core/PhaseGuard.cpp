/**
 * @file PhaseGuard.cpp
 * @brief Phase-scoped timeout combinator implementation
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/PhaseGuard.h"
#include "stork/Debug.h"

namespace Stork {

PhaseGuard::PhaseGuard(SessionPhase phase,
                       ErrorCode timeoutCode,
                       std::chrono::milliseconds timeout,
                       CancelToken& cancel,
                       InterruptFn interrupt)
    : m_phase(phase)
    , m_timeoutCode(timeoutCode)
    , m_timeout(timeout)
    , m_interrupt(std::move(interrupt))
{
    if (m_timeout.count() > 0) {
        m_watchdog = std::thread(&PhaseGuard::watchdogThreadFunc, this);
    }

    // Registered last: an already-cancelled token fires immediately.
    m_cancelRegistration = std::make_unique<InterruptRegistration>(cancel, [this]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        fireLocked(PhaseResolution::Cancelled);
    });
}

PhaseGuard::~PhaseGuard() {
    // Detach from the token first so its hook cannot run past this point
    m_cancelRegistration.reset();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();

    if (m_watchdog.joinable()) {
        m_watchdog.join();
    }
}

void PhaseGuard::watchdogThreadFunc() {
    std::unique_lock<std::mutex> lock(m_mutex);
    const bool stopped = m_cv.wait_for(lock, m_timeout, [this]() { return m_stop; });
    if (!stopped) {
        fireLocked(PhaseResolution::TimedOut);
    }
}

void PhaseGuard::fireLocked(PhaseResolution resolution) {
    PhaseResolution expected = PhaseResolution::Running;
    if (!m_state.compare_exchange_strong(expected, resolution, std::memory_order_acq_rel)) {
        return;  // Phase already resolved
    }

    LOG_DEBUG("Phase " << sessionPhaseToString(m_phase) << " interrupted: "
              << (resolution == PhaseResolution::TimedOut ? "timed out" : "cancelled"));

    if (m_interrupt) {
        m_interrupt();
    }
}

bool PhaseGuard::tryCommit() {
    if (m_committed.load(std::memory_order_acquire)) {
        return true;
    }

    PhaseResolution expected = PhaseResolution::Running;
    if (!m_state.compare_exchange_strong(expected, PhaseResolution::Completed,
                                         std::memory_order_acq_rel)) {
        return false;
    }
    m_committed.store(true, std::memory_order_release);
    return true;
}

bool PhaseGuard::conclude(bool phaseOk, const SessionError& phaseError, SessionError& error) {
    PhaseResolution expected = PhaseResolution::Running;
    if (m_committed.load(std::memory_order_acquire) ||
        m_state.compare_exchange_strong(expected, PhaseResolution::Completed,
                                        std::memory_order_acq_rel)) {
        if (!phaseOk) {
            error = phaseError;
        }
        return phaseOk;
    }

    if (expected == PhaseResolution::Cancelled) {
        error = SessionError::make(ErrorCode::Cancelled, m_phase, "Cancelled by user");
    } else {
        error = SessionError::make(m_timeoutCode, m_phase,
            "Timed out after " + std::to_string(m_timeout.count()) + " ms");
    }
    return false;
}

}  // namespace Stork
