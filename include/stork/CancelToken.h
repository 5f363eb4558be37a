/**
 * @file CancelToken.h
 * @brief Cooperative cancellation shared between a session and its phases
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace Stork {

/**
 * @class CancelToken
 * @brief One-shot cancellation flag with interrupt hooks
 *
 * Chunk loops poll isCancelled() between chunks. Code that blocks inside a
 * socket call registers an interrupt hook (typically "shut down my socket")
 * so cancel() can unblock it.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Hooks run under the token's mutex, so once unregisterInterrupt() returns
 *   the hook is guaranteed not to be running. Hooks must not call back into
 *   the same token.
 */
class CancelToken {
public:
    using InterruptFn = std::function<void()>;

    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    /**
     * @brief Raise the flag and run every registered hook once
     *
     * Idempotent: later calls are no-ops.
     */
    void cancel();

    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    /**
     * @brief Register a hook to run on cancel()
     * @return Registration id for unregisterInterrupt()
     *
     * If the token is already cancelled the hook runs immediately.
     */
    uint64_t registerInterrupt(InterruptFn fn);

    void unregisterInterrupt(uint64_t id);

private:
    std::atomic<bool> m_cancelled{ false };
    mutable std::mutex m_mutex;
    uint64_t m_nextId = 1;
    std::map<uint64_t, InterruptFn> m_hooks;
};

/**
 * @brief RAII registration of a CancelToken interrupt hook
 */
class InterruptRegistration {
public:
    InterruptRegistration(CancelToken& token, CancelToken::InterruptFn fn)
        : m_token(token)
        , m_id(token.registerInterrupt(std::move(fn)))
    {
    }

    ~InterruptRegistration() { m_token.unregisterInterrupt(m_id); }

    InterruptRegistration(const InterruptRegistration&) = delete;
    InterruptRegistration& operator=(const InterruptRegistration&) = delete;

private:
    CancelToken& m_token;
    uint64_t m_id;
};

}  // namespace Stork
