/**
 * @file CancelToken.cpp
 * @brief Cooperative cancellation implementation
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/CancelToken.h"

namespace Stork {

void CancelToken::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);

    bool expected = false;
    if (!m_cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    for (auto& entry : m_hooks) {
        if (entry.second) {
            entry.second();
        }
    }
}

uint64_t CancelToken::registerInterrupt(InterruptFn fn) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const uint64_t id = m_nextId++;
    if (m_cancelled.load(std::memory_order_acquire)) {
        if (fn) {
            fn();
        }
        return id;
    }

    m_hooks.emplace(id, std::move(fn));
    return id;
}

void CancelToken::unregisterInterrupt(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hooks.erase(id);
}

}  // namespace Stork
