/**
 * @file ProgressSink.cpp
 * @brief ThrottledProgress implementation
 */

#include "stork/ProgressSink.h"
#include "stork/config.h"

namespace Stork {

ThrottledProgress::ThrottledProgress(ProgressSink& downstream,
                                     std::chrono::milliseconds interval)
    : m_downstream(downstream)
    , m_interval(interval)
    , m_lastUpdate()
{
}

ThrottledProgress::ThrottledProgress(ProgressSink& downstream)
    : ThrottledProgress(downstream, std::chrono::milliseconds(PROGRESS_THROTTLE_MS))
{
}

void ThrottledProgress::onProgress(uint64_t bytesMoved, uint64_t bytesTotal) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto now = std::chrono::steady_clock::now();
    const bool isFinal = bytesMoved >= bytesTotal;

    // Only forward if the interval elapsed, or this is the last event
    if (!m_hasForwarded || isFinal || now - m_lastUpdate >= m_interval) {
        m_downstream.onProgress(bytesMoved, bytesTotal);
        m_lastUpdate = now;
        m_hasForwarded = true;
    }
}

}  // namespace Stork
