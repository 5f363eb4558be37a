/**
 * @file SessionSupervisor.h
 * @brief Owns the detached sender continuations
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace Stork {

/**
 * @class SessionSupervisor
 * @brief Runs session tasks on their own threads and tracks them to the end
 *
 * A sender's continuation (wait for peer, negotiate, stream) outlives the
 * beginSend() call that started it and the handle the caller holds. The
 * supervisor keeps the task accounted for: it can cancel every running task
 * and it waits for all of them before it is destroyed, so no session thread
 * ever runs against freed state.
 *
 * Thread Safety: all methods are thread-safe. The supervisor must outlive
 * the sessions that use it.
 */
class SessionSupervisor {
public:
    using Task = std::function<void()>;
    using CancelFn = std::function<void()>;

    SessionSupervisor() = default;

    /// Cancels and waits for every task (see shutdown())
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    /**
     * @brief Start @p task on a new thread
     * @param name Label for logs
     * @param task Work to run; exceptions are expected to be handled inside
     * @param cancel Called by cancelAll()/shutdown() while the task runs
     * @return false after shutdown() or if the thread cannot be created
     */
    bool spawn(const std::string& name, Task task, CancelFn cancel, std::string& errorMsg);

    /// Ask every running task to stop
    void cancelAll();

    /**
     * @brief Wait until no task is running
     * @return false on timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /**
     * @brief Refuse new tasks, cancel running ones and wait for all of them
     *
     * Idempotent.
     */
    void shutdown();

    size_t activeCount() const;

private:
    void taskFinished(uint64_t id);

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;
    bool m_shuttingDown = false;
    uint64_t m_nextId = 1;
    std::map<uint64_t, CancelFn> m_tasks;
};

}  // namespace Stork
