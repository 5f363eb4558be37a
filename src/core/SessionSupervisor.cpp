/**
 * @file SessionSupervisor.cpp
 * @brief Supervised session threads
 */

#include "stork/SessionSupervisor.h"
#include "stork/Debug.h"
#include "stork/ThreadSafeLog.h"

#include <system_error>
#include <thread>
#include <vector>

namespace Stork {

SessionSupervisor::~SessionSupervisor() {
    shutdown();
}

bool SessionSupervisor::spawn(const std::string& name, Task task, CancelFn cancel, std::string& errorMsg) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shuttingDown) {
            errorMsg = "Supervisor is shutting down";
            return false;
        }
        id = m_nextId++;
        m_tasks.emplace(id, std::move(cancel));
    }

    try {
        std::thread worker([this, id, name, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("[Supervisor] Task " << name << " escaped with exception: " << e.what());
                ThreadSafeLog::log("Supervisor: task " + name + " exception: " + e.what());
            }
            taskFinished(id);
        });
        worker.detach();
    } catch (const std::system_error& e) {
        taskFinished(id);
        errorMsg = std::string("Cannot start session thread: ") + e.what();
        return false;
    }

    LOG_DEBUG("[Supervisor] Started " << name);
    return true;
}

void SessionSupervisor::taskFinished(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.erase(id);
    m_idleCv.notify_all();
}

void SessionSupervisor::cancelAll() {
    std::vector<CancelFn> cancels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& pair : m_tasks) {
            if (pair.second) {
                cancels.push_back(pair.second);
            }
        }
    }
    // Outside the lock: a cancel hook may unblock a task that finishes at once
    for (auto& fn : cancels) {
        fn();
    }
}

bool SessionSupervisor::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this]() { return m_tasks.empty(); });
}

void SessionSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shuttingDown = true;
    }
    cancelAll();

    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return m_tasks.empty(); });
}

size_t SessionSupervisor::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

}  // namespace Stork
