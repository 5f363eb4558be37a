/**
 * @file MailboxHub.h
 * @brief In-process mailbox store shared by the mailbox server and local connections
 */

#pragma once

#include "Mailbox.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Stork {

/**
 * @class MailboxHub
 * @brief Nameplate table and per-nameplate message logs
 *
 * Rules:
 * - Nameplates are allocated lowest-free-first starting at 1.
 * - A nameplate holds at most two sides.
 * - A nameplate nobody claimed expires after the configured TTL.
 * - Releasing a nameplate that was never claimed deletes it immediately.
 * - Each side receives the other side's messages in order; messages added
 *   before the other side arrived are delivered when it does.
 * - Once a side leaves, the remaining side drains queued messages and then
 *   receives Closed.
 *
 * Thread Safety: all methods are thread-safe.
 */
class MailboxHub {
public:
    explicit MailboxHub(std::chrono::milliseconds nameplateTtl =
                            std::chrono::milliseconds(NAMEPLATE_TTL_MS));

    MailboxHub(const MailboxHub&) = delete;
    MailboxHub& operator=(const MailboxHub&) = delete;

    MailboxStatus allocate(const std::string& side, uint32_t& nameplate);
    MailboxStatus claim(uint32_t nameplate, const std::string& side);

    MailboxStatus add(uint32_t nameplate,
                      const std::string& side,
                      const std::string& phase,
                      const std::string& body);

    /**
     * @brief Block until a message from the other side is available
     * @param interrupted Checked on every wakeup; see wakeAll()
     */
    MailboxStatus receive(uint32_t nameplate,
                          const std::string& side,
                          MailboxMessage& out,
                          const std::atomic<bool>& interrupted);

    void release(uint32_t nameplate, const std::string& side);

    /// Wake every blocked receive() so it re-checks its interrupt flag
    void wakeAll();

    bool hasNameplate(uint32_t nameplate) const;
    size_t nameplateCount() const;

private:
    struct Entry {
        std::vector<std::string> sides;
        std::set<std::string> departed;
        std::vector<MailboxMessage> log;
        std::map<std::string, size_t> cursors;
        bool claimed = false;
        std::chrono::steady_clock::time_point createdAt;
    };

    /// Caller must hold m_mutex
    void purgeExpiredLocked();

    const std::chrono::milliseconds m_nameplateTtl;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<uint32_t, Entry> m_entries;
};

/**
 * @brief MailboxConnector that talks to a MailboxHub in the same process
 */
class LocalMailboxConnector final : public MailboxConnector {
public:
    explicit LocalMailboxConnector(std::shared_ptr<MailboxHub> hub);

    bool connect(std::unique_ptr<MailboxConnection>& out, std::string& errorMsg) override;
    std::string describe() const override { return "local://hub"; }

    const std::shared_ptr<MailboxHub>& hub() const { return m_hub; }

private:
    std::shared_ptr<MailboxHub> m_hub;
};

}  // namespace Stork
