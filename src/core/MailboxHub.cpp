/**
 * @file MailboxHub.cpp
 * @brief MailboxHub and LocalMailboxConnector implementation
 */

#include "stork/MailboxHub.h"
#include "stork/CryptoUtils.h"
#include "stork/Debug.h"

#include <algorithm>

namespace Stork {

std::string mailboxStatusToString(MailboxStatus status) {
    switch (status) {
        case MailboxStatus::Ok:            return "ok";
        case MailboxStatus::NotFound:      return "not-found";
        case MailboxStatus::Full:          return "full";
        case MailboxStatus::Unreachable:   return "unreachable";
        case MailboxStatus::Closed:        return "closed";
        case MailboxStatus::Interrupted:   return "interrupted";
        case MailboxStatus::ProtocolError: return "protocol-error";
        default:                           return "unknown";
    }
}

//=============================================================================
// MailboxHub
//=============================================================================

MailboxHub::MailboxHub(std::chrono::milliseconds nameplateTtl)
    : m_nameplateTtl(nameplateTtl)
{
}

void MailboxHub::purgeExpiredLocked() {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (!it->second.claimed && now - it->second.createdAt >= m_nameplateTtl) {
            LOG_DEBUG("[Mailbox] Nameplate " << it->first << " expired unclaimed");
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}

MailboxStatus MailboxHub::allocate(const std::string& side, uint32_t& nameplate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    purgeExpiredLocked();

    uint32_t candidate = 1;
    for (const auto& entry : m_entries) {
        if (entry.first != candidate) {
            break;
        }
        ++candidate;
    }
    if (candidate > MAX_NAMEPLATE) {
        return MailboxStatus::Full;
    }

    Entry entry;
    entry.sides.push_back(side);
    entry.cursors[side] = 0;
    entry.createdAt = std::chrono::steady_clock::now();
    m_entries.emplace(candidate, std::move(entry));

    nameplate = candidate;
    return MailboxStatus::Ok;
}

MailboxStatus MailboxHub::claim(uint32_t nameplate, const std::string& side) {
    std::lock_guard<std::mutex> lock(m_mutex);
    purgeExpiredLocked();

    auto it = m_entries.find(nameplate);
    if (it == m_entries.end()) {
        return MailboxStatus::NotFound;
    }

    Entry& entry = it->second;
    if (std::find(entry.sides.begin(), entry.sides.end(), side) != entry.sides.end()) {
        return MailboxStatus::Ok;
    }
    if (entry.claimed || entry.sides.size() >= 2) {
        return MailboxStatus::Full;
    }

    entry.sides.push_back(side);
    entry.cursors[side] = 0;
    entry.claimed = true;
    m_cv.notify_all();
    return MailboxStatus::Ok;
}

MailboxStatus MailboxHub::add(uint32_t nameplate,
                              const std::string& side,
                              const std::string& phase,
                              const std::string& body) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(nameplate);
    if (it == m_entries.end()) {
        return MailboxStatus::Closed;
    }

    Entry& entry = it->second;
    if (std::find(entry.sides.begin(), entry.sides.end(), side) == entry.sides.end()) {
        return MailboxStatus::ProtocolError;
    }

    entry.log.push_back(MailboxMessage{ side, phase, body });
    m_cv.notify_all();
    return MailboxStatus::Ok;
}

MailboxStatus MailboxHub::receive(uint32_t nameplate,
                                  const std::string& side,
                                  MailboxMessage& out,
                                  const std::atomic<bool>& interrupted) {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (interrupted.load()) {
            return MailboxStatus::Interrupted;
        }

        auto it = m_entries.find(nameplate);
        if (it == m_entries.end()) {
            return MailboxStatus::Closed;
        }

        Entry& entry = it->second;
        size_t& cursor = entry.cursors[side];
        while (cursor < entry.log.size()) {
            const MailboxMessage& message = entry.log[cursor++];
            if (message.side != side) {
                out = message;
                return MailboxStatus::Ok;
            }
        }

        for (const auto& gone : entry.departed) {
            if (gone != side) {
                return MailboxStatus::Closed;
            }
        }

        m_cv.wait(lock);
    }
}

void MailboxHub::release(uint32_t nameplate, const std::string& side) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(nameplate);
    if (it == m_entries.end()) {
        return;
    }

    Entry& entry = it->second;
    auto pos = std::find(entry.sides.begin(), entry.sides.end(), side);
    if (pos == entry.sides.end()) {
        return;
    }
    entry.sides.erase(pos);
    entry.departed.insert(side);

    if (!entry.claimed || entry.sides.empty()) {
        m_entries.erase(it);
    }
    m_cv.notify_all();
}

void MailboxHub::wakeAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cv.notify_all();
}

bool MailboxHub::hasNameplate(uint32_t nameplate) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(nameplate) != 0;
}

size_t MailboxHub::nameplateCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

//=============================================================================
// LocalMailboxConnection
//=============================================================================

namespace {

class LocalMailboxConnection final : public MailboxConnection {
public:
    explicit LocalMailboxConnection(std::shared_ptr<MailboxHub> hub)
        : m_hub(std::move(hub))
        , m_side(CryptoUtils::randomHex(8))
    {
    }

    ~LocalMailboxConnection() override { release(); }

    const std::string& side() const override { return m_side; }

    MailboxStatus allocate(uint32_t& nameplate, std::string& errorMsg) override {
        if (m_nameplate != 0) {
            errorMsg = "Connection already bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }
        const MailboxStatus status = m_hub->allocate(m_side, nameplate);
        if (status == MailboxStatus::Ok) {
            m_nameplate = nameplate;
        } else {
            errorMsg = "allocate failed: " + mailboxStatusToString(status);
        }
        return status;
    }

    MailboxStatus claim(uint32_t nameplate, std::string& errorMsg) override {
        if (m_nameplate != 0) {
            errorMsg = "Connection already bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }
        const MailboxStatus status = m_hub->claim(nameplate, m_side);
        if (status == MailboxStatus::Ok) {
            m_nameplate = nameplate;
        } else {
            errorMsg = "claim failed: " + mailboxStatusToString(status);
        }
        return status;
    }

    MailboxStatus send(const std::string& phase, const std::string& body, std::string& errorMsg) override {
        if (m_nameplate == 0) {
            errorMsg = "Connection not bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }
        const MailboxStatus status = m_hub->add(m_nameplate, m_side, phase, body);
        if (status != MailboxStatus::Ok) {
            errorMsg = "add failed: " + mailboxStatusToString(status);
        }
        return status;
    }

    MailboxStatus receive(MailboxMessage& message, std::string& errorMsg) override {
        if (m_nameplate == 0) {
            errorMsg = "Connection not bound to a nameplate";
            return MailboxStatus::ProtocolError;
        }
        const MailboxStatus status = m_hub->receive(m_nameplate, m_side, message, m_interrupted);
        if (status != MailboxStatus::Ok) {
            errorMsg = "receive failed: " + mailboxStatusToString(status);
        }
        return status;
    }

    void interrupt() override {
        m_interrupted.store(true);
        m_hub->wakeAll();
    }

    void release() override {
        if (m_nameplate != 0) {
            m_hub->release(m_nameplate, m_side);
            m_nameplate = 0;
        }
    }

private:
    std::shared_ptr<MailboxHub> m_hub;
    std::string m_side;
    uint32_t m_nameplate = 0;
    std::atomic<bool> m_interrupted{ false };
};

}  // namespace

//=============================================================================
// LocalMailboxConnector
//=============================================================================

LocalMailboxConnector::LocalMailboxConnector(std::shared_ptr<MailboxHub> hub)
    : m_hub(std::move(hub))
{
}

bool LocalMailboxConnector::connect(std::unique_ptr<MailboxConnection>& out, std::string& errorMsg) {
    if (!m_hub) {
        errorMsg = "No mailbox hub configured";
        return false;
    }
    out = std::make_unique<LocalMailboxConnection>(m_hub);
    return true;
}

}  // namespace Stork
