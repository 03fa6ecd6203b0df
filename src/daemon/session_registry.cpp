#include "daemon/session_registry.hpp"

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/file_ops.hpp"

namespace tidemark {

SessionRegistry::SessionRegistry(SessionOptions options)
    : m_options(std::move(options))
{
}

SessionRegistry::~SessionRegistry()
{
    std::map<std::string, Entry> entries;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries.swap(m_entries);
    }
    for (auto &item : entries) {
        item.second.session->stop();
    }
}

std::string SessionRegistry::keyFor(const std::string &root)
{
    return normalizeDirectoryPath(root).string();
}

std::shared_ptr<WatchSession> SessionRegistry::add(const std::string &root)
{
    const std::string key = keyFor(root);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            return it->second.session;
        }
    }

    auto session = std::make_shared<WatchSession>(key, m_options);
    if (!session->start()) {
        TLOG_WARN(QStringLiteral("SessionRegistry"),
                  QStringLiteral("add"),
                  QStringLiteral("session_not_running"),
                  QStringLiteral("watch_start_failed"),
                  QStringLiteral("keep_registered"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", key}}));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto inserted = m_entries.emplace(key, Entry{session, 0, {}});
    return inserted.first->second.session;
}

bool SessionRegistry::remove(const std::string &root)
{
    const std::string key = keyFor(root);
    std::shared_ptr<WatchSession> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_busy.count(key) > 0) {
            return false;
        }
        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return false;
        }
        session = it->second.session;
        m_entries.erase(it);
    }
    session->stop();
    return true;
}

std::shared_ptr<WatchSession> SessionRegistry::find(const std::string &root) const
{
    const std::string key = keyFor(root);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return it->second.session;
}

std::vector<std::string> SessionRegistry::roots() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto &item : m_entries) {
        result.push_back(item.first);
    }
    return result;
}

bool SessionRegistry::tryBeginOperation(const std::string &root)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_busy.insert(keyFor(root)).second;
}

void SessionRegistry::endOperation(const std::string &root)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_busy.erase(keyFor(root));
}

std::size_t SessionRegistry::drainNotifications()
{
    std::vector<std::shared_ptr<WatchSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &item : m_entries) {
            sessions.push_back(item.second.session);
        }
    }

    std::size_t total = 0;
    for (const auto &session : sessions) {
        const auto notifications = session->notifications().drain();
        if (notifications.empty()) {
            continue;
        }
        total += notifications.size();

        for (const auto &notification : notifications) {
            TLOG_DEBUG(QStringLiteral("SessionRegistry"),
                       QStringLiteral("drainNotifications"),
                       QStringLiteral("change_notified"),
                       QStringLiteral("filesystem_event"),
                       QStringLiteral("change_channel"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"root", notification.root},
                                       {"path", notification.path},
                                       {"kind", notification.kind}}));
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(session->root().string());
        if (it == m_entries.end()) {
            continue;
        }
        it->second.revision += notifications.size();
        it->second.lastChange = notifications.back().timestamp;
    }
    return total;
}

FolderStatus SessionRegistry::statusLocked(const std::string &key, const Entry &entry) const
{
    FolderStatus status;
    status.root = key;
    status.running = entry.session->isRunning();
    status.hasCheckpoint = entry.session->hasCheckpoint();
    status.changeCount = entry.session->changes().size();
    status.revision = entry.revision;
    status.lastChange = entry.lastChange;
    return status;
}

FolderStatus SessionRegistry::status(const std::string &root) const
{
    const std::string key = keyFor(root);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        FolderStatus status;
        status.root = key;
        return status;
    }
    return statusLocked(key, it->second);
}

std::vector<FolderStatus> SessionRegistry::statuses() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<FolderStatus> result;
    result.reserve(m_entries.size());
    for (const auto &item : m_entries) {
        result.push_back(statusLocked(item.first, item.second));
    }
    return result;
}

OperationGuard::OperationGuard(SessionRegistry &registry, std::string root)
    : m_registry(registry)
    , m_root(std::move(root))
    , m_acquired(registry.tryBeginOperation(m_root))
{
}

OperationGuard::~OperationGuard()
{
    if (m_acquired) {
        m_registry.endOperation(m_root);
    }
}

} // namespace tidemark
