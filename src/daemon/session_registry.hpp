#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/watch_session.hpp"

namespace tidemark {

/**
 * SessionRegistry owns one WatchSession per watched root and the per-root
 * bookkeeping the daemon reports: a revision counter and the time of the last
 * recorded change, both fed from the sessions' change channels.
 *
 * It also serializes long-running operations (checkpoint, rollback) per root
 * so two clients cannot interleave them on the same folder.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(SessionOptions options = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry &) = delete;
    SessionRegistry &operator=(const SessionRegistry &) = delete;

    // Creates and starts a session for root, or returns the existing one.
    std::shared_ptr<WatchSession> add(const std::string &root);
    // Stops and forgets the session. Fails while an operation is running on it.
    bool remove(const std::string &root);

    std::shared_ptr<WatchSession> find(const std::string &root) const;
    std::vector<std::string> roots() const;

    bool tryBeginOperation(const std::string &root);
    void endOperation(const std::string &root);

    // Moves every queued notification into the revision counters. Returns the
    // number of notifications consumed.
    std::size_t drainNotifications();

    FolderStatus status(const std::string &root) const;
    std::vector<FolderStatus> statuses() const;

    static std::string keyFor(const std::string &root);

private:
    struct Entry {
        std::shared_ptr<WatchSession> session;
        unsigned long long revision = 0;
        std::chrono::system_clock::time_point lastChange;
    };

    FolderStatus statusLocked(const std::string &key, const Entry &entry) const;

    SessionOptions m_options;
    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    std::set<std::string> m_busy;
};

// Holds the per-root operation slot for the lifetime of the guard.
class OperationGuard {
public:
    OperationGuard(SessionRegistry &registry, std::string root);
    ~OperationGuard();

    OperationGuard(const OperationGuard &) = delete;
    OperationGuard &operator=(const OperationGuard &) = delete;

    bool acquired() const { return m_acquired; }

private:
    SessionRegistry &m_registry;
    std::string m_root;
    bool m_acquired = false;
};

} // namespace tidemark
