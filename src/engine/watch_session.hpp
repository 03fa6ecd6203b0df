#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/change_channel.hpp"
#include "engine/change_ledger.hpp"
#include "engine/event_suppressor.hpp"
#include "engine/ignore_matcher.hpp"
#include "engine/rollback_engine.hpp"
#include "engine/snapshot_store.hpp"

namespace tidemark {

class InotifyWatcher;

struct SessionOptions {
    std::chrono::milliseconds suppressionWindow = EventSuppressor::kDefaultWindow;
    std::size_t channelCapacity = ChangeChannel::kDefaultCapacity;
    // Parent of the checkpoint staging directory. Empty means the system
    // temporary directory.
    std::filesystem::path stagingParent;
};

/**
 * WatchSession tracks one watched root.
 *
 * It owns the inotify subscription, filters decoded events through the ignore
 * rules and the suppressor, records accepted ones in the ledger, and
 * announces them to the listener and the change channel. Checkpoint and
 * rollback operations are forwarded to the snapshot store and the rollback
 * engine.
 *
 * Every public method may be called from any thread. Checkpoint creation and
 * rollbacks are long-running; callers must not run two of them concurrently
 * on the same session.
 */
class WatchSession {
public:
    using ChangeListener = std::function<void(const std::string &root)>;

    explicit WatchSession(std::filesystem::path root, SessionOptions options = {});
    ~WatchSession();

    WatchSession(const WatchSession &) = delete;
    WatchSession &operator=(const WatchSession &) = delete;

    const std::filesystem::path &root() const { return m_root; }

    bool start();
    void stop();
    bool isRunning() const;

    bool hasCheckpoint() const;
    ChangeTable changes() const;

    CheckpointResult createCheckpoint();
    void cancelCheckpoint();
    RollbackResult rollback();
    bool rollbackFile(const std::string &relPath);
    std::optional<std::filesystem::path> checkpointPath(const std::string &relPath) const;

    // Refused while a checkpoint is active.
    bool clearAllChanges();

    void reloadIgnorePatterns();
    std::vector<std::string> ignorePatterns() const;

    void setChangeListener(ChangeListener listener);
    ChangeChannel &notifications() { return m_channel; }

    // Entry point for decoded filesystem events. Called on the delivery thread.
    void handleEvent(const FsEvent &event);

private:
    void notifyListener();

    std::filesystem::path m_root;
    SessionOptions m_options;

    IgnoreMatcher m_ignore;
    ChangeLedger m_ledger;
    EventSuppressor m_suppressor;
    SnapshotStore m_snapshots;
    RollbackEngine m_rollback;
    ChangeChannel m_channel;

    mutable std::mutex m_stateMutex;
    std::unique_ptr<InotifyWatcher> m_watcher;
    ChangeListener m_listener;
};

} // namespace tidemark
