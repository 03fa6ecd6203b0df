#include "engine/watch_session.hpp"

#include <QDir>

#include <exception>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/file_ops.hpp"
#include "engine/inotify_watcher.hpp"

namespace tidemark {

namespace fs = std::filesystem;

namespace {

fs::path stagingParentFor(const SessionOptions &options)
{
    if (!options.stagingParent.empty()) {
        return options.stagingParent;
    }
    return fs::path(QDir::tempPath().toStdString());
}

} // namespace

WatchSession::WatchSession(fs::path root, SessionOptions options)
    : m_root(normalizeDirectoryPath(root))
    , m_options(std::move(options))
    , m_ignore(m_root)
    , m_suppressor(m_options.suppressionWindow)
    , m_snapshots(m_root, stagingParentFor(m_options))
    , m_rollback(m_root, m_ledger, m_snapshots, m_suppressor)
    , m_channel(m_options.channelCapacity)
{
}

WatchSession::~WatchSession()
{
    stop();
}

bool WatchSession::start()
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_watcher && m_watcher->isRunning()) {
        return true;
    }
    // A watcher whose delivery thread failed is replaced.
    m_watcher.reset();

    auto watcher = std::make_unique<InotifyWatcher>(
        m_root,
        [this](const FsEvent &event) { handleEvent(event); },
        [this](const fs::path &dir) {
            return m_ignore.isIgnored(dir) || m_snapshots.isStagingPath(dir);
        });
    if (!watcher->start()) {
        TLOG_ERROR(QStringLiteral("WatchSession"),
                   QStringLiteral("start"),
                   QStringLiteral("session_start_failed"),
                   QStringLiteral("watch_unavailable"),
                   QStringLiteral("inotify"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"root", m_root.string()}}));
        return false;
    }
    m_watcher = std::move(watcher);

    TLOG_INFO(QStringLiteral("WatchSession"),
              QStringLiteral("start"),
              QStringLiteral("session_started"),
              QStringLiteral("folder_watch"),
              QStringLiteral("inotify"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"patterns", m_ignore.patterns().size()}}));
    return true;
}

void WatchSession::stop()
{
    std::unique_ptr<InotifyWatcher> watcher;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        watcher = std::move(m_watcher);
    }
    if (watcher) {
        watcher->stop();
        TLOG_INFO(QStringLiteral("WatchSession"),
                  QStringLiteral("stop"),
                  QStringLiteral("session_stopped"),
                  QStringLiteral("folder_unwatch"),
                  QStringLiteral("inotify"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()}}));
    }

    // Teardown never restores; a leftover snapshot is only cleaned up.
    if (m_snapshots.hasSnapshot()) {
        m_snapshots.discard();
        m_ledger.endCheckpoint(false);
    }
}

bool WatchSession::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_watcher && m_watcher->isRunning();
}

bool WatchSession::hasCheckpoint() const
{
    return m_ledger.hasCheckpoint();
}

ChangeTable WatchSession::changes() const
{
    return m_ledger.snapshot();
}

CheckpointResult WatchSession::createCheckpoint()
{
    const auto rules = m_ignore.rules();
    CheckpointResult result = m_snapshots.create(*rules);
    if (result.created) {
        m_ledger.beginCheckpoint();
    } else {
        m_ledger.endCheckpoint(false);
    }
    return result;
}

void WatchSession::cancelCheckpoint()
{
    m_rollback.cancel();
}

RollbackResult WatchSession::rollback()
{
    return m_rollback.rollbackAll();
}

bool WatchSession::rollbackFile(const std::string &relPath)
{
    return m_rollback.rollbackOne(relPath);
}

std::optional<fs::path> WatchSession::checkpointPath(const std::string &relPath) const
{
    return m_rollback.checkpointPathFor(relPath);
}

bool WatchSession::clearAllChanges()
{
    if (m_ledger.hasCheckpoint()) {
        TLOG_WARN(QStringLiteral("WatchSession"),
                  QStringLiteral("clearAllChanges"),
                  QStringLiteral("clear_rejected"),
                  QStringLiteral("checkpoint_active"),
                  QStringLiteral("precondition"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()}}));
        return false;
    }
    m_ledger.clear();
    return true;
}

void WatchSession::reloadIgnorePatterns()
{
    m_ignore.reload();
    {
        // Directories the old rules skipped have no watch yet.
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_watcher) {
            m_watcher->refreshWatches();
        }
    }
    TLOG_INFO(QStringLiteral("WatchSession"),
              QStringLiteral("reloadIgnorePatterns"),
              QStringLiteral("ignore_rules_reloaded"),
              QStringLiteral("user_request"),
              QStringLiteral("override_file"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"patterns", m_ignore.patterns()}}));
}

std::vector<std::string> WatchSession::ignorePatterns() const
{
    return m_ignore.patterns();
}

void WatchSession::setChangeListener(ChangeListener listener)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_listener = std::move(listener);
}

void WatchSession::handleEvent(const FsEvent &event)
{
    if (event.isDirectory) {
        return;
    }

    const fs::path path(event.path);
    if (m_ignore.isIgnored(path)) {
        return;
    }
    // Checkpoint copies staged inside the root are not user changes.
    if (m_snapshots.isStagingPath(path)) {
        return;
    }

    const auto relPath = relativeGenericPath(m_root, path);
    if (!relPath.has_value()) {
        return;
    }

    if (m_suppressor.isSuppressed(*relPath)) {
        TLOG_DEBUG(QStringLiteral("WatchSession"),
                   QStringLiteral("handleEvent"),
                   QStringLiteral("event_suppressed"),
                   QStringLiteral("own_write"),
                   QStringLiteral("suppression_window"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"root", m_root.string()},
                                   {"path", *relPath},
                                   {"kind", toChangeKindString(event.kind)}}));
        return;
    }

    const auto now = std::chrono::system_clock::now();
    m_ledger.registerChange(*relPath, event.kind, now);
    TLOG_DEBUG(QStringLiteral("WatchSession"),
               QStringLiteral("handleEvent"),
               QStringLiteral("change_recorded"),
               QStringLiteral("filesystem_event"),
               QStringLiteral("ledger_register"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", m_root.string()},
                               {"path", *relPath},
                               {"kind", toChangeKindString(event.kind)}}));

    notifyListener();

    ChangeNotification notification;
    notification.root = m_root.string();
    notification.path = *relPath;
    notification.kind = event.kind;
    notification.timestamp = now;
    m_channel.push(std::move(notification));
}

void WatchSession::notifyListener()
{
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        listener = m_listener;
    }
    if (!listener) {
        return;
    }

    // A failing listener must never take down the delivery thread.
    try {
        listener(m_root.string());
    } catch (const std::exception &ex) {
        TLOG_WARN(QStringLiteral("WatchSession"),
                  QStringLiteral("notifyListener"),
                  QStringLiteral("listener_failed"),
                  QStringLiteral("listener_exception"),
                  QStringLiteral("callback"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()},
                                  {"what", ex.what()}}));
    }
}

} // namespace tidemark
