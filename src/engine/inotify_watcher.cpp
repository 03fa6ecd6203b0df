#include "engine/inotify_watcher.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include "common/logging.hpp"

namespace tidemark {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_DELETE
    | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF;

constexpr std::size_t kBufferSize = 64 * 1024;

struct PendingMove {
    fs::path from;
    bool isDirectory = false;
};

bool isSameOrBelow(const fs::path &path, const fs::path &base)
{
    auto baseIt = base.begin();
    auto pathIt = path.begin();
    for (; baseIt != base.end(); ++baseIt, ++pathIt) {
        if (pathIt == path.end() || *pathIt != *baseIt) {
            return false;
        }
    }
    return true;
}

} // namespace

InotifyWatcher::InotifyWatcher(fs::path root,
                               EventCallback callback,
                               DirectoryFilter skipDirectory)
    : m_root(std::move(root))
    , m_callback(std::move(callback))
    , m_skipDirectory(std::move(skipDirectory))
{
}

InotifyWatcher::~InotifyWatcher()
{
    stop();
}

bool InotifyWatcher::start()
{
    if (m_running.load()) {
        return true;
    }
    // A delivery thread that died on a poll failure is reaped first.
    stop();

    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd < 0) {
        TLOG_ERROR(QStringLiteral("InotifyWatcher"),
                   QStringLiteral("start"),
                   QStringLiteral("inotify_init_failed"),
                   QStringLiteral("watch_start"),
                   QStringLiteral("inotify_init1"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"root", m_root.string()},
                                   {"error", std::strerror(errno)}}));
        return false;
    }

    m_wakeFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_wakeFd < 0) {
        TLOG_ERROR(QStringLiteral("InotifyWatcher"),
                   QStringLiteral("start"),
                   QStringLiteral("eventfd_failed"),
                   QStringLiteral("watch_start"),
                   QStringLiteral("eventfd"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"root", m_root.string()},
                                   {"error", std::strerror(errno)}}));
        closeDescriptors();
        return false;
    }

    if (!addSingleWatch(m_root)) {
        closeDescriptors();
        return false;
    }
    addWatchesRecursive(m_root, ChangeKind::Created, false);

    m_running = true;
    m_thread = std::thread([this]() { watchLoop(); });

    TLOG_INFO(QStringLiteral("InotifyWatcher"),
              QStringLiteral("start"),
              QStringLiteral("watch_started"),
              QStringLiteral("session_start"),
              QStringLiteral("inotify"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"watches", watchCount()}}));
    return true;
}

void InotifyWatcher::stop()
{
    const bool wasRunning = m_running.exchange(false);
    if (!wasRunning && !m_thread.joinable()) {
        return;
    }

    const uint64_t one = 1;
    if (wasRunning && write(m_wakeFd, &one, sizeof(one)) < 0) {
        TLOG_WARN(QStringLiteral("InotifyWatcher"),
                  QStringLiteral("stop"),
                  QStringLiteral("wake_failed"),
                  QStringLiteral("watch_stop"),
                  QStringLiteral("eventfd"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", std::strerror(errno)}}));
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    closeDescriptors();

    std::lock_guard<std::mutex> lock(m_watchMutex);
    m_wdToPath.clear();
}

void InotifyWatcher::closeDescriptors()
{
    if (m_inotifyFd >= 0) {
        close(m_inotifyFd);
        m_inotifyFd = -1;
    }
    if (m_wakeFd >= 0) {
        close(m_wakeFd);
        m_wakeFd = -1;
    }
}

std::size_t InotifyWatcher::watchCount() const
{
    std::lock_guard<std::mutex> lock(m_watchMutex);
    return m_wdToPath.size();
}

bool InotifyWatcher::addSingleWatch(const fs::path &dir)
{
    const int wd = inotify_add_watch(m_inotifyFd, dir.c_str(), kWatchMask | IN_ONLYDIR);
    if (wd < 0) {
        TLOG_WARN(QStringLiteral("InotifyWatcher"),
                  QStringLiteral("addSingleWatch"),
                  QStringLiteral("add_watch_failed"),
                  QStringLiteral("directory_watch"),
                  QStringLiteral("inotify_add_watch"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"dir", dir.string()},
                                  {"error", std::strerror(errno)}}));
        return false;
    }

    // Re-adding an inode returns its existing descriptor; the path is updated
    // so renamed directories resolve to their new location.
    std::lock_guard<std::mutex> lock(m_watchMutex);
    m_wdToPath[wd] = dir;
    return true;
}

void InotifyWatcher::removeWatchesUnder(const fs::path &dir)
{
    std::vector<int> removed;
    {
        std::lock_guard<std::mutex> lock(m_watchMutex);
        for (auto it = m_wdToPath.begin(); it != m_wdToPath.end();) {
            if (isSameOrBelow(it->second, dir)) {
                removed.push_back(it->first);
                it = m_wdToPath.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (int wd : removed) {
        // The kernel may already have dropped the watch with its directory.
        inotify_rm_watch(m_inotifyFd, wd);
    }
    if (!removed.empty()) {
        TLOG_DEBUG(QStringLiteral("InotifyWatcher"),
                   QStringLiteral("removeWatchesUnder"),
                   QStringLiteral("watches_removed"),
                   QStringLiteral("directory_left_tree"),
                   QStringLiteral("inotify_rm_watch"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"dir", dir.string()},
                                   {"count", removed.size()}}));
    }
}

void InotifyWatcher::refreshWatches()
{
    if (!m_running.load()) {
        return;
    }

    std::vector<fs::path> rejected;
    if (m_skipDirectory) {
        std::lock_guard<std::mutex> lock(m_watchMutex);
        for (const auto &entry : m_wdToPath) {
            if (entry.second != m_root && m_skipDirectory(entry.second)) {
                rejected.push_back(entry.second);
            }
        }
    }
    for (const fs::path &dir : rejected) {
        removeWatchesUnder(dir);
    }

    addWatchesRecursive(m_root, ChangeKind::Created, false);

    TLOG_INFO(QStringLiteral("InotifyWatcher"),
              QStringLiteral("refreshWatches"),
              QStringLiteral("watches_refreshed"),
              QStringLiteral("ignore_rules_changed"),
              QStringLiteral("tree_rescan"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"dropped", rejected.size()},
                              {"watches", watchCount()}}));
}

void InotifyWatcher::addWatchesRecursive(const fs::path &dir, ChangeKind reportFilesAs,
                                         bool reportFiles)
{
    std::error_code error;
    fs::recursive_directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, error);
    const fs::recursive_directory_iterator end;
    while (!error && it != end) {
        const fs::path current = it->path();
        std::error_code typeError;
        if (it->is_directory(typeError) && !it->is_symlink(typeError)) {
            if (m_skipDirectory && m_skipDirectory(current)) {
                it.disable_recursion_pending();
            } else {
                addSingleWatch(current);
            }
        } else if (reportFiles && it->is_regular_file(typeError)) {
            deliver(reportFilesAs, current, false);
        }
        it.increment(error);
    }
}

fs::path InotifyWatcher::pathForWatch(int wd) const
{
    std::lock_guard<std::mutex> lock(m_watchMutex);
    auto it = m_wdToPath.find(wd);
    if (it == m_wdToPath.end()) {
        return {};
    }
    return it->second;
}

void InotifyWatcher::deliver(ChangeKind kind, const fs::path &path, bool isDirectory)
{
    if (!m_callback) {
        return;
    }
    FsEvent event;
    event.kind = kind;
    event.path = path.string();
    event.isDirectory = isDirectory;
    m_callback(event);
}

void InotifyWatcher::watchLoop()
{
    std::vector<char> buffer(kBufferSize);

    while (m_running.load()) {
        pollfd fds[2];
        fds[0].fd = m_inotifyFd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = m_wakeFd;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            TLOG_ERROR(QStringLiteral("InotifyWatcher"),
                       QStringLiteral("watchLoop"),
                       QStringLiteral("poll_failed"),
                       QStringLiteral("event_delivery"),
                       QStringLiteral("poll"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"root", m_root.string()},
                                       {"error", std::strerror(errno)}}));
            // Nothing is delivered any more; report the watcher as stopped.
            m_running = false;
            break;
        }
        if (fds[1].revents & POLLIN) {
            break;
        }
        if (!(fds[0].revents & POLLIN)) {
            continue;
        }

        while (true) {
            const ssize_t length = read(m_inotifyFd, buffer.data(), buffer.size());
            if (length < 0) {
                if (errno != EAGAIN && errno != EINTR) {
                    TLOG_WARN(QStringLiteral("InotifyWatcher"),
                              QStringLiteral("watchLoop"),
                              QStringLiteral("read_failed"),
                              QStringLiteral("event_delivery"),
                              QStringLiteral("read"),
                              logging::defaultWho(),
                              QString(),
                              (nlohmann::json{{"root", m_root.string()},
                                              {"error", std::strerror(errno)}}));
                }
                break;
            }
            if (length == 0) {
                break;
            }
            processBuffer(buffer.data(), static_cast<std::size_t>(length));
        }
    }
}

void InotifyWatcher::processBuffer(const char *buffer, std::size_t length)
{
    std::unordered_map<uint32_t, PendingMove> pendingMoves;
    std::vector<uint32_t> moveOrder;

    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= length) {
        inotify_event event{};
        std::memcpy(&event, buffer + offset, sizeof(inotify_event));
        const char *nameStart = buffer + offset + sizeof(inotify_event);
        offset += sizeof(inotify_event) + event.len;

        if (event.mask & IN_Q_OVERFLOW) {
            TLOG_WARN(QStringLiteral("InotifyWatcher"),
                      QStringLiteral("processBuffer"),
                      QStringLiteral("queue_overflow"),
                      QStringLiteral("event_burst"),
                      QStringLiteral("inotify"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"root", m_root.string()}}));
            continue;
        }

        if (event.mask & IN_IGNORED) {
            std::lock_guard<std::mutex> lock(m_watchMutex);
            m_wdToPath.erase(event.wd);
            continue;
        }

        const fs::path dir = pathForWatch(event.wd);
        if (dir.empty() || event.len == 0) {
            continue;
        }
        const fs::path path = dir / std::string(nameStart);
        const bool isDirectory = (event.mask & IN_ISDIR) != 0;

        if (event.mask & IN_CREATE) {
            if (isDirectory) {
                if (!m_skipDirectory || !m_skipDirectory(path)) {
                    addSingleWatch(path);
                    addWatchesRecursive(path, ChangeKind::Created, true);
                }
            }
            deliver(ChangeKind::Created, path, isDirectory);
        } else if (event.mask & IN_CLOSE_WRITE) {
            deliver(ChangeKind::Modified, path, false);
        } else if (event.mask & IN_DELETE) {
            deliver(ChangeKind::Deleted, path, isDirectory);
        } else if (event.mask & IN_MOVED_FROM) {
            pendingMoves[event.cookie] = PendingMove{path, isDirectory};
            moveOrder.push_back(event.cookie);
        } else if (event.mask & IN_MOVED_TO) {
            auto pending = pendingMoves.find(event.cookie);
            const bool paired = pending != pendingMoves.end();
            fs::path movedFrom;
            if (paired) {
                movedFrom = pending->second.from;
                pendingMoves.erase(pending);
            }
            const ChangeKind kind = paired ? ChangeKind::Moved : ChangeKind::Created;
            if (isDirectory) {
                if (!m_skipDirectory || !m_skipDirectory(path)) {
                    addSingleWatch(path);
                    addWatchesRecursive(path, kind, true);
                } else if (paired) {
                    // Renamed into a skipped name: its old watches would keep
                    // reporting under the old path.
                    removeWatchesUnder(movedFrom);
                }
            }
            deliver(kind, path, isDirectory);
        }
    }

    for (uint32_t cookie : moveOrder) {
        auto pending = pendingMoves.find(cookie);
        if (pending == pendingMoves.end()) {
            continue;
        }
        // Moved out of the tree. Its watches follow the inode and would
        // report changes outside the root under the old path.
        if (pending->second.isDirectory) {
            removeWatchesUnder(pending->second.from);
        }
        deliver(ChangeKind::Deleted, pending->second.from, pending->second.isDirectory);
    }
}

} // namespace tidemark
