#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "common/models.hpp"

namespace tidemark {

/**
 * InotifyWatcher delivers recursive file notifications for one directory tree.
 *
 * Raw inotify records are decoded on the delivery thread into FsEvent values:
 *   IN_CREATE                -> Created
 *   IN_CLOSE_WRITE           -> Modified
 *   IN_DELETE                -> Deleted
 *   IN_MOVED_FROM + _TO pair -> Moved (at the destination)
 *   unpaired IN_MOVED_TO     -> Created (moved into the tree)
 *   unpaired IN_MOVED_FROM   -> Deleted (moved out of the tree)
 *
 * New subdirectories are watched as they appear; files already inside them
 * are reported as created. Directories rejected by the skip filter are never
 * watched. A directory moved out of the tree loses its watches.
 */
class InotifyWatcher {
public:
    using EventCallback = std::function<void(const FsEvent &)>;
    using DirectoryFilter = std::function<bool(const std::filesystem::path &)>;

    InotifyWatcher(std::filesystem::path root,
                   EventCallback callback,
                   DirectoryFilter skipDirectory);
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher &) = delete;
    InotifyWatcher &operator=(const InotifyWatcher &) = delete;

    // Sets up the watches and starts the delivery thread.
    bool start();
    // Blocks until the delivery thread has exited.
    void stop();

    bool isRunning() const { return m_running.load(); }
    std::size_t watchCount() const;

    // Re-applies the skip filter to the whole tree: watches directories it no
    // longer rejects and drops the ones it now rejects. Safe to call from any
    // thread while running.
    void refreshWatches();

private:
    void watchLoop();
    void processBuffer(const char *buffer, std::size_t length);
    void addWatchesRecursive(const std::filesystem::path &dir, ChangeKind reportFilesAs,
                             bool reportFiles);
    bool addSingleWatch(const std::filesystem::path &dir);
    // Removes the watch on dir and on every watched directory below it.
    void removeWatchesUnder(const std::filesystem::path &dir);
    std::filesystem::path pathForWatch(int wd) const;
    void deliver(ChangeKind kind, const std::filesystem::path &path, bool isDirectory);
    void closeDescriptors();

    std::filesystem::path m_root;
    EventCallback m_callback;
    DirectoryFilter m_skipDirectory;

    int m_inotifyFd = -1;
    int m_wakeFd = -1;

    std::atomic<bool> m_running{false};
    std::thread m_thread;

    mutable std::mutex m_watchMutex;
    std::unordered_map<int, std::filesystem::path> m_wdToPath;
};

} // namespace tidemark
