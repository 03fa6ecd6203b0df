#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/ignore_matcher.hpp"

namespace tidemark {

/**
 * SnapshotStore materializes checkpoint copies of a watched root.
 *
 * A snapshot is a private staging directory mirroring the root's non-ignored
 * files. At most one snapshot exists per store; creating a new one discards
 * the previous one. The staging directory is removed on discard and when the
 * store is destroyed.
 */
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path root, std::filesystem::path stagingParent);
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore &) = delete;
    SnapshotStore &operator=(const SnapshotStore &) = delete;

    CheckpointResult create(const IgnoreRules &rules);
    void discard();

    bool hasSnapshot() const;
    std::optional<std::filesystem::path> stagingDir() const;

    // Staged copy of relPath if it exists on disk.
    std::optional<std::filesystem::path> stagedPathFor(const std::string &relPath) const;

    // Relative paths of every staged regular file.
    std::vector<std::string> stagedFiles() const;

    // True for a staging directory of any store sharing this staging parent,
    // and for anything below one. Only matters when the parent lies inside a
    // watched root.
    bool isStagingPath(const std::filesystem::path &path) const;

    static constexpr const char *kStagingPrefix = "tidemark_";

private:
    static void removeTree(const std::filesystem::path &dir);

    std::filesystem::path m_root;
    std::filesystem::path m_stagingParent;

    mutable std::mutex m_mutex;
    std::optional<std::filesystem::path> m_stagingDir;
};

} // namespace tidemark
