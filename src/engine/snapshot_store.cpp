#include "engine/snapshot_store.hpp"

#include <QTemporaryDir>

#include <utility>

#include "common/logging.hpp"
#include "engine/file_ops.hpp"

namespace tidemark {

namespace fs = std::filesystem;

SnapshotStore::SnapshotStore(fs::path root, fs::path stagingParent)
    : m_root(std::move(root))
    , m_stagingParent(normalizeDirectoryPath(stagingParent))
{
}

SnapshotStore::~SnapshotStore()
{
    discard();
}

CheckpointResult SnapshotStore::create(const IgnoreRules &rules)
{
    discard();

    CheckpointResult result;

    std::error_code error;
    fs::create_directories(m_stagingParent, error);

    QTemporaryDir staging(QString::fromStdString(
        (m_stagingParent / (std::string(kStagingPrefix) + "XXXXXX")).string()));
    if (!staging.isValid()) {
        result.warnings.push_back("cannot create staging directory: "
                                  + staging.errorString().toStdString());
        TLOG_ERROR(QStringLiteral("SnapshotStore"),
                   QStringLiteral("create"),
                   QStringLiteral("staging_create_failed"),
                   QStringLiteral("checkpoint_request"),
                   QStringLiteral("temporary_dir"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"root", m_root.string()},
                                   {"parent", m_stagingParent.string()},
                                   {"error", staging.errorString().toStdString()}}));
        return result;
    }
    // Ownership moves to this store; discard() removes it.
    staging.setAutoRemove(false);
    const fs::path stagingDir = staging.path().toStdString();

    fs::recursive_directory_iterator it(
        m_root, fs::directory_options::skip_permission_denied, error);
    if (error) {
        result.warnings.push_back(describeError(m_root, error));
        removeTree(stagingDir);
        TLOG_ERROR(QStringLiteral("SnapshotStore"),
                   QStringLiteral("create"),
                   QStringLiteral("root_unreadable"),
                   QStringLiteral("checkpoint_request"),
                   QStringLiteral("directory_walk"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"root", m_root.string()},
                                   {"error", error.message()}}));
        return result;
    }

    const fs::recursive_directory_iterator end;
    while (!error && it != end) {
        const fs::path current = it->path();
        const auto relPath = relativeGenericPath(m_root, current);

        std::error_code typeError;
        const bool isDirectory = it->is_directory(typeError);

        // A staging parent inside the root must not be copied into itself.
        if (!relPath.has_value() || rules.matches(*relPath) || isStagingPath(current)) {
            if (isDirectory) {
                it.disable_recursion_pending();
            }
        } else if (!isDirectory && it->is_regular_file(typeError)) {
            std::error_code copyError;
            if (copyFilePreservingMetadata(current, stagingDir / *relPath, copyError)) {
                ++result.copiedFiles;
            } else {
                result.warnings.push_back(describeError(current, copyError));
            }
        }

        it.increment(error);
        if (error) {
            result.warnings.push_back(describeError(current, error));
            // The iterator is unusable after a failed increment.
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stagingDir = stagingDir;
    }

    result.created = true;
    result.snapshotId = stagingDir.filename().string();
    result.stagingDir = stagingDir.string();

    if (!result.warnings.empty()) {
        TLOG_WARN(QStringLiteral("SnapshotStore"),
                  QStringLiteral("create"),
                  QStringLiteral("checkpoint_partial"),
                  QStringLiteral("per_file_io_error"),
                  QStringLiteral("tree_copy"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()},
                                  {"failed", result.warnings.size()},
                                  {"warnings", result.warnings}}));
    }
    TLOG_INFO(QStringLiteral("SnapshotStore"),
              QStringLiteral("create"),
              QStringLiteral("snapshot_created"),
              QStringLiteral("checkpoint_request"),
              QStringLiteral("tree_copy"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"snapshotId", result.snapshotId},
                              {"copiedFiles", result.copiedFiles}}));
    return result;
}

void SnapshotStore::discard()
{
    std::optional<fs::path> stagingDir;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stagingDir.swap(m_stagingDir);
    }
    if (stagingDir.has_value()) {
        removeTree(*stagingDir);
    }
}

void SnapshotStore::removeTree(const fs::path &dir)
{
    std::error_code error;
    fs::remove_all(dir, error);
    if (error) {
        // An orphaned staging directory is left for the OS temp cleaner.
        TLOG_WARN(QStringLiteral("SnapshotStore"),
                  QStringLiteral("discard"),
                  QStringLiteral("staging_remove_failed"),
                  QStringLiteral("snapshot_discard"),
                  QStringLiteral("remove_all"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"dir", dir.string()},
                                  {"error", error.message()}}));
    }
}

bool SnapshotStore::hasSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stagingDir.has_value();
}

std::optional<fs::path> SnapshotStore::stagingDir() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stagingDir;
}

std::optional<fs::path> SnapshotStore::stagedPathFor(const std::string &relPath) const
{
    if (!isSafeRelativePath(relPath)) {
        return std::nullopt;
    }
    const auto dir = stagingDir();
    if (!dir.has_value()) {
        return std::nullopt;
    }
    const fs::path candidate = *dir / relPath;
    std::error_code error;
    if (!fs::exists(candidate, error)) {
        return std::nullopt;
    }
    return candidate;
}

bool SnapshotStore::isStagingPath(const fs::path &path) const
{
    const auto relPath = relativeGenericPath(m_stagingParent, path);
    if (!relPath.has_value()) {
        return false;
    }
    const std::string topLevel = relPath->substr(0, relPath->find('/'));
    return topLevel.rfind(kStagingPrefix, 0) == 0;
}

std::vector<std::string> SnapshotStore::stagedFiles() const
{
    std::vector<std::string> files;
    const auto dir = stagingDir();
    if (!dir.has_value()) {
        return files;
    }

    std::error_code error;
    fs::recursive_directory_iterator it(*dir, error);
    const fs::recursive_directory_iterator end;
    while (!error && it != end) {
        std::error_code typeError;
        if (it->is_regular_file(typeError)) {
            if (auto relPath = relativeGenericPath(*dir, it->path())) {
                files.push_back(*relPath);
            }
        }
        it.increment(error);
    }
    return files;
}

} // namespace tidemark
