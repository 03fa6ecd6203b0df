#include "engine/rollback_engine.hpp"

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/file_ops.hpp"

namespace tidemark {

namespace fs = std::filesystem;

RollbackEngine::RollbackEngine(fs::path root,
                               ChangeLedger &ledger,
                               SnapshotStore &snapshots,
                               EventSuppressor &suppressor)
    : m_root(std::move(root))
    , m_ledger(ledger)
    , m_snapshots(snapshots)
    , m_suppressor(suppressor)
{
}

RollbackResult RollbackEngine::rollbackAll()
{
    RollbackResult result;

    const auto stagingDir = m_snapshots.stagingDir();
    if (!m_ledger.hasCheckpoint() || !stagingDir.has_value()) {
        TLOG_WARN(QStringLiteral("RollbackEngine"),
                  QStringLiteral("rollbackAll"),
                  QStringLiteral("rollback_rejected"),
                  QStringLiteral("no_active_checkpoint"),
                  QStringLiteral("precondition"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()}}));
        return result;
    }

    for (const auto &relPath : m_snapshots.stagedFiles()) {
        m_suppressor.suppress(relPath);
        std::error_code error;
        if (copyFilePreservingMetadata(*stagingDir / relPath, m_root / relPath, error)) {
            ++result.restoredFiles;
        } else {
            result.errors.push_back(describeError(m_root / relPath, error));
        }
    }

    // These did not exist at checkpoint time, so restoring means removing.
    for (const auto &relPath : m_ledger.createdSinceCheckpoint()) {
        const fs::path target = m_root / relPath;
        std::error_code error;
        if (!fs::exists(target, error)) {
            continue;
        }
        m_suppressor.suppress(relPath);
        if (removeFileIfPresent(target, error)) {
            ++result.removedFiles;
        } else {
            result.errors.push_back(describeError(target, error));
        }
    }

    m_snapshots.discard();
    m_ledger.endCheckpoint(true);

    result.success = result.errors.empty();
    if (!result.success) {
        TLOG_WARN(QStringLiteral("RollbackEngine"),
                  QStringLiteral("rollbackAll"),
                  QStringLiteral("rollback_partial"),
                  QStringLiteral("per_file_io_error"),
                  QStringLiteral("restore_from_snapshot"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()},
                                  {"errors", result.errors}}));
    }
    TLOG_INFO(QStringLiteral("RollbackEngine"),
              QStringLiteral("rollbackAll"),
              QStringLiteral("rollback_completed"),
              QStringLiteral("user_request"),
              QStringLiteral("restore_from_snapshot"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"restored", result.restoredFiles},
                              {"removed", result.removedFiles},
                              {"failed", result.errors.size()}}));
    return result;
}

bool RollbackEngine::rollbackOne(const std::string &relPath)
{
    if (!m_ledger.hasCheckpoint() || !m_snapshots.hasSnapshot()) {
        TLOG_WARN(QStringLiteral("RollbackEngine"),
                  QStringLiteral("rollbackOne"),
                  QStringLiteral("rollback_rejected"),
                  QStringLiteral("no_active_checkpoint"),
                  QStringLiteral("precondition"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()}, {"path", relPath}}));
        return false;
    }
    if (!isSafeRelativePath(relPath)) {
        TLOG_WARN(QStringLiteral("RollbackEngine"),
                  QStringLiteral("rollbackOne"),
                  QStringLiteral("rollback_rejected"),
                  QStringLiteral("unsafe_path"),
                  QStringLiteral("precondition"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()}, {"path", relPath}}));
        return false;
    }

    const auto recorded = m_ledger.recordedKind(relPath);
    const auto staged = m_snapshots.stagedPathFor(relPath);
    if (!recorded.has_value() && !staged.has_value()) {
        // Untracked and not in the snapshot: nothing to restore it to.
        TLOG_WARN(QStringLiteral("RollbackEngine"),
                  QStringLiteral("rollbackOne"),
                  QStringLiteral("rollback_rejected"),
                  QStringLiteral("untracked_path"),
                  QStringLiteral("precondition"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()}, {"path", relPath}}));
        return false;
    }

    const ChangeKind kind = recorded.value_or(ChangeKind::Modified);
    const fs::path target = m_root / relPath;

    std::error_code error;
    bool ok = false;
    m_suppressor.suppress(relPath);
    if (kind != ChangeKind::Created && staged.has_value()) {
        ok = copyFilePreservingMetadata(*staged, target, error);
    } else {
        // Created after the checkpoint, or no staged copy to go back to.
        ok = removeFileIfPresent(target, error);
    }

    if (!ok) {
        TLOG_WARN(QStringLiteral("RollbackEngine"),
                  QStringLiteral("rollbackOne"),
                  QStringLiteral("rollback_file_failed"),
                  QStringLiteral("io_error"),
                  kind == ChangeKind::Created ? QStringLiteral("remove")
                                              : QStringLiteral("restore_from_snapshot"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"root", m_root.string()},
                                  {"path", relPath},
                                  {"error", error.message()}}));
        return false;
    }

    m_ledger.forget(relPath);
    TLOG_INFO(QStringLiteral("RollbackEngine"),
              QStringLiteral("rollbackOne"),
              QStringLiteral("rollback_file_completed"),
              QStringLiteral("user_request"),
              staged.has_value() && kind != ChangeKind::Created
                  ? QStringLiteral("restore_from_snapshot")
                  : QStringLiteral("remove"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()},
                              {"path", relPath},
                              {"kind", toChangeKindString(kind)}}));
    return true;
}

std::optional<fs::path> RollbackEngine::checkpointPathFor(const std::string &relPath) const
{
    if (!m_ledger.hasCheckpoint()) {
        return std::nullopt;
    }
    return m_snapshots.stagedPathFor(relPath);
}

void RollbackEngine::cancel()
{
    m_snapshots.discard();
    m_ledger.endCheckpoint(false);
    TLOG_INFO(QStringLiteral("RollbackEngine"),
              QStringLiteral("cancel"),
              QStringLiteral("checkpoint_cancelled"),
              QStringLiteral("user_request"),
              QStringLiteral("discard_snapshot"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"root", m_root.string()}}));
}

} // namespace tidemark
