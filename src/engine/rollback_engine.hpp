#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/models.hpp"
#include "engine/change_ledger.hpp"
#include "engine/event_suppressor.hpp"
#include "engine/snapshot_store.hpp"

namespace tidemark {

/**
 * RollbackEngine restores a watched root to its checkpoint state.
 *
 * The ledger decides what a rollback means for each path: files created after
 * the checkpoint are removed, everything else is copied back from the
 * snapshot. Every write is announced to the suppressor first so the
 * resulting notifications are not recorded as new changes.
 */
class RollbackEngine {
public:
    RollbackEngine(std::filesystem::path root,
                   ChangeLedger &ledger,
                   SnapshotStore &snapshots,
                   EventSuppressor &suppressor);

    // Restores every staged file and removes post-checkpoint creations.
    // Ends the checkpoint and clears both ledger tables whatever the outcome.
    RollbackResult rollbackAll();

    // Restores a single path. Fails without touching the tree when no
    // checkpoint is active, the path is unsafe, or the path is unknown to
    // both the ledger and the snapshot.
    bool rollbackOne(const std::string &relPath);

    std::optional<std::filesystem::path> checkpointPathFor(const std::string &relPath) const;

    // Ends the checkpoint without restoring anything.
    void cancel();

private:
    std::filesystem::path m_root;
    ChangeLedger &m_ledger;
    SnapshotStore &m_snapshots;
    EventSuppressor &m_suppressor;
};

} // namespace tidemark
