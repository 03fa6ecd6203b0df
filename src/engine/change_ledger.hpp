#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tidemark {

/**
 * ChangeLedger keeps the per-file change history of one watched root.
 *
 * Two tables are maintained: the all-time table, and the since-checkpoint
 * table which only receives changes while a checkpoint is active. Readers
 * see exactly one of them depending on the checkpoint flag.
 *
 * All operations take the same lock. It is only ever held for table updates,
 * never across file I/O.
 */
class ChangeLedger {
public:
    // Merge a new raw event kind into the previously recorded one.
    static ChangeKind coalesce(std::optional<ChangeKind> previous, ChangeKind incoming);

    void registerChange(const std::string &relPath,
                        ChangeKind kind,
                        std::chrono::system_clock::time_point timestamp);

    // Copy of the since-checkpoint table while a checkpoint is active,
    // otherwise of the all-time table.
    ChangeTable snapshot() const;
    ChangeTable allTimeTable() const;

    // Since-checkpoint entry first, then all-time entry.
    std::optional<ChangeKind> recordedKind(const std::string &relPath) const;
    std::vector<std::string> createdSinceCheckpoint() const;

    bool hasCheckpoint() const;
    void beginCheckpoint();
    void endCheckpoint(bool clearAllTime);

    void forget(const std::string &relPath);
    void clear();

private:
    static void apply(ChangeTable &table,
                      const std::string &relPath,
                      ChangeKind kind,
                      std::chrono::system_clock::time_point timestamp);

    mutable std::mutex m_mutex;
    ChangeTable m_allTime;
    ChangeTable m_sinceCheckpoint;
    bool m_checkpointActive = false;
};

} // namespace tidemark
