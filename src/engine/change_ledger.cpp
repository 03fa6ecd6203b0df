#include "engine/change_ledger.hpp"

namespace tidemark {

ChangeKind ChangeLedger::coalesce(std::optional<ChangeKind> previous, ChangeKind incoming)
{
    if (!previous.has_value()) {
        return incoming;
    }
    // A new file stays new however often it is edited afterwards.
    if (*previous == ChangeKind::Created && incoming == ChangeKind::Modified) {
        return ChangeKind::Created;
    }
    // Deleted and recreated is a net modification.
    if (*previous == ChangeKind::Deleted && incoming == ChangeKind::Created) {
        return ChangeKind::Modified;
    }
    return incoming;
}

void ChangeLedger::apply(ChangeTable &table,
                         const std::string &relPath,
                         ChangeKind kind,
                         std::chrono::system_clock::time_point timestamp)
{
    std::optional<ChangeKind> previous;
    auto it = table.find(relPath);
    if (it != table.end()) {
        previous = it->second.kind;
    }
    table[relPath] = ChangeRecord{coalesce(previous, kind), timestamp};
}

void ChangeLedger::registerChange(const std::string &relPath,
                                  ChangeKind kind,
                                  std::chrono::system_clock::time_point timestamp)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    apply(m_allTime, relPath, kind, timestamp);
    if (m_checkpointActive) {
        apply(m_sinceCheckpoint, relPath, kind, timestamp);
    }
}

ChangeTable ChangeLedger::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkpointActive ? m_sinceCheckpoint : m_allTime;
}

ChangeTable ChangeLedger::allTimeTable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_allTime;
}

std::optional<ChangeKind> ChangeLedger::recordedKind(const std::string &relPath) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sinceCheckpoint.find(relPath);
    if (it != m_sinceCheckpoint.end()) {
        return it->second.kind;
    }
    it = m_allTime.find(relPath);
    if (it != m_allTime.end()) {
        return it->second.kind;
    }
    return std::nullopt;
}

std::vector<std::string> ChangeLedger::createdSinceCheckpoint() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> paths;
    for (const auto &entry : m_sinceCheckpoint) {
        if (entry.second.kind == ChangeKind::Created) {
            paths.push_back(entry.first);
        }
    }
    return paths;
}

bool ChangeLedger::hasCheckpoint() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkpointActive;
}

void ChangeLedger::beginCheckpoint()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_checkpointActive = true;
    m_sinceCheckpoint.clear();
}

void ChangeLedger::endCheckpoint(bool clearAllTime)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_checkpointActive = false;
    m_sinceCheckpoint.clear();
    if (clearAllTime) {
        m_allTime.clear();
    }
}

void ChangeLedger::forget(const std::string &relPath)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinceCheckpoint.erase(relPath);
    m_allTime.erase(relPath);
}

void ChangeLedger::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_allTime.clear();
    m_sinceCheckpoint.clear();
}

} // namespace tidemark
