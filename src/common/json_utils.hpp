#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tidemark {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toChangeKindString(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Created:
        return "created";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Deleted:
        return "deleted";
    case ChangeKind::Moved:
        return "moved";
    }
    return "modified";
}

inline ChangeKind parseChangeKindString(const std::string &value)
{
    if (value == "created") {
        return ChangeKind::Created;
    }
    if (value == "deleted") {
        return ChangeKind::Deleted;
    }
    if (value == "moved") {
        return ChangeKind::Moved;
    }
    return ChangeKind::Modified;
}

inline void to_json(nlohmann::json &j, const ChangeKind &kind)
{
    j = toChangeKindString(kind);
}

inline void from_json(const nlohmann::json &j, ChangeKind &kind)
{
    if (j.is_string()) {
        kind = parseChangeKindString(j.get<std::string>());
    } else {
        kind = ChangeKind::Modified;
    }
}

inline void to_json(nlohmann::json &j, const ChangeRecord &record)
{
    j = nlohmann::json{
        {"type", record.kind},
        {"time", toIso8601Utc(record.timestamp)}
    };
}

inline void from_json(const nlohmann::json &j, ChangeRecord &record)
{
    if (j.contains("type")) {
        record.kind = j.at("type").get<ChangeKind>();
    } else {
        record.kind = ChangeKind::Modified;
    }
    record.timestamp = fromIso8601Utc(j.value("time", ""));
}

inline void to_json(nlohmann::json &j, const CheckpointResult &result)
{
    j = nlohmann::json{
        {"created", result.created},
        {"snapshotId", result.snapshotId},
        {"copiedFiles", result.copiedFiles},
        {"warnings", result.warnings}
    };
}

inline void to_json(nlohmann::json &j, const RollbackResult &result)
{
    j = nlohmann::json{
        {"success", result.success},
        {"restoredFiles", result.restoredFiles},
        {"removedFiles", result.removedFiles},
        {"errors", result.errors}
    };
}

inline void to_json(nlohmann::json &j, const FolderStatus &status)
{
    j = nlohmann::json{
        {"root", status.root},
        {"running", status.running},
        {"hasCheckpoint", status.hasCheckpoint},
        {"changeCount", status.changeCount},
        {"revision", status.revision},
        {"lastChange", status.lastChange == std::chrono::system_clock::time_point{}
                           ? std::string()
                           : toIso8601Utc(status.lastChange)}
    };
}

inline void from_json(const nlohmann::json &j, FolderStatus &status)
{
    status.root = j.value("root", "");
    status.running = j.value("running", false);
    status.hasCheckpoint = j.value("hasCheckpoint", false);
    status.changeCount = j.value("changeCount", static_cast<std::size_t>(0));
    status.revision = j.value("revision", 0ULL);
    status.lastChange = fromIso8601Utc(j.value("lastChange", ""));
}

} // namespace tidemark
