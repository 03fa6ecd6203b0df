#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace tidemark {

struct ChangeRecord {
    ChangeKind kind = ChangeKind::Modified;
    std::chrono::system_clock::time_point timestamp;
};

// Keyed by root-relative path with forward slashes.
using ChangeTable = std::map<std::string, ChangeRecord>;

// A filesystem notification decoded at the platform boundary.
// Moves are reported once, at their destination path.
struct FsEvent {
    ChangeKind kind = ChangeKind::Modified;
    std::string path;
    bool isDirectory = false;
};

struct ChangeNotification {
    std::string root;
    std::string path;
    ChangeKind kind = ChangeKind::Modified;
    std::chrono::system_clock::time_point timestamp;
};

struct CheckpointResult {
    bool created = false;
    std::string snapshotId;
    std::string stagingDir;
    int copiedFiles = 0;
    std::vector<std::string> warnings;
};

struct RollbackResult {
    bool success = false;
    int restoredFiles = 0;
    int removedFiles = 0;
    std::vector<std::string> errors;
};

struct FolderStatus {
    std::string root;
    bool running = false;
    bool hasCheckpoint = false;
    std::size_t changeCount = 0;
    unsigned long long revision = 0;
    std::chrono::system_clock::time_point lastChange;
};

} // namespace tidemark
