#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tidemark {

enum class DiffState {
    Text,
    Identical,
    Binary,
    MissingBoth,
    Unreadable
};

struct FileDiff {
    DiffState state = DiffState::Identical;
    // Unified diff text, only set for DiffState::Text.
    std::string text;
    int added = 0;
    int removed = 0;
    // Read error for DiffState::Unreadable.
    std::string error;
};

constexpr int kDefaultDiffContext = 4;
constexpr std::size_t kBinarySniffBytes = 8192;

// Splits on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> splitLines(const std::string &content);

// Unified diff with ---/+++ headers and @@ hunks built from a shortest edit
// script. Returns an empty string when both sides are equal.
std::string unifiedDiff(const std::vector<std::string> &oldLines,
                        const std::vector<std::string> &newLines,
                        const std::string &fromLabel,
                        const std::string &toLabel,
                        int context = kDefaultDiffContext);

// Compares the checkpoint copy of relPath with its current version. A side
// that does not exist is diffed as an empty file.
FileDiff diffFiles(const std::optional<std::filesystem::path> &checkpointFile,
                   const std::filesystem::path &currentFile,
                   const std::string &relPath);

std::string toDiffStateString(DiffState state);

} // namespace tidemark
