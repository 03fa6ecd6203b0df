#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace tidemark {

// Absolute, symlink-resolved form of a directory path without a trailing
// separator. Falls back to the lexically normalized absolute path when the
// directory cannot be resolved.
std::filesystem::path normalizeDirectoryPath(const std::filesystem::path &path);

// Root-relative form of path using forward slashes, or nullopt when path is
// not below root. Both arguments are expected to be absolute.
std::optional<std::string> relativeGenericPath(const std::filesystem::path &root,
                                               const std::filesystem::path &path);

// A relative path is accepted only when it is non-empty, not absolute and has
// no "." or ".." segments.
bool isSafeRelativePath(const std::string &relPath);

// Copies a regular file over dst, creating parent directories. Modification
// time and permission bits are carried over where the filesystem allows.
bool copyFilePreservingMetadata(const std::filesystem::path &src,
                                const std::filesystem::path &dst,
                                std::error_code &error);

// Removes a file. A missing file counts as success.
bool removeFileIfPresent(const std::filesystem::path &path, std::error_code &error);

std::string describeError(const std::filesystem::path &path, const std::error_code &error);

} // namespace tidemark
