#include "engine/file_ops.hpp"

namespace tidemark {

namespace fs = std::filesystem;

fs::path normalizeDirectoryPath(const fs::path &path)
{
    std::error_code error;
    fs::path resolved = fs::weakly_canonical(path, error);
    if (error) {
        resolved = fs::absolute(path, error).lexically_normal();
    }
    // "/a/b/" and "/a/b" must resolve to the same key.
    if (!resolved.has_filename() && resolved.has_parent_path()
        && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

std::optional<std::string> relativeGenericPath(const fs::path &root, const fs::path &path)
{
    const fs::path normalRoot = root.lexically_normal();
    const fs::path normalPath = path.lexically_normal();

    auto rootIt = normalRoot.begin();
    auto pathIt = normalPath.begin();
    for (; rootIt != normalRoot.end(); ++rootIt) {
        // A trailing separator leaves an empty last element.
        if (rootIt->empty()) {
            continue;
        }
        if (pathIt == normalPath.end() || *pathIt != *rootIt) {
            return std::nullopt;
        }
        ++pathIt;
    }

    fs::path relative;
    for (; pathIt != normalPath.end(); ++pathIt) {
        if (!pathIt->empty()) {
            relative /= *pathIt;
        }
    }
    if (relative.empty()) {
        return std::nullopt;
    }
    return relative.generic_string();
}

bool isSafeRelativePath(const std::string &relPath)
{
    if (relPath.empty()) {
        return false;
    }
    const fs::path path(relPath);
    if (path.is_absolute() || path.has_root_path()) {
        return false;
    }
    for (const auto &part : path) {
        if (part == "." || part == "..") {
            return false;
        }
    }
    return true;
}

bool copyFilePreservingMetadata(const fs::path &src, const fs::path &dst,
                                std::error_code &error)
{
    error.clear();
    const fs::file_status status = fs::status(src, error);
    if (error) {
        return false;
    }
    if (!fs::is_regular_file(status)) {
        error = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    if (dst.has_parent_path()) {
        fs::create_directories(dst.parent_path(), error);
        if (error) {
            return false;
        }
    }

    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, error);
    if (error) {
        return false;
    }

    // Metadata is best-effort; the content copy is what restores a file.
    std::error_code metaError;
    const auto mtime = fs::last_write_time(src, metaError);
    if (!metaError) {
        fs::last_write_time(dst, mtime, metaError);
    }
    metaError.clear();
    fs::permissions(dst, status.permissions(), fs::perm_options::replace, metaError);
    return true;
}

bool removeFileIfPresent(const fs::path &path, std::error_code &error)
{
    error.clear();
    fs::remove(path, error);
    if (error == std::errc::no_such_file_or_directory) {
        error.clear();
    }
    return !error;
}

std::string describeError(const fs::path &path, const std::error_code &error)
{
    return path.string() + ": " + error.message();
}

} // namespace tidemark
