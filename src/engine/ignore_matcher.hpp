#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tidemark {

// An immutable set of glob patterns. A relative path is matched when any of
// its segments, or the whole path, matches any pattern.
class IgnoreRules {
public:
    explicit IgnoreRules(std::vector<std::string> patterns);

    bool matches(const std::string &relPath) const;
    const std::vector<std::string> &patterns() const { return m_patterns; }

private:
    std::vector<std::string> m_patterns;
};

/**
 * IgnoreMatcher owns the ignore rules of one watched root: the built-in
 * defaults plus the lines of <root>/.tidemark_ignore.
 *
 * Rules are swapped atomically on reload(). Callers that walk a tree take
 * rules() once so a concurrent reload never changes the rules mid-walk.
 */
class IgnoreMatcher {
public:
    static constexpr const char *kOverrideFileName = ".tidemark_ignore";
    static constexpr const char *kBackupDirName = ".tidemark_backup";

    explicit IgnoreMatcher(std::filesystem::path root);

    void reload();

    // Absolute path check. Paths outside the root are never ignored.
    bool isIgnored(const std::filesystem::path &path) const;
    bool isIgnoredRelative(const std::string &relPath) const;

    std::shared_ptr<const IgnoreRules> rules() const;
    std::vector<std::string> patterns() const;

    static const std::vector<std::string> &defaultPatterns();

private:
    std::shared_ptr<const IgnoreRules> loadRules() const;

    std::filesystem::path m_root;
    mutable std::mutex m_mutex;
    std::shared_ptr<const IgnoreRules> m_rules;
};

} // namespace tidemark
