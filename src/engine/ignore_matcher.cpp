#include "engine/ignore_matcher.hpp"

#include <fnmatch.h>

#include <fstream>
#include <utility>

#include "common/logging.hpp"
#include "engine/file_ops.hpp"

namespace tidemark {

namespace {

std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool globMatch(const std::string &pattern, const std::string &value)
{
    // No FNM_PATHNAME: '*' crosses '/' when matching whole relative paths.
    return fnmatch(pattern.c_str(), value.c_str(), FNM_NOESCAPE) == 0;
}

} // namespace

IgnoreRules::IgnoreRules(std::vector<std::string> patterns)
    : m_patterns(std::move(patterns))
{
}

bool IgnoreRules::matches(const std::string &relPath) const
{
    if (relPath.empty()) {
        return false;
    }

    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (start <= relPath.size()) {
        const auto slash = relPath.find('/', start);
        const auto end = slash == std::string::npos ? relPath.size() : slash;
        if (end > start) {
            segments.push_back(relPath.substr(start, end - start));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    for (const auto &pattern : m_patterns) {
        for (const auto &segment : segments) {
            if (globMatch(pattern, segment)) {
                return true;
            }
        }
        if (globMatch(pattern, relPath)) {
            return true;
        }
    }
    return false;
}

IgnoreMatcher::IgnoreMatcher(std::filesystem::path root)
    : m_root(std::move(root))
{
    m_rules = loadRules();
}

const std::vector<std::string> &IgnoreMatcher::defaultPatterns()
{
    static const std::vector<std::string> patterns = {
        ".git",
        ".svn",
        ".hg",
        "__pycache__",
        "*.pyc",
        "*.pyo",
        "node_modules",
        ".DS_Store",
        "Thumbs.db",
        "*.tmp",
        "*.log",
        ".idea",
        ".vscode",
        "*.egg-info",
        kBackupDirName,
    };
    return patterns;
}

std::shared_ptr<const IgnoreRules> IgnoreMatcher::loadRules() const
{
    std::vector<std::string> patterns = defaultPatterns();

    const std::filesystem::path overrideFile = m_root / kOverrideFileName;
    std::error_code error;
    if (!std::filesystem::exists(overrideFile, error)) {
        return std::make_shared<const IgnoreRules>(std::move(patterns));
    }

    std::ifstream in(overrideFile);
    if (!in) {
        TLOG_WARN(QStringLiteral("IgnoreMatcher"),
                  QStringLiteral("loadRules"),
                  QStringLiteral("ignore_file_unreadable"),
                  QStringLiteral("override_file"),
                  QStringLiteral("defaults_only"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"file", overrideFile.string()}}));
        return std::make_shared<const IgnoreRules>(std::move(patterns));
    }

    int added = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        patterns.push_back(line);
        ++added;
    }

    TLOG_DEBUG(QStringLiteral("IgnoreMatcher"),
               QStringLiteral("loadRules"),
               QStringLiteral("ignore_file_loaded"),
               QStringLiteral("override_file"),
               QStringLiteral("line_parse"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"file", overrideFile.string()},
                               {"patterns", added}}));
    return std::make_shared<const IgnoreRules>(std::move(patterns));
}

void IgnoreMatcher::reload()
{
    auto rules = loadRules();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rules = std::move(rules);
}

std::shared_ptr<const IgnoreRules> IgnoreMatcher::rules() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rules;
}

std::vector<std::string> IgnoreMatcher::patterns() const
{
    return rules()->patterns();
}

bool IgnoreMatcher::isIgnored(const std::filesystem::path &path) const
{
    const auto relPath = relativeGenericPath(m_root, path);
    if (!relPath.has_value()) {
        return false;
    }
    return rules()->matches(*relPath);
}

bool IgnoreMatcher::isIgnoredRelative(const std::string &relPath) const
{
    return rules()->matches(relPath);
}

} // namespace tidemark
