#include "config/folder_config.hpp"

#include <QDir>
#include <QFile>
#include <QSaveFile>

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/file_ops.hpp"

namespace tidemark {

FolderConfig::FolderConfig()
    : FolderConfig(defaultConfigDir())
{
}

FolderConfig::FolderConfig(std::filesystem::path configDir)
    : m_configDir(std::move(configDir))
{
    load();
}

std::filesystem::path FolderConfig::defaultConfigDir()
{
    const QString overrideDir = qEnvironmentVariable("TIDEMARK_CONFIG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir.toStdString();
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return ".config/tidemark";
    }
    return (home + QStringLiteral("/.config/tidemark")).toStdString();
}

std::filesystem::path FolderConfig::configFile() const
{
    return m_configDir / "config.json";
}

std::string FolderConfig::normalizeFolder(const std::string &path)
{
    return normalizeDirectoryPath(path).string();
}

void FolderConfig::load()
{
    QFile file(QString::fromStdString(configFile().string()));
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        TLOG_WARN(QStringLiteral("FolderConfig"),
                  QStringLiteral("load"),
                  QStringLiteral("config_unreadable"),
                  QStringLiteral("startup"),
                  QStringLiteral("defaults"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"file", configFile().string()},
                                  {"error", file.errorString().toStdString()}}));
        return;
    }

    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TLOG_WARN(QStringLiteral("FolderConfig"),
                  QStringLiteral("load"),
                  QStringLiteral("config_corrupt"),
                  QStringLiteral("startup"),
                  QStringLiteral("defaults"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"file", configFile().string()}}));
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_folders.clear();
    const auto it = parsed.find("folders");
    if (it == parsed.end() || !it->is_array()) {
        return;
    }
    for (const auto &entry : *it) {
        if (!entry.is_string()) {
            continue;
        }
        const std::string folder = entry.get<std::string>();
        if (std::find(m_folders.begin(), m_folders.end(), folder) == m_folders.end()) {
            m_folders.push_back(folder);
        }
    }
}

std::vector<std::string> FolderConfig::folders() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_folders;
}

bool FolderConfig::addFolder(const std::string &path)
{
    const std::string folder = normalizeFolder(path);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_folders.begin(), m_folders.end(), folder) != m_folders.end()) {
        return false;
    }
    m_folders.push_back(folder);
    saveLocked();
    return true;
}

bool FolderConfig::removeFolder(const std::string &path)
{
    const std::string folder = normalizeFolder(path);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find(m_folders.begin(), m_folders.end(), folder);
    if (it == m_folders.end()) {
        // Entries written by hand may not be normalized.
        it = std::find(m_folders.begin(), m_folders.end(), path);
    }
    if (it == m_folders.end()) {
        return false;
    }
    m_folders.erase(it);
    saveLocked();
    return true;
}

bool FolderConfig::save() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return saveLocked();
}

bool FolderConfig::saveLocked() const
{
    QDir().mkpath(QString::fromStdString(m_configDir.string()));

    nlohmann::json payload;
    payload["folders"] = m_folders;

    QSaveFile file(QString::fromStdString(configFile().string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        TLOG_ERROR(QStringLiteral("FolderConfig"),
                   QStringLiteral("save"),
                   QStringLiteral("config_write_failed"),
                   QStringLiteral("folder_list_changed"),
                   QStringLiteral("save_file"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"file", configFile().string()},
                                   {"error", file.errorString().toStdString()}}));
        return false;
    }
    file.write(QByteArray::fromStdString(payload.dump(2)));
    if (!file.commit()) {
        TLOG_ERROR(QStringLiteral("FolderConfig"),
                   QStringLiteral("save"),
                   QStringLiteral("config_write_failed"),
                   QStringLiteral("folder_list_changed"),
                   QStringLiteral("save_file"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"file", configFile().string()},
                                   {"error", file.errorString().toStdString()}}));
        return false;
    }
    return true;
}

} // namespace tidemark
