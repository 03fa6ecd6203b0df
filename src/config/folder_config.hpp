#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace tidemark {

// FolderConfig persists the ordered list of watched folders as
// <config dir>/config.json. Paths are stored normalized and de-duplicated.
class FolderConfig {
public:
    FolderConfig();
    explicit FolderConfig(std::filesystem::path configDir);

    std::vector<std::string> folders() const;

    // Both return whether the list changed; a change is saved immediately.
    bool addFolder(const std::string &path);
    bool removeFolder(const std::string &path);

    bool save() const;

    std::filesystem::path configFile() const;

    // $TIDEMARK_CONFIG_DIR, else $HOME/.config/tidemark.
    static std::filesystem::path defaultConfigDir();
    static std::string normalizeFolder(const std::string &path);

private:
    void load();
    bool saveLocked() const;

    std::filesystem::path m_configDir;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_folders;
};

} // namespace tidemark
