#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "config/folder_config.hpp"

namespace fs = std::filesystem;

class FolderConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testMissingFileIsEmpty();
    void testAddNormalizesAndDeduplicates();
    void testRemoveAndPersistence();
    void testCorruptFileFallsBackToEmpty();
    void testDefaultConfigDir();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevConfigDir;
    std::unique_ptr<QTemporaryDir> m_configDir;
    std::unique_ptr<QTemporaryDir> m_folders;

    fs::path configDir() const { return m_configDir->path().toStdString(); }
    std::string makeFolder(const std::string &name) const;
};

void FolderConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevConfigDir = qgetenv("TIDEMARK_CONFIG_DIR");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("TIDEMARK_CONFIG_DIR");
}

void FolderConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
    if (!m_prevConfigDir.isEmpty()) {
        qputenv("TIDEMARK_CONFIG_DIR", m_prevConfigDir);
    }
}

void FolderConfigTests::init()
{
    m_configDir = std::make_unique<QTemporaryDir>();
    m_folders = std::make_unique<QTemporaryDir>();
    QVERIFY(m_configDir->isValid());
    QVERIFY(m_folders->isValid());
}

std::string FolderConfigTests::makeFolder(const std::string &name) const
{
    const fs::path folder = fs::canonical(m_folders->path().toStdString()) / name;
    fs::create_directories(folder);
    return folder.string();
}

void FolderConfigTests::testMissingFileIsEmpty()
{
    tidemark::FolderConfig config(configDir());
    QVERIFY(config.folders().empty());
    QVERIFY(!fs::exists(config.configFile()));
}

void FolderConfigTests::testAddNormalizesAndDeduplicates()
{
    const std::string project = makeFolder("project");
    tidemark::FolderConfig config(configDir());

    QVERIFY(config.addFolder(project));
    QVERIFY(!config.addFolder(project + "/"));
    QVERIFY(!config.addFolder(project + "/sub/.."));

    const auto folders = config.folders();
    QCOMPARE(folders.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(folders.front()), QString::fromStdString(project));
}

void FolderConfigTests::testRemoveAndPersistence()
{
    const std::string first = makeFolder("first");
    const std::string second = makeFolder("second");
    {
        tidemark::FolderConfig config(configDir());
        QVERIFY(config.addFolder(second));
        QVERIFY(config.addFolder(first));
    }

    std::ifstream in(configDir() / "config.json");
    const auto stored = nlohmann::json::parse(in);
    QVERIFY(stored.at("folders").is_array());
    QCOMPARE(stored.at("folders").size(), static_cast<size_t>(2));

    tidemark::FolderConfig reloaded(configDir());
    auto folders = reloaded.folders();
    QCOMPARE(folders.size(), static_cast<size_t>(2));
    // Insertion order is kept.
    QCOMPARE(QString::fromStdString(folders[0]), QString::fromStdString(second));
    QCOMPARE(QString::fromStdString(folders[1]), QString::fromStdString(first));

    QVERIFY(reloaded.removeFolder(second + "/"));
    QVERIFY(!reloaded.removeFolder(second));

    tidemark::FolderConfig again(configDir());
    folders = again.folders();
    QCOMPARE(folders.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(folders[0]), QString::fromStdString(first));
}

void FolderConfigTests::testCorruptFileFallsBackToEmpty()
{
    {
        std::ofstream out(configDir() / "config.json");
        out << "{ this is not json";
    }
    tidemark::FolderConfig config(configDir());
    QVERIFY(config.folders().empty());

    const std::string project = makeFolder("project");
    QVERIFY(config.addFolder(project));

    tidemark::FolderConfig reloaded(configDir());
    QCOMPARE(reloaded.folders().size(), static_cast<size_t>(1));
}

void FolderConfigTests::testDefaultConfigDir()
{
    const fs::path expected = fs::path(m_tempDir.path().toStdString()) / ".config/tidemark";
    QCOMPARE(QString::fromStdString(tidemark::FolderConfig::defaultConfigDir().string()),
             QString::fromStdString(expected.string()));

    qputenv("TIDEMARK_CONFIG_DIR", m_configDir->path().toUtf8());
    QCOMPARE(QString::fromStdString(tidemark::FolderConfig::defaultConfigDir().string()),
             m_configDir->path());
    qunsetenv("TIDEMARK_CONFIG_DIR");
}

QTEST_MAIN(FolderConfigTests)
#include "test_folder_config.moc"
