#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QDir>
#include <QLocalSocket>
#include <QTemporaryDir>
#include <QThreadPool>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "config/folder_config.hpp"
#include "daemon/session_registry.hpp"
#include "daemon/tidemark_api_server.hpp"

namespace fs = std::filesystem;

class ApiServerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testStatusAndFolderManagement();
    void testRequestErrors();
    void testFolderMethodErrors();
    void testCheckpointRollbackFlow();
    void testRollbackFileAndDiff();
    void testIgnorePatterns();
    void testBusyFolderRefusesLongOperations();
    void testSocketRoundTrip();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevRuntime;
    QByteArray m_prevConfigDir;
    QByteArray m_prevSocketName;

    std::unique_ptr<QTemporaryDir> m_watched;
    std::unique_ptr<QTemporaryDir> m_staging;
    std::unique_ptr<QTemporaryDir> m_configDir;
    std::unique_ptr<tidemark::SessionRegistry> m_registry;
    std::unique_ptr<tidemark::FolderConfig> m_config;
    std::unique_ptr<tidemark::TidemarkApiServer> m_server;

    std::string folder() const { return fs::canonical(m_watched->path().toStdString()).string(); }
    void writeFile(const std::string &relPath, const std::string &content) const;
    std::string readFile(const std::string &relPath) const;
    nlohmann::json call(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object());
    nlohmann::json addWatchedFolder();
};

static void restoreEnv(const char *name, const QByteArray &value)
{
    if (value.isEmpty()) {
        qunsetenv(name);
    } else {
        qputenv(name, value);
    }
}

void ApiServerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevRuntime = qgetenv("XDG_RUNTIME_DIR");
    m_prevConfigDir = qgetenv("TIDEMARK_CONFIG_DIR");
    m_prevSocketName = qgetenv("TIDEMARK_SOCKET_NAME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qputenv("XDG_RUNTIME_DIR", m_tempDir.path().toUtf8());
    qunsetenv("TIDEMARK_SOCKET_NAME");
}

void ApiServerTests::cleanupTestCase()
{
    restoreEnv("HOME", m_prevHome);
    restoreEnv("XDG_RUNTIME_DIR", m_prevRuntime);
    restoreEnv("TIDEMARK_CONFIG_DIR", m_prevConfigDir);
    restoreEnv("TIDEMARK_SOCKET_NAME", m_prevSocketName);
}

void ApiServerTests::init()
{
    m_watched = std::make_unique<QTemporaryDir>();
    m_staging = std::make_unique<QTemporaryDir>();
    m_configDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_watched->isValid());
    QVERIFY(m_staging->isValid());
    QVERIFY(m_configDir->isValid());
    qputenv("TIDEMARK_CONFIG_DIR", m_configDir->path().toUtf8());

    tidemark::SessionOptions options;
    options.stagingParent = m_staging->path().toStdString();
    m_registry = std::make_unique<tidemark::SessionRegistry>(options);
    m_config = std::make_unique<tidemark::FolderConfig>();
    m_server = std::make_unique<tidemark::TidemarkApiServer>(*m_registry, *m_config);
}

void ApiServerTests::cleanup()
{
    QThreadPool::globalInstance()->waitForDone();
    m_server.reset();
    m_registry.reset();
    m_config.reset();
}

void ApiServerTests::writeFile(const std::string &relPath, const std::string &content) const
{
    const fs::path path = fs::path(folder()) / relPath;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string ApiServerTests::readFile(const std::string &relPath) const
{
    std::ifstream in(fs::path(folder()) / relPath, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

nlohmann::json ApiServerTests::call(const std::string &method, const nlohmann::json &params)
{
    const nlohmann::json request = {{"id", 7}, {"method", method}, {"params", params}};
    const QByteArray response =
        m_server->handleRequestPayload(QByteArray::fromStdString(request.dump()));
    return nlohmann::json::parse(response.toStdString());
}

nlohmann::json ApiServerTests::addWatchedFolder()
{
    return call("add_folder", {{"path", folder()}});
}

void ApiServerTests::testStatusAndFolderManagement()
{
    auto status = call("status");
    QCOMPARE(status.at("id").get<int>(), 7);
    QVERIFY(!status.at("result").at("version").get<std::string>().empty());
    QVERIFY(status.at("result").at("folders").empty());

    const auto added = addWatchedFolder();
    QVERIFY(added.contains("result"));
    QCOMPARE(added.at("result").at("added").get<bool>(), true);
    QCOMPARE(added.at("result").at("running").get<bool>(), true);
    QCOMPARE(QString::fromStdString(added.at("result").at("folder").get<std::string>()),
             QString::fromStdString(folder()));

    const auto again = call("add_folder", {{"path", folder() + "/"}});
    QCOMPARE(again.at("result").at("added").get<bool>(), false);

    const auto listed = call("list_folders");
    QCOMPARE(listed.at("result").at("folders").size(), static_cast<size_t>(1));

    status = call("status");
    const auto folders = status.at("result").at("folders");
    QCOMPARE(folders.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(folders[0].at("root").get<std::string>()),
             QString::fromStdString(folder()));
    QCOMPARE(folders[0].at("hasCheckpoint").get<bool>(), false);

    // The folder list is persisted.
    tidemark::FolderConfig reloaded;
    QCOMPARE(reloaded.folders().size(), static_cast<size_t>(1));

    const auto removed = call("remove_folder", {{"path", folder()}});
    QCOMPARE(removed.at("result").at("removed").get<bool>(), true);
    QVERIFY(!m_registry->find(folder()));
    QVERIFY(call("list_folders").at("result").at("folders").empty());
}

void ApiServerTests::testRequestErrors()
{
    auto response = nlohmann::json::parse(
        m_server->handleRequestPayload(QByteArrayLiteral("{not json")).toStdString());
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Invalid JSON payload"));
    QCOMPARE(response.at("id").get<int>(), -1);

    response = nlohmann::json::parse(
        m_server->handleRequestPayload(QByteArrayLiteral("{\"id\":3}")).toStdString());
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Missing method"));
    QCOMPARE(response.at("id").get<int>(), 3);

    response = nlohmann::json::parse(m_server->handleRequestPayload(
        QByteArrayLiteral("{\"id\":4,\"method\":\"status\",\"params\":[]}")).toStdString());
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Invalid params"));

    response = call("no_such_method");
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Unknown method"));

    response = call("add_folder");
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Missing path"));

    response = call("add_folder", {{"path", folder() + "/does-not-exist"}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Folder does not exist"));
}

void ApiServerTests::testFolderMethodErrors()
{
    auto response = call("get_changes");
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Missing folder"));

    response = call("get_changes", {{"folder", folder()}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Unknown folder"));

    addWatchedFolder();

    response = call("rollback", {{"folder", folder()}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("No active checkpoint"));

    response = call("rollback_file", {{"folder", folder()}, {"path", "../escape.txt"}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Invalid path"));

    response = call("diff_file", {{"folder", folder()}, {"path", "/etc/passwd"}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Invalid path"));

    response = call("get_checkpoint_path", {{"folder", folder()}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Missing path"));
}

void ApiServerTests::testCheckpointRollbackFlow()
{
    writeFile("keep.txt", "original\n");
    addWatchedFolder();
    const nlohmann::json target = {{"folder", folder()}};

    const auto checkpoint = call("create_checkpoint", target);
    QCOMPARE(checkpoint.at("result").at("created").get<bool>(), true);
    QCOMPARE(checkpoint.at("result").at("copiedFiles").get<int>(), 1);
    QVERIFY(!checkpoint.at("result").at("snapshotId").get<std::string>().empty());

    writeFile("keep.txt", "edited\n");
    writeFile("fresh.txt", "new\n");

    QTRY_VERIFY_WITH_TIMEOUT(
        call("get_changes", target).at("result").at("changes").contains("fresh.txt"), 5000);
    QTRY_VERIFY_WITH_TIMEOUT(
        call("get_changes", target).at("result").at("changes").contains("keep.txt"), 5000);

    const auto changes = call("get_changes", target).at("result");
    QCOMPARE(changes.at("hasCheckpoint").get<bool>(), true);
    QCOMPARE(QString::fromStdString(changes.at("changes").at("fresh.txt").at("type").get<std::string>()),
             QStringLiteral("created"));

    const auto cleared = call("clear_changes", target);
    QCOMPARE(cleared.at("result").at("cleared").get<bool>(), false);

    const auto rollback = call("rollback", target);
    const auto result = rollback.at("result");
    QCOMPARE(result.at("success").get<bool>(), true);
    QCOMPARE(result.at("restoredFiles").get<int>(), 1);
    QCOMPARE(result.at("removedFiles").get<int>(), 1);
    QCOMPARE(QString::fromStdString(readFile("keep.txt")), QStringLiteral("original\n"));
    QVERIFY(!fs::exists(fs::path(folder()) / "fresh.txt"));

    const auto after = call("get_changes", target).at("result");
    QCOMPARE(after.at("hasCheckpoint").get<bool>(), false);
    QVERIFY(after.at("changes").empty());

    const auto cancelled = call("cancel_checkpoint", target);
    QCOMPARE(cancelled.at("result").at("cancelled").get<bool>(), false);
}

void ApiServerTests::testRollbackFileAndDiff()
{
    writeFile("notes.txt", "one\ntwo\nthree\n");
    addWatchedFolder();
    const nlohmann::json target = {{"folder", folder()}};
    call("create_checkpoint", target);

    writeFile("notes.txt", "one\nTWO\nthree\n");
    QTRY_VERIFY_WITH_TIMEOUT(
        call("get_changes", target).at("result").at("changes").contains("notes.txt"), 5000);

    const auto staged = call("get_checkpoint_path", {{"folder", folder()}, {"path", "notes.txt"}});
    QVERIFY(staged.at("result").at("path").is_string());
    QVERIFY(fs::exists(staged.at("result").at("path").get<std::string>()));

    const auto missing = call("get_checkpoint_path", {{"folder", folder()}, {"path", "nope.txt"}});
    QVERIFY(missing.at("result").at("path").is_null());

    const auto diff = call("diff_file", {{"folder", folder()}, {"path", "notes.txt"}}).at("result");
    QCOMPARE(QString::fromStdString(diff.at("state").get<std::string>()), QStringLiteral("text"));
    QCOMPARE(diff.at("added").get<int>(), 1);
    QCOMPARE(diff.at("removed").get<int>(), 1);
    QVERIFY(diff.at("text").get<std::string>().find("-two\n+TWO\n") != std::string::npos);

    const auto restored =
        call("rollback_file", {{"folder", folder()}, {"path", "notes.txt"}}).at("result");
    QCOMPARE(restored.at("restored").get<bool>(), true);
    QCOMPARE(QString::fromStdString(readFile("notes.txt")), QStringLiteral("one\ntwo\nthree\n"));

    const auto same = call("diff_file", {{"folder", folder()}, {"path", "notes.txt"}}).at("result");
    QCOMPARE(QString::fromStdString(same.at("state").get<std::string>()),
             QStringLiteral("identical"));

    const auto unknown =
        call("rollback_file", {{"folder", folder()}, {"path", "ghost.txt"}}).at("result");
    QCOMPARE(unknown.at("restored").get<bool>(), false);
}

void ApiServerTests::testIgnorePatterns()
{
    addWatchedFolder();
    const nlohmann::json target = {{"folder", folder()}};

    const auto defaults = call("get_ignore_patterns", target).at("result").at("patterns");
    QVERIFY(!defaults.empty());

    writeFile(".tidemark_ignore", "*.bak\n# comment\n\nbuild\n");
    const auto reloaded = call("reload_ignore", target).at("result").at("patterns");
    QVERIFY(reloaded.size() > defaults.size());
    bool sawBak = false;
    for (const auto &pattern : reloaded) {
        if (pattern.get<std::string>() == "*.bak") {
            sawBak = true;
        }
    }
    QVERIFY(sawBak);
}

void ApiServerTests::testBusyFolderRefusesLongOperations()
{
    addWatchedFolder();
    const nlohmann::json target = {{"folder", folder()}};

    QVERIFY(m_registry->tryBeginOperation(folder()));

    auto response = call("create_checkpoint", target);
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Operation in progress"));

    // Read-only methods are not serialized.
    response = call("get_changes", target);
    QVERIFY(response.contains("result"));

    response = call("remove_folder", {{"path", folder()}});
    QCOMPARE(QString::fromStdString(response.at("error").get<std::string>()),
             QStringLiteral("Operation in progress"));

    m_registry->endOperation(folder());
    response = call("create_checkpoint", target);
    QVERIFY(response.contains("result"));
}

void ApiServerTests::testSocketRoundTrip()
{
    QVERIFY(m_server->start());
    QCOMPARE(m_server->socketPath(), m_tempDir.path() + QStringLiteral("/tidemark.sock"));

    QLocalSocket socket;
    socket.connectToServer(m_server->socketPath());
    QVERIFY(socket.waitForConnected(1000));

    const nlohmann::json request = {{"id", 11}, {"method", "status"}};
    socket.write(QByteArray::fromStdString(request.dump()));
    QVERIFY(socket.waitForBytesWritten(1000));

    // The reply is written from the event loop once the pool task finishes.
    QTRY_VERIFY_WITH_TIMEOUT(socket.bytesAvailable() > 0, 5000);
    const auto response = nlohmann::json::parse(socket.readAll().toStdString());
    QCOMPARE(response.at("id").get<int>(), 11);
    QVERIFY(response.at("result").contains("folders"));
}

QTEST_MAIN(ApiServerTests)
#include "test_api_server.moc"
