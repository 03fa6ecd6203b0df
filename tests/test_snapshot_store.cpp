#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include "engine/ignore_matcher.hpp"
#include "engine/snapshot_store.hpp"

namespace fs = std::filesystem;

class SnapshotStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void init();

    void testCreateMirrorsNonIgnoredFiles();
    void testPreservesModificationTime();
    void testNewSnapshotReplacesPrevious();
    void testDiscardAndDestructorRemoveStaging();
    void testUnreadableRootFails();
    void testUnreadableFileBecomesWarning();
    void testStagedPathLookup();

private:
    std::unique_ptr<QTemporaryDir> m_root;
    std::unique_ptr<QTemporaryDir> m_staging;

    fs::path rootPath() const { return m_root->path().toStdString(); }
    fs::path stagingParent() const { return m_staging->path().toStdString(); }
    void writeFile(const std::string &relPath, const std::string &content);
    static std::string readFile(const fs::path &path);
};

void SnapshotStoreTests::init()
{
    m_root = std::make_unique<QTemporaryDir>();
    m_staging = std::make_unique<QTemporaryDir>();
    QVERIFY(m_root->isValid());
    QVERIFY(m_staging->isValid());
}

void SnapshotStoreTests::writeFile(const std::string &relPath, const std::string &content)
{
    const fs::path target = rootPath() / relPath;
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary);
    out << content;
}

std::string SnapshotStoreTests::readFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void SnapshotStoreTests::testCreateMirrorsNonIgnoredFiles()
{
    writeFile("a.txt", "alpha");
    writeFile("src/lib/b.cpp", "int b;");
    writeFile(".git/HEAD", "ref: refs/heads/main");
    writeFile("node_modules/pkg/index.js", "module.exports = 1;");
    writeFile("cache/scratch.tmp", "scratch");

    tidemark::IgnoreMatcher matcher(rootPath());
    tidemark::SnapshotStore store(rootPath(), stagingParent());
    const auto result = store.create(*matcher.rules());

    QVERIFY(result.created);
    QCOMPARE(result.copiedFiles, 2);
    QVERIFY(result.warnings.empty());
    QVERIFY(store.hasSnapshot());

    const fs::path staging = store.stagingDir().value();
    QCOMPARE(QString::fromStdString(result.stagingDir), QString::fromStdString(staging.string()));
    QCOMPARE(QString::fromStdString(result.snapshotId),
             QString::fromStdString(staging.filename().string()));
    QVERIFY(staging.parent_path() == stagingParent());

    QCOMPARE(QString::fromStdString(readFile(staging / "a.txt")), QStringLiteral("alpha"));
    QCOMPARE(QString::fromStdString(readFile(staging / "src/lib/b.cpp")),
             QStringLiteral("int b;"));
    QVERIFY(!fs::exists(staging / ".git"));
    QVERIFY(!fs::exists(staging / "node_modules"));
    QVERIFY(!fs::exists(staging / "cache/scratch.tmp"));

    auto staged = store.stagedFiles();
    std::sort(staged.begin(), staged.end());
    QCOMPARE(staged.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(staged[0]), QStringLiteral("a.txt"));
    QCOMPARE(QString::fromStdString(staged[1]), QStringLiteral("src/lib/b.cpp"));
}

void SnapshotStoreTests::testPreservesModificationTime()
{
    writeFile("old.txt", "old");
    const auto past = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(rootPath() / "old.txt", past);

    tidemark::IgnoreMatcher matcher(rootPath());
    tidemark::SnapshotStore store(rootPath(), stagingParent());
    QVERIFY(store.create(*matcher.rules()).created);

    const auto stagedTime = fs::last_write_time(*store.stagedPathFor("old.txt"));
    const auto delta = std::chrono::duration_cast<std::chrono::seconds>(stagedTime - past);
    QVERIFY(std::abs(delta.count()) <= 1);
}

void SnapshotStoreTests::testNewSnapshotReplacesPrevious()
{
    writeFile("a.txt", "one");

    tidemark::IgnoreMatcher matcher(rootPath());
    tidemark::SnapshotStore store(rootPath(), stagingParent());
    QVERIFY(store.create(*matcher.rules()).created);
    const fs::path first = store.stagingDir().value();

    writeFile("a.txt", "two");
    QVERIFY(store.create(*matcher.rules()).created);
    const fs::path second = store.stagingDir().value();

    QVERIFY(first != second);
    QVERIFY(!fs::exists(first));
    QCOMPARE(QString::fromStdString(readFile(second / "a.txt")), QStringLiteral("two"));
}

void SnapshotStoreTests::testDiscardAndDestructorRemoveStaging()
{
    writeFile("a.txt", "alpha");
    tidemark::IgnoreMatcher matcher(rootPath());

    fs::path staging;
    {
        tidemark::SnapshotStore store(rootPath(), stagingParent());
        QVERIFY(store.create(*matcher.rules()).created);
        staging = store.stagingDir().value();

        store.discard();
        QVERIFY(!store.hasSnapshot());
        QVERIFY(!fs::exists(staging));

        QVERIFY(store.create(*matcher.rules()).created);
        staging = store.stagingDir().value();
        QVERIFY(fs::exists(staging));
    }
    QVERIFY(!fs::exists(staging));
}

void SnapshotStoreTests::testUnreadableRootFails()
{
    const fs::path missing = rootPath() / "does-not-exist";
    const tidemark::IgnoreRules rules(std::vector<std::string>{});
    tidemark::SnapshotStore store(missing, stagingParent());

    const auto result = store.create(rules);
    QVERIFY(!result.created);
    QVERIFY(!result.warnings.empty());
    QVERIFY(!store.hasSnapshot());
    QVERIFY(fs::is_empty(stagingParent()));
}

void SnapshotStoreTests::testUnreadableFileBecomesWarning()
{
    if (geteuid() == 0) {
        QSKIP("root reads files regardless of their mode");
    }
    writeFile("a.txt", "alpha");
    writeFile("docs/b.txt", "beta");
    writeFile("secret.txt", "hidden");
    fs::permissions(rootPath() / "secret.txt", fs::perms::none);

    tidemark::IgnoreMatcher matcher(rootPath());
    tidemark::SnapshotStore store(rootPath(), stagingParent());
    const auto result = store.create(*matcher.rules());
    fs::permissions(rootPath() / "secret.txt", fs::perms::owner_read | fs::perms::owner_write);

    QVERIFY(result.created);
    QCOMPARE(result.copiedFiles, 2);
    QCOMPARE(result.warnings.size(), static_cast<size_t>(1));
    QVERIFY(result.warnings.front().find("secret.txt") != std::string::npos);

    QVERIFY(store.stagedPathFor("a.txt").has_value());
    QVERIFY(store.stagedPathFor("docs/b.txt").has_value());
    QVERIFY(!store.stagedPathFor("secret.txt").has_value());
}

void SnapshotStoreTests::testStagedPathLookup()
{
    writeFile("dir/a.txt", "alpha");
    tidemark::IgnoreMatcher matcher(rootPath());
    tidemark::SnapshotStore store(rootPath(), stagingParent());

    QVERIFY(!store.stagedPathFor("dir/a.txt").has_value());
    QVERIFY(store.create(*matcher.rules()).created);

    QVERIFY(store.stagedPathFor("dir/a.txt").has_value());
    QVERIFY(!store.stagedPathFor("dir/missing.txt").has_value());
    QVERIFY(!store.stagedPathFor("../escape.txt").has_value());
    QVERIFY(!store.stagedPathFor("/etc/passwd").has_value());
}

QTEST_MAIN(SnapshotStoreTests)
#include "test_snapshot_store.moc"
