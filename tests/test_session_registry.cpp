#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>

#include "daemon/session_registry.hpp"

namespace fs = std::filesystem;

class SessionRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testAddIsIdempotentPerNormalizedRoot();
    void testDrainUpdatesRevision();
    void testOperationSlots();
    void testRemoveStopsSession();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<QTemporaryDir> m_watched;
    std::unique_ptr<QTemporaryDir> m_staging;

    std::string root() const { return fs::canonical(m_watched->path().toStdString()).string(); }
    tidemark::SessionOptions options() const;
    void emitEvent(tidemark::WatchSession &session, tidemark::ChangeKind kind,
                   const std::string &relPath) const;
};

void SessionRegistryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SessionRegistryTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SessionRegistryTests::init()
{
    m_watched = std::make_unique<QTemporaryDir>();
    m_staging = std::make_unique<QTemporaryDir>();
    QVERIFY(m_watched->isValid());
    QVERIFY(m_staging->isValid());
}

tidemark::SessionOptions SessionRegistryTests::options() const
{
    tidemark::SessionOptions opts;
    opts.stagingParent = m_staging->path().toStdString();
    return opts;
}

void SessionRegistryTests::emitEvent(tidemark::WatchSession &session, tidemark::ChangeKind kind,
                                     const std::string &relPath) const
{
    tidemark::FsEvent event;
    event.kind = kind;
    event.path = (fs::path(root()) / relPath).string();
    session.handleEvent(event);
}

void SessionRegistryTests::testAddIsIdempotentPerNormalizedRoot()
{
    tidemark::SessionRegistry registry(options());
    const auto first = registry.add(root());
    const auto second = registry.add(root() + "/");
    QVERIFY(first);
    QCOMPARE(first.get(), second.get());
    QVERIFY(first->isRunning());

    const auto roots = registry.roots();
    QCOMPARE(roots.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(roots.front()), QString::fromStdString(root()));
    QCOMPARE(registry.find(root() + "/").get(), first.get());
    QVERIFY(!registry.find(root() + "/elsewhere"));
}

void SessionRegistryTests::testDrainUpdatesRevision()
{
    tidemark::SessionRegistry registry(options());
    const auto session = registry.add(root());

    QCOMPARE(registry.drainNotifications(), static_cast<size_t>(0));
    QCOMPARE(registry.status(root()).revision, 0ULL);

    emitEvent(*session, tidemark::ChangeKind::Created, "a.txt");
    emitEvent(*session, tidemark::ChangeKind::Modified, "a.txt");
    emitEvent(*session, tidemark::ChangeKind::Created, "b.txt");

    QCOMPARE(registry.drainNotifications(), static_cast<size_t>(3));
    const tidemark::FolderStatus status = registry.status(root());
    QCOMPARE(status.revision, 3ULL);
    QCOMPARE(status.changeCount, static_cast<size_t>(2));
    QVERIFY(status.lastChange != std::chrono::system_clock::time_point{});
    QVERIFY(status.running);
    QVERIFY(!status.hasCheckpoint);

    QCOMPARE(registry.drainNotifications(), static_cast<size_t>(0));
    QCOMPARE(registry.statuses().size(), static_cast<size_t>(1));
}

void SessionRegistryTests::testOperationSlots()
{
    tidemark::SessionRegistry registry(options());
    registry.add(root());
    {
        tidemark::OperationGuard guard(registry, root());
        QVERIFY(guard.acquired());

        tidemark::OperationGuard second(registry, root() + "/");
        QVERIFY(!second.acquired());
        QVERIFY(!registry.remove(root()));
    }
    QVERIFY(registry.tryBeginOperation(root()));
    registry.endOperation(root());
}

void SessionRegistryTests::testRemoveStopsSession()
{
    tidemark::SessionRegistry registry(options());
    const auto session = registry.add(root());
    QVERIFY(session->isRunning());

    QVERIFY(registry.remove(root()));
    QVERIFY(!session->isRunning());
    QVERIFY(registry.roots().empty());
    QVERIFY(!registry.remove(root()));
}

QTEST_MAIN(SessionRegistryTests)
#include "test_session_registry.moc"
