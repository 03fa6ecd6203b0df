#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLocalSocket>
#include <QProcess>
#include <QStandardPaths>

#include <unistd.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace tidemark {

namespace {

const QString kDaemonBinary = QStringLiteral("tidemark-daemon");

QString findSiblingBinary(const QString &name)
{
    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral(".."),
        QStringLiteral("../bin"),
    };

    for (const QString &relPath : relCandidates) {
        const QString candidate =
            QDir(appDir).absoluteFilePath(relPath + QDir::separator() + name);
        QFileInfo info(candidate);
        if (info.exists() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
    }
    return QString();
}

bool isDevBuildTree()
{
    QString dir = QCoreApplication::applicationDirPath();
    for (int i = 0; i < 3; ++i) {
        if (QFileInfo::exists(QDir(dir).absoluteFilePath(QStringLiteral("CMakeCache.txt")))) {
            return true;
        }
        QDir parent(dir);
        if (!parent.cdUp()) {
            break;
        }
        dir = parent.absolutePath();
    }
    return false;
}

} // namespace

QString daemonSocketPath()
{
    const QString socketName = qEnvironmentVariable("TIDEMARK_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/tidemark.sock");
}

bool isDaemonRunning()
{
    QLocalSocket socket;
    socket.connectToServer(daemonSocketPath());
    if (socket.waitForConnected(200)) {
        socket.disconnectFromServer();
        return true;
    }
    return false;
}

bool startDaemon()
{
    TLOG_INFO(QStringLiteral("ProcessUtils"),
              QStringLiteral("startDaemon"),
              QStringLiteral("start_daemon"),
              QStringLiteral("user_action"),
              QStringLiteral("systemd_or_fallback"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    const QString sibling = findSiblingBinary(kDaemonBinary);
    if (!sibling.isEmpty() && QProcess::startDetached(sibling, {})) {
        return true;
    }

    if (!isDevBuildTree()) {
        const QStringList args = {QStringLiteral("--user"), QStringLiteral("start"),
                                  kDaemonBinary + QStringLiteral(".service")};
        if (QProcess::startDetached(QStringLiteral("systemctl"), args)) {
            return true;
        }
    }

    return QProcess::startDetached(kDaemonBinary, {});
}

} // namespace tidemark
