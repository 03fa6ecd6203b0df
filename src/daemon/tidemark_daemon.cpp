#include "daemon/tidemark_daemon.hpp"

#include <filesystem>
#include <utility>

#include <QThreadPool>

#include "common/logging.hpp"
#include "common/tidemark_version.hpp"
#include "daemon/tidemark_api_server.hpp"

#include <nlohmann/json.hpp>

namespace tidemark {

namespace {

constexpr int kDrainIntervalMs = 250;

} // namespace

TidemarkDaemon::TidemarkDaemon(SessionOptions options, QObject *parent)
    : QObject(parent)
    , m_registry(std::move(options))
{
    m_drainTimer.setInterval(kDrainIntervalMs);
    connect(&m_drainTimer, &QTimer::timeout, this, &TidemarkDaemon::drainNotifications);
}

TidemarkDaemon::~TidemarkDaemon()
{
    m_drainTimer.stop();
    // Requests still running on the pool reference the API server.
    QThreadPool::globalInstance()->waitForDone();
}

bool TidemarkDaemon::start()
{
    TLOG_INFO(QStringLiteral("TidemarkDaemon"),
              QStringLiteral("start"),
              QStringLiteral("daemon_starting"),
              QStringLiteral("process_start"),
              QStringLiteral("folder_config"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"version", TIDEMARK_VERSION},
                              {"config", m_config.configFile().string()}}));

    startConfiguredFolders();

    if (!m_apiServer) {
        m_apiServer = std::make_unique<TidemarkApiServer>(m_registry, m_config);
    }
    const bool listening = m_apiServer->start();

    m_drainTimer.start();
    return listening;
}

void TidemarkDaemon::startConfiguredFolders()
{
    for (const std::string &folder : m_config.folders()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(folder, ec)) {
            m_config.removeFolder(folder);
            TLOG_INFO(QStringLiteral("TidemarkDaemon"),
                      QStringLiteral("startConfiguredFolders"),
                      QStringLiteral("folder_dropped"),
                      QStringLiteral("folder_missing"),
                      QStringLiteral("config_prune"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"folder", folder}}));
            continue;
        }
        m_registry.add(folder);
    }
}

void TidemarkDaemon::drainNotifications()
{
    m_registry.drainNotifications();
}

} // namespace tidemark
