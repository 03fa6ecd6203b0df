#pragma once

#include <memory>

#include <QObject>
#include <QTimer>

#include "config/folder_config.hpp"
#include "daemon/session_registry.hpp"
#include "engine/watch_session.hpp"

namespace tidemark {

class TidemarkApiServer;

/**
 * TidemarkDaemon coordinates:
 * - the persisted folder list
 * - one watch session per folder
 * - the local socket API
 * - periodic draining of the sessions' change channels
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class TidemarkDaemon : public QObject
{
    Q_OBJECT
public:
    explicit TidemarkDaemon(SessionOptions options = {}, QObject *parent = nullptr);
    ~TidemarkDaemon() override;

    // Starts sessions for the configured folders and the API server.
    bool start();

    SessionRegistry &registry() { return m_registry; }
    FolderConfig &config() { return m_config; }

private slots:
    void drainNotifications();

private:
    void startConfiguredFolders();

    FolderConfig m_config;
    SessionRegistry m_registry;
    std::unique_ptr<TidemarkApiServer> m_apiServer;
    QTimer m_drainTimer;
};

} // namespace tidemark
