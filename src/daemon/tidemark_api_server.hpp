#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

namespace tidemark {

class FolderConfig;
class SessionRegistry;

/**
 * TidemarkApiServer exposes the watched folders over a local UNIX socket
 * using a minimal JSON-RPC-like protocol: one {"id","method","params"}
 * request per connection, answered with {"id","result"} or {"id","error"}.
 *
 * Requests run on the global thread pool so a long rollback does not block
 * the event loop.
 */
class TidemarkApiServer : public QObject
{
    Q_OBJECT
public:
    TidemarkApiServer(SessionRegistry &registry, FolderConfig &config,
                      QObject *parent = nullptr);
    ~TidemarkApiServer() override;

    bool start();
    QString socketPath() const;

    // Process a single payload synchronously without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);

    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    SessionRegistry &m_registry;
    FolderConfig &m_config;
    QLocalServer m_server;
};

} // namespace tidemark
