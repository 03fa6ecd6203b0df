#include "daemon/tidemark_api_server.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QPointer>
#include <QUuid>
#include <QtConcurrent/QtConcurrent>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/tidemark_version.hpp"
#include "config/folder_config.hpp"
#include "daemon/session_registry.hpp"
#include "diff/unified_diff.hpp"
#include "engine/file_ops.hpp"

namespace tidemark {

namespace fs = std::filesystem;

namespace {

// A request the client got wrong. Reported back without an ERROR log.
class ApiError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

std::string requireString(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ApiError(std::string("Missing ") + key);
    }
    return it->get<std::string>();
}

std::string requireSafePath(const nlohmann::json &params)
{
    const std::string relPath = requireString(params, "path");
    if (!isSafeRelativePath(relPath)) {
        throw ApiError("Invalid path");
    }
    return relPath;
}

nlohmann::json fileDiffToJson(const FileDiff &diff)
{
    nlohmann::json result;
    result["state"] = toDiffStateString(diff.state);
    result["text"] = diff.text;
    result["added"] = diff.added;
    result["removed"] = diff.removed;
    if (!diff.error.empty()) {
        result["error"] = diff.error;
    }
    return result;
}

bool isFolderMethod(const std::string &method)
{
    static const std::set<std::string> kFolderMethods = {
        "get_changes", "create_checkpoint", "cancel_checkpoint", "rollback",
        "rollback_file", "get_checkpoint_path", "diff_file", "clear_changes",
        "reload_ignore", "get_ignore_patterns",
    };
    return kFolderMethods.count(method) > 0;
}

// Methods that copy or delete files hold the per-root operation slot.
bool isLongRunning(const std::string &method)
{
    return method == "create_checkpoint" || method == "cancel_checkpoint"
        || method == "rollback" || method == "rollback_file";
}

} // namespace

TidemarkApiServer::TidemarkApiServer(SessionRegistry &registry, FolderConfig &config,
                                     QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_config(config)
{
}

TidemarkApiServer::~TidemarkApiServer() = default;

QString TidemarkApiServer::socketPath() const
{
    return daemonSocketPath();
}

bool TidemarkApiServer::start()
{
    const QString path = socketPath();
    if (path.contains('/')) {
        const QFileInfo socketInfo(path);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            TLOG_ERROR(QStringLiteral("TidemarkApiServer"),
                       QStringLiteral("start"),
                       QStringLiteral("socket_dir_failed"),
                       QStringLiteral("server_start"),
                       QStringLiteral("mkpath"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"dir", socketInfo.absolutePath().toStdString()}}));
            return false;
        }

        if (QFile::exists(path) && !QLocalServer::removeServer(path)) {
            TLOG_ERROR(QStringLiteral("TidemarkApiServer"),
                       QStringLiteral("start"),
                       QStringLiteral("stale_socket_remove_failed"),
                       QStringLiteral("server_start"),
                       QStringLiteral("remove_server"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"socket", path.toStdString()}}));
            return false;
        }
    } else {
        QLocalServer::removeServer(path);
    }

    if (!m_server.listen(path)) {
        TLOG_ERROR(QStringLiteral("TidemarkApiServer"),
                   QStringLiteral("start"),
                   QStringLiteral("listen_failed"),
                   QStringLiteral("server_start"),
                   QStringLiteral("local_socket"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"socket", path.toStdString()},
                                   {"error", m_server.errorString().toStdString()}}));
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &TidemarkApiServer::handleNewConnection);

    TLOG_INFO(QStringLiteral("TidemarkApiServer"),
              QStringLiteral("start"),
              QStringLiteral("server_listening"),
              QStringLiteral("server_start"),
              QStringLiteral("local_socket"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"socket", path.toStdString()}}));
    return true;
}

void TidemarkApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &TidemarkApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void TidemarkApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    // The client may hang up before a long request finishes.
    QPointer<QLocalSocket> target(socket);
    auto *watcher = new QFutureWatcher<QByteArray>(this);
    connect(watcher, &QFutureWatcher<QByteArray>::finished, this, [watcher, target]() {
        const QByteArray response = watcher->result();
        watcher->deleteLater();
        if (!target) {
            return;
        }
        target->write(response);
        target->flush();
        target->disconnectFromServer();
    });
    watcher->setFuture(QtConcurrent::run([this, payload]() {
        return handleRequestPayload(payload);
    }));
}

QByteArray TidemarkApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TLOG_WARN(QStringLiteral("TidemarkApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"));
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        TLOG_WARN(QStringLiteral("TidemarkApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Missing method"), id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse(QStringLiteral("Invalid params"), id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    TLOG_INFO(QStringLiteral("TidemarkApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                              {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        TLOG_INFO(QStringLiteral("TidemarkApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method},
                                  {"durationMs",
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const ApiError &ex) {
        TLOG_WARN(QStringLiteral("TidemarkApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("bad_request"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), id);
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("TidemarkApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), id);
    }
}

nlohmann::json TidemarkApiServer::dispatch(const std::string &method,
                                           const nlohmann::json &params)
{
    nlohmann::json result = nlohmann::json::object();

    if (method == "status") {
        result["version"] = TIDEMARK_VERSION;
        result["folders"] = m_registry.statuses();
        return result;
    }

    if (method == "list_folders") {
        result["folders"] = m_config.folders();
        return result;
    }

    if (method == "add_folder") {
        const std::string path = requireString(params, "path");
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            throw ApiError("Folder does not exist");
        }
        const std::string folder = FolderConfig::normalizeFolder(path);
        result["added"] = m_config.addFolder(folder);
        result["folder"] = folder;
        result["running"] = m_registry.add(folder)->isRunning();
        return result;
    }

    if (method == "remove_folder") {
        const std::string path = requireString(params, "path");
        if (m_registry.find(path) && !m_registry.remove(path)) {
            throw ApiError("Operation in progress");
        }
        result["removed"] = m_config.removeFolder(path);
        return result;
    }

    if (!isFolderMethod(method)) {
        throw ApiError("Unknown method");
    }

    // Everything below works on one registered folder.
    const std::string folder = requireString(params, "folder");
    const auto session = m_registry.find(folder);
    if (!session) {
        throw ApiError("Unknown folder");
    }
    result["folder"] = session->root().string();

    std::optional<OperationGuard> guard;
    if (isLongRunning(method)) {
        guard.emplace(m_registry, session->root().string());
        if (!guard->acquired()) {
            throw ApiError("Operation in progress");
        }
    }

    if (method == "get_changes") {
        result["hasCheckpoint"] = session->hasCheckpoint();
        result["changes"] = session->changes();
        return result;
    }

    if (method == "create_checkpoint") {
        const CheckpointResult checkpoint = session->createCheckpoint();
        result.update(nlohmann::json(checkpoint));
        return result;
    }

    if (method == "cancel_checkpoint") {
        result["cancelled"] = session->hasCheckpoint();
        session->cancelCheckpoint();
        return result;
    }

    if (method == "rollback") {
        if (!session->hasCheckpoint()) {
            throw ApiError("No active checkpoint");
        }
        const RollbackResult rollback = session->rollback();
        result.update(nlohmann::json(rollback));
        return result;
    }

    if (method == "rollback_file") {
        const std::string relPath = requireSafePath(params);
        result["path"] = relPath;
        result["restored"] = session->rollbackFile(relPath);
        return result;
    }

    if (method == "get_checkpoint_path") {
        const std::string relPath = requireSafePath(params);
        const auto staged = session->checkpointPath(relPath);
        result["path"] = staged ? nlohmann::json(staged->string()) : nlohmann::json(nullptr);
        return result;
    }

    if (method == "diff_file") {
        const std::string relPath = requireSafePath(params);
        const FileDiff diff = diffFiles(session->checkpointPath(relPath),
                                        session->root() / relPath,
                                        relPath);
        result.update(fileDiffToJson(diff));
        result["path"] = relPath;
        return result;
    }

    if (method == "clear_changes") {
        result["cleared"] = session->clearAllChanges();
        return result;
    }

    if (method == "reload_ignore") {
        session->reloadIgnorePatterns();
        result["patterns"] = session->ignorePatterns();
        return result;
    }

    if (method == "get_ignore_patterns") {
        result["patterns"] = session->ignorePatterns();
        return result;
    }

    throw ApiError("Unknown method");
}

QByteArray TidemarkApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray TidemarkApiServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace tidemark
