#include "ctl/TidemarkCli.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <QFileInfo>
#include <QLocalSocket>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace tidemark {

namespace {

constexpr int kConnectTimeoutMs = 1000;
// Rollbacks of large folders may take a while before the reply arrives.
constexpr int kReplyTimeoutMs = 120000;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  tidemark-ctl folders\n"
        "  tidemark-ctl add PATH\n"
        "  tidemark-ctl remove PATH\n"
        "  tidemark-ctl changes FOLDER [--format text|json]\n"
        "  tidemark-ctl checkpoint FOLDER\n"
        "  tidemark-ctl cancel FOLDER\n"
        "  tidemark-ctl rollback FOLDER\n"
        "  tidemark-ctl rollback-file FOLDER PATH\n"
        "  tidemark-ctl diff FOLDER PATH\n"
        "  tidemark-ctl clear FOLDER\n"
        "  tidemark-ctl reload-ignore FOLDER\n"
        "  tidemark-ctl status\n"
        "  tidemark-ctl start\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

// Positional argument n after the command, skipping --format and its value.
QString positional(const QStringList &args, int n)
{
    int seen = 0;
    for (int i = 2; i < args.size(); ++i) {
        if (args.at(i) == QStringLiteral("--format")) {
            ++i;
            continue;
        }
        if (seen == n) {
            return args.at(i);
        }
        ++seen;
    }
    return {};
}

// The daemon resolves paths against its own working directory.
std::string absoluteFolder(const QString &path)
{
    return QFileInfo(path).absoluteFilePath().toStdString();
}

std::string stringOr(const nlohmann::json &value, const char *key, const std::string &fallback)
{
    auto it = value.find(key);
    if (it == value.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // namespace

TidemarkCli::TidemarkCli()
    : TidemarkCli(&TidemarkCli::socketTransport)
{
}

TidemarkCli::TidemarkCli(Transport transport)
    : m_transport(std::move(transport))
{
}

nlohmann::json TidemarkCli::socketTransport(const nlohmann::json &request)
{
    QLocalSocket socket;
    socket.connectToServer(daemonSocketPath());
    if (!socket.waitForConnected(kConnectTimeoutMs)) {
        throw std::runtime_error("tidemark-daemon is not running ("
                                 + socket.errorString().toStdString() + ")");
    }

    socket.write(QByteArray::fromStdString(request.dump()));
    socket.flush();

    QByteArray reply;
    while (socket.state() == QLocalSocket::ConnectedState
           && socket.waitForReadyRead(kReplyTimeoutMs)) {
        reply += socket.readAll();
    }
    reply += socket.readAll();

    if (reply.isEmpty()) {
        throw std::runtime_error("No reply from tidemark-daemon");
    }
    const auto parsed = nlohmann::json::parse(reply.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw std::runtime_error("Malformed reply from tidemark-daemon");
    }
    return parsed;
}

bool TidemarkCli::call(const std::string &method, const nlohmann::json &params,
                       nlohmann::json &result)
{
    nlohmann::json request;
    request["id"] = m_nextId++;
    request["method"] = method;
    request["params"] = params;

    nlohmann::json response;
    try {
        response = m_transport(request);
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return false;
    }

    if (response.contains("error")) {
        std::cerr << "Error: " << stringOr(response, "error", "unknown error") << std::endl;
        return false;
    }
    auto it = response.find("result");
    if (it == response.end() || !it->is_object()) {
        std::cerr << "Error: malformed response" << std::endl;
        return false;
    }
    result = *it;
    return true;
}

int TidemarkCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    TLOG_INFO(QStringLiteral("TidemarkCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    if (command == QStringLiteral("folders")) {
        return runFolders();
    }
    if (command == QStringLiteral("add")) {
        return runAdd(args);
    }
    if (command == QStringLiteral("remove")) {
        return runRemove(args);
    }
    if (command == QStringLiteral("changes")) {
        return runChanges(args);
    }
    if (command == QStringLiteral("checkpoint")) {
        return runCheckpoint(args);
    }
    if (command == QStringLiteral("cancel")) {
        return runCancel(args);
    }
    if (command == QStringLiteral("rollback")) {
        return runRollback(args);
    }
    if (command == QStringLiteral("rollback-file")) {
        return runRollbackFile(args);
    }
    if (command == QStringLiteral("diff")) {
        return runDiff(args);
    }
    if (command == QStringLiteral("clear")) {
        return runClear(args);
    }
    if (command == QStringLiteral("reload-ignore")) {
        return runReloadIgnore(args);
    }
    if (command == QStringLiteral("status")) {
        return runStatus();
    }
    if (command == QStringLiteral("start")) {
        return runStartDaemon();
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int TidemarkCli::runFolders()
{
    nlohmann::json result;
    if (!call("list_folders", nlohmann::json::object(), result)) {
        return 1;
    }
    const auto folders = result.value("folders", nlohmann::json::array());
    if (folders.empty()) {
        std::cout << "No folders watched." << std::endl;
        return 0;
    }
    for (const auto &folder : folders) {
        std::cout << folder.get<std::string>() << "\n";
    }
    return 0;
}

int TidemarkCli::runAdd(const QStringList &args)
{
    const QString path = positional(args, 0);
    if (path.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("add_folder", {{"path", absoluteFolder(path)}}, result)) {
        return 1;
    }
    const std::string folder = stringOr(result, "folder", absoluteFolder(path));
    if (result.value("added", false)) {
        std::cout << "Watching " << folder << std::endl;
    } else {
        std::cout << "Already watching " << folder << std::endl;
    }
    return 0;
}

int TidemarkCli::runRemove(const QStringList &args)
{
    const QString path = positional(args, 0);
    if (path.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("remove_folder", {{"path", absoluteFolder(path)}}, result)) {
        return 1;
    }
    if (!result.value("removed", false)) {
        std::cerr << "Not watched: " << absoluteFolder(path) << std::endl;
        return 1;
    }
    std::cout << "Stopped watching " << absoluteFolder(path) << std::endl;
    return 0;
}

int TidemarkCli::runChanges(const QStringList &args)
{
    const QString folder = positional(args, 0);
    if (folder.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    nlohmann::json result;
    if (!call("get_changes", {{"folder", absoluteFolder(folder)}}, result)) {
        return 1;
    }
    if (format == QStringLiteral("json")) {
        std::cout << result.dump(2) << std::endl;
        return 0;
    }

    const auto changes = result.value("changes", nlohmann::json::object());
    std::cout << (result.value("hasCheckpoint", false) ? "Changes since checkpoint"
                                                       : "Changes")
              << " in " << stringOr(result, "folder", absoluteFolder(folder))
              << ": " << changes.size() << "\n";
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        const ChangeRecord record = it.value().get<ChangeRecord>();
        std::cout << "  " << toChangeKindString(record.kind) << "\t"
                  << toIso8601Utc(record.timestamp) << "\t" << it.key() << "\n";
    }
    return 0;
}

int TidemarkCli::runCheckpoint(const QStringList &args)
{
    const QString folder = positional(args, 0);
    if (folder.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("create_checkpoint", {{"folder", absoluteFolder(folder)}}, result)) {
        return 1;
    }
    for (const auto &warning : result.value("warnings", nlohmann::json::array())) {
        std::cerr << "warning: " << warning.get<std::string>() << "\n";
    }
    if (!result.value("created", false)) {
        std::cerr << "Checkpoint could not be created." << std::endl;
        return 1;
    }
    std::cout << "Checkpoint " << stringOr(result, "snapshotId", "") << " created ("
              << result.value("copiedFiles", 0) << " files)" << std::endl;
    return 0;
}

int TidemarkCli::runCancel(const QStringList &args)
{
    const QString folder = positional(args, 0);
    if (folder.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("cancel_checkpoint", {{"folder", absoluteFolder(folder)}}, result)) {
        return 1;
    }
    std::cout << (result.value("cancelled", false) ? "Checkpoint cancelled."
                                                   : "No active checkpoint.")
              << std::endl;
    return 0;
}

int TidemarkCli::runRollback(const QStringList &args)
{
    const QString folder = positional(args, 0);
    if (folder.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("rollback", {{"folder", absoluteFolder(folder)}}, result)) {
        return 1;
    }
    for (const auto &error : result.value("errors", nlohmann::json::array())) {
        std::cerr << "error: " << error.get<std::string>() << "\n";
    }
    std::cout << "Restored " << result.value("restoredFiles", 0) << " files, removed "
              << result.value("removedFiles", 0) << " files." << std::endl;
    return result.value("success", false) ? 0 : 1;
}

int TidemarkCli::runRollbackFile(const QStringList &args)
{
    const QString folder = positional(args, 0);
    const QString path = positional(args, 1);
    if (folder.isEmpty() || path.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("rollback_file",
              {{"folder", absoluteFolder(folder)}, {"path", path.toStdString()}},
              result)) {
        return 1;
    }
    if (!result.value("restored", false)) {
        std::cerr << "Could not roll back " << path.toStdString() << std::endl;
        return 1;
    }
    std::cout << "Rolled back " << path.toStdString() << std::endl;
    return 0;
}

int TidemarkCli::runDiff(const QStringList &args)
{
    const QString folder = positional(args, 0);
    const QString path = positional(args, 1);
    if (folder.isEmpty() || path.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("diff_file",
              {{"folder", absoluteFolder(folder)}, {"path", path.toStdString()}},
              result)) {
        return 1;
    }

    const std::string state = stringOr(result, "state", "unreadable");
    if (state == "text") {
        std::cout << stringOr(result, "text", "");
        std::cout << "+" << result.value("added", 0) << " -" << result.value("removed", 0)
                  << std::endl;
        return 0;
    }
    if (state == "identical") {
        std::cout << "No differences from the checkpoint." << std::endl;
        return 0;
    }
    if (state == "binary") {
        std::cout << "Binary file, no diff available." << std::endl;
        return 0;
    }
    if (state == "missing") {
        std::cout << "File not found in the checkpoint or the folder." << std::endl;
        return 0;
    }
    std::cerr << "Could not read file: " << stringOr(result, "error", "") << std::endl;
    return 1;
}

int TidemarkCli::runClear(const QStringList &args)
{
    const QString folder = positional(args, 0);
    if (folder.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("clear_changes", {{"folder", absoluteFolder(folder)}}, result)) {
        return 1;
    }
    if (!result.value("cleared", false)) {
        std::cerr << "Cannot clear changes while a checkpoint is active." << std::endl;
        return 1;
    }
    std::cout << "Change history cleared." << std::endl;
    return 0;
}

int TidemarkCli::runReloadIgnore(const QStringList &args)
{
    const QString folder = positional(args, 0);
    if (folder.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    nlohmann::json result;
    if (!call("reload_ignore", {{"folder", absoluteFolder(folder)}}, result)) {
        return 1;
    }
    for (const auto &pattern : result.value("patterns", nlohmann::json::array())) {
        std::cout << pattern.get<std::string>() << "\n";
    }
    return 0;
}

int TidemarkCli::runStatus()
{
    nlohmann::json result;
    if (!call("status", nlohmann::json::object(), result)) {
        return 1;
    }
    std::cout << "tidemark-daemon " << stringOr(result, "version", "?") << "\n";
    for (const auto &entry : result.value("folders", nlohmann::json::array())) {
        const FolderStatus status = entry.get<FolderStatus>();
        std::cout << "  " << status.root
                  << (status.running ? "  watching" : "  stopped")
                  << (status.hasCheckpoint ? "  checkpoint" : "")
                  << "  changes=" << status.changeCount
                  << "  revision=" << status.revision << "\n";
    }
    return 0;
}

int TidemarkCli::runStartDaemon()
{
    if (isDaemonRunning()) {
        std::cout << "tidemark-daemon is already running." << std::endl;
        return 0;
    }
    if (!startDaemon()) {
        std::cerr << "Failed to start tidemark-daemon." << std::endl;
        return 1;
    }
    std::cout << "tidemark-daemon started." << std::endl;
    return 0;
}

} // namespace tidemark
