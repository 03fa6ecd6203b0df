#pragma once

#include <functional>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

namespace tidemark {

class TidemarkCli
{
public:
    // Sends one request and returns the parsed response. Throws
    // std::runtime_error when the daemon cannot be reached.
    using Transport = std::function<nlohmann::json(const nlohmann::json &)>;

    TidemarkCli();
    explicit TidemarkCli(Transport transport);

    // returns exit code
    int run(int argc, char *argv[]);

    // Blocking request over the daemon's local socket.
    static nlohmann::json socketTransport(const nlohmann::json &request);

private:
    int runFolders();
    int runAdd(const QStringList &args);
    int runRemove(const QStringList &args);
    int runChanges(const QStringList &args);
    int runCheckpoint(const QStringList &args);
    int runCancel(const QStringList &args);
    int runRollback(const QStringList &args);
    int runRollbackFile(const QStringList &args);
    int runDiff(const QStringList &args);
    int runClear(const QStringList &args);
    int runReloadIgnore(const QStringList &args);
    int runStatus();
    int runStartDaemon();

    // Returns false and prints the error when the call failed.
    bool call(const std::string &method, const nlohmann::json &params,
              nlohmann::json &result);

    Transport m_transport;
    int m_nextId = 1;
};

} // namespace tidemark
