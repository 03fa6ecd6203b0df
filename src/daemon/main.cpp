#include <QCoreApplication>

#include <chrono>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/tidemark_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tidemark-daemon"));

    bool trace = qEnvironmentVariableIntValue("TIDEMARK_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    tidemark::logging::initLogging(QStringLiteral("tidemark-daemon"), trace);

    tidemark::SessionOptions options;
    bool suppressOk = false;
    const int suppressMs = qEnvironmentVariableIntValue("TIDEMARK_SUPPRESS_MS", &suppressOk);
    if (suppressOk && suppressMs > 0) {
        options.suppressionWindow = std::chrono::milliseconds(suppressMs);
    }

    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("default_config"),
              tidemark::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"trace", trace},
                              {"suppressionWindowMs", options.suppressionWindow.count()}}));

    // The daemon lives for the lifetime of the process.
    tidemark::TidemarkDaemon daemon(options);
    if (!daemon.start()) {
        return 1;
    }

    return app.exec();
}
