#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tidemark::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();
QString logsDirPath();

} // namespace tidemark::logging

#define TLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::tidemark::logging::logEvent(::tidemark::logging::LogLevel::Debug, \
                                  ::tidemark::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::tidemark::logging::logEvent(::tidemark::logging::LogLevel::Info, \
                                  ::tidemark::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::tidemark::logging::logEvent(::tidemark::logging::LogLevel::Warn, \
                                  ::tidemark::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::tidemark::logging::logEvent(::tidemark::logging::LogLevel::Error, \
                                  ::tidemark::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
