#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace unpod::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking the records of one command.
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

} // namespace unpod::logging

#define ULOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::unpod::logging::logEvent(::unpod::logging::LogLevel::Debug, \
                               ::unpod::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ULOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::unpod::logging::logEvent(::unpod::logging::LogLevel::Info, \
                               ::unpod::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ULOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::unpod::logging::logEvent(::unpod::logging::LogLevel::Warn, \
                               ::unpod::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ULOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::unpod::logging::logEvent(::unpod::logging::LogLevel::Error, \
                               ::unpod::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
