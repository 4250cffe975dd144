#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace syncwarden::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Files go to $SYNCWARDEN_LOG_DIR, or ~/.local/share/syncwarden/logs.
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

// Raw output of the supervised service, one timestamped line per call.
void logServiceOutput(const QString &line);

QString logDirectory();
QString logFilePath(const QString &processName);
QString serviceLogFilePath(const QString &processName);

} // namespace syncwarden::logging

#define SWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::syncwarden::logging::logEvent(::syncwarden::logging::LogLevel::Debug, \
                                    ::syncwarden::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::syncwarden::logging::logEvent(::syncwarden::logging::LogLevel::Info, \
                                    ::syncwarden::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::syncwarden::logging::logEvent(::syncwarden::logging::LogLevel::Warn, \
                                    ::syncwarden::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::syncwarden::logging::logEvent(::syncwarden::logging::LogLevel::Error, \
                                    ::syncwarden::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
