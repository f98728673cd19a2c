#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tracedeck::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

// Trace mode writes debug events and mirrors everything to <process>-trace.log.
bool isTraceEnabled();

// Overrides the log directory (defaults to $HOME/.local/share/tracedeck/logs).
void setLogDirectory(const QString &path);
QString logDirectory();

// A log file that would grow past this many bytes is moved to <file>.1 first.
void setRotationLimit(qint64 bytes);

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

} // namespace tracedeck::logging

#define TDLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::tracedeck::logging::logEvent(::tracedeck::logging::LogLevel::Debug, \
                                   ::tracedeck::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TDLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::tracedeck::logging::logEvent(::tracedeck::logging::LogLevel::Info, \
                                   ::tracedeck::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TDLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::tracedeck::logging::logEvent(::tracedeck::logging::LogLevel::Warn, \
                                   ::tracedeck::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TDLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::tracedeck::logging::logEvent(::tracedeck::logging::LogLevel::Error, \
                                   ::tracedeck::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
