#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace inreact::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// An empty logDir selects the default location for the current user.
void initLogging(const QString &processName, bool traceEnabled,
                 const QString &logDir = QString());

bool isTraceEnabled();

// Close and reopen the log file, e.g. after an external rotation.
void reopenLog();

QString logFilePath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. Use empty strings where a field is unknown.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace inreact::logging

#define IRLOG_DEBUG(component, where, what, why, ctxJson) \
    ::inreact::logging::logEvent(::inreact::logging::LogLevel::Debug, \
                                 (component), (where), (what), (why), (ctxJson))

#define IRLOG_INFO(component, where, what, why, ctxJson) \
    ::inreact::logging::logEvent(::inreact::logging::LogLevel::Info, \
                                 (component), (where), (what), (why), (ctxJson))

#define IRLOG_WARN(component, where, what, why, ctxJson) \
    ::inreact::logging::logEvent(::inreact::logging::LogLevel::Warn, \
                                 (component), (where), (what), (why), (ctxJson))

#define IRLOG_ERROR(component, where, what, why, ctxJson) \
    ::inreact::logging::logEvent(::inreact::logging::LogLevel::Error, \
                                 (component), (where), (what), (why), (ctxJson))
