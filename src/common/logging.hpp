#pragma once

#include <QString>
#include <QtGlobal>

#include <nlohmann/json.hpp>

namespace snapforge::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogConfig {
    QString processName;
    // Debug events are dropped unless set; when set every event is also
    // mirrored into <process>-trace.log.
    bool traceEnabled = false;
    // Empty means $HOME/.local/share/snapforge/logs.
    QString directory;
    qint64 maxFileBytes = 5 * 1024 * 1024;
    int maxBackups = 3;
};

// Defaults plus SNAPFORGE_LOG_DIR.
LogConfig configFromEnvironment(const QString &processName, bool traceEnabled);

// Call early in main(), before the first log event.
void initLogging(const LogConfig &config);
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Also records qInfo()/qWarning()/qCritical() output as "console" events.
// The previously installed handler still prints the message.
void installConsoleBridge();

// Thread-local correlation id; every event of one build carries the image reference.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line per event. Use empty strings for unknown fields.
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

} // namespace snapforge::logging

#define SFLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::snapforge::logging::logEvent((level), \
                                   ::snapforge::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SFLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_EVENT(::snapforge::logging::LogLevel::Debug, component, where, what, why, how, who, corr, ctxJson)

#define SFLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_EVENT(::snapforge::logging::LogLevel::Info, component, where, what, why, how, who, corr, ctxJson)

#define SFLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_EVENT(::snapforge::logging::LogLevel::Warn, component, where, what, why, how, who, corr, ctxJson)

#define SFLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_EVENT(::snapforge::logging::LogLevel::Error, component, where, what, why, how, who, corr, ctxJson)
