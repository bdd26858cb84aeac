#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace snapforge::logging {

namespace {

struct LogState {
    std::mutex mutex;
    LogConfig config;
    std::atomic<QtMessageHandler> previousHandler{nullptr};
};

LogState &state()
{
    static LogState instance;
    return instance;
}

thread_local QString t_corrId;
thread_local bool t_writingLog = false;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

LogLevel levelFor(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return LogLevel::Debug;
    case QtInfoMsg:
        return LogLevel::Info;
    case QtWarningMsg:
        return LogLevel::Warn;
    case QtCriticalMsg:
    case QtFatalMsg:
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

QString homeLogsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/snapforge/logs");
    }
    return home + QStringLiteral("/.local/share/snapforge/logs");
}

QString directoryFor(const LogConfig &config)
{
    return config.directory.isEmpty() ? homeLogsDir() : config.directory;
}

QString backupName(const QString &path, int index)
{
    return QStringLiteral("%1.%2").arg(path).arg(index);
}

// log -> log.1 -> log.2 ... ; the oldest backup is dropped.
void rotate(const QString &path, int maxBackups)
{
    if (maxBackups <= 0) {
        QFile::remove(path);
        return;
    }

    QFile::remove(backupName(path, maxBackups));
    for (int i = maxBackups - 1; i >= 1; --i) {
        const QString from = backupName(path, i);
        if (QFile::exists(from)) {
            QFile::rename(from, backupName(path, i + 1));
        }
    }
    QFile::rename(path, backupName(path, 1));
}

void appendLine(const LogConfig &config, const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    const QFileInfo info(path);
    if (info.exists() && info.size() + line.size() + 1 > config.maxFileBytes) {
        rotate(path, config.maxBackups);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

void consoleMessageHandler(QtMsgType type, const QMessageLogContext &context,
                           const QString &message)
{
    const QtMessageHandler previous = state().previousHandler.load();

    // Record first: a fatal message never returns from the previous handler.
    // Messages raised while this thread is writing a log line are only printed.
    if (!t_writingLog) {
        logEvent(levelFor(type),
                 defaultProcessName(),
                 QStringLiteral("console"),
                 QString::fromUtf8(context.function ? context.function : ""),
                 QStringLiteral("console_message"),
                 QStringLiteral("user_feedback"),
                 QStringLiteral("qt_message_handler"),
                 defaultWho(),
                 QString(),
                 nlohmann::json{{"message", message.toStdString()}});
    }

    if (previous) {
        previous(type, context, message);
    } else {
        fprintf(stderr, "%s\n", qPrintable(qFormatLogMessage(type, context, message)));
    }
}

} // namespace

LogConfig configFromEnvironment(const QString &processName, bool traceEnabled)
{
    LogConfig config;
    config.processName = processName;
    config.traceEnabled = traceEnabled;
    config.directory = qEnvironmentVariable("SNAPFORGE_LOG_DIR");
    return config;
}

void initLogging(const LogConfig &config)
{
    std::lock_guard<std::mutex> lock(state().mutex);
    state().config = config;
}

void initLogging(const QString &processName, bool traceEnabled)
{
    initLogging(configFromEnvironment(processName, traceEnabled));
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().config.traceEnabled;
}

void installConsoleBridge()
{
    const QtMessageHandler previous = qInstallMessageHandler(consoleMessageHandler);
    if (previous != consoleMessageHandler) {
        state().previousHandler.store(previous);
    }
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logsDirPath()
{
    std::lock_guard<std::mutex> lock(state().mutex);
    return directoryFor(state().config);
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(state().mutex);
        if (!state().config.processName.isEmpty()) {
            return state().config.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("snapforge");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", QCoreApplication::applicationPid()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };

    // Context may carry raw tool output; invalid UTF-8 is replaced, not thrown.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(state().mutex);
    t_writingLog = true;
    const LogConfig &config = state().config;
    const QString base = directoryFor(config) + QLatin1Char('/') + process;

    if (level != LogLevel::Debug || config.traceEnabled) {
        appendLine(config, base + QStringLiteral(".log"), line);
    }
    if (config.traceEnabled) {
        appendLine(config, base + QStringLiteral("-trace.log"), line);
    }
    t_writingLog = false;
}

} // namespace snapforge::logging
