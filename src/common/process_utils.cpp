#include "common/process_utils.hpp"

#include <QElapsedTimer>
#include <QProcess>

#include <cstdio>

#include "common/cancellation.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kKillGraceMs = 5000;
constexpr int kMaxDiagnosticsBytes = 64 * 1024;

void appendTail(QByteArray &buffer, const QByteArray &chunk)
{
    buffer.append(chunk);
    if (buffer.size() > kMaxDiagnosticsBytes) {
        buffer.remove(0, buffer.size() - kMaxDiagnosticsBytes);
    }
}

} // namespace

QString ProcessResult::diagnostics() const
{
    const QByteArray &source = standardError.trimmed().isEmpty()
        ? standardOutput
        : standardError;
    if (source.trimmed().isEmpty()) {
        return errorString;
    }
    return QString::fromUtf8(source).trimmed();
}

void forwardToStderr(const QByteArray &chunk)
{
    fwrite(chunk.constData(), 1, static_cast<size_t>(chunk.size()), stderr);
    fflush(stderr);
}

ProcessResult runProcess(const QString &program,
                         const QStringList &arguments,
                         const ProcessOptions &options)
{
    ProcessResult result;

    SFLOG_DEBUG(QStringLiteral("ProcessUtils"),
                QStringLiteral("runProcess"),
                QStringLiteral("process_start"),
                QStringLiteral("external_tool"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"program", program.toStdString()},
                                {"args", arguments.size()}}));

    QProcess process;
    const bool streaming = static_cast<bool>(options.onOutput);
    if (streaming) {
        process.setProcessChannelMode(QProcess::MergedChannels);
    }

    process.start(program, arguments);
    if (!process.waitForStarted()) {
        result.errorString = process.errorString();
        return result;
    }
    result.started = true;
    process.closeWriteChannel();

    auto drain = [&]() {
        const QByteArray out = process.readAllStandardOutput();
        if (streaming) {
            if (!out.isEmpty()) {
                options.onOutput(out);
                appendTail(result.standardOutput, out);
            }
            return;
        }
        result.standardOutput.append(out);
        result.standardError.append(process.readAllStandardError());
    };

    QElapsedTimer timer;
    timer.start();

    while (!process.waitForFinished(kPollIntervalMs)) {
        drain();
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (options.cancellable && isCancellationRequested()) {
            result.cancelled = true;
        } else if (options.timeout.count() > 0 && timer.elapsed() >= options.timeout.count()) {
            result.timedOut = true;
        }
        if (result.cancelled || result.timedOut) {
            process.terminate();
            if (!process.waitForFinished(kKillGraceMs)) {
                process.kill();
                process.waitForFinished(kKillGraceMs);
            }
            break;
        }
    }
    drain();

    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();
    if (result.crashed && result.errorString.isEmpty()) {
        result.errorString = process.errorString();
    }
    return result;
}

} // namespace snapforge
