#pragma once

#include <chrono>
#include <functional>

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace snapforge {

struct ProcessOptions {
    // Zero means wait indefinitely.
    std::chrono::milliseconds timeout{0};

    // When set, stdout and stderr are merged and forwarded as they arrive;
    // only the trailing diagnostics are retained in ProcessResult::standardOutput.
    std::function<void(const QByteArray &)> onOutput;

    // Teardown commands must run to completion even after cancellation.
    bool cancellable = true;
};

struct ProcessResult {
    bool started = false;
    bool crashed = false;
    bool timedOut = false;
    bool cancelled = false;
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;
    QString errorString;

    bool succeeded() const
    {
        return started && !crashed && !timedOut && !cancelled && exitCode == 0;
    }

    // stderr if present, otherwise stdout; trimmed for messages.
    QString diagnostics() const;
};

// Runs program to completion, honouring the timeout and the process-wide
// cancellation flag. The child is killed on either.
ProcessResult runProcess(const QString &program,
                         const QStringList &arguments,
                         const ProcessOptions &options = {});

// Default onOutput sink: forwards container output to our stderr.
void forwardToStderr(const QByteArray &chunk);

} // namespace snapforge
