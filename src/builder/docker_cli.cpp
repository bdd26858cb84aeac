#include "builder/docker_cli.hpp"

#include <QFileInfo>

#include <utility>

#include "common/build_error.hpp"
#include "common/json_utils.hpp"
#include "common/process_utils.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

namespace {

QStringList toQStringList(const CommandLine &command)
{
    QStringList list;
    list.reserve(static_cast<int>(command.size()));
    for (const auto &arg : command) {
        list.push_back(QString::fromStdString(arg));
    }
    return list;
}

std::string describe(const QString &program, const QStringList &args)
{
    return (program + QLatin1Char(' ') + args.join(QLatin1Char(' '))).toStdString();
}

[[noreturn]] void throwFailure(BuildErrorKind kind,
                               const QString &program,
                               const QStringList &args,
                               const ProcessResult &result)
{
    std::string message = "'" + describe(program, args) + "' ";
    if (result.cancelled) {
        throw BuildError(BuildErrorKind::ExecutionFailed, message + "was interrupted",
                         BuildError::kInterruptedExitCode,
                         result.diagnostics().toStdString());
    }
    if (result.timedOut) {
        throw BuildError(BuildErrorKind::ExecutionTimedOut, message + "timed out", -1,
                         result.diagnostics().toStdString());
    }
    if (!result.started) {
        message += "could not be started";
    } else if (result.crashed) {
        message += "crashed";
    } else {
        message += "exited with code " + std::to_string(result.exitCode);
    }
    const std::string diagnostics = result.diagnostics().toStdString();
    if (!diagnostics.empty()) {
        message += ": " + diagnostics;
    }
    throw BuildError(kind, message, result.started ? result.exitCode : -1, diagnostics);
}

} // namespace

DockerCli::DockerCli(QString program)
    : m_program(std::move(program))
    , m_outputSink(forwardToStderr)
{
}

void DockerCli::setOutputSink(std::function<void(const QByteArray &)> sink)
{
    m_outputSink = std::move(sink);
}

ImageMetadata DockerCli::parseInspectOutput(const std::string &json)
{
    try {
        const auto parsed = nlohmann::json::parse(json);
        if (!parsed.is_array() || parsed.empty() || !parsed.front().is_object()) {
            throw BuildError(BuildErrorKind::InvalidImageMetadata,
                             "image inspection returned no image object");
        }
        return parsed.front().get<ImageMetadata>();
    } catch (const nlohmann::json::exception &ex) {
        throw BuildError(BuildErrorKind::InvalidImageMetadata,
                         std::string("malformed image inspection output: ") + ex.what());
    }
}

ImageMetadata DockerCli::inspect(const std::string &imageRef)
{
    const QStringList args = {QStringLiteral("image"), QStringLiteral("inspect"),
                              QString::fromStdString(imageRef)};
    const ProcessResult result = runProcess(m_program, args);
    if (!result.succeeded()) {
        throwFailure(BuildErrorKind::ExecutionFailed, m_program, args, result);
    }
    return parseInspectOutput(result.standardOutput.toStdString());
}

void DockerCli::save(const std::string &imageRef, const std::string &destPath)
{
    const QStringList args = {QStringLiteral("image"), QStringLiteral("save"),
                              QString::fromStdString(imageRef),
                              QStringLiteral("-o"), QString::fromStdString(destPath)};
    const ProcessResult result = runProcess(m_program, args);
    if (!result.succeeded()) {
        throwFailure(BuildErrorKind::ExecutionFailed, m_program, args, result);
    }
}

QStringList DockerCli::createArguments(const std::string &image,
                                       const CommandLine &command,
                                       const MountSpec &mount)
{
    QString volume = QFileInfo(QString::fromStdString(mount.hostPath)).absoluteFilePath()
        + QLatin1Char(':') + QString::fromStdString(mount.containerPath);
    if (mount.mode == MountMode::ReadOnly) {
        volume += QStringLiteral(":ro");
    }

    QStringList args = {QStringLiteral("container"), QStringLiteral("create"),
                        QStringLiteral("--volume"), volume,
                        QString::fromStdString(image)};
    args.append(toQStringList(command));
    return args;
}

std::string DockerCli::create(const std::string &image,
                              const CommandLine &command,
                              const MountSpec &mount)
{
    const QStringList args = createArguments(image, command, mount);
    const ProcessResult result = runProcess(m_program, args);
    if (!result.succeeded()) {
        throwFailure(BuildErrorKind::ExecutionFailed, m_program, args, result);
    }

    const QString id = QString::fromUtf8(result.standardOutput).trimmed();
    if (id.isEmpty()) {
        throw BuildError(BuildErrorKind::ExecutionFailed,
                         "container create returned no container id", -1,
                         result.diagnostics().toStdString());
    }
    return id.toStdString();
}

ContainerExit DockerCli::start(const std::string &containerId,
                               std::chrono::milliseconds timeout)
{
    const QStringList args = {QStringLiteral("container"), QStringLiteral("start"),
                              QStringLiteral("-a"), QString::fromStdString(containerId)};

    ProcessOptions options;
    options.timeout = timeout;
    if (m_outputSink) {
        options.onOutput = m_outputSink;
    } else {
        options.onOutput = forwardToStderr;
    }

    const ProcessResult result = runProcess(m_program, args, options);
    if (!result.started) {
        throwFailure(BuildErrorKind::ExecutionFailed, m_program, args, result);
    }
    if (result.timedOut) {
        throw BuildError(BuildErrorKind::ExecutionTimedOut,
                         "container " + containerId + " exceeded the stage timeout of "
                             + std::to_string(timeout.count()) + " ms",
                         -1, result.diagnostics().toStdString());
    }

    ContainerExit exit;
    exit.diagnostics = QString::fromUtf8(result.standardOutput).toStdString();
    if (result.cancelled) {
        exit.exitCode = BuildError::kInterruptedExitCode;
    } else if (result.crashed) {
        exit.exitCode = -1;
    } else {
        exit.exitCode = result.exitCode;
    }
    return exit;
}

void DockerCli::copyOut(const std::string &containerId,
                        const std::string &containerPath,
                        const std::string &hostPath)
{
    const QStringList args = {QStringLiteral("container"), QStringLiteral("cp"),
                              QString::fromStdString(containerId + ":" + containerPath),
                              QString::fromStdString(hostPath)};
    const ProcessResult result = runProcess(m_program, args);
    if (!result.succeeded()) {
        throwFailure(BuildErrorKind::ArtifactCopyFailed, m_program, args, result);
    }
}

void DockerCli::stop(const std::string &containerId)
{
    const QStringList args = {QStringLiteral("container"), QStringLiteral("stop"),
                              QString::fromStdString(containerId)};
    ProcessOptions options;
    options.cancellable = false;
    const ProcessResult result = runProcess(m_program, args, options);
    if (!result.succeeded()) {
        throwFailure(BuildErrorKind::ExecutionFailed, m_program, args, result);
    }
}

void DockerCli::remove(const std::string &containerId)
{
    // --force also removes a container whose stop failed.
    const QStringList args = {QStringLiteral("container"), QStringLiteral("rm"),
                              QStringLiteral("--force"),
                              QString::fromStdString(containerId)};
    ProcessOptions options;
    options.cancellable = false;
    const ProcessResult result = runProcess(m_program, args, options);
    if (!result.succeeded()) {
        throwFailure(BuildErrorKind::ExecutionFailed, m_program, args, result);
    }
}

} // namespace snapforge
