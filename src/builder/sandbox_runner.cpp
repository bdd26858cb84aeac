#include "builder/sandbox_runner.hpp"

#include <QFileInfo>
#include <QString>

#include <exception>
#include <utility>

#include "common/build_error.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

namespace {

void logTeardownFailure(const char *operation, const std::string &containerId,
                        const std::exception &ex)
{
    SFLOG_ERROR(QStringLiteral("SandboxRunner"),
                QStringLiteral("ContainerGuard::~ContainerGuard"),
                QStringLiteral("container_teardown_failed"),
                QString::fromLatin1(operation),
                QStringLiteral("container_engine"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"container", containerId},
                                {"error", ex.what()}}));
}

} // namespace

ContainerGuard::ContainerGuard(ContainerEngine &engine, std::string containerId)
    : m_engine(engine)
    , m_containerId(std::move(containerId))
{
}

ContainerGuard::~ContainerGuard()
{
    try {
        m_engine.stop(m_containerId);
    } catch (const std::exception &ex) {
        logTeardownFailure("stop", m_containerId, ex);
    }

    try {
        m_engine.remove(m_containerId);
    } catch (const std::exception &ex) {
        logTeardownFailure("remove", m_containerId, ex);
    }

    SFLOG_DEBUG(QStringLiteral("SandboxRunner"),
                QStringLiteral("ContainerGuard::~ContainerGuard"),
                QStringLiteral("container_released"),
                QStringLiteral("scope_exit"),
                QStringLiteral("stop_and_remove"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"container", m_containerId}}));
}

SandboxRunner::SandboxRunner(ContainerEngine &engine,
                             std::chrono::milliseconds stageTimeout,
                             MountMode inputMode)
    : m_engine(engine)
    , m_stageTimeout(stageTimeout)
    , m_inputMode(inputMode)
{
}

void SandboxRunner::runOneShot(const std::string &environmentImage,
                               const CommandLine &command,
                               const std::string &inputPath,
                               const std::string &outputPath) const
{
    SFLOG_INFO(QStringLiteral("SandboxRunner"),
               QStringLiteral("runOneShot"),
               QStringLiteral("stage_container_start"),
               QStringLiteral("pipeline_stage"),
               QStringLiteral("one_shot_container"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"image", environmentImage},
                               {"program", command.empty() ? std::string() : command.front()},
                               {"input", inputPath},
                               {"output", outputPath}}));

    MountSpec mount;
    mount.hostPath = inputPath;
    mount.containerPath = kInputMountPath;
    mount.mode = m_inputMode;

    const std::string containerId = m_engine.create(environmentImage, command, mount);
    ContainerGuard guard(m_engine, containerId);

    const ContainerExit exit = m_engine.start(containerId, m_stageTimeout);
    if (exit.exitCode != 0) {
        SFLOG_WARN(QStringLiteral("SandboxRunner"),
                   QStringLiteral("runOneShot"),
                   QStringLiteral("stage_container_failed"),
                   QStringLiteral("non_zero_exit"),
                   QStringLiteral("one_shot_container"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"container", containerId},
                                   {"exitCode", exit.exitCode}}));
        throw BuildError(BuildErrorKind::ExecutionFailed,
                         "stage command in " + environmentImage + " exited with code "
                             + std::to_string(exit.exitCode),
                         exit.exitCode, exit.diagnostics);
    }

    m_engine.copyOut(containerId, kOutputPath, outputPath);
    if (!QFileInfo::exists(QString::fromStdString(outputPath))) {
        throw BuildError(BuildErrorKind::ArtifactCopyFailed,
                         "stage produced no artifact at " + outputPath);
    }

    SFLOG_INFO(QStringLiteral("SandboxRunner"),
               QStringLiteral("runOneShot"),
               QStringLiteral("stage_container_done"),
               QStringLiteral("pipeline_stage"),
               QStringLiteral("one_shot_container"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"container", containerId},
                               {"output", outputPath}}));
}

} // namespace snapforge
