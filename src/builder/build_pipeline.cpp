#include "builder/build_pipeline.hpp"

#include <QDebug>
#include <QString>

#include <utility>

#include "builder/image_validator.hpp"
#include "builder/sandbox_runner.hpp"
#include "builder/stage_commands.hpp"
#include "builder/working_area.hpp"
#include "common/build_error.hpp"
#include "common/cancellation.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

BuildPipeline::BuildPipeline(ImageStore &store, ContainerEngine &engine, BuildSettings settings)
    : m_store(store)
    , m_engine(engine)
    , m_settings(std::move(settings))
{
}

void BuildPipeline::setStageObserver(StageObserver observer)
{
    m_observer = std::move(observer);
}

void BuildPipeline::transition(BuildStage next)
{
    SFLOG_INFO(QStringLiteral("BuildPipeline"),
               QStringLiteral("transition"),
               QStringLiteral("stage_transition"),
               QStringLiteral("pipeline_progress"),
               QStringLiteral("state_machine"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"from", toStageString(m_stage)},
                               {"to", toStageString(next)}}));
    m_stage = next;
    if (m_observer) {
        m_observer(next);
    }
}

void BuildPipeline::throwIfCancelled() const
{
    if (isCancellationRequested()) {
        throw BuildError(BuildErrorKind::ExecutionFailed, "build interrupted",
                         BuildError::kInterruptedExitCode, std::string());
    }
}

BuildOutcome BuildPipeline::run(const std::string &imageRef)
{
    logging::CorrelationScope correlation(QString::fromStdString(imageRef));
    m_stage = BuildStage::Initializing;
    transition(BuildStage::Initializing);

    BuildOutcome outcome;
    WorkingArea area(m_settings.workDir);

    try {
        area.acquire();
        area.reset();

        throwIfCancelled();
        transition(BuildStage::Validating);
        outcome.configuration = inspectAndValidate(m_store, imageRef, m_settings);
        const ImageConfiguration &config = outcome.configuration;

        const SandboxRunner runner(
            m_engine,
            std::chrono::duration_cast<std::chrono::milliseconds>(m_settings.stageTimeout),
            m_settings.readWriteInputMount ? MountMode::ReadWrite : MountMode::ReadOnly);

        throwIfCancelled();
        transition(BuildStage::ExportingArchive);
        exportArchive(config, area);

        throwIfCancelled();
        transition(BuildStage::BuildingFilesystemImage);
        buildFilesystemImage(config, area, runner);

        throwIfCancelled();
        transition(BuildStage::BuildingSnapshot);
        buildSnapshot(config, area, runner);

        transition(BuildStage::Finalizing);
        area.commitSnapshot();
        area.removeIntermediates();

        outcome.snapshotPath = area.snapshotPath();
        outcome.snapshotHash = readSnapshotHash(outcome.snapshotPath);
        outcome.stage = BuildStage::Succeeded;
        transition(BuildStage::Succeeded);

        qInfo().noquote() << "snapforge: snapshot ready at"
                          << QString::fromStdString(outcome.snapshotPath);
        SFLOG_INFO(QStringLiteral("BuildPipeline"),
                   QStringLiteral("run"),
                   QStringLiteral("build_succeeded"),
                   QStringLiteral("pipeline_complete"),
                   QStringLiteral("state_machine"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"snapshot", outcome.snapshotPath},
                                   {"hash", outcome.snapshotHash.value_or("")},
                                   {"configuration", config}}));
        return outcome;
    } catch (const BuildError &error) {
        const BuildStage failedStage = m_stage;
        area.removeIntermediates();
        area.discardSnapshot();

        if (error.isInterruption()) {
            qWarning().noquote() << "snapforge: build interrupted during"
                                 << QString::fromStdString(toStageString(failedStage));
            SFLOG_WARN(QStringLiteral("BuildPipeline"),
                       QStringLiteral("run"),
                       QStringLiteral("build_interrupted"),
                       QStringLiteral("operator_shutdown"),
                       QStringLiteral("state_machine"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"stage", toStageString(failedStage)}}));
            outcome.stage = BuildStage::Interrupted;
            outcome.snapshotPath.clear();
            transition(BuildStage::Interrupted);
            return outcome;
        }

        SFLOG_ERROR(QStringLiteral("BuildPipeline"),
                    QStringLiteral("run"),
                    QStringLiteral("build_failed"),
                    QString::fromStdString(toErrorKindString(error.kind())),
                    QStringLiteral("state_machine"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"stage", toStageString(failedStage)},
                                    {"error", error.what()},
                                    {"exitCode", error.exitCode()}}));
        transition(BuildStage::Failed);
        throw;
    }
}

void BuildPipeline::exportArchive(const ImageConfiguration &config, const WorkingArea &area)
{
    qInfo().noquote() << "snapforge: exporting" << QString::fromStdString(config.imageRef);
    m_store.save(config.imageRef, area.archivePath());
}

void BuildPipeline::buildFilesystemImage(const ImageConfiguration &config,
                                         const WorkingArea &area,
                                         const SandboxRunner &runner)
{
    const std::string toolset = config.toolsetImage();

    qInfo().noquote() << "snapforge: extracting root filesystem with"
                      << QString::fromStdString(toolset);
    runner.runOneShot(toolset, createRootfsTarCommand(),
                      area.archivePath(), area.filesystemArchivePath());

    qInfo().noquote() << "snapforge: creating filesystem image";
    runner.runOneShot(toolset, createExt2Command(config.dataPartitionBytes),
                      area.filesystemArchivePath(), area.blockImagePath());
}

void BuildPipeline::buildSnapshot(const ImageConfiguration &config,
                                  const WorkingArea &area,
                                  const SandboxRunner &runner)
{
    qInfo().noquote() << "snapforge: creating machine snapshot";
    runner.runOneShot(config.toolsetImage(), createMachineSnapshotCommand(config),
                      area.blockImagePath(), area.snapshotPath());
}

} // namespace snapforge
