#pragma once

#include <functional>
#include <optional>
#include <string>

#include "builder/container_engine.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"

namespace snapforge {

class SandboxRunner;
class WorkingArea;

struct BuildOutcome {
    // Succeeded or Interrupted; failures are thrown.
    BuildStage stage = BuildStage::Failed;
    std::string snapshotPath;
    ImageConfiguration configuration;
    std::optional<std::string> snapshotHash;
};

/**
 * BuildPipeline turns a container image into a machine snapshot:
 *
 *   Initializing -> Validating -> ExportingArchive -> BuildingFilesystemImage
 *     -> BuildingSnapshot -> Finalizing -> Succeeded
 *
 * Any failure moves to Failed (the BuildError is rethrown) after the
 * intermediates and any partial snapshot have been removed. A stage that
 * exits with the interrupted status ends in Interrupted instead, with the
 * same cleanup and no exception.
 */
class BuildPipeline
{
public:
    using StageObserver = std::function<void(BuildStage)>;

    BuildPipeline(ImageStore &store, ContainerEngine &engine, BuildSettings settings);

    void setStageObserver(StageObserver observer);

    BuildOutcome run(const std::string &imageRef);

    BuildStage stage() const { return m_stage; }
    const BuildSettings &settings() const { return m_settings; }

private:
    void transition(BuildStage next);
    void throwIfCancelled() const;

    void exportArchive(const ImageConfiguration &config, const WorkingArea &area);
    void buildFilesystemImage(const ImageConfiguration &config,
                              const WorkingArea &area,
                              const SandboxRunner &runner);
    void buildSnapshot(const ImageConfiguration &config,
                       const WorkingArea &area,
                       const SandboxRunner &runner);

    ImageStore &m_store;
    ContainerEngine &m_engine;
    const BuildSettings m_settings;
    StageObserver m_observer;
    BuildStage m_stage = BuildStage::Initializing;
};

} // namespace snapforge
