#pragma once

#include <chrono>
#include <string>

#include "builder/container_engine.hpp"
#include "common/models.hpp"

namespace snapforge {

// Stops and removes a container when it goes out of scope. Teardown
// failures are logged, never thrown.
class ContainerGuard
{
public:
    ContainerGuard(ContainerEngine &engine, std::string containerId);
    ~ContainerGuard();

    ContainerGuard(const ContainerGuard &) = delete;
    ContainerGuard &operator=(const ContainerGuard &) = delete;

    const std::string &containerId() const { return m_containerId; }

private:
    ContainerEngine &m_engine;
    std::string m_containerId;
};

/**
 * Runs one stage command in a disposable container:
 * - the input artifact is mounted at /tmp/input
 * - the tool must write its result to /tmp/output
 * - /tmp/output is copied back to the host output path
 *
 * The container is always stopped and removed, whatever the outcome.
 */
class SandboxRunner
{
public:
    static constexpr const char *kInputMountPath = "/tmp/input";
    static constexpr const char *kOutputPath = "/tmp/output";

    explicit SandboxRunner(ContainerEngine &engine,
                           std::chrono::milliseconds stageTimeout = std::chrono::milliseconds(0),
                           MountMode inputMode = MountMode::ReadOnly);

    // Throws BuildError: ExecutionFailed (with exit code), ExecutionTimedOut,
    // ArtifactCopyFailed.
    void runOneShot(const std::string &environmentImage,
                    const CommandLine &command,
                    const std::string &inputPath,
                    const std::string &outputPath) const;

private:
    ContainerEngine &m_engine;
    std::chrono::milliseconds m_stageTimeout;
    MountMode m_inputMode;
};

} // namespace snapforge
