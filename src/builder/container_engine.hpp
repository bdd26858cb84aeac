#pragma once

#include <chrono>
#include <string>

#include "common/models.hpp"

namespace snapforge {

// Source of images: metadata lookup and export to a portable archive.
class ImageStore
{
public:
    virtual ~ImageStore() = default;

    // Throws BuildError (ExecutionFailed or InvalidImageMetadata).
    virtual ImageMetadata inspect(const std::string &imageRef) = 0;
    virtual void save(const std::string &imageRef, const std::string &destPath) = 0;
};

struct ContainerExit {
    int exitCode = 0;
    std::string diagnostics;
};

/**
 * The five container operations a one-shot stage needs. Implementations must
 * accept stop() and remove() for a container whose start() or copyOut()
 * failed, so callers can always tear down.
 */
class ContainerEngine
{
public:
    virtual ~ContainerEngine() = default;

    // Returns the container id.
    virtual std::string create(const std::string &image,
                               const CommandLine &command,
                               const MountSpec &mount) = 0;

    // Runs attached until the container exits; a zero timeout waits forever.
    // Throws BuildError(ExecutionTimedOut) on expiry. A cancelled run
    // reports the interrupted exit code.
    virtual ContainerExit start(const std::string &containerId,
                                std::chrono::milliseconds timeout) = 0;

    // Throws BuildError(ArtifactCopyFailed).
    virtual void copyOut(const std::string &containerId,
                         const std::string &containerPath,
                         const std::string &hostPath) = 0;

    virtual void stop(const std::string &containerId) = 0;
    virtual void remove(const std::string &containerId) = 0;
};

} // namespace snapforge
