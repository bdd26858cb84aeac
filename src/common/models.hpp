#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace snapforge {

// Raw image metadata as reported by the image store (docker image inspect).
struct ImageMetadata {
    std::string id;
    std::string architecture;
    std::map<std::string, std::string> labels;
    std::vector<std::string> env;
    std::vector<std::string> entrypoint;
    std::vector<std::string> cmd;
    std::string workingDir;
};

// Validated, defaulted configuration derived from ImageMetadata.
struct ImageConfiguration {
    std::string imageRef;
    std::string imageId;
    std::string architecture;
    std::vector<std::string> entrypoint;
    std::vector<std::string> command;
    std::vector<std::string> environmentVariables;
    std::optional<std::string> workingDirectory;
    std::string ramSize;
    std::string dataPartitionSize;
    std::uint64_t dataPartitionBytes = 0;
    std::string toolsetName;
    std::string toolsetVersion;

    std::string toolsetImage() const
    {
        return toolsetName + ":" + toolsetVersion;
    }
};

// A single process invocation: program followed by its arguments.
using CommandLine = std::vector<std::string>;

// Processes connected stdout -> stdin, left to right.
struct CommandPipeline {
    std::vector<CommandLine> processes;
};

struct MountSpec {
    std::string hostPath;
    std::string containerPath;
    MountMode mode = MountMode::ReadOnly;
};

} // namespace snapforge
