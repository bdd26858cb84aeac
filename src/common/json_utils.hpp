#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace snapforge {

inline std::string toStageString(BuildStage stage)
{
    switch (stage) {
    case BuildStage::Initializing:
        return "initializing";
    case BuildStage::Validating:
        return "validating";
    case BuildStage::ExportingArchive:
        return "exporting_archive";
    case BuildStage::BuildingFilesystemImage:
        return "building_filesystem_image";
    case BuildStage::BuildingSnapshot:
        return "building_snapshot";
    case BuildStage::Finalizing:
        return "finalizing";
    case BuildStage::Succeeded:
        return "succeeded";
    case BuildStage::Failed:
        return "failed";
    case BuildStage::Interrupted:
        return "interrupted";
    }
    return "failed";
}

inline std::string toErrorKindString(BuildErrorKind kind)
{
    switch (kind) {
    case BuildErrorKind::UnsupportedArchitecture:
        return "unsupported_architecture";
    case BuildErrorKind::MissingBootCommand:
        return "missing_boot_command";
    case BuildErrorKind::UnsupportedToolsetVersion:
        return "unsupported_toolset_version";
    case BuildErrorKind::InvalidSizeValue:
        return "invalid_size_value";
    case BuildErrorKind::InvalidImageMetadata:
        return "invalid_image_metadata";
    case BuildErrorKind::ExecutionFailed:
        return "execution_failed";
    case BuildErrorKind::ExecutionTimedOut:
        return "execution_timed_out";
    case BuildErrorKind::ArtifactCopyFailed:
        return "artifact_copy_failed";
    case BuildErrorKind::WorkingAreaLocked:
        return "working_area_locked";
    case BuildErrorKind::WorkingAreaUnavailable:
        return "working_area_unavailable";
    }
    return "execution_failed";
}

// Docker reports absent values as null rather than omitting the key.
inline std::string stringOrEmpty(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return {};
}

inline std::vector<std::string> stringListOrEmpty(const nlohmann::json &j, const char *key)
{
    std::vector<std::string> result;
    if (!j.contains(key) || !j.at(key).is_array()) {
        return result;
    }
    for (const auto &item : j.at(key)) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

// One element of the `docker image inspect` array.
inline void from_json(const nlohmann::json &j, ImageMetadata &metadata)
{
    metadata.id = stringOrEmpty(j, "Id");
    metadata.architecture = stringOrEmpty(j, "Architecture");

    metadata.labels.clear();
    metadata.env.clear();
    metadata.entrypoint.clear();
    metadata.cmd.clear();
    metadata.workingDir.clear();

    if (!j.contains("Config") || !j.at("Config").is_object()) {
        return;
    }

    const auto &config = j.at("Config");
    if (config.contains("Labels") && config.at("Labels").is_object()) {
        for (const auto &item : config.at("Labels").items()) {
            if (item.value().is_string()) {
                metadata.labels[item.key()] = item.value().get<std::string>();
            }
        }
    }
    metadata.env = stringListOrEmpty(config, "Env");
    metadata.entrypoint = stringListOrEmpty(config, "Entrypoint");
    metadata.cmd = stringListOrEmpty(config, "Cmd");
    metadata.workingDir = stringOrEmpty(config, "WorkingDir");
}

inline void to_json(nlohmann::json &j, const ImageConfiguration &config)
{
    j = nlohmann::json{
        {"imageRef", config.imageRef},
        {"imageId", config.imageId},
        {"architecture", config.architecture},
        {"entrypoint", config.entrypoint},
        {"command", config.command},
        {"env", config.environmentVariables},
        {"workingDirectory", config.workingDirectory
            ? nlohmann::json(*config.workingDirectory)
            : nlohmann::json()},
        {"ramSize", config.ramSize},
        {"dataPartitionSize", config.dataPartitionSize},
        {"dataPartitionBytes", config.dataPartitionBytes},
        {"toolsetImage", config.toolsetImage()}
    };
}

} // namespace snapforge
