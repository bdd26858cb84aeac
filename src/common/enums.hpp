#pragma once

namespace snapforge {

enum class BuildStage {
    Initializing,
    Validating,
    ExportingArchive,
    BuildingFilesystemImage,
    BuildingSnapshot,
    Finalizing,
    Succeeded,
    Failed,
    Interrupted
};

enum class BuildErrorKind {
    UnsupportedArchitecture,
    MissingBootCommand,
    UnsupportedToolsetVersion,
    InvalidSizeValue,
    InvalidImageMetadata,
    ExecutionFailed,
    ExecutionTimedOut,
    ArtifactCopyFailed,
    WorkingAreaLocked,
    WorkingAreaUnavailable
};

enum class MountMode {
    ReadOnly,
    ReadWrite
};

} // namespace snapforge
