#pragma once

#include <cstdint>
#include <string>

#include "common/models.hpp"

namespace snapforge {

constexpr std::uint64_t kFilesystemBlockSize = 4096;
constexpr const char *kSnapshotDriveLabel = "root";

// Quotes a single argument for a POSIX shell; safe words are left as-is.
std::string shellQuote(const std::string &argument);

// Renders a pipeline as `bash -o pipefail -c '...'` so that any failing
// process fails the whole command.
CommandLine renderPipeline(const CommandPipeline &pipeline);

// OCI archive on /tmp/input -> GNU tar of the root filesystem on /tmp/output:
// cat | crane export - - | bsdtar --format=gnutar.
CommandPipeline rootfsExportPipeline();
CommandLine createRootfsTarCommand();

// GNU tar on /tmp/input -> ext2 image on /tmp/output sized to the content
// plus extraBytes rounded up to whole blocks. Timestamps are faked so
// identical input yields an identical image.
CommandLine createExt2Command(std::uint64_t extraBytes);

// ext2 image on /tmp/input -> machine snapshot directory on /tmp/output.
CommandLine createMachineSnapshotCommand(const ImageConfiguration &config);

// Entrypoint followed by command, space separated.
std::string bootCommand(const ImageConfiguration &config);

} // namespace snapforge
