#pragma once

#include <string>

#include "builder/container_engine.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"

namespace snapforge {

/**
 * Derive a validated ImageConfiguration from raw image metadata.
 *
 * Checks, in order:
 * - architecture equals settings.requiredArchitecture
 * - entrypoint or cmd is non-empty
 * - sdk_version is a valid semver (warning only)
 * - default toolset is not older than settings.minimumToolsetVersion
 * - data_size, then ram_size, parse as byte sizes
 *
 * Throws BuildError on the first violation. Pure apart from logging.
 */
ImageConfiguration validateImageMetadata(const std::string &imageRef,
                                         const ImageMetadata &metadata,
                                         const BuildSettings &settings);

// Inspects imageRef through the store, then validates.
ImageConfiguration inspectAndValidate(ImageStore &store,
                                      const std::string &imageRef,
                                      const BuildSettings &settings);

} // namespace snapforge
