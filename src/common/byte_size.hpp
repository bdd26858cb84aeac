#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace snapforge {

/**
 * Parse a human-readable size such as "128Mi", "10Mb", "1.5G" or "4096".
 *
 * Units:
 * - none, "b", "B": bytes
 * - "k"/"K", "M", "G", "T", "P": decimal (10^3 steps)
 * - "Ki", "Mi", "Gi", "Ti", "Pi" (optionally with a trailing "B"): binary
 * - letter followed by "b"/"B" ("kb", "MB", "Gb", ...): binary, the
 *   convention image labels have historically used for "10Mb"
 *
 * Fractional byte counts are floored. Returns std::nullopt on malformed
 * input, a sign, or overflow. Never throws.
 */
std::optional<std::uint64_t> parseByteSize(const std::string &value);

// Render bytes with the largest binary unit that divides it exactly ("256Mi").
std::string formatByteSize(std::uint64_t bytes);

} // namespace snapforge
