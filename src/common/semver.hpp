#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snapforge {

// Semantic Versioning 2.0.0 value. Build metadata does not take part in precedence.
struct SemanticVersion {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> preRelease;
    std::vector<std::string> build;

    std::string toString() const;
};

// Accepts surrounding whitespace and a single leading 'v'.
std::optional<SemanticVersion> parseVersion(const std::string &value);

bool isValidVersion(const std::string &value);

// Returns <0, 0 or >0 by semver precedence.
int compareVersions(const SemanticVersion &a, const SemanticVersion &b);

// False when either side is not a valid version.
bool versionLessThan(const std::string &a, const std::string &b);

} // namespace snapforge
