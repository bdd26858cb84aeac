#include "common/semver.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace snapforge {

namespace {

bool isDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

bool isIdentifierChar(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-';
}

bool isNumeric(const std::string &value)
{
    return !value.empty() && std::all_of(value.begin(), value.end(), isDigit);
}

std::optional<std::uint64_t> parseNumber(const std::string &value)
{
    if (!isNumeric(value)) {
        return std::nullopt;
    }
    // No leading zeros on numeric fields.
    if (value.size() > 1 && value.front() == '0') {
        return std::nullopt;
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t result = 0;
    for (char ch : value) {
        const std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (result > (kMax - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

std::vector<std::string> splitDots(const std::string &value)
{
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        const auto dot = value.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool validIdentifiers(const std::vector<std::string> &identifiers, bool rejectLeadingZeros)
{
    for (const auto &id : identifiers) {
        if (id.empty() || !std::all_of(id.begin(), id.end(), isIdentifierChar)) {
            return false;
        }
        if (rejectLeadingZeros && isNumeric(id) && id.size() > 1 && id.front() == '0') {
            return false;
        }
    }
    return true;
}

int compareNumbers(std::uint64_t a, std::uint64_t b)
{
    if (a < b) {
        return -1;
    }
    return a > b ? 1 : 0;
}

int compareIdentifier(const std::string &a, const std::string &b)
{
    const bool aNumeric = isNumeric(a);
    const bool bNumeric = isNumeric(b);
    if (aNumeric && bNumeric) {
        // Lengths first: identifiers are free of leading zeros.
        if (a.size() != b.size()) {
            return a.size() < b.size() ? -1 : 1;
        }
        return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    }
    if (aNumeric) {
        return -1;
    }
    if (bNumeric) {
        return 1;
    }
    const int cmp = a.compare(b);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

} // namespace

std::string SemanticVersion::toString() const
{
    std::string out = std::to_string(major) + "." + std::to_string(minor) + "."
        + std::to_string(patch);
    for (std::size_t i = 0; i < preRelease.size(); ++i) {
        out += (i == 0 ? "-" : ".") + preRelease[i];
    }
    for (std::size_t i = 0; i < build.size(); ++i) {
        out += (i == 0 ? "+" : ".") + build[i];
    }
    return out;
}

std::optional<SemanticVersion> parseVersion(const std::string &value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    if (begin < end && value[begin] == 'v') {
        ++begin;
    }

    std::string text = value.substr(begin, end - begin);
    if (text.empty()) {
        return std::nullopt;
    }

    SemanticVersion version;

    const auto plus = text.find('+');
    if (plus != std::string::npos) {
        version.build = splitDots(text.substr(plus + 1));
        if (!validIdentifiers(version.build, false)) {
            return std::nullopt;
        }
        text.erase(plus);
    }

    const auto dash = text.find('-');
    if (dash != std::string::npos) {
        version.preRelease = splitDots(text.substr(dash + 1));
        if (!validIdentifiers(version.preRelease, true)) {
            return std::nullopt;
        }
        text.erase(dash);
    }

    const std::vector<std::string> core = splitDots(text);
    if (core.size() != 3) {
        return std::nullopt;
    }

    const auto major = parseNumber(core[0]);
    const auto minor = parseNumber(core[1]);
    const auto patch = parseNumber(core[2]);
    if (!major || !minor || !patch) {
        return std::nullopt;
    }

    version.major = *major;
    version.minor = *minor;
    version.patch = *patch;
    return version;
}

bool isValidVersion(const std::string &value)
{
    return parseVersion(value).has_value();
}

int compareVersions(const SemanticVersion &a, const SemanticVersion &b)
{
    if (const int cmp = compareNumbers(a.major, b.major); cmp != 0) {
        return cmp;
    }
    if (const int cmp = compareNumbers(a.minor, b.minor); cmp != 0) {
        return cmp;
    }
    if (const int cmp = compareNumbers(a.patch, b.patch); cmp != 0) {
        return cmp;
    }

    // A release outranks any of its pre-releases.
    if (a.preRelease.empty() || b.preRelease.empty()) {
        if (a.preRelease.empty() && b.preRelease.empty()) {
            return 0;
        }
        return a.preRelease.empty() ? 1 : -1;
    }

    const std::size_t count = std::min(a.preRelease.size(), b.preRelease.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (const int cmp = compareIdentifier(a.preRelease[i], b.preRelease[i]); cmp != 0) {
            return cmp;
        }
    }
    return compareNumbers(a.preRelease.size(), b.preRelease.size());
}

bool versionLessThan(const std::string &a, const std::string &b)
{
    const auto lhs = parseVersion(a);
    const auto rhs = parseVersion(b);
    if (!lhs || !rhs) {
        return false;
    }
    return compareVersions(*lhs, *rhs) < 0;
}

} // namespace snapforge
