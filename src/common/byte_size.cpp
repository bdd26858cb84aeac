#include "common/byte_size.hpp"

#include <array>
#include <cctype>
#include <limits>
#include <utility>

namespace snapforge {

namespace {

constexpr std::uint64_t kKi = 1ULL << 10;
constexpr std::uint64_t kMi = 1ULL << 20;
constexpr std::uint64_t kGi = 1ULL << 30;
constexpr std::uint64_t kTi = 1ULL << 40;
constexpr std::uint64_t kPi = 1ULL << 50;

// Fraction digits beyond this are truncated; keeps the arithmetic in 64 bits.
constexpr std::size_t kMaxFractionDigits = 9;

std::optional<std::uint64_t> unitMultiplier(const std::string &unit)
{
    static const std::array<std::pair<const char *, std::uint64_t>, 21> kUnits = {{
        {"", 1},
        {"b", 1},
        {"B", 1},
        {"k", 1000ULL},
        {"K", 1000ULL},
        {"M", 1000ULL * 1000},
        {"G", 1000ULL * 1000 * 1000},
        {"T", 1000ULL * 1000 * 1000 * 1000},
        {"P", 1000ULL * 1000 * 1000 * 1000 * 1000},
        {"Ki", kKi},
        {"ki", kKi},
        {"Mi", kMi},
        {"Gi", kGi},
        {"Ti", kTi},
        {"Pi", kPi},
        {"KiB", kKi},
        {"kiB", kKi},
        {"MiB", kMi},
        {"GiB", kGi},
        {"TiB", kTi},
        {"PiB", kPi},
    }};

    for (const auto &entry : kUnits) {
        if (unit == entry.first) {
            return entry.second;
        }
    }

    // "kb", "MB", "Gb", ...: binary regardless of case.
    if (unit.size() == 2 && (unit[1] == 'b' || unit[1] == 'B')) {
        switch (std::tolower(static_cast<unsigned char>(unit[0]))) {
        case 'k':
            return kKi;
        case 'm':
            return kMi;
        case 'g':
            return kGi;
        case 't':
            return kTi;
        case 'p':
            return kPi;
        default:
            break;
        }
    }

    return std::nullopt;
}

bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool isDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

} // namespace

std::optional<std::uint64_t> parseByteSize(const std::string &value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && isSpace(value[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(value[end - 1])) {
        --end;
    }

    std::size_t pos = begin;
    if (pos >= end || !isDigit(value[pos])) {
        return std::nullopt;
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

    std::uint64_t whole = 0;
    while (pos < end && isDigit(value[pos])) {
        const std::uint64_t digit = static_cast<std::uint64_t>(value[pos] - '0');
        if (whole > (kMax - digit) / 10) {
            return std::nullopt;
        }
        whole = whole * 10 + digit;
        ++pos;
    }

    std::uint64_t fraction = 0;
    std::uint64_t fractionScale = 1;
    if (pos < end && value[pos] == '.') {
        ++pos;
        if (pos >= end || !isDigit(value[pos])) {
            return std::nullopt;
        }
        std::size_t digits = 0;
        while (pos < end && isDigit(value[pos])) {
            if (digits < kMaxFractionDigits) {
                fraction = fraction * 10 + static_cast<std::uint64_t>(value[pos] - '0');
                fractionScale *= 10;
                ++digits;
            }
            ++pos;
        }
    }

    while (pos < end && isSpace(value[pos])) {
        ++pos;
    }

    const auto multiplier = unitMultiplier(value.substr(pos, end - pos));
    if (!multiplier) {
        return std::nullopt;
    }

    if (whole != 0 && whole > kMax / *multiplier) {
        return std::nullopt;
    }
    const std::uint64_t wholeBytes = whole * *multiplier;

    // floor(fraction * multiplier / fractionScale) without 128-bit math.
    const std::uint64_t quotient = *multiplier / fractionScale;
    const std::uint64_t remainder = *multiplier % fractionScale;
    const std::uint64_t fractionBytes =
        fraction * quotient + (fraction * remainder) / fractionScale;

    if (wholeBytes > kMax - fractionBytes) {
        return std::nullopt;
    }
    return wholeBytes + fractionBytes;
}

std::string formatByteSize(std::uint64_t bytes)
{
    static const std::array<std::pair<std::uint64_t, const char *>, 5> kBinaryUnits = {{
        {kPi, "Pi"},
        {kTi, "Ti"},
        {kGi, "Gi"},
        {kMi, "Mi"},
        {kKi, "Ki"},
    }};

    if (bytes == 0) {
        return "0";
    }

    for (const auto &unit : kBinaryUnits) {
        if (bytes % unit.first == 0) {
            return std::to_string(bytes / unit.first) + unit.second;
        }
    }
    return std::to_string(bytes);
}

} // namespace snapforge
