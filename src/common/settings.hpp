#pragma once

#include <chrono>
#include <optional>

#include <QString>

namespace snapforge {

// Longest stage timeout whose millisecond count still fits std::chrono::milliseconds.
constexpr std::chrono::seconds::rep kMaxStageTimeoutSeconds =
    std::chrono::milliseconds::max().count() / 1000;

// Whole seconds in [0, kMaxStageTimeoutSeconds]; std::nullopt otherwise.
std::optional<std::chrono::seconds> parseStageTimeout(const QString &text);

struct BuildSettings {
    // Working area; emptied at the start of every build.
    QString workDir = QStringLiteral(".snapforge");
    QString dockerProgram = QStringLiteral("docker");

    QString requiredArchitecture = QStringLiteral("riscv64");
    QString labelPrefix = QStringLiteral("io.cartesi.rollups");

    QString defaultToolsetName = QStringLiteral("cartesi/sdk");
    QString minimumToolsetVersion = QStringLiteral("0.9.0");
    QString defaultRamSize = QStringLiteral("128Mi");
    QString defaultDataSize = QStringLiteral("10Mb");

    // Zero means no limit.
    std::chrono::seconds stageTimeout{0};
    bool readWriteInputMount = false;

    QString label(const QString &name) const
    {
        return labelPrefix + QLatin1Char('.') + name;
    }

    // Defaults overlaid with SNAPFORGE_WORKDIR, SNAPFORGE_DOCKER and
    // SNAPFORGE_STAGE_TIMEOUT (seconds).
    static BuildSettings fromEnvironment();
};

} // namespace snapforge
