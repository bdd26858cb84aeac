#include "common/settings.hpp"

#include <QtGlobal>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

std::optional<std::chrono::seconds> parseStageTimeout(const QString &text)
{
    bool ok = false;
    const qlonglong seconds = text.trimmed().toLongLong(&ok);
    if (!ok || seconds < 0 || seconds > kMaxStageTimeoutSeconds) {
        return std::nullopt;
    }
    return std::chrono::seconds(seconds);
}

BuildSettings BuildSettings::fromEnvironment()
{
    BuildSettings settings;

    const QString workDir = qEnvironmentVariable("SNAPFORGE_WORKDIR");
    if (!workDir.isEmpty()) {
        settings.workDir = workDir;
    }

    const QString docker = qEnvironmentVariable("SNAPFORGE_DOCKER");
    if (!docker.isEmpty()) {
        settings.dockerProgram = docker;
    }

    const QString timeout = qEnvironmentVariable("SNAPFORGE_STAGE_TIMEOUT");
    if (!timeout.isEmpty()) {
        if (const auto seconds = parseStageTimeout(timeout)) {
            settings.stageTimeout = *seconds;
        } else {
            SFLOG_WARN(QStringLiteral("Settings"),
                       QStringLiteral("fromEnvironment"),
                       QStringLiteral("invalid_stage_timeout"),
                       QStringLiteral("env_override"),
                       QStringLiteral("ignored"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"value", timeout.toStdString()}}));
        }
    }

    return settings;
}

} // namespace snapforge
