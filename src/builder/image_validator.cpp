#include "builder/image_validator.hpp"

#include <QDebug>

#include <optional>

#include "common/build_error.hpp"
#include "common/byte_size.hpp"
#include "common/logging.hpp"
#include "common/semver.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

namespace {

std::optional<std::string> labelValue(const ImageMetadata &metadata,
                                      const BuildSettings &settings,
                                      const QString &name)
{
    const auto it = metadata.labels.find(settings.label(name).toStdString());
    if (it == metadata.labels.end()) {
        return std::nullopt;
    }
    return it->second;
}

void warnDefaulted(const BuildSettings &settings, const QString &name, const QString &fallback)
{
    const QString label = settings.label(name);
    qWarning().noquote() << "Undefined" << label << "label, defaulting to" << fallback;
    SFLOG_WARN(QStringLiteral("ImageValidator"),
               QStringLiteral("validateImageMetadata"),
               QStringLiteral("label_defaulted"),
               QStringLiteral("label_missing"),
               QStringLiteral("default_value"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"label", label.toStdString()},
                               {"default", fallback.toStdString()}}));
}

} // namespace

ImageConfiguration validateImageMetadata(const std::string &imageRef,
                                         const ImageMetadata &metadata,
                                         const BuildSettings &settings)
{
    const std::string requiredArch = settings.requiredArchitecture.toStdString();
    if (metadata.architecture != requiredArch) {
        throw BuildError(BuildErrorKind::UnsupportedArchitecture,
                         "Invalid image Architecture: " + metadata.architecture
                             + ". Expected " + requiredArch);
    }

    if (metadata.entrypoint.empty() && metadata.cmd.empty()) {
        throw BuildError(BuildErrorKind::MissingBootCommand,
                         "Undefined image ENTRYPOINT or CMD");
    }

    ImageConfiguration config;
    config.imageRef = imageRef;
    config.imageId = metadata.id;
    config.architecture = metadata.architecture;
    config.entrypoint = metadata.entrypoint;
    config.command = metadata.cmd;
    config.environmentVariables = metadata.env;
    if (!metadata.workingDir.empty()) {
        config.workingDirectory = metadata.workingDir;
    }

    const auto ramSize = labelValue(metadata, settings, QStringLiteral("ram_size"));
    const auto dataSize = labelValue(metadata, settings, QStringLiteral("data_size"));
    const auto toolsetName = labelValue(metadata, settings, QStringLiteral("sdk_name"));
    const auto toolsetVersion = labelValue(metadata, settings, QStringLiteral("sdk_version"));

    config.ramSize = ramSize.value_or(settings.defaultRamSize.toStdString());
    config.dataPartitionSize = dataSize.value_or(settings.defaultDataSize.toStdString());
    config.toolsetName = toolsetName.value_or(settings.defaultToolsetName.toStdString());
    config.toolsetVersion =
        toolsetVersion.value_or(settings.minimumToolsetVersion.toStdString());

    const std::string minimumVersion = settings.minimumToolsetVersion.toStdString();
    if (!isValidVersion(config.toolsetVersion)) {
        // Kept as a warning; the literal label still names the toolset image.
        qWarning().noquote() << "sdk version is not a valid semver:"
                             << QString::fromStdString(config.toolsetVersion);
        SFLOG_WARN(QStringLiteral("ImageValidator"),
                   QStringLiteral("validateImageMetadata"),
                   QStringLiteral("toolset_version_invalid"),
                   QStringLiteral("not_semver"),
                   QStringLiteral("literal_reference"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"version", config.toolsetVersion}}));
    } else if (config.toolsetName == settings.defaultToolsetName.toStdString()
               && versionLessThan(config.toolsetVersion, minimumVersion)) {
        throw BuildError(BuildErrorKind::UnsupportedToolsetVersion,
                         "Unsupported sdk version: " + config.toolsetVersion
                             + " (used) < " + minimumVersion + " (minimum).");
    }

    if (!toolsetVersion) {
        warnDefaulted(settings, QStringLiteral("sdk_version"), settings.minimumToolsetVersion);
    }
    if (!ramSize) {
        warnDefaulted(settings, QStringLiteral("ram_size"), settings.defaultRamSize);
    }

    const auto dataBytes = parseByteSize(config.dataPartitionSize);
    if (!dataBytes) {
        throw BuildError(BuildErrorKind::InvalidSizeValue,
                         "Invalid " + settings.label(QStringLiteral("data_size")).toStdString()
                             + " value: " + config.dataPartitionSize);
    }
    config.dataPartitionBytes = *dataBytes;

    if (!parseByteSize(config.ramSize)) {
        throw BuildError(BuildErrorKind::InvalidSizeValue,
                         "Invalid " + settings.label(QStringLiteral("ram_size")).toStdString()
                             + " value: " + config.ramSize);
    }

    return config;
}

ImageConfiguration inspectAndValidate(ImageStore &store,
                                      const std::string &imageRef,
                                      const BuildSettings &settings)
{
    const ImageMetadata metadata = store.inspect(imageRef);
    ImageConfiguration config = validateImageMetadata(imageRef, metadata, settings);

    SFLOG_INFO(QStringLiteral("ImageValidator"),
               QStringLiteral("inspectAndValidate"),
               QStringLiteral("image_validated"),
               QStringLiteral("pipeline_validation"),
               QStringLiteral("image_inspect"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"image", imageRef},
                               {"imageId", config.imageId},
                               {"toolset", config.toolsetImage()},
                               {"ramSize", config.ramSize},
                               {"dataBytes", config.dataPartitionBytes}}));
    return config;
}

} // namespace snapforge
