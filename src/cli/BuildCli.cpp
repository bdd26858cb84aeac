#include "cli/BuildCli.hpp"

#include <chrono>
#include <iostream>

#include "builder/build_pipeline.hpp"
#include "builder/docker_cli.hpp"
#include "builder/image_validator.hpp"
#include "common/build_error.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/snapforge_version.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

namespace {

constexpr int kUsageExitCode = 2;
constexpr int kErrorExitCodeBase = 10;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  snapforge build IMAGE [--workdir DIR] [--docker PATH] [--stage-timeout SECONDS]\n"
        "  snapforge inspect IMAGE [--docker PATH]\n"
        "  snapforge version\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// First argument after the subcommand that is neither an option nor its value.
QString positionalImage(const QStringList &args)
{
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg.startsWith(QStringLiteral("--"))) {
            ++i;
            continue;
        }
        return arg;
    }
    return {};
}

int reportError(const BuildError &error)
{
    std::cerr << "snapforge: " << error.what() << std::endl;
    if (error.kind() == BuildErrorKind::ExecutionFailed && !error.diagnostics().empty()) {
        std::cerr << error.diagnostics() << std::endl;
    }
    return BuildCli::exitCodeFor(error.kind());
}

} // namespace

int BuildCli::exitCodeFor(BuildErrorKind kind)
{
    return kErrorExitCodeBase + static_cast<int>(kind);
}

int BuildCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kUsageExitCode;
    }

    const QString command = args.at(1);
    SFLOG_INFO(QStringLiteral("BuildCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    if (command == QStringLiteral("build")) {
        return runBuild(args);
    }
    if (command == QStringLiteral("inspect")) {
        return runInspect(args);
    }
    if (command == QStringLiteral("version")) {
        std::cout << SNAPFORGE_VERSION << std::endl;
        return 0;
    }

    std::cerr << usageText().toStdString();
    return kUsageExitCode;
}

bool BuildCli::applyOptions(const QStringList &args, BuildSettings &settings) const
{
    const QString workDir = getArgValue(args, QStringLiteral("--workdir"));
    if (!workDir.isEmpty()) {
        settings.workDir = workDir;
    }

    const QString docker = getArgValue(args, QStringLiteral("--docker"));
    if (!docker.isEmpty()) {
        settings.dockerProgram = docker;
    }

    if (args.contains(QStringLiteral("--stage-timeout"))) {
        const auto seconds =
            parseStageTimeout(getArgValue(args, QStringLiteral("--stage-timeout")));
        if (!seconds) {
            std::cerr << "Invalid --stage-timeout. Use a number of seconds up to "
                      << kMaxStageTimeoutSeconds << "." << std::endl;
            return false;
        }
        settings.stageTimeout = *seconds;
    }

    return true;
}

int BuildCli::runBuild(const QStringList &args)
{
    const QString image = positionalImage(args);
    if (image.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kUsageExitCode;
    }

    BuildSettings settings = BuildSettings::fromEnvironment();
    if (!applyOptions(args, settings)) {
        return kUsageExitCode;
    }

    DockerCli docker(settings.dockerProgram);
    BuildPipeline pipeline(docker, docker, settings);

    try {
        const BuildOutcome outcome = pipeline.run(image.toStdString());
        if (outcome.stage == BuildStage::Interrupted) {
            std::cerr << "snapforge: build interrupted" << std::endl;
            return 0;
        }
        std::cout << outcome.snapshotPath << std::endl;
        if (outcome.snapshotHash) {
            std::cout << *outcome.snapshotHash << std::endl;
        }
        return 0;
    } catch (const BuildError &error) {
        return reportError(error);
    }
}

int BuildCli::runInspect(const QStringList &args)
{
    const QString image = positionalImage(args);
    if (image.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kUsageExitCode;
    }

    BuildSettings settings = BuildSettings::fromEnvironment();
    if (!applyOptions(args, settings)) {
        return kUsageExitCode;
    }

    DockerCli docker(settings.dockerProgram);
    try {
        const ImageConfiguration config =
            inspectAndValidate(docker, image.toStdString(), settings);
        std::cout << nlohmann::json(config).dump(2) << std::endl;
        return 0;
    } catch (const BuildError &error) {
        return reportError(error);
    }
}

} // namespace snapforge
