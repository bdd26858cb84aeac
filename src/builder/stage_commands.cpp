#include "builder/stage_commands.hpp"

#include <algorithm>
#include <cctype>

#include "builder/sandbox_runner.hpp"

namespace snapforge {

namespace {

bool isShellSafe(char ch)
{
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
        return true;
    }
    switch (ch) {
    case '_':
    case '@':
    case '%':
    case '+':
    case '=':
    case ':':
    case ',':
    case '.':
    case '/':
    case '-':
        return true;
    default:
        return false;
    }
}

std::string joinWords(const std::vector<std::string> &words, const std::string &separator)
{
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += words[i];
    }
    return out;
}

} // namespace

std::string shellQuote(const std::string &argument)
{
    if (!argument.empty() && std::all_of(argument.begin(), argument.end(), isShellSafe)) {
        return argument;
    }

    std::string quoted = "'";
    for (char ch : argument) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}

CommandLine renderPipeline(const CommandPipeline &pipeline)
{
    std::vector<std::string> stages;
    stages.reserve(pipeline.processes.size());
    for (const auto &process : pipeline.processes) {
        std::vector<std::string> words;
        words.reserve(process.size());
        for (const auto &arg : process) {
            words.push_back(shellQuote(arg));
        }
        stages.push_back(joinWords(words, " "));
    }

    return {"/usr/bin/env", "bash", "-o", "pipefail", "-c", joinWords(stages, " | ")};
}

CommandPipeline rootfsExportPipeline()
{
    CommandPipeline pipeline;
    pipeline.processes = {
        {"cat", SandboxRunner::kInputMountPath},
        // OCI image from stdin, rootfs tarball to stdout.
        {"crane", "export", "-", "-"},
        {"bsdtar", "-cf", SandboxRunner::kOutputPath, "--format=gnutar", "@/dev/stdin"},
    };
    return pipeline;
}

CommandLine createRootfsTarCommand()
{
    return renderPipeline(rootfsExportPipeline());
}

CommandLine createExt2Command(std::uint64_t extraBytes)
{
    const std::uint64_t extraBlocks = extraBytes / kFilesystemBlockSize
        + (extraBytes % kFilesystemBlockSize != 0 ? 1 : 0);

    return {
        "xgenext2fs",
        "--tarball", SandboxRunner::kInputMountPath,
        "--block-size", std::to_string(kFilesystemBlockSize),
        "--faketime",
        "-r", "+" + std::to_string(extraBlocks),
        SandboxRunner::kOutputPath,
    };
}

std::string bootCommand(const ImageConfiguration &config)
{
    std::vector<std::string> words = config.entrypoint;
    words.insert(words.end(), config.command.begin(), config.command.end());
    return joinWords(words, " ");
}

CommandLine createMachineSnapshotCommand(const ImageConfiguration &config)
{
    CommandLine command = {
        "create_machine_snapshot",
        "--ram-length=" + config.ramSize,
        std::string("--drive-label=") + kSnapshotDriveLabel,
        std::string("--drive-filename=") + SandboxRunner::kInputMountPath,
        std::string("--output=") + SandboxRunner::kOutputPath,
    };

    if (config.workingDirectory && !config.workingDirectory->empty()) {
        command.push_back("--workdir=" + *config.workingDirectory);
    }

    for (const auto &variable : config.environmentVariables) {
        command.push_back("--env=" + variable);
    }

    command.push_back("--entrypoint=" + bootCommand(config));
    return command;
}

} // namespace snapforge
