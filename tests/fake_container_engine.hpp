#pragma once

#include <QByteArray>
#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include <chrono>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "builder/container_engine.hpp"
#include "common/build_error.hpp"

namespace snapforge::testing {

inline QByteArray readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

inline bool writeAll(const QString &path, const QByteArray &data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

// In-memory image store; save() writes a small deterministic archive.
class FakeImageStore : public ImageStore
{
public:
    ImageMetadata metadata;
    int inspectCalls = 0;
    int saveCalls = 0;
    std::vector<std::string> savedPaths;

    ImageMetadata inspect(const std::string &) override
    {
        ++inspectCalls;
        return metadata;
    }

    void save(const std::string &imageRef, const std::string &destPath) override
    {
        ++saveCalls;
        savedPaths.push_back(destPath);
        if (!writeAll(QString::fromStdString(destPath),
                      QByteArray("oci-archive:") + QByteArray::fromStdString(imageRef))) {
            throw BuildError(BuildErrorKind::ExecutionFailed, "fake save failed", 1, "");
        }
    }
};

/**
 * Container engine that "runs" stage tools by deriving the output artifact
 * from the mounted input. Failures can be injected per tool, keyed by the
 * tool name (first argument; "bash" for rendered pipelines).
 */
class FakeContainerEngine : public ContainerEngine
{
public:
    struct Container {
        std::string image;
        CommandLine command;
        MountSpec mount;
        bool inputExisted = false;
        bool started = false;
        bool stopped = false;
        bool removed = false;
        std::chrono::milliseconds timeout{0};
    };

    std::map<std::string, Container> containers;
    std::vector<std::string> calls;

    std::map<std::string, int> exitCodes;
    std::set<std::string> timeouts;
    std::set<std::string> copyFailures;
    std::set<std::string> partialCopies;
    bool failStop = false;
    bool failRemove = false;

    static std::string toolOf(const CommandLine &command)
    {
        if (command.empty()) {
            return {};
        }
        if (command.front() == "/usr/bin/env" && command.size() > 1) {
            return command[1];
        }
        return command.front();
    }

    std::vector<std::string> toolsRun() const
    {
        std::vector<std::string> tools;
        for (const auto &entry : containers) {
            tools.push_back(toolOf(entry.second.command));
        }
        return tools;
    }

    bool allTornDown() const
    {
        for (const auto &entry : containers) {
            if (!entry.second.stopped || !entry.second.removed) {
                return false;
            }
        }
        return true;
    }

    std::string create(const std::string &image,
                       const CommandLine &command,
                       const MountSpec &mount) override
    {
        const std::string id = "container-" + std::to_string(containers.size() + 1);
        calls.push_back("create");

        Container container;
        container.image = image;
        container.command = command;
        container.mount = mount;
        container.inputExisted = QFileInfo::exists(QString::fromStdString(mount.hostPath));
        containers[id] = container;
        return id;
    }

    ContainerExit start(const std::string &containerId,
                        std::chrono::milliseconds timeout) override
    {
        calls.push_back("start");
        Container &container = containers.at(containerId);
        container.started = true;
        container.timeout = timeout;

        const std::string tool = toolOf(container.command);
        if (timeouts.count(tool) > 0) {
            throw BuildError(BuildErrorKind::ExecutionTimedOut, "fake timeout", -1, "");
        }
        const auto it = exitCodes.find(tool);
        if (it != exitCodes.end()) {
            return ContainerExit{it->second, tool + ": injected failure"};
        }
        return ContainerExit{0, tool + ": ok"};
    }

    void copyOut(const std::string &containerId,
                 const std::string &,
                 const std::string &hostPath) override
    {
        calls.push_back("copyOut");
        const Container &container = containers.at(containerId);
        const std::string tool = toolOf(container.command);
        const QString output = QString::fromStdString(hostPath);

        if (copyFailures.count(tool) > 0) {
            throw BuildError(BuildErrorKind::ArtifactCopyFailed, "fake copy failure");
        }

        const QByteArray input = readAll(QString::fromStdString(container.mount.hostPath));
        QByteArray produced = QByteArray::fromStdString(tool) + "(" + input + ")";
        for (const auto &arg : container.command) {
            produced += " " + QByteArray::fromStdString(arg);
        }

        if (tool == "create_machine_snapshot") {
            QDir().mkpath(output);
            writeAll(output + "/config", produced);
            writeAll(output + "/hash",
                     QCryptographicHash::hash(produced, QCryptographicHash::Sha256));
        } else {
            writeAll(output, produced);
        }

        if (partialCopies.count(tool) > 0) {
            throw BuildError(BuildErrorKind::ArtifactCopyFailed, "fake partial copy");
        }
    }

    void stop(const std::string &containerId) override
    {
        calls.push_back("stop");
        containers.at(containerId).stopped = true;
        if (failStop) {
            throw BuildError(BuildErrorKind::ExecutionFailed, "fake stop failure", 1, "");
        }
    }

    void remove(const std::string &containerId) override
    {
        calls.push_back("remove");
        containers.at(containerId).removed = true;
        if (failRemove) {
            throw BuildError(BuildErrorKind::ExecutionFailed, "fake remove failure", 1, "");
        }
    }
};

// True when fn throws a BuildError of the given kind.
inline bool throwsBuildError(const std::function<void()> &fn, BuildErrorKind kind)
{
    try {
        fn();
    } catch (const BuildError &error) {
        return error.kind() == kind;
    }
    return false;
}

inline ImageMetadata minimalRiscvImage()
{
    ImageMetadata metadata;
    metadata.id = "sha256:1111";
    metadata.architecture = "riscv64";
    metadata.entrypoint = {"/usr/local/bin/app"};
    metadata.env = {"PATH=/usr/local/bin:/usr/bin:/bin"};
    return metadata;
}

} // namespace snapforge::testing
