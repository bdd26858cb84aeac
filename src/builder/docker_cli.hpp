#pragma once

#include <functional>
#include <string>

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "builder/container_engine.hpp"

namespace snapforge {

// ImageStore and ContainerEngine backed by the docker command-line client.
class DockerCli : public ImageStore, public ContainerEngine
{
public:
    explicit DockerCli(QString program = QStringLiteral("docker"));

    ImageMetadata inspect(const std::string &imageRef) override;
    void save(const std::string &imageRef, const std::string &destPath) override;

    std::string create(const std::string &image,
                       const CommandLine &command,
                       const MountSpec &mount) override;
    ContainerExit start(const std::string &containerId,
                        std::chrono::milliseconds timeout) override;
    void copyOut(const std::string &containerId,
                 const std::string &containerPath,
                 const std::string &hostPath) override;
    void stop(const std::string &containerId) override;
    void remove(const std::string &containerId) override;

    // Where attached container output goes; stderr by default.
    void setOutputSink(std::function<void(const QByteArray &)> sink);

    // Parses `docker image inspect` output (a JSON array with one element).
    static ImageMetadata parseInspectOutput(const std::string &json);

    static QStringList createArguments(const std::string &image,
                                       const CommandLine &command,
                                       const MountSpec &mount);

private:
    QString m_program;
    std::function<void(const QByteArray &)> m_outputSink;
};

} // namespace snapforge
