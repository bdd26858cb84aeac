#pragma once

#include <QStringList>

#include "common/enums.hpp"
#include "common/settings.hpp"

namespace snapforge {

class BuildCli
{
public:
    // CLI dispatcher for build and inspect.
    // returns exit code
    int run(int argc, char *argv[]);

    static int exitCodeFor(BuildErrorKind kind);

private:
    int runBuild(const QStringList &args);
    int runInspect(const QStringList &args);

    // Environment defaults overridden by --workdir, --docker, --stage-timeout.
    bool applyOptions(const QStringList &args, BuildSettings &settings) const;
};

} // namespace snapforge
