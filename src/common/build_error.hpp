#pragma once

#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace snapforge {

// Raised by every build step. exitCode is only meaningful for ExecutionFailed.
class BuildError : public std::runtime_error
{
public:
    BuildError(BuildErrorKind kind, const std::string &message);
    BuildError(BuildErrorKind kind, const std::string &message, int exitCode,
               std::string diagnostics);

    BuildErrorKind kind() const { return m_kind; }
    int exitCode() const { return m_exitCode; }
    const std::string &diagnostics() const { return m_diagnostics; }

    // Stage exit status of an operator-requested shutdown (128 + SIGINT).
    static constexpr int kInterruptedExitCode = 130;

    bool isInterruption() const
    {
        return m_kind == BuildErrorKind::ExecutionFailed
            && m_exitCode == kInterruptedExitCode;
    }

private:
    BuildErrorKind m_kind;
    int m_exitCode = 0;
    std::string m_diagnostics;
};

} // namespace snapforge
