#include "common/build_error.hpp"

#include <utility>

namespace snapforge {

BuildError::BuildError(BuildErrorKind kind, const std::string &message)
    : std::runtime_error(message)
    , m_kind(kind)
{
}

BuildError::BuildError(BuildErrorKind kind, const std::string &message,
                       int exitCode, std::string diagnostics)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_exitCode(exitCode)
    , m_diagnostics(std::move(diagnostics))
{
}

} // namespace snapforge
