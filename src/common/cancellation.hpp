#pragma once

namespace snapforge {

// Process-wide cancellation flag, set from SIGINT/SIGTERM.
void requestCancellation();
bool isCancellationRequested();
void resetCancellation();

// Routes SIGINT and SIGTERM to requestCancellation() so in-flight
// containers are torn down before the process exits.
void installCancellationHandlers();

} // namespace snapforge
