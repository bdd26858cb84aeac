#include "common/cancellation.hpp"

#include <atomic>
#include <signal.h>

namespace snapforge {

namespace {

std::atomic<bool> g_cancelRequested{false};

void onTerminationSignal(int)
{
    g_cancelRequested.store(true);
}

} // namespace

void requestCancellation()
{
    g_cancelRequested.store(true);
}

bool isCancellationRequested()
{
    return g_cancelRequested.load();
}

void resetCancellation()
{
    g_cancelRequested.store(false);
}

void installCancellationHandlers()
{
    struct sigaction action {};
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

} // namespace snapforge
