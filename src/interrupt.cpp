#include "interrupt.h"

#include <csignal>

namespace Interrupt {

namespace {
std::atomic_bool g_cancel{false};

void onSignal(int)
{
    // Async-signal-safe: only flip the flag.
    g_cancel.store(true, std::memory_order_relaxed);
}
}

std::atomic_bool& cancelFlag()
{
    return g_cancel;
}

bool install()
{
    g_cancel.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    return sigaction(SIGINT, &action, nullptr) == 0 && sigaction(SIGTERM, &action, nullptr) == 0;
}

} // namespace Interrupt
