#pragma once
#include <atomic>

// SIGINT/SIGTERM turn into a cancel request that the scheduler polls.
namespace Interrupt {

// Flag raised by the signal handler.
std::atomic_bool& cancelFlag();

// Installs the handlers. Returns false if sigaction failed.
bool install();

} // namespace Interrupt
