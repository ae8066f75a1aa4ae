#pragma once
#include <atomic>

namespace itemstream {

// Set by SIGINT/SIGTERM once InstallSignalHandlers() ran. Blocking reads
// give up with EINTR when it is set.
extern std::atomic<bool> g_cancel;

// Installed without SA_RESTART so a blocked read() returns on the signal.
void InstallSignalHandlers();

} // namespace itemstream
