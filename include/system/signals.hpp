#pragma once

#include <atomic>

namespace rehash {

// Set by the first SIGINT/SIGTERM once InstallSignalHandlers() ran.
extern std::atomic_bool g_cancel;

// The first signal only requests a stop so the run can save its session.
// A second one gets the default action and terminates the process.
// Returns false (errno set) if a handler could not be installed.
bool InstallSignalHandlers();

} // namespace rehash
