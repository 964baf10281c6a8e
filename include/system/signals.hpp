#pragma once

#include <atomic>

namespace corpus {

// Set by SIGINT/SIGTERM in the coordinating process. The worker pool stops
// starting new packages once it is set and waits for the running ones.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

// Restores default dispositions; called in freshly forked workers.
void ResetSignalHandlers();

} // namespace corpus
