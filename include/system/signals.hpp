#pragma once

#include <atomic>
#include <sys/types.h>

namespace repack {

// Last termination signal received, 0 if none.
extern std::atomic_int g_pending_signal;

// SIGINT, SIGTERM, SIGHUP, SIGQUIT: record the signal and forward it to the
// registered child process, if any. The process keeps running so the caller
// can unwind and clean up.
void InstallSignalHandlers();

bool CancelRequested();
int PendingSignal();
void ClearPendingSignal();

// Child pid that receives forwarded signals; 0 clears it.
void SetForwardTarget(pid_t pid);

} // namespace repack
