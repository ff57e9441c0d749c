// signals.cpp - Termination signal handling and forwarding to the active collaborator.

#include "system/signals.hpp"

#include <csignal>

namespace repack {

std::atomic_int g_pending_signal{0};

namespace {
std::atomic<pid_t> g_forward_pid{0};
} // namespace

static void HandleSignal(int sig) {
    g_pending_signal.store(sig, std::memory_order_relaxed);
    const pid_t pid = g_forward_pid.load(std::memory_order_relaxed);
    if (pid > 0) {
        ::kill(pid, sig);
    }
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleSignal);
    std::signal(SIGQUIT, HandleSignal);
}

bool CancelRequested() {
    return g_pending_signal.load(std::memory_order_relaxed) != 0;
}

int PendingSignal() {
    return g_pending_signal.load(std::memory_order_relaxed);
}

void ClearPendingSignal() {
    g_pending_signal.store(0, std::memory_order_relaxed);
}

void SetForwardTarget(pid_t pid) {
    g_forward_pid.store(pid, std::memory_order_relaxed);
}

} // namespace repack
