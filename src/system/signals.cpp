// signals.cpp - Batch cancellation on SIGINT/SIGTERM.

#include "system/signals.hpp"

#include <csignal>

namespace corpus {

std::atomic_bool g_cancel{false};

namespace {

void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void SetDisposition(void (*handler)(int)) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: the coordinator's poll() must wake up and notice.
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

void InstallSignalHandlers() {
    SetDisposition(HandleSignal);
}

void ResetSignalHandlers() {
    SetDisposition(SIG_DFL);
}

} // namespace corpus
