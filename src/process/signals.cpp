#include <pgtemp/process/signals.h>

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstring>

#include <pthread.h>
#include <signal.h>

namespace pgtemp::process {

namespace {

volatile sig_atomic_t g_signal = 0;
volatile sig_atomic_t g_forward_pid = 0;

constexpr int kShutdownSignals[] = {SIGINT, SIGTERM, SIGQUIT};

void on_shutdown_signal(int signo) {
    if (g_signal == 0) {
        g_signal = signo;
    }
    if (signo == SIGTERM && g_forward_pid > 0) {
        ::kill(static_cast<pid_t>(g_forward_pid), SIGTERM);
    }
}

void set_handler(void (*handler)(int)) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    for (int signo : kShutdownSignals) {
        if (::sigaction(signo, &sa, nullptr) == -1) {
            spdlog::warn("Failed to install handler for signal {}", signo);
        }
    }
}

} // namespace

void installShutdownHandlers() {
    set_handler(on_shutdown_signal);
}

void restoreDefaultHandlers() {
    set_handler(SIG_DFL);
}

int shutdownSignal() noexcept {
    return g_signal;
}

void resetShutdownSignal() noexcept {
    g_signal = 0;
}

void forwardTerminationTo(pid_t pid) noexcept {
    g_forward_pid = pid;
}

int waitForShutdown() {
    sigset_t block;
    sigset_t previous;
    sigemptyset(&block);
    for (int signo : kShutdownSignals) {
        sigaddset(&block, signo);
    }
    // Checking the flag with the signals blocked closes the race with sigsuspend
    pthread_sigmask(SIG_BLOCK, &block, &previous);
    while (g_signal == 0) {
        sigset_t waitMask = previous;
        for (int signo : kShutdownSignals) {
            sigdelset(&waitMask, signo);
        }
        ::sigsuspend(&waitMask);
    }
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    return g_signal;
}

} // namespace pgtemp::process
