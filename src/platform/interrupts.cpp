#include "interrupts.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <csignal>
#include <cstdlib>

#ifndef _WIN32
#  include <signal.h>
#  include <unistd.h>
#endif

namespace platform {

static volatile std::sig_atomic_t g_interrupt_count = 0;

#ifdef _WIN32

using HandlerFn = void (*)(int);
static HandlerFn g_old_int = SIG_DFL;
static HandlerFn g_old_term = SIG_DFL;

static void interrupt_handler(int) {
    g_interrupt_count = g_interrupt_count + 1;
    if (g_interrupt_count >= 2) {
        std::_Exit(EXIT_CODE_CANCELLED);
    }
    // MSVC resets the handler after each delivery
    std::signal(SIGINT, interrupt_handler);
    std::signal(SIGTERM, interrupt_handler);
}

static void install_handlers() {
    g_old_int = std::signal(SIGINT, interrupt_handler);
    g_old_term = std::signal(SIGTERM, interrupt_handler);
}

static void restore_handlers() {
    std::signal(SIGINT, g_old_int);
    std::signal(SIGTERM, g_old_term);
}

#else

static struct sigaction g_old_int;
static struct sigaction g_old_term;

static void interrupt_handler(int) {
    g_interrupt_count = g_interrupt_count + 1;
    if (g_interrupt_count >= 2) {
        // Second Ctrl+C: the user wants out now
        static const char msg[] = "\nForce quit.\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(EXIT_CODE_CANCELLED);
    }
}

static void install_handlers() {
    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);
}

static void restore_handlers() {
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
}

#endif

InterruptWatcher::InterruptWatcher(CancellationToken& token)
    : token_(token) {
    g_interrupt_count = 0;
    install_handlers();
    thread_ = std::thread(&InterruptWatcher::watch_loop, this);
}

InterruptWatcher::~InterruptWatcher() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();
    restore_handlers();
}

void InterruptWatcher::watch_loop() {
    while (!stop_.load()) {
        if (g_interrupt_count > 0 && !token_.is_cancelled()) {
            gemindex_log("interrupt: signal received, cancelling run");
            token_.cancel();
        }
        sleep_ms(INTERRUPT_POLL_MS);
    }
}

} // namespace platform
