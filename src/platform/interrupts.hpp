#pragma once

#include <atomic>
#include <thread>
#include <sync/cancellation.hpp>

namespace platform {

// Translates SIGINT / SIGTERM into a cancellation of `token`.
//
// First interrupt: cancel the token (graceful drain). The signal handler only
// bumps a counter; a watcher thread observes it and calls token.cancel(), so
// subscribers never run in signal context.
// Second interrupt: the process exits immediately with code 130.
//
// One instance at a time. Previous handlers are restored on destruction.
class InterruptWatcher {
public:
    explicit InterruptWatcher(CancellationToken& token);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void watch_loop();

    CancellationToken& token_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // namespace platform
