#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

// One cancellation signal per sync invocation. Created by the orchestrator
// and passed by reference into every call that can block or retry.
//
// The flag is set at most once. Subscribers are cleanup callbacks run
// synchronously, in registration order, on the thread that calls cancel().
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Set the flag and run subscribers. Returns false if already cancelled.
    bool cancel();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Interruptible sleep. Returns true if the token is (or becomes) cancelled
    // before the duration elapses.
    bool wait_for(std::chrono::milliseconds duration) const;

    // Throws CancelledError if cancelled.
    void throw_if_cancelled() const;

    // Register a cleanup callback. If the token is already cancelled the
    // callback runs immediately. Returns an id for unsubscribe().
    int subscribe(Callback cb);
    void unsubscribe(int id);

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::pair<int, Callback>> subscribers_;
    int next_id_ = 1;
};
