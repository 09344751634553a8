#include "cancellation.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <algorithm>

bool CancellationToken::cancel() {
    bool expected = false;
    if (!cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }

    // Taking the mutex after the store orders us against any waiter that is
    // between its predicate check and cv_.wait().
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, cb] : subscribers_) {
            callbacks.push_back(cb);
        }
    }
    cv_.notify_all();

    gemindex_log("cancel: token cancelled, running " + std::to_string(callbacks.size()) +
                 " cleanup callback(s)");
    for (const auto& cb : callbacks) {
        if (cb) cb();
    }
    return true;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    if (is_cancelled()) return true;
    if (duration.count() <= 0) return is_cancelled();

    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancelledError();
    }
}

int CancellationToken::subscribe(Callback cb) {
    int id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        if (!is_cancelled()) {
            subscribers_.emplace_back(id, std::move(cb));
            return id;
        }
    }
    // Late subscriber: cancellation already happened
    if (cb) cb();
    return id;
}

void CancellationToken::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        subscribers_.end());
}
