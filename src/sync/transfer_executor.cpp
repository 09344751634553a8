#include "transfer_executor.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <thread>

namespace {

TransferResult cancelled_result(const SyncAction& action, int retries = 0) {
    TransferResult r;
    r.action = action;
    r.cancelled = true;
    r.retries = retries;
    return r;
}

TransferResult unreachable_result(const SyncAction& action) {
    TransferResult r;
    r.action = action;
    r.error = RemoteError{RemoteError::Kind::Connection, 0, REMOTE_UNREACHABLE};
    return r;
}

} // namespace

TransferExecutor::TransferExecutor(RemoteStoreClient& client, std::string store, ExecutorOptions options)
    : client_(client), store_(std::move(store)), options_(options) {
    options_.concurrency = std::max(1, options_.concurrency);
    options_.max_attempts = std::max(1, options_.max_attempts);
    options_.connection_failure_threshold = std::max(1, options_.connection_failure_threshold);
}

// ── Circuit breaker ───────────────────────────────────────

void TransferExecutor::note_success() {
    consecutive_connection_failures_.store(0);
}

void TransferExecutor::note_failure(const RemoteError& error) {
    if (error.kind != RemoteError::Kind::Connection) return;

    int n = ++consecutive_connection_failures_;
    if (n >= options_.connection_failure_threshold && !tripped_.exchange(true)) {
        gemindex_log(fmt::format("executor: {} consecutive connection failures, "
                                 "failing remaining actions fast", n));
    }
}

// ── Actions ───────────────────────────────────────────────

TransferResult TransferExecutor::run_upload(const SyncAction& action, const CancellationToken& token) {
    TransferResult result;
    result.action = action;
    const std::string identity = action.identity();

    for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
        if (attempt > 0) {
            if (token.is_cancelled()) return cancelled_result(action, result.retries);
            if (tripped_.load()) break;

            auto delay = backoff_delay(options_.base_delay, attempt);
            gemindex_log(fmt::format("executor: retry {} for {} in {}ms",
                                     attempt, identity, delay.count()));
            if (token.wait_for(delay)) {
                return cancelled_result(action, result.retries);
            }
        }

        if (token.is_cancelled()) return cancelled_result(action, result.retries);
        if (tripped_.load()) {
            if (attempt == 0) return unreachable_result(action);
            break;
        }

        RemoteResult<void> res = RemoteResult<void>::Ok();
        try {
            res = client_.upload_file(store_, *action.local, identity, token);
        } catch (const std::exception& e) {
            res = RemoteResult<void>::Err({RemoteError::Kind::Transient, 0, e.what()});
        }

        if (res.is_ok()) {
            note_success();
            result.success = true;
            result.retries = attempt;
            result.error.reset();
            return result;
        }

        if (res.error.kind == RemoteError::Kind::Cancelled) {
            return cancelled_result(action, result.retries);
        }

        note_failure(res.error);
        result.error = res.error;
        result.retries = attempt + 1;
        gemindex_log(fmt::format("executor: upload {} attempt {}/{} failed ({}): {}",
                                 identity, attempt + 1, options_.max_attempts,
                                 remote_error_kind_name(res.error.kind), res.error.message));

        if (res.error.kind == RemoteError::Kind::Client) break;
    }

    return result;
}

TransferResult TransferExecutor::run_delete(const SyncAction& action, const CancellationToken& token) {
    if (token.is_cancelled()) return cancelled_result(action);
    if (tripped_.load()) return unreachable_result(action);

    TransferResult result;
    result.action = action;
    const std::string name = action.remote ? action.remote->name : std::string();

    RemoteResult<void> res = RemoteResult<void>::Ok();
    try {
        res = client_.delete_file(store_, name, token);
    } catch (const std::exception& e) {
        res = RemoteResult<void>::Err({RemoteError::Kind::Transient, 0, e.what()});
    }

    if (res.is_ok()) {
        note_success();
        result.success = true;
        return result;
    }
    if (res.error.kind == RemoteError::Kind::Cancelled) {
        return cancelled_result(action);
    }

    note_failure(res.error);
    result.error = res.error;
    result.retries = 1;
    gemindex_log(fmt::format("executor: delete {} failed ({}): {}", action.identity(),
                             remote_error_kind_name(res.error.kind), res.error.message));
    return result;
}

// ── Pool ──────────────────────────────────────────────────

void TransferExecutor::report(TransferResult result, const ProgressCallback& on_progress) {
    std::lock_guard<std::mutex> progress_lock(progress_mutex_);

    TransferTotals snapshot;
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        totals_.completed++;
        if (result.success) totals_.succeeded++;
        else if (result.cancelled) totals_.cancelled++;
        else totals_.failed++;
        results_.push_back(std::move(result));
        snapshot = totals_;
    }

    if (on_progress) on_progress(results_.back(), snapshot);
}

std::vector<TransferResult> TransferExecutor::execute(const SyncPlan& plan,
                                                      const CancellationToken& token,
                                                      ProgressCallback on_progress) {
    std::vector<const SyncAction*> queue;
    queue.reserve(plan.uploads.size() + plan.deletes.size());
    for (const auto& a : plan.uploads) queue.push_back(&a);
    for (const auto& a : plan.deletes) queue.push_back(&a);

    results_.clear();
    results_.reserve(queue.size());
    totals_ = TransferTotals{};
    totals_.total = queue.size();
    if (queue.empty()) return {};

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < queue.size(); i = next++) {
            const SyncAction& action = *queue[i];
            TransferResult r;
            if (token.is_cancelled()) {
                r = cancelled_result(action);
            } else if (action.kind == ActionKind::Delete) {
                r = run_delete(action, token);
            } else {
                r = run_upload(action, token);
            }
            report(std::move(r), on_progress);
        }
    };

    size_t width = std::min(queue.size(), static_cast<size_t>(options_.concurrency));
    gemindex_log(fmt::format("executor: {} action(s) on {} worker(s)", queue.size(), width));

    std::vector<std::thread> workers;
    workers.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_;
}
