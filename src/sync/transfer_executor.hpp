#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <remote/remote_store.hpp>
#include "cancellation.hpp"

struct ExecutorOptions {
    int concurrency = DEFAULT_CONCURRENCY;
    int max_attempts = DEFAULT_MAX_ATTEMPTS;              // per upload, first try included
    std::chrono::milliseconds base_delay{DEFAULT_RETRY_BASE_DELAY_MS};
    int connection_failure_threshold = DEFAULT_CONNECTION_FAILURES;
};

// Outcome of one upload or delete. Never modified once reported.
struct TransferResult {
    SyncAction action;
    bool success = false;
    std::optional<RemoteError> error;
    int retries = 0;          // failed attempts
    bool cancelled = false;   // not a failure

    bool failed() const { return !success && !cancelled; }
    std::string error_message() const { return error ? error->message : std::string(); }
};

// Running counts handed to the progress callback
struct TransferTotals {
    size_t total = 0;
    size_t completed = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t cancelled = 0;
};

using ProgressCallback = std::function<void(const TransferResult&, const TransferTotals&)>;

// Message for actions failed fast once the breaker has tripped
constexpr const char* REMOTE_UNREACHABLE = "remote store unreachable";

// Runs a plan's uploads and deletes against the remote store on a bounded
// worker pool. Uploads are queued ahead of deletes; completion order is
// arbitrary.
//
// Uploads retry with exponential backoff until max_attempts is spent; client
// errors fail at once. Deletes get a single attempt. After
// connection_failure_threshold consecutive connection failures (any success
// resets the count) nothing new contacts the remote: in-flight uploads stop
// retrying and unstarted actions fail with REMOTE_UNREACHABLE.
//
// Once the token is cancelled, unstarted actions are recorded as cancelled,
// a pending backoff wakes up, and in-flight transfers are aborted by the
// client.
class TransferExecutor {
public:
    TransferExecutor(RemoteStoreClient& client, std::string store, ExecutorOptions options = {});

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    // Blocks until every action has a result. One executor per run.
    std::vector<TransferResult> execute(const SyncPlan& plan,
                                        const CancellationToken& token,
                                        ProgressCallback on_progress = nullptr);

    bool breaker_tripped() const { return tripped_.load(); }

private:
    TransferResult run_upload(const SyncAction& action, const CancellationToken& token);
    TransferResult run_delete(const SyncAction& action, const CancellationToken& token);

    // Circuit breaker bookkeeping for one remote call
    void note_success();
    void note_failure(const RemoteError& error);

    void report(TransferResult result, const ProgressCallback& on_progress);

    RemoteStoreClient& client_;
    std::string store_;
    ExecutorOptions options_;

    std::atomic<int> consecutive_connection_failures_{0};
    std::atomic<bool> tripped_{false};

    std::mutex progress_mutex_;   // serializes the progress callback
    std::mutex results_mutex_;    // guards results_ and totals_
    std::vector<TransferResult> results_;
    TransferTotals totals_;
};
