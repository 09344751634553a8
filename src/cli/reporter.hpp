#pragma once

#include <chrono>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <sync/transfer_executor.hpp>

struct SyncSummary {
    size_t upload_success = 0;
    size_t upload_failed = 0;
    size_t delete_success = 0;
    size_t delete_failed = 0;
    size_t skipped = 0;
    size_t cancelled = 0;
    std::chrono::milliseconds elapsed{0};

    size_t failures() const { return upload_failed + delete_failed; }
};

// Plan shown before anything is mutated
std::string format_plan(const SyncPlan& plan);

// One line per completed action
std::string format_progress(const TransferResult& result, const TransferTotals& totals);

SyncSummary build_summary(const std::vector<TransferResult>& results,
                          size_t skipped,
                          std::chrono::milliseconds elapsed);

std::string format_summary(const SyncSummary& summary);

// Every failed (not cancelled) action with its error; empty when none failed
std::string format_failures(const std::vector<TransferResult>& results);

// 130 when cancelled, 1 when anything failed, else 0
int exit_code_for(const SyncSummary& summary, bool cancelled);

// Live console output shared by executor workers and the interrupt watcher.
// Each write() lands whole, never inside another line.
class ConsoleWriter {
public:
    explicit ConsoleWriter(std::ostream& out) : out_(out) {}

    void write(const std::string& text);

private:
    std::ostream& out_;
    std::mutex mutex_;
};
