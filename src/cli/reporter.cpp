#include "reporter.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

std::string format_plan(const SyncPlan& plan) {
    std::string out = theme::section("Sync Plan");

    if (!plan.uploads.empty()) {
        out += "  " + theme::green(fmt::format("{} file(s) to upload:", plan.uploads.size())) + "\n";
        for (const auto& a : plan.uploads) {
            out += fmt::format("    {} {} ({})\n", theme::green("+"), a.identity(), a.reason);
        }
    }

    if (!plan.deletes.empty()) {
        out += "  " + theme::red(fmt::format("{} file(s) to delete:", plan.deletes.size())) + "\n";
        for (const auto& a : plan.deletes) {
            out += fmt::format("    {} {} ({})\n", theme::red("-"), a.identity(), a.reason);
        }
    }

    if (!plan.skips.empty()) {
        out += "  " + theme::dim(fmt::format("{} file(s) unchanged (skipped)", plan.skips.size())) + "\n";
    }

    if (!plan.has_work()) {
        out += "  " + theme::dim("No changes detected.") + "\n";
    }

    return out;
}

std::string format_progress(const TransferResult& result, const TransferTotals& totals) {
    bool is_delete = result.action.kind == ActionKind::Delete;
    std::string counter = theme::dim(fmt::format("({}/{})", totals.completed, totals.total));
    std::string id = result.action.identity();

    if (result.cancelled) {
        return theme::info(fmt::format("Cancelled {} {}", id, counter));
    }

    if (result.success) {
        std::string line = fmt::format("{} {} {}", is_delete ? "Deleted" : "Uploaded", id, counter);
        if (result.retries > 0) {
            line += theme::dim(fmt::format(" after {} retr{}", result.retries,
                                           result.retries == 1 ? "y" : "ies"));
        }
        return theme::ok(line);
    }

    std::string line = fmt::format("{} {} {}: {}", is_delete ? "Delete failed" : "Upload failed",
                                   id, counter, result.error_message());
    if (result.retries > 1) {
        line += theme::dim(fmt::format(" ({} attempts)", result.retries));
    }
    return theme::fail(line);
}

SyncSummary build_summary(const std::vector<TransferResult>& results,
                          size_t skipped,
                          std::chrono::milliseconds elapsed) {
    SyncSummary s;
    s.skipped = skipped;
    s.elapsed = elapsed;

    for (const auto& r : results) {
        if (r.cancelled) {
            s.cancelled++;
            continue;
        }
        bool is_delete = r.action.kind == ActionKind::Delete;
        if (r.success) {
            (is_delete ? s.delete_success : s.upload_success)++;
        } else {
            (is_delete ? s.delete_failed : s.upload_failed)++;
        }
    }
    return s;
}

std::string format_summary(const SyncSummary& s) {
    std::string out = theme::section("Summary");

    auto counts = [](size_t ok, size_t failed) {
        std::string v = theme::green(fmt::format("{} success", ok));
        if (failed > 0) v += ", " + theme::red(fmt::format("{} failed", failed));
        return v;
    };

    if (s.upload_success > 0 || s.upload_failed > 0) {
        out += theme::kv("Uploaded", counts(s.upload_success, s.upload_failed));
    }
    if (s.delete_success > 0 || s.delete_failed > 0) {
        out += theme::kv("Deleted", counts(s.delete_success, s.delete_failed));
    }
    if (s.skipped > 0) {
        out += theme::kv("Skipped", theme::dim(std::to_string(s.skipped)));
    }
    if (s.cancelled > 0) {
        out += theme::kv("Cancelled", theme::yellow(fmt::format("{} remaining", s.cancelled)));
    }
    out += theme::kv("Duration", theme::dim(format_elapsed(s.elapsed)));
    return out;
}

std::string format_failures(const std::vector<TransferResult>& results) {
    std::string lines;
    for (const auto& r : results) {
        if (!r.failed()) continue;
        lines += theme::fail(fmt::format("{}: {}", r.action.identity(), r.error_message()));
    }
    if (lines.empty()) return "";
    return theme::section(theme::red("Failures")) + lines;
}

int exit_code_for(const SyncSummary& summary, bool cancelled) {
    if (cancelled) return EXIT_CODE_CANCELLED;
    if (summary.failures() > 0) return EXIT_CODE_FAILURE;
    return EXIT_CODE_OK;
}

void ConsoleWriter::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << std::flush;
}
