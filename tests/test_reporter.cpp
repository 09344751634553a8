#include <gtest/gtest.h>
#include <cli/reporter.hpp>
#include <core/constants.hpp>
#include <sstream>
#include <thread>

namespace {

TransferResult make_result(ActionKind kind, const std::string& id, bool success,
                           bool cancelled = false, const std::string& error = "") {
    TransferResult r;
    r.action.kind = kind;
    if (kind == ActionKind::Delete) {
        RemoteFile rf;
        rf.name = "doc/" + id;
        rf.original_name = id;
        r.action.remote = rf;
    } else {
        r.action.local = LocalFile{id, "/b/" + id, 1};
    }
    r.success = success;
    r.cancelled = cancelled;
    if (!error.empty()) r.error = RemoteError{RemoteError::Kind::Transient, 500, error};
    return r;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(Reporter, BuildSummaryCounts) {
    std::vector<TransferResult> results = {
        make_result(ActionKind::Upload, "a", true),
        make_result(ActionKind::Upload, "b", false, false, "boom"),
        make_result(ActionKind::Upload, "c", false, true),
        make_result(ActionKind::Delete, "d", true),
        make_result(ActionKind::Delete, "e", false, false, "nope"),
        make_result(ActionKind::Delete, "f", false, true),
    };

    SyncSummary s = build_summary(results, 7, std::chrono::milliseconds(1500));
    EXPECT_EQ(s.upload_success, 1u);
    EXPECT_EQ(s.upload_failed, 1u);
    EXPECT_EQ(s.delete_success, 1u);
    EXPECT_EQ(s.delete_failed, 1u);
    EXPECT_EQ(s.cancelled, 2u);
    EXPECT_EQ(s.skipped, 7u);
    EXPECT_EQ(s.failures(), 2u);
}

TEST(Reporter, ExitCodes) {
    SyncSummary clean;
    EXPECT_EQ(exit_code_for(clean, false), EXIT_CODE_OK);

    SyncSummary failed;
    failed.upload_failed = 1;
    EXPECT_EQ(exit_code_for(failed, false), EXIT_CODE_FAILURE);

    // Cancellation wins over failures
    EXPECT_EQ(exit_code_for(failed, true), EXIT_CODE_CANCELLED);

    // Cancelled actions alone are not failures
    SyncSummary only_cancelled;
    only_cancelled.cancelled = 4;
    EXPECT_EQ(exit_code_for(only_cancelled, false), EXIT_CODE_OK);
}

TEST(Reporter, FailureListSkipsCancelled) {
    std::vector<TransferResult> results = {
        make_result(ActionKind::Upload, "ok.md", true),
        make_result(ActionKind::Upload, "bad.md", false, false, "quota exceeded"),
        make_result(ActionKind::Upload, "stopped.md", false, true),
        make_result(ActionKind::Delete, "gone.md", false, false, "forbidden"),
    };

    std::string out = format_failures(results);
    EXPECT_TRUE(contains(out, "Failures"));
    EXPECT_TRUE(contains(out, "bad.md: quota exceeded"));
    EXPECT_TRUE(contains(out, "gone.md: forbidden"));
    EXPECT_FALSE(contains(out, "stopped.md"));
    EXPECT_FALSE(contains(out, "ok.md"));
}

TEST(Reporter, NoFailuresPrintsNothing) {
    std::vector<TransferResult> results = {make_result(ActionKind::Upload, "a", true)};
    EXPECT_EQ(format_failures(results), "");
}

TEST(Reporter, SummaryShowsOnlyRelevantRows) {
    SyncSummary s;
    s.upload_success = 3;
    s.cancelled = 2;
    s.elapsed = std::chrono::milliseconds(2500);

    std::string out = format_summary(s);
    EXPECT_TRUE(contains(out, "Uploaded"));
    EXPECT_TRUE(contains(out, "3 success"));
    EXPECT_FALSE(contains(out, "Deleted"));
    EXPECT_FALSE(contains(out, "Skipped"));
    EXPECT_TRUE(contains(out, "2 remaining"));
    EXPECT_TRUE(contains(out, "2.5s"));
}

TEST(Reporter, PlanListsActions) {
    SyncPlan plan;
    SyncAction up;
    up.kind = ActionKind::Upload;
    up.local = LocalFile{"docs/new.md", "/b/docs/new.md", 1};
    up.reason = "new file";
    plan.uploads.push_back(up);

    SyncAction del;
    del.kind = ActionKind::Delete;
    RemoteFile rf;
    rf.name = "doc/1";
    rf.original_name = "old.md";
    del.remote = rf;
    del.reason = "not present locally";
    plan.deletes.push_back(del);

    SyncAction skip;
    skip.kind = ActionKind::Skip;
    skip.local = LocalFile{"same.md", "/b/same.md", 1};
    plan.skips.push_back(skip);

    std::string out = format_plan(plan);
    EXPECT_TRUE(contains(out, "Sync Plan"));
    EXPECT_TRUE(contains(out, "1 file(s) to upload:"));
    EXPECT_TRUE(contains(out, "docs/new.md (new file)"));
    EXPECT_TRUE(contains(out, "1 file(s) to delete:"));
    EXPECT_TRUE(contains(out, "old.md (not present locally)"));
    EXPECT_TRUE(contains(out, "1 file(s) unchanged (skipped)"));
    EXPECT_FALSE(contains(out, "No changes detected."));
}

TEST(Reporter, EmptyPlanSaysNoChanges) {
    EXPECT_TRUE(contains(format_plan(SyncPlan{}), "No changes detected."));
}

TEST(Reporter, ProgressLine) {
    TransferTotals totals;
    totals.total = 5;
    totals.completed = 2;

    auto ok = make_result(ActionKind::Upload, "a.md", true);
    ok.retries = 2;
    std::string line = format_progress(ok, totals);
    EXPECT_TRUE(contains(line, "Uploaded a.md"));
    EXPECT_TRUE(contains(line, "(2/5)"));
    EXPECT_TRUE(contains(line, "after 2 retries"));

    auto bad = make_result(ActionKind::Delete, "b.md", false, false, "denied");
    EXPECT_TRUE(contains(format_progress(bad, totals), "Delete failed b.md"));
    EXPECT_TRUE(contains(format_progress(bad, totals), "denied"));

    auto stopped = make_result(ActionKind::Upload, "c.md", false, true);
    EXPECT_TRUE(contains(format_progress(stopped, totals), "Cancelled c.md"));
}

TEST(Reporter, ConsoleWriterKeepsLinesWhole) {
    std::ostringstream out;
    ConsoleWriter console(out);

    constexpr int kThreads = 4;
    constexpr int kLines = 200;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&console, t] {
            std::string line = std::string(40, static_cast<char>('a' + t)) + "\n";
            for (int i = 0; i < kLines; ++i) console.write(line);
        });
    }
    for (auto& w : writers) w.join();

    std::istringstream in(out.str());
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        ++count;
        ASSERT_EQ(line.size(), 40u);
        EXPECT_EQ(line.find_first_not_of(line[0]), std::string::npos) << line;
    }
    EXPECT_EQ(count, kThreads * kLines);
}
