#include <gtest/gtest.h>
#include <sync/sync_planner.hpp>
#include <set>

namespace {

LocalFile local(const std::string& rel) {
    return {rel, "/base/" + rel, 1};
}

RemoteFile remote(const std::string& identity, std::optional<std::string> sha,
                  const std::string& name = "") {
    RemoteFile rf;
    rf.name = name.empty() ? "fileSearchStores/s/documents/" + identity : name;
    rf.display_name = identity;
    rf.original_name = identity;
    rf.sha256 = std::move(sha);
    rf.state = "STATE_ACTIVE";
    return rf;
}

std::unordered_map<std::string, std::string> hashes_for(
    const std::vector<std::pair<std::string, std::string>>& entries) {
    std::unordered_map<std::string, std::string> out;
    for (const auto& [rel, h] : entries) out["/base/" + rel] = h;
    return out;
}

} // namespace

TEST(SyncPlanner, WorkedExample) {
    std::vector<LocalFile> locals = {local("a.txt"), local("b.txt")};
    auto hashes = hashes_for({{"a.txt", "hashX"}, {"b.txt", "hashY"}});
    std::vector<RemoteFile> remotes = {remote("a.txt", "hashX"), remote("c.txt", "hashZ")};

    SyncPlan plan = build_sync_plan(locals, hashes, remotes, true);

    ASSERT_EQ(plan.uploads.size(), 1u);
    EXPECT_EQ(plan.uploads[0].identity(), "b.txt");
    EXPECT_EQ(plan.uploads[0].reason, "new file");

    ASSERT_EQ(plan.skips.size(), 1u);
    EXPECT_EQ(plan.skips[0].identity(), "a.txt");
    EXPECT_EQ(plan.skips[0].reason, "unchanged");

    ASSERT_EQ(plan.deletes.size(), 1u);
    EXPECT_EQ(plan.deletes[0].identity(), "c.txt");
    EXPECT_EQ(plan.deletes[0].reason, "not present locally");
    EXPECT_EQ(plan.deletes[0].kind, ActionKind::Delete);
}

TEST(SyncPlanner, ChangedContentUploads) {
    std::vector<LocalFile> locals = {local("a.txt")};
    auto hashes = hashes_for({{"a.txt", "new"}});
    std::vector<RemoteFile> remotes = {remote("a.txt", "old")};

    SyncPlan plan = build_sync_plan(locals, hashes, remotes, false);
    ASSERT_EQ(plan.uploads.size(), 1u);
    EXPECT_EQ(plan.uploads[0].reason, "content changed");
    ASSERT_TRUE(plan.uploads[0].remote.has_value());
}

TEST(SyncPlanner, MissingRemoteHashForcesUpload) {
    std::vector<LocalFile> locals = {local("legacy.md")};
    auto hashes = hashes_for({{"legacy.md", "abc"}});
    std::vector<RemoteFile> remotes = {remote("legacy.md", std::nullopt)};

    SyncPlan plan = build_sync_plan(locals, hashes, remotes, false);
    ASSERT_EQ(plan.uploads.size(), 1u);
    EXPECT_EQ(plan.uploads[0].reason, "missing remote hash");
    EXPECT_TRUE(plan.skips.empty());
}

TEST(SyncPlanner, MissingLocalDigestCountsAsChanged) {
    std::vector<LocalFile> locals = {local("a.txt")};
    std::vector<RemoteFile> remotes = {remote("a.txt", "abc")};

    SyncPlan plan = build_sync_plan(locals, {}, remotes, false);
    ASSERT_EQ(plan.uploads.size(), 1u);
    EXPECT_EQ(plan.uploads[0].reason, "content changed");
}

TEST(SyncPlanner, EqualHashSkipsRegardlessOfName) {
    std::vector<LocalFile> locals = {local("docs/a.md")};
    auto hashes = hashes_for({{"docs/a.md", "h1"}});
    std::vector<RemoteFile> remotes = {remote("docs/a.md", "h1", "fileSearchStores/s/documents/zzz")};

    SyncPlan plan = build_sync_plan(locals, hashes, remotes, true);
    EXPECT_TRUE(plan.uploads.empty());
    EXPECT_TRUE(plan.deletes.empty());
    ASSERT_EQ(plan.skips.size(), 1u);
}

TEST(SyncPlanner, DeleteDisabledRetainsOrphans) {
    std::vector<RemoteFile> remotes = {remote("orphan.md", "h")};
    SyncPlan plan = build_sync_plan({}, {}, remotes, false);
    EXPECT_TRUE(plan.deletes.empty());
    EXPECT_FALSE(plan.has_work());
}

TEST(SyncPlanner, MatchesOnOriginalNameNotDisplayName) {
    RemoteFile rf = remote("guide/intro.md", "h");
    rf.display_name = "intro.md";

    std::vector<LocalFile> locals = {local("guide/intro.md")};
    auto hashes = hashes_for({{"guide/intro.md", "h"}});
    SyncPlan plan = build_sync_plan(locals, hashes, {rf}, true);
    EXPECT_EQ(plan.skips.size(), 1u);
    EXPECT_TRUE(plan.deletes.empty());
}

TEST(SyncPlanner, DuplicateRemoteIdentityIsDeleted) {
    std::vector<LocalFile> locals = {local("a.txt")};
    auto hashes = hashes_for({{"a.txt", "h"}});
    std::vector<RemoteFile> remotes = {remote("a.txt", "h", "doc/1"), remote("a.txt", "h", "doc/2")};

    SyncPlan plan = build_sync_plan(locals, hashes, remotes, true);
    ASSERT_EQ(plan.skips.size(), 1u);
    EXPECT_EQ(plan.skips[0].remote->name, "doc/1");
    ASSERT_EQ(plan.deletes.size(), 1u);
    EXPECT_EQ(plan.deletes[0].remote->name, "doc/2");
    EXPECT_EQ(plan.deletes[0].reason, "duplicate remote entry");
}

TEST(SyncPlanner, DeletesFollowListingOrder) {
    std::vector<RemoteFile> remotes = {remote("z.md", "1"), remote("a.md", "2"), remote("m.md", "3")};
    SyncPlan plan = build_sync_plan({}, {}, remotes, true);
    ASSERT_EQ(plan.deletes.size(), 3u);
    EXPECT_EQ(plan.deletes[0].identity(), "z.md");
    EXPECT_EQ(plan.deletes[1].identity(), "a.md");
    EXPECT_EQ(plan.deletes[2].identity(), "m.md");
}

TEST(SyncPlanner, PartitionCoversEveryFileOnce) {
    std::vector<LocalFile> locals;
    std::vector<std::pair<std::string, std::string>> hash_entries;
    std::vector<RemoteFile> remotes;
    for (int i = 0; i < 50; ++i) {
        std::string rel = "f" + std::to_string(i) + ".md";
        locals.push_back(local(rel));
        hash_entries.push_back({rel, "h" + std::to_string(i)});
        // Every third remote matches, every fifth differs, plus extra orphans
        if (i % 3 == 0) remotes.push_back(remote(rel, "h" + std::to_string(i % 5 == 0 ? -1 : i)));
    }
    for (int i = 0; i < 7; ++i) remotes.push_back(remote("orphan" + std::to_string(i) + ".md", "x"));

    SyncPlan plan = build_sync_plan(locals, hashes_for(hash_entries), remotes, true);

    std::multiset<std::string> local_ids;
    for (const auto& a : plan.uploads) local_ids.insert(a.identity());
    for (const auto& a : plan.skips) local_ids.insert(a.identity());
    EXPECT_EQ(local_ids.size(), locals.size());
    for (const auto& f : locals) EXPECT_EQ(local_ids.count(f.relative_path), 1u);

    EXPECT_EQ(plan.deletes.size(), 7u);
}

TEST(SyncPlanner, SecondRunIsIdempotent) {
    std::vector<LocalFile> locals = {local("a.md"), local("b/c.md")};
    auto hashes = hashes_for({{"a.md", "1"}, {"b/c.md", "2"}});

    // Remote state after a successful first run
    std::vector<RemoteFile> remotes = {remote("a.md", "1"), remote("b/c.md", "2")};
    SyncPlan plan = build_sync_plan(locals, hashes, remotes, true);
    EXPECT_TRUE(plan.uploads.empty());
    EXPECT_TRUE(plan.deletes.empty());
    EXPECT_EQ(plan.skips.size(), 2u);
}
