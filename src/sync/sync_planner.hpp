#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <core/types.hpp>

// Plan reasons, shown to the user verbatim
namespace reason {
    constexpr const char* NEW_FILE        = "new file";
    constexpr const char* CONTENT_CHANGED = "content changed";
    constexpr const char* MISSING_HASH    = "missing remote hash";
    constexpr const char* UNCHANGED       = "unchanged";
    constexpr const char* NOT_LOCAL       = "not present locally";
    constexpr const char* DUPLICATE       = "duplicate remote entry";
}

// Identity under which a remote entry is matched: the declared original
// name, falling back to the display name.
std::string remote_identity(const RemoteFile& remote);

// Diff local files (with digests keyed by absolute path) against the remote
// listing. Every local file lands in exactly one of uploads/skips; unmatched
// remote entries become deletes only when delete_remote is set.
// Single pass over each side.
SyncPlan build_sync_plan(const std::vector<LocalFile>& local,
                         const std::unordered_map<std::string, std::string>& hashes,
                         const std::vector<RemoteFile>& remote,
                         bool delete_remote);
