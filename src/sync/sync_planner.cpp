#include "sync_planner.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

std::string remote_identity(const RemoteFile& remote) {
    return remote.original_name.empty() ? remote.display_name : remote.original_name;
}

SyncPlan build_sync_plan(const std::vector<LocalFile>& local,
                         const std::unordered_map<std::string, std::string>& hashes,
                         const std::vector<RemoteFile>& remote,
                         bool delete_remote) {
    SyncPlan plan;

    // identity -> index into `remote`; first listing wins
    std::unordered_map<std::string, size_t> index;
    index.reserve(remote.size());
    for (size_t i = 0; i < remote.size(); ++i) {
        std::string key = remote_identity(remote[i]);
        if (key.empty()) continue;
        index.emplace(key, i);
    }

    std::vector<bool> matched(remote.size(), false);

    for (const auto& file : local) {
        SyncAction action;
        action.local = file;

        auto it = index.find(file.relative_path);
        if (it == index.end()) {
            action.kind = ActionKind::Upload;
            action.reason = reason::NEW_FILE;
            plan.uploads.push_back(std::move(action));
            continue;
        }

        const RemoteFile& rf = remote[it->second];
        matched[it->second] = true;
        index.erase(it);
        action.remote = rf;

        auto h = hashes.find(file.absolute_path);
        if (!rf.sha256 || rf.sha256->empty()) {
            action.kind = ActionKind::Upload;
            action.reason = reason::MISSING_HASH;
        } else if (h == hashes.end() || h->second != *rf.sha256) {
            action.kind = ActionKind::Upload;
            action.reason = reason::CONTENT_CHANGED;
        } else {
            action.kind = ActionKind::Skip;
            action.reason = reason::UNCHANGED;
        }

        if (action.kind == ActionKind::Skip) {
            plan.skips.push_back(std::move(action));
        } else {
            plan.uploads.push_back(std::move(action));
        }
    }

    if (delete_remote) {
        for (size_t i = 0; i < remote.size(); ++i) {
            if (matched[i]) continue;

            SyncAction action;
            action.kind = ActionKind::Delete;
            action.remote = remote[i];

            // A leftover whose identity was consumed, or taken by an earlier
            // listing entry, is a duplicate
            std::string key = remote_identity(remote[i]);
            auto it = index.find(key);
            bool duplicate = !key.empty() && (it == index.end() || it->second != i);
            action.reason = duplicate ? reason::DUPLICATE : reason::NOT_LOCAL;
            plan.deletes.push_back(std::move(action));
        }
    }

    gemindex_log(fmt::format("plan: {} upload(s), {} skip(s), {} delete(s)",
                             plan.uploads.size(), plan.skips.size(), plan.deletes.size()));
    return plan;
}
