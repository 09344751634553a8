#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Files ──────────────────────────────────────────────────

struct LocalFile {
    std::string relative_path;      // "docs/guide/intro.md", always '/'-separated
    std::string absolute_path;
    int64_t size = 0;
};

struct RemoteFile {
    std::string name;               // remote identifier, e.g. "fileSearchStores/x/documents/y"
    std::string display_name;
    std::string original_name;      // declared original identity (matching key)
    std::optional<std::string> sha256;
    std::string state;
};

// ── Plan ───────────────────────────────────────────────────

enum class ActionKind { Upload, Skip, Delete };

struct SyncAction {
    ActionKind kind = ActionKind::Upload;
    std::optional<LocalFile> local;
    std::optional<RemoteFile> remote;
    std::string reason;

    // Identity shown to the user: local relative path, else remote original name.
    std::string identity() const {
        if (local) return local->relative_path;
        if (remote) {
            if (!remote->original_name.empty()) return remote->original_name;
            if (!remote->display_name.empty()) return remote->display_name;
            return remote->name;
        }
        return "unknown";
    }
};

struct SyncPlan {
    std::vector<SyncAction> uploads;
    std::vector<SyncAction> skips;
    std::vector<SyncAction> deletes;

    bool has_work() const { return !uploads.empty() || !deletes.empty(); }
};

// ── Configuration structures ───────────────────────────────

struct CollectConfig {
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

struct SyncSettings {
    bool delete_remote = false;
    int concurrency = 8;
    int max_attempts = 3;
    int retry_base_delay_ms = 1000;
    int connection_failure_threshold = 3;
};

struct ApiConfig {
    std::string endpoint;
    std::string token_env;
    std::optional<std::string> token;   // resolved from token_env at load time
    int connect_timeout = 30;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
