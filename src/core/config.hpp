#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Command-line values layered over the file
struct ConfigOverrides {
    std::optional<std::string> store;
    std::optional<std::string> endpoint;
    std::optional<int> concurrency;
    bool force_delete = false;
};

class Config {
public:
    // Load and validate a .gemindex.yml
    static Result<Config> load(const fs::path& path);

    // Parse YAML text. `base_dir` is where scanning starts.
    static Result<Config> parse(const std::string& yaml_text, const fs::path& base_dir);

    // Apply --store / --endpoint / --delete / --concurrency
    Result<void> apply_overrides(const ConfigOverrides& overrides);

    // Accessors
    const std::string& store() const { return store_; }
    const CollectConfig& collect() const { return collect_; }
    const SyncSettings& sync() const { return sync_; }
    const ApiConfig& api() const { return api_; }
    const fs::path& base_dir() const { return base_dir_; }
    const fs::path& source_path() const { return source_path_; }

    static fs::path get_default_config_path(const fs::path& dir = fs::current_path());

public:
    Config() = default;

private:
    std::string store_;
    CollectConfig collect_;
    SyncSettings sync_;
    ApiConfig api_;
    fs::path base_dir_;
    fs::path source_path_;

    Result<void> validate() const;
};

bool config_exists(const fs::path& path);
