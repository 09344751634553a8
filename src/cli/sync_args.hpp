#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

struct SyncOptions {
    std::string config_path;          // empty: ./.gemindex.yml
    bool yes = false;                 // skip the confirmation prompt
    bool dry_run = false;
    bool help = false;
    ConfigOverrides overrides;
};

// Parse the arguments following "sync". Accepts "--flag value" and
// "--flag=value". Unknown flags, missing values and a non-positive
// --concurrency are errors.
Result<SyncOptions> parse_sync_args(const std::vector<std::string>& args);

// Option table for `gemindex sync --help`
std::string sync_usage();
