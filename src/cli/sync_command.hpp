#pragma once

#include <string>
#include <vector>
#include "sync_args.hpp"

// `gemindex sync`: scan, hash, diff against the remote store, confirm,
// then upload and delete. Returns the process exit code.
class SyncCommand {
public:
    explicit SyncCommand(SyncOptions options);

    int run();

private:
    SyncOptions options_;
};

// Registry entry point: parse args, then run
int run_sync_command(const std::vector<std::string>& args);
