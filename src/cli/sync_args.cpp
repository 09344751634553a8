#include "sync_args.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// Short and long spellings of options that take a value
bool is_flag(const std::string& arg, const char* short_name, const char* long_name) {
    return (short_name && arg == short_name) || arg == long_name;
}

} // namespace

Result<SyncOptions> parse_sync_args(const std::vector<std::string>& args) {
    using R = Result<SyncOptions>;
    SyncOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::string inline_value;
        bool has_inline = false;

        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        // Fetch the value for an option that takes one
        auto take_value = [&](std::string& out) -> bool {
            if (has_inline) {
                out = inline_value;
                return true;
            }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (is_flag(arg, "-h", "--help")) {
            opts.help = true;
        } else if (is_flag(arg, "-y", "--yes")) {
            if (has_inline) return R::Err(arg + " does not take a value");
            opts.yes = true;
        } else if (is_flag(arg, "-n", "--dry-run")) {
            if (has_inline) return R::Err(arg + " does not take a value");
            opts.dry_run = true;
        } else if (is_flag(arg, "-d", "--delete")) {
            if (has_inline) return R::Err(arg + " does not take a value");
            opts.overrides.force_delete = true;
        } else if (is_flag(arg, "-c", "--config")) {
            if (!take_value(opts.config_path) || opts.config_path.empty()) {
                return R::Err(arg + " requires a path");
            }
        } else if (is_flag(arg, "-s", "--store")) {
            std::string store;
            if (!take_value(store) || store.empty()) return R::Err(arg + " requires a store name");
            opts.overrides.store = store;
        } else if (is_flag(arg, "-e", "--endpoint")) {
            std::string endpoint;
            if (!take_value(endpoint) || endpoint.empty()) return R::Err(arg + " requires a URL");
            opts.overrides.endpoint = endpoint;
        } else if (is_flag(arg, nullptr, "--concurrency")) {
            std::string value;
            if (!take_value(value)) return R::Err("--concurrency requires a number");
            int n = safe_stoi(value, 0);
            if (n < 1) {
                return R::Err(fmt::format("--concurrency must be a positive integer (got '{}')", value));
            }
            opts.overrides.concurrency = n;
        } else {
            return R::Err("Unknown option: " + args[i]);
        }
    }

    return R::Ok(opts);
}

std::string sync_usage() {
    auto row = [](const std::string& flags, const std::string& desc) {
        return theme::color::TEAL + fmt::format("    {:<26}", flags) + theme::color::RESET
             + theme::color::DIM + desc + theme::color::RESET + "\n";
    };

    std::string out = theme::section("gemindex sync [options]");
    out += row("-c, --config <path>", "Config file path (default .gemindex.yml)");
    out += row("-y, --yes", "Skip confirmation prompt (auto-approve)");
    out += row("-n, --dry-run", "Show plan without executing");
    out += row("-d, --delete", "Delete remote files not present locally");
    out += row("--concurrency <n>", "Parallel transfer limit");
    out += row("-s, --store <name>", "Target store name (overrides config)");
    out += row("-e, --endpoint <url>", "API endpoint URL (overrides config)");
    out += row("-h, --help", "Show this help");
    return out + "\n";
}
