#include "sync_command.hpp"
#include "prompt.hpp"
#include "reporter.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/interrupts.hpp>
#include <remote/http_store_client.hpp>
#include <sync/cancellation.hpp>
#include <sync/content_hasher.hpp>
#include <sync/file_scanner.hpp>
#include <sync/sync_planner.hpp>
#include <sync/transfer_executor.hpp>
#include <fmt/format.h>
#include <chrono>
#include <iostream>

SyncCommand::SyncCommand(SyncOptions options)
    : options_(std::move(options)) {}

int SyncCommand::run() {
    auto start = std::chrono::steady_clock::now();

    // ── Config ──────────────────────────────────────────
    fs::path config_path = options_.config_path.empty()
        ? Config::get_default_config_path()
        : fs::path(options_.config_path);

    auto config_result = Config::load(config_path);
    if (config_result.is_err()) {
        std::cout << theme::fail("Config error: " + config_result.error);
        return EXIT_CODE_CONFIG;
    }
    Config config = config_result.value;

    auto override_result = config.apply_overrides(options_.overrides);
    if (override_result.is_err()) {
        std::cout << theme::fail("Config error: " + override_result.error);
        return EXIT_CODE_CONFIG;
    }
    gemindex_log("config: loaded " + config.source_path().string());
    std::cout << theme::ok(fmt::format("Config loaded (store: {})", theme::teal(config.store())));

    // ── Cancellation ────────────────────────────────────
    ConsoleWriter console(std::cout);
    CancellationToken token;
    platform::InterruptWatcher watcher(token);
    int notice_id = token.subscribe([&console] {
        console.write("\n" + theme::warn("Interrupt received, finishing in-flight transfers "
                                         "(press Ctrl+C again to force quit)"));
    });

    // ── Scan ────────────────────────────────────────────
    FileScanner scanner(config.base_dir(), config.collect().include, config.collect().exclude);
    auto scan_result = scanner.scan();
    if (scan_result.is_err()) {
        std::cout << theme::fail("Scan failed: " + scan_result.error);
        return EXIT_CODE_FAILURE;
    }
    const std::vector<LocalFile>& local_files = scan_result.value;
    std::cout << theme::ok(fmt::format("Found {} local file(s)", theme::teal(std::to_string(local_files.size()))));

    // ── Hash ────────────────────────────────────────────
    std::unordered_map<std::string, std::string> hashes;
    try {
        hashes = compute_hashes(local_files, token, [](const std::string& msg) {
            gemindex_log("hash: " + msg);
        });
    } catch (const CancelledError&) {
        std::cout << "\n" << theme::yellow("  Cancelled by user.") << "\n";
        return EXIT_CODE_CANCELLED;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string("Hashing failed: ") + e.what());
        return EXIT_CODE_FAILURE;
    }
    std::cout << theme::ok("Hashes computed");

    if (token.is_cancelled()) {
        std::cout << "\n" << theme::yellow("  Cancelled by user.") << "\n";
        return EXIT_CODE_CANCELLED;
    }

    // ── Remote listing ──────────────────────────────────
    HttpStoreClient client(config.api());
    auto list_result = client.list_files(config.store());
    if (list_result.is_err()) {
        const RemoteError& err = list_result.error;
        if (err.kind == RemoteError::Kind::Connection) {
            std::cout << theme::fail(HttpStoreClient::connection_hints(client.base_url()));
            std::cout << theme::step("Original error: " + err.message);
        } else {
            std::cout << theme::fail(err.message);
        }
        return EXIT_CODE_FAILURE;
    }
    const std::vector<RemoteFile>& remote_files = list_result.value;
    std::cout << theme::ok(fmt::format("Found {} remote file(s)", theme::teal(std::to_string(remote_files.size()))));

    // ── Plan ────────────────────────────────────────────
    SyncPlan plan = build_sync_plan(local_files, hashes, remote_files, config.sync().delete_remote);
    std::cout << format_plan(plan);

    if (!plan.has_work()) {
        std::cout << "\n" << theme::green("  Everything is up to date!") << "\n";
        return EXIT_CODE_OK;
    }

    if (options_.dry_run) {
        std::cout << "\n" << theme::dim("  Dry run - no changes made.") << "\n";
        return EXIT_CODE_OK;
    }

    if (!options_.yes) {
        ConfirmResult answer = confirm_sync(token);
        if (answer == ConfirmResult::Interrupted) {
            std::cout << theme::dim("  Cancelled. No changes were made.") << "\n";
            return EXIT_CODE_CANCELLED;
        }
        if (answer == ConfirmResult::No) {
            std::cout << "\n" << theme::dim("  Cancelled. No changes were made.") << "\n";
            return EXIT_CODE_OK;
        }
    }

    // ── Execute ─────────────────────────────────────────
    ExecutorOptions exec_opts;
    exec_opts.concurrency = config.sync().concurrency;
    exec_opts.max_attempts = config.sync().max_attempts;
    exec_opts.base_delay = std::chrono::milliseconds(config.sync().retry_base_delay_ms);
    exec_opts.connection_failure_threshold = config.sync().connection_failure_threshold;

    std::cout << theme::section("Syncing");
    TransferExecutor executor(client, config.store(), exec_opts);
    auto results = executor.execute(plan, token, [&console](const TransferResult& r, const TransferTotals& t) {
        console.write(format_progress(r, t));
    });
    token.unsubscribe(notice_id);

    // ── Summary ─────────────────────────────────────────
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    SyncSummary summary = build_summary(results, plan.skips.size(), elapsed);
    std::cout << format_summary(summary);
    std::cout << format_failures(results);

    if (executor.breaker_tripped()) {
        std::cout << "\n" << theme::warn(fmt::format("Remote store unreachable at {}; remaining actions were not attempted.",
                                                     client.base_url()));
    }

    bool cancelled = token.is_cancelled();
    if (cancelled) {
        std::cout << "\n" << theme::yellow("  Cancelled by user.") << "\n";
    }

    int code = exit_code_for(summary, cancelled);
    gemindex_log(fmt::format("sync: finished with exit code {}", code));
    return code;
}

int run_sync_command(const std::vector<std::string>& args) {
    auto parsed = parse_sync_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Run 'gemindex sync --help' for options.");
        return EXIT_CODE_CONFIG;
    }
    if (parsed.value.help) {
        std::cout << sync_usage();
        return EXIT_CODE_OK;
    }

    SyncCommand command(parsed.value);
    return command.run();
}
