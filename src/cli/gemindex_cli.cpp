#include "gemindex_cli.hpp"
#include "sync_command.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>
#include <fmt/format.h>

GemindexCLI::GemindexCLI() {
    add_command("sync", run_sync_command, "Sync local files to a file search store");
}

void GemindexCLI::add_command(const std::string& name,
                              CommandHandler handler,
                              const std::string& help) {
    commands_[name] = {handler, help};
}

bool GemindexCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

int GemindexCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        print_usage();
        return EXIT_CODE_CONFIG;
    }
    return it->second.first(args);
}

int GemindexCLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_CODE_CONFIG;
    }

    std::string cmd = argv[1];
    if (cmd == "--version" || cmd == "-V") {
        std::cout << theme::color::TEAL << theme::color::BOLD << "gemindex"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << GEMINDEX_VERSION << theme::color::RESET << "\n";
        return EXIT_CODE_OK;
    }
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        print_usage();
        return EXIT_CODE_OK;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    return execute_command(cmd, args);
}

void GemindexCLI::print_usage() const {
    std::cout << theme::title();
    std::cout << theme::section("Usage");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::TEAL
                  << fmt::format("    gemindex {:<14}", name)
                  << theme::color::RESET
                  << theme::color::DIM
                  << entry.second
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    gemindex sync --help     Show sync options\n"
              << "    gemindex --version       Show version\n"
              << "    gemindex --help          Show this help"
              << theme::color::RESET << "\n\n";
}
