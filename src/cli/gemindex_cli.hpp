#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>

// Subcommand registry behind main()
class GemindexCLI {
public:
    GemindexCLI();

    using CommandHandler = std::function<int(const std::vector<std::string>& args)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    bool has_command(const std::string& name) const;

    // Returns the process exit code
    int execute_command(const std::string& command, const std::vector<std::string>& args);

    // Dispatch argv: --help, --version, or a subcommand
    int run(int argc, char** argv);

    void print_usage() const;

private:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
