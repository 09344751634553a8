#include <iostream>
#include <string>
#include <core/constants.hpp>
#include "cli/gemindex_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        GemindexCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_CODE_FAILURE;
    }
}
