#include "prompt.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <sync/cancellation.hpp>
#include <iostream>

bool is_affirmative(const std::string& answer) {
    std::string a = answer;
    trim(a);
    return to_lower(a) == "yes";
}

ConfirmResult confirm_sync(const CancellationToken& token) {
    std::cout << "\n" << theme::bold("  Do you want to perform these actions?") << "\n";
    std::cout << "  gemindex will perform the actions described above.\n";
    std::cout << "  Only " << theme::green("'yes'") << " will be accepted to approve.\n\n";
    std::cout << "  Enter a value: " << std::flush;

    while (!token.is_cancelled()) {
        if (!platform::poll_stdin(PROMPT_POLL_MS)) continue;

        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            return ConfirmResult::No;
        }
        return is_affirmative(line) ? ConfirmResult::Yes : ConfirmResult::No;
    }

    std::cout << "\n";
    return ConfirmResult::Interrupted;
}
