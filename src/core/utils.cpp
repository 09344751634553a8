#include "utils.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t consumed = 0;
        int value = std::stoi(s, &consumed);
        if (consumed != s.size()) return fallback;
        return value;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
            continue;
        }
        escaped << '%' << std::setw(2) << static_cast<int>(uc);
    }

    return escaped.str();
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}
