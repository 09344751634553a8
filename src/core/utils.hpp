#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
// Trailing garbage ("8x") counts as failure.
int safe_stoi(const std::string& s, int fallback = 0);

// Percent-encode everything except RFC 3986 unreserved characters.
std::string url_encode(const std::string& value);

// Lowercase ASCII copy.
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
