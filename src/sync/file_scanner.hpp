#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Enumerates files under a base directory that match include globs and
// none of the exclude globs.
//
// Glob dialect: `*` and `?` stay within one segment, `**` spans segments,
// `[...]` / `[!...]` classes, `{a,b}` alternation. Patterns match the whole
// '/'-separated relative path. Wildcards never match a leading '.' in an
// include pattern, so hidden files need a pattern that spells the dot out.
// An exclude that matches a directory drops every file below it.
class FileScanner {
public:
    FileScanner(const fs::path& base_dir,
                const std::vector<std::string>& include,
                const std::vector<std::string>& exclude = {});

    // Walk the tree. Any filesystem error (or an invalid pattern) is fatal.
    Result<std::vector<LocalFile>> scan() const;

    // Check a '/'-separated relative path against include/exclude rules
    bool is_included(const std::string& rel_path) const;

    const fs::path& base_dir() const { return base_dir_; }

    // Translate one glob into an ECMAScript regex body (unanchored).
    // With match_dot=false, wildcards refuse a leading '.' in any segment.
    static std::string glob_to_regex(const std::string& glob, bool match_dot);

private:
    struct Pattern {
        std::string glob;
        std::regex re;
    };

    fs::path base_dir_;
    std::vector<Pattern> include_;
    std::vector<Pattern> exclude_;
    bool descend_hidden_ = false;   // some include pattern names a dot segment
    std::string pattern_error_;

    void add_pattern(const std::string& glob, bool match_dot, std::vector<Pattern>& out);
    bool should_descend(const std::string& rel_dir) const;
    bool matches_exclude(const std::string& rel_path) const;
};

// Relative path with '/' separators, used as the identity of a local file.
std::string to_identity_path(const fs::path& rel);
