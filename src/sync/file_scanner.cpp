#include "file_scanner.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

constexpr auto npos = std::string::npos;

bool is_regex_special(char c) {
    return std::string(".+()^$|{}[]\\*?").find(c) != npos;
}

// One path segment of any length; optionally refusing a leading dot
std::string segment_any(bool guard_dot) {
    return guard_dot ? "(?!\\.)[^/]*" : "[^/]*";
}

size_t find_class_end(const std::string& g, size_t open) {
    size_t j = open + 1;
    if (j < g.size() && (g[j] == '!' || g[j] == '^')) ++j;
    if (j < g.size() && g[j] == ']') ++j;   // leading ']' is literal
    while (j < g.size() && g[j] != ']') ++j;
    return j < g.size() ? j : npos;
}

size_t find_brace_end(const std::string& g, size_t open) {
    int depth = 0;
    for (size_t j = open; j < g.size(); ++j) {
        if (g[j] == '\\') { ++j; continue; }
        if (g[j] == '{') {
            ++depth;
        } else if (g[j] == '}') {
            if (--depth == 0) return j;
        }
    }
    return npos;
}

// Split "a,b{c,d},e" on top-level commas
std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> alts;
    std::string current;
    int depth = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            current += c;
            current += body[++i];
            continue;
        }
        if (c == '{') ++depth;
        if (c == '}') --depth;
        if (c == ',' && depth == 0) {
            alts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    alts.push_back(current);
    return alts;
}

std::string convert(const std::string& g, bool match_dot, bool seg_start) {
    std::string out;

    for (size_t i = 0; i < g.size(); ++i) {
        char c = g[i];
        bool guard = seg_start && !match_dot;

        if (c == '*') {
            bool dbl = i + 1 < g.size() && g[i + 1] == '*';
            if (dbl && seg_start) {
                bool at_end = i + 2 == g.size();
                if (!at_end && g[i + 2] == '/') {
                    // "**/": zero or more whole directories
                    out += "(?:" + segment_any(!match_dot) + "/)*";
                    i += 2;
                    seg_start = true;
                    continue;
                }
                if (at_end) {
                    // trailing "**": everything below
                    std::string seg = segment_any(!match_dot);
                    out += "(?:" + seg + "(?:/" + seg + ")*)?";
                    i += 1;
                    seg_start = false;
                    continue;
                }
            }
            out += segment_any(guard);
            while (i + 1 < g.size() && g[i + 1] == '*') ++i;
            seg_start = false;
        } else if (c == '?') {
            out += guard ? "[^/.]" : "[^/]";
            seg_start = false;
        } else if (c == '[') {
            size_t end = find_class_end(g, i);
            if (end == npos) {
                out += "\\[";
                seg_start = false;
                continue;
            }
            std::string cls = "[";
            size_t j = i + 1;
            if (g[j] == '!' || g[j] == '^') {
                cls += '^';
                ++j;
            }
            for (; j < end; ++j) {
                if (g[j] == '\\' || g[j] == '[' || g[j] == ']') cls += '\\';
                cls += g[j];
            }
            cls += ']';
            if (guard) out += "(?!\\.)";
            out += cls;
            i = end;
            seg_start = false;
        } else if (c == '{') {
            size_t end = find_brace_end(g, i);
            if (end == npos) {
                out += "\\{";
                seg_start = false;
                continue;
            }
            auto alts = split_alternatives(g.substr(i + 1, end - i - 1));
            out += "(?:";
            for (size_t k = 0; k < alts.size(); ++k) {
                if (k > 0) out += '|';
                out += convert(alts[k], match_dot, seg_start);
            }
            out += ')';
            i = end;
            seg_start = false;
        } else if (c == '/') {
            out += '/';
            seg_start = true;
        } else if (c == '\\' && i + 1 < g.size()) {
            ++i;
            if (is_regex_special(g[i])) out += '\\';
            out += g[i];
            seg_start = false;
        } else {
            if (is_regex_special(c)) out += '\\';
            out += c;
            seg_start = false;
        }
    }

    return out;
}

std::string normalize_glob(std::string glob) {
    trim(glob);
    while (glob.rfind("./", 0) == 0) glob.erase(0, 2);
    return glob;
}

bool names_hidden_segment(const std::string& glob) {
    return (!glob.empty() && glob[0] == '.') ||
           glob.find("/.") != npos ||
           glob.find("{.") != npos ||
           glob.find(",.") != npos;
}

bool has_hidden_segment(const std::string& rel) {
    if (!rel.empty() && rel[0] == '.') return true;
    return rel.find("/.") != npos;
}

} // namespace

std::string to_identity_path(const fs::path& rel) {
    return rel.generic_string();
}

std::string FileScanner::glob_to_regex(const std::string& glob, bool match_dot) {
    return convert(normalize_glob(glob), match_dot, true);
}

FileScanner::FileScanner(const fs::path& base_dir,
                         const std::vector<std::string>& include,
                         const std::vector<std::string>& exclude) {
    std::error_code ec;
    fs::path abs = fs::absolute(base_dir, ec);
    base_dir_ = (ec ? base_dir : abs).lexically_normal();
    // "/a/b/" -> "/a/b" so lexically_relative() lines up
    if (!base_dir_.has_filename() && base_dir_.has_parent_path() &&
        base_dir_ != base_dir_.root_path()) {
        base_dir_ = base_dir_.parent_path();
    }

    for (const auto& g : include) {
        add_pattern(g, false, include_);
        if (names_hidden_segment(normalize_glob(g))) descend_hidden_ = true;
    }
    // Excludes may name hidden paths through wildcards
    for (const auto& g : exclude) {
        add_pattern(g, true, exclude_);
    }
}

void FileScanner::add_pattern(const std::string& glob, bool match_dot, std::vector<Pattern>& out) {
    std::string normalized = normalize_glob(glob);
    if (normalized.empty()) return;

    try {
        out.push_back({normalized, std::regex(glob_to_regex(normalized, match_dot),
                                              std::regex::ECMAScript | std::regex::optimize)});
    } catch (const std::regex_error& e) {
        if (pattern_error_.empty()) {
            pattern_error_ = fmt::format("Invalid glob pattern '{}': {}", glob, e.what());
        }
    }
}

bool FileScanner::is_included(const std::string& rel_path) const {
    bool included = false;
    for (const auto& p : include_) {
        if (std::regex_match(rel_path, p.re)) {
            included = true;
            break;
        }
    }
    if (!included) return false;

    if (matches_exclude(rel_path)) return false;

    // An excluded directory takes everything below it
    for (size_t slash = rel_path.find('/'); slash != npos; slash = rel_path.find('/', slash + 1)) {
        if (matches_exclude(rel_path.substr(0, slash))) return false;
    }
    return true;
}

bool FileScanner::matches_exclude(const std::string& rel_path) const {
    for (const auto& p : exclude_) {
        if (std::regex_match(rel_path, p.re)) return true;
    }
    return false;
}

bool FileScanner::should_descend(const std::string& rel_dir) const {
    if (!descend_hidden_ && has_hidden_segment(rel_dir)) {
        return false;
    }

    // "node_modules", "**/node_modules" and "node_modules/**" all prune the directory
    return !matches_exclude(rel_dir) && !matches_exclude(rel_dir + "/");
}

Result<std::vector<LocalFile>> FileScanner::scan() const {
    using R = Result<std::vector<LocalFile>>;

    if (!pattern_error_.empty()) {
        return R::Err(pattern_error_);
    }

    std::error_code ec;
    if (!fs::exists(base_dir_, ec)) {
        return R::Err(fmt::format("Base directory not found: {}", base_dir_.string()));
    }
    if (!fs::is_directory(base_dir_, ec)) {
        return R::Err(fmt::format("Base path is not a directory: {}", base_dir_.string()));
    }

    std::vector<LocalFile> files;
    fs::recursive_directory_iterator it(base_dir_, fs::directory_options::none, ec);
    if (ec) {
        return R::Err(fmt::format("Cannot read directory {}: {}", base_dir_.string(), ec.message()));
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        std::string rel = to_identity_path(entry.path().lexically_relative(base_dir_));

        fs::file_status st = entry.status(ec);
        if (ec) {
            std::error_code link_ec;
            if (fs::is_symlink(entry.symlink_status(link_ec))) {
                // Dangling symlink: nothing to upload
                gemindex_log(fmt::format("scan: skipping dangling symlink {}", rel));
                ec.clear();
            } else {
                return R::Err(fmt::format("Cannot stat {}: {}", entry.path().string(), ec.message()));
            }
        } else if (fs::is_directory(st)) {
            if (!should_descend(rel)) {
                it.disable_recursion_pending();
            }
        } else if (fs::is_regular_file(st) && is_included(rel)) {
            auto size = entry.file_size(ec);
            if (ec) {
                return R::Err(fmt::format("Cannot stat {}: {}", entry.path().string(), ec.message()));
            }
            files.push_back({rel, entry.path().string(), static_cast<int64_t>(size)});
        }

        fs::path current = entry.path();
        bool current_is_dir = !ec && fs::is_directory(st);
        it.increment(ec);
        if (ec) {
            fs::path failed = current_is_dir ? current : current.parent_path();
            return R::Err(fmt::format("Cannot read directory {}: {}", failed.string(), ec.message()));
        }
    }

    // Sort for consistent ordering
    std::sort(files.begin(), files.end(), [](const LocalFile& a, const LocalFile& b) {
        return a.relative_path < b.relative_path;
    });

    gemindex_log(fmt::format("scan: {} file(s) matched under {}", files.size(), base_dir_.string()));
    return R::Ok(std::move(files));
}
