//! # Source Tree Access Implementation

#include "fs/filesystem.hpp"

#include <algorithm>
#include <regex>

namespace stdfs = std::filesystem;

namespace transbuild::fs {

// ============================================================================
// Path Helpers
// ============================================================================

auto normalize(std::string_view path) -> std::string {
    while (path.starts_with("./")) {
        path.remove_prefix(2);
    }
    while (path.size() > 1 && path.ends_with('/')) {
        path.remove_suffix(1);
    }
    if (path.empty()) {
        return ".";
    }
    return std::string(path);
}

auto join(std::string_view dir, std::string_view rel) -> std::string {
    auto d = normalize(dir);
    auto r = normalize(rel);
    if (d == ".") {
        return r;
    }
    if (r == ".") {
        return d;
    }
    return d + "/" + r;
}

auto parent_dir(std::string_view path) -> std::string {
    auto p = normalize(path);
    auto slash = p.rfind('/');
    if (slash == std::string::npos) {
        return ".";
    }
    return p.substr(0, slash);
}

auto relative_to(std::string_view dir, std::string_view path) -> std::string {
    auto d = normalize(dir);
    auto p = normalize(path);
    if (d == ".") {
        return p;
    }
    if (p.starts_with(d) && p.size() > d.size() && p[d.size()] == '/') {
        return p.substr(d.size() + 1);
    }
    return p;
}

auto is_glob(std::string_view pattern) -> bool {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}

namespace {

auto split_segments(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        segments.emplace_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return segments;
}

/// Appends the bracket expression starting at `seg[open]` to `re` and
/// returns the index of its closing `]`, or npos when it is unterminated.
auto append_bracket(std::string_view seg, size_t open, std::string& re) -> size_t {
    size_t pos = open + 1;
    bool negated = pos < seg.size() && (seg[pos] == '!' || seg[pos] == '^');
    if (negated) {
        ++pos;
    }
    // A ']' right after the opening bracket is a member, not the end
    size_t close = seg.find(']', pos < seg.size() && seg[pos] == ']' ? pos + 1 : pos);
    if (close == std::string_view::npos) {
        return std::string_view::npos;
    }
    re += negated ? "[^/" : "[";
    for (char c : seg.substr(pos, close - pos)) {
        if (c == '\\' || c == ']' || c == '[') {
            re += '\\';
        }
        re += c;
    }
    re += ']';
    return close;
}

/// Translates a glob into an anchored ECMAScript regex. A `[` without a
/// matching `]` is taken literally.
auto glob_to_regex(std::string_view pattern) -> std::string {
    auto segments = split_segments(normalize(pattern));
    std::string re;
    for (size_t i = 0; i < segments.size(); ++i) {
        std::string_view seg = segments[i];
        bool last = i + 1 == segments.size();
        if (seg == "**") {
            re += last ? ".*" : "(?:[^/]+/)*";
            continue;
        }
        for (size_t j = 0; j < seg.size(); ++j) {
            char c = seg[j];
            switch (c) {
            case '*':
                re += "[^/]*";
                break;
            case '?':
                re += "[^/]";
                break;
            case '[': {
                auto close = append_bracket(seg, j, re);
                if (close == std::string_view::npos) {
                    re += "\\[";
                } else {
                    j = close;
                }
                break;
            }
            case ']':
            case '.':
            case '+':
            case '(':
            case ')':
            case '{':
            case '}':
            case '^':
            case '$':
            case '|':
            case '\\':
                re += '\\';
                re += c;
                break;
            default:
                re += c;
            }
        }
        if (!last) {
            re += '/';
        }
    }
    return re;
}

auto compile_glob(std::string_view pattern) -> Result<std::regex> {
    try {
        return std::regex(glob_to_regex(pattern));
    } catch (const std::regex_error& e) {
        return "invalid glob pattern \"" + std::string(pattern) + "\": " + e.what();
    }
}

using Excludes = std::vector<std::regex>;

/// Compiles every exclude pattern once for a whole glob expansion.
auto compile_excludes(const std::vector<std::string>& patterns) -> Result<Excludes> {
    Excludes compiled;
    compiled.reserve(patterns.size());
    for (const auto& p : patterns) {
        auto re = compile_glob(p);
        if (is_err(re)) {
            return unwrap_err(re);
        }
        compiled.push_back(std::move(unwrap(re)));
    }
    return compiled;
}

/// Leading pattern segments without metacharacters, joined.
auto literal_base(std::string_view pattern) -> std::string {
    auto segments = split_segments(normalize(pattern));
    std::string base = ".";
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (is_glob(segments[i])) {
            break;
        }
        base = join(base, segments[i]);
    }
    return base;
}

auto matches_any(const Excludes& excludes, const std::string& path) -> bool {
    return std::any_of(excludes.begin(), excludes.end(),
                       [&](const std::regex& re) { return std::regex_match(path, re); });
}

} // namespace

// ============================================================================
// OsFileSystem
// ============================================================================

OsFileSystem::OsFileSystem(stdfs::path root) : root_(std::move(root)) {}

auto OsFileSystem::resolve(std::string_view path) const -> stdfs::path {
    auto p = normalize(path);
    if (p == ".") {
        return root_;
    }
    return root_ / p;
}

auto OsFileSystem::exists(std::string_view path) const -> bool {
    std::error_code ec;
    return stdfs::exists(resolve(path), ec);
}

auto OsFileSystem::is_symlink(std::string_view path) const -> bool {
    std::error_code ec;
    return stdfs::is_symlink(stdfs::symlink_status(resolve(path), ec));
}

auto OsFileSystem::glob(std::string_view pattern, const std::vector<std::string>& excludes) const
    -> Result<std::vector<std::string>> {
    auto excluded = compile_excludes(excludes);
    if (is_err(excluded)) {
        return unwrap_err(excluded);
    }
    const auto& exclude_res = unwrap(excluded);
    std::vector<std::string> files;

    if (!is_glob(pattern)) {
        auto p = normalize(pattern);
        if (exists(p) && !matches_any(exclude_res, p)) {
            files.push_back(p);
        }
        return files;
    }

    auto base = literal_base(pattern);
    auto base_path = resolve(base);
    std::error_code ec;
    if (!stdfs::is_directory(base_path, ec)) {
        return files;
    }

    auto compiled = compile_glob(pattern);
    if (is_err(compiled)) {
        return unwrap_err(compiled);
    }
    const auto& re = unwrap(compiled);
    try {
        for (const auto& entry : stdfs::recursive_directory_iterator(base_path)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            auto rel = stdfs::relative(entry.path(), root_).generic_string();
            if (std::regex_match(rel, re) && !matches_any(exclude_res, rel)) {
                files.push_back(rel);
            }
        }
    } catch (const stdfs::filesystem_error& e) {
        return std::string("could not search ") + base + " for pattern " + std::string(pattern) +
               ": " + e.what();
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// MockFileSystem
// ============================================================================

MockFileSystem::MockFileSystem(const std::vector<std::string>& files) {
    for (const auto& f : files) {
        add_file(f);
    }
}

void MockFileSystem::add_file(std::string_view path) {
    auto p = normalize(path);
    files_.insert(p);
    auto dir = parent_dir(p);
    while (dir != ".") {
        dirs_.insert(dir);
        dir = parent_dir(dir);
    }
}

void MockFileSystem::add_symlink(std::string_view path) {
    symlinks_.insert(normalize(path));
}

auto MockFileSystem::exists(std::string_view path) const -> bool {
    auto p = normalize(path);
    return p == "." || files_.contains(p) || dirs_.contains(p) || symlinks_.contains(p);
}

auto MockFileSystem::is_symlink(std::string_view path) const -> bool {
    return symlinks_.contains(normalize(path));
}

auto MockFileSystem::glob(std::string_view pattern, const std::vector<std::string>& excludes) const
    -> Result<std::vector<std::string>> {
    auto compiled = compile_glob(pattern);
    if (is_err(compiled)) {
        return unwrap_err(compiled);
    }
    auto excluded = compile_excludes(excludes);
    if (is_err(excluded)) {
        return unwrap_err(excluded);
    }
    const auto& re = unwrap(compiled);
    std::vector<std::string> files;
    for (const auto& f : files_) {
        if (std::regex_match(f, re) && !matches_any(unwrap(excluded), f)) {
            files.push_back(f);
        }
    }
    // std::set iteration is already sorted
    return files;
}

} // namespace transbuild::fs
