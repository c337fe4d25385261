//! # Source Tree Access
//!
//! Read-only view of the source tree used by path resolution.
//!
//! All paths are relative to the source root and use `/` separators. The
//! top-level directory is `.`; `./x` and `x` name the same file.
//!
//! ## Implementations
//!
//! | Class            | Backing store                          |
//! |------------------|----------------------------------------|
//! | `OsFileSystem`   | `std::filesystem` under a root path    |
//! | `MockFileSystem` | In-memory file and symlink sets        |
//!
//! ## Glob syntax
//!
//! - `*` matches any run of characters except `/`
//! - `?` matches one character except `/`
//! - `**` as a whole segment matches zero or more directories

#pragma once

#include "common.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace transbuild::fs {

/// Joins root-relative path segments, dropping `.` segments.
[[nodiscard]] auto join(std::string_view dir, std::string_view rel) -> std::string;

/// Normalizes a root-relative path: strips `./` prefixes and trailing `/`.
[[nodiscard]] auto normalize(std::string_view path) -> std::string;

/// Returns the directory part of `path`, or `.` when it has none.
[[nodiscard]] auto parent_dir(std::string_view path) -> std::string;

/// Returns `path` relative to `dir` (which must be a prefix of it).
[[nodiscard]] auto relative_to(std::string_view dir, std::string_view path) -> std::string;

/// Returns true if `pattern` contains glob metacharacters.
[[nodiscard]] auto is_glob(std::string_view pattern) -> bool;

// ============================================================================
// FileSystem Interface
// ============================================================================

/// Abstract source-tree access.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Returns true if a file or directory exists at `path`.
    [[nodiscard]] virtual auto exists(std::string_view path) const -> bool = 0;

    /// Returns true if `path` itself is a symbolic link.
    [[nodiscard]] virtual auto is_symlink(std::string_view path) const -> bool = 0;

    /// Expands `pattern` into sorted, root-relative file paths.
    ///
    /// `*` and `?` stay within one path segment, `**` spans segments, and
    /// `[...]` or `[!...]` is a character class. A `[` with no closing `]`
    /// matches itself.
    ///
    /// Files matching any of `excludes` (also patterns) are dropped. Fails
    /// when the pattern or an exclude does not compile.
    [[nodiscard]] virtual auto glob(std::string_view pattern,
                                    const std::vector<std::string>& excludes) const
        -> Result<std::vector<std::string>> = 0;
};

// ============================================================================
// OsFileSystem
// ============================================================================

/// Source tree on disk.
class OsFileSystem : public FileSystem {
public:
    explicit OsFileSystem(std::filesystem::path root);

    [[nodiscard]] auto exists(std::string_view path) const -> bool override;
    [[nodiscard]] auto is_symlink(std::string_view path) const -> bool override;
    [[nodiscard]] auto glob(std::string_view pattern, const std::vector<std::string>& excludes) const
        -> Result<std::vector<std::string>> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& {
        return root_;
    }

private:
    std::filesystem::path root_;

    [[nodiscard]] auto resolve(std::string_view path) const -> std::filesystem::path;
};

// ============================================================================
// MockFileSystem
// ============================================================================

/// In-memory source tree for tests.
///
/// Directories exist implicitly when a file below them exists.
class MockFileSystem : public FileSystem {
public:
    MockFileSystem() = default;
    explicit MockFileSystem(const std::vector<std::string>& files);

    void add_file(std::string_view path);
    void add_symlink(std::string_view path);

    [[nodiscard]] auto exists(std::string_view path) const -> bool override;
    [[nodiscard]] auto is_symlink(std::string_view path) const -> bool override;
    [[nodiscard]] auto glob(std::string_view pattern, const std::vector<std::string>& excludes) const
        -> Result<std::vector<std::string>> override;

private:
    std::set<std::string> files_;
    std::set<std::string> dirs_;
    std::set<std::string> symlinks_;
};

} // namespace transbuild::fs
