//! # Conversion Allowlist
//!
//! Which modules and directories are converted to the target build system.
//!
//! ## Sources of a decision
//!
//! | Set                          | Keyed by    | Effect                         |
//! |------------------------------|-------------|--------------------------------|
//! | directory defaults           | directory   | convert everything (not) here  |
//! | `module_always_convert`      | module name | opt in                         |
//! | `module_type_always_convert` | module type | opt in                         |
//! | `module_do_not_convert`      | module name | opt out                        |
//! | keep-existing-build-file     | directory   | package boundary hint          |
//!
//! The allowlist is built once with the `set_*` builder methods and then
//! only read; it is shared between worker threads without locking.

#ifndef TRANSBUILD_CONFIG_ALLOWLIST_HPP
#define TRANSBUILD_CONFIG_ALLOWLIST_HPP

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace transbuild::config {

/// Per-directory conversion default.
enum class DirectoryDefault {
    Unset,
    True,             ///< Convert every module in exactly this directory
    TrueRecursively,  ///< Convert every module in this directory and below
    False,            ///< Convert nothing in exactly this directory
    FalseRecursively, ///< Convert nothing in this directory and below
};

/// Parses `"true"`, `"true_recursively"`, `"false"`, `"false_recursively"`.
[[nodiscard]] auto parse_directory_default(std::string_view text)
    -> std::optional<DirectoryDefault>;

[[nodiscard]] auto directory_default_name(DirectoryDefault value) -> const char*;

using DirectoryDefaults = std::map<std::string, DirectoryDefault, std::less<>>;

/// Result of resolving a directory default.
struct DirectoryDecision {
    bool convert = false;
    std::string matched_prefix; ///< Entry that decided, or the queried path
};

/// Resolves the default for `package_path`.
///
/// An exact entry wins outright. Otherwise the deepest recursive entry on
/// the path from the root decides; plain `True`/`False` entries never apply
/// to subdirectories. No match yields `false` scoped to `package_path`.
[[nodiscard]] auto resolve_directory_default(std::string_view package_path,
                                             const DirectoryDefaults& defaults)
    -> DirectoryDecision;

// ============================================================================
// Allowlist
// ============================================================================

class Allowlist {
public:
    Allowlist() = default;

    /// Merges `defaults` into the directory defaults.
    auto set_default_config(const DirectoryDefaults& defaults) -> Allowlist&;

    /// Merges `dirs` (directory -> recursive) into the keep-existing map.
    auto set_keep_existing_build_file(const std::map<std::string, bool>& dirs) -> Allowlist&;

    auto set_module_always_convert(const std::vector<std::string>& names) -> Allowlist&;
    auto set_module_type_always_convert(const std::vector<std::string>& types) -> Allowlist&;
    auto set_module_do_not_convert(const std::vector<std::string>& names) -> Allowlist&;

    [[nodiscard]] auto module_always_convert(std::string_view name) const -> bool;
    [[nodiscard]] auto module_type_always_convert(std::string_view type) const -> bool;
    [[nodiscard]] auto module_do_not_convert(std::string_view name) const -> bool;

    /// Returns true if a checked-in build file in `dir` is kept.
    ///
    /// Exact entries always match; recursive entries also match every
    /// directory below them.
    [[nodiscard]] auto should_keep_existing_build_file(std::string_view dir) const -> bool;

    [[nodiscard]] auto directory_default(std::string_view package_path) const
        -> DirectoryDecision {
        return resolve_directory_default(package_path, default_config_);
    }

    [[nodiscard]] auto default_config() const -> const DirectoryDefaults& {
        return default_config_;
    }

    [[nodiscard]] auto keep_existing_build_file() const -> const std::map<std::string, bool>& {
        return keep_existing_build_file_;
    }

private:
    DirectoryDefaults default_config_;
    std::map<std::string, bool> keep_existing_build_file_;
    std::set<std::string, std::less<>> module_always_convert_;
    std::set<std::string, std::less<>> module_type_always_convert_;
    std::set<std::string, std::less<>> module_do_not_convert_;
};

} // namespace transbuild::config

#endif // TRANSBUILD_CONFIG_ALLOWLIST_HPP
