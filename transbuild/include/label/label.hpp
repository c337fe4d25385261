//! # Label Model
//!
//! Addresses of targets in the target build system.
//!
//! ## Overview
//!
//! | Type              | Purpose                                             |
//! |-------------------|-----------------------------------------------------|
//! | `Label`           | One address plus the spelling that produced it      |
//! | `LabelList`       | Ordered includes with a separate exclude list       |
//! | `ModuleReference` | Parsed `:name{.tag}` / `//ns:name{.tag}` reference  |
//!
//! ## Address forms
//!
//! - `//pkg/dir:target`: absolute, package `pkg/dir`
//! - `//:target`: absolute, top-level package
//! - `:target`: relative to the referring package
//! - `dir/file.c`: a file in the referring package
//!
//! Labels compare by address only. The original spelling is kept so that
//! later passes can rewrite references that turned out to live in another
//! package.

#ifndef TRANSBUILD_LABEL_LABEL_HPP
#define TRANSBUILD_LABEL_LABEL_HPP

#include "common.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transbuild::label {

/// Spelling of the top-level source directory.
inline constexpr std::string_view TOP_LEVEL_DIR = ".";

/// Address suffix rendered for a module reference that could not be resolved.
inline constexpr std::string_view MISSING_DEP_SUFFIX = "__BP2BUILD__MISSING__DEP";

// ============================================================================
// Label
// ============================================================================

/// A target-system address.
struct Label {
    std::string address;
    std::string original_spelling;

    Label() = default;
    explicit Label(std::string addr) : address(std::move(addr)) {}
    Label(std::string addr, std::string spelling)
        : address(std::move(addr)), original_spelling(std::move(spelling)) {}

    [[nodiscard]] auto empty() const -> bool {
        return address.empty();
    }

    bool operator==(const Label& other) const {
        return address == other.address;
    }

    bool operator<(const Label& other) const {
        return address < other.address;
    }
};

/// Hash functor for using `Label` as a key in unordered containers.
struct LabelHash {
    auto operator()(const Label& label) const -> size_t {
        return std::hash<std::string>{}(label.address);
    }
};

// ============================================================================
// LabelList
// ============================================================================

/// Ordered include labels plus labels excluded from them.
///
/// Excludes are subtracted by address equality. A list can be explicitly
/// empty, which renders as `[]` instead of being omitted.
class LabelList {
public:
    std::vector<Label> includes;
    std::vector<Label> excludes;

    LabelList() = default;
    explicit LabelList(std::vector<Label> incs) : includes(std::move(incs)) {}
    LabelList(std::vector<Label> incs, std::vector<Label> excs)
        : includes(std::move(incs)), excludes(std::move(excs)) {}

    /// Builds an empty list that was set explicitly.
    static auto make_explicitly_empty() -> LabelList;

    void add(Label label);
    void add_exclude(Label label);

    /// Appends another list's includes and excludes.
    void append(const LabelList& other);

    [[nodiscard]] auto is_empty() const -> bool {
        return includes.empty() && excludes.empty();
    }

    [[nodiscard]] auto is_explicitly_empty() const -> bool {
        return explicitly_empty_ && includes.empty();
    }

    /// Includes with duplicates removed, keeping the first occurrence.
    [[nodiscard]] auto unique_includes() const -> std::vector<Label>;

    /// Includes minus every label whose address appears in the excludes.
    [[nodiscard]] auto resolved() const -> std::vector<Label>;

    /// Addresses of the resolved includes.
    [[nodiscard]] auto addresses() const -> std::vector<std::string>;

    bool operator==(const LabelList& other) const {
        return includes == other.includes && excludes == other.excludes;
    }

private:
    bool explicitly_empty_ = false;
};

// ============================================================================
// Address Helpers
// ============================================================================

/// Returns true if `address` starts with `//`.
[[nodiscard]] auto is_absolute(std::string_view address) -> bool;

/// Renders `//<dir>:<name>`; the top-level directory renders as empty.
[[nodiscard]] auto make_address(std::string_view dir, std::string_view name) -> std::string;

/// Returns the part of a qualified address before `:`, or `std::nullopt`
/// when the address has no `:`.
[[nodiscard]] auto package_of(std::string_view address) -> std::optional<std::string>;

/// Returns the `:name` part of a qualified address.
[[nodiscard]] auto short_form(std::string_view address) -> std::optional<std::string>;

/// Returns true when both addresses are qualified and name the same package.
[[nodiscard]] auto same_package(std::string_view a, std::string_view b) -> bool;

/// Returns the package directory owning `address` as seen from `module_dir`.
///
/// `//x/y:a.proto` belongs to `x/y`; relative addresses belong to `module_dir`.
[[nodiscard]] auto package_dir_of(std::string_view module_dir, std::string_view address)
    -> std::string;

/// Splits labels by owning package directory.
///
/// Labels moved into another package are rewritten relative to that package
/// (`//x/y:a.proto` becomes `a.proto` under key `x/y`).
[[nodiscard]] auto partition_by_package(std::string_view module_dir, const LabelList& list)
    -> std::map<std::string, LabelList>;

// ============================================================================
// Module References
// ============================================================================

/// A parsed reference to another module.
struct ModuleReference {
    std::string name; ///< Module name, including a `//ns:` prefix when namespaced
    std::string tag;  ///< Output tag including its leading dot, or empty

    bool operator==(const ModuleReference&) const = default;
};

/// Classifies `text` as a module reference.
///
/// Returns `std::nullopt` for plain paths and patterns. `:name`,
/// `:name{.tag}` and `//ns:name{.tag}` parse into a reference; a reference
/// with an empty name, an unterminated tag or a namespace without `:` is an
/// error.
[[nodiscard]] auto parse_module_reference(std::string_view text)
    -> Result<std::optional<ModuleReference>>;

/// Returns true when `text` parses as a well-formed module reference.
[[nodiscard]] auto is_module_reference(std::string_view text) -> bool;

} // namespace transbuild::label

#endif // TRANSBUILD_LABEL_LABEL_HPP
