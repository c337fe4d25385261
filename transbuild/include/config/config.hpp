//! # Conversion Configuration
//!
//! The immutable configuration value handed to every transbuild component.
//!
//! ## Configuration File
//!
//! `load_config()` reads a TOML subset:
//!
//! | Section                      | Contents                                     |
//! |------------------------------|----------------------------------------------|
//! | `[conversion]`               | mode, jobs, target OS/arch, file names       |
//! | `[directories]`              | `"dir" = "true_recursively"` defaults        |
//! | `[keep_existing_build_file]` | `"dir" = true` (recursive) / `false`         |
//! | `[modules]`                  | always/type/do-not convert lists             |
//! | `[mixed_build]`              | mixed-execution allowlist                    |
//! | `[dependency_exemptions]`    | conversion-edge carve-outs                   |
//! | `[tagged_outputs]`           | modules whose `{.tag}` references keep tags  |
//! | `[log]`                      | level, filter, file, format                  |
//!
//! ```toml
//! [conversion]
//! mode = "full"
//! allow_missing_dependencies = true
//! jobs = 8
//!
//! [directories]
//! "external/zlib" = "true_recursively"
//! "external/zlib/contrib" = "false"
//!
//! [modules]
//! always_convert = ["libfoo"]
//! ```

#ifndef TRANSBUILD_CONFIG_CONFIG_HPP
#define TRANSBUILD_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "config/allowlist.hpp"
#include "diagnostic.hpp"
#include "fs/filesystem.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace transbuild::config {

/// What the conversion phase produces.
enum class ConversionMode {
    Full,           ///< Convert allowlisted modules
    ApiSurfaceOnly, ///< Convert only modules contributing API surfaces
};

/// Operating systems a module can target.
enum class OsType {
    Common,
    Android,
    Linux,
    LinuxBionic,
    Darwin,
    Windows,
};

[[nodiscard]] auto os_name(OsType os) -> const char*;
[[nodiscard]] auto parse_os(std::string_view text) -> std::optional<OsType>;

/// Module pairs for which no conversion-only edge is created.
///
/// A module listed in `source_modules` never gets conversion edges (e.g. a
/// library that depends on a variant of itself); a name in `dependencies`
/// never receives them.
struct DependencyExemptions {
    std::set<std::string, std::less<>> source_modules;
    std::set<std::string, std::less<>> dependencies;

    [[nodiscard]] auto exempts(std::string_view source, std::string_view dependency) const
        -> bool {
        return source_modules.find(source) != source_modules.end() ||
               dependencies.find(dependency) != dependencies.end();
    }
};

/// Modules whose tagged references (`:name{.tag}`) keep the tag in labels.
struct TaggedOutputRules {
    /// Module names whose every tag is kept.
    std::set<std::string, std::less<>> module_names;
    /// Module type -> tags kept for modules of that type.
    std::map<std::string, std::set<std::string>, std::less<>> module_type_tags;

    [[nodiscard]] auto keeps_tag(std::string_view name, std::string_view type,
                                 std::string_view tag) const -> bool;
};

/// Complete conversion configuration.
///
/// Built once, then only read through `const Config&`.
struct Config {
    Allowlist allowlist;
    ConversionMode mode = ConversionMode::Full;
    bool allow_missing_dependencies = false;

    OsType target_os = OsType::Android;
    std::string target_arch = "arm64";

    /// Worker count per phase; 0 uses the hardware concurrency.
    int jobs = 0;

    /// Modules allowed to be built by the external executor.
    std::set<std::string, std::less<>> mixed_build_allowlist;

    DependencyExemptions dependency_exemptions;
    TaggedOutputRules tagged_outputs;

    /// Native description file marking a package boundary.
    std::string native_build_file = "Android.bp";
    /// Target-system build files honoured in kept or symlinked directories.
    std::vector<std::string> target_build_files = {"BUILD", "BUILD.bazel"};

    log::LogConfig log;

    /// Source tree; shared with every component reading the tree.
    Rc<fs::FileSystem> filesystem;

    [[nodiscard]] auto mixed_build_allowlisted(std::string_view name) const -> bool {
        return mixed_build_allowlist.find(name) != mixed_build_allowlist.end();
    }

    /// Configuration with the built-in exemptions and tagged-output rules.
    static auto with_defaults(Rc<fs::FileSystem> filesystem) -> Config;
};

// ============================================================================
// Loading
// ============================================================================

/// Parser for the configuration TOML subset.
///
/// Handles:
/// - Sections: [section]
/// - Key-value pairs: key = "value", "quoted/key" = "value"
/// - Numbers: key = 123
/// - Booleans: key = true
/// - Arrays: key = ["value1", "value2"] (may span lines)
/// - Comments: # ...
class ConfigParser {
public:
    explicit ConfigParser(const std::string& content);

    /// Parses the content on top of `base`.
    std::optional<Config> parse(Config base);

    /// Error message if parsing failed, prefixed with the line number.
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;
    bool explicit_log_level_ = false;

    void skip_whitespace();
    void skip_whitespace_and_newlines();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_key();
    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int> parse_number();
    std::optional<bool> parse_boolean();
    std::optional<std::vector<std::string>> parse_string_array();

    bool apply_conversion(Config& config, const std::string& key);
    bool apply_directories(Config& config, const std::string& key);
    bool apply_keep_existing(Config& config, const std::string& key);
    bool apply_modules(Config& config, const std::string& key);
    bool apply_mixed_build(Config& config, const std::string& key);
    bool apply_exemptions(Config& config, const std::string& key);
    bool apply_tagged_outputs(Config& config, const std::string& key);
    bool apply_log(Config& config, const std::string& key);

    void set_error(const std::string& message);
};

/// Reads and parses the configuration file at `path`; the filesystem is
/// rooted at `source_root`.
///
/// Errors are `C001` diagnostics carrying the file path and line number.
[[nodiscard]] auto load_config(const std::filesystem::path& path,
                               const std::filesystem::path& source_root)
    -> Result<Config, Diagnostic>;

/// Parses configuration text; used by `load_config()` and tests.
[[nodiscard]] auto parse_config(const std::string& content, Rc<fs::FileSystem> filesystem)
    -> Result<Config, Diagnostic>;

} // namespace transbuild::config

#endif // TRANSBUILD_CONFIG_CONFIG_HPP
