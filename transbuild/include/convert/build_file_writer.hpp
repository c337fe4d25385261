//! # Build File Writer
//!
//! Renders target declarations as target-system build files.
//!
//! ## Output Format
//!
//! ```text
//! load("//build/bazel/rules:filegroup.bzl", "filegroup")
//!
//! filegroup(
//!     name = "fg",
//!     srcs = [
//!         "a.c",
//!         "b.c",
//!     ],
//!     visible = True,
//! )
//! ```
//!
//! - `load` statements are sorted by file; symbols within a load are sorted
//! - `name` comes first, the remaining attributes are sorted
//! - single-element lists stay on one line
//! - unset labels and non-explicit empty label lists are omitted

#pragma once

#include "convert/target.hpp"
#include "diagnostic.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace transbuild::convert {

/// Rendered build files keyed by package directory.
using BuildFiles = std::map<std::string, std::string>;

/// File name written into every package directory.
inline constexpr const char* BUILD_FILE_NAME = "BUILD.bazel";

/// Renders a single target.
[[nodiscard]] auto render_target(const TargetDeclaration& target) -> std::string;

/// Groups targets by directory and renders one build file per directory.
[[nodiscard]] auto render_build_files(const std::vector<TargetDeclaration>& targets)
    -> BuildFiles;

/// Writes `files` below `out_dir`, creating package directories as needed.
[[nodiscard]] auto write_build_files(const std::filesystem::path& out_dir, const BuildFiles& files)
    -> Result<Ok, Diagnostic>;

} // namespace transbuild::convert
