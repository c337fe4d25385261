//! # Package Boundaries
//!
//! Rewrites module-relative paths that cross into a sub-package.
//!
//! A directory is a package boundary when it holds the native description
//! file, or when it keeps its existing target build file (allowlisted or
//! symlinked) and holds one. Boundaries are queried on every call; nothing
//! is cached.
//!
//! ```text
//! module dir "x", x/y/Android.bp exists
//!
//!   "y/a.c"      -> "//x/y:a.c"
//!   "./y/z/b.c"  -> "//x/y:z/b.c"
//!   "c.c"        -> "c.c"
//!   "//p:t"      -> "//p:t"
//! ```

#pragma once

#include "config/config.hpp"
#include "label/label.hpp"

#include <string_view>

namespace transbuild::convert {

/// Returns true if the root-relative directory `dir` is a package boundary.
[[nodiscard]] auto is_package_boundary(const config::Config& config, std::string_view dir) -> bool;

/// Rewrites `label` relative to `base_dir` so that the deepest package
/// boundary becomes the `:` split.
///
/// Absolute addresses pass through. The original spelling is kept when set,
/// otherwise the input address is recorded as the spelling.
[[nodiscard]] auto transform_subpackage_path(const config::Config& config,
                                             std::string_view base_dir,
                                             const label::Label& label) -> label::Label;

/// Applies `transform_subpackage_path` to includes and excludes.
[[nodiscard]] auto transform_subpackage_paths(const config::Config& config,
                                              std::string_view base_dir,
                                              const label::LabelList& list) -> label::LabelList;

} // namespace transbuild::convert
