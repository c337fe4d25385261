//! # filegroup
//!
//! A named collection of source files.
//!
//! ## Properties
//!
//! | Property                   | Type        | Meaning                          |
//! |----------------------------|-------------|----------------------------------|
//! | `srcs`                     | string list | Files, globs, `:module` refs     |
//! | `exclude_srcs`             | string list | Removed from `srcs`              |
//! | `path`                     | string      | Import root of the sources       |
//! | `mixed_build_incompatible` | bool        | Opts out of mixed execution      |
//!
//! ## Conversion
//!
//! | Sources        | Targets                                             |
//! |----------------|-----------------------------------------------------|
//! | all `.aidl`    | `aidl_library`                                      |
//! | all `.proto`   | `proto_library` + `alias`, then `filegroup`         |
//! | anything else  | `filegroup`                                         |
//!
//! A filegroup whose only source is a file named like the module already
//! has a label (the file itself) and emits nothing.

#pragma once

#include "common.hpp"
#include "graph/module_type.hpp"
#include "graph/provider.hpp"

#include <string>
#include <vector>

namespace transbuild::modules {

inline constexpr const char* FILEGROUP_TYPE = "filegroup";

/// Suffix of the alias pointing at a converted `proto_library`.
inline constexpr const char* CONVERTED_PROTO_SUFFIX = "_bp2build_converted";

/// Output files of a filegroup built by the external executor.
struct FilegroupOutputs {
    std::vector<std::string> files; ///< Relative to the module dir plus `path`
};

inline constexpr graph::ProviderKey<FilegroupOutputs> FILEGROUP_OUTPUTS{"filegroup_outputs"};

/// Builds the `filegroup` type implementation.
[[nodiscard]] auto filegroup_type() -> graph::ModuleTypeSpec;

/// Registers `filegroup` with `registry`.
auto register_filegroup(graph::ModuleTypeRegistry& registry) -> Result<Ok>;

} // namespace transbuild::modules
