//! # Conversion Decisions
//!
//! Decides per module whether conversion applies, and computes the labels
//! other modules use to refer to it.
//!
//! ## Precedence
//!
//! ```text
//! type not convertible                  -> false
//! API-surface-only mode                 -> type contributes API
//! top-level dir "." with explicit opt-in -> true
//! name and type allowlisted             -> conflict, false
//! denylisted                            -> false (conflict if name-allowlisted)
//! directory default true                -> conflict if name-allowlisted,
//!                                          else explicit opt-out may override
//! otherwise                             -> explicit opt-in/out, else allowlists
//! ```
//!
//! Decisions are pure: they read the module declaration and the immutable
//! configuration only, so any module may compute the decision of any other.

#pragma once

#include "config/config.hpp"
#include "diagnostic.hpp"
#include "graph/module.hpp"
#include "graph/module_type.hpp"

#include <string>

namespace transbuild::convert {

/// Outcome of `should_convert`.
struct Decision {
    bool convert = false;
    Diagnostics diagnostics; ///< Allowlist conflicts, one per conflict
};

[[nodiscard]] auto should_convert(const graph::Module& module, const config::Config& config,
                                  const graph::ModuleTypeRegistry& registry) -> Decision;

/// Returns `//<dir>:<name>` with a `prebuilt_` name prefix stripped.
[[nodiscard]] auto generated_label(const graph::Module& module) -> std::string;

/// Hand-authored label if set, else the generated label when `converts`,
/// else empty.
[[nodiscard]] auto target_label(const graph::Module& module, bool converts) -> std::string;

/// True when the module converts or carries a hand-authored label.
[[nodiscard]] auto converted_or_handcrafted(const graph::Module& module,
                                            const config::Config& config,
                                            const graph::ModuleTypeRegistry& registry) -> bool;

/// Label other modules use to reference `module`.
[[nodiscard]] auto module_label(const graph::Module& module, const config::Config& config,
                                const graph::ModuleTypeRegistry& registry) -> std::string;

} // namespace transbuild::convert
