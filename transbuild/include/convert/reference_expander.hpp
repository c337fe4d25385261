//! # Reference Expander
//!
//! Turns the path and dependency properties of a module into label lists.
//!
//! ## Entry Points
//!
//! | Method              | Input                                           |
//! |---------------------|-------------------------------------------------|
//! | `expand_srcs`       | paths, globs and `:module` references           |
//! | `expand_deps`       | module names and references only                |
//! | `expand_src_single` | one source property                             |
//! | `expand_dep_single` | one dependency property                         |
//! | `expand_pattern`    | a glob relative to any directory                |
//! | `string_or_label`   | a property that is either a label or a string   |
//!
//! ## Module references
//!
//! A reference resolves to the referred module's label (the short `:name`
//! form inside the same package). An unknown module becomes the sentinel
//! `:<name>__BP2BUILD__MISSING__DEP` and is recorded as a missing
//! dependency; a known module that does not convert is recorded as an
//! unconverted dependency. Resolving a reference also adds a
//! conversion-only edge unless the caller opts out.

#pragma once

#include "convert/conversion_context.hpp"
#include "label/label.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace transbuild::convert {

/// A property value classified as a label or a plain string.
using StringOrLabel = std::variant<std::string, label::Label>;

class ReferenceExpander {
public:
    explicit ReferenceExpander(ConversionContext& ctx) : ctx_(ctx) {}

    /// Expands `paths` minus `excludes`, both relative to the module dir.
    ///
    /// Excludes are expanded first without adding edges; the result carries
    /// them as its exclude list. Sub-package crossings are rewritten.
    auto expand_srcs(const std::vector<std::string>& paths,
                     const std::vector<std::string>& excludes = {}) -> label::LabelList;

    /// Expands a dependency list. Bare names are read as `:name`.
    ///
    /// `std::nullopt` yields an empty list; an empty vector yields an
    /// explicitly empty list.
    auto expand_deps(const std::optional<std::vector<std::string>>& modules,
                     const std::vector<std::string>& excludes = {}) -> label::LabelList;

    /// First label of `expand_srcs({path})`, or an empty label.
    auto expand_src_single(const std::string& path) -> label::Label;

    /// First label of `expand_deps({name})`, or an empty label.
    auto expand_dep_single(const std::string& name) -> label::Label;

    /// Globs `pattern` under the root-relative `dir`.
    ///
    /// Matches become `./`-relative labels rewritten against `dir`.
    auto expand_pattern(std::string_view dir, std::string_view pattern,
                        const std::vector<std::string>& excludes = {}) -> label::LabelList;

    /// Classifies `value` as a module reference, a file directly in the
    /// module dir, or a plain string.
    auto string_or_label(const std::string& value) -> StringOrLabel;

    /// Resolves one module reference to a label.
    auto other_module_label(const label::ModuleReference& ref, bool mark_as_dep) -> label::Label;

private:
    ConversionContext& ctx_;

    auto expand_srcs_impl(const std::vector<std::string>& paths,
                          const std::vector<std::string>& excluded, bool mark_as_deps)
        -> label::LabelList;

    auto expand_deps_impl(const std::vector<std::string>& modules, bool mark_as_deps)
        -> label::LabelList;
};

} // namespace transbuild::convert
