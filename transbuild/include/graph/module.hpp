//! # Module Nodes
//!
//! Vertices of the module graph.
//!
//! A module is created from a `ModuleDecl` (the already-parsed declaration)
//! when the graph is loaded and lives until the graph is destroyed. Phases
//! mutate its runtime state: edges, conversion status, diagnostics, the
//! failed flag and its providers. Only the module's own step writes them.

#pragma once

#include "config/config.hpp"
#include "convert/target.hpp"
#include "diagnostic.hpp"
#include "graph/provider.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace transbuild::graph {

using ModuleId = size_t;

// ============================================================================
// Edges
// ============================================================================

/// Role of a dependency edge.
enum class DependencyTag {
    Ordinary,        ///< Declared dependency
    OutputReference, ///< `:name` reference found in a path property
    License,         ///< License metadata dependency
    ConversionOnly,  ///< Bookkeeping edge added while converting
};

[[nodiscard]] auto dependency_tag_name(DependencyTag tag) -> const char*;

struct Edge {
    ModuleId target;
    DependencyTag tag;

    bool operator==(const Edge&) const = default;
};

/// A dependency named in the module declaration.
struct DeclaredDependency {
    std::string name;
    DependencyTag tag = DependencyTag::Ordinary;
};

// ============================================================================
// Properties
// ============================================================================

using PropertyValue = std::variant<bool, std::string, std::vector<std::string>>;

/// Typed property values of a module declaration.
class PropertyBag {
public:
    void set(std::string name, PropertyValue value);

    [[nodiscard]] auto has(std::string_view name) const -> bool;

    [[nodiscard]] auto get_bool(std::string_view name) const -> std::optional<bool>;

    /// Returns nullptr when absent or not a string.
    [[nodiscard]] auto get_string(std::string_view name) const -> const std::string*;

    /// Returns nullptr when absent or not a list; an empty list that was set
    /// is returned as an empty vector.
    [[nodiscard]] auto get_list(std::string_view name) const -> const std::vector<std::string>*;

    [[nodiscard]] auto list_or_empty(std::string_view name) const -> std::vector<std::string>;

private:
    std::map<std::string, PropertyValue, std::less<>> values_;
};

// ============================================================================
// Module
// ============================================================================

/// An already-parsed module declaration.
struct ModuleDecl {
    std::string name;
    std::string module_namespace; ///< Empty for the root namespace
    std::string type;
    std::string dir = "."; ///< Package path; the top level is "."
    PropertyBag properties;
    std::vector<DeclaredDependency> deps;

    bool enabled = true;
    std::optional<bool> convert_opt_in;           ///< Explicit conversion opt-in/opt-out
    std::optional<std::string> handcrafted_label; ///< Hand-authored target label
    std::optional<config::OsType> os;             ///< Overrides the configured target OS
};

/// Outcome of converting one module.
struct ConversionStatus {
    bool converted = false;
    std::vector<convert::TargetDeclaration> targets;
    std::vector<std::string> missing_deps;
    std::vector<std::string> unconverted_deps;
};

/// A graph vertex.
struct Module {
    explicit Module(ModuleDecl declaration, ModuleId module_id)
        : decl(std::move(declaration)), id(module_id) {}

    ModuleDecl decl;
    ModuleId id;

    std::vector<Edge> edges;
    ConversionStatus status;
    Diagnostics diagnostics;
    bool failed = false;
    ProviderStore providers;

    [[nodiscard]] auto name() const -> const std::string& {
        return decl.name;
    }
    [[nodiscard]] auto type() const -> const std::string& {
        return decl.type;
    }
    [[nodiscard]] auto dir() const -> const std::string& {
        return decl.dir;
    }

    /// Records an error diagnostic against this module.
    void error(const char* code, std::string message) {
        diagnostics.push_back(Diagnostic{code, decl.name, std::move(message)});
    }

    [[nodiscard]] auto os(const config::Config& config) const -> config::OsType {
        return decl.os.value_or(config.target_os);
    }
};

} // namespace transbuild::graph
