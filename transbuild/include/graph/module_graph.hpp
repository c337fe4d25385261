//! # Module Graph
//!
//! Owns every module and the directed dependency edges between them.
//!
//! ## Lookup
//!
//! | Spelling      | Resolves to                                           |
//! |---------------|-------------------------------------------------------|
//! | `name`        | `name` in the caller's namespace, else the root one  |
//! | `//ns:name`   | `name` in namespace `ns`                              |
//!
//! ## Thread Safety
//!
//! Modules are added before any phase runs. During a phase a module's
//! edges are mutated only by that module's own step, so `add_edge` takes
//! no lock; ordering information is snapshotted with `dependency_lists()`
//! when a phase starts.

#ifndef TRANSBUILD_GRAPH_MODULE_GRAPH_HPP
#define TRANSBUILD_GRAPH_MODULE_GRAPH_HPP

#include "common.hpp"
#include "diagnostic.hpp"
#include "graph/module.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace transbuild::graph {

/// Adjacency lists indexed by module id.
using AdjacencyList = std::vector<std::vector<ModuleId>>;

class ModuleGraph {
public:
    ModuleGraph() = default;
    ModuleGraph(const ModuleGraph&) = delete;
    ModuleGraph& operator=(const ModuleGraph&) = delete;

    /// Adds a module. Fails when the name is already taken in its namespace.
    auto add_module(ModuleDecl decl) -> Result<ModuleId, Diagnostic>;

    [[nodiscard]] auto size() const -> size_t {
        return modules_.size();
    }

    [[nodiscard]] auto module(ModuleId id) -> Module& {
        return *modules_[id];
    }
    [[nodiscard]] auto module(ModuleId id) const -> const Module& {
        return *modules_[id];
    }

    /// Looks `name` up as seen from a module in `from_namespace`.
    [[nodiscard]] auto find(std::string_view name, std::string_view from_namespace = "") const
        -> std::optional<ModuleId>;

    /// Adds an edge unless the same (target, tag) edge exists already.
    void add_edge(ModuleId from, ModuleId to, DependencyTag tag);

    /// Distinct dependency targets of `id`, in edge order, without self-edges.
    [[nodiscard]] auto dependencies(ModuleId id) const -> std::vector<ModuleId>;

    /// Snapshot of `dependencies()` for every module.
    [[nodiscard]] auto dependency_lists() const -> AdjacencyList;

    /// Inverts an adjacency list (dependencies -> dependents).
    [[nodiscard]] static auto reverse(const AdjacencyList& deps) -> AdjacencyList;

    /// Modules that sit on a dependency cycle of `deps`.
    [[nodiscard]] static auto cycle_members(const AdjacencyList& deps) -> std::set<ModuleId>;

private:
    std::vector<Box<Module>> modules_;
    std::map<std::pair<std::string, std::string>, ModuleId> by_name_;
};

} // namespace transbuild::graph

#endif // TRANSBUILD_GRAPH_MODULE_GRAPH_HPP
