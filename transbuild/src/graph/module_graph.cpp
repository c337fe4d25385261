//! # Module Graph
//!
//! Module storage, name lookup and the ordering helpers used by the
//! scheduler.
//!
//! ## Ordering
//!
//! ```text
//! dependency_lists()  -> snapshot taken when a phase starts
//! reverse()           -> dependents, for bottom-up readiness and top-down order
//! cycle_members()     -> Tarjan SCCs with more than one member
//! ```

#include "graph/module_graph.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <functional>

namespace transbuild::graph {

auto ModuleGraph::add_module(ModuleDecl decl) -> Result<ModuleId, Diagnostic> {
    auto key = std::make_pair(decl.module_namespace, decl.name);
    if (by_name_.contains(key)) {
        std::string where = decl.module_namespace.empty() ? "" : " in namespace //" +
                                                                     decl.module_namespace;
        return Diagnostic{ErrorCodes::PKG_NAME_COLLISION, decl.name,
                          "module \"" + decl.name + "\" already defined" + where};
    }

    ModuleId id = modules_.size();
    modules_.push_back(make_box<Module>(std::move(decl), id));
    by_name_.emplace(std::move(key), id);
    return id;
}

auto ModuleGraph::find(std::string_view name, std::string_view from_namespace) const
    -> std::optional<ModuleId> {
    if (name.starts_with("//")) {
        auto colon = name.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        auto it = by_name_.find(
            {std::string(name.substr(2, colon - 2)), std::string(name.substr(colon + 1))});
        if (it == by_name_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    if (!from_namespace.empty()) {
        auto it = by_name_.find({std::string(from_namespace), std::string(name)});
        if (it != by_name_.end()) {
            return it->second;
        }
    }
    auto it = by_name_.find({std::string(), std::string(name)});
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ModuleGraph::add_edge(ModuleId from, ModuleId to, DependencyTag tag) {
    auto& edges = modules_[from]->edges;
    Edge edge{to, tag};
    if (std::find(edges.begin(), edges.end(), edge) == edges.end()) {
        edges.push_back(edge);
        TRANSBUILD_LOG_TRACE("sched", "Edge " << modules_[from]->name() << " -> "
                                              << modules_[to]->name() << " ("
                                              << dependency_tag_name(tag) << ")");
    }
}

auto ModuleGraph::dependencies(ModuleId id) const -> std::vector<ModuleId> {
    std::vector<ModuleId> result;
    for (const auto& edge : modules_[id]->edges) {
        if (edge.target != id &&
            std::find(result.begin(), result.end(), edge.target) == result.end()) {
            result.push_back(edge.target);
        }
    }
    return result;
}

auto ModuleGraph::dependency_lists() const -> AdjacencyList {
    AdjacencyList lists(modules_.size());
    for (ModuleId id = 0; id < modules_.size(); ++id) {
        lists[id] = dependencies(id);
    }
    return lists;
}

auto ModuleGraph::reverse(const AdjacencyList& deps) -> AdjacencyList {
    AdjacencyList rdeps(deps.size());
    for (ModuleId id = 0; id < deps.size(); ++id) {
        for (ModuleId dep : deps[id]) {
            rdeps[dep].push_back(id);
        }
    }
    return rdeps;
}

auto ModuleGraph::cycle_members(const AdjacencyList& deps) -> std::set<ModuleId> {
    // Tarjan's strongly connected components
    std::vector<int> index(deps.size(), -1);
    std::vector<int> lowlink(deps.size(), 0);
    std::vector<bool> on_stack(deps.size(), false);
    std::vector<ModuleId> stack;
    std::set<ModuleId> members;
    int next_index = 0;

    std::function<void(ModuleId)> strongconnect = [&](ModuleId v) {
        index[v] = lowlink[v] = next_index++;
        stack.push_back(v);
        on_stack[v] = true;

        for (ModuleId w : deps[v]) {
            if (index[w] < 0) {
                strongconnect(w);
                lowlink[v] = std::min(lowlink[v], lowlink[w]);
            } else if (on_stack[w]) {
                lowlink[v] = std::min(lowlink[v], index[w]);
            }
        }

        if (lowlink[v] == index[v]) {
            std::vector<ModuleId> component;
            ModuleId w;
            do {
                w = stack.back();
                stack.pop_back();
                on_stack[w] = false;
                component.push_back(w);
            } while (w != v);

            if (component.size() > 1) {
                members.insert(component.begin(), component.end());
            }
        }
    };

    for (ModuleId v = 0; v < deps.size(); ++v) {
        if (index[v] < 0) {
            strongconnect(v);
        }
    }
    return members;
}

} // namespace transbuild::graph
