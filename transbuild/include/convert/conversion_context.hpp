//! # Conversion Context
//!
//! Everything a module type sees while converting one module: the module
//! itself, read access to the rest of the graph, the configuration, and
//! the sinks for targets, errors and dependency bookkeeping.
//!
//! A context only ever writes to its own module, so contexts of different
//! modules can be used from different worker threads.

#pragma once

#include "config/config.hpp"
#include "convert/target.hpp"
#include "graph/module_graph.hpp"
#include "graph/module_type.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transbuild::convert {

class ConversionContext {
public:
    ConversionContext(graph::Module& module, graph::ModuleGraph& graph,
                      const config::Config& config, const graph::ModuleTypeRegistry& registry);

    [[nodiscard]] auto module() -> graph::Module& {
        return module_;
    }
    [[nodiscard]] auto module() const -> const graph::Module& {
        return module_;
    }
    [[nodiscard]] auto graph() const -> const graph::ModuleGraph& {
        return graph_;
    }
    [[nodiscard]] auto config() const -> const config::Config& {
        return config_;
    }
    [[nodiscard]] auto registry() const -> const graph::ModuleTypeRegistry& {
        return registry_;
    }

    /// Package directory of the module being converted.
    [[nodiscard]] auto dir() const -> const std::string& {
        return module_.dir();
    }

    [[nodiscard]] auto module_name() const -> const std::string& {
        return module_.name();
    }

    /// Records an error against the module. The conversion is discarded.
    void module_error(const char* code, std::string message);

    [[nodiscard]] auto has_errors() const -> bool {
        return error_count_ > 0;
    }

    void add_missing_dependency(const std::string& name);
    void add_unconverted_dependency(const std::string& name);

    /// Adds a conversion-only edge to `dependency` unless the pair is exempt.
    void add_conversion_dependency(graph::ModuleId dependency);

    /// Emits a target. `dir` defaults to the module directory.
    void create_target(TargetDeclaration target);

    /// Looks a module up from this module's namespace.
    [[nodiscard]] auto module_from_name(std::string_view name) const
        -> std::optional<graph::ModuleId>;

    /// Expands a root-relative pattern; errors are reported as `E002`.
    [[nodiscard]] auto glob(std::string_view pattern, const std::vector<std::string>& excludes)
        -> std::vector<std::string>;

private:
    graph::Module& module_;
    graph::ModuleGraph& graph_;
    const config::Config& config_;
    const graph::ModuleTypeRegistry& registry_;
    int error_count_ = 0;
};

} // namespace transbuild::convert
