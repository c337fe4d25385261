//! # Conversion Pipeline
//!
//! Wires the standard phases onto the scheduler.
//!
//! ## Phases
//!
//! | # | Phase           | Order     | Work                                    |
//! |---|-----------------|-----------|-----------------------------------------|
//! | 1 | `deps`          | BottomUp  | Declared deps and `:module` references  |
//! | 2 | `convert`       | TopDown   | Decision, conversion, `conversion`      |
//! | 3 | `mixed_queue`   | Parallel  | Eligible modules queue queries          |
//! | 4 | `mixed_answer`  | barrier   | External executor answers               |
//! | 5 | `mixed_process` | BottomUp  | Eligible modules read answers           |
//!
//! Phases 3-5 only run when an external executor is attached.
//!
//! `deps` creates the edges it would otherwise be ordered by, so it is
//! ordered by `declared_dependency_lists()` instead. A module whose
//! declared dependency failed discovery fails with `G002` before
//! `convert`.
//!
//! ## Example
//!
//! ```cpp
//! ConversionPipeline pipeline(graph, config, registry);
//! auto result = pipeline.run();
//! auto files = render_build_files(result.targets);
//! ```

#pragma once

#include "config/config.hpp"
#include "convert/target.hpp"
#include "diagnostic.hpp"
#include "graph/module_graph.hpp"
#include "graph/module_type.hpp"
#include "graph/provider.hpp"
#include "mixed/external_query.hpp"
#include "sched/scheduler.hpp"

#include <string>
#include <vector>

namespace transbuild::convert {

/// Published by every module reaching the `convert` phase.
struct ConversionOutput {
    bool converted = false;
    std::string label; ///< Label other modules reference
    std::vector<TargetDeclaration> targets;
};

inline constexpr graph::ProviderKey<ConversionOutput> CONVERSION{"conversion"};

/// Published in `mixed_queue`: whether the module executes externally.
inline constexpr graph::ProviderKey<bool> MIXED_BUILD{"mixed_build"};

/// Outcome of a pipeline run.
struct PipelineResult {
    std::vector<TargetDeclaration> targets; ///< In module order
    Diagnostics diagnostics;                ///< All module diagnostics, in module order
    std::vector<sched::PhaseStats> stats;
    size_t converted = 0;
    size_t failed = 0;

    [[nodiscard]] auto ok() const -> bool {
        return diagnostics.empty();
    }
};

class ConversionPipeline {
public:
    ConversionPipeline(graph::ModuleGraph& graph, const config::Config& config,
                       const graph::ModuleTypeRegistry& registry);

    /// Attaches the executor answering mixed-execution queries.
    void set_executor(mixed::ExternalExecutor* executor) {
        executor_ = executor;
    }

    auto run() -> PipelineResult;

    [[nodiscard]] auto queries() const -> const mixed::ExternalQueryQueue& {
        return queries_;
    }

    /// Per module, the modules its declared deps and path-property
    /// references resolve to. Unresolvable names are left to `deps_step`.
    [[nodiscard]] auto declared_dependency_lists() const -> graph::AdjacencyList;

    // Phase steps, exposed for tests driving a single phase.
    bool deps_step(graph::Module& module);
    bool convert_step(graph::Module& module);
    bool mixed_queue_step(graph::Module& module);
    bool mixed_process_step(graph::Module& module);

private:
    graph::ModuleGraph& graph_;
    const config::Config& config_;
    const graph::ModuleTypeRegistry& registry_;
    mixed::ExternalExecutor* executor_ = nullptr;
    mixed::ExternalQueryQueue queries_;

    void apply_handcrafted_labels();
    bool add_dependency(graph::Module& module, const std::string& name, graph::DependencyTag tag);
};

} // namespace transbuild::convert
