//! # Mixed Execution
//!
//! Decides whether a module's outputs come from the external executor and
//! gives `MixedBuildable` implementations access to the query queue.
//!
//! A module executes externally when all of these hold:
//!
//! - its OS is not Windows
//! - it is enabled and has no missing dependencies
//! - it converts, or carries a hand-authored label
//! - it is in the mixed-execution allowlist
//! - its type is `MixedBuildable` and reports the module as supported

#pragma once

#include "config/config.hpp"
#include "graph/module_graph.hpp"
#include "graph/module_type.hpp"
#include "mixed/external_query.hpp"

#include <optional>
#include <string>
#include <vector>

namespace transbuild::mixed {

class MixedContext {
public:
    MixedContext(graph::Module& module, const config::Config& config,
                 const graph::ModuleTypeRegistry& registry, ExternalQueryQueue& queue);

    [[nodiscard]] auto module() -> graph::Module& {
        return module_;
    }
    [[nodiscard]] auto module() const -> const graph::Module& {
        return module_;
    }
    [[nodiscard]] auto config() const -> const config::Config& {
        return config_;
    }

    /// Label the external executor knows the module by.
    [[nodiscard]] auto label() const -> std::string;

    void queue(RequestType request, const ConfigurationKey& key);

    /// Reads an answer. An unanswered query is reported as `X001` and
    /// yields `std::nullopt`.
    auto answer(RequestType request, const ConfigurationKey& key)
        -> std::optional<std::vector<std::string>>;

    void module_error(const char* code, std::string message);

    [[nodiscard]] auto has_errors() const -> bool {
        return error_count_ > 0;
    }

private:
    graph::Module& module_;
    const config::Config& config_;
    const graph::ModuleTypeRegistry& registry_;
    ExternalQueryQueue& queue_;
    int error_count_ = 0;
};

/// Module-level conditions, independent of the module type.
[[nodiscard]] auto mixed_build_possible(const graph::Module& module, const config::Config& config,
                                        bool converted_or_handcrafted) -> bool;

/// Full eligibility check, including the type's `supported` hook.
[[nodiscard]] auto mixed_build_enabled(const MixedContext& ctx,
                                       const graph::ModuleTypeRegistry& registry,
                                       bool converted_or_handcrafted) -> bool;

} // namespace transbuild::mixed
