//! # Conversion Pipeline Implementation
//!
//! ```text
//! apply_handcrafted_labels   # single-threaded, before any phase
//! deps           BottomUp    # edges, missing deps; ordered by declared references
//! convert        TopDown     # should_convert + type conversion
//! mixed_queue    Parallel    # MIXED_BUILD + external queries
//! mixed_answer   barrier     # ExternalQueryQueue::answer_all
//! mixed_process  BottomUp    # type consume hook
//! ```

#include "convert/pipeline.hpp"

#include "convert/conversion_context.hpp"
#include "convert/decision.hpp"
#include "log/log.hpp"
#include "mixed/mixed_context.hpp"

#include <algorithm>

namespace transbuild::convert {

ConversionPipeline::ConversionPipeline(graph::ModuleGraph& graph, const config::Config& config,
                                       const graph::ModuleTypeRegistry& registry)
    : graph_(graph), config_(config), registry_(registry) {}

void ConversionPipeline::apply_handcrafted_labels() {
    for (graph::ModuleId id = 0; id < graph_.size(); ++id) {
        auto& module = graph_.module(id);
        if (module.decl.handcrafted_label) {
            continue;
        }
        const auto* spec = registry_.find(module.type());
        if (!spec || !spec->handcrafted_label) {
            continue;
        }
        if (auto handcrafted = spec->handcrafted_label(module)) {
            TRANSBUILD_LOG_DEBUG("convert", "Module " << module.name() << " uses hand-authored "
                                                      << *handcrafted);
            module.decl.handcrafted_label = std::move(*handcrafted);
        }
    }
}

// ============================================================================
// deps
// ============================================================================

bool ConversionPipeline::add_dependency(graph::Module& module, const std::string& name,
                                        graph::DependencyTag tag) {
    if (auto id = graph_.find(name, module.decl.module_namespace)) {
        graph_.add_edge(module.id, *id, tag);
        return true;
    }

    if (config_.allow_missing_dependencies) {
        auto& missing = module.status.missing_deps;
        if (std::find(missing.begin(), missing.end(), name) == missing.end()) {
            missing.push_back(name);
        }
        return true;
    }

    module.error(ErrorCodes::REF_MISSING_DEPENDENCY, "depends on undefined module \"" + name + "\"");
    return false;
}

namespace {

/// Names referenced as `:module` in the path properties of `module`'s type.
/// Malformed references are appended to `malformed` when it is set.
auto path_references(const graph::Module& module, const graph::ModuleTypeRegistry& registry,
                     std::vector<std::string>* malformed) -> std::vector<std::string> {
    std::vector<std::string> names;
    const auto* spec = registry.find(module.type());
    if (!spec) {
        return names;
    }

    for (const auto& property : spec->path_properties) {
        std::vector<std::string> values = module.decl.properties.list_or_empty(property);
        if (const auto* single = module.decl.properties.get_string(property)) {
            values.push_back(*single);
        }

        for (const auto& value : values) {
            auto parsed = label::parse_module_reference(value);
            if (is_err(parsed)) {
                if (malformed) {
                    malformed->push_back(unwrap_err(parsed));
                }
                continue;
            }
            if (const auto& ref = unwrap(parsed)) {
                names.push_back(ref->name);
            }
        }
    }
    return names;
}

} // namespace

auto ConversionPipeline::declared_dependency_lists() const -> graph::AdjacencyList {
    graph::AdjacencyList lists(graph_.size());
    for (graph::ModuleId id = 0; id < graph_.size(); ++id) {
        const auto& module = graph_.module(id);
        auto add = [&](const std::string& name) {
            auto dep = graph_.find(name, module.decl.module_namespace);
            auto& list = lists[id];
            if (dep && *dep != id && std::find(list.begin(), list.end(), *dep) == list.end()) {
                list.push_back(*dep);
            }
        };
        for (const auto& dep : module.decl.deps) {
            add(dep.name);
        }
        for (const auto& name : path_references(module, registry_, nullptr)) {
            add(name);
        }
    }
    return lists;
}

bool ConversionPipeline::deps_step(graph::Module& module) {
    bool ok = true;
    for (const auto& dep : module.decl.deps) {
        ok = add_dependency(module, dep.name, dep.tag) && ok;
    }

    std::vector<std::string> malformed;
    for (const auto& name : path_references(module, registry_, &malformed)) {
        ok = add_dependency(module, name, graph::DependencyTag::OutputReference) && ok;
    }
    for (auto& message : malformed) {
        module.error(ErrorCodes::REF_MALFORMED, std::move(message));
        ok = false;
    }
    return ok;
}

// ============================================================================
// convert
// ============================================================================

bool ConversionPipeline::convert_step(graph::Module& module) {
    auto decision = should_convert(module, config_, registry_);
    for (auto& diagnostic : decision.diagnostics) {
        module.diagnostics.push_back(std::move(diagnostic));
    }

    ConversionOutput output;
    if (!decision.convert) {
        output.label = module_label(module, config_, registry_);
        module.providers.set(CONVERSION, std::move(output));
        return true;
    }

    ConversionContext ctx(module, graph_, config_, registry_);
    const auto* spec = registry_.find(module.type());
    if (config_.mode == config::ConversionMode::ApiSurfaceOnly) {
        if (const auto* api = spec->capability<graph::ApiContributor>()) {
            api->convert_api(ctx);
        }
    } else if (const auto* convertible = spec->capability<graph::Convertible>()) {
        convertible->convert(ctx);
    }

    if (ctx.has_errors()) {
        module.status.targets.clear();
        module.status.converted = false;
        output.label = generated_label(module);
        module.providers.set(CONVERSION, std::move(output));
        return false;
    }

    module.status.converted = true;
    output.converted = true;
    output.label = target_label(module, true);
    output.targets = module.status.targets;
    module.providers.set(CONVERSION, std::move(output));
    return true;
}

// ============================================================================
// mixed_queue / mixed_process
// ============================================================================

bool ConversionPipeline::mixed_queue_step(graph::Module& module) {
    const auto* conversion = module.providers.find(CONVERSION);
    bool converted_or_handcrafted =
        module.decl.handcrafted_label.has_value() || (conversion && conversion->converted);

    mixed::MixedContext ctx(module, config_, registry_, queries_);
    bool enabled = mixed::mixed_build_enabled(ctx, registry_, converted_or_handcrafted);
    module.providers.set(MIXED_BUILD, enabled);
    if (!enabled) {
        return true;
    }

    const auto* buildable = registry_.capability<graph::MixedBuildable>(module.type());
    if (buildable->enqueue) {
        buildable->enqueue(ctx);
    }
    return !ctx.has_errors();
}

bool ConversionPipeline::mixed_process_step(graph::Module& module) {
    const auto* enabled = module.providers.find(MIXED_BUILD);
    if (!enabled || !*enabled) {
        return true;
    }

    mixed::MixedContext ctx(module, config_, registry_, queries_);
    const auto* buildable = registry_.capability<graph::MixedBuildable>(module.type());
    if (buildable->consume) {
        buildable->consume(ctx);
    }
    return !ctx.has_errors();
}

// ============================================================================
// Run
// ============================================================================

auto ConversionPipeline::run() -> PipelineResult {
    apply_handcrafted_labels();

    sched::Scheduler scheduler(graph_, config_.jobs);
    scheduler.add_phase(
        "deps", sched::PhaseOrder::BottomUp, [this](graph::Module& m) { return deps_step(m); },
        [this] { return declared_dependency_lists(); });
    scheduler.add_phase("convert", sched::PhaseOrder::TopDown,
                        [this](graph::Module& m) { return convert_step(m); });
    if (executor_) {
        scheduler.add_phase("mixed_queue", sched::PhaseOrder::Parallel,
                            [this](graph::Module& m) { return mixed_queue_step(m); });
        scheduler.add_barrier("mixed_answer", [this]() { queries_.answer_all(*executor_); });
        scheduler.add_phase("mixed_process", sched::PhaseOrder::BottomUp,
                            [this](graph::Module& m) { return mixed_process_step(m); });
    }

    TRANSBUILD_LOG_INFO("convert", "Converting " << graph_.size() << " modules with "
                                                 << scheduler.jobs() << " jobs");
    scheduler.run();

    PipelineResult result;
    result.stats = scheduler.stats();
    for (graph::ModuleId id = 0; id < graph_.size(); ++id) {
        const auto& module = graph_.module(id);
        if (module.status.converted) {
            ++result.converted;
            result.targets.insert(result.targets.end(), module.status.targets.begin(),
                                  module.status.targets.end());
        }
        if (module.failed) {
            ++result.failed;
        }
        result.diagnostics.insert(result.diagnostics.end(), module.diagnostics.begin(),
                                  module.diagnostics.end());
    }

    TRANSBUILD_LOG_INFO("convert", "Converted " << result.converted << " of " << graph_.size()
                                                << " modules, " << result.failed << " failed, "
                                                << result.diagnostics.size() << " diagnostics");
    return result;
}

} // namespace transbuild::convert
