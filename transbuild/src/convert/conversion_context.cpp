#include "convert/conversion_context.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace transbuild::convert {

ConversionContext::ConversionContext(graph::Module& module, graph::ModuleGraph& graph,
                                     const config::Config& config,
                                     const graph::ModuleTypeRegistry& registry)
    : module_(module), graph_(graph), config_(config), registry_(registry) {}

void ConversionContext::module_error(const char* code, std::string message) {
    TRANSBUILD_LOG_DEBUG("convert", "error[" << code << "] " << message);
    module_.error(code, std::move(message));
    ++error_count_;
}

void ConversionContext::add_missing_dependency(const std::string& name) {
    auto& missing = module_.status.missing_deps;
    if (std::find(missing.begin(), missing.end(), name) == missing.end()) {
        missing.push_back(name);
    }
}

void ConversionContext::add_unconverted_dependency(const std::string& name) {
    auto& unconverted = module_.status.unconverted_deps;
    if (std::find(unconverted.begin(), unconverted.end(), name) == unconverted.end()) {
        unconverted.push_back(name);
    }
}

void ConversionContext::add_conversion_dependency(graph::ModuleId dependency) {
    const auto& dep_name = graph_.module(dependency).name();
    if (config_.dependency_exemptions.exempts(module_.name(), dep_name)) {
        TRANSBUILD_LOG_TRACE("convert", "Skipping exempt edge " << module_.name() << " -> "
                                                                << dep_name);
        return;
    }
    graph_.add_edge(module_.id, dependency, graph::DependencyTag::ConversionOnly);
}

void ConversionContext::create_target(TargetDeclaration target) {
    if (target.dir.empty()) {
        target.dir = module_.dir();
    }
    TRANSBUILD_LOG_DEBUG("convert", "Target " << target.rule_class << " " << target.address()
                                              << " from " << module_.name());
    module_.status.targets.push_back(std::move(target));
}

auto ConversionContext::module_from_name(std::string_view name) const
    -> std::optional<graph::ModuleId> {
    return graph_.find(name, module_.decl.module_namespace);
}

auto ConversionContext::glob(std::string_view pattern, const std::vector<std::string>& excludes)
    -> std::vector<std::string> {
    auto result = config_.filesystem->glob(pattern, excludes);
    if (is_err(result)) {
        module_error(ErrorCodes::IO_READ, unwrap_err(result));
        return {};
    }
    return unwrap(result);
}

} // namespace transbuild::convert
