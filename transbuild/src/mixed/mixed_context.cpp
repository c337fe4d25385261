#include "mixed/mixed_context.hpp"

#include "convert/decision.hpp"
#include "log/log.hpp"

namespace transbuild::mixed {

MixedContext::MixedContext(graph::Module& module, const config::Config& config,
                           const graph::ModuleTypeRegistry& registry, ExternalQueryQueue& queue)
    : module_(module), config_(config), registry_(registry), queue_(queue) {}

auto MixedContext::label() const -> std::string {
    return convert::module_label(module_, config_, registry_);
}

void MixedContext::queue(RequestType request, const ConfigurationKey& key) {
    queue_.enqueue(ExternalQuery{label(), key, request});
}

auto MixedContext::answer(RequestType request, const ConfigurationKey& key)
    -> std::optional<std::vector<std::string>> {
    auto result = queue_.answer(ExternalQuery{label(), key, request});
    if (is_err(result)) {
        module_error(ErrorCodes::EXT_UNANSWERED, unwrap_err(result));
        return std::nullopt;
    }
    return std::move(unwrap(result));
}

void MixedContext::module_error(const char* code, std::string message) {
    module_.error(code, std::move(message));
    ++error_count_;
}

auto mixed_build_possible(const graph::Module& module, const config::Config& config,
                          bool converted_or_handcrafted) -> bool {
    if (module.os(config) == config::OsType::Windows) {
        return false;
    }
    if (!module.decl.enabled || !module.status.missing_deps.empty()) {
        return false;
    }
    if (!converted_or_handcrafted) {
        return false;
    }
    return config.mixed_build_allowlisted(module.name());
}

auto mixed_build_enabled(const MixedContext& ctx, const graph::ModuleTypeRegistry& registry,
                         bool converted_or_handcrafted) -> bool {
    const auto& module = ctx.module();
    if (!mixed_build_possible(module, ctx.config(), converted_or_handcrafted)) {
        return false;
    }

    const auto* buildable = registry.capability<graph::MixedBuildable>(module.type());
    if (!buildable) {
        return false;
    }
    bool supported = !buildable->supported || buildable->supported(ctx);
    TRANSBUILD_LOG_TRACE("mixed", "Module " << module.name() << " mixed build "
                                            << (supported ? "enabled" : "unsupported"));
    return supported;
}

} // namespace transbuild::mixed
