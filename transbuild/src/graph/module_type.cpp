#include "graph/module_type.hpp"

#include "log/log.hpp"

namespace transbuild::graph {

auto ModuleTypeRegistry::register_type(ModuleTypeSpec spec) -> Result<Ok> {
    if (types_.find(spec.name) != types_.end()) {
        return "module type \"" + spec.name + "\" registered twice";
    }
    TRANSBUILD_LOG_DEBUG("convert", "Registered module type " << spec.name << " with "
                                                              << spec.capabilities.size()
                                                              << " capabilities");
    auto name = spec.name;
    types_.emplace(std::move(name), std::move(spec));
    return Ok{};
}

auto ModuleTypeRegistry::find(std::string_view type) const -> const ModuleTypeSpec* {
    auto it = types_.find(type);
    return it == types_.end() ? nullptr : &it->second;
}

} // namespace transbuild::graph
