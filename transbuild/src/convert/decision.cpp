#include "convert/decision.hpp"

#include "log/log.hpp"

namespace transbuild::convert {

namespace {

auto quoted(const std::string& text) -> std::string {
    return "\"" + text + "\"";
}

} // namespace

auto should_convert(const graph::Module& module, const config::Config& config,
                    const graph::ModuleTypeRegistry& registry) -> Decision {
    Decision decision;

    const auto* spec = registry.find(module.type());
    if (!spec || !spec->capability<graph::Convertible>()) {
        return decision;
    }

    if (config.mode == config::ConversionMode::ApiSurfaceOnly) {
        decision.convert = spec->capability<graph::ApiContributor>() != nullptr;
        return decision;
    }

    const auto& opt_in = module.decl.convert_opt_in;
    const auto& package_path = module.dir();

    // Unit tests declare modules in the top-level package
    if (package_path == label::TOP_LEVEL_DIR && opt_in.value_or(false)) {
        decision.convert = true;
        return decision;
    }

    const auto& allowlist = config.allowlist;
    const auto& name = module.name();
    bool name_allowed = allowlist.module_always_convert(name);
    bool type_allowed = allowlist.module_type_always_convert(module.type());

    if (name_allowed && type_allowed) {
        decision.diagnostics.push_back(
            Diagnostic{ErrorCodes::ALLOWLIST_NAME_TYPE_CONFLICT, name,
                       "A module " + quoted(name) + " of type " + quoted(module.type()) +
                           " cannot be in moduleAlwaysConvert and also be in "
                           "moduleTypeAlwaysConvert"});
        return decision;
    }

    if (allowlist.module_do_not_convert(name)) {
        if (name_allowed) {
            decision.diagnostics.push_back(
                Diagnostic{ErrorCodes::ALLOWLIST_DENYLIST_CONFLICT, name,
                           "a module " + quoted(name) +
                               " cannot be in moduleDoNotConvert and also be in "
                               "moduleAlwaysConvert"});
        }
        return decision;
    }

    auto directory = allowlist.directory_default(package_path);
    if (directory.convert) {
        if (name_allowed) {
            decision.diagnostics.push_back(Diagnostic{
                ErrorCodes::ALLOWLIST_DIRECTORY_CONFLICT, name,
                "A module cannot be in a directory marked Bp2BuildDefaultTrue or "
                "Bp2BuildDefaultTrueRecursively and also be in moduleAlwaysConvert. "
                "Directory: '" +
                    directory.matched_prefix + "' Module: '" + name + "'"});
            return decision;
        }
        decision.convert = opt_in.value_or(true);
        return decision;
    }

    decision.convert = opt_in.value_or(name_allowed || type_allowed);
    TRANSBUILD_LOG_TRACE("allowlist", "Module " << name << " in " << package_path << ": "
                                                << (decision.convert ? "convert" : "skip"));
    return decision;
}

auto generated_label(const graph::Module& module) -> std::string {
    std::string_view name = module.name();
    if (name.starts_with("prebuilt_")) {
        name.remove_prefix(9);
    }
    return label::make_address(module.dir(), name);
}

auto target_label(const graph::Module& module, bool converts) -> std::string {
    if (module.decl.handcrafted_label) {
        return *module.decl.handcrafted_label;
    }
    if (converts) {
        return generated_label(module);
    }
    return "";
}

auto converted_or_handcrafted(const graph::Module& module, const config::Config& config,
                              const graph::ModuleTypeRegistry& registry) -> bool {
    return module.decl.handcrafted_label.has_value() ||
           should_convert(module, config, registry).convert;
}

auto module_label(const graph::Module& module, const config::Config& config,
                  const graph::ModuleTypeRegistry& registry) -> std::string {
    if (!converted_or_handcrafted(module, config, registry)) {
        return generated_label(module);
    }
    return target_label(module, true);
}

} // namespace transbuild::convert
