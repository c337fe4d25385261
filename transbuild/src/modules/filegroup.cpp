#include "modules/filegroup.hpp"

#include "convert/conversion_context.hpp"
#include "convert/reference_expander.hpp"
#include "fs/filesystem.hpp"
#include "log/log.hpp"
#include "mixed/mixed_context.hpp"

#include <algorithm>

namespace transbuild::modules {

namespace {

constexpr const char* AIDL_LIBRARY_LOAD = "//build/bazel/rules/aidl:aidl_library.bzl";
constexpr const char* FILEGROUP_LOAD = "//build/bazel/rules:filegroup.bzl";
constexpr const char* APEX_AVAILABLE_ANY = "apex_available=//apex_available:anyapex";

auto all_have_suffix(const label::LabelList& srcs, std::string_view suffix) -> bool {
    if (srcs.includes.empty()) {
        return false;
    }
    return std::all_of(srcs.includes.begin(), srcs.includes.end(),
                       [&](const label::Label& l) { return l.address.ends_with(suffix); });
}

void convert_proto_library(convert::ConversionContext& ctx, const label::LabelList& srcs,
                           const std::string* path) {
    const auto& name = ctx.module_name();
    auto by_package = label::partition_by_package(ctx.dir(), srcs);
    if (by_package.size() > 1) {
        std::string packages;
        for (const auto& [pkg, _] : by_package) {
            packages += packages.empty() ? pkg : ", " + pkg;
        }
        ctx.module_error(ErrorCodes::PKG_CROSS_PACKAGE,
                         "filegroup '" + name + "' has .proto srcs in several packages: " + packages);
        return;
    }

    const auto& [pkg, pkg_srcs] = *by_package.begin();
    std::vector<std::string> tags = {APEX_AVAILABLE_ANY, "manual"};

    convert::TargetDeclaration proto;
    proto.rule_class = "proto_library";
    proto.name = name + "_proto";
    proto.dir = pkg;
    proto.attributes["srcs"] = pkg_srcs;
    proto.attributes["tags"] = tags;
    if (path) {
        proto.attributes["strip_import_prefix"] = *path;
    }
    if (pkg != ctx.dir()) {
        // The library lives in a sub-package; keep import paths stable
        auto rel = fs::relative_to(ctx.dir(), pkg);
        if (rel != ".") {
            proto.attributes["import_prefix"] = rel;
            proto.attributes["strip_import_prefix"] = std::string();
        }
    }
    ctx.create_target(std::move(proto));

    convert::TargetDeclaration alias;
    alias.rule_class = "alias";
    alias.name = name + CONVERTED_PROTO_SUFFIX;
    alias.attributes["actual"] = label::Label(label::make_address(pkg, name + "_proto"));
    alias.attributes["tags"] = tags;
    ctx.create_target(std::move(alias));
}

void convert_filegroup(convert::ConversionContext& ctx) {
    const auto& props = ctx.module().decl.properties;
    const auto& name = ctx.module_name();

    convert::ReferenceExpander expander(ctx);
    auto srcs = expander.expand_srcs(props.list_or_empty("srcs"), props.list_or_empty("exclude_srcs"));
    if (ctx.has_errors()) {
        return;
    }

    // An eponymous source already is the target
    for (const auto& src : srcs.includes) {
        if (src.address == name) {
            if (srcs.includes.size() > 1) {
                ctx.module_error(ErrorCodes::PKG_NAME_COLLISION,
                                 "filegroup '" + name + "' cannot contain a file with the same name");
            }
            return;
        }
    }

    const auto* path = props.get_string("path");

    if (all_have_suffix(srcs, ".aidl")) {
        convert::TargetDeclaration aidl;
        aidl.rule_class = "aidl_library";
        aidl.load_location = AIDL_LIBRARY_LOAD;
        aidl.name = name;
        aidl.attributes["srcs"] = srcs;
        aidl.attributes["tags"] = std::vector<std::string>{APEX_AVAILABLE_ANY};
        if (path) {
            aidl.attributes["strip_import_prefix"] = *path;
        }
        ctx.create_target(std::move(aidl));
        return;
    }

    if (all_have_suffix(srcs, ".proto")) {
        convert_proto_library(ctx, srcs, path);
        if (ctx.has_errors()) {
            return;
        }
    }

    // Unconverted modules may still depend on the filegroup itself
    convert::TargetDeclaration filegroup;
    filegroup.rule_class = "filegroup";
    filegroup.load_location = FILEGROUP_LOAD;
    filegroup.name = name;
    filegroup.attributes["srcs"] = srcs;
    ctx.create_target(std::move(filegroup));
}

auto eponymous_source_label(const graph::Module& module) -> std::optional<std::string> {
    const auto* srcs = module.decl.properties.get_list("srcs");
    if (srcs && srcs->size() == 1 && srcs->front() == module.name()) {
        return label::make_address(module.dir(), module.name());
    }
    return std::nullopt;
}

// ============================================================================
// Mixed Execution
// ============================================================================

bool mixed_supported(const mixed::MixedContext& ctx) {
    return !ctx.module().decl.properties.get_bool("mixed_build_incompatible").value_or(false);
}

void queue_outputs(mixed::MixedContext& ctx) {
    ctx.queue(mixed::RequestType::OutputFiles, mixed::ConfigurationKey::common());
}

void consume_outputs(mixed::MixedContext& ctx) {
    auto files = ctx.answer(mixed::RequestType::OutputFiles, mixed::ConfigurationKey::common());
    if (!files) {
        return;
    }

    auto& module = ctx.module();
    std::string root = module.dir();
    if (const auto* path = module.decl.properties.get_string("path")) {
        root = fs::join(root, *path);
    }

    FilegroupOutputs outputs;
    outputs.files.reserve(files->size());
    for (const auto& file : *files) {
        outputs.files.push_back(fs::relative_to(root, file));
    }
    TRANSBUILD_LOG_DEBUG("mixed", outputs.files.size() << " external outputs");
    module.providers.set(FILEGROUP_OUTPUTS, std::move(outputs));
}

} // namespace

auto filegroup_type() -> graph::ModuleTypeSpec {
    graph::ModuleTypeSpec spec;
    spec.name = FILEGROUP_TYPE;
    spec.path_properties = {"srcs", "exclude_srcs"};
    spec.capabilities.emplace_back(graph::Convertible{convert_filegroup});
    spec.capabilities.emplace_back(
        graph::MixedBuildable{mixed_supported, queue_outputs, consume_outputs});
    spec.handcrafted_label = eponymous_source_label;
    return spec;
}

auto register_filegroup(graph::ModuleTypeRegistry& registry) -> Result<Ok> {
    return registry.register_type(filegroup_type());
}

} // namespace transbuild::modules
