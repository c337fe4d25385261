#include "convert/reference_expander.hpp"

#include "convert/decision.hpp"
#include "convert/package_boundary.hpp"
#include "fs/filesystem.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace transbuild::convert {

namespace {

auto contains(const std::vector<std::string>& list, const std::string& value) -> bool {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

// ============================================================================
// Module References
// ============================================================================

auto ReferenceExpander::other_module_label(const label::ModuleReference& ref, bool mark_as_dep)
    -> label::Label {
    auto id = ctx_.module_from_name(ref.name);
    if (!id) {
        ctx_.add_missing_dependency(ref.name);
        return label::Label(":" + ref.name + std::string(label::MISSING_DEP_SUFFIX));
    }

    if (mark_as_dep) {
        ctx_.add_conversion_dependency(*id);
    }

    const auto& other = ctx_.graph().module(*id);
    if (!converted_or_handcrafted(other, ctx_.config(), ctx_.registry())) {
        ctx_.add_unconverted_dependency(ref.name);
    }

    auto self_label = module_label(ctx_.module(), ctx_.config(), ctx_.registry());
    auto other_label = module_label(other, ctx_.config(), ctx_.registry());

    // Only a few module types expose tagged outputs as distinct targets
    if (ctx_.config().tagged_outputs.keeps_tag(other.name(), other.type(), ref.tag)) {
        other_label += ref.tag;
    }

    if (label::same_package(self_label, other_label)) {
        if (auto short_label = label::short_form(other_label)) {
            other_label = *short_label;
        }
    }
    return label::Label(std::move(other_label));
}

// ============================================================================
// Sources
// ============================================================================

auto ReferenceExpander::expand_srcs_impl(const std::vector<std::string>& paths,
                                         const std::vector<std::string>& excluded,
                                         bool mark_as_deps) -> label::LabelList {
    label::LabelList labels;

    // Globs run against root-relative paths
    std::vector<std::string> root_excludes;
    root_excludes.reserve(excluded.size());
    for (const auto& exclude : excluded) {
        root_excludes.push_back(fs::join(ctx_.dir(), exclude));
    }

    for (const auto& path : paths) {
        auto parsed = label::parse_module_reference(path);
        if (is_err(parsed)) {
            ctx_.module_error(ErrorCodes::REF_MALFORMED, unwrap_err(parsed));
            continue;
        }

        if (const auto& ref = unwrap(parsed)) {
            auto other = other_module_label(*ref, mark_as_deps);
            if (contains(excluded, other.address)) {
                continue;
            }
            other.original_spelling = ref->name.starts_with("//") ? ref->name : ":" + ref->name;
            labels.add(std::move(other));
        } else if (fs::is_glob(path)) {
            for (const auto& match : ctx_.glob(fs::join(ctx_.dir(), path), root_excludes)) {
                labels.add(label::Label(fs::relative_to(ctx_.dir(), match)));
            }
        } else if (!contains(excluded, path)) {
            labels.add(label::Label(path));
        }
    }
    return labels;
}

auto ReferenceExpander::expand_srcs(const std::vector<std::string>& paths,
                                    const std::vector<std::string>& excludes)
    -> label::LabelList {
    auto exclude_labels = expand_srcs_impl(excludes, {}, false);

    std::vector<std::string> excluded;
    excluded.reserve(exclude_labels.includes.size());
    for (const auto& exclude : exclude_labels.includes) {
        excluded.push_back(exclude.address);
    }

    auto labels = expand_srcs_impl(paths, excluded, true);
    labels.excludes = std::move(exclude_labels.includes);

    auto result = transform_subpackage_paths(ctx_.config(), ctx_.dir(), labels);
    TRANSBUILD_LOG_DEBUG("expand", paths.size() << " paths, " << excludes.size()
                                                << " excludes -> " << result.includes.size()
                                                << " labels");
    return result;
}

auto ReferenceExpander::expand_src_single(const std::string& path) -> label::Label {
    auto list = expand_srcs({path});
    if (list.includes.empty()) {
        return label::Label();
    }
    return list.includes.front();
}

auto ReferenceExpander::expand_pattern(std::string_view dir, std::string_view pattern,
                                       const std::vector<std::string>& excludes)
    -> label::LabelList {
    std::vector<std::string> root_excludes;
    root_excludes.reserve(excludes.size());
    for (const auto& exclude : excludes) {
        root_excludes.push_back(fs::join(dir, exclude));
    }

    label::LabelList labels;
    for (const auto& match : ctx_.glob(fs::join(dir, pattern), root_excludes)) {
        labels.add(label::Label("./" + fs::relative_to(dir, match)));
    }
    return transform_subpackage_paths(ctx_.config(), dir, labels);
}

// ============================================================================
// Dependencies
// ============================================================================

auto ReferenceExpander::expand_deps_impl(const std::vector<std::string>& modules,
                                         bool mark_as_deps) -> label::LabelList {
    auto labels = label::LabelList::make_explicitly_empty();

    std::unordered_set<std::string> seen;
    for (const auto& module : modules) {
        if (!seen.insert(module).second) {
            continue;
        }

        std::string text = module;
        if (!text.starts_with(":") && !text.starts_with("//")) {
            text = ":" + text;
        }

        auto parsed = label::parse_module_reference(text);
        if (is_err(parsed) || !unwrap(parsed)) {
            ctx_.module_error(ErrorCodes::REF_NOT_A_MODULE,
                              "\"" + module + "\", is not a module reference");
            continue;
        }

        auto other = other_module_label(*unwrap(parsed), mark_as_deps);
        other.original_spelling = module;
        labels.add(std::move(other));
    }
    return labels;
}

auto ReferenceExpander::expand_deps(const std::optional<std::vector<std::string>>& modules,
                                    const std::vector<std::string>& excludes)
    -> label::LabelList {
    if (!modules) {
        return label::LabelList();
    }

    std::vector<std::string> remaining;
    for (const auto& module : *modules) {
        if (!contains(excludes, module)) {
            remaining.push_back(module);
        }
    }

    auto labels = expand_deps_impl(remaining, true);
    if (excludes.empty()) {
        return labels;
    }

    auto exclude_labels = expand_deps_impl(excludes, false);
    labels.excludes = std::move(exclude_labels.includes);
    return labels;
}

auto ReferenceExpander::expand_dep_single(const std::string& name) -> label::Label {
    auto list = expand_deps(std::vector<std::string>{name});
    if (list.includes.empty()) {
        return label::Label();
    }
    return list.includes.front();
}

// ============================================================================
// Mixed Properties
// ============================================================================

auto ReferenceExpander::string_or_label(const std::string& value) -> StringOrLabel {
    auto parsed = label::parse_module_reference(value);
    if (is_ok(parsed) && unwrap(parsed)) {
        return expand_dep_single(unwrap(parsed)->name);
    }

    auto path = fs::join(ctx_.dir(), value);
    if (ctx_.config().filesystem->exists(path) &&
        fs::parent_dir(path) == fs::normalize(ctx_.dir())) {
        return expand_src_single(value);
    }
    return value;
}

} // namespace transbuild::convert
