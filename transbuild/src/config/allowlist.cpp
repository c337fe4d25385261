#include "config/allowlist.hpp"

namespace transbuild::config {

auto parse_directory_default(std::string_view text) -> std::optional<DirectoryDefault> {
    if (text == "true")
        return DirectoryDefault::True;
    if (text == "true_recursively")
        return DirectoryDefault::TrueRecursively;
    if (text == "false")
        return DirectoryDefault::False;
    if (text == "false_recursively")
        return DirectoryDefault::FalseRecursively;
    if (text == "unset")
        return DirectoryDefault::Unset;
    return std::nullopt;
}

auto directory_default_name(DirectoryDefault value) -> const char* {
    switch (value) {
    case DirectoryDefault::Unset:
        return "unset";
    case DirectoryDefault::True:
        return "true";
    case DirectoryDefault::TrueRecursively:
        return "true_recursively";
    case DirectoryDefault::False:
        return "false";
    case DirectoryDefault::FalseRecursively:
        return "false_recursively";
    }
    return "unset";
}

auto resolve_directory_default(std::string_view package_path, const DirectoryDefaults& defaults)
    -> DirectoryDecision {
    auto exact = defaults.find(package_path);
    if (exact != defaults.end()) {
        switch (exact->second) {
        case DirectoryDefault::True:
        case DirectoryDefault::TrueRecursively:
            return {true, std::string(package_path)};
        case DirectoryDefault::False:
        case DirectoryDefault::FalseRecursively:
            return {false, std::string(package_path)};
        case DirectoryDefault::Unset:
            break;
        }
    }

    // For x/y/z visit x, x/y, x/y/z; the deepest recursive entry decides.
    std::optional<DirectoryDecision> decided;
    size_t pos = 0;
    while (pos <= package_path.size()) {
        size_t slash = package_path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = package_path.size();
        }
        auto prefix = package_path.substr(0, slash);
        auto it = defaults.find(prefix);
        if (it != defaults.end()) {
            if (it->second == DirectoryDefault::TrueRecursively) {
                decided = DirectoryDecision{true, std::string(prefix)};
            } else if (it->second == DirectoryDefault::FalseRecursively) {
                decided = DirectoryDecision{false, std::string(prefix)};
            }
        }
        pos = slash + 1;
    }

    if (decided) {
        return *decided;
    }
    return {false, std::string(package_path)};
}

// ============================================================================
// Allowlist
// ============================================================================

auto Allowlist::set_default_config(const DirectoryDefaults& defaults) -> Allowlist& {
    for (const auto& [dir, value] : defaults) {
        default_config_[dir] = value;
    }
    return *this;
}

auto Allowlist::set_keep_existing_build_file(const std::map<std::string, bool>& dirs)
    -> Allowlist& {
    for (const auto& [dir, recursive] : dirs) {
        keep_existing_build_file_[dir] = recursive;
    }
    return *this;
}

auto Allowlist::set_module_always_convert(const std::vector<std::string>& names) -> Allowlist& {
    module_always_convert_.insert(names.begin(), names.end());
    return *this;
}

auto Allowlist::set_module_type_always_convert(const std::vector<std::string>& types)
    -> Allowlist& {
    module_type_always_convert_.insert(types.begin(), types.end());
    return *this;
}

auto Allowlist::set_module_do_not_convert(const std::vector<std::string>& names) -> Allowlist& {
    module_do_not_convert_.insert(names.begin(), names.end());
    return *this;
}

auto Allowlist::module_always_convert(std::string_view name) const -> bool {
    return module_always_convert_.find(name) != module_always_convert_.end();
}

auto Allowlist::module_type_always_convert(std::string_view type) const -> bool {
    return module_type_always_convert_.find(type) != module_type_always_convert_.end();
}

auto Allowlist::module_do_not_convert(std::string_view name) const -> bool {
    return module_do_not_convert_.find(name) != module_do_not_convert_.end();
}

auto Allowlist::should_keep_existing_build_file(std::string_view dir) const -> bool {
    if (keep_existing_build_file_.contains(std::string(dir))) {
        return true;
    }
    for (const auto& [prefix, recursive] : keep_existing_build_file_) {
        if (recursive && dir.size() > prefix.size() && dir.starts_with(prefix) &&
            dir[prefix.size()] == '/') {
            return true;
        }
    }
    return false;
}

} // namespace transbuild::config
