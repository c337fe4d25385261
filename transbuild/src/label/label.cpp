#include "label/label.hpp"

#include <algorithm>
#include <unordered_set>

namespace transbuild::label {

// ============================================================================
// LabelList
// ============================================================================

auto LabelList::make_explicitly_empty() -> LabelList {
    LabelList list;
    list.explicitly_empty_ = true;
    return list;
}

void LabelList::add(Label label) {
    includes.push_back(std::move(label));
}

void LabelList::add_exclude(Label label) {
    excludes.push_back(std::move(label));
}

void LabelList::append(const LabelList& other) {
    includes.insert(includes.end(), other.includes.begin(), other.includes.end());
    excludes.insert(excludes.end(), other.excludes.begin(), other.excludes.end());
    explicitly_empty_ = explicitly_empty_ || other.explicitly_empty_;
}

auto LabelList::unique_includes() const -> std::vector<Label> {
    std::vector<Label> result;
    std::unordered_set<std::string> seen;
    for (const auto& label : includes) {
        if (seen.insert(label.address).second) {
            result.push_back(label);
        }
    }
    return result;
}

auto LabelList::resolved() const -> std::vector<Label> {
    std::unordered_set<std::string> excluded;
    for (const auto& label : excludes) {
        excluded.insert(label.address);
    }

    std::vector<Label> result;
    for (const auto& label : unique_includes()) {
        if (!excluded.contains(label.address)) {
            result.push_back(label);
        }
    }
    return result;
}

auto LabelList::addresses() const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& label : resolved()) {
        result.push_back(label.address);
    }
    return result;
}

// ============================================================================
// Address Helpers
// ============================================================================

auto is_absolute(std::string_view address) -> bool {
    return address.starts_with("//");
}

auto make_address(std::string_view dir, std::string_view name) -> std::string {
    std::string result = "//";
    if (dir != TOP_LEVEL_DIR) {
        result += dir;
    }
    result += ":";
    result += name;
    return result;
}

auto package_of(std::string_view address) -> std::optional<std::string> {
    auto colon = address.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(address.substr(0, colon));
}

auto short_form(std::string_view address) -> std::optional<std::string> {
    auto colon = address.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(address.substr(colon));
}

auto same_package(std::string_view a, std::string_view b) -> bool {
    auto pa = package_of(a);
    auto pb = package_of(b);
    return pa && pb && *pa == *pb;
}

auto package_dir_of(std::string_view module_dir, std::string_view address) -> std::string {
    if (!is_absolute(address)) {
        return std::string(module_dir);
    }
    auto colon = address.find(':');
    if (colon == std::string_view::npos) {
        return std::string(address.substr(2));
    }
    auto dir = address.substr(2, colon - 2);
    if (dir.empty()) {
        return std::string(TOP_LEVEL_DIR);
    }
    return std::string(dir);
}

auto partition_by_package(std::string_view module_dir, const LabelList& list)
    -> std::map<std::string, LabelList> {
    std::map<std::string, LabelList> result;
    for (const auto& label : list.includes) {
        auto pkg = package_dir_of(module_dir, label.address);
        Label local = label;
        if (is_absolute(label.address)) {
            auto colon = label.address.find(':');
            if (colon != std::string::npos) {
                local.address = label.address.substr(colon + 1);
            }
        }
        result[pkg].add(std::move(local));
    }
    return result;
}

// ============================================================================
// Module References
// ============================================================================

namespace {

auto split_tag(std::string_view text, std::string_view full)
    -> Result<std::optional<ModuleReference>> {
    ModuleReference ref;
    auto brace = text.find('{');
    if (brace == std::string_view::npos) {
        ref.name = std::string(text);
    } else {
        if (!text.ends_with('}')) {
            return "malformed module reference \"" + std::string(full) + "\": unterminated tag";
        }
        ref.name = std::string(text.substr(0, brace));
        ref.tag = std::string(text.substr(brace + 1, text.size() - brace - 2));
    }
    if (ref.name.empty() || ref.name.ends_with(':')) {
        return "malformed module reference \"" + std::string(full) + "\": missing module name";
    }
    return std::optional<ModuleReference>(std::move(ref));
}

} // namespace

auto parse_module_reference(std::string_view text) -> Result<std::optional<ModuleReference>> {
    if (text.starts_with(':')) {
        return split_tag(text.substr(1), text);
    }
    if (text.starts_with("//")) {
        if (text.find(':') == std::string_view::npos) {
            return "malformed module reference \"" + std::string(text) +
                   "\": expected //<namespace>:<module>";
        }
        return split_tag(text, text);
    }
    return std::optional<ModuleReference>(std::nullopt);
}

auto is_module_reference(std::string_view text) -> bool {
    auto parsed = parse_module_reference(text);
    return is_ok(parsed) && unwrap(parsed).has_value();
}

} // namespace transbuild::label
