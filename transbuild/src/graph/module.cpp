#include "graph/module.hpp"

namespace transbuild::graph {

auto dependency_tag_name(DependencyTag tag) -> const char* {
    switch (tag) {
    case DependencyTag::Ordinary:
        return "ordinary";
    case DependencyTag::OutputReference:
        return "output_reference";
    case DependencyTag::License:
        return "license";
    case DependencyTag::ConversionOnly:
        return "conversion_only";
    }
    return "ordinary";
}

void PropertyBag::set(std::string name, PropertyValue value) {
    values_[std::move(name)] = std::move(value);
}

auto PropertyBag::has(std::string_view name) const -> bool {
    return values_.find(name) != values_.end();
}

auto PropertyBag::get_bool(std::string_view name) const -> std::optional<bool> {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<bool>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

auto PropertyBag::get_string(std::string_view name) const -> const std::string* {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return nullptr;
    }
    return std::get_if<std::string>(&it->second);
}

auto PropertyBag::get_list(std::string_view name) const -> const std::vector<std::string>* {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return nullptr;
    }
    return std::get_if<std::vector<std::string>>(&it->second);
}

auto PropertyBag::list_or_empty(std::string_view name) const -> std::vector<std::string> {
    const auto* list = get_list(name);
    return list ? *list : std::vector<std::string>{};
}

} // namespace transbuild::graph
