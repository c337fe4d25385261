//! # Module Type Registry
//!
//! Maps module type names to the capabilities their implementations provide.
//!
//! ## Capabilities
//!
//! | Capability       | Provided by types that...                        |
//! |------------------|--------------------------------------------------|
//! | `Convertible`    | emit target declarations                         |
//! | `ApiContributor` | emit API-surface targets in API-only mode        |
//! | `MixedBuildable` | can be built by the external executor            |
//!
//! Capabilities are plain variant alternatives looked up with
//! `ModuleTypeSpec::capability<T>()`.

#pragma once

#include "common.hpp"
#include "graph/module.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace transbuild::convert {
class ConversionContext;
} // namespace transbuild::convert

namespace transbuild::mixed {
class MixedContext;
} // namespace transbuild::mixed

namespace transbuild::graph {

struct Convertible {
    std::function<void(convert::ConversionContext&)> convert;
};

struct ApiContributor {
    std::function<void(convert::ConversionContext&)> convert_api;
};

struct MixedBuildable {
    /// Module-level opt-out (e.g. an incompatibility property).
    std::function<bool(const mixed::MixedContext&)> supported;
    /// Queues the module's external queries.
    std::function<void(mixed::MixedContext&)> enqueue;
    /// Reads answered queries and publishes providers.
    std::function<void(mixed::MixedContext&)> consume;
};

using Capability = std::variant<Convertible, ApiContributor, MixedBuildable>;

/// Implementation of one module type.
struct ModuleTypeSpec {
    std::string name;

    /// Properties whose entries may contain `:module` references.
    std::vector<std::string> path_properties;

    std::vector<Capability> capabilities;

    /// Computes a hand-authored label for a module when it is loaded, or
    /// returns `std::nullopt`.
    std::function<std::optional<std::string>(const Module&)> handcrafted_label;

    template <typename C> [[nodiscard]] const C* capability() const {
        for (const auto& cap : capabilities) {
            if (const auto* found = std::get_if<C>(&cap)) {
                return found;
            }
        }
        return nullptr;
    }
};

class ModuleTypeRegistry {
public:
    /// Registers a type. Fails if the name is taken.
    auto register_type(ModuleTypeSpec spec) -> Result<Ok>;

    /// Returns the spec for `type` or nullptr.
    [[nodiscard]] auto find(std::string_view type) const -> const ModuleTypeSpec*;

    template <typename C> [[nodiscard]] const C* capability(std::string_view type) const {
        const auto* spec = find(type);
        return spec ? spec->template capability<C>() : nullptr;
    }

    [[nodiscard]] auto size() const -> size_t {
        return types_.size();
    }

private:
    std::map<std::string, ModuleTypeSpec, std::less<>> types_;
};

} // namespace transbuild::graph
