//! # Module Providers
//!
//! Typed values a module publishes for later phases and for its dependents.
//!
//! Each provider is written at most once per module. Writing a provider
//! twice or reading one that was never published is a programming error in
//! phase ordering and aborts via `transbuild::fatal`.
//!
//! ```cpp
//! inline const ProviderKey<ConversionOutput> CONVERSION{"conversion"};
//!
//! module.providers.set(CONVERSION, output);
//! const auto& out = dep.providers.get(CONVERSION);
//! ```

#pragma once

#include "common.hpp"

#include <any>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace transbuild::graph {

/// Name of a provider carrying values of type `T`.
template <typename T> struct ProviderKey {
    std::string_view name;
};

/// Write-once per-module provider storage.
class ProviderStore {
public:
    ProviderStore() = default;
    ProviderStore(const ProviderStore&) = delete;
    ProviderStore& operator=(const ProviderStore&) = delete;

    /// Publishes `value` under `key`. Aborts if already published.
    template <typename T> void set(const ProviderKey<T>& key, T value) {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = entries_.try_emplace(std::string(key.name));
        if (!inserted) {
            lock.unlock();
            fatal("sched", "provider '" + std::string(key.name) + "' published twice");
        }
        it->second = std::move(value);
    }

    /// Reads the value published under `key`. Aborts if not published.
    template <typename T> const T& get(const ProviderKey<T>& key) const {
        const T* value = find(key);
        if (!value) {
            fatal("sched", "provider '" + std::string(key.name) + "' read before it was published");
        }
        return *value;
    }

    /// Returns the published value or nullptr.
    template <typename T> const T* find(const ProviderKey<T>& key) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(std::string(key.name));
        if (it == entries_.end()) {
            return nullptr;
        }
        const T* value = std::any_cast<T>(&it->second);
        if (!value) {
            lock.unlock();
            fatal("sched", "provider '" + std::string(key.name) + "' read with the wrong type");
        }
        return value;
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        std::shared_lock lock(mutex_);
        return entries_.contains(std::string(name));
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::any> entries_;
};

} // namespace transbuild::graph
