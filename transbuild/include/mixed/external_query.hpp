//! # External Queries
//!
//! Requests sent to the external executor during mixed execution.
//!
//! Modules queue queries while the `mixed_queue` phase runs in parallel;
//! the executor answers all of them at a barrier; modules read the answers
//! in `mixed_process`. The queue is the only structure written by several
//! workers at once and is guarded by a mutex.

#pragma once

#include "common.hpp"
#include "config/config.hpp"

#include <compare>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transbuild::mixed {

/// Configuration an external query is evaluated in.
struct ConfigurationKey {
    std::string arch;
    config::OsType os = config::OsType::Common;

    /// Architecture- and OS-independent configuration.
    static auto common() -> ConfigurationKey {
        return ConfigurationKey{"common", config::OsType::Common};
    }

    auto operator<=>(const ConfigurationKey&) const = default;
};

/// Kind of information requested about a label.
enum class RequestType {
    OutputFiles,
};

[[nodiscard]] auto request_type_name(RequestType request) -> const char*;

struct ExternalQuery {
    std::string label;
    ConfigurationKey key;
    RequestType request = RequestType::OutputFiles;

    auto operator<=>(const ExternalQuery&) const = default;
};

/// Answers queued queries. Implemented by the external build system bridge.
class ExternalExecutor {
public:
    virtual ~ExternalExecutor() = default;

    [[nodiscard]] virtual auto answer(const ExternalQuery& query)
        -> Result<std::vector<std::string>> = 0;
};

/// Deduplicating, mutex-protected query queue.
class ExternalQueryQueue {
public:
    void enqueue(ExternalQuery query);

    /// Queries without an answer, in sorted order.
    [[nodiscard]] auto pending() const -> std::vector<ExternalQuery>;

    void set_answer(const ExternalQuery& query, std::vector<std::string> values);

    /// Returns the answer or an error if the query was never answered.
    [[nodiscard]] auto answer(const ExternalQuery& query) const
        -> Result<std::vector<std::string>>;

    [[nodiscard]] auto size() const -> size_t;

    /// Asks `executor` for every pending query.
    ///
    /// Queries the executor fails to answer stay pending; the modules that
    /// queued them report it when they read the answer. Returns the number
    /// of queries answered.
    auto answer_all(ExternalExecutor& executor) -> size_t;

private:
    mutable std::mutex mutex_;
    std::map<ExternalQuery, std::optional<std::vector<std::string>>> queries_;
};

} // namespace transbuild::mixed
