//! # Common Definitions
//!
//! Result handling, ownership aliases and fatal errors shared by every
//! transbuild component.
//!
//! Recoverable problems travel as `Result<T, E>` or as diagnostics attached
//! to the module being processed. Phase-ordering mistakes (reading a
//! provider before it was published, publishing one twice) go through
//! `fatal()`.

#ifndef TRANSBUILD_COMMON_HPP
#define TRANSBUILD_COMMON_HPP

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace transbuild {

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto loaded = config::load_config("transbuild.toml", ".");
/// if (is_err(loaded)) {
///     const Diagnostic& error = unwrap_err(loaded);
///     TRANSBUILD_LOG_ERROR("config", error.code << " " << error.message);
/// }
/// ```
///
/// `T` and `E` must differ; a `Result<std::string>` cannot tell them apart.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Payload of results that only signal success.
struct Ok {
    bool operator==(const Ok&) const = default;
};

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

/// Shared ownership; the filesystem is shared between configs and tests.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Fatal Errors
// ============================================================================

/// Logs `message` at Fatal under `component`, flushes the sinks and aborts.
[[noreturn]] void fatal(std::string_view component, const std::string& message);

} // namespace transbuild

#endif // TRANSBUILD_COMMON_HPP
