//! # Diagnostics
//!
//! Errors collected per module while the pipeline runs.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category             | Example                              |
//! |--------|----------------------|--------------------------------------|
//! | A      | Allowlist            | A001 - name/type allowlist conflict  |
//! | R      | Reference expansion  | R002 - missing dependency            |
//! | P      | Package layout       | P002 - source name collision         |
//! | G      | Graph scheduling     | G001 - dependency cycle              |
//! | X      | External execution   | X001 - unanswered query              |
//! | C      | Configuration        | C001 - parse error                   |
//! | E      | I/O                  | E001 - build file write failed       |

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace transbuild {

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCodes {
// Allowlist conflicts (A000-A099)
constexpr const char* ALLOWLIST_NAME_TYPE_CONFLICT = "A001";
constexpr const char* ALLOWLIST_DENYLIST_CONFLICT = "A002";
constexpr const char* ALLOWLIST_DIRECTORY_CONFLICT = "A003";

// Reference expansion (R000-R099)
constexpr const char* REF_MALFORMED = "R001";
constexpr const char* REF_MISSING_DEPENDENCY = "R002";
constexpr const char* REF_NOT_A_MODULE = "R003";

// Package layout (P000-P099)
constexpr const char* PKG_CROSS_PACKAGE = "P001";
constexpr const char* PKG_NAME_COLLISION = "P002";

// Graph scheduling (G000-G099)
constexpr const char* GRAPH_CYCLE = "G001";
constexpr const char* GRAPH_DEPENDENCY_FAILED = "G002";

// External execution (X000-X099)
constexpr const char* EXT_UNANSWERED = "X001";

// Configuration (C000-C099)
constexpr const char* CONFIG_PARSE = "C001";

// I/O (E000-E099)
constexpr const char* IO_WRITE = "E001";
constexpr const char* IO_READ = "E002";
} // namespace ErrorCodes

// ============================================================================
// Diagnostic
// ============================================================================

/// One reported error.
struct Diagnostic {
    std::string code;    ///< Stable code from `ErrorCodes`
    std::string module;  ///< Owning module name, empty for global errors
    std::string message; ///< Human-readable text

    bool operator==(const Diagnostic&) const = default;
};

using Diagnostics = std::vector<Diagnostic>;

inline std::ostream& operator<<(std::ostream& os, const Diagnostic& diag) {
    os << "error[" << diag.code << "]";
    if (!diag.module.empty()) {
        os << " module \"" << diag.module << "\"";
    }
    return os << ": " << diag.message;
}

} // namespace transbuild
