//! # Target Declarations
//!
//! Rule invocations emitted by module conversion, rendered later into
//! target-system build files.

#pragma once

#include "label/label.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace transbuild::convert {

/// Value of one rule attribute.
using AttributeValue =
    std::variant<bool, int, std::string, std::vector<std::string>, label::Label, label::LabelList>;

/// One rule invocation in a target-system build file.
struct TargetDeclaration {
    std::string rule_class;    ///< e.g. "filegroup"
    std::string load_location; ///< .bzl file defining the rule; empty for native rules
    std::string name;
    std::string dir; ///< Package the target is written to
    std::map<std::string, AttributeValue> attributes;

    /// Returns `//<dir>:<name>`.
    [[nodiscard]] auto address() const -> std::string {
        return label::make_address(dir, name);
    }
};

} // namespace transbuild::convert
