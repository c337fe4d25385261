//! # Log Initialization from the Environment

#include "log/log.hpp"

#include <cstdlib>
#include <string_view>

namespace transbuild::log {

void apply_env_overrides(LogConfig& config, bool has_explicit_level) {
    if (has_explicit_level || !config.filter_spec.empty()) {
        return;
    }

    const char* value = std::getenv("TRANSBUILD_LOG");
    if (!value || *value == '\0') {
        return;
    }

    std::string_view env(value);
    if (env.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = env;
    } else if (auto level = parse_level(env)) {
        config.level = *level;
    }
}

} // namespace transbuild::log
