//! # Configuration Loader
//!
//! Parses the configuration TOML subset into a `Config`.

#include "config/config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace transbuild::config {

ConfigParser::ConfigParser(const std::string& content) : content_(content) {}

// ============================================================================
// Lexing Helpers
// ============================================================================

char ConfigParser::advance() {
    if (is_eof())
        return '\0';
    char c = content_[pos_++];
    if (c == '\n')
        ++line_;
    return c;
}

void ConfigParser::skip_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void ConfigParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void ConfigParser::skip_whitespace_and_newlines() {
    while (!is_eof()) {
        skip_whitespace();
        skip_comment();
        if (peek() == '\n') {
            advance();
        } else {
            break;
        }
    }
}

void ConfigParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = "line " + std::to_string(line_) + ": " + message;
    }
}

std::string ConfigParser::parse_identifier() {
    std::string result;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' ||
            c == '/') {
            result += advance();
        } else {
            break;
        }
    }
    return result;
}

std::string ConfigParser::parse_key() {
    if (peek() == '"') {
        auto quoted = parse_string();
        return quoted ? *quoted : std::string();
    }
    return parse_identifier();
}

std::optional<std::string> ConfigParser::parse_string() {
    if (peek() != '"') {
        set_error("expected a string");
        return std::nullopt;
    }
    advance();

    std::string result;
    while (!is_eof() && peek() != '"') {
        char c = advance();
        if (c == '\n') {
            set_error("unterminated string");
            return std::nullopt;
        }
        if (c == '\\') {
            char esc = advance();
            switch (esc) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case '"':
                result += '"';
                break;
            case '\\':
                result += '\\';
                break;
            default:
                set_error(std::string("invalid escape '\\") + esc + "'");
                return std::nullopt;
            }
        } else {
            result += c;
        }
    }

    if (is_eof()) {
        set_error("unterminated string");
        return std::nullopt;
    }
    advance();
    return result;
}

std::optional<int> ConfigParser::parse_number() {
    std::string digits;
    if (peek() == '-') {
        digits += advance();
    }
    while (!is_eof() && std::isdigit(static_cast<unsigned char>(peek()))) {
        digits += advance();
    }
    if (digits.empty() || digits == "-") {
        set_error("expected a number");
        return std::nullopt;
    }
    return std::stoi(digits);
}

std::optional<bool> ConfigParser::parse_boolean() {
    auto word = parse_identifier();
    if (word == "true")
        return true;
    if (word == "false")
        return false;
    set_error("expected true or false");
    return std::nullopt;
}

std::optional<std::vector<std::string>> ConfigParser::parse_string_array() {
    if (peek() != '[') {
        set_error("expected an array of strings");
        return std::nullopt;
    }
    advance();

    std::vector<std::string> result;
    while (true) {
        skip_whitespace_and_newlines();
        if (peek() == ']') {
            advance();
            return result;
        }
        auto item = parse_string();
        if (!item) {
            return std::nullopt;
        }
        result.push_back(std::move(*item));

        skip_whitespace_and_newlines();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            set_error("expected ',' or ']' in array");
            return std::nullopt;
        }
    }
}

// ============================================================================
// Sections
// ============================================================================

bool ConfigParser::apply_conversion(Config& config, const std::string& key) {
    if (key == "mode") {
        auto value = parse_string();
        if (!value)
            return false;
        if (*value == "full") {
            config.mode = ConversionMode::Full;
        } else if (*value == "api_surface_only") {
            config.mode = ConversionMode::ApiSurfaceOnly;
        } else {
            set_error("unknown conversion mode '" + *value + "'");
            return false;
        }
        return true;
    }
    if (key == "allow_missing_dependencies") {
        auto value = parse_boolean();
        if (!value)
            return false;
        config.allow_missing_dependencies = *value;
        return true;
    }
    if (key == "target_os") {
        auto value = parse_string();
        if (!value)
            return false;
        auto os = parse_os(*value);
        if (!os) {
            set_error("unknown target_os '" + *value + "'");
            return false;
        }
        config.target_os = *os;
        return true;
    }
    if (key == "target_arch") {
        auto value = parse_string();
        if (!value)
            return false;
        config.target_arch = *value;
        return true;
    }
    if (key == "jobs") {
        auto value = parse_number();
        if (!value)
            return false;
        if (*value < 0) {
            set_error("jobs must not be negative");
            return false;
        }
        config.jobs = *value;
        return true;
    }
    if (key == "native_build_file") {
        auto value = parse_string();
        if (!value)
            return false;
        config.native_build_file = *value;
        return true;
    }
    if (key == "target_build_files") {
        auto value = parse_string_array();
        if (!value)
            return false;
        config.target_build_files = *value;
        return true;
    }
    set_error("unknown key '" + key + "' in [conversion]");
    return false;
}

bool ConfigParser::apply_directories(Config& config, const std::string& key) {
    auto value = parse_string();
    if (!value)
        return false;
    auto parsed = parse_directory_default(*value);
    if (!parsed) {
        set_error("unknown directory default '" + *value + "' for '" + key + "'");
        return false;
    }
    config.allowlist.set_default_config({{key, *parsed}});
    return true;
}

bool ConfigParser::apply_keep_existing(Config& config, const std::string& key) {
    auto recursive = parse_boolean();
    if (!recursive)
        return false;
    config.allowlist.set_keep_existing_build_file({{key, *recursive}});
    return true;
}

bool ConfigParser::apply_modules(Config& config, const std::string& key) {
    auto value = parse_string_array();
    if (!value)
        return false;
    if (key == "always_convert") {
        config.allowlist.set_module_always_convert(*value);
    } else if (key == "type_always_convert") {
        config.allowlist.set_module_type_always_convert(*value);
    } else if (key == "do_not_convert") {
        config.allowlist.set_module_do_not_convert(*value);
    } else {
        set_error("unknown key '" + key + "' in [modules]");
        return false;
    }
    return true;
}

bool ConfigParser::apply_mixed_build(Config& config, const std::string& key) {
    if (key != "allowlist") {
        set_error("unknown key '" + key + "' in [mixed_build]");
        return false;
    }
    auto value = parse_string_array();
    if (!value)
        return false;
    config.mixed_build_allowlist.insert(value->begin(), value->end());
    return true;
}

bool ConfigParser::apply_exemptions(Config& config, const std::string& key) {
    auto value = parse_string_array();
    if (!value)
        return false;
    if (key == "source_modules") {
        config.dependency_exemptions.source_modules = {value->begin(), value->end()};
    } else if (key == "dependencies") {
        config.dependency_exemptions.dependencies = {value->begin(), value->end()};
    } else {
        set_error("unknown key '" + key + "' in [dependency_exemptions]");
        return false;
    }
    return true;
}

bool ConfigParser::apply_tagged_outputs(Config& config, const std::string& key) {
    auto value = parse_string_array();
    if (!value)
        return false;
    if (key == "module_names") {
        config.tagged_outputs.module_names = {value->begin(), value->end()};
    } else {
        // Any other key is a module type listing the tags it keeps
        config.tagged_outputs.module_type_tags[key] = {value->begin(), value->end()};
    }
    return true;
}

bool ConfigParser::apply_log(Config& config, const std::string& key) {
    if (key == "console" || key == "colors") {
        auto value = parse_boolean();
        if (!value)
            return false;
        (key == "console" ? config.log.console : config.log.colors) = *value;
        return true;
    }

    auto value = parse_string();
    if (!value)
        return false;
    if (key == "level") {
        auto level = log::parse_level(*value);
        if (!level) {
            set_error("unknown log level '" + *value + "'");
            return false;
        }
        config.log.level = *level;
        explicit_log_level_ = true;
    } else if (key == "filter") {
        if (!log::LogFilter().parse(*value)) {
            set_error("log filter '" + *value + "' names an unknown level");
            return false;
        }
        config.log.filter_spec = *value;
    } else if (key == "file") {
        config.log.log_file = *value;
    } else if (key == "format") {
        config.log.format = (*value == "json") ? log::LogFormat::JSON : log::LogFormat::Text;
    } else {
        set_error("unknown key '" + key + "' in [log]");
        return false;
    }
    return true;
}

// ============================================================================
// Driver
// ============================================================================

std::optional<Config> ConfigParser::parse(Config base) {
    Config config = std::move(base);
    std::string section;

    while (true) {
        skip_whitespace_and_newlines();
        if (is_eof())
            break;

        if (peek() == '[') {
            advance();
            skip_whitespace();
            section = parse_identifier();
            skip_whitespace();
            if (peek() != ']') {
                set_error("expected ']' after section name");
                return std::nullopt;
            }
            advance();
            if (section != "conversion" && section != "directories" &&
                section != "keep_existing_build_file" && section != "modules" &&
                section != "mixed_build" && section != "dependency_exemptions" &&
                section != "tagged_outputs" && section != "log") {
                set_error("unknown section [" + section + "]");
                return std::nullopt;
            }
        } else {
            if (section.empty()) {
                set_error("key outside of a section");
                return std::nullopt;
            }
            auto key = parse_key();
            if (key.empty()) {
                set_error("expected a key");
                return std::nullopt;
            }
            skip_whitespace();
            if (peek() != '=') {
                set_error("expected '=' after key '" + key + "'");
                return std::nullopt;
            }
            advance();
            skip_whitespace();

            bool ok = false;
            if (section == "conversion") {
                ok = apply_conversion(config, key);
            } else if (section == "directories") {
                ok = apply_directories(config, key);
            } else if (section == "keep_existing_build_file") {
                ok = apply_keep_existing(config, key);
            } else if (section == "modules") {
                ok = apply_modules(config, key);
            } else if (section == "mixed_build") {
                ok = apply_mixed_build(config, key);
            } else if (section == "dependency_exemptions") {
                ok = apply_exemptions(config, key);
            } else if (section == "tagged_outputs") {
                ok = apply_tagged_outputs(config, key);
            } else {
                ok = apply_log(config, key);
            }
            if (!ok) {
                return std::nullopt;
            }
        }

        skip_whitespace();
        skip_comment();
        if (!is_eof() && peek() != '\n') {
            set_error("unexpected characters at end of line");
            return std::nullopt;
        }
    }

    log::apply_env_overrides(config.log, explicit_log_level_);
    return config;
}

auto parse_config(const std::string& content, Rc<fs::FileSystem> filesystem)
    -> Result<Config, Diagnostic> {
    ConfigParser parser(content);
    auto config = parser.parse(Config::with_defaults(std::move(filesystem)));
    if (!config) {
        return Diagnostic{ErrorCodes::CONFIG_PARSE, "", parser.get_error()};
    }
    return std::move(*config);
}

auto load_config(const std::filesystem::path& path, const std::filesystem::path& source_root)
    -> Result<Config, Diagnostic> {
    std::ifstream file(path);
    if (!file) {
        return Diagnostic{ErrorCodes::CONFIG_PARSE, "",
                          "could not open configuration file " + path.string()};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str(), make_rc<fs::OsFileSystem>(source_root));
    if (is_err(result)) {
        auto& diag = unwrap_err(result);
        diag.message = path.string() + ": " + diag.message;
        TRANSBUILD_LOG_ERROR("config", diag.message);
        return result;
    }

    const auto& config = unwrap(result);
    TRANSBUILD_LOG_INFO("config", "Loaded " << path.string() << " ("
                                            << config.allowlist.default_config().size()
                                            << " directory defaults, "
                                            << config.mixed_build_allowlist.size()
                                            << " mixed-build modules)");
    return result;
}

} // namespace transbuild::config
