//! # Build File Writer Implementation

#include "convert/build_file_writer.hpp"

#include "log/log.hpp"

#include <fstream>
#include <optional>
#include <set>
#include <sstream>

namespace transbuild::convert {

namespace {

auto quote(std::string_view text) -> std::string {
    std::string result = "\"";
    for (char c : text) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        default:
            result += c;
        }
    }
    result += "\"";
    return result;
}

auto render_list(const std::vector<std::string>& items) -> std::string {
    if (items.empty()) {
        return "[]";
    }
    if (items.size() == 1) {
        return "[" + quote(items.front()) + "]";
    }

    std::string result = "[\n";
    for (const auto& item : items) {
        result += "        " + quote(item) + ",\n";
    }
    result += "    ]";
    return result;
}

/// Renders `value`, or returns std::nullopt when the attribute is omitted.
auto render_value(const AttributeValue& value) -> std::optional<std::string> {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "True" : "False";
    }
    if (const auto* i = std::get_if<int>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return quote(*s);
    }
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        return render_list(*list);
    }
    if (const auto* label = std::get_if<label::Label>(&value)) {
        if (label->empty()) {
            return std::nullopt;
        }
        return quote(label->address);
    }

    const auto& labels = std::get<label::LabelList>(value);
    auto addresses = labels.addresses();
    if (addresses.empty() && !labels.is_explicitly_empty()) {
        return std::nullopt;
    }
    return render_list(addresses);
}

} // namespace

auto render_target(const TargetDeclaration& target) -> std::string {
    std::ostringstream out;
    out << target.rule_class << "(\n";
    out << "    name = " << quote(target.name) << ",\n";
    for (const auto& [key, value] : target.attributes) {
        if (key == "name") {
            continue;
        }
        if (auto rendered = render_value(value)) {
            out << "    " << key << " = " << *rendered << ",\n";
        }
    }
    out << ")\n";
    return out.str();
}

auto render_build_files(const std::vector<TargetDeclaration>& targets) -> BuildFiles {
    std::map<std::string, std::vector<const TargetDeclaration*>> by_dir;
    for (const auto& target : targets) {
        by_dir[target.dir].push_back(&target);
    }

    BuildFiles files;
    for (const auto& [dir, dir_targets] : by_dir) {
        std::map<std::string, std::set<std::string>> loads;
        for (const auto* target : dir_targets) {
            if (!target->load_location.empty()) {
                loads[target->load_location].insert(target->rule_class);
            }
        }

        std::ostringstream out;
        for (const auto& [location, symbols] : loads) {
            out << "load(" << quote(location);
            for (const auto& symbol : symbols) {
                out << ", " << quote(symbol);
            }
            out << ")\n";
        }

        bool first = loads.empty();
        for (const auto* target : dir_targets) {
            if (!first) {
                out << "\n";
            }
            first = false;
            out << render_target(*target);
        }

        TRANSBUILD_LOG_DEBUG("codegen", "Rendered " << dir_targets.size() << " targets for "
                                                    << dir);
        files.emplace(dir, out.str());
    }
    return files;
}

auto write_build_files(const std::filesystem::path& out_dir, const BuildFiles& files)
    -> Result<Ok, Diagnostic> {
    for (const auto& [dir, content] : files) {
        auto package_dir = dir == label::TOP_LEVEL_DIR ? out_dir : out_dir / dir;

        std::error_code ec;
        std::filesystem::create_directories(package_dir, ec);
        if (ec) {
            return Diagnostic{ErrorCodes::IO_WRITE, "",
                              "cannot create " + package_dir.string() + ": " + ec.message()};
        }

        auto path = package_dir / BUILD_FILE_NAME;
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Diagnostic{ErrorCodes::IO_WRITE, "", "cannot open " + path.string()};
        }
        file << content;
        file.close();
        if (!file) {
            return Diagnostic{ErrorCodes::IO_WRITE, "", "failed writing " + path.string()};
        }
        TRANSBUILD_LOG_INFO("codegen", "Wrote " << path.string());
    }
    return Ok{};
}

} // namespace transbuild::convert
