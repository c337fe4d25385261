#include "convert/package_boundary.hpp"

#include "fs/filesystem.hpp"
#include "log/log.hpp"

#include <vector>

namespace transbuild::convert {

auto is_package_boundary(const config::Config& config, std::string_view dir) -> bool {
    const auto& fs = *config.filesystem;
    if (fs.exists(fs::join(dir, config.native_build_file))) {
        return true;
    }

    if (config.allowlist.should_keep_existing_build_file(dir) || fs.is_symlink(dir)) {
        for (const auto& build_file : config.target_build_files) {
            if (fs.exists(fs::join(dir, build_file))) {
                return true;
            }
        }
    }
    return false;
}

namespace {

auto split_path(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            parts.emplace_back(path.substr(start));
            break;
        }
        parts.emplace_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

} // namespace

auto transform_subpackage_path(const config::Config& config, std::string_view base_dir,
                               const label::Label& label) -> label::Label {
    label::Label result;
    result.original_spelling =
        label.original_spelling.empty() ? label.address : label.original_spelling;

    if (label::is_absolute(label.address)) {
        result.address = label.address;
        return result;
    }

    std::string_view path = label.address;
    if (path.starts_with("./")) {
        path.remove_prefix(2);
    }

    auto parts = split_path(path);

    // Deepest prefix first; the whole path may itself name a package
    std::string rewritten;
    bool found_boundary = false;
    for (size_t i = parts.size(); i-- > 0;) {
        char sep = '/';
        if (!found_boundary) {
            std::string prefix(base_dir);
            for (size_t j = 0; j <= i; ++j) {
                prefix = fs::join(prefix, parts[j]);
            }
            if (is_package_boundary(config, prefix)) {
                sep = ':';
                found_boundary = true;
            }
        }
        rewritten = rewritten.empty() ? parts[i] : parts[i] + sep + rewritten;
    }

    if (!found_boundary) {
        result.address = std::string(path);
        return result;
    }

    if (base_dir == label::TOP_LEVEL_DIR || base_dir.empty()) {
        result.address = "//" + rewritten;
    } else {
        result.address = "//" + std::string(base_dir) + "/" + rewritten;
    }
    TRANSBUILD_LOG_TRACE("paths", "Crossed package boundary: " << label.address << " -> "
                                                               << result.address);
    return result;
}

auto transform_subpackage_paths(const config::Config& config, std::string_view base_dir,
                                const label::LabelList& list) -> label::LabelList {
    label::LabelList result = list;
    for (auto& include : result.includes) {
        include = transform_subpackage_path(config, base_dir, include);
    }
    for (auto& exclude : result.excludes) {
        exclude = transform_subpackage_path(config, base_dir, exclude);
    }
    return result;
}

} // namespace transbuild::convert
