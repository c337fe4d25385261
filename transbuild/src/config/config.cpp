#include "config/config.hpp"

namespace transbuild::config {

auto os_name(OsType os) -> const char* {
    switch (os) {
    case OsType::Common:
        return "common_os";
    case OsType::Android:
        return "android";
    case OsType::Linux:
        return "linux_glibc";
    case OsType::LinuxBionic:
        return "linux_bionic";
    case OsType::Darwin:
        return "darwin";
    case OsType::Windows:
        return "windows";
    }
    return "common_os";
}

auto parse_os(std::string_view text) -> std::optional<OsType> {
    for (auto os : {OsType::Common, OsType::Android, OsType::Linux, OsType::LinuxBionic,
                    OsType::Darwin, OsType::Windows}) {
        if (text == os_name(os)) {
            return os;
        }
    }
    return std::nullopt;
}

auto TaggedOutputRules::keeps_tag(std::string_view name, std::string_view type,
                                  std::string_view tag) const -> bool {
    if (tag.empty()) {
        return false;
    }
    if (module_names.find(name) != module_names.end()) {
        return true;
    }
    auto it = module_type_tags.find(type);
    return it != module_type_tags.end() && it->second.contains(std::string(tag));
}

auto Config::with_defaults(Rc<fs::FileSystem> filesystem) -> Config {
    Config config;
    config.filesystem = std::move(filesystem);

    // libc depends on itself in a variantless graph; crtbegin_dynamic has
    // dependencies that are not convertible yet.
    config.dependency_exemptions.source_modules = {"libc", "crtbegin_dynamic"};
    // A source file shares this module's name in its directory.
    config.dependency_exemptions.dependencies = {"mke2fs.conf"};

    config.tagged_outputs.module_names = {"framework-res"};
    config.tagged_outputs.module_type_tags["java_aconfig_library"] = {".generated_srcjars"};
    return config;
}

} // namespace transbuild::config
