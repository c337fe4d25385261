//! # Build File Writer Tests

#include "convert/build_file_writer.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>

using namespace transbuild;
using namespace transbuild::convert;
namespace stdfs = std::filesystem;

namespace {

auto make_target(std::string rule, std::string name, std::string dir,
                 std::string load = "") -> TargetDeclaration {
    TargetDeclaration target;
    target.rule_class = std::move(rule);
    target.name = std::move(name);
    target.dir = std::move(dir);
    target.load_location = std::move(load);
    return target;
}

} // namespace

// ============================================================================
// render_target
// ============================================================================

TEST(RenderTargetTest, NameFirstThenSortedAttributes) {
    auto target = make_target("filegroup", "fg", "x");
    target.attributes["srcs"] = label::LabelList({label::Label("b.c"), label::Label("a.c")});
    target.attributes["path"] = std::string("src");
    target.attributes["visible"] = true;
    target.attributes["count"] = 3;

    EXPECT_EQ(render_target(target), "filegroup(\n"
                                     "    name = \"fg\",\n"
                                     "    count = 3,\n"
                                     "    path = \"src\",\n"
                                     "    srcs = [\n"
                                     "        \"b.c\",\n"
                                     "        \"a.c\",\n"
                                     "    ],\n"
                                     "    visible = True,\n"
                                     ")\n");
}

TEST(RenderTargetTest, SingleElementListStaysInline) {
    auto target = make_target("proto_library", "p_proto", "x");
    target.attributes["tags"] = std::vector<std::string>{"manual"};
    target.attributes["strip_import_prefix"] = std::string();

    EXPECT_EQ(render_target(target), "proto_library(\n"
                                     "    name = \"p_proto\",\n"
                                     "    strip_import_prefix = \"\",\n"
                                     "    tags = [\"manual\"],\n"
                                     ")\n");
}

TEST(RenderTargetTest, EmptyLabelsOmittedUnlessExplicit) {
    auto target = make_target("alias", "a", "x");
    target.attributes["actual"] = label::Label();
    target.attributes["deps"] = label::LabelList();
    target.attributes["srcs"] = label::LabelList::make_explicitly_empty();
    target.attributes["excluded"] = label::LabelList({label::Label("a.c")}, {label::Label("a.c")});

    EXPECT_EQ(render_target(target), "alias(\n"
                                     "    name = \"a\",\n"
                                     "    srcs = [],\n"
                                     ")\n");
}

TEST(RenderTargetTest, EscapesStrings) {
    auto target = make_target("genrule", "g", "x");
    target.attributes["cmd"] = std::string("echo \"hi\"\n");

    EXPECT_NE(render_target(target).find("cmd = \"echo \\\"hi\\\"\\n\","), std::string::npos);
}

// ============================================================================
// render_build_files
// ============================================================================

TEST(RenderBuildFilesTest, GroupsByDirectoryWithLoads) {
    std::vector<TargetDeclaration> targets;
    targets.push_back(make_target("filegroup", "fg", "x", "//build/bazel/rules:filegroup.bzl"));
    targets.push_back(make_target("proto_library", "fg_proto", "x/y"));
    targets.push_back(make_target("alias", "fg_bp2build_converted", "x"));
    targets.push_back(
        make_target("aidl_library", "aidl", "x", "//build/bazel/rules/aidl:aidl_library.bzl"));

    auto files = render_build_files(targets);

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files["x"], "load(\"//build/bazel/rules/aidl:aidl_library.bzl\", \"aidl_library\")\n"
                          "load(\"//build/bazel/rules:filegroup.bzl\", \"filegroup\")\n"
                          "\n"
                          "filegroup(\n"
                          "    name = \"fg\",\n"
                          ")\n"
                          "\n"
                          "alias(\n"
                          "    name = \"fg_bp2build_converted\",\n"
                          ")\n"
                          "\n"
                          "aidl_library(\n"
                          "    name = \"aidl\",\n"
                          ")\n");
    EXPECT_EQ(files["x/y"], "proto_library(\n"
                            "    name = \"fg_proto\",\n"
                            ")\n");
}

// ============================================================================
// write_build_files
// ============================================================================

class WriteBuildFilesTest : public ::testing::Test {
protected:
    stdfs::path out;

    void SetUp() override {
        out = stdfs::temp_directory_path() / "transbuild_writer_test";
        stdfs::remove_all(out);
    }

    void TearDown() override {
        stdfs::remove_all(out);
    }

    auto read(const stdfs::path& path) -> std::string {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(WriteBuildFilesTest, WritesEveryPackage) {
    BuildFiles files{{".", "root\n"}, {"x/y", "nested\n"}};

    auto result = write_build_files(out, files);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(read(out / BUILD_FILE_NAME), "root\n");
    EXPECT_EQ(read(out / "x" / "y" / BUILD_FILE_NAME), "nested\n");
}

TEST_F(WriteBuildFilesTest, FailureIsDiagnostic) {
    // A regular file where a package directory is needed
    stdfs::create_directories(out);
    std::ofstream(out / "x") << "not a directory";

    auto result = write_build_files(out, BuildFiles{{"x/y", "nested\n"}});

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, ErrorCodes::IO_WRITE);
}
