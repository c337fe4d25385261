//! # Reference Expander Tests
//!
//! Source and dependency expansion, module reference resolution and the
//! bookkeeping a resolution leaves on the converting module.

#include "convert/reference_expander.hpp"
#include "modules/filegroup.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace transbuild;
using namespace transbuild::convert;
using namespace transbuild::graph;
using config::DirectoryDefault;

class ReferenceExpanderTest : public ::testing::Test {
protected:
    Rc<fs::MockFileSystem> files = make_rc<fs::MockFileSystem>(std::vector<std::string>{
        "x/Android.bp",
        "x/a.c",
        "x/b.c",
        "x/notes.txt",
        "x/sub/c.c",
        "x/y/Android.bp",
        "x/y/d.c",
        "z/Android.bp",
    });
    config::Config config = config::Config::with_defaults(files);
    ModuleGraph graph;
    ModuleTypeRegistry registry;
    ModuleId self = 0;
    ModuleId gen = 0;

    void SetUp() override {
        ASSERT_TRUE(is_ok(modules::register_filegroup(registry)));
        config.allowlist.set_default_config({{"x", DirectoryDefault::TrueRecursively}});

        self = add("self", "x");
        gen = add("gen", "x");
        add("framework-res", "x");
        add("lib", "x/y");
        add("other", "z");
    }

    auto add(const std::string& name, const std::string& dir) -> ModuleId {
        ModuleDecl decl;
        decl.name = name;
        decl.dir = dir;
        decl.type = modules::FILEGROUP_TYPE;
        auto result = graph.add_module(std::move(decl));
        EXPECT_TRUE(is_ok(result));
        return is_ok(result) ? unwrap(result) : 0;
    }

    auto context() -> ConversionContext {
        return ConversionContext(graph.module(self), graph, config, registry);
    }

    auto has_edge(ModuleId from, ModuleId to) -> bool {
        const auto& edges = graph.module(from).edges;
        return std::find(edges.begin(), edges.end(),
                         Edge{to, DependencyTag::ConversionOnly}) != edges.end();
    }
};

// ============================================================================
// Sources
// ============================================================================

TEST_F(ReferenceExpanderTest, LiteralsGlobsAndReferences) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({"*.c", ":gen", "notes.txt"}, {"b.c"});

    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{"a.c", ":gen", "notes.txt"}));
    ASSERT_EQ(labels.excludes.size(), 1u);
    EXPECT_EQ(labels.excludes[0].address, "b.c");
    EXPECT_EQ(labels.includes[1].original_spelling, ":gen");
    EXPECT_FALSE(ctx.has_errors());
}

TEST_F(ReferenceExpanderTest, RecursiveGlobCrossesIntoSubpackage) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({"**/*.c"});

    EXPECT_EQ(labels.addresses(),
              (std::vector<std::string>{"a.c", "b.c", "sub/c.c", "//x/y:d.c"}));
}

TEST_F(ReferenceExpanderTest, OutputNeverContainsExcludedAddresses) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels =
        expander.expand_srcs({"a.c", "b.c", ":gen", "sub/*.c"}, {"b.c", ":gen", "sub/c.c"});

    for (const auto& include : labels.includes) {
        for (const auto& exclude : labels.excludes) {
            EXPECT_NE(include.address, exclude.address);
        }
    }
    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{"a.c"}));
}

TEST_F(ReferenceExpanderTest, ExpansionIsIdempotent) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto first = expander.expand_srcs({"**/*.c", ":gen", ":missing"}, {"a.c"});
    auto second = expander.expand_srcs({"**/*.c", ":gen", ":missing"}, {"a.c"});

    EXPECT_EQ(first, second);
    EXPECT_EQ(graph.module(self).status.missing_deps, (std::vector<std::string>{"missing"}));
    EXPECT_EQ(graph.module(self).edges.size(), 1u);
}

TEST_F(ReferenceExpanderTest, MalformedReferenceIsAnError) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({":gen{.out", "a.c"});

    EXPECT_TRUE(ctx.has_errors());
    ASSERT_EQ(graph.module(self).diagnostics.size(), 1u);
    EXPECT_EQ(graph.module(self).diagnostics[0].code, ErrorCodes::REF_MALFORMED);
    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{"a.c"}));
}

TEST_F(ReferenceExpanderTest, SingleSource) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    EXPECT_EQ(expander.expand_src_single("y/d.c").address, "//x/y:d.c");
    EXPECT_TRUE(expander.expand_src_single("none/*.c").empty());
}

// ============================================================================
// Module References
// ============================================================================

TEST_F(ReferenceExpanderTest, MissingModuleBecomesSentinel) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({":nothing"});

    EXPECT_EQ(labels.addresses(),
              (std::vector<std::string>{":nothing__BP2BUILD__MISSING__DEP"}));
    EXPECT_EQ(graph.module(self).status.missing_deps, (std::vector<std::string>{"nothing"}));
    EXPECT_FALSE(ctx.has_errors());
}

TEST_F(ReferenceExpanderTest, UnconvertedModuleRecorded) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({":other"});

    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{"//z:other"}));
    EXPECT_EQ(graph.module(self).status.unconverted_deps, (std::vector<std::string>{"other"}));
}

TEST_F(ReferenceExpanderTest, OtherPackageUsesFullLabel) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    EXPECT_EQ(expander.expand_srcs({":lib"}).addresses(), (std::vector<std::string>{"//x/y:lib"}));
    EXPECT_TRUE(graph.module(self).status.unconverted_deps.empty());
}

TEST_F(ReferenceExpanderTest, TagsDroppedUnlessConfigured) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({":gen{.out}", ":framework-res{.export-package.apk}"});

    EXPECT_EQ(labels.addresses(),
              (std::vector<std::string>{":gen", ":framework-res.export-package.apk"}));
}

TEST_F(ReferenceExpanderTest, ResolutionAddsConversionEdge) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    (void)expander.expand_srcs({":gen"});

    EXPECT_TRUE(has_edge(self, gen));
}

TEST_F(ReferenceExpanderTest, ExemptDependencyGetsNoEdge) {
    config.dependency_exemptions.dependencies.insert("gen");
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_srcs({":gen"});

    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{":gen"}));
    EXPECT_TRUE(graph.module(self).edges.empty());
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_F(ReferenceExpanderTest, DepsReadBareNamesAsReferences) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_deps(std::vector<std::string>{"gen", "gen", "//:lib", "lib"});

    // "//:lib" names the root namespace explicitly
    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{":gen", "//x/y:lib"}));
    ASSERT_EQ(labels.includes.size(), 3u);
    EXPECT_EQ(labels.includes[1].original_spelling, "//:lib");
}

TEST_F(ReferenceExpanderTest, DepsEmptiness) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto absent = expander.expand_deps(std::nullopt);
    EXPECT_TRUE(absent.is_empty());
    EXPECT_FALSE(absent.is_explicitly_empty());

    auto empty = expander.expand_deps(std::vector<std::string>{});
    EXPECT_TRUE(empty.is_explicitly_empty());
}

TEST_F(ReferenceExpanderTest, DepsExcludes) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto labels = expander.expand_deps(std::vector<std::string>{"gen", "lib"}, {"lib"});

    EXPECT_EQ(labels.addresses(), (std::vector<std::string>{":gen"}));
    ASSERT_EQ(labels.excludes.size(), 1u);
    EXPECT_EQ(labels.excludes[0].address, "//x/y:lib");
    EXPECT_FALSE(has_edge(self, 3));
}

TEST_F(ReferenceExpanderTest, DepsRejectNonReferences) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto label = expander.expand_dep_single("lib{.out");

    EXPECT_TRUE(label.empty());
    ASSERT_EQ(graph.module(self).diagnostics.size(), 1u);
    EXPECT_EQ(graph.module(self).diagnostics[0].code, ErrorCodes::REF_NOT_A_MODULE);
    EXPECT_EQ(graph.module(self).diagnostics[0].message,
              "\"lib{.out\", is not a module reference");
}

// ============================================================================
// Patterns and Mixed Properties
// ============================================================================

TEST_F(ReferenceExpanderTest, PatternRelativeToAnyDirectory) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto in_sub = expander.expand_pattern("x/y", "*.c");
    ASSERT_EQ(in_sub.includes.size(), 1u);
    EXPECT_EQ(in_sub.includes[0].address, "d.c");
    EXPECT_EQ(in_sub.includes[0].original_spelling, "./d.c");

    auto crossing = expander.expand_pattern("x", "**/*.c", {"sub/**"});
    EXPECT_EQ(crossing.addresses(), (std::vector<std::string>{"a.c", "b.c", "//x/y:d.c"}));
}

TEST_F(ReferenceExpanderTest, StringOrLabel) {
    auto ctx = context();
    ReferenceExpander expander(ctx);

    auto reference = expander.string_or_label(":gen");
    ASSERT_TRUE(std::holds_alternative<label::Label>(reference));
    EXPECT_EQ(std::get<label::Label>(reference).address, ":gen");

    auto file = expander.string_or_label("a.c");
    ASSERT_TRUE(std::holds_alternative<label::Label>(file));
    EXPECT_EQ(std::get<label::Label>(file).address, "a.c");

    EXPECT_EQ(std::get<std::string>(expander.string_or_label("sub/c.c")), "sub/c.c");
    EXPECT_EQ(std::get<std::string>(expander.string_or_label("-DDEBUG")), "-DDEBUG");
}
