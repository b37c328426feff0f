//! # Package Tree Tests

#include "test_helpers.hpp"
#include "tplid/model/package_tree.hpp"

#include <gtest/gtest.h>

using namespace tplid;
using namespace tplid::model;
using tplid::test::make_class;
using tplid::test::make_classes;

// ============================================================================
// Construction
// ============================================================================

TEST(PackageTreeTest, BuildsNodesAndCounts) {
    std::vector<ClassDescriptor> classes = {make_class("com.lib.A", {"M:()V"}),
                                            make_class("com.lib.net.B", {"M:()I"}),
                                            make_class("com.lib.net.C", {"F:J"})};
    auto result = PackageTree::build(classes);
    ASSERT_TRUE(is_ok(result));
    const auto& tree = unwrap(result);

    // <root>, com, lib, net
    EXPECT_EQ(tree.node_count(), 4u);
    EXPECT_EQ(tree.class_count(), 3u);

    auto lib = tree.find({"com", "lib"});
    ASSERT_TRUE(lib.has_value());
    EXPECT_EQ(tree.node(*lib).classes.size(), 1u);
    EXPECT_EQ(tree.node(*lib).class_count, 3u);
    EXPECT_EQ(tree.node(*lib).depth, 2u);

    auto net = tree.find({"com", "lib", "net"});
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(tree.path_of(*net), (PackagePath{"com", "lib", "net"}));
    EXPECT_FALSE(tree.find({"com", "other"}).has_value());
}

TEST(PackageTreeTest, EmptyInputGivesLoneRoot) {
    auto result = PackageTree::build({});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).node_count(), 1u);
    EXPECT_EQ(unwrap(result).class_count(), 0u);
}

TEST(PackageTreeTest, DefaultPackageClassesSitAtRoot) {
    auto result = PackageTree::build({make_class("Main", {"M:()V"})});
    ASSERT_TRUE(is_ok(result));
    const auto& tree = unwrap(result);
    EXPECT_EQ(tree.node(tree.root()).classes.size(), 1u);
    EXPECT_FALSE(tree.has_multiple_roots());
}

TEST(PackageTreeTest, InputOrderDoesNotMatter) {
    auto classes = make_classes("com.lib", "a", 4);
    tplid::test::append(classes, make_classes("com.lib.util", "b", 3));

    auto reversed = classes;
    std::reverse(reversed.begin(), reversed.end());

    auto first = PackageTree::build(classes);
    auto second = PackageTree::build(reversed);
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first).to_string(), unwrap(second).to_string());

    const auto& a = unwrap(first).nodes();
    const auto& b = unwrap(second).nodes();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        ASSERT_EQ(a[i].classes.size(), b[i].classes.size());
        for (size_t j = 0; j < a[i].classes.size(); ++j) {
            EXPECT_EQ(a[i].classes[j].simple_name, b[i].classes[j].simple_name);
        }
    }
}

// ============================================================================
// Malformed Paths
// ============================================================================

class MalformedPathTest : public ::testing::TestWithParam<std::string> {};

TEST_P(MalformedPathTest, Rejected) {
    auto cls = ClassDescriptor::make({"com", GetParam(), "x"}, "A", {"M:()V"});
    auto result = PackageTree::build({make_class("com.ok.B", {"M:()V"}), cls});
    ASSERT_TRUE(is_err(result));

    const auto* error = std::get_if<MalformedPathError>(&unwrap_err(result));
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->segment_index, 1u);
    EXPECT_FALSE(error->reason.empty());
}

INSTANTIATE_TEST_SUITE_P(BadSegments, MalformedPathTest,
                         ::testing::Values("", "a.b", "a/b", "a b", "\t"));

TEST(ValidateSegmentTest, AcceptsOrdinaryNames) {
    EXPECT_FALSE(validate_segment("okhttp3").has_value());
    EXPECT_FALSE(validate_segment("_internal$").has_value());
    EXPECT_TRUE(validate_segment("").has_value());
}

// ============================================================================
// Root Detection
// ============================================================================

TEST(RootLayoutTest, DescendsToDominantRoot) {
    auto classes = make_classes("com.squareup.okhttp", "a", 2);
    tplid::test::append(classes, make_classes("com.squareup.okhttp.internal", "b", 2));

    auto result = PackageTree::build(classes);
    ASSERT_TRUE(is_ok(result));
    const auto& tree = unwrap(result);

    ASSERT_FALSE(tree.has_multiple_roots());
    const auto& single = std::get<SingleRoot>(tree.root_layout());
    EXPECT_EQ(single.path, (PackagePath{"com", "squareup", "okhttp"}));
    ASSERT_EQ(tree.root_nodes().size(), 1u);
    EXPECT_EQ(tree.path_of(tree.root_nodes().front()), single.path);
    EXPECT_TRUE(tree.warnings().empty());
}

TEST(RootLayoutTest, StopsAtBranch) {
    auto classes = make_classes("com.lib.a", "a", 1);
    tplid::test::append(classes, make_classes("com.lib.b", "b", 1));

    auto result = PackageTree::build(classes);
    ASSERT_TRUE(is_ok(result));
    const auto& single = std::get<SingleRoot>(unwrap(result).root_layout());
    EXPECT_EQ(single.path, (PackagePath{"com", "lib"}));
}

TEST(RootLayoutTest, DisjointTopLevelPackages) {
    auto classes = make_classes("com.google.gson", "a", 2);
    tplid::test::append(classes, make_classes("org.json", "b", 1));

    auto result = PackageTree::build(classes);
    ASSERT_TRUE(is_ok(result));
    const auto& tree = unwrap(result);

    ASSERT_TRUE(tree.has_multiple_roots());
    const auto& multi = std::get<MultipleRoots>(tree.root_layout());
    ASSERT_EQ(multi.roots.size(), 2u);
    EXPECT_EQ(multi.roots[0], (PackagePath{"com", "google", "gson"}));
    EXPECT_EQ(multi.roots[1], (PackagePath{"org", "json"}));
    EXPECT_EQ(tree.root_nodes().size(), 2u);

    ASSERT_EQ(tree.warnings().size(), 1u);
    EXPECT_NE(warning_message(tree.warnings().front()).find("org.json"), std::string::npos);
}
