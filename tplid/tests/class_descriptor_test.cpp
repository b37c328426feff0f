//! # Member Normalization and Class Descriptor Tests

#include "tplid/model/class_descriptor.hpp"
#include "tplid/model/signature.hpp"

#include <gtest/gtest.h>

using namespace tplid;
using namespace tplid::model;

namespace {

MemberInfo method(std::string name, std::string desc, bool is_public = true) {
    MemberInfo m;
    m.kind = MemberKind::Method;
    m.name = std::move(name);
    m.descriptor = std::move(desc);
    m.is_public = is_public;
    return m;
}

MemberInfo field(std::string name, std::string desc) {
    MemberInfo m;
    m.kind = MemberKind::Field;
    m.name = std::move(name);
    m.descriptor = std::move(desc);
    m.is_public = true;
    return m;
}

} // namespace

// ============================================================================
// Fuzzy Descriptors
// ============================================================================

class FuzzyDescriptorTest : public ::testing::Test {
protected:
    std::vector<std::string> prefixes = default_framework_prefixes();
};

TEST_F(FuzzyDescriptorTest, LibraryTypesBecomePlaceholder) {
    EXPECT_EQ(fuzzy_descriptor("(Ljava/lang/String;Lcom/a/B;)V", prefixes),
              "(Ljava/lang/String;X)V");
}

TEST_F(FuzzyDescriptorTest, ArraysAndPrimitivesKept) {
    EXPECT_EQ(fuzzy_descriptor("([Lcom/a/B;I)[J", prefixes), "([XI)[J");
    EXPECT_EQ(fuzzy_descriptor("[[Z", prefixes), "[[Z");
}

TEST_F(FuzzyDescriptorTest, FrameworkFieldTypeKept) {
    EXPECT_EQ(fuzzy_descriptor("Landroid/view/View;", prefixes), "Landroid/view/View;");
}

TEST_F(FuzzyDescriptorTest, RenamedTypesGiveSameDescriptor) {
    EXPECT_EQ(fuzzy_descriptor("(Lcom/squareup/okhttp/Request;)Lcom/squareup/okhttp/Response;",
                               prefixes),
              fuzzy_descriptor("(La/b/c;)La/b/d;", prefixes));
}

TEST_F(FuzzyDescriptorTest, MalformedRejected) {
    EXPECT_FALSE(fuzzy_descriptor("", prefixes).has_value());
    EXPECT_FALSE(fuzzy_descriptor("(Lcom/a/B", prefixes).has_value());
    EXPECT_FALSE(fuzzy_descriptor("(I", prefixes).has_value());
    EXPECT_FALSE(fuzzy_descriptor("Q", prefixes).has_value());
    EXPECT_FALSE(fuzzy_descriptor("()VV", prefixes).has_value());
}

TEST_F(FuzzyDescriptorTest, CustomPrefixes) {
    std::vector<std::string> custom = {"com/google/"};
    EXPECT_EQ(fuzzy_descriptor("(Lcom/google/Gson;Ljava/lang/String;)V", custom),
              "(Lcom/google/Gson;X)V");
}

// ============================================================================
// Member Normalization
// ============================================================================

TEST(NormalizeMemberTest, DefaultDropsNames) {
    MemberPolicy policy;
    EXPECT_EQ(normalize_member(method("run", "(Lcom/a/B;)V"), policy), "M:(X)V");
    EXPECT_EQ(normalize_member(field("count", "I"), policy), "F:I");
}

TEST(NormalizeMemberTest, NamesKeptWhenConfigured) {
    MemberPolicy policy;
    policy.include_member_names = true;
    EXPECT_EQ(normalize_member(method("run", "(Lcom/a/B;)V"), policy), "M:run(X)V");
    EXPECT_EQ(normalize_member(field("count", "I"), policy), "F:count:I");
}

TEST(NormalizeMemberTest, NonPublicDropped) {
    MemberPolicy policy;
    EXPECT_FALSE(normalize_member(method("hidden", "()V", false), policy).has_value());
}

TEST(NormalizeMemberTest, ProtectedKeptWhenConfigured) {
    MemberPolicy policy;
    auto m = method("hook", "()V", false);
    m.is_protected = true;
    EXPECT_FALSE(normalize_member(m, policy).has_value());
    policy.include_protected = true;
    EXPECT_EQ(normalize_member(m, policy), "M:()V");
}

TEST(NormalizeMemberTest, SyntheticBridgeAndClinitDropped) {
    MemberPolicy policy;
    auto synthetic = method("access$000", "()V");
    synthetic.is_synthetic = true;
    auto bridge = method("compareTo", "(Ljava/lang/Object;)I");
    bridge.is_bridge = true;

    EXPECT_FALSE(normalize_member(synthetic, policy).has_value());
    EXPECT_FALSE(normalize_member(bridge, policy).has_value());
    EXPECT_FALSE(normalize_member(method("<clinit>", "()V"), policy).has_value());
    EXPECT_EQ(normalize_member(method("<init>", "(I)V"), policy), "M:(I)V");
}

// ============================================================================
// Class Kind
// ============================================================================

TEST(ClassifyClassTest, FlagsWinOverName) {
    EXPECT_EQ(classify_class("Outer$1", true, false, false), ClassKind::Interface);
    EXPECT_EQ(classify_class("Color", false, true, false), ClassKind::Enum);
    EXPECT_EQ(classify_class("Outer$Inner", false, false, true), ClassKind::Synthetic);
}

TEST(ClassifyClassTest, NameShapes) {
    EXPECT_EQ(classify_class("Client", false, false, false), ClassKind::TopLevel);
    EXPECT_EQ(classify_class("Client$Builder", false, false, false), ClassKind::Inner);
    EXPECT_EQ(classify_class("Client$12", false, false, false), ClassKind::Anonymous);
    EXPECT_EQ(classify_class("Client$Builder$3", false, false, false), ClassKind::Anonymous);
}

TEST(ClassKindTest, NamesAndDecoding) {
    EXPECT_STREQ(class_kind_name(ClassKind::TopLevel), "top-level");
    EXPECT_EQ(class_kind_from_u8(5), ClassKind::Enum);
    EXPECT_FALSE(class_kind_from_u8(CLASS_KIND_COUNT).has_value());
}

// ============================================================================
// ClassDescriptor
// ============================================================================

TEST(ClassDescriptorTest, ContentHashIgnoresNameAndPackage) {
    auto a = ClassDescriptor::make({"com", "a"}, "Client", {"M:()V", "F:I"});
    auto b = ClassDescriptor::make({"x", "y", "z"}, "a", {"F:I", "M:()V"});
    EXPECT_EQ(a.content_hash, b.content_hash);
}

TEST(ClassDescriptorTest, ContentHashDependsOnMembers) {
    auto a = ClassDescriptor::make({"com"}, "A", {"M:()V"});
    auto b = ClassDescriptor::make({"com"}, "A", {"M:()I"});
    EXPECT_NE(a.content_hash, b.content_hash);
}

TEST(ClassDescriptorTest, EmptyMemberSetHasDefinedHash) {
    auto a = ClassDescriptor::make({"com"}, "Marker", {});
    EXPECT_FALSE(a.content_hash.is_zero());
    EXPECT_EQ(a.content_hash, compute_content_hash({}));
}

TEST(ClassDescriptorTest, FromMembersAppliesPolicy) {
    MemberPolicy policy;
    std::vector<MemberInfo> members = {method("run", "(Lcom/a/B;)V"),
                                       method("secret", "()V", false), field("size", "J")};
    auto desc = ClassDescriptor::from_members({"com", "a"}, "Task", members, ClassKind::TopLevel,
                                              policy);
    EXPECT_EQ(desc.member_signatures, (std::set<std::string>{"M:(X)V", "F:J"}));
    EXPECT_EQ(desc.qualified_name(), "com.a.Task");
}

TEST(ClassDescriptorTest, SyntheticClassesFiltered) {
    MemberPolicy policy;
    std::vector<ClassDescriptor> classes = {
        ClassDescriptor::make({"com"}, "A", {"M:()V"}),
        ClassDescriptor::make({"com"}, "A$$Lambda", {"M:()V"}, ClassKind::Synthetic)};

    EXPECT_EQ(apply_class_policy(classes, policy).size(), 1u);
    policy.exclude_synthetic_classes = false;
    EXPECT_EQ(apply_class_policy(classes, policy).size(), 2u);
}
