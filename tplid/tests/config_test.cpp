//! # Configuration Tests

#include "tplid/config/config.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace tplid;
using namespace tplid::config;

// ============================================================================
// tplid.toml
// ============================================================================

TEST(ConfigParserTest, EmptyDocumentGivesDefaults) {
    SimpleTomlParser parser("");
    auto config = parser.parse_config();
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->matching.min_score, 0.5);
    EXPECT_TRUE(config->matching.path_aware);
    EXPECT_DOUBLE_EQ(config->matching.path_aware_weight, 0.0);
    EXPECT_DOUBLE_EQ(config->matching.partial_class_weight, 0.5);
    EXPECT_EQ(config->profile.child_order, model::ChildOrder::SubtreeHash);
    EXPECT_FALSE(config->profile.parallel);
    EXPECT_TRUE(config->validate().empty());
}

TEST(ConfigParserTest, AllKeys) {
    SimpleTomlParser parser(R"(
# tplid settings
[matching]
min-score = 0.7
path-aware = false
path-aware-weight = 0.25   # blend
partial-class-weight = 0.4

[profile]
include-member-names = true
include-protected = true
exclude-synthetic-classes = false
framework-prefixes = [
    "java/",
    "android/",   # platform
]
parallel = true
child-order = "segment-name"

[unknown.section]
anything = [1, [2, 3]]
)");
    auto config = parser.parse_config();
    ASSERT_TRUE(config.has_value()) << parser.get_error();

    EXPECT_DOUBLE_EQ(config->matching.min_score, 0.7);
    EXPECT_FALSE(config->matching.path_aware);
    EXPECT_DOUBLE_EQ(config->matching.path_aware_weight, 0.25);
    EXPECT_DOUBLE_EQ(config->matching.partial_class_weight, 0.4);

    const auto& policy = config->profile.member_policy;
    EXPECT_TRUE(policy.include_member_names);
    EXPECT_TRUE(policy.include_protected);
    EXPECT_FALSE(policy.exclude_synthetic_classes);
    EXPECT_EQ(policy.framework_prefixes, (std::vector<std::string>{"java/", "android/"}));
    EXPECT_TRUE(config->profile.parallel);
    EXPECT_EQ(config->profile.child_order, model::ChildOrder::SegmentName);

    auto options = config->profile.hash_tree_options();
    EXPECT_EQ(options.child_order, model::ChildOrder::SegmentName);
    EXPECT_TRUE(options.parallel);
}

TEST(ConfigParserTest, UnknownKeysIgnored) {
    SimpleTomlParser parser("[matching]\nfuture-key = \"x\"\nmin-score = 0.6\n");
    auto config = parser.parse_config();
    ASSERT_TRUE(config.has_value()) << parser.get_error();
    EXPECT_DOUBLE_EQ(config->matching.min_score, 0.6);
}

struct ConfigErrorCase {
    const char* source;
    const char* message;
};

class ConfigErrorTest : public ::testing::TestWithParam<ConfigErrorCase> {};

TEST_P(ConfigErrorTest, ReportsLineAndMessage) {
    SimpleTomlParser parser(GetParam().source);
    EXPECT_FALSE(parser.parse_config().has_value());
    EXPECT_NE(parser.get_error().find(GetParam().message), std::string::npos)
        << parser.get_error();
}

INSTANTIATE_TEST_SUITE_P(
    Errors, ConfigErrorTest,
    ::testing::Values(
        ConfigErrorCase{"min-score = 0.5\n", "Line 1: Key outside of a section"},
        ConfigErrorCase{"[matching]\n\nmin-score = high\n", "Line 3: Expected number"},
        ConfigErrorCase{"[matching]\npath-aware = yes\n", "Line 2: Expected boolean"},
        ConfigErrorCase{"[profile]\nchild-order = \"random\"\n", "Unknown child order"},
        ConfigErrorCase{"[profile]\nframework-prefixes = [\"java/\" \"x\"]\n",
                        "Expected ',' or ']'"},
        ConfigErrorCase{"[matching\nmin-score = 1\n", "Expected ']' after section name"},
        ConfigErrorCase{"[matching]\nmin-score 0.5\n", "Expected '=' after key"},
        ConfigErrorCase{"[library]\nname = \"open\n", "Unterminated string"}));

TEST(ConfigValidateTest, RangesChecked) {
    TplidConfig config;
    config.matching.min_score = 1.5;
    EXPECT_NE(config.validate().find("min-score"), std::string::npos);

    config = TplidConfig{};
    config.matching.path_aware_weight = -0.1;
    EXPECT_NE(config.validate().find("path-aware-weight"), std::string::npos);

    config = TplidConfig{};
    config.matching.partial_class_weight = 2.0;
    EXPECT_NE(config.validate().find("partial-class-weight"), std::string::npos);

    config = TplidConfig{};
    config.profile.member_policy.framework_prefixes = {"java/", ""};
    EXPECT_NE(config.validate().find("framework-prefixes"), std::string::npos);
}

// ============================================================================
// library.toml
// ============================================================================

TEST(LibraryParserTest, FullDescription) {
    SimpleTomlParser parser(R"([library]
name = "OkHttp"
version = "3.12.0"
category = "utilities"
release-date = "2018-11-16"
comment = "HTTP client \"3.x\""
)");
    auto desc = parser.parse_library();
    ASSERT_TRUE(desc.has_value()) << parser.get_error();
    EXPECT_EQ(desc->name, "OkHttp");
    EXPECT_EQ(desc->version, "3.12.0");
    EXPECT_EQ(desc->category, model::LibraryCategory::Utilities);
    EXPECT_EQ(desc->release_date, "2018-11-16");
    EXPECT_EQ(desc->comment, "HTTP client \"3.x\"");
}

TEST(LibraryParserTest, MissingSection) {
    SimpleTomlParser parser("[matching]\nmin-score = 0.5\n");
    EXPECT_FALSE(parser.parse_library().has_value());
    EXPECT_NE(parser.get_error().find("Missing [library] section"), std::string::npos);
}

TEST(LibraryParserTest, NameAndVersionRequired) {
    SimpleTomlParser parser("[library]\nname = \"OkHttp\"\n");
    EXPECT_FALSE(parser.parse_library().has_value());
    EXPECT_NE(parser.get_error().find("requires name and version"), std::string::npos);
}

TEST(LibraryParserTest, UnknownCategory) {
    SimpleTomlParser parser("[library]\nname = \"a\"\nversion = \"1\"\ncategory = \"Games\"\n");
    EXPECT_FALSE(parser.parse_library().has_value());
    EXPECT_NE(parser.get_error().find("Line 4: Unknown category 'Games'"), std::string::npos);
}

TEST(LibraryParserTest, BadReleaseDate) {
    SimpleTomlParser parser("[library]\nname = \"a\"\nversion = \"1\"\nrelease-date = \"16.11.2018\"\n");
    EXPECT_FALSE(parser.parse_library().has_value());
    EXPECT_NE(parser.get_error().find("Invalid release date"), std::string::npos);
}

TEST(ReleaseDateTest, Shapes) {
    EXPECT_TRUE(is_valid_release_date(""));
    EXPECT_TRUE(is_valid_release_date("2019-02-28"));
    EXPECT_FALSE(is_valid_release_date("2019-13-01"));
    EXPECT_FALSE(is_valid_release_date("2019-1-01"));
    EXPECT_FALSE(is_valid_release_date("2019/01/01"));
    EXPECT_FALSE(is_valid_release_date("2019-01-00"));
}

// ============================================================================
// Files
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "tplid_config_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir / name);
        out << content;
    }

    fs::path dir;
};

TEST_F(ConfigFileTest, LoadValidatesRanges) {
    write("tplid.toml", "[matching]\nmin-score = 1.5\n");
    auto result = TplidConfig::load(dir / "tplid.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("min-score must be between 0 and 1"), std::string::npos);
}

TEST_F(ConfigFileTest, LoadPrefixesPath) {
    write("tplid.toml", "[matching]\nmin-score = x\n");
    auto result = TplidConfig::load(dir / "tplid.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("tplid.toml: Line 2"), std::string::npos);
}

TEST_F(ConfigFileTest, MissingFile) {
    EXPECT_TRUE(is_err(TplidConfig::load(dir / "absent.toml")));
    EXPECT_TRUE(is_err(load_library_description(dir / "absent.toml")));
}

TEST_F(ConfigFileTest, LibraryDescriptionFile) {
    write("library.toml", "[library]\nname = \"Gson\"\nversion = \"2.8.5\"\n");
    auto result = load_library_description(dir / "library.toml");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).to_string(), "Gson 2.8.5");
    EXPECT_EQ(unwrap(result).category, model::LibraryCategory::Unknown);
}
