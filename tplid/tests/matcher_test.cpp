//! # Matcher Tests
//!
//! Scores are checked against values worked out by hand from the synthetic
//! class sets in `test_helpers.hpp`.

#include "test_helpers.hpp"
#include "tplid/match/matcher.hpp"

#include <gtest/gtest.h>

using namespace tplid;
using namespace tplid::match;
using namespace tplid::model;
using namespace tplid::test;

namespace {

auto okhttp_classes() -> std::vector<ClassDescriptor> {
    auto classes = make_classes("com.squareup.okhttp", "ok", 6);
    append(classes, make_classes("com.squareup.okhttp.internal", "int", 4));
    append(classes, make_classes("com.squareup.okhttp.internal.http", "http", 3));
    return classes;
}

auto app_classes() -> std::vector<ClassDescriptor> {
    auto classes = make_classes("com.example.app", "app", 5);
    append(classes, make_classes("com.example.app.ui", "ui", 3));
    return classes;
}

auto relaxed_config() -> MatchConfig {
    MatchConfig config;
    config.min_score = 0.1;
    return config;
}

} // namespace

// ============================================================================
// Exact Matches
// ============================================================================

class ExactMatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        library = std::make_unique<LibraryFingerprint>(
            fingerprint_of("okhttp", "2.7.5", okhttp_classes()));
    }

    std::unique_ptr<LibraryFingerprint> library;
};

TEST_F(ExactMatchTest, EmbeddedLibraryFoundWithAnchor) {
    auto classes = app_classes();
    append(classes, okhttp_classes());
    auto query = query_of(classes);

    auto results = Matcher().match(query, std::vector<LibraryFingerprint>{*library});
    ASSERT_EQ(results.size(), 1u);
    const auto& r = results.front();
    EXPECT_EQ(r.library.name, "okhttp");
    EXPECT_EQ(r.strategy, MatchStrategy::Exact);
    EXPECT_DOUBLE_EQ(r.score, 1.0);
    EXPECT_EQ(r.matched_class_count, 13u);
    EXPECT_EQ(r.library_class_count, 13u);
    ASSERT_TRUE(r.anchor.has_value());
    EXPECT_EQ(join_path(*r.anchor), "com.squareup.okhttp");
}

TEST_F(ExactMatchTest, RenamedLibraryStillExact) {
    auto classes = app_classes();
    append(classes, rename_all(okhttp_classes(), "o"));
    auto query = query_of(classes);

    auto results = Matcher().match(query, std::vector<LibraryFingerprint>{*library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().strategy, MatchStrategy::Exact);
    ASSERT_TRUE(results.front().anchor.has_value());
    EXPECT_EQ(join_path(*results.front().anchor), "ocom.osquareup.ookhttp");
}

TEST_F(ExactMatchTest, RelocatedLibraryStillExact) {
    PackagePath prefix = {"shaded", "deps"};
    auto relocated = okhttp_classes();
    for (auto& cls : relocated) {
        cls.package_path.insert(cls.package_path.begin(), prefix.begin(), prefix.end());
    }
    auto classes = app_classes();
    append(classes, relocated);

    auto results = Matcher().match(query_of(classes), std::vector<LibraryFingerprint>{*library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().strategy, MatchStrategy::Exact);
    EXPECT_EQ(join_path(*results.front().anchor), "shaded.deps.com.squareup.okhttp");
}

TEST_F(ExactMatchTest, UnrelatedApplicationGivesNoResult) {
    auto results =
        Matcher().match(query_of(app_classes()), std::vector<LibraryFingerprint>{*library});
    EXPECT_TRUE(results.empty());
}

TEST(MultiRootMatchTest, ExactNeedsEveryRoot) {
    auto lib_classes = make_classes("com.google.gson", "g", 4);
    append(lib_classes, make_classes("org.json", "j", 2));
    auto library = fingerprint_of("gson", "2.8", lib_classes);
    ASSERT_EQ(library.hash_trees().size(), 2u);

    auto full = app_classes();
    append(full, lib_classes);
    auto results = Matcher().match(query_of(full), std::vector<LibraryFingerprint>{library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().strategy, MatchStrategy::Exact);
    // Anchor of the first root in path order
    EXPECT_EQ(join_path(*results.front().anchor), "com.google.gson");

    auto partial = app_classes();
    append(partial, make_classes("com.google.gson", "g", 4));
    results = Matcher().match(query_of(partial), std::vector<LibraryFingerprint>{library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().strategy, MatchStrategy::Partial);
    EXPECT_EQ(results.front().matched_class_count, 4u);
    EXPECT_NEAR(results.front().score, 4.0 / 6.0, 1e-9);
}

// ============================================================================
// Partial Matches
// ============================================================================

TEST(PartialMatchTest, ScoreDropsWithEachRemovedClass) {
    auto library = fingerprint_of("okhttp", "2.7.5", okhttp_classes());
    MatchConfig config;
    config.min_score = 0.0;
    Matcher matcher(config);

    // Drop classes from com.squareup.okhttp (6 classes of 13)
    double previous = 1.0;
    for (int removed = 1; removed <= 3; ++removed) {
        auto classes = okhttp_classes();
        classes.erase(classes.begin(), classes.begin() + removed);
        auto results = matcher.match(query_of(classes), std::vector<LibraryFingerprint>{library});
        ASSERT_EQ(results.size(), 1u);

        const auto& r = results.front();
        EXPECT_EQ(r.strategy, MatchStrategy::Partial);
        EXPECT_EQ(r.matched_class_count, 13u - removed);
        double expected = (7.0 + 0.5 * (6 - removed)) / 13.0;
        EXPECT_NEAR(r.path_agnostic_score, expected, 1e-9);
        EXPECT_LT(r.score, previous);
        previous = r.score;
    }
}

TEST(PartialMatchTest, PathAwareScoreAndAnchor) {
    auto lib_classes = make_classes("com.lib.a", "a", 3);
    append(lib_classes, make_classes("com.lib.b", "b", 3));
    auto library = fingerprint_of("lib", "1.0", lib_classes);

    auto classes = lib_classes;
    classes.push_back(make_class("com.lib.b.Extra", {"M:()Lextra;"}));
    auto query = query_of(classes);

    MatchConfig config = relaxed_config();
    config.path_aware_weight = 1.0;
    auto results = Matcher(config).match(query, std::vector<LibraryFingerprint>{library});
    ASSERT_EQ(results.size(), 1u);

    const auto& r = results.front();
    EXPECT_EQ(r.strategy, MatchStrategy::Partial);
    EXPECT_NEAR(r.path_agnostic_score, 0.75, 1e-9);
    EXPECT_NEAR(r.path_aware_score, 0.5, 1e-9);
    EXPECT_NEAR(r.score, 0.5, 1e-9);
    EXPECT_EQ(r.matched_class_count, 6u);
    ASSERT_TRUE(r.anchor.has_value());
    EXPECT_EQ(join_path(*r.anchor), "com.lib");
}

TEST(PartialMatchTest, WeightBlendsScores) {
    auto lib_classes = make_classes("com.lib.a", "a", 3);
    append(lib_classes, make_classes("com.lib.b", "b", 3));
    auto library = fingerprint_of("lib", "1.0", lib_classes);

    auto classes = lib_classes;
    classes.push_back(make_class("com.lib.b.Extra", {"M:()Lextra;"}));

    MatchConfig config = relaxed_config();
    config.path_aware_weight = 0.5;
    auto results = Matcher(config).match(query_of(classes), std::vector<LibraryFingerprint>{library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(results.front().score, 0.625, 1e-9);
}

TEST(PartialMatchTest, PathAwareDisabled) {
    auto lib_classes = make_classes("com.lib.a", "a", 3);
    append(lib_classes, make_classes("com.lib.b", "b", 3));
    auto library = fingerprint_of("lib", "1.0", lib_classes);

    auto classes = lib_classes;
    classes.push_back(make_class("com.lib.b.Extra", {"M:()Lextra;"}));

    MatchConfig config = relaxed_config();
    config.path_aware = false;
    config.path_aware_weight = 1.0;
    auto results = Matcher(config).match(query_of(classes), std::vector<LibraryFingerprint>{library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(results.front().score, 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(results.front().path_aware_score, 0.0);
    EXPECT_FALSE(results.front().anchor.has_value());
}

TEST(PartialMatchTest, PartialClassWeightScalesClassCredit) {
    auto lib_classes = make_classes("com.lib.a", "a", 3);
    append(lib_classes, make_classes("com.lib.b", "b", 3));
    auto library = fingerprint_of("lib", "1.0", lib_classes);

    auto classes = lib_classes;
    classes.push_back(make_class("com.lib.b.Extra", {"M:()Lextra;"}));

    MatchConfig config = relaxed_config();
    config.partial_class_weight = 0.0;
    auto results = Matcher(config).match(query_of(classes), std::vector<LibraryFingerprint>{library});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(results.front().score, 0.5, 1e-9);
    EXPECT_EQ(results.front().matched_class_count, 6u);
}

// ============================================================================
// Threshold and Ranking
// ============================================================================

TEST(ThresholdTest, SharedUtilityPackageDoesNotReportLargeLibrary) {
    auto big = make_classes("com.a", "a", 498);
    append(big, make_classes("com.a.util", "u", 2));
    auto small = make_classes("com.b.util", "u", 2);

    std::vector<LibraryFingerprint> corpus = {fingerprint_of("big", "1", big),
                                              fingerprint_of("small", "1", small)};

    MatchConfig config;
    config.min_score = 0.1;
    Matcher matcher(config);
    auto results = matcher.match(query_of(small), corpus);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().library.name, "small");
    EXPECT_EQ(results.front().strategy, MatchStrategy::Exact);

    // The big library does score, just below the threshold
    auto query = query_of(small);
    QueryIndex index(query);
    auto big_score = matcher.score(index, corpus.front());
    EXPECT_EQ(big_score.matched_class_count, 2u);
    EXPECT_NEAR(big_score.score, 2.0 / 500.0, 1e-9);
}

TEST(ThresholdTest, EmptyCorpusGivesNoResults) {
    EXPECT_TRUE(Matcher().match(query_of(app_classes()), Corpus()).empty());
}

TEST(RankingTest, OrderOfKeys) {
    MatchResult a;
    a.library.name = "a";
    a.library.version = "1";
    a.score = 0.8;
    MatchResult b = a;
    b.library.name = "b";

    // Score first
    b.score = 0.9;
    EXPECT_TRUE(rank_before(b, a));

    // Then path-aware score
    b.score = 0.8;
    b.path_aware_score = 0.4;
    EXPECT_TRUE(rank_before(b, a));

    // Then library size
    b.path_aware_score = 0.0;
    b.library_class_count = 10;
    EXPECT_TRUE(rank_before(b, a));

    // Then name, then version
    b.library_class_count = 0;
    EXPECT_TRUE(rank_before(a, b));
    b.library.name = "a";
    b.library.version = "2";
    EXPECT_TRUE(rank_before(a, b));
    EXPECT_FALSE(rank_before(a, a));
}

TEST(RankingTest, ResultsSortedBestFirst) {
    auto lib_classes = okhttp_classes();
    std::vector<LibraryFingerprint> corpus = {
        fingerprint_of("partial", "1", make_classes("com.squareup.okhttp", "ok", 6)),
        fingerprint_of("okhttp", "2.7.5", lib_classes)};

    // Both score 1.0 with full path-aware scores; the larger library wins
    auto results = Matcher().match(query_of(lib_classes), corpus);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].library.name, "okhttp");
    EXPECT_EQ(results[1].library.name, "partial");
}
