//! # Match Report Tests

#include "cli/report.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace tplid;
using namespace tplid::cli;

namespace {

auto sample_results() -> std::vector<match::BatchResult> {
    match::MatchResult exact;
    exact.library.name = "OkHttp";
    exact.library.version = "3.12.0";
    exact.library.category = model::LibraryCategory::Utilities;
    exact.score = 1.0;
    exact.path_agnostic_score = 1.0;
    exact.path_aware_score = 1.0;
    exact.matched_class_count = 412;
    exact.library_class_count = 412;
    exact.strategy = match::MatchStrategy::Exact;
    exact.anchor = PackagePath{"a", "b"};

    match::MatchResult partial;
    partial.library.name = "Gson \"fork\"";
    partial.library.version = "2.8.5";
    partial.library.category = model::LibraryCategory::Unknown;
    partial.score = 0.87312;
    partial.path_agnostic_score = 0.87312;
    partial.matched_class_count = 161;
    partial.library_class_count = 180;

    return {match::BatchResult{"app1", {exact, partial}}, match::BatchResult{"app2", {}}};
}

} // namespace

TEST(TextReportTest, OneBlockPerApplication) {
    std::ostringstream out;
    write_report(out, sample_results(), ReportFormat::Text);
    EXPECT_EQ(out.str(),
              "== app1 ==\n"
              "  1.0000  OkHttp 3.12.0 [Utilities]  exact  412/412 classes  at a.b\n"
              "  0.8731  Gson \"fork\" 2.8.5 [Unknown]  partial  161/180 classes\n"
              "== app2 ==\n"
              "  no library matched\n");
}

TEST(JsonReportTest, FlatArrayWithApplication) {
    std::ostringstream out;
    write_report(out, sample_results(), ReportFormat::JSON);
    auto json = out.str();

    EXPECT_EQ(json.front(), '[');
    EXPECT_NE(json.find("{\"application\": \"app1\", \"library\": \"OkHttp\", \"version\": "
                        "\"3.12.0\", \"category\": \"Utilities\", \"score\": 1.0000"),
              std::string::npos);
    EXPECT_NE(json.find("\"strategy\": \"exact\", \"anchor\": \"a.b\"}"), std::string::npos);
    EXPECT_NE(json.find("\"library\": \"Gson \\\"fork\\\"\""), std::string::npos);
    EXPECT_NE(json.find("\"path_aware\": 0.0000"), std::string::npos);
    EXPECT_NE(json.find("\"anchor\": null}"), std::string::npos);
    EXPECT_EQ(json.find("app2"), std::string::npos);
    EXPECT_EQ(json.substr(json.size() - 3), "\n]\n");
}

TEST(JsonReportTest, EmptyResults) {
    std::ostringstream out;
    write_json_report(out, {});
    EXPECT_EQ(out.str(), "[]\n");
}
