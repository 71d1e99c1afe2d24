#include <gtest/gtest.h>
#include <yardstick/report/result_writer.h>

#include "../../common/test_helpers.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using nlohmann::json;
using namespace yardstick;
using yardstick::runner::BenchmarkResult;
using yardstick::runner::CaseResult;
using yardstick::runner::SystemReport;

namespace {

BenchmarkResult sampleResult() {
    CaseResult ok;
    ok.caseId = "a";
    ok.systemName = "alpha";
    ok.predicted = json("4");
    ok.metrics = metrics::MetricOutcomes{{"exact_match", metrics::MetricOutcome::scored(1.0)}};
    ok.latency = std::chrono::milliseconds(12);

    CaseResult httpFailure;
    httpFailure.caseId = "b";
    httpFailure.systemName = "alpha";
    httpFailure.error =
        exec::CaseError{exec::CaseErrorKind::HttpError, "returned status 500", 500L};

    CaseResult metric;
    metric.caseId = "c";
    metric.systemName = "alpha";
    metric.predicted = json{{"nested", true}};
    metric.metrics = metrics::MetricOutcomes{
        {"exact_match", metrics::MetricOutcome::failed("Failed to extract reference value")}};

    SystemReport alpha;
    alpha.systemName = "alpha";
    alpha.primaryMetric = "exact_match";
    alpha.aggregates = {{"exact_match_rate", 1.0}, {"worst", std::nullopt}};
    alpha.errorCount = 2;
    alpha.errorCounts = {{"http_error", 1}, {"metric_error", 1}};
    alpha.caseResults = {ok, httpFailure, metric};

    BenchmarkResult result;
    result.specId = "arithmetic";
    result.specName = "Arithmetic QA";
    result.specVersion = "3";
    result.datasetPath = "cases.jsonl";
    result.generatedAt = TimePoint{std::chrono::seconds(1714564800)};
    result.systems = {alpha};
    return result;
}

} // namespace

TEST(ResultWriterTest, FormatsTimestampInUtc) {
    EXPECT_EQ(report::formatTimestamp(TimePoint{std::chrono::seconds(1714564800)}),
              "2024-05-01T12:00:00Z");
    EXPECT_EQ(report::formatTimestamp(TimePoint{}), "1970-01-01T00:00:00Z");
}

TEST(ResultWriterTest, SummaryDocumentLayout) {
    auto j = report::toJson(sampleResult(), false);
    EXPECT_EQ(j["spec_id"], "arithmetic");
    EXPECT_EQ(j["spec_name"], "Arithmetic QA");
    EXPECT_EQ(j["spec_version"], "3");
    EXPECT_EQ(j["dataset_path"], "cases.jsonl");
    EXPECT_EQ(j["generated_at"], "2024-05-01T12:00:00Z");
    EXPECT_EQ(j["complete"], true);

    ASSERT_EQ(j["systems"].size(), 1u);
    const auto& system = j["systems"][0];
    EXPECT_EQ(system["system_name"], "alpha");
    EXPECT_EQ(system["primary_metric"], "exact_match");
    EXPECT_EQ(system["aggregates"]["exact_match_rate"], 1.0);
    EXPECT_TRUE(system["aggregates"]["worst"].is_null());
    EXPECT_EQ(system["error_count"], 2);
    EXPECT_EQ(system["error_counts"]["http_error"], 1);
    EXPECT_EQ(system["case_count"], 3);
    EXPECT_FALSE(system.contains("case_results"));
}

TEST(ResultWriterTest, CaseResultsWhenRequested) {
    auto j = report::toJson(sampleResult(), true);
    const auto& cases = j["systems"][0]["case_results"];
    ASSERT_EQ(cases.size(), 3u);

    EXPECT_EQ(cases[0]["case_id"], "a");
    EXPECT_EQ(cases[0]["predicted"], "4");
    EXPECT_EQ(cases[0]["metrics"]["exact_match"]["score"], 1.0);
    EXPECT_TRUE(cases[0]["error"].is_null());
    EXPECT_EQ(cases[0]["latency_ms"], 12);

    EXPECT_TRUE(cases[1]["predicted"].is_null());
    EXPECT_TRUE(cases[1]["metrics"].is_null());
    EXPECT_EQ(cases[1]["error"]["kind"], "http_error");
    EXPECT_EQ(cases[1]["error"]["http_status"], 500);

    EXPECT_EQ(cases[2]["predicted"], json({{"nested", true}}));
    EXPECT_EQ(cases[2]["metrics"]["exact_match"]["error"], "Failed to extract reference value");
}

TEST(ResultWriterTest, WritesFileAtomically) {
    auto dir = tests::make_temp_dir("yardstick_report_");
    auto file = dir / "nested" / "result.json";

    auto written = report::writeResult(sampleResult(), file, {true, 4});
    ASSERT_TRUE(written) << written.error().message;
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_FALSE(std::filesystem::exists(dir / "nested" / "result.json.tmp"));

    std::ifstream in(file);
    auto parsed = json::parse(in);
    EXPECT_EQ(parsed, report::toJson(sampleResult(), true));
    std::filesystem::remove_all(dir);
}

TEST(ResultWriterTest, InvalidUtf8InMessagesIsReplaced) {
    auto result = sampleResult();
    auto& parseFailure = result.systems[0].caseResults[1];
    parseFailure.error = exec::CaseError{exec::CaseErrorKind::ParseError,
                                         "Response is not valid JSON: \xff\xfe<html>\xc3", 200L};

    auto dir = tests::make_temp_dir("yardstick_report_");
    auto file = dir / "result.json";
    auto written = report::writeResult(result, file, {true, 2});
    ASSERT_TRUE(written) << written.error().message;
    EXPECT_FALSE(std::filesystem::exists(dir / "result.json.tmp"));

    std::ifstream in(file);
    auto parsed = json::parse(in);
    auto message = parsed["systems"][0]["case_results"][1]["error"]["message"].get<std::string>();
    EXPECT_NE(message.find("\xef\xbf\xbd\xef\xbf\xbd<html>"), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(ResultWriterTest, SummaryTableShowsUndefinedAggregates) {
    auto result = sampleResult();
    result.complete = false;
    std::ostringstream out;
    report::printSummary(out, result);
    auto text = out.str();

    EXPECT_NE(text.find("Benchmark: Arithmetic QA (arithmetic) v3"), std::string::npos);
    EXPECT_NE(text.find("INCOMPLETE"), std::string::npos);
    EXPECT_NE(text.find("alpha  (3 cases, 2 errors)"), std::string::npos) << text;
    EXPECT_NE(text.find("1.0000"), std::string::npos);
    EXPECT_NE(text.find("undefined"), std::string::npos);
    EXPECT_NE(text.find("http_error"), std::string::npos);
}
