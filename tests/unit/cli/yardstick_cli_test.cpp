/**
 * End-to-end tests for the yardstick command line.
 *
 * These tests verify that:
 * 1. `validate` exits 0 for a valid spec and 1 with every violation listed otherwise
 * 2. `run` drives the runner through an injected transport and writes the artifact
 * 3. Argument problems (no systems, bad --system) fail before any request is sent
 */

#include <gtest/gtest.h>
#include <yardstick/cli/yardstick_cli.h>

#include "../../common/test_helpers.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using nlohmann::json;
using namespace yardstick;
using yardstick::cli::YardstickCLI;
using yardstick::tests::FakeHttpClient;
using yardstick::tests::jsonResponse;

namespace {

Result<http::HttpResponse> echoAnswer(const http::HttpRequest& request) {
    auto body = json::parse(request.body);
    return jsonResponse(json{{"answer", body.at("expected")}}.dump());
}

int runCli(YardstickCLI& cli, std::vector<std::string> args) {
    std::vector<const char*> argv = {"yardstick"};
    for (const auto& arg : args)
        argv.push_back(arg.c_str());
    return cli.run(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));
}

json readJson(const std::filesystem::path& file) {
    std::ifstream in(file);
    return json::parse(in);
}

} // namespace

class YardstickCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("yardstick_cli_");
        specPath_ = tests::write_file(dir_ / "spec.yaml", tests::minimal_spec_yaml());
        tests::write_file(dir_ / "cases.jsonl",
                          "{\"id\":\"q1\",\"input\":{\"expected\":\"4\"},"
                          "\"reference\":{\"answer\":\"4\"}}\n"
                          "{\"id\":\"q2\",\"input\":{\"expected\":\"Nine\"},"
                          "\"reference\":{\"answer\":\"nine\"}}\n"
                          "{\"id\":\"q3\",\"input\":{\"expected\":\"7\"},"
                          "\"reference\":{\"answer\":\"8\"}}\n");
        configPath_ = tests::write_file(dir_ / "config.toml", "[runner]\nconcurrency = 2\n");
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    std::filesystem::path specPath_;
    std::filesystem::path configPath_;
    tests::ScopedEnv noConfigEnv_{"YARDSTICK_CONFIG", nullptr};
    tests::ScopedEnv noLevelEnv_{"YARDSTICK_LOG_LEVEL", nullptr};
};

TEST_F(YardstickCliTest, ValidateAcceptsWellFormedSpec) {
    YardstickCLI cli;
    testing::internal::CaptureStdout();
    int code = runCli(cli, {"validate", specPath_.string()});
    auto out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, cli::kExitOk);
    EXPECT_NE(out.find("[OK] arithmetic v1: 1 metric(s), 1 aggregate(s), 3 case(s)"),
              std::string::npos)
        << out;
}

TEST_F(YardstickCliTest, ValidateListsEveryViolation) {
    auto bad = tests::write_file(dir_ / "bad.yaml", "id: broken\n"
                                                    "contract:\n"
                                                    "  protocol: grpc\n");
    YardstickCLI cli;
    testing::internal::CaptureStderr();
    int code = runCli(cli, {"validate", bad.string()});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::kExitFailure);
    EXPECT_NE(err.find("  - name: required field is missing"), std::string::npos) << err;
    EXPECT_NE(err.find("  - contract.protocol: unsupported protocol 'grpc'"), std::string::npos);
    EXPECT_NE(err.find("contract.response: required field is missing"), std::string::npos);
    EXPECT_NE(err.find("[FAIL]"), std::string::npos);
}

TEST_F(YardstickCliTest, ValidateReportsDatasetErrorsUnlessSkipped) {
    tests::write_file(dir_ / "cases.jsonl", "{\"id\":\"q1\"}\n");

    YardstickCLI strict;
    testing::internal::CaptureStderr();
    EXPECT_EQ(runCli(strict, {"validate", specPath_.string()}), cli::kExitFailure);
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Dataset error: line 1"), std::string::npos) << err;

    YardstickCLI lenient;
    testing::internal::CaptureStdout();
    EXPECT_EQ(runCli(lenient, {"validate", "--skip-dataset", specPath_.string()}), cli::kExitOk);
    testing::internal::GetCapturedStdout();
}

TEST_F(YardstickCliTest, SubcommandIsRequired) {
    YardstickCLI cli;
    testing::internal::CaptureStderr();
    testing::internal::CaptureStdout();
    EXPECT_NE(runCli(cli, {}), cli::kExitOk);
    testing::internal::GetCapturedStdout();
    testing::internal::GetCapturedStderr();
}

TEST_F(YardstickCliTest, RunWritesResultArtifact) {
    auto client = std::make_shared<FakeHttpClient>(&echoAnswer);
    auto outPath = dir_ / "out" / "result.json";

    YardstickCLI cli;
    cli.setHttpClient(client);
    testing::internal::CaptureStdout();
    int code = runCli(cli, {"--config", configPath_.string(), "run", specPath_.string(),
                            "--system", "alpha=http://alpha.test/predict", "--system",
                            "beta=http://beta.test/predict", "--header", "X-Run: cli-test",
                            "--out", outPath.string()});
    auto out = testing::internal::GetCapturedStdout();

    ASSERT_EQ(code, cli::kExitOk) << out;
    EXPECT_NE(out.find("Benchmark: Arithmetic QA (arithmetic) v1"), std::string::npos) << out;
    EXPECT_EQ(client->requests().size(), 6u);
    for (const auto& request : client->requests())
        EXPECT_EQ(request.headers.at("X-Run"), "cli-test");

    ASSERT_TRUE(std::filesystem::exists(outPath));
    EXPECT_FALSE(std::filesystem::exists(outPath.string() + ".tmp"));
    auto artifact = readJson(outPath);
    EXPECT_EQ(artifact["spec_id"], "arithmetic");
    EXPECT_TRUE(artifact["complete"].get<bool>());
    ASSERT_EQ(artifact["systems"].size(), 2u);
    EXPECT_EQ(artifact["systems"][0]["system_name"], "alpha");
    EXPECT_DOUBLE_EQ(artifact["systems"][0]["aggregates"]["exact_match_rate"].get<double>(),
                     2.0 / 3.0);
    EXPECT_EQ(artifact["systems"][0]["error_count"], 0);
    EXPECT_FALSE(artifact["systems"][0].contains("case_results"));
}

TEST_F(YardstickCliTest, RunVerboseResultsIncludeCases) {
    auto client = std::make_shared<FakeHttpClient>([](const http::HttpRequest&) {
        return Result<http::HttpResponse>(jsonResponse("not json"));
    });
    auto outPath = dir_ / "verbose.json";

    YardstickCLI cli;
    cli.setHttpClient(client);
    testing::internal::CaptureStdout();
    int code = runCli(cli, {"run", specPath_.string(), "--system", "only=http://only.test",
                            "--verbose-results", "--concurrency", "3", "--out",
                            outPath.string()});
    testing::internal::GetCapturedStdout();

    // Case errors never fail the run.
    ASSERT_EQ(code, cli::kExitOk);
    auto artifact = readJson(outPath);
    const auto& system = artifact["systems"][0];
    EXPECT_TRUE(system["aggregates"]["exact_match_rate"].is_null());
    EXPECT_EQ(system["error_count"], 3);
    EXPECT_EQ(system["error_counts"]["parse_error"], 3);
    ASSERT_EQ(system["case_results"].size(), 3u);
    EXPECT_EQ(system["case_results"][0]["case_id"], "q1");
    EXPECT_EQ(system["case_results"][0]["error"]["kind"], "parse_error");
}

TEST_F(YardstickCliTest, RunWritesArtifactForNonUtf8Bodies) {
    auto client = std::make_shared<FakeHttpClient>([](const http::HttpRequest&) {
        return Result<http::HttpResponse>(jsonResponse("\xff\xfe binary payload"));
    });
    auto outPath = dir_ / "binary.json";

    YardstickCLI cli;
    cli.setHttpClient(client);
    testing::internal::CaptureStdout();
    int code = runCli(cli, {"run", specPath_.string(), "--system", "only=http://only.test",
                            "--verbose-results", "--out", outPath.string()});
    testing::internal::GetCapturedStdout();

    ASSERT_EQ(code, cli::kExitOk);
    EXPECT_FALSE(std::filesystem::exists(outPath.string() + ".tmp"));
    auto artifact = readJson(outPath);
    EXPECT_EQ(artifact["systems"][0]["error_counts"]["parse_error"], 3);
    auto message =
        artifact["systems"][0]["case_results"][0]["error"]["message"].get<std::string>();
    EXPECT_NE(message.find("\xef\xbf\xbd"), std::string::npos) << message;
}

TEST_F(YardstickCliTest, InterruptedRunWritesPartialArtifact) {
    YardstickCLI cli;
    std::atomic<int> calls{0};
    // Stop once alpha's last case is in flight; beta never starts.
    auto client = std::make_shared<FakeHttpClient>([&](const http::HttpRequest& request) {
        if (++calls == 3)
            cli.requestStop();
        return echoAnswer(request);
    });
    auto outPath = dir_ / "partial.json";

    cli.setHttpClient(client);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    int code = runCli(cli, {"run", specPath_.string(), "--concurrency", "1", "--system",
                            "alpha=http://alpha.test", "--system", "beta=http://beta.test",
                            "--out", outPath.string()});
    auto out = testing::internal::GetCapturedStdout();
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::kExitInterrupted) << err;
    EXPECT_NE(err.find("[INTERRUPTED]"), std::string::npos) << err;
    EXPECT_NE(out.find("INCOMPLETE"), std::string::npos) << out;
    EXPECT_EQ(client->requests().size(), 3u);

    ASSERT_TRUE(std::filesystem::exists(outPath));
    auto artifact = readJson(outPath);
    EXPECT_FALSE(artifact["complete"].get<bool>());
    ASSERT_EQ(artifact["systems"].size(), 1u);
    EXPECT_EQ(artifact["systems"][0]["system_name"], "alpha");
    EXPECT_EQ(artifact["systems"][0]["case_count"], 3);
}

TEST_F(YardstickCliTest, RunWithoutSystemsFails) {
    auto client = std::make_shared<FakeHttpClient>(&echoAnswer);
    YardstickCLI cli;
    cli.setHttpClient(client);
    testing::internal::CaptureStderr();
    int code = runCli(cli, {"run", specPath_.string()});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::kExitFailure);
    EXPECT_NE(err.find("at least one system is required"), std::string::npos) << err;
    EXPECT_TRUE(client->requests().empty());
}

TEST_F(YardstickCliTest, RunRejectsMalformedSystem) {
    auto client = std::make_shared<FakeHttpClient>(&echoAnswer);
    YardstickCLI cli;
    cli.setHttpClient(client);
    testing::internal::CaptureStderr();
    int code = runCli(cli, {"run", specPath_.string(), "--system", "alpha=ftp://x"});
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::kExitFailure);
    EXPECT_TRUE(client->requests().empty());
}

TEST_F(YardstickCliTest, RunWithInvalidSpecFails) {
    auto bad = tests::write_file(dir_ / "bad.yaml", "id: x\n");
    auto client = std::make_shared<FakeHttpClient>(&echoAnswer);
    YardstickCLI cli;
    cli.setHttpClient(client);
    testing::internal::CaptureStderr();
    int code = runCli(cli, {"run", bad.string(), "--system", "a=http://a.test"});
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::kExitFailure);
    EXPECT_NE(err.find("Invalid benchmark spec"), std::string::npos) << err;
}
