#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <yardstick/cli/command.h>
#include <yardstick/cli/yardstick_cli.h>
#include <yardstick/metrics/metric_registry.h>
#include <yardstick/report/result_writer.h>
#include <yardstick/runner/benchmark_runner.h>
#include <yardstick/systems/system_config.h>

namespace yardstick::cli {

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Run a benchmark spec against one or more HTTP systems";
    }

    void registerCommand(CLI::App& app, YardstickCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("run", getDescription());
        cmd->add_option("spec", specPath_, "Benchmark spec file (YAML or JSON)")->required();
        cmd->add_option("--system", systemArgs_, "System under test as name=endpoint (repeatable)");
        cmd->add_option("--systems-file", systemsFile_, "YAML file listing systems");
        cmd->add_option("--header", headerArgs_,
                        "Extra request header 'Name: value' for every system (repeatable)");
        timeoutOpt_ = cmd->add_option("--timeout-ms", timeoutMs_,
                                      "Request timeout for systems without their own")
                          ->check(CLI::PositiveNumber);
        concurrencyOpt_ = cmd->add_option("--concurrency", concurrency_,
                                          "Number of cases executed in parallel")
                              ->check(CLI::PositiveNumber);
        verboseResultsOpt_ = cmd->add_flag("--verbose-results", verboseResults_,
                                           "Include per-case results in the output file");
        cmd->add_option("--out", outPath_, "Write the JSON result artifact to this path");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        config::RunnerOverrides overrides;
        if (concurrencyOpt_->count() > 0)
            overrides.concurrency = concurrency_;
        if (timeoutOpt_->count() > 0)
            overrides.timeout = std::chrono::milliseconds(timeoutMs_);
        if (verboseResultsOpt_->count() > 0)
            overrides.verboseResults = verboseResults_;

        auto settings = cli_->resolveSettings(overrides);
        if (!settings)
            return settings.error();

        auto systemList = collectSystems(settings.value());
        if (!systemList)
            return systemList.error();

        runner::RunnerConfig config;
        config.concurrency = settings.value().concurrency;
        config.stopToken = cli_->getStopToken();

        runner::BenchmarkRunner runner(cli_->getHttpClient(), metrics::MetricRegistry::builtin(),
                                       std::move(config));
        auto outcome = runner.runFromFile(specPath_, systemList.value());
        if (!outcome.ok() || !outcome.result) {
            return Error{ErrorCode::InvalidData, outcome.error};
        }

        const auto& result = *outcome.result;
        report::printSummary(std::cout, result);

        if (!outPath_.empty()) {
            report::WriteOptions options;
            options.includeCaseResults = settings.value().verboseResults;
            auto written = report::writeResult(result, outPath_, options);
            if (!written)
                return written.error();
            std::cout << "\nResults written to: " << outPath_.string() << "\n";
        }

        if (!result.complete) {
            return Error{ErrorCode::OperationCancelled,
                         "Run interrupted; " + std::to_string(result.systems.size()) +
                             " system(s) fully evaluated"};
        }
        return {};
    }

private:
    Result<std::vector<systems::SystemConfig>>
    collectSystems(const config::RunnerSettings& settings) const {
        std::vector<systems::SystemConfig> list;
        if (!systemsFile_.empty()) {
            auto loaded = systems::loadSystemsFile(systemsFile_);
            if (!loaded)
                return loaded.error();
            list = std::move(loaded).value();
        }
        for (const auto& arg : systemArgs_) {
            auto parsed = systems::parseSystemArg(arg);
            if (!parsed)
                return parsed.error();
            list.push_back(std::move(parsed).value());
        }

        http::HeaderMap extraHeaders;
        for (const auto& arg : headerArgs_) {
            auto header = systems::parseHeaderArg(arg);
            if (!header)
                return header.error();
            extraHeaders[header.value().first] = header.value().second;
        }

        for (auto& system : list) {
            // Headers from the systems file win over --header
            for (const auto& [name, value] : extraHeaders)
                system.headers.emplace(name, value);
            if (!system.timeout && settings.timeout)
                system.timeout = settings.timeout;
        }

        if (auto valid = systems::validateSystems(list); !valid)
            return valid.error();
        return list;
    }

    YardstickCLI* cli_{nullptr};
    std::filesystem::path specPath_;
    std::vector<std::string> systemArgs_;
    std::filesystem::path systemsFile_;
    std::vector<std::string> headerArgs_;
    std::size_t timeoutMs_{0};
    std::size_t concurrency_{1};
    bool verboseResults_{false};
    std::filesystem::path outPath_;

    CLI::Option* timeoutOpt_{nullptr};
    CLI::Option* concurrencyOpt_{nullptr};
    CLI::Option* verboseResultsOpt_{nullptr};
};

std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace yardstick::cli
