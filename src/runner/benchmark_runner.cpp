#include <yardstick/aggregate/aggregator.h>
#include <yardstick/exec/contract_executor.h>
#include <yardstick/metrics/metric_engine.h>
#include <yardstick/runner/benchmark_runner.h>
#include <yardstick/runner/thread_pool.h>
#include <yardstick/spec/spec_loader.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <utility>

namespace yardstick::runner {

namespace {

CaseResult executeCase(const exec::ContractExecutor& executor,
                       const metrics::MetricEngine& engine, const systems::SystemConfig& system,
                       const dataset::Case& testCase) {
    CaseResult result;
    result.caseId = testCase.id;
    result.systemName = system.name;

    auto outcome = executor.execute(system, testCase);
    result.latency = outcome.latency;
    if (!outcome.ok()) {
        spdlog::warn("[{}] case '{}' failed ({}): {}", system.name, testCase.id,
                     exec::toString(outcome.error->kind), outcome.error->message);
        result.error = std::move(outcome.error);
        return result;
    }

    result.metrics = engine.score(*outcome.predicted, testCase.reference);
    result.predicted = std::move(outcome.predicted);
    if (result.hasMetricError()) {
        spdlog::warn("[{}] case '{}' has metric errors", system.name, testCase.id);
    }
    return result;
}

} // namespace

const char* toString(RunState state) {
    switch (state) {
        case RunState::Idle:
            return "idle";
        case RunState::Loading:
            return "loading";
        case RunState::Executing:
            return "executing";
        case RunState::Aggregating:
            return "aggregating";
        case RunState::Complete:
            return "complete";
        case RunState::Failed:
            return "failed";
    }
    return "unknown";
}

BenchmarkRunner::BenchmarkRunner(http::IHttpClient& client,
                                 const metrics::MetricRegistry& registry, RunnerConfig config)
    : client_(client), registry_(registry), config_(std::move(config)) {}

TimePoint BenchmarkRunner::now() const {
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

void BenchmarkRunner::transition(RunState next) {
    auto previous = state_.exchange(next);
    spdlog::debug("Run state {} -> {}", toString(previous), toString(next));
}

BenchmarkResult BenchmarkRunner::run(const spec::BenchmarkSpec& spec,
                                     const std::vector<dataset::Case>& cases,
                                     const std::vector<systems::SystemConfig>& systems) {
    if (auto valid = systems::validateSystems(systems); !valid) {
        throw std::invalid_argument(valid.error().message);
    }

    transition(RunState::Executing);
    const auto stopToken = config_.stopToken;
    exec::ContractExecutor executor(spec.contract, client_);
    metrics::MetricEngine engine(registry_, spec.metrics);

    spdlog::info("Running '{}' v{}: {} cases x {} systems (concurrency {})", spec.id,
                 spec.version, cases.size(), systems.size(), config_.concurrency);

    // One future per (system, case); an empty optional means the case was skipped.
    std::vector<std::vector<std::future<std::optional<CaseResult>>>> pending(systems.size());
    {
        ThreadPool pool(config_.concurrency);
        for (std::size_t s = 0; s < systems.size(); ++s) {
            pending[s].reserve(cases.size());
            for (const auto& testCase : cases) {
                const auto& system = systems[s];
                pending[s].push_back(pool.enqueue(
                    [&executor, &engine, &system, &testCase,
                     stopToken]() -> std::optional<CaseResult> {
                        if (stopToken.stop_requested())
                            return std::nullopt;
                        return executeCase(executor, engine, system, testCase);
                    }));
            }
        }
        // Pool destructor drains the queue; cancelled tasks return immediately.
    }

    BenchmarkResult result;
    result.specId = spec.id;
    result.specName = spec.name;
    result.specVersion = spec.version;
    result.datasetPath = spec.datasetPath;

    std::vector<std::pair<std::size_t, std::vector<CaseResult>>> finished;
    for (std::size_t s = 0; s < systems.size(); ++s) {
        std::vector<CaseResult> caseResults;
        caseResults.reserve(cases.size());
        bool allExecuted = true;
        for (auto& future : pending[s]) {
            auto caseResult = future.get();
            if (!caseResult) {
                allExecuted = false;
                continue;
            }
            caseResults.push_back(std::move(*caseResult));
        }
        if (!allExecuted) {
            spdlog::warn("[{}] run cancelled; {} of {} cases executed, system omitted",
                         systems[s].name, caseResults.size(), cases.size());
            result.complete = false;
            continue;
        }
        finished.emplace_back(s, std::move(caseResults));
    }

    transition(RunState::Aggregating);
    aggregate::Aggregator aggregator(spec.aggregates);
    for (auto& [index, caseResults] : finished) {
        auto report = aggregator.aggregate(systems[index].name, spec.primaryMetric,
                                           std::move(caseResults));
        spdlog::info("[{}] {} cases, {} errors", report.systemName, report.caseCount(),
                     report.errorCount);
        result.systems.push_back(std::move(report));
    }

    result.generatedAt = now();
    transition(RunState::Complete);
    return result;
}

RunOutcome BenchmarkRunner::runFromFile(const std::filesystem::path& specPath,
                                        const std::vector<systems::SystemConfig>& systems) {
    RunOutcome outcome;
    transition(RunState::Loading);

    auto fail = [&](std::string message) {
        spdlog::debug("Run failed while loading: {}", message);
        transition(RunState::Failed);
        outcome.state = RunState::Failed;
        outcome.error = std::move(message);
        return outcome;
    };

    if (auto valid = systems::validateSystems(systems); !valid) {
        return fail(valid.error().message);
    }

    spec::BenchmarkSpec spec;
    try {
        spec = spec::SpecLoader(registry_).load(specPath);
    } catch (const spec::SpecValidationError& e) {
        return fail(e.what());
    }

    std::vector<dataset::Case> cases;
    try {
        cases = dataset::DatasetLoader::load(spec.resolvedDatasetPath());
    } catch (const dataset::DatasetError& e) {
        return fail(std::string("Dataset error: ") + e.what());
    }

    outcome.result = run(spec, cases, systems);
    outcome.state = state();
    return outcome;
}

} // namespace yardstick::runner
