#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <yardstick/core/types.h>
#include <yardstick/dataset/dataset.h>
#include <yardstick/http/http_client.h>
#include <yardstick/metrics/metric_registry.h>
#include <yardstick/runner/results.h>
#include <yardstick/spec/benchmark_spec.h>
#include <yardstick/systems/system_config.h>

namespace yardstick::runner {

/**
 * Loading -> Executing -> Aggregating -> Complete. Failed is reachable from
 * Loading only; case and metric errors never fail a run.
 */
enum class RunState { Idle, Loading, Executing, Aggregating, Complete, Failed };

const char* toString(RunState state);

struct RunnerConfig {
    std::size_t concurrency{1};
    // Source of BenchmarkResult::generatedAt.
    std::function<TimePoint()> clock;
    // Stops scheduling of further cases. Cases already in flight finish.
    std::stop_token stopToken;
};

struct RunOutcome {
    RunState state{RunState::Idle};
    std::optional<BenchmarkResult> result;
    // Set when state == Failed.
    std::string error;

    bool ok() const noexcept { return state == RunState::Complete; }
};

/**
 * Drives the systems x cases matrix. Every (system, case) pair becomes one task
 * on a bounded pool; each system is aggregated only once all of its cases have
 * produced a result.
 *
 * A cancelled run returns the reports of systems whose cases all executed and
 * sets BenchmarkResult::complete to false.
 */
class BenchmarkRunner {
public:
    BenchmarkRunner(http::IHttpClient& client, const metrics::MetricRegistry& registry,
                    RunnerConfig config = {});

    BenchmarkRunner(const BenchmarkRunner&) = delete;
    BenchmarkRunner& operator=(const BenchmarkRunner&) = delete;

    /**
     * Execute with already-loaded inputs.
     * @throws std::invalid_argument if `systems` is empty or has duplicate names
     */
    BenchmarkResult run(const spec::BenchmarkSpec& spec, const std::vector<dataset::Case>& cases,
                        const std::vector<systems::SystemConfig>& systems);

    /**
     * Load the spec and its dataset, then run. Loading problems are returned
     * as a Failed outcome rather than thrown.
     */
    RunOutcome runFromFile(const std::filesystem::path& specPath,
                           const std::vector<systems::SystemConfig>& systems);

    RunState state() const noexcept { return state_.load(); }

private:
    TimePoint now() const;
    void transition(RunState next);

    http::IHttpClient& client_;
    const metrics::MetricRegistry& registry_;
    RunnerConfig config_;
    std::atomic<RunState> state_{RunState::Idle};
};

} // namespace yardstick::runner
