#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <yardstick/core/types.h>
#include <yardstick/exec/contract_executor.h>
#include <yardstick/metrics/metric_engine.h>

namespace yardstick::runner {

struct CaseResult {
    std::string caseId;
    std::string systemName;
    std::optional<nlohmann::json> predicted;
    std::optional<metrics::MetricOutcomes> metrics;
    std::optional<exec::CaseError> error;
    // Reported only; never part of scoring.
    std::chrono::milliseconds latency{0};

    bool hasMetricError() const;
    bool errored() const { return error.has_value() || hasMetricError(); }
};

/**
 * Per-system summary. An aggregate with no contributing scores holds nullopt
 * (rendered as JSON null).
 */
struct SystemReport {
    std::string systemName;
    std::string primaryMetric;
    std::map<std::string, std::optional<double>> aggregates;
    std::size_t errorCount{0};
    std::map<std::string, std::size_t> errorCounts;
    // Sorted by case id.
    std::vector<CaseResult> caseResults;

    std::size_t caseCount() const noexcept { return caseResults.size(); }
};

struct BenchmarkResult {
    std::string specId;
    std::string specName;
    std::string specVersion;
    std::string datasetPath;
    TimePoint generatedAt;
    bool complete{true};
    // Declaration order of the systems.
    std::vector<SystemReport> systems;
};

} // namespace yardstick::runner
