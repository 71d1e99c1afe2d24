#pragma once

#include <optional>
#include <string>
#include <vector>

#include <yardstick/runner/results.h>
#include <yardstick/spec/benchmark_spec.h>

namespace yardstick::aggregate {

inline constexpr const char* kMetricErrorKind = "metric_error";

/**
 * Reduces one system's case results into a SystemReport. Results may arrive in
 * any order; the report is identical for every permutation of the input.
 */
class Aggregator {
public:
    explicit Aggregator(std::vector<spec::AggregateDefinition> definitions);

    runner::SystemReport aggregate(std::string systemName, std::string primaryMetric,
                                   std::vector<runner::CaseResult> results) const;

    // nullopt for empty input. Sorts `scores` before reducing.
    static std::optional<double> reduce(spec::ReductionKind kind, std::vector<double> scores);

private:
    std::vector<spec::AggregateDefinition> definitions_;
};

} // namespace yardstick::aggregate
