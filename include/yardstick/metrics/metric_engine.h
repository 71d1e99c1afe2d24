#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <yardstick/metrics/metric_registry.h>
#include <yardstick/spec/benchmark_spec.h>

namespace yardstick::metrics {

/**
 * Result of one metric on one case: a score in [0, 1] or a metric_error message.
 */
struct MetricOutcome {
    std::optional<double> score;
    std::optional<std::string> error;

    bool ok() const noexcept { return score.has_value(); }

    static MetricOutcome scored(double value) { return MetricOutcome{value, std::nullopt}; }
    static MetricOutcome failed(std::string message) {
        return MetricOutcome{std::nullopt, std::move(message)};
    }
};

using MetricOutcomes = std::map<std::string, MetricOutcome>;

class MetricEngine {
public:
    MetricEngine(const MetricRegistry& registry, std::vector<spec::MetricDefinition> definitions);

    // Runs every configured metric. Never throws for per-case failures.
    MetricOutcomes score(const nlohmann::json& predicted, const nlohmann::json& reference) const;

    const std::vector<spec::MetricDefinition>& definitions() const noexcept {
        return definitions_;
    }

private:
    const MetricRegistry& registry_;
    std::vector<spec::MetricDefinition> definitions_;
};

} // namespace yardstick::metrics
