#include <yardstick/metrics/metric_engine.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace yardstick::metrics {

MetricEngine::MetricEngine(const MetricRegistry& registry,
                           std::vector<spec::MetricDefinition> definitions)
    : registry_(registry), definitions_(std::move(definitions)) {}

MetricOutcomes MetricEngine::score(const nlohmann::json& predicted,
                                   const nlohmann::json& reference) const {
    MetricOutcomes outcomes;
    for (const auto& def : definitions_) {
        const auto& descriptor = registry_.get(def.kind);
        auto result = descriptor.score(predicted, reference, def.args);
        if (!result) {
            spdlog::debug("metric '{}' failed: {}", def.name, result.error().message);
            outcomes.emplace(def.name, MetricOutcome::failed(result.error().message));
            continue;
        }
        double value = result.value();
        if (value < 0.0)
            value = 0.0;
        else if (value > 1.0)
            value = 1.0;
        outcomes.emplace(def.name, MetricOutcome::scored(value));
    }
    return outcomes;
}

} // namespace yardstick::metrics
