#include <yardstick/aggregate/aggregator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace yardstick::aggregate {

Aggregator::Aggregator(std::vector<spec::AggregateDefinition> definitions)
    : definitions_(std::move(definitions)) {}

std::optional<double> Aggregator::reduce(spec::ReductionKind kind, std::vector<double> scores) {
    if (scores.empty())
        return std::nullopt;

    std::sort(scores.begin(), scores.end());
    switch (kind) {
        case spec::ReductionKind::Min:
            return scores.front();
        case spec::ReductionKind::Max:
            return scores.back();
        case spec::ReductionKind::Mean: {
            double sum = 0.0;
            for (double s : scores)
                sum += s;
            return sum / static_cast<double>(scores.size());
        }
    }
    return std::nullopt;
}

runner::SystemReport Aggregator::aggregate(std::string systemName, std::string primaryMetric,
                                           std::vector<runner::CaseResult> results) const {
    std::sort(results.begin(), results.end(),
              [](const runner::CaseResult& a, const runner::CaseResult& b) {
                  return a.caseId < b.caseId;
              });

    runner::SystemReport report;
    report.systemName = std::move(systemName);
    report.primaryMetric = std::move(primaryMetric);

    for (const auto& result : results) {
        if (result.error) {
            ++report.errorCounts[exec::toString(result.error->kind)];
        } else if (result.hasMetricError()) {
            ++report.errorCounts[kMetricErrorKind];
        }
        if (result.errored())
            ++report.errorCount;
    }

    for (const auto& def : definitions_) {
        std::vector<double> scores;
        scores.reserve(results.size());
        for (const auto& result : results) {
            if (result.error || !result.metrics)
                continue;
            auto it = result.metrics->find(def.metric);
            if (it == result.metrics->end() || !it->second.ok())
                continue;
            scores.push_back(*it->second.score);
        }
        auto value = reduce(def.reduction, std::move(scores));
        if (!value) {
            spdlog::debug("[{}] aggregate '{}' has no scored cases", report.systemName, def.name);
        }
        report.aggregates[def.name] = value;
    }

    report.caseResults = std::move(results);
    return report;
}

} // namespace yardstick::aggregate
