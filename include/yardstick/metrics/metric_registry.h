#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <yardstick/core/types.h>
#include <yardstick/spec/benchmark_spec.h>

namespace yardstick::metrics {

// Appends "<field>: <message>" entries to `violations` and fills `out` on success.
using ArgsValidator = void (*)(const nlohmann::json& args, const std::string& field,
                               std::vector<std::string>& violations, spec::ComparisonArgs& out);

// Score in [0, 1]; an error means the metric could not be computed for this case.
using ScoreFunction = Result<double> (*)(const nlohmann::json& predicted,
                                         const nlohmann::json& reference,
                                         const spec::ComparisonArgs& args);

struct MetricDescriptor {
    std::string_view type;
    spec::MetricKind kind;
    std::string_view description;
    ArgsValidator validateArgs;
    ScoreFunction score;
};

/**
 * Closed table of metric kinds. Built once on first use and never mutated, so
 * it is shared by reference across worker threads without locking.
 */
class MetricRegistry {
public:
    static const MetricRegistry& builtin();

    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    const MetricDescriptor* find(std::string_view type) const noexcept;
    const MetricDescriptor& get(spec::MetricKind kind) const;

    std::vector<std::string_view> types() const;

private:
    explicit MetricRegistry(std::vector<MetricDescriptor> entries);

    std::vector<MetricDescriptor> entries_;
};

// Text form used for comparison: strings verbatim, everything else compact JSON.
std::string renderText(const nlohmann::json& value);

std::string normalizeText(std::string text, const spec::NormalizeOptions& options);

} // namespace yardstick::metrics
