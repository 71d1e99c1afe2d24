#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>
#include <yardstick/core/types.h>
#include <yardstick/runner/results.h>

namespace yardstick::report {

struct WriteOptions {
    // Adds case_results[] to every system entry.
    bool includeCaseResults{false};
    int indent{2};
};

// UTC, second precision: 2024-05-01T12:00:00Z
std::string formatTimestamp(TimePoint tp);

nlohmann::json toJson(const runner::CaseResult& result);
nlohmann::json toJson(const runner::SystemReport& report, bool includeCaseResults);
nlohmann::json toJson(const runner::BenchmarkResult& result, bool includeCaseResults);

/**
 * Writes the result artifact. The file is written to a sibling temporary and
 * renamed into place, so readers never observe a partial document.
 */
Result<void> writeResult(const runner::BenchmarkResult& result,
                         const std::filesystem::path& file, const WriteOptions& options = {});

// Human-readable table of aggregates and error counts per system.
void printSummary(std::ostream& out, const runner::BenchmarkResult& result);

} // namespace yardstick::report
