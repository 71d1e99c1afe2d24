#include <yardstick/report/result_writer.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace yardstick::report {

using nlohmann::json;

namespace {

json optionalNumber(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

std::string formatAggregate(const std::optional<double>& value) {
    return value ? fmt::format("{:.4f}", *value) : std::string("undefined");
}

} // namespace

std::string formatTimestamp(TimePoint tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

json toJson(const runner::CaseResult& result) {
    json j;
    j["case_id"] = result.caseId;
    j["predicted"] = result.predicted ? *result.predicted : json(nullptr);

    if (result.metrics) {
        json metrics = json::object();
        for (const auto& [name, outcome] : *result.metrics) {
            if (outcome.ok()) {
                metrics[name] = {{"score", *outcome.score}};
            } else {
                metrics[name] = {{"error", *outcome.error}};
            }
        }
        j["metrics"] = std::move(metrics);
    } else {
        j["metrics"] = nullptr;
    }

    if (result.error) {
        json error = {{"kind", exec::toString(result.error->kind)},
                      {"message", result.error->message}};
        error["http_status"] =
            result.error->httpStatus ? json(*result.error->httpStatus) : json(nullptr);
        j["error"] = std::move(error);
    } else {
        j["error"] = nullptr;
    }

    j["latency_ms"] = result.latency.count();
    return j;
}

json toJson(const runner::SystemReport& report, bool includeCaseResults) {
    json j;
    j["system_name"] = report.systemName;
    j["primary_metric"] = report.primaryMetric;

    json aggregates = json::object();
    for (const auto& [name, value] : report.aggregates)
        aggregates[name] = optionalNumber(value);
    j["aggregates"] = std::move(aggregates);

    j["error_count"] = report.errorCount;
    json counts = json::object();
    for (const auto& [kind, count] : report.errorCounts)
        counts[kind] = count;
    j["error_counts"] = std::move(counts);
    j["case_count"] = report.caseCount();

    if (includeCaseResults) {
        json cases = json::array();
        for (const auto& caseResult : report.caseResults)
            cases.push_back(toJson(caseResult));
        j["case_results"] = std::move(cases);
    }
    return j;
}

json toJson(const runner::BenchmarkResult& result, bool includeCaseResults) {
    json j;
    j["spec_id"] = result.specId;
    j["spec_name"] = result.specName;
    j["spec_version"] = result.specVersion;
    j["dataset_path"] = result.datasetPath;
    j["generated_at"] = formatTimestamp(result.generatedAt);
    j["complete"] = result.complete;

    json systems = json::array();
    for (const auto& report : result.systems)
        systems.push_back(toJson(report, includeCaseResults));
    j["systems"] = std::move(systems);
    return j;
}

Result<void> writeResult(const runner::BenchmarkResult& result,
                         const std::filesystem::path& file, const WriteOptions& options) {
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::InvalidArgument,
                         "Cannot create directory " + file.parent_path().string() + ": " +
                             ec.message()};
        }
    }

    // Response bodies quoted in error messages need not be valid UTF-8.
    std::string text;
    try {
        text = toJson(result, options.includeCaseResults)
                   .dump(options.indent, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InternalError,
                     std::string("Cannot serialize result: ") + e.what()};
    }

    auto tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::InvalidArgument, "Cannot open " + tmp.string()};
        }
        out << text << '\n';
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            return Error{ErrorCode::InternalError, "Failed writing " + tmp.string()};
        }
    }

    std::filesystem::rename(tmp, file, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Error{ErrorCode::InternalError, "Cannot move result into " + file.string()};
    }
    spdlog::info("Wrote results to {}", file.string());
    return {};
}

void printSummary(std::ostream& out, const runner::BenchmarkResult& result) {
    out << fmt::format("Benchmark: {} ({}) v{}\n", result.specName, result.specId,
                       result.specVersion);
    out << fmt::format("Dataset:   {}\n", result.datasetPath);
    if (!result.complete)
        out << "Status:    INCOMPLETE (run cancelled)\n";

    for (const auto& report : result.systems) {
        out << fmt::format("\n{}  ({} cases, {} errors)\n", report.systemName,
                           report.caseCount(), report.errorCount);
        for (const auto& [name, value] : report.aggregates) {
            out << fmt::format("  {:<28} {}\n", name, formatAggregate(value));
        }
        for (const auto& [kind, count] : report.errorCounts) {
            out << fmt::format("  {:<28} {}\n", kind, count);
        }
    }
}

} // namespace yardstick::report
