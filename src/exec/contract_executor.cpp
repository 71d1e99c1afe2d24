#include <yardstick/exec/contract_executor.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace yardstick::exec {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxBodyPreview = 200;

// Cut never lands inside a UTF-8 sequence.
std::string preview(const std::string& body) {
    if (body.size() <= kMaxBodyPreview)
        return body;
    std::size_t cut = kMaxBodyPreview;
    while (cut > 0 && (static_cast<unsigned char>(body[cut]) & 0xC0) == 0x80)
        --cut;
    return body.substr(0, cut) + "...";
}

ExecutionOutcome failure(CaseErrorKind kind, std::string message, Clock::time_point start,
                         std::optional<long> status = std::nullopt) {
    ExecutionOutcome outcome;
    outcome.error = CaseError{kind, std::move(message), status};
    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return outcome;
}

} // namespace

const char* toString(CaseErrorKind kind) {
    switch (kind) {
        case CaseErrorKind::NetworkError:
            return "network_error";
        case CaseErrorKind::HttpError:
            return "http_error";
        case CaseErrorKind::ParseError:
            return "parse_error";
        case CaseErrorKind::ExtractionError:
            return "extraction_error";
    }
    return "unknown";
}

ContractExecutor::ContractExecutor(const spec::Contract& contract, http::IHttpClient& client)
    : contract_(contract), client_(client) {}

Result<http::HttpRequest>
ContractExecutor::buildRequest(const systems::SystemConfig& system,
                               const dataset::Case& testCase) const {
    auto body = contract_.bodyPath.evaluate(testCase.input);
    if (!body) {
        return Error{ErrorCode::ExtractionError,
                     "Failed to extract request body at '" + contract_.bodyPath.expression() +
                         "': " + body.error().message};
    }

    http::HttpRequest request;
    request.method = contract_.method;
    request.url = system.endpoint;
    request.headers = contract_.headers;
    for (const auto& [name, value] : system.headers)
        request.headers[name] = value;
    request.headers.emplace("Content-Type", "application/json");
    request.body = body.value()->dump();
    request.timeout = system.timeout.value_or(contract_.timeout);
    return request;
}

ExecutionOutcome ContractExecutor::execute(const systems::SystemConfig& system,
                                           const dataset::Case& testCase) const {
    const auto start = Clock::now();

    auto request = buildRequest(system, testCase);
    if (!request) {
        return failure(CaseErrorKind::ExtractionError, request.error().message, start);
    }

    auto response = client_.send(request.value());
    if (!response) {
        const auto& err = response.error();
        std::string message = err.code == ErrorCode::Timeout
                                  ? "Request to " + system.endpoint + " timed out after " +
                                        std::to_string(request.value().timeout.count()) + "ms"
                                  : "Request to " + system.endpoint + " failed: " + err.message;
        return failure(CaseErrorKind::NetworkError, std::move(message), start);
    }

    const auto& reply = response.value();
    if (!reply.success()) {
        return failure(CaseErrorKind::HttpError,
                       "Request to " + system.endpoint + " returned status " +
                           std::to_string(reply.status),
                       start, reply.status);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(reply.body);
    } catch (const nlohmann::json::parse_error& e) {
        return failure(CaseErrorKind::ParseError,
                       "Response from " + system.endpoint + " is not valid JSON: " + e.what() +
                           " (body: " + preview(reply.body) + ")",
                       start);
    }

    auto extracted = contract_.outputPath.evaluate(document);
    if (!extracted) {
        return failure(CaseErrorKind::ExtractionError,
                       "Failed to extract output at '" + contract_.outputPath.expression() +
                           "': " + extracted.error().message,
                       start);
    }

    ExecutionOutcome outcome;
    outcome.predicted = *extracted.value();
    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    spdlog::debug("[{}] case '{}' completed in {}ms", system.name, testCase.id,
                  outcome.latency.count());
    return outcome;
}

} // namespace yardstick::exec
