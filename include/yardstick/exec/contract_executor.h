#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <yardstick/dataset/dataset.h>
#include <yardstick/http/http_client.h>
#include <yardstick/spec/benchmark_spec.h>
#include <yardstick/systems/system_config.h>

namespace yardstick::exec {

enum class CaseErrorKind { NetworkError, HttpError, ParseError, ExtractionError };

const char* toString(CaseErrorKind kind);

struct CaseError {
    CaseErrorKind kind{CaseErrorKind::NetworkError};
    std::string message;
    std::optional<long> httpStatus;
};

/**
 * Exactly one of `predicted` and `error` is set.
 */
struct ExecutionOutcome {
    std::optional<nlohmann::json> predicted;
    std::optional<CaseError> error;
    std::chrono::milliseconds latency{0};

    bool ok() const noexcept { return predicted.has_value(); }
};

/**
 * Runs one (system, case) exchange under the spec's contract. Every failure is
 * captured in the outcome; execute() does not throw for transport or payload
 * problems. A single attempt is made per call.
 */
class ContractExecutor {
public:
    ContractExecutor(const spec::Contract& contract, http::IHttpClient& client);

    ExecutionOutcome execute(const systems::SystemConfig& system,
                             const dataset::Case& testCase) const;

    // Request assembled for a case, or an extraction error if the body path fails.
    Result<http::HttpRequest> buildRequest(const systems::SystemConfig& system,
                                           const dataset::Case& testCase) const;

private:
    const spec::Contract& contract_;
    http::IHttpClient& client_;
};

} // namespace yardstick::exec
