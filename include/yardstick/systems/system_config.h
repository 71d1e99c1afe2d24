#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yardstick/core/types.h>
#include <yardstick/http/http_client.h>

namespace yardstick::systems {

struct SystemConfig {
    std::string name;
    std::string endpoint;
    http::HeaderMap headers;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * Parses "name=endpoint". The name may not be empty or contain '='; the
 * endpoint must start with http:// or https://.
 */
Result<SystemConfig> parseSystemArg(std::string_view arg);

/**
 * Parses "Name: value" into a header pair.
 */
Result<std::pair<std::string, std::string>> parseHeaderArg(std::string_view arg);

/**
 * Loads systems from a YAML file:
 * \code{.yaml}
 * systems:
 *   - name: baseline
 *     endpoint: http://localhost:8080/predict
 *     headers: {Authorization: "Bearer x"}
 *     timeout_ms: 5000
 * \endcode
 */
Result<std::vector<SystemConfig>> loadSystemsFile(const std::filesystem::path& file);

// Rejects an empty list and duplicate names.
Result<void> validateSystems(const std::vector<SystemConfig>& systems);

} // namespace yardstick::systems
