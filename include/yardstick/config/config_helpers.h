#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <yardstick/core/types.h>

namespace yardstick::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Parse a value from TOML config file. Empty when the file, section or key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the config file location
/// Override > $YARDSTICK_CONFIG > $XDG_CONFIG_HOME/yardstick/config.toml
/// > ~/.config/yardstick/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

Result<std::size_t> parse_positive_int(std::string_view text, std::string_view what);
Result<bool> parse_bool(std::string_view text, std::string_view what);

// trace|debug|info|warn|error|critical|off (case-insensitive); "warning" is accepted as warn.
Result<std::string> normalize_log_level(std::string_view text);

struct RunnerSettings {
    std::size_t concurrency{1};
    // Default request timeout for systems that do not set their own.
    std::optional<std::chrono::milliseconds> timeout;
    bool verboseResults{false};
    std::string logLevel{"warn"};
};

// Values given on the command line; unset fields fall through to env and file.
struct RunnerOverrides {
    std::optional<std::size_t> concurrency;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<bool> verboseResults;
    std::optional<std::string> logLevel;
};

/**
 * Resolve runner settings with precedence CLI > environment > config file > default.
 * Environment: YARDSTICK_CONCURRENCY, YARDSTICK_TIMEOUT_MS, YARDSTICK_LOG_LEVEL.
 * File keys: [runner] concurrency, timeout_ms, verbose_results; [log] level.
 */
Result<RunnerSettings> resolve_runner_settings(const std::filesystem::path& config_path,
                                               const RunnerOverrides& overrides);

} // namespace yardstick::config
