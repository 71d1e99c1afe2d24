#include <charconv>
#include <cstdlib>
#include <fstream>
#include <yardstick/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace yardstick::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "runner.concurrency" and "[runner] concurrency"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("YARDSTICK_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "yardstick" / "config.toml";
}

Result<std::size_t> parse_positive_int(std::string_view text, std::string_view what) {
    std::string s(text);
    trim(s);
    std::size_t value = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size() || value == 0) {
        return Error{ErrorCode::ConfigError,
                     std::string(what) + ": expected a positive integer, got '" + s + "'"};
    }
    return value;
}

Result<bool> parse_bool(std::string_view text, std::string_view what) {
    std::string s(text);
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return Error{ErrorCode::ConfigError,
                 std::string(what) + ": expected a boolean, got '" + std::string(text) + "'"};
}

Result<std::string> normalize_log_level(std::string_view text) {
    std::string s(text);
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "warning")
        s = "warn";
    if (s == "trace" || s == "debug" || s == "info" || s == "warn" || s == "error" ||
        s == "critical" || s == "off") {
        return s;
    }
    return Error{ErrorCode::ConfigError, "unknown log level '" + std::string(text) + "'"};
}

Result<RunnerSettings> resolve_runner_settings(const std::filesystem::path& config_path,
                                               const RunnerOverrides& overrides) {
    RunnerSettings settings;

    auto layer = [&](const std::optional<std::string>& fromEnv, const std::string& section,
                     const std::string& key) -> std::optional<std::string> {
        if (fromEnv && !fromEnv->empty())
            return fromEnv;
        if (config_path.empty())
            return std::nullopt;
        auto value = parse_config_value(config_path, section, key);
        if (value.empty())
            return std::nullopt;
        return value;
    };
    auto env = [](const char* name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name); v && *v)
            return std::string(v);
        return std::nullopt;
    };

    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        spdlog::debug("Reading configuration from {}", config_path.string());
    }

    if (overrides.concurrency) {
        settings.concurrency = *overrides.concurrency;
    } else if (auto raw = layer(env("YARDSTICK_CONCURRENCY"), "runner", "concurrency")) {
        auto parsed = parse_positive_int(*raw, "concurrency");
        if (!parsed)
            return parsed.error();
        settings.concurrency = parsed.value();
    }

    if (overrides.timeout) {
        settings.timeout = overrides.timeout;
    } else if (auto raw = layer(env("YARDSTICK_TIMEOUT_MS"), "runner", "timeout_ms")) {
        auto parsed = parse_positive_int(*raw, "timeout_ms");
        if (!parsed)
            return parsed.error();
        settings.timeout = std::chrono::milliseconds(parsed.value());
    }

    if (overrides.verboseResults) {
        settings.verboseResults = *overrides.verboseResults;
    } else if (auto raw = layer(std::nullopt, "runner", "verbose_results")) {
        auto parsed = parse_bool(*raw, "verbose_results");
        if (!parsed)
            return parsed.error();
        settings.verboseResults = parsed.value();
    }

    std::optional<std::string> level = overrides.logLevel;
    if (!level)
        level = layer(env("YARDSTICK_LOG_LEVEL"), "log", "level");
    if (level) {
        auto parsed = normalize_log_level(*level);
        if (!parsed)
            return parsed.error();
        settings.logLevel = parsed.value();
    }

    return settings;
}

} // namespace yardstick::config
