#include <yardstick/spec/spec_loader.h>
#include <yardstick/systems/system_config.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>

namespace yardstick::systems {

namespace {

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

bool hasHttpScheme(std::string_view url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

Result<SystemConfig> makeSystem(std::string name, std::string endpoint) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "system name must not be empty"};
    }
    if (endpoint.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "system '" + name + "': endpoint must not be empty"};
    }
    if (!hasHttpScheme(endpoint)) {
        return Error{ErrorCode::InvalidArgument, "system '" + name + "': endpoint '" + endpoint +
                                                     "' must start with http:// or https://"};
    }
    SystemConfig config;
    config.name = std::move(name);
    config.endpoint = std::move(endpoint);
    return config;
}

std::string stringField(const nlohmann::json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string())
        return {};
    return trim(it->get<std::string>());
}

} // namespace

Result<SystemConfig> parseSystemArg(std::string_view arg) {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid system '" + std::string(arg) + "' (expected name=endpoint)"};
    }
    return makeSystem(trim(arg.substr(0, eq)), trim(arg.substr(eq + 1)));
}

Result<std::pair<std::string, std::string>> parseHeaderArg(std::string_view arg) {
    auto colon = arg.find(':');
    if (colon == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid header '" + std::string(arg) + "' (expected 'Name: value')"};
    }
    auto name = trim(arg.substr(0, colon));
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid header '" + std::string(arg) + "' (empty name)"};
    }
    return std::make_pair(std::move(name), trim(arg.substr(colon + 1)));
}

Result<std::vector<SystemConfig>> loadSystemsFile(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "unable to open systems file: " + file.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json doc;
    try {
        doc = spec::yamlToJson(buffer.str());
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParseError,
                     "failed to parse systems file " + file.string() + ": " + e.what()};
    }

    const nlohmann::json* list = &doc;
    if (doc.is_object()) {
        auto it = doc.find("systems");
        if (it == doc.end()) {
            return Error{ErrorCode::InvalidData, file.string() + ": missing 'systems' list"};
        }
        list = &*it;
    }
    if (!list->is_array()) {
        return Error{ErrorCode::InvalidData, file.string() + ": 'systems' must be a sequence"};
    }

    std::vector<SystemConfig> systems;
    for (std::size_t i = 0; i < list->size(); ++i) {
        const auto& entry = (*list)[i];
        const std::string where = file.string() + ": systems[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            return Error{ErrorCode::InvalidData, where + " must be a mapping"};
        }
        auto made = makeSystem(stringField(entry, "name"), stringField(entry, "endpoint"));
        if (!made) {
            return Error{made.error().code, where + ": " + made.error().message};
        }
        SystemConfig config = std::move(made).value();

        if (auto headers = entry.find("headers"); headers != entry.end() && !headers->is_null()) {
            if (!headers->is_object()) {
                return Error{ErrorCode::InvalidData, where + ".headers must be a mapping"};
            }
            for (const auto& [key, value] : headers->items()) {
                config.headers[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        if (auto timeout = entry.find("timeout_ms");
            timeout != entry.end() && !timeout->is_null()) {
            if (!timeout->is_number_integer() || timeout->get<std::int64_t>() <= 0) {
                return Error{ErrorCode::InvalidData,
                             where + ".timeout_ms must be a positive integer"};
            }
            config.timeout = std::chrono::milliseconds(timeout->get<std::int64_t>());
        }
        systems.push_back(std::move(config));
    }

    spdlog::debug("Loaded {} systems from {}", systems.size(), file.string());
    return systems;
}

Result<void> validateSystems(const std::vector<SystemConfig>& systems) {
    if (systems.empty()) {
        return Error{ErrorCode::InvalidArgument, "at least one system is required"};
    }
    std::set<std::string> names;
    for (const auto& system : systems) {
        if (!names.insert(system.name).second) {
            return Error{ErrorCode::InvalidArgument,
                         "duplicate system name '" + system.name + "'"};
        }
    }
    return {};
}

} // namespace yardstick::systems
