#include <yardstick/metrics/metric_registry.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace yardstick::metrics {

namespace {

using nlohmann::json;

constexpr std::string_view kNormalizeFlags[] = {"lowercase", "strip_whitespace",
                                                "strip_punctuation"};

bool isKnownArgument(const std::string& key) {
    if (key == "pred_path" || key == "ref_path" || key == "normalize")
        return true;
    return std::find(std::begin(kNormalizeFlags), std::end(kNormalizeFlags), key) !=
           std::end(kNormalizeFlags);
}

void readPath(const json& args, const char* key, const std::string& field,
              std::vector<std::string>& violations, path::JsonPath& out) {
    auto it = args.find(key);
    if (it == args.end()) {
        out = path::JsonPath{};
        return;
    }
    if (!it->is_string()) {
        violations.push_back(field + "." + key + ": must be a string path expression");
        return;
    }
    auto parsed = path::JsonPath::parse(it->get<std::string>());
    if (!parsed) {
        violations.push_back(field + "." + key + ": " + parsed.error().message);
        return;
    }
    out = std::move(parsed).value();
}

void readFlag(const json& source, std::string_view key, const std::string& field,
              std::vector<std::string>& violations, bool& out) {
    auto it = source.find(std::string(key));
    if (it == source.end())
        return;
    if (!it->is_boolean()) {
        violations.push_back(field + "." + std::string(key) + ": must be a boolean");
        return;
    }
    out = it->get<bool>();
}

void validateComparisonArgs(const json& args, const std::string& field,
                            std::vector<std::string>& violations, spec::ComparisonArgs& out) {
    out = spec::ComparisonArgs{};
    if (args.is_null())
        return;
    if (!args.is_object()) {
        violations.push_back(field + ": must be a mapping");
        return;
    }

    for (const auto& [key, value] : args.items()) {
        if (!isKnownArgument(key)) {
            violations.push_back(field + "." + key + ": unknown argument");
        }
    }

    readPath(args, "pred_path", field, violations, out.predPath);
    readPath(args, "ref_path", field, violations, out.refPath);

    bool* targets[] = {&out.normalize.lowercase, &out.normalize.stripWhitespace,
                       &out.normalize.stripPunctuation};
    for (std::size_t i = 0; i < std::size(kNormalizeFlags); ++i) {
        readFlag(args, kNormalizeFlags[i], field, violations, *targets[i]);
    }

    if (auto it = args.find("normalize"); it != args.end()) {
        if (!it->is_object()) {
            violations.push_back(field + ".normalize: must be a mapping");
            return;
        }
        for (const auto& [key, value] : it->items()) {
            if (std::find(std::begin(kNormalizeFlags), std::end(kNormalizeFlags), key) ==
                std::end(kNormalizeFlags)) {
                violations.push_back(field + ".normalize." + key + ": unknown option");
            }
        }
        for (std::size_t i = 0; i < std::size(kNormalizeFlags); ++i) {
            readFlag(*it, kNormalizeFlags[i], field + ".normalize", violations, *targets[i]);
        }
    }
}

struct ComparedPair {
    std::string predicted;
    std::string reference;
};

Result<ComparedPair> resolvePair(const json& predicted, const json& reference,
                                 const spec::ComparisonArgs& args) {
    auto pred = args.predPath.evaluate(predicted);
    if (!pred) {
        return Error{ErrorCode::ExtractionError, "Failed to extract predicted value at '" +
                                                     args.predPath.expression() +
                                                     "': " + pred.error().message};
    }
    auto ref = args.refPath.evaluate(reference);
    if (!ref) {
        return Error{ErrorCode::ExtractionError, "Failed to extract reference value at '" +
                                                     args.refPath.expression() +
                                                     "': " + ref.error().message};
    }
    return ComparedPair{normalizeText(renderText(*pred.value()), args.normalize),
                        normalizeText(renderText(*ref.value()), args.normalize)};
}

Result<double> scoreExactMatch(const json& predicted, const json& reference,
                               const spec::ComparisonArgs& args) {
    auto pair = resolvePair(predicted, reference, args);
    if (!pair)
        return pair.error();
    return pair.value().predicted == pair.value().reference ? 1.0 : 0.0;
}

Result<double> scoreContains(const json& predicted, const json& reference,
                             const spec::ComparisonArgs& args) {
    auto pair = resolvePair(predicted, reference, args);
    if (!pair)
        return pair.error();
    const auto& p = pair.value();
    return p.predicted.find(p.reference) != std::string::npos ? 1.0 : 0.0;
}

} // namespace

MetricRegistry::MetricRegistry(std::vector<MetricDescriptor> entries)
    : entries_(std::move(entries)) {}

const MetricRegistry& MetricRegistry::builtin() {
    static const MetricRegistry registry({
        {"exact_match", spec::MetricKind::ExactMatch,
         "1.0 when the normalized predicted and reference texts are equal",
         &validateComparisonArgs, &scoreExactMatch},
        {"contains", spec::MetricKind::Contains,
         "1.0 when the normalized reference text occurs in the predicted text",
         &validateComparisonArgs, &scoreContains},
    });
    return registry;
}

const MetricDescriptor* MetricRegistry::find(std::string_view type) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.type == type)
            return &entry;
    }
    return nullptr;
}

const MetricDescriptor& MetricRegistry::get(spec::MetricKind kind) const {
    for (const auto& entry : entries_) {
        if (entry.kind == kind)
            return entry;
    }
    throw std::out_of_range(std::string("Metric kind not registered: ") + spec::toString(kind));
}

std::vector<std::string_view> MetricRegistry::types() const {
    std::vector<std::string_view> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_)
        out.push_back(entry.type);
    return out;
}

std::string renderText(const nlohmann::json& value) {
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

std::string normalizeText(std::string text, const spec::NormalizeOptions& options) {
    if (options.lowercase) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    if (options.stripPunctuation) {
        text.erase(std::remove_if(text.begin(), text.end(),
                                  [](unsigned char c) { return std::ispunct(c) != 0; }),
                   text.end());
    }
    if (options.stripWhitespace) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        text.erase(text.begin(), std::find_if(text.begin(), text.end(), notSpace));
        text.erase(std::find_if(text.rbegin(), text.rend(), notSpace).base(), text.end());
    }
    return text;
}

} // namespace yardstick::metrics
