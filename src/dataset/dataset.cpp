#include <yardstick/dataset/dataset.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace yardstick::dataset {

namespace {

constexpr std::size_t kMaxQuotedContent = 200;

std::string quoteContent(const std::string& line) {
    if (line.size() <= kMaxQuotedContent)
        return line;
    return line.substr(0, kMaxQuotedContent) + "...";
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string lineMessage(std::size_t lineNumber, const std::string& what,
                        const std::string& line) {
    return "line " + std::to_string(lineNumber) + ": " + what + ": " + quoteContent(line);
}

// Reads the next non-blank line. Returns false at end of input.
bool nextLine(std::istream& in, std::size_t& lineNumber, std::string& out) {
    std::string line;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (isBlank(line))
            continue;
        out = std::move(line);
        return true;
    }
    if (in.bad()) {
        throw DatasetError("read failure after line " + std::to_string(lineNumber));
    }
    return false;
}

std::optional<Case> readCase(std::istream& in, std::size_t& lineNumber,
                             std::set<std::string>& seenIds) {
    std::string line;
    if (!nextLine(in, lineNumber, line))
        return std::nullopt;

    Case c = DatasetLoader::parseLine(line, lineNumber);
    if (!seenIds.insert(c.id).second) {
        throw DatasetError("line " + std::to_string(lineNumber) + ": duplicate case id '" + c.id +
                               "'",
                           lineNumber, line);
    }
    return c;
}

} // namespace

DatasetError::DatasetError(std::string message, std::size_t line, std::string content)
    : std::runtime_error(std::move(message)), line_(line), content_(std::move(content)) {}

DatasetReader::DatasetReader(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        throw DatasetError("dataset file not found: " + file.string());
    }
    auto stream = std::make_unique<std::ifstream>(file, std::ios::binary);
    if (!stream->is_open()) {
        throw DatasetError("unable to open dataset file: " + file.string());
    }
    stream_ = std::move(stream);
}

DatasetReader::DatasetReader(std::unique_ptr<std::istream> stream) : stream_(std::move(stream)) {
    if (!stream_) {
        throw DatasetError("dataset stream is null");
    }
}

std::optional<Case> DatasetReader::next() {
    return readCase(*stream_, lineNumber_, seenIds_);
}

Case DatasetLoader::parseLine(const std::string& line, std::size_t lineNumber) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw DatasetError(lineMessage(lineNumber, std::string("invalid JSON (") + e.what() + ")",
                                       line),
                           lineNumber, line);
    }

    if (!data.is_object()) {
        throw DatasetError(lineMessage(lineNumber, "expected a JSON object", line), lineNumber,
                           line);
    }

    auto id = data.find("id");
    if (id == data.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw DatasetError(lineMessage(lineNumber, "'id' must be a non-empty string", line),
                           lineNumber, line);
    }
    auto input = data.find("input");
    if (input == data.end()) {
        throw DatasetError(lineMessage(lineNumber, "missing 'input'", line), lineNumber, line);
    }
    auto reference = data.find("reference");
    if (reference == data.end()) {
        throw DatasetError(lineMessage(lineNumber, "missing 'reference'", line), lineNumber,
                           line);
    }

    return Case{id->get<std::string>(), std::move(*input), std::move(*reference)};
}

std::vector<Case> DatasetLoader::parse(std::istream& in) {
    std::vector<Case> cases;
    std::size_t lineNumber = 0;
    std::set<std::string> seenIds;
    while (auto c = readCase(in, lineNumber, seenIds)) {
        cases.push_back(std::move(*c));
    }
    if (cases.empty()) {
        throw DatasetError("dataset contains no cases");
    }
    return cases;
}

std::vector<Case> DatasetLoader::load(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        throw DatasetError("dataset file not found: " + file.string());
    }
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw DatasetError("unable to open dataset file: " + file.string());
    }
    auto cases = parse(in);
    spdlog::debug("Loaded {} cases from {}", cases.size(), file.string());
    return cases;
}

} // namespace yardstick::dataset
