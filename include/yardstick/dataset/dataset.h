#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace yardstick::dataset {

struct Case {
    std::string id;
    nlohmann::json input;
    nlohmann::json reference;
};

/**
 * Raised when a dataset cannot be read or contains an invalid line. `line()` is
 * the 1-based line number, or 0 when the failure is not tied to a line.
 */
class DatasetError : public std::runtime_error {
public:
    DatasetError(std::string message, std::size_t line = 0, std::string content = {});

    std::size_t line() const noexcept { return line_; }
    const std::string& content() const noexcept { return content_; }

private:
    std::size_t line_;
    std::string content_;
};

/**
 * Single forward pass over a dataset file. Each call to next() parses one more
 * line; a bad line throws DatasetError at the point it is reached.
 */
class DatasetReader {
public:
    explicit DatasetReader(const std::filesystem::path& file);
    explicit DatasetReader(std::unique_ptr<std::istream> stream);

    DatasetReader(const DatasetReader&) = delete;
    DatasetReader& operator=(const DatasetReader&) = delete;
    DatasetReader(DatasetReader&&) noexcept = default;
    DatasetReader& operator=(DatasetReader&&) noexcept = default;

    // Next case, or nullopt at end of input.
    std::optional<Case> next();

    std::size_t lineNumber() const noexcept { return lineNumber_; }
    std::size_t casesRead() const noexcept { return seenIds_.size(); }

private:
    std::unique_ptr<std::istream> stream_;
    std::size_t lineNumber_{0};
    std::set<std::string> seenIds_;
};

/**
 * Restartable handle on a dataset file; every reader() starts a fresh pass.
 */
class Dataset {
public:
    explicit Dataset(std::filesystem::path file) : file_(std::move(file)) {}

    DatasetReader reader() const { return DatasetReader(file_); }
    const std::filesystem::path& path() const noexcept { return file_; }

private:
    std::filesystem::path file_;
};

class DatasetLoader {
public:
    /**
     * Reads and validates the whole file. Returns cases in file order; throws
     * DatasetError without returning a partial list.
     */
    static std::vector<Case> load(const std::filesystem::path& file);

    static std::vector<Case> parse(std::istream& in);

    // Parses one dataset line; `lineNumber` is used for error reporting only.
    static Case parseLine(const std::string& line, std::size_t lineNumber);
};

} // namespace yardstick::dataset
