#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <yardstick/core/types.h>

namespace yardstick::path {

/**
 * Compiled path expression addressing a location inside a JSON value.
 *
 * Supported syntax:
 *   $                 root
 *   $.field           object member (identifier characters, '_' and '-')
 *   $['any key']      object member with arbitrary characters
 *   $[3]              array element (zero-based)
 *
 * Segments chain freely, e.g. `$.choices[0].message['content']`.
 */
class JsonPath {
public:
    struct Field {
        std::string name;
    };
    struct Index {
        std::size_t value;
    };
    using Segment = std::variant<Field, Index>;

    JsonPath() = default;

    /**
     * Parse a path expression. Syntax errors report the character offset.
     */
    static Result<JsonPath> parse(std::string_view expression);

    /**
     * Resolve the path against `root`. The returned pointer aliases `root`.
     */
    Result<const nlohmann::json*> evaluate(const nlohmann::json& root) const;

    bool isRoot() const noexcept { return segments_.empty(); }
    const std::vector<Segment>& segments() const noexcept { return segments_; }
    const std::string& expression() const noexcept { return expression_; }

private:
    std::string expression_{"$"};
    std::vector<Segment> segments_;
};

// Convenience: parse + evaluate in one call, returning a copy of the addressed value.
Result<nlohmann::json> evaluate(const nlohmann::json& root, std::string_view expression);

} // namespace yardstick::path
