#include <yardstick/path/json_path.h>

#include <cctype>
#include <limits>
#include <string>

namespace yardstick::path {

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

Error syntaxError(std::string_view expr, std::size_t offset, std::string_view what) {
    return Error{ErrorCode::InvalidArgument, "Invalid path '" + std::string(expr) + "' at offset " +
                                                 std::to_string(offset) + ": " +
                                                 std::string(what)};
}

const char* typeName(const nlohmann::json& v) {
    return v.type_name();
}

} // namespace

Result<JsonPath> JsonPath::parse(std::string_view expression) {
    // Trim surrounding whitespace
    std::size_t b = 0;
    std::size_t e = expression.size();
    while (b < e && std::isspace(static_cast<unsigned char>(expression[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(expression[e - 1])))
        --e;
    const std::string_view expr = expression.substr(b, e - b);

    if (expr.empty()) {
        return Error{ErrorCode::InvalidArgument, "Path expression cannot be empty"};
    }
    if (expr.front() != '$') {
        return syntaxError(expr, 0, "expected '$'");
    }

    JsonPath path;
    path.expression_ = std::string(expr);

    std::size_t i = 1;
    while (i < expr.size()) {
        const char c = expr[i];
        if (c == '.') {
            ++i;
            if (i >= expr.size() || !isIdentStart(expr[i])) {
                return syntaxError(expr, i, "expected field name after '.'");
            }
            const std::size_t start = i;
            while (i < expr.size() && isIdentChar(expr[i]))
                ++i;
            path.segments_.emplace_back(Field{std::string(expr.substr(start, i - start))});
        } else if (c == '[') {
            ++i;
            if (i >= expr.size()) {
                return syntaxError(expr, i, "unterminated '['");
            }
            if (expr[i] == '\'' || expr[i] == '"') {
                const char quote = expr[i++];
                std::string name;
                bool closed = false;
                while (i < expr.size()) {
                    if (expr[i] == '\\' && i + 1 < expr.size()) {
                        name.push_back(expr[i + 1]);
                        i += 2;
                        continue;
                    }
                    if (expr[i] == quote) {
                        closed = true;
                        ++i;
                        break;
                    }
                    name.push_back(expr[i++]);
                }
                if (!closed) {
                    return syntaxError(expr, i, "unterminated quoted field name");
                }
                if (i >= expr.size() || expr[i] != ']') {
                    return syntaxError(expr, i, "expected ']'");
                }
                ++i;
                path.segments_.emplace_back(Field{std::move(name)});
            } else if (std::isdigit(static_cast<unsigned char>(expr[i]))) {
                constexpr auto kMaxIndex = std::numeric_limits<std::size_t>::max();
                const std::size_t start = i;
                std::size_t value = 0;
                while (i < expr.size() && std::isdigit(static_cast<unsigned char>(expr[i]))) {
                    auto digit = static_cast<std::size_t>(expr[i] - '0');
                    if (value > (kMaxIndex - digit) / 10) {
                        return syntaxError(expr, start, "index out of range");
                    }
                    value = value * 10 + digit;
                    ++i;
                }
                if (i >= expr.size() || expr[i] != ']') {
                    return syntaxError(expr, i, "expected ']'");
                }
                ++i;
                path.segments_.emplace_back(Index{value});
            } else {
                return syntaxError(expr, i, "expected index or quoted field name");
            }
        } else {
            return syntaxError(expr, i, std::string("unexpected character '") + c + "'");
        }
    }

    return path;
}

Result<const nlohmann::json*> JsonPath::evaluate(const nlohmann::json& root) const {
    const nlohmann::json* current = &root;
    std::string traversed = "$";

    for (const auto& segment : segments_) {
        if (const auto* field = std::get_if<Field>(&segment)) {
            traversed += "." + field->name;
            if (current->is_null()) {
                return Error{ErrorCode::ExtractionError, "Cannot access '" + field->name +
                                                             "' on null value at path: " +
                                                             traversed};
            }
            if (!current->is_object()) {
                return Error{ErrorCode::ExtractionError,
                             "Cannot access '" + field->name + "' on non-object type '" +
                                 typeName(*current) + "' at path: " + traversed};
            }
            auto it = current->find(field->name);
            if (it == current->end()) {
                return Error{ErrorCode::ExtractionError,
                             "Field '" + field->name + "' not found at path: " + traversed};
            }
            current = &*it;
        } else {
            const auto index = std::get<Index>(segment).value;
            traversed += "[" + std::to_string(index) + "]";
            if (!current->is_array()) {
                return Error{ErrorCode::ExtractionError,
                             "Cannot index non-array type '" + std::string(typeName(*current)) +
                                 "' at path: " + traversed};
            }
            if (index >= current->size()) {
                return Error{ErrorCode::ExtractionError,
                             "Index " + std::to_string(index) + " out of range (size " +
                                 std::to_string(current->size()) + ") at path: " + traversed};
            }
            current = &(*current)[index];
        }
    }
    return current;
}

Result<nlohmann::json> evaluate(const nlohmann::json& root, std::string_view expression) {
    auto compiled = JsonPath::parse(expression);
    if (!compiled) {
        return compiled.error();
    }
    auto resolved = compiled.value().evaluate(root);
    if (!resolved) {
        return resolved.error();
    }
    return nlohmann::json(*resolved.value());
}

} // namespace yardstick::path
