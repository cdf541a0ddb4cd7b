#include "result.hpp"

namespace conform::schema {

namespace {
// "~" and "/" are the only characters JSON Pointer escapes.
void appendEscaped(std::string& out, const std::string& token) {
    for (const char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
}
}  // namespace

auto pathToString(const Path& path) -> std::string {
    std::string result;
    for (const auto& segment : path) {
        result += '/';
        if (const auto* name = std::get_if<std::string>(&segment)) {
            appendEscaped(result, *name);
        } else {
            result += std::to_string(std::get<std::size_t>(segment));
        }
    }
    return result;
}

auto ValidationError::toJson() const -> Value {
    return Value{{"path", pathToString(path)},
                 {"keyword", keyword},
                 {"message", message}};
}

auto toJson(const ValidationResult& result) -> Value {
    Value errors = Value::array();
    for (const auto& error : result) {
        errors.push_back(error.toJson());
    }
    return errors;
}

}  // namespace conform::schema
