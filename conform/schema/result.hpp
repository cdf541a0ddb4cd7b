#ifndef CONFORM_SCHEMA_RESULT_HPP
#define CONFORM_SCHEMA_RESULT_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "conform/value/value.hpp"

namespace conform::schema {

/**
 * @brief One step into an instance: a property name or an array index.
 */
using PathSegment = std::variant<std::string, std::size_t>;

/**
 * @brief Location of a value inside the validated instance. Empty for the
 * root.
 */
using Path = std::vector<PathSegment>;

/**
 * @brief Renders a path as a JSON Pointer (RFC 6901), e.g. "/items/0/name".
 * The root renders as "".
 */
[[nodiscard]] auto pathToString(const Path& path) -> std::string;

/**
 * @brief A single failed keyword check.
 */
struct ValidationError {
    Path path;
    std::string keyword;
    std::string message;

    ValidationError() = default;

    ValidationError(Path p, std::string kw, std::string msg) noexcept
        : path(std::move(p)), keyword(std::move(kw)), message(std::move(msg)) {}

    /**
     * @brief Converts error to JSON format
     * @return {"path": "/a/0", "keyword": "...", "message": "..."}
     */
    [[nodiscard]] auto toJson() const -> Value;

    friend auto operator==(const ValidationError&,
                           const ValidationError&) -> bool = default;
};

/**
 * @brief Every violation found, in traversal order. Empty means the instance
 * conforms.
 */
using ValidationResult = std::vector<ValidationError>;

/**
 * @brief Converts a whole result to a JSON array.
 */
[[nodiscard]] auto toJson(const ValidationResult& result) -> Value;

}  // namespace conform::schema

#endif  // CONFORM_SCHEMA_RESULT_HPP
