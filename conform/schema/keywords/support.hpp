#ifndef CONFORM_SCHEMA_KEYWORDS_SUPPORT_HPP
#define CONFORM_SCHEMA_KEYWORDS_SUPPORT_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "conform/schema/evaluation.hpp"
#include "conform/value/decimal.hpp"
#include "conform/value/value.hpp"

namespace conform::schema::keywords {

/**
 * @brief The keyword's value in a schema node, or nullptr when absent.
 */
[[nodiscard]] auto member(const Value& schema, const char* keyword) -> const
    Value*;

/**
 * @brief Boolean keyword; false when absent.
 * @throws ConfigurationError if present but not a boolean.
 */
[[nodiscard]] auto readFlag(const Value& schema, const char* keyword) -> bool;

/**
 * @brief Non-negative whole-number keyword such as `minLength`.
 * @throws ConfigurationError if present but not a non-negative integer.
 */
[[nodiscard]] auto readCount(const Value& schema, const char* keyword)
    -> std::optional<std::size_t>;

/**
 * @brief Numeric keyword such as `minimum`, in exact decimal form.
 * @throws ConfigurationError if present but not a number.
 */
[[nodiscard]] auto readNumber(const Value& schema, const char* keyword)
    -> std::optional<value::Decimal>;

/**
 * @brief List keyword; nullptr when absent.
 * @throws ConfigurationError if present but not an array.
 */
[[nodiscard]] auto readList(const Value& schema, const char* keyword) -> const
    Value*;

/**
 * @brief Throws ConfigurationError unless subschema is an object.
 */
void requireSchema(const Value& subschema, const char* keyword);

/**
 * @brief Length-style bounds shared by strings, arrays and objects.
 *
 * Bounds are inclusive unless `exclusiveMinimum` / `exclusiveMaximum` is
 * true in the same schema node.
 *
 * @param subject Describes the measured quantity in messages, e.g.
 * "string length".
 */
void checkCount(std::size_t actual, const Value& schema,
                const char* minKeyword, const char* maxKeyword,
                std::string_view subject, const Path& path, ErrorSink& sink);

}  // namespace conform::schema::keywords

#endif  // CONFORM_SCHEMA_KEYWORDS_SUPPORT_HPP
