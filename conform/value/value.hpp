#ifndef CONFORM_VALUE_VALUE_HPP
#define CONFORM_VALUE_VALUE_HPP

#include <cstddef>
#include <string_view>

#include <nlohmann/json.hpp>

namespace conform {

/**
 * @brief Dynamically shaped tree shared by instances and schemas.
 */
using Value = nlohmann::json;

namespace value {

/**
 * @brief Logical kind of a Value, independent of how a number is stored.
 */
enum class Kind { Null, Boolean, Number, String, Sequence, Mapping };

/**
 * @brief Classifies a Value. A discarded value counts as null.
 *
 * Binary data (from CBOR, MessagePack...) counts as a sequence: the array
 * keywords see it as the list of its bytes, each an integer in [0, 255].
 */
[[nodiscard]] auto kindOf(const Value& value) noexcept -> Kind;

/**
 * @brief Schema-facing name of a kind: "null", "boolean", "number",
 * "string", "array" or "object".
 */
[[nodiscard]] auto kindName(Kind kind) noexcept -> std::string_view;

/**
 * @brief Kind name refined to "integer" for whole numbers.
 */
[[nodiscard]] auto describeKind(const Value& value) -> std::string_view;

/**
 * @brief True for a numeric Value with no fractional part (1.0 included).
 */
[[nodiscard]] auto isIntegral(const Value& value) -> bool;

/**
 * @brief Structural equality used by `enum` and `uniqueItems`.
 *
 * Numbers compare by exact decimal value regardless of representation, so
 * `1`, `1u` and `1.0` are equal. Sequences compare element-wise in order,
 * mappings by key set and per-key value. Strings compare byte-wise.
 */
[[nodiscard]] auto deepEquals(const Value& lhs, const Value& rhs) -> bool;

/**
 * @brief Binary data as an array of its bytes; any other value is returned
 * unchanged.
 */
[[nodiscard]] auto asSequence(const Value& value) -> Value;

/**
 * @brief Number of Unicode code points in UTF-8 text. Malformed sequences
 * count one per lead byte.
 */
[[nodiscard]] auto codePointLength(std::string_view text) noexcept
    -> std::size_t;

}  // namespace value
}  // namespace conform

#endif  // CONFORM_VALUE_VALUE_HPP
