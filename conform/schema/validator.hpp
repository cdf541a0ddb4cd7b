#ifndef CONFORM_SCHEMA_VALIDATOR_HPP
#define CONFORM_SCHEMA_VALIDATOR_HPP

#include "conform/schema/exception.hpp"
#include "conform/schema/options.hpp"
#include "conform/schema/result.hpp"
#include "conform/value/value.hpp"

namespace conform::schema {

/**
 * @brief Checks instances against schemas and reports every violation.
 *
 * Supported keywords: type, required, enum, pattern, format, minLength,
 * maxLength, minimum, maximum, exclusiveMinimum, exclusiveMaximum,
 * divisibleBy, properties, patternProperties, additionalProperties,
 * dependencies, minProperties, maxProperties, items, additionalItems,
 * minItems, maxItems, uniqueItems, allOf, anyOf, oneOf, not. Other members
 * of a schema node are ignored.
 *
 * A null instance is accepted by any schema that does not name the `null`
 * type, unless the schema also says `required: true`.
 *
 * The validator keeps no state between calls; one instance may be shared by
 * any number of threads as long as the schema and instance trees are not
 * modified during a call.
 */
class Validator {
public:
    explicit Validator(ValidationOptions options = {}) noexcept
        : options_(options) {}

    /**
     * @brief Validates the instance against the schema
     * @param instance Data to check
     * @param schema Schema object
     * @return All violations in traversal order; empty if the instance
     * conforms
     * @throws ConfigurationError if the schema is malformed
     */
    [[nodiscard]] auto validate(const Value& instance,
                                const Value& schema) const -> ValidationResult;

    /**
     * @brief True when the instance conforms. Stops at the first violation.
     * @throws ConfigurationError if the schema is malformed
     */
    [[nodiscard]] auto isValid(const Value& instance,
                               const Value& schema) const -> bool;

    [[nodiscard]] auto options() const noexcept -> const ValidationOptions& {
        return options_;
    }

private:
    ValidationOptions options_;
};

/**
 * @brief Validates with default options.
 * @throws ConfigurationError if the schema is malformed
 */
[[nodiscard]] auto validate(const Value& instance,
                            const Value& schema) -> ValidationResult;

}  // namespace conform::schema

#endif  // CONFORM_SCHEMA_VALIDATOR_HPP
