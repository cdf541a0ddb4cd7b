#ifndef CONFORM_SCHEMA_OPTIONS_HPP
#define CONFORM_SCHEMA_OPTIONS_HPP

#include <cstddef>

#include "conform/value/value.hpp"

namespace conform::schema {

/**
 * @brief Configuration options for schema validation
 */
struct ValidationOptions {
    /// Stop at the first violation.
    bool fail_fast{false};
    /// Upper bound on reported violations; 0 reports all of them.
    std::size_t max_errors{0};
    /// Skip `format` checks. Unknown format names are still rejected.
    bool ignore_format{false};
    /// Deepest sub-schema nesting accepted before the schema is rejected.
    std::size_t max_depth{256};

    /**
     * @brief Effective error limit, 0 meaning unlimited.
     */
    [[nodiscard]] auto errorLimit() const noexcept -> std::size_t {
        return fail_fast ? 1 : max_errors;
    }

    /**
     * @brief Reads options from a JSON object.
     *
     * Recognized members: "failFast", "maxErrors", "ignoreFormat",
     * "maxDepth", and "logLevel" (applied to the library logger). Missing
     * members keep their defaults; unknown members are ignored.
     *
     * @throws conform::error::InvalidArgument on a non-object document, a
     * member of the wrong type or an unknown log level.
     */
    static auto fromJson(const Value& config) -> ValidationOptions;

    /**
     * @brief Inverse of fromJson, without the log level.
     */
    [[nodiscard]] auto toJson() const -> Value;
};

}  // namespace conform::schema

#endif  // CONFORM_SCHEMA_OPTIONS_HPP
