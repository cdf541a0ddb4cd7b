#ifndef CONFORM_SCHEMA_EVALUATION_HPP
#define CONFORM_SCHEMA_EVALUATION_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "conform/schema/options.hpp"
#include "conform/schema/result.hpp"
#include "conform/value/value.hpp"

namespace conform::schema {

/**
 * @brief Collects violations, dropping any beyond its limit.
 */
class ErrorSink {
public:
    /**
     * @param limit Maximum number of errors kept; 0 keeps everything.
     */
    explicit ErrorSink(std::size_t limit = 0) noexcept : limit_(limit) {}

    void add(const Path& path, std::string_view keyword, std::string message);

    /**
     * @brief Moves another sink's errors in after this one's.
     */
    void merge(ErrorSink&& other);

    [[nodiscard]] auto full() const noexcept -> bool {
        return limit_ != 0 && errors_.size() >= limit_;
    }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return errors_.empty();
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return errors_.size();
    }
    [[nodiscard]] auto errors() const noexcept -> const ValidationResult& {
        return errors_;
    }
    [[nodiscard]] auto release() noexcept -> ValidationResult {
        return std::move(errors_);
    }

private:
    ValidationResult errors_;
    std::size_t limit_;
};

/**
 * @brief Pushes a segment onto a path for the lifetime of the scope.
 */
class PathScope {
public:
    PathScope(Path& path, PathSegment segment) : path_(path) {
        path_.push_back(std::move(segment));
    }
    ~PathScope() { path_.pop_back(); }

    PathScope(const PathScope&) = delete;
    PathScope& operator=(const PathScope&) = delete;

private:
    Path& path_;
};

/**
 * @brief State of one validate() call: the recursive walk over instance and
 * schema.
 *
 * Each node is evaluated in a fixed order:
 *  1. null / required short-circuit (may end the node),
 *  2. type,
 *  3. enum,
 *  4. string or number keywords, by instance kind,
 *  5. object or array keywords, by instance kind,
 *  6. allOf, anyOf, oneOf, not.
 * Steps 2 to 6 all run; their errors accumulate in order.
 *
 * An Evaluation is confined to a single call and thread. It owns the regular
 * expressions compiled during the call and nothing else.
 */
class Evaluation {
public:
    explicit Evaluation(const ValidationOptions& options) noexcept
        : options_(options) {}

    Evaluation(const Evaluation&) = delete;
    Evaluation& operator=(const Evaluation&) = delete;

    /**
     * @brief Validates instance against schema, reporting at path.
     * @throws ConfigurationError if the schema is malformed or nested deeper
     * than ValidationOptions::max_depth.
     */
    void validate(const Value& instance, const Value& schema, Path& path,
                  ErrorSink& sink);

    /**
     * @brief True when instance satisfies schema. Stops at the first
     * violation.
     */
    [[nodiscard]] auto conforms(const Value& instance, const Value& schema,
                                Path& path) -> bool;

    /**
     * @brief Compiled form of a pattern, cached for the rest of the call.
     * @param keyword Reported if the pattern does not compile.
     * @throws ConfigurationError for an invalid regular expression.
     */
    auto regex(const std::string& pattern,
               std::string_view keyword) -> const std::regex&;

    [[nodiscard]] auto options() const noexcept -> const ValidationOptions& {
        return options_;
    }

private:
    const ValidationOptions& options_;
    std::size_t depth_{0};
    std::unordered_map<std::string, std::regex> regexCache_;
};

}  // namespace conform::schema

#endif  // CONFORM_SCHEMA_EVALUATION_HPP
