#ifndef CONFORM_SCHEMA_EXCEPTION_HPP
#define CONFORM_SCHEMA_EXCEPTION_HPP

#include <string>
#include <string_view>
#include <utility>

#include "conform/error/exception.hpp"

namespace conform::schema {

/**
 * @brief Thrown when a schema is malformed: unknown `type` or `format`,
 * an invalid regular expression, a keyword value of the wrong shape...
 *
 * Data that fails a schema never raises; only the schema can.
 */
class ConfigurationError : public error::Exception {
public:
    template <typename... Args>
    ConfigurationError(std::string file, int line, std::string func,
                       std::string keyword, std::string_view format,
                       Args&&... args)
        : error::Exception(std::move(file), line, std::move(func), format,
                           std::forward<Args>(args)...),
          keyword_(std::move(keyword)) {}

    /**
     * @brief The schema keyword whose value is at fault.
     */
    [[nodiscard]] auto keyword() const noexcept -> const std::string& {
        return keyword_;
    }

private:
    std::string keyword_;
};

#define THROW_CONFIGURATION_ERROR(keyword, ...)                          \
    throw conform::schema::ConfigurationError(                           \
        CONFORM_FILE_NAME, CONFORM_FILE_LINE, CONFORM_FUNC_NAME, keyword, \
        __VA_ARGS__)

}  // namespace conform::schema

#endif  // CONFORM_SCHEMA_EXCEPTION_HPP
