#ifndef CONFORM_FORMAT_REGISTRY_HPP
#define CONFORM_FORMAT_REGISTRY_HPP

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace conform::format {

/**
 * @brief A named string format: an anchored pattern plus the longest text
 * it can describe.
 *
 * Text longer than max_length is rejected without running the pattern, so
 * arbitrarily long instance strings never reach the regex engine.
 */
struct Format {
    std::regex pattern;
    std::size_t max_length;

    [[nodiscard]] auto matches(std::string_view text) const -> bool;
};

/**
 * @brief Process-wide table of named string formats.
 *
 * Every entry is an anchored ECMAScript pattern compiled exactly once, on
 * first access to instance(), together with its length cap. The table is never modified afterwards, so
 * lookups need no locking and may run from any thread.
 *
 * Known formats: date-time, date, time, email, hostname, ipv4, ipv6, uri,
 * uuid.
 */
class FormatRegistry {
public:
    FormatRegistry(const FormatRegistry&) = delete;
    FormatRegistry& operator=(const FormatRegistry&) = delete;

    /**
     * @brief The shared registry.
     */
    static auto instance() -> const FormatRegistry&;

    /**
     * @brief The format registered under name, or nullptr if unknown.
     */
    [[nodiscard]] auto find(std::string_view name) const noexcept
        -> const Format*;

    [[nodiscard]] auto contains(std::string_view name) const noexcept -> bool;

    /**
     * @brief Tests text against a format.
     * @throws conform::error::InvalidArgument if the format is unknown.
     */
    [[nodiscard]] auto matches(std::string_view name,
                               std::string_view text) const -> bool;

    /**
     * @brief Registered format names, sorted.
     */
    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    FormatRegistry();

    void add(std::string name, const std::string& pattern,
             std::size_t maxLength);

    std::unordered_map<std::string, Format> formats_;
};

}  // namespace conform::format

#endif  // CONFORM_FORMAT_REGISTRY_HPP
