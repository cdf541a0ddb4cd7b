#include "support.hpp"

#include <cstdint>
#include <limits>

#include <spdlog/fmt/fmt.h>

#include "conform/schema/exception.hpp"

namespace conform::schema::keywords {

namespace {
// Whole, non-negative decimal to a count. Bounds beyond size_t saturate.
auto toCount(const value::Decimal& decimal) noexcept -> std::size_t {
    constexpr auto kMax = std::numeric_limits<std::size_t>::max();
    std::size_t count = decimal.coefficient();
    for (std::int32_t i = 0; i < decimal.exponent(); ++i) {
        if (count > kMax / 10) {
            return kMax;
        }
        count *= 10;
    }
    return count;
}
}  // namespace

auto member(const Value& schema, const char* keyword) -> const Value* {
    auto it = schema.find(keyword);
    return it == schema.end() ? nullptr : &*it;
}

auto readFlag(const Value& schema, const char* keyword) -> bool {
    const Value* flag = member(schema, keyword);
    if (flag == nullptr) {
        return false;
    }
    if (!flag->is_boolean()) {
        THROW_CONFIGURATION_ERROR(keyword, "\"{}\" must be a boolean, got {}",
                                  keyword, flag->dump());
    }
    return flag->get<bool>();
}

auto readCount(const Value& schema, const char* keyword)
    -> std::optional<std::size_t> {
    const Value* count = member(schema, keyword);
    if (count == nullptr) {
        return std::nullopt;
    }
    if (count->is_number_unsigned()) {
        return count->get<std::size_t>();
    }
    if (count->is_number()) {
        const auto decimal = value::Decimal::fromValue(*count);
        if (decimal.isIntegral() && !decimal.isNegative()) {
            return toCount(decimal);
        }
    }
    THROW_CONFIGURATION_ERROR(keyword,
                              "\"{}\" must be a non-negative integer, got {}",
                              keyword, count->dump());
}

auto readNumber(const Value& schema, const char* keyword)
    -> std::optional<value::Decimal> {
    const Value* number = member(schema, keyword);
    if (number == nullptr) {
        return std::nullopt;
    }
    if (!number->is_number()) {
        THROW_CONFIGURATION_ERROR(keyword, "\"{}\" must be a number, got {}",
                                  keyword, number->dump());
    }
    return value::Decimal::fromValue(*number);
}

auto readList(const Value& schema, const char* keyword) -> const Value* {
    const Value* list = member(schema, keyword);
    if (list != nullptr && !list->is_array()) {
        THROW_CONFIGURATION_ERROR(keyword, "\"{}\" must be an array, got {}",
                                  keyword, list->type_name());
    }
    return list;
}

void requireSchema(const Value& subschema, const char* keyword) {
    if (!subschema.is_object()) {
        THROW_CONFIGURATION_ERROR(keyword,
                                  "\"{}\" must hold schema objects, got {}",
                                  keyword, subschema.dump());
    }
}

void checkCount(std::size_t actual, const Value& schema,
                const char* minKeyword, const char* maxKeyword,
                std::string_view subject, const Path& path, ErrorSink& sink) {
    if (auto minimum = readCount(schema, minKeyword)) {
        if (readFlag(schema, "exclusiveMinimum")) {
            if (actual <= *minimum) {
                sink.add(path, minKeyword,
                         fmt::format("{} {} must be greater than {}", subject,
                                     actual, *minimum));
            }
        } else if (actual < *minimum) {
            sink.add(path, minKeyword,
                     fmt::format("{} {} is less than the minimum of {}",
                                 subject, actual, *minimum));
        }
    }

    if (auto maximum = readCount(schema, maxKeyword)) {
        if (readFlag(schema, "exclusiveMaximum")) {
            if (actual >= *maximum) {
                sink.add(path, maxKeyword,
                         fmt::format("{} {} must be less than {}", subject,
                                     actual, *maximum));
            }
        } else if (actual > *maximum) {
            sink.add(path, maxKeyword,
                     fmt::format("{} {} exceeds the maximum of {}", subject,
                                 actual, *maximum));
        }
    }
}

}  // namespace conform::schema::keywords
