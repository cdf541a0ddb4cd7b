#include "keywords.hpp"

#include <spdlog/fmt/fmt.h>

#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/support.hpp"
#include "conform/value/decimal.hpp"

namespace conform::schema::keywords {

void checkNumber(const Value& instance, const Value& schema, const Path& path,
                 ErrorSink& sink) {
    const auto number = value::Decimal::fromValue(instance);

    if (auto minimum = readNumber(schema, "minimum")) {
        if (readFlag(schema, "exclusiveMinimum")) {
            if (number <= *minimum) {
                sink.add(path, "minimum",
                         fmt::format("Value {} must be greater than {}",
                                     number.toString(), minimum->toString()));
            }
        } else if (number < *minimum) {
            sink.add(path, "minimum",
                     fmt::format("Value {} is less than the minimum of {}",
                                 number.toString(), minimum->toString()));
        }
    }

    if (auto maximum = readNumber(schema, "maximum")) {
        if (readFlag(schema, "exclusiveMaximum")) {
            if (number >= *maximum) {
                sink.add(path, "maximum",
                         fmt::format("Value {} must be less than {}",
                                     number.toString(), maximum->toString()));
            }
        } else if (number > *maximum) {
            sink.add(path, "maximum",
                     fmt::format("Value {} exceeds the maximum of {}",
                                 number.toString(), maximum->toString()));
        }
    }

    if (auto divisor = readNumber(schema, "divisibleBy")) {
        if (divisor->isZero() || !divisor->isFinite()) {
            THROW_CONFIGURATION_ERROR("divisibleBy",
                                      "\"divisibleBy\" must be non-zero, got {}",
                                      divisor->toString());
        }
        if (!number.isMultipleOf(*divisor)) {
            sink.add(path, "divisibleBy",
                     fmt::format("Value {} is not divisible by {}",
                                 number.toString(), divisor->toString()));
        }
    }
}

}  // namespace conform::schema::keywords
