#include "options.hpp"

#include <cstdint>
#include <string>

#include "conform/error/exception.hpp"
#include "conform/log/logger.hpp"

namespace conform::schema {

namespace {
auto readBool(const Value& config, const char* name, bool fallback) -> bool {
    auto it = config.find(name);
    if (it == config.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        THROW_INVALID_ARGUMENT("Option \"{}\" must be a boolean, got {}", name,
                               it->type_name());
    }
    return it->get<bool>();
}

auto readCount(const Value& config, const char* name,
               std::size_t fallback) -> std::size_t {
    auto it = config.find(name);
    if (it == config.end()) {
        return fallback;
    }
    if (!it->is_number_unsigned() &&
        !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        THROW_INVALID_ARGUMENT(
            "Option \"{}\" must be a non-negative integer, got {}", name,
            it->dump());
    }
    return it->get<std::size_t>();
}
}  // namespace

auto ValidationOptions::fromJson(const Value& config) -> ValidationOptions {
    if (!config.is_object()) {
        THROW_INVALID_ARGUMENT("Validation options must be a JSON object");
    }

    ValidationOptions options;
    options.fail_fast = readBool(config, "failFast", options.fail_fast);
    options.max_errors = readCount(config, "maxErrors", options.max_errors);
    options.ignore_format =
        readBool(config, "ignoreFormat", options.ignore_format);
    options.max_depth = readCount(config, "maxDepth", options.max_depth);

    if (auto it = config.find("logLevel"); it != config.end()) {
        if (!it->is_string()) {
            THROW_INVALID_ARGUMENT("Option \"logLevel\" must be a string");
        }
        const auto level =
            log::stringToLogLevel(it->get_ref<const std::string&>());
        if (level == log::LogLevel::UNKNOWN) {
            THROW_INVALID_ARGUMENT("Unknown log level: {}",
                                   it->get_ref<const std::string&>());
        }
        log::setLogLevel(level);
        log::getLogger()->debug("Log level set to {}",
                                log::logLevelToString(level));
    }
    return options;
}

auto ValidationOptions::toJson() const -> Value {
    return Value{{"failFast", fail_fast},
                 {"maxErrors", max_errors},
                 {"ignoreFormat", ignore_format},
                 {"maxDepth", max_depth}};
}

}  // namespace conform::schema
