#include "validator.hpp"

#include "conform/log/logger.hpp"
#include "conform/schema/evaluation.hpp"

namespace conform::schema {

auto Validator::validate(const Value& instance, const Value& schema) const
    -> ValidationResult {
    auto logger = log::getLogger();
    logger->debug("Validating {} instance", value::describeKind(instance));

    Evaluation evaluation(options_);
    ErrorSink sink(options_.errorLimit());
    Path path;
    try {
        evaluation.validate(instance, schema, path, sink);
    } catch (const ConfigurationError& e) {
        logger->debug("Schema rejected at keyword \"{}\": {}", e.keyword(),
                      e.getMessage());
        throw;
    }

    ValidationResult result = sink.release();
    logger->debug("Validation finished with {} error(s)", result.size());
    if (logger->should_log(spdlog::level::trace)) {
        for (const auto& error : result) {
            logger->trace("{} [{}] {}", pathToString(error.path),
                          error.keyword, error.message);
        }
    }
    return result;
}

auto Validator::isValid(const Value& instance, const Value& schema) const
    -> bool {
    ValidationOptions trialOptions = options_;
    trialOptions.fail_fast = true;
    Evaluation evaluation(trialOptions);
    ErrorSink sink(1);
    Path path;
    evaluation.validate(instance, schema, path, sink);
    return sink.empty();
}

auto validate(const Value& instance, const Value& schema)
    -> ValidationResult {
    return Validator().validate(instance, schema);
}

}  // namespace conform::schema
