#include "keywords.hpp"

#include <spdlog/fmt/fmt.h>

#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/support.hpp"

namespace conform::schema::keywords {

namespace {
// allOf/anyOf/oneOf take a non-empty array of schemas.
auto readAlternatives(const Value& schema, const char* keyword) -> const
    Value* {
    const Value* list = member(schema, keyword);
    if (list == nullptr) {
        return nullptr;
    }
    if (!list->is_array() || list->empty()) {
        THROW_CONFIGURATION_ERROR(
            keyword, "\"{}\" must be a non-empty array of schemas, got {}",
            keyword, list->dump());
    }
    for (const auto& subschema : *list) {
        requireSchema(subschema, keyword);
    }
    return list;
}

void checkAllOf(Evaluation& eval, const Value& instance, const Value& schema,
                Path& path, ErrorSink& sink) {
    const Value* list = readAlternatives(schema, "allOf");
    if (list == nullptr) {
        return;
    }
    for (const auto& subschema : *list) {
        eval.validate(instance, subschema, path, sink);
    }
}

void checkAnyOf(Evaluation& eval, const Value& instance, const Value& schema,
                Path& path, ErrorSink& sink) {
    const Value* list = readAlternatives(schema, "anyOf");
    if (list == nullptr) {
        return;
    }
    // Every alternative is evaluated so a malformed one is always reported.
    bool matched = false;
    for (const auto& subschema : *list) {
        if (eval.conforms(instance, subschema, path)) {
            matched = true;
        }
    }
    if (matched) {
        return;
    }
    sink.add(path, "anyOf",
             fmt::format("Value does not match any of the {} schemas in anyOf",
                         list->size()));
}

void checkOneOf(Evaluation& eval, const Value& instance, const Value& schema,
                Path& path, ErrorSink& sink) {
    const Value* list = readAlternatives(schema, "oneOf");
    if (list == nullptr) {
        return;
    }
    std::size_t matched = 0;
    for (const auto& subschema : *list) {
        if (eval.conforms(instance, subschema, path)) {
            ++matched;
        }
    }
    if (matched != 1) {
        sink.add(path, "oneOf",
                 fmt::format("Value must match exactly one of the {} schemas "
                             "in oneOf (matched {})",
                             list->size(), matched));
    }
}

void checkNot(Evaluation& eval, const Value& instance, const Value& schema,
              Path& path, ErrorSink& sink) {
    const Value* negated = member(schema, "not");
    if (negated == nullptr) {
        return;
    }

    bool matched = true;
    if (negated->is_object()) {
        matched = eval.conforms(instance, *negated, path);
    } else if (negated->is_array() && !negated->empty()) {
        for (const auto& subschema : *negated) {
            requireSchema(subschema, "not");
        }
        for (const auto& subschema : *negated) {
            if (!eval.conforms(instance, subschema, path)) {
                matched = false;
            }
        }
    } else {
        THROW_CONFIGURATION_ERROR(
            "not", "\"not\" must be a schema or a non-empty array of schemas, "
                   "got {}",
            negated->dump());
    }

    if (matched) {
        sink.add(path, "not", "Value must not match the schema in not");
    }
}
}  // namespace

void checkComposition(Evaluation& eval, const Value& instance,
                      const Value& schema, Path& path, ErrorSink& sink) {
    checkAllOf(eval, instance, schema, path, sink);
    checkAnyOf(eval, instance, schema, path, sink);
    checkOneOf(eval, instance, schema, path, sink);
    checkNot(eval, instance, schema, path, sink);
}

}  // namespace conform::schema::keywords
