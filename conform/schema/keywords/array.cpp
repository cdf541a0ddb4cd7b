#include "keywords.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/support.hpp"

namespace conform::schema::keywords {

namespace {
// Elements past a positional "items" list. A missing "additionalItems"
// rejects them.
void checkAdditionalItems(Evaluation& eval, const Value& instance,
                          std::size_t first, const Value* policy, Path& path,
                          ErrorSink& sink) {
    if (policy != nullptr && !policy->is_boolean() && !policy->is_object()) {
        THROW_CONFIGURATION_ERROR(
            "additionalItems",
            "\"additionalItems\" must be a boolean or a schema, got {}",
            policy->dump());
    }
    if (policy != nullptr && policy->is_boolean() && policy->get<bool>()) {
        return;
    }

    for (std::size_t i = first; i < instance.size() && !sink.full(); ++i) {
        PathScope scope(path, i);
        if (policy != nullptr && policy->is_object()) {
            eval.validate(instance[i], *policy, path, sink);
        } else {
            sink.add(path, "additionalItems",
                     fmt::format("Additional item at index {} is not allowed, "
                                 "at most {} items are described",
                                 i, first));
        }
    }
}

void checkItems(Evaluation& eval, const Value& instance, const Value& schema,
                Path& path, ErrorSink& sink) {
    const Value* items = member(schema, "items");
    if (items == nullptr) {
        return;
    }

    if (items->is_object()) {
        for (std::size_t i = 0; i < instance.size() && !sink.full(); ++i) {
            PathScope scope(path, i);
            eval.validate(instance[i], *items, path, sink);
        }
        return;
    }

    if (!items->is_array()) {
        THROW_CONFIGURATION_ERROR(
            "items", "\"items\" must be a schema or an array of schemas, got {}",
            items->dump());
    }

    const std::size_t positional = std::min(items->size(), instance.size());
    for (std::size_t i = 0; i < items->size(); ++i) {
        requireSchema((*items)[i], "items");
    }
    for (std::size_t i = 0; i < positional && !sink.full(); ++i) {
        PathScope scope(path, i);
        eval.validate(instance[i], (*items)[i], path, sink);
    }
    checkAdditionalItems(eval, instance, items->size(),
                         member(schema, "additionalItems"), path, sink);
}

void checkUniqueItems(const Value& instance, const Value& schema,
                      const Path& path, ErrorSink& sink) {
    if (!readFlag(schema, "uniqueItems")) {
        return;
    }
    // One error per repeated element, naming its first earlier equal.
    for (std::size_t j = 1; j < instance.size() && !sink.full(); ++j) {
        for (std::size_t i = 0; i < j; ++i) {
            if (value::deepEquals(instance[i], instance[j])) {
                sink.add(path, "uniqueItems",
                         fmt::format("Array item at index {} duplicates the "
                                     "item at index {}",
                                     j, i));
                break;
            }
        }
    }
}
}  // namespace

void checkArray(Evaluation& eval, const Value& instance, const Value& schema,
                Path& path, ErrorSink& sink) {
    if (instance.is_binary()) {
        checkArray(eval, value::asSequence(instance), schema, path, sink);
        return;
    }

    checkItems(eval, instance, schema, path, sink);
    checkCount(instance.size(), schema, "minItems", "maxItems", "Array size",
               path, sink);
    checkUniqueItems(instance, schema, path, sink);
}

}  // namespace conform::schema::keywords
