#include "keywords.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/support.hpp"

namespace conform::schema::keywords {

namespace {
const Value kAbsent;

auto readMapping(const Value& schema, const char* keyword) -> const Value* {
    const Value* mapping = member(schema, keyword);
    if (mapping != nullptr && !mapping->is_object()) {
        THROW_CONFIGURATION_ERROR(keyword, "\"{}\" must be an object, got {}",
                                  keyword, mapping->type_name());
    }
    return mapping;
}

void checkProperties(Evaluation& eval, const Value& instance,
                     const Value& properties, Path& path, ErrorSink& sink) {
    for (const auto& [name, subschema] : properties.items()) {
        requireSchema(subschema, "properties");
        auto it = instance.find(name);
        PathScope scope(path, name);
        eval.validate(it == instance.end() ? kAbsent : *it, subschema, path,
                      sink);
    }
}

void checkPatternProperties(Evaluation& eval, const Value& instance,
                            const Value& patterns, Path& path,
                            ErrorSink& sink) {
    for (const auto& [source, subschema] : patterns.items()) {
        requireSchema(subschema, "patternProperties");
        const std::regex& pattern = eval.regex(source, "patternProperties");
        for (const auto& [key, item] : instance.items()) {
            if (std::regex_search(key, pattern)) {
                PathScope scope(path, key);
                eval.validate(item, subschema, path, sink);
            }
        }
    }
}

// Keys covered neither by "properties" nor by a "patternProperties" regex.
auto residualKeys(Evaluation& eval, const Value& instance,
                  const Value* properties,
                  const Value* patterns) -> std::vector<std::string> {
    std::vector<std::string> residual;
    for (const auto& [key, item] : instance.items()) {
        if (properties != nullptr && properties->contains(key)) {
            continue;
        }
        bool matched = false;
        if (patterns != nullptr) {
            for (const auto& [source, subschema] : patterns->items()) {
                if (std::regex_search(key,
                                      eval.regex(source, "patternProperties"))) {
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            residual.push_back(key);
        }
    }
    return residual;
}

void checkAdditionalProperties(Evaluation& eval, const Value& instance,
                               const Value& policy, const Value* properties,
                               const Value* patterns, Path& path,
                               ErrorSink& sink) {
    if (policy.is_boolean() && policy.get<bool>()) {
        return;
    }
    if (!policy.is_boolean() && !policy.is_array() && !policy.is_object()) {
        THROW_CONFIGURATION_ERROR(
            "additionalProperties",
            "\"additionalProperties\" must be a boolean, an array of names or "
            "a schema, got {}",
            policy.dump());
    }
    if (policy.is_array()) {
        for (const auto& name : policy) {
            if (!name.is_string()) {
                THROW_CONFIGURATION_ERROR(
                    "additionalProperties",
                    "\"additionalProperties\" names must be strings, got {}",
                    name.dump());
            }
        }
    }

    for (const auto& key : residualKeys(eval, instance, properties, patterns)) {
        if (sink.full()) {
            return;
        }
        PathScope scope(path, key);
        if (policy.is_object()) {
            eval.validate(instance.at(key), policy, path, sink);
        } else if (policy.is_boolean() ||
                   std::find(policy.begin(), policy.end(), Value(key)) ==
                       policy.end()) {
            sink.add(path, "additionalProperties",
                     fmt::format("Additional property \"{}\" is not allowed",
                                 key));
        }
    }
}

void checkDependencies(Evaluation& eval, const Value& instance,
                       const Value& dependencies, Path& path,
                       ErrorSink& sink) {
    for (const auto& [trigger, dependency] : dependencies.items()) {
        if (!instance.contains(trigger)) {
            continue;
        }

        if (dependency.is_object()) {
            eval.validate(instance, dependency, path, sink);
            continue;
        }

        std::vector<std::string> names;
        if (dependency.is_string()) {
            names.push_back(dependency.get<std::string>());
        } else if (dependency.is_array()) {
            for (const auto& name : dependency) {
                if (!name.is_string()) {
                    THROW_CONFIGURATION_ERROR(
                        "dependencies",
                        "Dependency names of \"{}\" must be strings, got {}",
                        trigger, name.dump());
                }
                names.push_back(name.get<std::string>());
            }
        } else {
            THROW_CONFIGURATION_ERROR(
                "dependencies",
                "Dependency of \"{}\" must be a name, an array of names or a "
                "schema, got {}",
                trigger, dependency.dump());
        }

        for (const auto& name : names) {
            if (!instance.contains(name)) {
                sink.add(path, "dependencies",
                         fmt::format("Property \"{}\" requires property \"{}\"",
                                     trigger, name));
            }
        }
    }
}
}  // namespace

void checkObject(Evaluation& eval, const Value& instance, const Value& schema,
                 Path& path, ErrorSink& sink) {
    const Value* properties = readMapping(schema, "properties");
    const Value* patterns = readMapping(schema, "patternProperties");

    if (properties != nullptr) {
        checkProperties(eval, instance, *properties, path, sink);
    }
    if (patterns != nullptr) {
        checkPatternProperties(eval, instance, *patterns, path, sink);
    }
    if (const Value* policy = member(schema, "additionalProperties")) {
        checkAdditionalProperties(eval, instance, *policy, properties,
                                  patterns, path, sink);
    }
    if (const Value* dependencies = readMapping(schema, "dependencies")) {
        checkDependencies(eval, instance, *dependencies, path, sink);
    }

    checkCount(instance.size(), schema, "minProperties", "maxProperties",
               "Property count", path, sink);
}

}  // namespace conform::schema::keywords
