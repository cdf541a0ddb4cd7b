#include "keywords.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "conform/schema/exception.hpp"
#include "conform/schema/keywords/support.hpp"

namespace conform::schema::keywords {

namespace {
constexpr std::array<std::string_view, 8> kTypeNames = {
    "string", "number", "integer", "boolean",
    "array",  "object", "null",    "any"};

auto knownType(std::string_view name) noexcept -> bool {
    return std::find(kTypeNames.begin(), kTypeNames.end(), name) !=
           kTypeNames.end();
}

// Type names declared by the schema node; empty when `type` is absent.
auto declaredTypes(const Value& schema) -> std::vector<std::string_view> {
    std::vector<std::string_view> names;
    const Value* type = member(schema, "type");
    if (type == nullptr) {
        return names;
    }

    auto addName = [&](const Value& name) {
        if (!name.is_string() ||
            !knownType(name.get_ref<const std::string&>())) {
            THROW_CONFIGURATION_ERROR("type", "Unknown type {}", name.dump());
        }
        names.emplace_back(name.get_ref<const std::string&>());
    };

    if (type->is_array()) {
        if (type->empty()) {
            THROW_CONFIGURATION_ERROR("type",
                                      "\"type\" must not be an empty array");
        }
        for (const auto& name : *type) {
            addName(name);
        }
    } else {
        addName(*type);
    }
    return names;
}

auto matchesType(const Value& instance, std::string_view type) -> bool {
    if (type == "any")
        return true;
    if (type == "string")
        return instance.is_string();
    if (type == "number")
        return instance.is_number();
    if (type == "integer")
        return value::isIntegral(instance);
    if (type == "boolean")
        return instance.is_boolean();
    if (type == "array")
        return value::kindOf(instance) == value::Kind::Sequence;
    if (type == "object")
        return instance.is_object();
    if (type == "null")
        return value::kindOf(instance) == value::Kind::Null;
    return false;
}
}  // namespace

auto checkNullRequired(const Value& instance, const Value& schema,
                       const Path& path, ErrorSink& sink) -> bool {
    const bool required = readFlag(schema, "required");
    const auto types = declaredTypes(schema);

    if (value::kindOf(instance) != value::Kind::Null) {
        return false;
    }
    if (std::find(types.begin(), types.end(), "null") != types.end()) {
        return false;
    }

    if (required) {
        if (!path.empty() && std::holds_alternative<std::string>(path.back())) {
            sink.add(path, "required",
                     fmt::format("Required property \"{}\" is missing",
                                 std::get<std::string>(path.back())));
        } else {
            sink.add(path, "required", "Required value is missing");
        }
    }
    return true;
}

void checkType(const Value& instance, const Value& schema, const Path& path,
               ErrorSink& sink) {
    const auto types = declaredTypes(schema);
    if (types.empty()) {
        return;
    }

    for (const auto type : types) {
        if (matchesType(instance, type)) {
            return;
        }
    }

    const std::string_view actual = value::describeKind(instance);
    if (types.size() == 1) {
        sink.add(path, "type",
                 fmt::format("Type mismatch, expected {}, got {}",
                             types.front(), actual));
    } else {
        sink.add(path, "type",
                 fmt::format("Type mismatch, expected one of [{}], got {}",
                             fmt::join(types, ", "), actual));
    }
}

void checkEnum(const Value& instance, const Value& schema, const Path& path,
               ErrorSink& sink) {
    const Value* options = readList(schema, "enum");
    if (options == nullptr) {
        return;
    }

    for (const auto& option : *options) {
        if (value::deepEquals(instance, option)) {
            return;
        }
    }
    sink.add(path, "enum",
             fmt::format("Value {} is not one of {}", instance.dump(),
                         options->dump()));
}

}  // namespace conform::schema::keywords
