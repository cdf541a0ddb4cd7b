#include "value.hpp"

#include "conform/value/decimal.hpp"

namespace conform::value {

auto kindOf(const Value& value) noexcept -> Kind {
    switch (value.type()) {
        case Value::value_t::boolean:
            return Kind::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return Kind::Number;
        case Value::value_t::string:
            return Kind::String;
        case Value::value_t::array:
        case Value::value_t::binary:
            return Kind::Sequence;
        case Value::value_t::object:
            return Kind::Mapping;
        case Value::value_t::null:
        case Value::value_t::discarded:
        default:
            return Kind::Null;
    }
}

auto kindName(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::Null:
            return "null";
        case Kind::Boolean:
            return "boolean";
        case Kind::Number:
            return "number";
        case Kind::String:
            return "string";
        case Kind::Sequence:
            return "array";
        case Kind::Mapping:
            return "object";
    }
    return "unknown";
}

auto describeKind(const Value& value) -> std::string_view {
    if (isIntegral(value)) {
        return "integer";
    }
    return kindName(kindOf(value));
}

auto isIntegral(const Value& value) -> bool {
    if (value.is_number_integer()) {
        return true;
    }
    if (!value.is_number_float()) {
        return false;
    }
    return Decimal::fromValue(value).isIntegral();
}

auto deepEquals(const Value& lhs, const Value& rhs) -> bool {
    const Kind kind = kindOf(lhs);
    if (kind != kindOf(rhs)) {
        return false;
    }

    switch (kind) {
        case Kind::Null:
            return true;
        case Kind::Boolean:
            return lhs.get<bool>() == rhs.get<bool>();
        case Kind::Number:
            return Decimal::fromValue(lhs) == Decimal::fromValue(rhs);
        case Kind::String:
            return lhs.get_ref<const std::string&>() ==
                   rhs.get_ref<const std::string&>();
        case Kind::Sequence: {
            if (lhs.is_binary() || rhs.is_binary()) {
                return deepEquals(asSequence(lhs), asSequence(rhs));
            }
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!deepEquals(lhs[i], rhs[i])) {
                    return false;
                }
            }
            return true;
        }
        case Kind::Mapping: {
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (const auto& [key, item] : lhs.items()) {
                auto other = rhs.find(key);
                if (other == rhs.end() || !deepEquals(item, *other)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

auto asSequence(const Value& value) -> Value {
    if (!value.is_binary()) {
        return value;
    }
    Value bytes = Value::array();
    for (const auto byte : value.get_binary()) {
        bytes.push_back(byte);
    }
    return bytes;
}

auto codePointLength(std::string_view text) noexcept -> std::size_t {
    std::size_t count = 0;
    for (const char c : text) {
        // Continuation bytes look like 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}  // namespace conform::value
