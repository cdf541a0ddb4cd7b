#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "conform/schema/validator.hpp"

namespace {

using conform::Value;
using namespace conform::schema;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class CompositionTest : public ::testing::Test {
protected:
    Validator validator;
};

TEST_F(CompositionTest, AllOfMergesEveryFailure) {
    Value schema = Value::parse(R"({"allOf": [{"minLength": 5}, {"pattern": "^z"}]})");
    auto errors = validator.validate(Value("abc"), schema);
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].keyword, "minLength");
    EXPECT_EQ(errors[1].keyword, "pattern");
}

TEST_F(CompositionTest, AnyOfReportsOneAggregateError) {
    Value schema = Value::parse(
        R"({"anyOf": [{"type": "string"}, {"type": "integer", "minimum": 10}]})");
    EXPECT_THAT(validator.validate(Value(12), schema), IsEmpty());
    auto errors = validator.validate(Value(5), schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "anyOf");
    EXPECT_EQ(errors[0].message,
              "Value does not match any of the 2 schemas in anyOf");
}

TEST_F(CompositionTest, OneOfRequiresExactlyOneMatch) {
    Value schema = Value::parse(
        R"({"oneOf": [{"type": "string"}, {"type": "number"}]})");
    EXPECT_THAT(validator.validate(Value(1), schema), IsEmpty());

    auto errors = validator.validate(Value(true), schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "oneOf");
    EXPECT_THAT(errors[0].message, HasSubstr("matched 0"));
}

TEST_F(CompositionTest, NotWithSchemaList) {
    Value schema = Value::parse(R"({"not": [{"type": "string"}, {"minLength": 2}]})");
    auto errors = validator.validate(Value("abc"), schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "not");
    EXPECT_THAT(validator.validate(Value("a"), schema), IsEmpty());
}

TEST_F(CompositionTest, NestedPathIsKept) {
    Value schema = Value::parse(R"({
        "properties": {
            "a": {"anyOf": [{"type": "string"}, {"type": "boolean"}]}
        }
    })");
    auto errors = validator.validate(Value{{"a", 1}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "anyOf");
    EXPECT_EQ(errors[0].path, Path{"a"});
}

TEST_F(CompositionTest, TrialEvaluationsDoNotLeakErrors) {
    Value schema = Value::parse(R"({
        "type": "integer",
        "oneOf": [{"minimum": 100}, {"maximum": 0}, {"divisibleBy": 7}]
    })");
    auto errors = validator.validate(Value(50), schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "oneOf");
}

TEST_F(CompositionTest, NullSkipsOperatorsUnlessTyped) {
    Value schema = Value::parse(R"({"anyOf": [{"type": "string"}]})");
    EXPECT_THAT(validator.validate(Value(), schema), IsEmpty());
}

TEST_F(CompositionTest, MalformedListsThrow) {
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value(1), {{"allOf", Value::object()}})),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value(1), {{"anyOf", Value::array()}})),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value(1), Value::parse(R"({"oneOf": [{}, 3]})"))),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(Value(1), {{"not", "x"}})),
                 ConfigurationError);
}

TEST_F(CompositionTest, EveryAlternativeIsChecked) {
    Value anyOf = Value::parse(
        R"({"anyOf": [{"type": "number"}, {"type": "strnig"}]})");
    EXPECT_THROW(static_cast<void>(validator.validate(Value(5), anyOf)),
                 ConfigurationError);

    Value negated = Value::parse(
        R"({"not": [{"type": "number"}, {"type": "strnig"}]})");
    EXPECT_THROW(static_cast<void>(validator.validate(Value("x"), negated)),
                 ConfigurationError);
}

TEST_F(CompositionTest, MalformedListNamesKeyword) {
    try {
        static_cast<void>(
            validator.validate(Value(1), {{"anyOf", Value::array()}}));
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.keyword(), "anyOf");
    }
}

}  // namespace
