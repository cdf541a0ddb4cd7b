#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "conform/schema/validator.hpp"

namespace {

using conform::Value;
using namespace conform::schema;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class ObjectKeywordsTest : public ::testing::Test {
protected:
    Validator validator;
};

TEST_F(ObjectKeywordsTest, PropertiesValidateEachDeclaredName) {
    Value schema = {{"properties",
                     {{"name", {{"type", "string"}}},
                      {"age", {{"type", "integer"}, {"minimum", 0}}}}}};
    EXPECT_THAT(validator.validate(Value{{"name", "x"}, {"age", 3}}, schema),
                IsEmpty());
    EXPECT_THAT(validator.validate(Value::object(), schema), IsEmpty());

    auto errors =
        validator.validate(Value{{"name", 1}, {"age", -1}}, schema);
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].path, Path{"age"});
    EXPECT_EQ(errors[0].keyword, "minimum");
    EXPECT_EQ(errors[1].path, Path{"name"});
    EXPECT_EQ(errors[1].keyword, "type");
}

TEST_F(ObjectKeywordsTest, ExplicitNullPropertyCountsAsMissing) {
    Value schema = {{"properties", {{"a", {{"required", true}}}}}};
    auto errors = validator.validate(Value{{"a", nullptr}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "required");
    EXPECT_EQ(errors[0].path, Path{"a"});
}

TEST_F(ObjectKeywordsTest, PatternPropertiesAllMatchesApply) {
    Value schema = Value::parse(R"({
        "patternProperties": {
            "^x-": {"type": "string"},
            "num$": {"type": "number"}
        }
    })");
    auto errors = validator.validate(Value{{"x-num", "a"}, {"other", 1}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "type");
    EXPECT_EQ(errors[0].path, Path{"x-num"});
}

TEST_F(ObjectKeywordsTest, AdditionalPropertiesHonorsPatterns) {
    Value schema = Value::parse(R"({
        "properties": {"a": {}},
        "patternProperties": {"^x-": {}},
        "additionalProperties": false
    })");
    auto errors =
        validator.validate(Value{{"a", 1}, {"x-y", 2}, {"c", 3}, {"d", 4}}, schema);
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].path, Path{"c"});
    EXPECT_EQ(errors[1].path, Path{"d"});
    EXPECT_EQ(errors[0].message, "Additional property \"c\" is not allowed");
}

TEST_F(ObjectKeywordsTest, AdditionalPropertiesAllowList) {
    Value schema = {{"properties", {{"a", Value::object()}}},
                    {"additionalProperties", {"b"}}};
    auto errors =
        validator.validate(Value{{"a", 1}, {"b", 2}, {"c", 3}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "additionalProperties");
    EXPECT_EQ(errors[0].path, Path{"c"});
}

TEST_F(ObjectKeywordsTest, AdditionalPropertiesSchema) {
    Value schema = {{"additionalProperties", {{"type", "integer"}}}};
    auto errors = validator.validate(Value{{"a", 1}, {"b", "x"}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "type");
    EXPECT_EQ(errors[0].path, Path{"b"});
}

TEST_F(ObjectKeywordsTest, AdditionalPropertiesDefaultsToAllowed) {
    Value schema = {{"properties", {{"a", Value::object()}}}};
    EXPECT_THAT(validator.validate(Value{{"z", 1}}, schema), IsEmpty());
    EXPECT_THAT(validator.validate(Value{{"z", 1}},
                                   {{"additionalProperties", true}}),
                IsEmpty());
}

TEST_F(ObjectKeywordsTest, DependencyByName) {
    Value schema = {{"dependencies", {{"card", "billing"}}}};
    auto errors = validator.validate(Value{{"card", 1}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "dependencies");
    EXPECT_EQ(errors[0].message,
              "Property \"card\" requires property \"billing\"");
    EXPECT_THAT(validator.validate(Value{{"card", 1}, {"billing", 2}}, schema),
                IsEmpty());
}

TEST_F(ObjectKeywordsTest, DependencySchemaAppliesToWholeObject) {
    Value schema = Value::parse(R"({
        "dependencies": {"a": {"properties": {"b": {"required": true}}}}
    })");
    auto errors = validator.validate(Value{{"a", 1}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "required");
    EXPECT_EQ(errors[0].path, Path{"b"});
    EXPECT_THAT(validator.validate(Value{{"b", 1}}, schema), IsEmpty());
}

TEST_F(ObjectKeywordsTest, PropertyCountBounds) {
    Value schema = {{"minProperties", 1}, {"maxProperties", 2}};
    auto errors = validator.validate(Value::object(), schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "minProperties");
    EXPECT_THAT(errors[0].message, HasSubstr("Property count 0"));

    EXPECT_THAT(validator.validate(Value{{"a", 1}, {"b", 2}}, schema), IsEmpty());
    errors = validator.validate(Value{{"a", 1}, {"b", 2}, {"c", 3}}, schema);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].keyword, "maxProperties");
}

TEST_F(ObjectKeywordsTest, NonObjectsAreVacuous) {
    Value schema = {{"properties", {{"a", {{"required", true}}}}},
                    {"additionalProperties", false},
                    {"minProperties", 3}};
    EXPECT_THAT(validator.validate(Value{1, 2}, schema), IsEmpty());
    EXPECT_THAT(validator.validate(Value("a"), schema), IsEmpty());
}

TEST_F(ObjectKeywordsTest, MalformedKeywordsThrow) {
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value::object(), {{"properties", Value::array()}})),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value::object(), {{"patternProperties", {{"(", Value::object()}}}})),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value{{"a", 1}}, {{"additionalProperties", 1}})),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value{{"a", 1}}, {{"dependencies", {{"a", 1}}}})),
                 ConfigurationError);
    EXPECT_THROW(static_cast<void>(validator.validate(
                     Value::object(), {{"minProperties", "1"}})),
                 ConfigurationError);
}

}  // namespace
