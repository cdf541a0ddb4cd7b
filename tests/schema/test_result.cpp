#include <gtest/gtest.h>

#include "conform/schema/result.hpp"

namespace {

using conform::Value;
using namespace conform::schema;

TEST(ResultTest, RootPathIsEmptyPointer) { EXPECT_EQ(pathToString({}), ""); }

TEST(ResultTest, PathRendersAsJsonPointer) {
    Path path{"items", std::size_t{0}, "name"};
    EXPECT_EQ(pathToString(path), "/items/0/name");
}

TEST(ResultTest, PathEscapesPointerCharacters) {
    Path path{"a/b", "~c", std::size_t{12}};
    EXPECT_EQ(pathToString(path), "/a~1b/~0c/12");
}

TEST(ResultTest, ErrorToJson) {
    ValidationError error(Path{"a", std::size_t{1}}, "type",
                          "Type mismatch, expected string, got integer");
    EXPECT_EQ(error.toJson(),
              Value::parse(R"({"path": "/a/1", "keyword": "type",
                               "message": "Type mismatch, expected string, got integer"})"));
}

TEST(ResultTest, ResultToJsonKeepsOrder) {
    ValidationResult result{{Path{}, "required", "Required value is missing"},
                            {Path{"b"}, "enum", "Value 1 is not one of [2]"}};
    Value rendered = toJson(result);
    ASSERT_TRUE(rendered.is_array());
    ASSERT_EQ(rendered.size(), 2);
    EXPECT_EQ(rendered[0]["keyword"], "required");
    EXPECT_EQ(rendered[0]["path"], "");
    EXPECT_EQ(rendered[1]["path"], "/b");
    EXPECT_TRUE(toJson(ValidationResult{}).empty());
}

}  // namespace
