#include <layercast/json/json.h>
#include <gtest/gtest.h>

#include <limits>
#include <string>

using namespace layercast::json;

TEST(JsonTest, ParsesScalars) {
    EXPECT_TRUE(parse("null").value.is_null());
    EXPECT_TRUE(parse("true").value.as_bool());
    EXPECT_DOUBLE_EQ(parse("-12.5e1").value.as_number(), -125.0);
    EXPECT_EQ(parse("\"hi\"").value.as_string(), "hi");
}

TEST(JsonTest, ParsesNestedStructures) {
    const ParseResult result = parse(R"({"a": [1, 2, {"b": "c"}], "d": {}})");
    ASSERT_TRUE(result.ok) << result.error;

    const Value* a = result.value.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->is_array());
    ASSERT_EQ(a->size(), 3u);
    EXPECT_EQ(a->items()[2].find("b")->as_string(), "c");
    EXPECT_TRUE(result.value.find("d")->is_object());
    EXPECT_FALSE(result.value.contains("missing"));
}

TEST(JsonTest, DecodesEscapesAndSurrogatePairs) {
    const ParseResult result = parse(R"("line\nbreak \u00e9 \ud83d\ude00")");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.value.as_string(), "line\nbreak \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonTest, ReportsErrorOffset) {
    const ParseResult result = parse(R"({"a": 1,})");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(result.error_offset, 8u);
}

TEST(JsonTest, RejectsTrailingCharacters) {
    const ParseResult result = parse("[1] x");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "Unexpected trailing characters");
}

TEST(JsonTest, ObjectsKeepInsertionOrder) {
    Value object = Value::object();
    object.set("zeta", 1);
    object.set("alpha", 2);
    object.set("zeta", 3);

    ASSERT_EQ(object.members().size(), 2u);
    EXPECT_EQ(object.members()[0].first, "zeta");
    EXPECT_DOUBLE_EQ(object.members()[0].second.as_number(), 3.0);
    EXPECT_EQ(serialize(object), R"({"zeta":3,"alpha":2})");
}

TEST(JsonTest, SerializesIndentedOutput) {
    Value object;
    object.set("name", "div");
    Value list;
    list.push_back(true);
    list.push_back(nullptr);
    object.set("list", list);

    EXPECT_EQ(serialize(object, 2),
              "{\n  \"name\": \"div\",\n  \"list\": [\n    true,\n    null\n  ]\n}");
}

TEST(JsonTest, FormatsNumbers) {
    EXPECT_EQ(serialize(Value(42)), "42");
    EXPECT_EQ(serialize(Value(0.25)), "0.25");
    EXPECT_EQ(serialize(Value(std::numeric_limits<double>::infinity())), "null");
}

TEST(JsonTest, QuoteEscapesControlCharacters) {
    EXPECT_EQ(quote("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(quote(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(JsonTest, FallbackAccessors) {
    const Value text("x");
    EXPECT_DOUBLE_EQ(text.as_number(7), 7.0);
    EXPECT_FALSE(text.as_bool());
    EXPECT_EQ(Value(3).as_string(), "");
    EXPECT_EQ(text.find("a"), nullptr);
}
