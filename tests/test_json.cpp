//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json.cpp
// Purpose: JSON parser and serializer tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "cdev/JSONValue.h"

using namespace cdev;

TEST(JSON, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"name":"USER","count":3,"ratio":0.5,"ok":true,"none":null,"list":[1,"two",false]})");
    ASSERT_TRUE(v.IsObject());

    const JSONValue* name = v.Find("name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(std::get<std::string>(name->value), "USER");

    const JSONValue* count = v.Find("count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(std::get<int64_t>(count->value), 3);

    const JSONValue* ratio = v.Find("ratio");
    ASSERT_NE(ratio, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(ratio->value), 0.5);

    EXPECT_TRUE(std::get<bool>(v.Find("ok")->value));
    EXPECT_TRUE(v.Find("none")->IsNull());

    const JSONValue* list = v.Find("list");
    ASSERT_TRUE(list && list->IsArray());
    const auto& arr = std::get<JSONValue::Array>(list->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(std::get<std::string>(arr[1]->value), "two");
    EXPECT_FALSE(std::get<bool>(arr[2]->value));

    EXPECT_EQ(v.Find("missing"), nullptr);
}

TEST(JSON, FindOnNonObjectReturnsNull) {
    JSONValue v = ParseJSON("[1,2]");
    EXPECT_EQ(v.Find("x"), nullptr);
}

TEST(JSON, DecodesEscapesAndUnicode) {
    JSONValue v = ParseJSON(R"("line1\r\nline2\t\"q\" é 😀")");
    ASSERT_TRUE(v.IsString());
    EXPECT_EQ(std::get<std::string>(v.value), "line1\r\nline2\t\"q\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSON, DecodesSurrogateEscapes) {
    EXPECT_EQ(std::get<std::string>(ParseJSON(R"("é😀")").value), "\xC3\xA9\xF0\x9F\x98\x80");
    // Unpaired halves decode to U+FFFD
    EXPECT_EQ(std::get<std::string>(ParseJSON(R"("a\uD83Db")").value), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(std::get<std::string>(ParseJSON(R"("\uD83DA")").value), "\xEF\xBF\xBD" "A");
    EXPECT_EQ(std::get<std::string>(ParseJSON(R"("\uDE00")").value), "\xEF\xBF\xBD");
}

TEST(JSON, SerializesEscapedStrings) {
    JSONValue v(std::string("a\"b\\c\r\n"));
    EXPECT_EQ(SerializeJSON(v), R"("a\"b\\c\r\n")");
}

TEST(JSON, MakeObjectSerializesMembers) {
    JSONValue body = MakeObject({{"action", "compile"}});
    EXPECT_EQ(SerializeJSON(body), R"({"action":"compile"})");
}

TEST(JSON, SerializedTextParsesBack) {
    const std::string text = R"({"content":"Class A {}\r\n","n":-12,"arr":[null,true]})";
    JSONValue v = ParseJSON(SerializeJSON(ParseJSON(text)));
    EXPECT_EQ(std::get<std::string>(v.Find("content")->value), "Class A {}\r\n");
    EXPECT_EQ(std::get<int64_t>(v.Find("n")->value), -12);
}

TEST(JSON, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON(R"({"a":})"), std::runtime_error);
    EXPECT_THROW(ParseJSON(R"("unterminated)"), std::runtime_error);
    EXPECT_THROW(ParseJSON("<html>error</html>"), std::runtime_error);
    EXPECT_THROW(ParseJSON(R"({"a":1} trailing)"), std::runtime_error);
    EXPECT_THROW(ParseJSON("-"), std::runtime_error);
}
