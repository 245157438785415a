//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: JSONValue parser, serializer and comparison tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolwire/JSONTypes.h"
#include <limits>
#include <stdexcept>
#include <string>

using namespace toolwire;

TEST(JSONValue, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":-3}})");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_TRUE(a != nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(arr[4]->isNull());
    const JSONValue* b = FindMember(v, "b");
    ASSERT_TRUE(b != nullptr);
    EXPECT_EQ(GetIntMember(*b, "c").value_or(0), -3);
}

TEST(JSONValue, RejectsTrailingData) {
    EXPECT_THROW(ParseJSON(R"({"a":1} x)"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2]]"), std::runtime_error);
    EXPECT_NO_THROW(ParseJSON("  {\"a\":1}  \n"));
}

TEST(JSONValue, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{'a':1}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"unterminated"), std::runtime_error);
    EXPECT_THROW(ParseJSON("01.e"), std::runtime_error);
}

TEST(JSONValue, LimitsNestingDepth) {
    std::string ok(100, '[');
    ok += std::string(100, ']');
    EXPECT_NO_THROW(ParseJSON(ok));

    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);
}

TEST(JSONValue, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("tab\tquote\" \u00e9 \ud83d\ude00")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "tab\tquote\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONValue, SerializesCompactly) {
    JSONValue::Array arr;
    arr.push_back(std::make_shared<JSONValue>(static_cast<int64_t>(1)));
    arr.push_back(std::make_shared<JSONValue>(2.0));
    arr.push_back(std::make_shared<JSONValue>(1.5));
    arr.push_back(std::make_shared<JSONValue>("a\"b\n"));
    arr.push_back(std::make_shared<JSONValue>(nullptr));
    EXPECT_EQ(SerializeJSON(JSONValue{arr}), "[1,2.0,1.5,\"a\\\"b\\n\",null]");

    JSONValue::Object obj;
    obj["k"] = std::make_shared<JSONValue>(false);
    EXPECT_EQ(SerializeJSON(JSONValue{obj}), "{\"k\":false}");
}

TEST(JSONValue, NonFiniteDoublesSerializeAsNull) {
    EXPECT_EQ(SerializeJSON(JSONValue{std::numeric_limits<double>::infinity()}), "null");
    EXPECT_EQ(SerializeJSON(JSONValue{std::numeric_limits<double>::quiet_NaN()}), "null");
}

TEST(JSONValue, SerializedOutputReparsesEqual) {
    const std::string text = R"({"name":"echo","nested":{"list":[1,{"x":null}],"flag":true},"ratio":0.25})";
    JSONValue v = ParseJSON(text);
    JSONValue again = ParseJSON(SerializeJSON(v));
    EXPECT_TRUE(JSONEquals(v, again));
}

TEST(JSONValue, EqualityTreatsIntAndDoubleNumerically) {
    EXPECT_TRUE(JSONEquals(ParseJSON("1"), ParseJSON("1.0")));
    EXPECT_FALSE(JSONEquals(ParseJSON("1"), ParseJSON("1.5")));
    EXPECT_TRUE(JSONEquals(ParseJSON(R"({"a":1,"b":[true]})"), ParseJSON(R"({"b":[true],"a":1})")));
    EXPECT_FALSE(JSONEquals(ParseJSON(R"({"a":1})"), ParseJSON(R"({"a":1,"b":2})")));
    EXPECT_FALSE(JSONEquals(ParseJSON("\"1\""), ParseJSON("1")));
}

TEST(JSONValue, MemberHelpers) {
    JSONValue v = ParseJSON(R"({"s":"text","i":7,"d":3.0,"f":3.5})");
    EXPECT_EQ(GetStringMember(v, "s").value_or(""), "text");
    EXPECT_FALSE(GetStringMember(v, "i").has_value());
    EXPECT_EQ(GetIntMember(v, "i").value_or(0), 7);
    EXPECT_EQ(GetIntMember(v, "d").value_or(0), 3);
    EXPECT_FALSE(GetIntMember(v, "f").has_value());
    EXPECT_TRUE(FindMember(v, "missing") == nullptr);
    EXPECT_TRUE(FindMember(ParseJSON("[1]"), "s") == nullptr);
}
