// ETHWALLET - JSON Value Tests
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include <gtest/gtest.h>
#include "ethwallet/core/json.h"

#include <stdexcept>

namespace ethwallet {
namespace {

TEST(JSONTest, BuildAndSerializeCompact) {
    JSONValue obj = JSONValue::MakeObject();
    obj["b"] = "text";
    obj["a"] = int64_t{42};
    obj["c"] = true;
    obj["d"] = nullptr;

    // Members are emitted in key order
    EXPECT_EQ(obj.ToJSON(), R"({"a":42,"b":"text","c":true,"d":null})");
}

TEST(JSONTest, ParseNested) {
    JSONValue v = JSONValue::Parse(R"({"list":[1,"two",{"x":false}],"n":-7})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue& list = v["list"];
    ASSERT_TRUE(list.IsArray());
    EXPECT_EQ(list.Size(), 3u);
    EXPECT_EQ(list[size_t{0}].GetInt(), 1);
    EXPECT_EQ(list[size_t{1}].GetString(), "two");
    EXPECT_FALSE(list[size_t{2}]["x"].GetBool(true));
    EXPECT_EQ(v["n"].GetInt(), -7);
}

TEST(JSONTest, MissingMembersReadAsNull) {
    JSONValue v = JSONValue::Parse(R"({"a":1})");
    const JSONValue& constView = v;
    EXPECT_TRUE(constView["missing"].IsNull());
    EXPECT_EQ(constView["missing"].GetString("fallback"), "fallback");
    EXPECT_FALSE(v.HasKey("missing"));
}

TEST(JSONTest, EscapesAndUnicode) {
    JSONValue v = JSONValue::Parse(R"(["line\nbreak","quote\"","é"])");
    EXPECT_EQ(v[size_t{0}].GetString(), "line\nbreak");
    EXPECT_EQ(v[size_t{1}].GetString(), "quote\"");
    EXPECT_EQ(v[size_t{2}].GetString(), "\xc3\xa9");
    EXPECT_EQ(JSONQuote("a\"b\n"), "\"a\\\"b\\n\"");
}

TEST(JSONTest, ReparseIsStable) {
    const std::string text = R"({"arr":[1,2,3],"name":"x","nested":{"k":"v"}})";
    EXPECT_EQ(JSONValue::Parse(text).ToJSON(), text);
}

TEST(JSONTest, WideIntegersKeepDigits) {
    const std::string text = R"({"big":1234567890123456789012,"neg":-98765432109876543210,"small":7})";
    JSONValue v = JSONValue::Parse(text);

    EXPECT_TRUE(v["big"].IsBigInt());
    EXPECT_TRUE(v["big"].IsNumber());
    EXPECT_EQ(v["big"].GetIntegerText(), "1234567890123456789012");
    EXPECT_EQ(v["neg"].GetIntegerText(), "-98765432109876543210");
    EXPECT_FALSE(v["small"].IsBigInt());
    EXPECT_TRUE(v["small"].GetIntegerText().empty());
    EXPECT_EQ(v.ToJSON(), text);

    // Neighbouring values share a double but not their digits
    EXPECT_NE(JSONValue::FromIntegerText("18446744073709551617"),
              JSONValue::FromIntegerText("18446744073709551616"));
    EXPECT_THROW(JSONValue::FromIntegerText("12a"), std::invalid_argument);
    EXPECT_THROW(JSONValue::FromIntegerText("-"), std::invalid_argument);
}

TEST(JSONTest, MalformedInput) {
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\":1} trailing").has_value());
    EXPECT_THROW(JSONValue::Parse("nope"), std::invalid_argument);
}

TEST(JSONTest, StringArrayEncoding) {
    EXPECT_EQ(ToJsonStringArray({"a", "b\"c"}), R"(["a","b\"c"])");
    EXPECT_EQ(ToJsonStringArray({}), "[]");
}

} // namespace
} // namespace ethwallet
