//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: GoogleTests for the strict JSON parser, serializer, UTF-8 helpers and JSON-RPC envelopes
//==========================================================================================================

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include "mcpgw/JSONRPCTypes.h"

using namespace mcpgw;

TEST(JSONParser, ParsesScalarsAndContainers) {
    JSONValue v = parseJSON(R"({"a":1,"b":-2.5,"c":"x","d":[true,false,null],"e":{}})");
    ASSERT_TRUE(v.isObject());
    EXPECT_EQ(std::get<int64_t>(findMember(v, "a")->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(findMember(v, "b")->value), -2.5);
    EXPECT_EQ(std::get<std::string>(findMember(v, "c")->value), "x");
    const auto& arr = std::get<JSONValue::Array>(findMember(v, "d")->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_FALSE(std::get<bool>(arr[1]->value));
    EXPECT_TRUE(arr[2]->isNull());
    EXPECT_TRUE(findMember(v, "e")->isObject());
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = parseJSON(R"("a\"b\\c\/\n\u00e9\ud83d\ude00")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "a\"b\\c/\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    const char* bad[] = {
        "{", "", "[1,2", "{\"a\":}", "tru", "nul", "01", "1.", "-", "1e", "[1,]",
        "{\"a\":1,}", "\"unterminated", "\"bad \\x escape\"", "{} extra", "\"\\ud800\"",
        "NaN", "'single'"
    };
    for (const char* text : bad) {
        JSONValue out;
        std::string err;
        EXPECT_FALSE(tryParseJSON(text, out, err)) << text;
        EXPECT_FALSE(err.empty()) << text;
    }
}

TEST(JSONParser, RejectsRawControlCharacterInString) {
    std::string text = "\"a";
    text.push_back('\x01');
    text += "\"";
    EXPECT_THROW(parseJSON(text), JSONParseError);
}

TEST(JSONParser, LargeIntegerFallsBackToDouble) {
    JSONValue v = parseJSON("123456789012345678901234567890");
    ASSERT_TRUE(std::holds_alternative<double>(v.value));
    EXPECT_GT(std::get<double>(v.value), 1e29);

    JSONValue i = parseJSON("-9223372036854775808");
    ASSERT_TRUE(i.isInteger());
    EXPECT_EQ(std::get<int64_t>(i.value), std::numeric_limits<int64_t>::min());
}

TEST(JSONParser, NestingBeyondBoundIsRejected) {
    std::string deep(kMaxJSONParseDepth + 1, '[');
    deep += std::string(kMaxJSONParseDepth + 1, ']');
    JSONValue out;
    std::string err;
    EXPECT_FALSE(tryParseJSON(deep, out, err));

    std::string ok(kMaxJSONParseDepth, '[');
    ok += std::string(kMaxJSONParseDepth, ']');
    EXPECT_TRUE(tryParseJSON(ok, out, err)) << err;
}

TEST(JSONSerializer, SortsKeysAndFormatsNumbers) {
    JSONValue v = parseJSON(R"({"b":1,"a":[0.5,2.0,"\u0001"],"c":null})");
    EXPECT_EQ(serializeJSONValue(v), R"({"a":[0.5,2.0,"\u0001"],"b":1,"c":null})");
    EXPECT_EQ(formatJSONNumber(120.0), "120");
    EXPECT_EQ(formatJSONNumber(0.1), "0.1");
}

TEST(JSONSerializer, PrettyPrintUsesTwoSpaces) {
    JSONValue v = parseJSON(R"({"temp":21,"sky":"clear"})");
    EXPECT_EQ(serializeJSONValuePretty(v), "{\n  \"sky\": \"clear\",\n  \"temp\": 21\n}");
}

TEST(JSONValueHelpers, StructuralEquality) {
    EXPECT_TRUE(jsonEquals(parseJSON(R"({"a":[1,{"b":2}]})"), parseJSON(R"({"a":[1,{"b":2}]})")));
    EXPECT_FALSE(jsonEquals(parseJSON("1"), parseJSON("1.0")));
    EXPECT_FALSE(jsonEquals(parseJSON("[1,2]"), parseJSON("[2,1]")));
}

TEST(Utf8, ValidationAndSanitizing) {
    EXPECT_TRUE(isValidUtf8("plain"));
    EXPECT_TRUE(isValidUtf8("\xE2\x82\xAC"));
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));          // overlong
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(isValidUtf8("\xE2\x82"));          // truncated
    EXPECT_EQ(sanitizeUtf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
}

TEST(JSONRPCRequestShape, AcceptsValidEnvelope) {
    JSONRPCRequest req;
    std::string err;
    ASSERT_TRUE(req.FromJSONValue(parseJSON(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})"), err)) << err;
    EXPECT_EQ(req.method, "tools/list");
    ASSERT_TRUE(std::holds_alternative<int64_t>(req.id));
    EXPECT_EQ(std::get<int64_t>(req.id), 7);
    EXPECT_TRUE(req.params.isObject());
}

TEST(JSONRPCRequestShape, RejectsWrongShapes) {
    JSONRPCRequest req;
    std::string err;
    EXPECT_FALSE(req.FromJSONValue(parseJSON("[1]"), err));
    EXPECT_EQ(err, "request must be a JSON object");
    EXPECT_FALSE(req.FromJSONValue(parseJSON(R"({"jsonrpc":"2.0","id":1,"method":5})"), err));
    EXPECT_EQ(err, "method must be a string");
    EXPECT_FALSE(req.FromJSONValue(parseJSON(R"({"jsonrpc":"2.0","id":[1],"method":"x"})"), err));
    EXPECT_EQ(err, "id must be a string, number, or null");
}

TEST(JSONRPCResponseShape, DeserializeRequiresResultOrError) {
    JSONRPCResponse r;
    EXPECT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":"x","result":{}})"));
    EXPECT_FALSE(r.IsError());
    EXPECT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"m"}})"));
    EXPECT_TRUE(r.IsError());
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{}})"));
}
