//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_response_builder.cpp
// Purpose: GoogleTests for success/error envelope construction and the fallback envelope
//==========================================================================================================

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/ResponseBuilder.h"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;

TEST(ResponseBuilder, SuccessRoundTripPreservesIdAndResult) {
    const JSONValue result = parseJSON(R"({"tools":[{"name":"get_weather","inputSchema":{"type":"object"}}],"n":1.5})");
    const JSONRPCId ids[] = {JSONRPCId{std::string("abc")}, JSONRPCId{int64_t{42}}, JSONRPCId{2.5}, JSONRPCId{nullptr}};
    for (const auto& id : ids) {
        std::string err;
        auto resp = BuildSuccessResponse(id, result, err);
        ASSERT_NE(resp, nullptr) << err;

        JSONRPCResponse back;
        ASSERT_TRUE(back.Deserialize(resp->Serialize()));
        EXPECT_EQ(back.id, id);
        ASSERT_TRUE(back.result.has_value());
        EXPECT_TRUE(jsonEquals(back.result.value(), result));
        EXPECT_FALSE(back.IsError());
    }
}

TEST(ResponseBuilder, SuccessRejectsNonObjectResult) {
    std::string err;
    EXPECT_EQ(BuildSuccessResponse(JSONRPCId{int64_t{1}}, JSONValue(std::string("x")), err), nullptr);
    EXPECT_EQ(err, "result must be an object");
}

TEST(ResponseBuilder, SuccessRejectsInvalidUtf8) {
    JSONValue::Object o;
    o["text"] = makeJSON(JSONValue(std::string("bad \xFF")));
    std::string err;
    EXPECT_EQ(BuildSuccessResponse(JSONRPCId{int64_t{1}}, JSONValue(o), err), nullptr);
    EXPECT_NE(err.find("invalid UTF-8"), std::string::npos);
}

TEST(ResponseBuilder, ErrorEnvelopeShape) {
    std::string err;
    auto resp = BuildErrorResponse(JSONRPCId{std::string("r1")}, JSONRPCErrorCodes::MethodNotFound,
                                   "Method not found: foo/bar", err);
    ASSERT_NE(resp, nullptr) << err;
    EXPECT_EQ(resp->Serialize(),
              R"({"error":{"code":-32601,"message":"Method not found: foo/bar"},"id":"r1","jsonrpc":"2.0"})");
    auto typed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->category, errors::ErrorCategory::MethodNotFound);
}

TEST(ResponseBuilder, ErrorRejectsUnknownCode) {
    std::string err;
    EXPECT_EQ(BuildErrorResponse(JSONRPCId{nullptr}, 12345, "x", err), nullptr);
    EXPECT_FALSE(err.empty());
}

TEST(ResponseBuilder, FallbackUsedForUnrepresentableInputs) {
    auto resp = MakeErrorResponseOrFallback(JSONRPCId{std::numeric_limits<double>::infinity()},
                                            JSONRPCErrorCodes::ServerError, std::string("bad \xFF message"));
    ASSERT_NE(resp, nullptr);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(resp->id));

    JSONRPCResponse back;
    ASSERT_TRUE(back.Deserialize(resp->Serialize()));
    auto typed = errors::mcpErrorFromResponse(back);
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->code, JSONRPCErrorCodes::ServerError);
    EXPECT_EQ(typed->message, "bad \xEF\xBF\xBD message");
}

TEST(ResponseBuilder, FallbackSanitizesStringId) {
    auto resp = BuildFallbackErrorResponse(JSONRPCId{std::string("id\xC0")}, JSONRPCErrorCodes::InternalError, "m");
    ASSERT_TRUE(std::holds_alternative<std::string>(resp->id));
    EXPECT_TRUE(isValidUtf8(std::get<std::string>(resp->id)));
}
