//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures, HTTP status mapping and JSON-RPC error helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/errors/Errors.h"

using namespace mcpgw;

TEST(Errors, CategoryMapping) {
    using mcpgw::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::Parse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::Protocol);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::MethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::InvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::Build);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerError), ErrorCategory::Domain);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
    EXPECT_FALSE(errors::isKnownErrorCode(-32001));
}

TEST(Errors, HttpStatusForCategory) {
    using mcpgw::errors::ErrorCategory;
    EXPECT_EQ(errors::httpStatusForCategory(ErrorCategory::Transport), 400);
    EXPECT_EQ(errors::httpStatusForCategory(ErrorCategory::Auth), 401);
    EXPECT_EQ(errors::httpStatusForCategory(ErrorCategory::Unknown), 500);
    // Protocol-level failures are carried in a 200 response
    EXPECT_EQ(errors::httpStatusForCategory(ErrorCategory::Parse), 200);
    EXPECT_EQ(errors::httpStatusForCategory(ErrorCategory::Domain), 200);
}

TEST(Errors, ErrorValueRoundTrip) {
    auto e = errors::makeError(JSONRPCErrorCodes::ServerError, "Tool 'x' not found");
    JSONValue v = errors::makeErrorValue(e);
    auto back = errors::mcpErrorFromErrorValue(v);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, JSONRPCErrorCodes::ServerError);
    EXPECT_EQ(back->message, "Tool 'x' not found");
    EXPECT_EQ(back->category, errors::ErrorCategory::Domain);
    EXPECT_FALSE(back->data.has_value());
}

TEST(Errors, MalformedErrorObject) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(parseJSON(R"({"code":"x","message":"m"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(parseJSON(R"({"message":"m"})")).has_value());
}

TEST(Errors, MakeErrorResponseEchoesId) {
    auto resp = errors::makeErrorResponse(JSONRPCId{int64_t{9}}, errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error: x"));
    ASSERT_TRUE(resp->IsError());
    ASSERT_TRUE(std::holds_alternative<int64_t>(resp->id));
    EXPECT_EQ(std::get<int64_t>(resp->id), 9);
    auto typed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->code, JSONRPCErrorCodes::ParseError);
}
