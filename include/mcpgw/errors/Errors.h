//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, gateway error taxonomy and JSON-RPC/HTTP mapping helpers
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {
namespace errors {

// Gateway error taxonomy. Transport and Auth never reach the dispatcher; the rest map to JSON-RPC codes.
enum class ErrorCategory {
    Transport,
    Auth,
    Parse,
    Protocol,
    MethodNotFound,
    InvalidParams,
    Domain,
    Build,
    Unknown
};

// Typed error representation used across the gateway.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::Parse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::Protocol;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::MethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::InvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::Build;
        case JSONRPCErrorCodes::ServerError: return ErrorCategory::Domain;
        default: return ErrorCategory::Unknown;
    }
}

// True for the codes the gateway is allowed to emit in an error envelope.
inline bool isKnownErrorCode(int code) {
    return errorCategoryFromCode(code) != ErrorCategory::Unknown;
}

// HTTP status used by the transport for a failure of the given category.
// Protocol-level failures travel inside a 200 response; only the transport's own
// rejections and unexpected exceptions change the status line.
inline int httpStatusForCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Transport: return 400;
        case ErrorCategory::Auth: return 401;
        case ErrorCategory::Unknown: return 500;
        default: return 200;
    }
}

// Build a McpError with the category derived from the code.
inline McpError makeError(int code, std::string message) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = findMember(errVal, "code");
    const JSONValue* msg = findMember(errVal, "message");
    if (code == nullptr || msg == nullptr) {
        return std::nullopt;
    }
    if (!code->isInteger() || !msg->isString()) {
        return std::nullopt;
    }
    McpError e = makeError(static_cast<int>(std::get<int64_t>(code->value)), std::get<std::string>(msg->value));
    if (const JSONValue* data = findMember(errVal, "data")) {
        e.data = *data;
    }
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
//
// Returns:
//   JSONValue of Object type with code/message and optional data.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return std::make_unique<JSONRPCResponse>(id, makeErrorValue(err), true);
}

} // namespace errors
} // namespace mcpgw
