//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseBuilder.h
// Purpose: Construction of JSON-RPC success/error envelopes with a non-failing fallback path
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

//==========================================================================================================
// BuildSuccessResponse
// Purpose: Builds a success envelope after checking the result against the output contract.
// Args:
//   id: Request id to echo (null when unknown).
//   result: Method result; must be an object whose strings (keys and values) are valid UTF-8.
//   errorMessage: Receives the contract violation.
// Returns:
//   Response, or nullptr when the contract is violated.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> BuildSuccessResponse(const JSONRPCId& id, const JSONValue& result,
                                                      std::string& errorMessage);

//==========================================================================================================
// BuildErrorResponse
// Purpose: Builds an error envelope {code, message}.
// Returns:
//   nullptr with errorMessage set when the code is not one the gateway emits, the message is not
//   valid UTF-8, or the id cannot be represented.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> BuildErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                    std::string& errorMessage);

//==========================================================================================================
// BuildFallbackErrorResponse
// Purpose: Minimal error envelope assembled directly from its inputs without any contract checks.
// Notes:
//   The message is sanitized to valid UTF-8 and a non-finite numeric id becomes null so the
//   envelope always serializes.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> BuildFallbackErrorResponse(const JSONRPCId& id, int code,
                                                            const std::string& message);

// BuildErrorResponse, or BuildFallbackErrorResponse when it rejects its inputs. Never returns nullptr.
std::unique_ptr<JSONRPCResponse> MakeErrorResponseOrFallback(const JSONRPCId& id, int code,
                                                             const std::string& message);

} // namespace mcpgw
