//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecutor.h
// Purpose: tools/call execution: tool lookup, argument validation, action invocation, result translation
//==========================================================================================================

#pragma once

#include <string>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/actions/ActionBackend.h"

namespace mcpgw {

//==========================================================================================================
// CallTool
// Purpose: Executes one tools/call request against a server configuration.
// Args:
//   params: Raw tools/call params ({name, arguments?}).
//   config: Server configuration loaded for this request.
//   backend: Action backend to run the tool's action on.
//   outResult: Receives {content: [...], isError: false} on success.
//   errorMessage: Receives the failure; surfaced by the dispatcher as a -32000 error.
// Returns:
//   true on success. Backend failures are not errors here: they become an "Error: ..." text block.
//==========================================================================================================
bool CallTool(const JSONValue& params, const ServerConfig& config, actions::IActionBackend& backend,
              JSONValue& outResult, std::string& errorMessage);

} // namespace mcpgw
