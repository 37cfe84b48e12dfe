//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecutor.cpp
// Purpose: tools/call handler implementation
//==========================================================================================================

#include "mcpgw/ToolExecutor.h"

#include "mcpgw/validation/Schema.h"
#include "logging/Logger.h"

namespace mcpgw {

bool CallTool(const JSONValue& params, const ServerConfig& config, actions::IActionBackend& backend,
              JSONValue& outResult, std::string& errorMessage) {
    FUNC_SCOPE();
    CallToolParams call;
    std::string parseError;
    if (!ParseCallToolParams(params, call, parseError)) {
        errorMessage = "Invalid tool call parameters: " + parseError;
        return false;
    }

    const ToolDefinition* def = config.FindTool(call.name);
    if (def == nullptr) {
        errorMessage = "Tool '" + call.name + "' not found";
        return false;
    }

    if (call.arguments.has_value()) {
        if (!validation::ValidateArguments(call.arguments.value(), def->tool.inputSchema, errorMessage)) {
            LOG_WARN("tools/call {}: {}", call.name, errorMessage);
            return false;
        }
    }

    LOG_DEBUG("tools/call {} -> action {}", call.name, def->actionId);
    const JSONValue args = call.arguments.value_or(JSONValue{nullptr});
    actions::ActionResponse action = actions::ExecuteMappedAction(backend, def->actionId, args);

    CallToolResult result;
    result.content = actions::ParseActionOutput(action);
    result.isError = false;
    outResult = result.ToJSON();
    return true;
}

} // namespace mcpgw
