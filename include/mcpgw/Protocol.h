//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants served by the gateway
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <variant>

namespace mcpgw {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* JSONRPC_VERSION = "2.0";

// Protocol version reported by initialize when the caller does not send one
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Server name reported in initialize serverInfo
constexpr const char* SERVER_NAME = "mcp-gateway";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Public tool shape as listed by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{JSONValue::Object{}})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolDefinition
// Purpose: Configured tool plus the backend action it is bound to.
// Fields:
//   tool: Public part (name, description, inputSchema).
//   actionId: Internal action mapping ("action-id" in configuration). Never listed to callers.
//==========================================================================================================
struct ToolDefinition {
    Tool tool;
    std::string actionId;
};

// Tools exposed under one server identity, in configuration order
struct ServerConfig {
    std::string id;
    std::vector<ToolDefinition> tools;

    const ToolDefinition* FindTool(const std::string& name) const;
};

// Whole value stored under the "mcp_servers" configuration key: {"mcp-servers": [...]}
struct ServersConfig {
    std::vector<ServerConfig> servers;
};

//==========================================================================================================
// ParseServersConfig
// Purpose: Converts the configuration document into ServersConfig.
// Returns:
//   false with errorMessage describing the first shape violation.
//==========================================================================================================
bool ParseServersConfig(const JSONValue& doc, ServersConfig& out, std::string& errorMessage);

// Inverse of ParseServersConfig (used to publish the built-in sample servers).
JSONValue ServersConfigToJSON(const ServersConfig& config);

///////////////////////////////////////// Content ///////////////////////////////////////////
struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data;      // base64 payload
    std::string mimeType;
};

using ContentBlock = std::variant<TextContent, ImageContent>;

// {"type":"text","text":...} or {"type":"image","data":...,"mimeType":...}
JSONValue ContentBlockToJSON(const ContentBlock& block);

///////////////////////////////////////// tools/call ///////////////////////////////////////////
struct CallToolParams {
    std::string name;
    std::optional<JSONValue> arguments;  // absent or null in the request leaves this empty
};

// Reads {name, arguments?}; arguments must be an object when present and not null.
bool ParseCallToolParams(const JSONValue& params, CallToolParams& out, std::string& errorMessage);

struct CallToolResult {
    std::vector<ContentBlock> content;
    bool isError = false;

    JSONValue ToJSON() const;
};

} // namespace mcpgw
