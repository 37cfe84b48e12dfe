//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversions for tools, server configuration, content blocks and tools/call payloads
//==========================================================================================================

#include "mcpgw/Protocol.h"
#include "logging/Logger.h"

namespace mcpgw {

JSONValue Tool::ToJSON() const {
    JSONValue::Object o;
    o["name"] = makeJSON(JSONValue(name));
    o["description"] = makeJSON(JSONValue(description));
    o["inputSchema"] = makeJSON(inputSchema);
    return JSONValue(std::move(o));
}

const ToolDefinition* ServerConfig::FindTool(const std::string& name) const {
    for (const auto& def : tools) {
        if (def.tool.name == name) {
            return &def;
        }
    }
    return nullptr;
}

namespace {

bool parseToolDefinition(const JSONValue& v, std::size_t index, ToolDefinition& out, std::string& errorMessage) {
    const std::string where = "tools[" + std::to_string(index) + "]";
    if (!v.isObject()) {
        errorMessage = where + " must be an object";
        return false;
    }
    const JSONValue* name = findMember(v, "name");
    if (name == nullptr || !name->isString()) {
        errorMessage = where + ".name must be a string";
        return false;
    }
    const JSONValue* actionId = findMember(v, "action-id");
    if (actionId == nullptr || !actionId->isString()) {
        errorMessage = where + ".action-id must be a string";
        return false;
    }
    const JSONValue* schema = findMember(v, "inputSchema");
    if (schema == nullptr || !schema->isObject()) {
        errorMessage = where + ".inputSchema must be an object";
        return false;
    }
    std::string description;
    if (const JSONValue* d = findMember(v, "description")) {
        if (d->isString()) {
            description = std::get<std::string>(d->value);
        } else if (!d->isNull()) {
            errorMessage = where + ".description must be a string";
            return false;
        }
    }
    out.tool = Tool(std::get<std::string>(name->value), std::move(description), *schema);
    out.actionId = std::get<std::string>(actionId->value);
    return true;
}

bool parseServerConfig(const JSONValue& v, std::size_t index, ServerConfig& out, std::string& errorMessage) {
    const std::string where = "mcp-servers[" + std::to_string(index) + "]";
    if (!v.isObject()) {
        errorMessage = where + " must be an object";
        return false;
    }
    const JSONValue* id = findMember(v, "id");
    if (id == nullptr || !id->isString()) {
        errorMessage = where + ".id must be a string";
        return false;
    }
    out.id = std::get<std::string>(id->value);
    out.tools.clear();
    const JSONValue* tools = findMember(v, "tools");
    if (tools == nullptr || tools->isNull()) {
        return true;
    }
    if (!tools->isArray()) {
        errorMessage = where + ".tools must be an array";
        return false;
    }
    const auto& arr = std::get<JSONValue::Array>(tools->value);
    for (std::size_t k = 0; k < arr.size(); ++k) {
        ToolDefinition def;
        std::string err;
        if (!arr[k] || !parseToolDefinition(*arr[k], k, def, err)) {
            errorMessage = where + "." + (arr[k] ? err : "tools[" + std::to_string(k) + "] must be an object");
            return false;
        }
        out.tools.push_back(std::move(def));
    }
    return true;
}

} // namespace

bool ParseServersConfig(const JSONValue& doc, ServersConfig& out, std::string& errorMessage) {
    FUNC_SCOPE();
    if (!doc.isObject()) {
        errorMessage = "configuration must be a JSON object";
        return false;
    }
    const JSONValue* servers = findMember(doc, "mcp-servers");
    if (servers == nullptr || !servers->isArray()) {
        errorMessage = "mcp-servers must be an array";
        return false;
    }
    ServersConfig parsed;
    const auto& arr = std::get<JSONValue::Array>(servers->value);
    for (std::size_t k = 0; k < arr.size(); ++k) {
        ServerConfig server;
        if (!arr[k]) {
            errorMessage = "mcp-servers[" + std::to_string(k) + "] must be an object";
            return false;
        }
        if (!parseServerConfig(*arr[k], k, server, errorMessage)) {
            return false;
        }
        parsed.servers.push_back(std::move(server));
    }
    out = std::move(parsed);
    return true;
}

JSONValue ServersConfigToJSON(const ServersConfig& config) {
    JSONValue::Array servers;
    for (const auto& server : config.servers) {
        JSONValue::Array tools;
        for (const auto& def : server.tools) {
            JSONValue toolJson = def.tool.ToJSON();
            std::get<JSONValue::Object>(toolJson.value)["action-id"] = makeJSON(JSONValue(def.actionId));
            tools.push_back(makeJSON(std::move(toolJson)));
        }
        JSONValue::Object s;
        s["id"] = makeJSON(JSONValue(server.id));
        s["tools"] = makeJSON(JSONValue(std::move(tools)));
        servers.push_back(makeJSON(JSONValue(std::move(s))));
    }
    JSONValue::Object root;
    root["mcp-servers"] = makeJSON(JSONValue(std::move(servers)));
    return JSONValue(std::move(root));
}

JSONValue ContentBlockToJSON(const ContentBlock& block) {
    JSONValue::Object o;
    std::visit([&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, TextContent>) {
            o["type"] = makeJSON(JSONValue("text"));
            o["text"] = makeJSON(JSONValue(c.text));
        } else {
            o["type"] = makeJSON(JSONValue("image"));
            o["data"] = makeJSON(JSONValue(c.data));
            o["mimeType"] = makeJSON(JSONValue(c.mimeType));
        }
    }, block);
    return JSONValue(std::move(o));
}

bool ParseCallToolParams(const JSONValue& params, CallToolParams& out, std::string& errorMessage) {
    if (!params.isObject()) {
        errorMessage = "params must be an object";
        return false;
    }
    const JSONValue* name = findMember(params, "name");
    if (name == nullptr) {
        errorMessage = "missing field `name`";
        return false;
    }
    if (!name->isString()) {
        errorMessage = "name must be a string";
        return false;
    }
    out.name = std::get<std::string>(name->value);
    out.arguments.reset();
    if (const JSONValue* args = findMember(params, "arguments")) {
        if (args->isObject()) {
            out.arguments = *args;
        } else if (!args->isNull()) {
            errorMessage = "arguments must be an object";
            return false;
        }
    }
    return true;
}

JSONValue CallToolResult::ToJSON() const {
    JSONValue::Array items;
    items.reserve(content.size());
    for (const auto& block : content) {
        items.push_back(makeJSON(ContentBlockToJSON(block)));
    }
    JSONValue::Object o;
    o["content"] = makeJSON(JSONValue(std::move(items)));
    o["isError"] = makeJSON(JSONValue(isError));
    return JSONValue(std::move(o));
}

} // namespace mcpgw
