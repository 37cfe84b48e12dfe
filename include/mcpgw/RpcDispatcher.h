//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RpcDispatcher.h
// Purpose: Request-processing pipeline: envelope parsing, config loading, method routing, envelope building
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/actions/ActionBackend.h"
#include "mcpgw/config/ConfigStore.h"

namespace mcpgw {

//==========================================================================================================
// RpcDispatcher
// Purpose: Turns one raw JSON-RPC body addressed to a server identity into exactly one response.
// Notes:
//   - Holds no per-request state; server configuration is loaded from the store on every call.
//   - Process never throws and never returns nullptr; every failure is an error envelope:
//       -32700 body is not JSON
//       -32600 envelope shape invalid or jsonrpc != "2.0"
//       -32000 configuration unavailable, tool not found, invalid arguments, bad tool params
//       -32601 unknown method
//       -32603 result could not be turned into a response
//==========================================================================================================
class RpcDispatcher {
public:
    RpcDispatcher(std::shared_ptr<config::IConfigStore> store,
                  std::shared_ptr<actions::IActionBackend> backend);
    RpcDispatcher(std::shared_ptr<config::IConfigStore> store,
                  std::shared_ptr<actions::IActionBackend> backend,
                  Implementation serverInfo);

    std::unique_ptr<JSONRPCResponse> Process(const std::string& serverId, const std::string& body) const;

    const Implementation& ServerInfo() const { return serverInfo_; }

private:
    std::unique_ptr<JSONRPCResponse> processUnchecked(const std::string& serverId, const std::string& body) const;

    bool handleInitialize(const JSONValue& params, JSONValue& outResult, std::string& errorMessage) const;
    bool handleToolsList(const ServerConfig& config, JSONValue& outResult, std::string& errorMessage) const;
    bool handleToolsCall(const JSONValue& params, const ServerConfig& config, JSONValue& outResult,
                         std::string& errorMessage) const;

    std::shared_ptr<config::IConfigStore> store_;
    std::shared_ptr<actions::IActionBackend> backend_;
    Implementation serverInfo_;
};

} // namespace mcpgw
