//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RpcDispatcher.cpp
// Purpose: JSON-RPC request pipeline and the initialize / tools/list / tools/call handlers
//==========================================================================================================

#include "mcpgw/RpcDispatcher.h"

#include <exception>

#include "mcpgw/ResponseBuilder.h"
#include "mcpgw/ToolExecutor.h"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/version.h"
#include "logging/Logger.h"

namespace mcpgw {

namespace {

// Id of a request that failed envelope checks: kept when it is a valid id value, else null.
JSONRPCId bestEffortId(const JSONValue& raw) {
    if (const JSONValue* idVal = findMember(raw, "id")) {
        if (auto id = idFromJSONValue(*idVal)) {
            return id.value();
        }
    }
    return JSONRPCId{nullptr};
}

std::unique_ptr<JSONRPCResponse> errorResponse(const JSONRPCId& id, const errors::McpError& e) {
    return MakeErrorResponseOrFallback(id, e.code, e.message);
}

} // namespace

RpcDispatcher::RpcDispatcher(std::shared_ptr<config::IConfigStore> store,
                             std::shared_ptr<actions::IActionBackend> backend)
    : RpcDispatcher(std::move(store), std::move(backend), Implementation(SERVER_NAME, getVersionString())) {}

RpcDispatcher::RpcDispatcher(std::shared_ptr<config::IConfigStore> store,
                             std::shared_ptr<actions::IActionBackend> backend,
                             Implementation serverInfo)
    : store_(std::move(store)), backend_(std::move(backend)), serverInfo_(std::move(serverInfo)) {}

std::unique_ptr<JSONRPCResponse> RpcDispatcher::Process(const std::string& serverId, const std::string& body) const {
    FUNC_SCOPE();
    try {
        return processUnchecked(serverId, body);
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected failure processing request for {}: {}", serverId, e.what());
        return BuildFallbackErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::InternalError,
                                          std::string("Internal error: ") + e.what());
    } catch (...) {
        LOG_ERROR("Unexpected non-standard exception processing request for {}", serverId);
        return BuildFallbackErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::InternalError,
                                          "Internal error: unknown exception");
    }
}

std::unique_ptr<JSONRPCResponse> RpcDispatcher::processUnchecked(const std::string& serverId, const std::string& body) const {
    // 1. Parse
    JSONValue raw;
    std::string parseError;
    if (!tryParseJSON(body, raw, parseError)) {
        LOG_WARN("Parse error for server {}: {}", serverId, parseError);
        return errorResponse(JSONRPCId{nullptr},
                             errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error: " + parseError));
    }

    // 2. Envelope shape
    JSONRPCRequest request;
    std::string shapeError;
    if (!request.FromJSONValue(raw, shapeError)) {
        LOG_WARN("Invalid request for server {}: {}", serverId, shapeError);
        return errorResponse(bestEffortId(raw),
                             errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: " + shapeError));
    }

    // 3. Protocol tag
    if (request.jsonrpc != JSONRPC_VERSION) {
        LOG_WARN("Invalid jsonrpc version '{}' for server {}", request.jsonrpc, serverId);
        return errorResponse(request.id,
                             errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: jsonrpc must be '2.0'"));
    }

    // 4. Server configuration, fresh for every request
    ServerConfig config;
    std::string configError;
    if (!store_ || !config::LoadServerConfig(*store_, serverId, config, configError)) {
        if (!store_) {
            configError = "no configuration store";
        }
        LOG_WARN("Failed to load server config for {}: {}", serverId, configError);
        return errorResponse(request.id,
                             errors::makeError(JSONRPCErrorCodes::ServerError, "Failed to load server config: " + configError));
    }

    // 5. Route
    LOG_DEBUG("Dispatching {} for server {}", request.method, serverId);
    JSONValue result;
    std::string handlerError;
    bool ok = false;
    if (request.method == Methods::Initialize) {
        ok = handleInitialize(request.params, result, handlerError);
    } else if (request.method == Methods::ListTools) {
        ok = handleToolsList(config, result, handlerError);
    } else if (request.method == Methods::CallTool) {
        ok = handleToolsCall(request.params, config, result, handlerError);
    } else {
        LOG_WARN("Method not found: {}", request.method);
        return errorResponse(request.id,
                             errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method));
    }

    // 6. Handler failure
    if (!ok) {
        return errorResponse(request.id, errors::makeError(JSONRPCErrorCodes::ServerError, handlerError));
    }

    // 7. Success envelope
    std::string buildError;
    auto response = BuildSuccessResponse(request.id, result, buildError);
    if (!response) {
        LOG_ERROR("Failed to build response for {}: {}", request.method, buildError);
        return errorResponse(request.id,
                             errors::makeError(JSONRPCErrorCodes::InternalError, "Failed to build response: " + buildError));
    }
    return response;
}

bool RpcDispatcher::handleInitialize(const JSONValue& params, JSONValue& outResult, std::string& /*errorMessage*/) const {
    LOG_INFO("Handling initialize request");
    std::string protocolVersion = PROTOCOL_VERSION;
    if (const JSONValue* pv = findMember(params, "protocolVersion"); pv && pv->isString()) {
        protocolVersion = std::get<std::string>(pv->value);
    }
    JSONValue capabilities{JSONValue::Object{}};
    if (const JSONValue* caps = findMember(params, "capabilities")) {
        capabilities = *caps;
    }

    JSONValue::Object resultObj;
    resultObj["protocolVersion"] = std::make_shared<JSONValue>(protocolVersion);
    resultObj["capabilities"] = std::make_shared<JSONValue>(capabilities);
    JSONValue::Object serverInfoObj;
    serverInfoObj["name"] = std::make_shared<JSONValue>(serverInfo_.name);
    serverInfoObj["version"] = std::make_shared<JSONValue>(serverInfo_.version);
    resultObj["serverInfo"] = std::make_shared<JSONValue>(serverInfoObj);
    outResult = JSONValue(std::move(resultObj));
    return true;
}

bool RpcDispatcher::handleToolsList(const ServerConfig& config, JSONValue& outResult, std::string& /*errorMessage*/) const {
    LOG_DEBUG("Handling tools/list request ({} tools)", config.tools.size());
    JSONValue::Array tools;
    tools.reserve(config.tools.size());
    for (const auto& def : config.tools) {
        // Public shape only: the action mapping stays internal
        tools.push_back(makeJSON(def.tool.ToJSON()));
    }
    JSONValue::Object resultObj;
    resultObj["tools"] = std::make_shared<JSONValue>(std::move(tools));
    outResult = JSONValue(std::move(resultObj));
    return true;
}

bool RpcDispatcher::handleToolsCall(const JSONValue& params, const ServerConfig& config, JSONValue& outResult,
                                    std::string& errorMessage) const {
    LOG_DEBUG("Handling tools/call request");
    if (!backend_) {
        errorMessage = "Action execution failed: no action backend configured";
        return false;
    }
    return CallTool(params, config, *backend_, outResult, errorMessage);
}

} // namespace mcpgw
