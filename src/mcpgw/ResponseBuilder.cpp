//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseBuilder.cpp
// Purpose: Success/error envelope construction and the fallback error envelope
//==========================================================================================================

#include "mcpgw/ResponseBuilder.h"

#include <cmath>

#include "mcpgw/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpgw {

namespace {

// Finds the first string (member name or value) that is not valid UTF-8.
bool allStringsValidUtf8(const JSONValue& v, std::string& path) {
    if (v.isString()) {
        return isValidUtf8(std::get<std::string>(v.value));
    }
    if (v.isArray()) {
        const auto& arr = std::get<JSONValue::Array>(v.value);
        for (std::size_t k = 0; k < arr.size(); ++k) {
            if (arr[k] && !allStringsValidUtf8(*arr[k], path)) {
                path = "[" + std::to_string(k) + "]" + path;
                return false;
            }
        }
        return true;
    }
    if (v.isObject()) {
        for (const auto& [key, member] : std::get<JSONValue::Object>(v.value)) {
            if (!isValidUtf8(key)) {
                path = ".<key>";
                return false;
            }
            if (member && !allStringsValidUtf8(*member, path)) {
                path = "." + key + path;
                return false;
            }
        }
    }
    return true;
}

bool checkId(const JSONRPCId& id, std::string& errorMessage) {
    if (std::holds_alternative<std::string>(id) && !isValidUtf8(std::get<std::string>(id))) {
        errorMessage = "id is not valid UTF-8";
        return false;
    }
    if (std::holds_alternative<double>(id) && !std::isfinite(std::get<double>(id))) {
        errorMessage = "id is not a finite number";
        return false;
    }
    return true;
}

} // namespace

std::unique_ptr<JSONRPCResponse> BuildSuccessResponse(const JSONRPCId& id, const JSONValue& result,
                                                      std::string& errorMessage) {
    FUNC_SCOPE();
    if (!checkId(id, errorMessage)) {
        return nullptr;
    }
    if (!result.isObject()) {
        errorMessage = "result must be an object";
        return nullptr;
    }
    std::string path;
    if (!allStringsValidUtf8(result, path)) {
        errorMessage = "result" + path + " contains invalid UTF-8";
        return nullptr;
    }
    return std::make_unique<JSONRPCResponse>(id, result);
}

std::unique_ptr<JSONRPCResponse> BuildErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                    std::string& errorMessage) {
    FUNC_SCOPE();
    if (!checkId(id, errorMessage)) {
        return nullptr;
    }
    if (!errors::isKnownErrorCode(code)) {
        errorMessage = "unsupported error code " + std::to_string(code);
        return nullptr;
    }
    if (!isValidUtf8(message)) {
        errorMessage = "error message is not valid UTF-8";
        return nullptr;
    }
    return errors::makeErrorResponse(id, errors::makeError(code, message));
}

std::unique_ptr<JSONRPCResponse> BuildFallbackErrorResponse(const JSONRPCId& id, int code,
                                                            const std::string& message) {
    JSONRPCId safeId{nullptr};
    if (std::holds_alternative<std::string>(id)) {
        safeId = sanitizeUtf8(std::get<std::string>(id));
    } else if (std::holds_alternative<int64_t>(id)) {
        safeId = std::get<int64_t>(id);
    } else if (std::holds_alternative<double>(id) && std::isfinite(std::get<double>(id))) {
        safeId = std::get<double>(id);
    }
    JSONValue::Object err;
    err["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    err["message"] = std::make_shared<JSONValue>(sanitizeUtf8(message));
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->jsonrpc = "2.0";
    resp->id = std::move(safeId);
    resp->error = JSONValue(std::move(err));
    return resp;
}

std::unique_ptr<JSONRPCResponse> MakeErrorResponseOrFallback(const JSONRPCId& id, int code,
                                                             const std::string& message) {
    std::string buildError;
    auto resp = BuildErrorResponse(id, code, message, buildError);
    if (resp) {
        return resp;
    }
    LOG_ERROR("Error response rejected ({}); using fallback envelope", buildError);
    return BuildFallbackErrorResponse(id, code, message);
}

} // namespace mcpgw
