//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionBackend.cpp
// Purpose: Action invocation and action-output to content-block translation
//==========================================================================================================

#include "mcpgw/actions/ActionBackend.h"

#include <exception>

#include "logging/Logger.h"

namespace mcpgw {
namespace actions {

namespace {

const std::string* stringMember(const JSONValue& v, const char* key) {
    const JSONValue* m = findMember(v, key);
    if (m == nullptr || !m->isString()) {
        return nullptr;
    }
    return &std::get<std::string>(m->value);
}

std::vector<ContentBlock> parseContentArray(const JSONValue::Array& items) {
    std::vector<ContentBlock> blocks;
    for (const auto& item : items) {
        if (!item) continue;
        const std::string* type = stringMember(*item, "type");
        if (type == nullptr) continue;
        if (*type == "text") {
            if (const std::string* text = stringMember(*item, "text")) {
                blocks.emplace_back(TextContent{*text});
            }
        } else if (*type == "image") {
            const std::string* data = stringMember(*item, "data");
            const std::string* mimeType = stringMember(*item, "mimeType");
            if (data != nullptr && mimeType != nullptr) {
                blocks.emplace_back(ImageContent{*data, *mimeType});
            }
        }
    }
    return blocks;
}

} // namespace

ActionResponse ExecuteMappedAction(IActionBackend& backend, const std::string& actionId, const JSONValue& arguments) {
    FUNC_SCOPE();
    ActionRunInput input;
    input.actionId = actionId;
    input.payload.input = serializeJSONValue(arguments);
    input.payload.configurations = "{}";

    ActionRunResult run;
    try {
        run = backend.Run(input);
    } catch (const std::exception& e) {
        LOG_ERROR("Action backend threw for action {}: {}", actionId, e.what());
        run = ActionRunResult::RunFailed(e.what());
    } catch (...) {
        LOG_ERROR("Action backend threw a non-standard exception for action {}", actionId);
        run = ActionRunResult::RunFailed("unknown exception");
    }

    ActionResponse response;
    switch (run.status) {
        case ActionRunStatus::Ok: {
            response.success = true;
            JSONValue parsed;
            std::string err;
            if (tryParseJSON(run.result, parsed, err)) {
                response.data = std::move(parsed);
            } else {
                LOG_DEBUG("Action {} output is not JSON ({}); treating as no data", actionId, err);
            }
            break;
        }
        case ActionRunStatus::Forbidden:
            LOG_WARN("Action {} forbidden", actionId);
            response.error = "Action forbidden: insufficient permissions";
            break;
        case ActionRunStatus::RunFailed:
            LOG_WARN("Action {} failed: {}", actionId, run.message);
            response.error = "Action execution failed: " + run.message;
            break;
    }
    return response;
}

std::vector<ContentBlock> ParseActionOutput(const ActionResponse& response) {
    if (!response.success) {
        return {TextContent{"Error: " + response.error.value_or("Unknown error")}};
    }
    if (!response.data.has_value()) {
        return {TextContent{"Action completed successfully"}};
    }
    const JSONValue& data = response.data.value();
    if (data.isString()) {
        return {TextContent{std::get<std::string>(data.value)}};
    }
    if (const std::string* text = stringMember(data, "text")) {
        return {TextContent{*text}};
    }
    if (const JSONValue* content = findMember(data, "content"); content && content->isArray()) {
        return parseContentArray(std::get<JSONValue::Array>(content->value));
    }
    return {TextContent{serializeJSONValuePretty(data)}};
}

} // namespace actions
} // namespace mcpgw
