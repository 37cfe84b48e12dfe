//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionBackend.h
// Purpose: Action execution backend interface and translation of action output into content blocks
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/Protocol.h"

namespace mcpgw {
namespace actions {

//==========================================================================================================
// ActionPayload / ActionRunInput
// Purpose: Request handed to the backend for one action run.
// Fields:
//   input: Serialized tool arguments ("null" when the call carried none).
//   configurations: Serialized action configuration; the gateway always sends "{}".
//==========================================================================================================
struct ActionPayload {
    std::string input;
    std::string configurations{"{}"};
};

struct ActionRunInput {
    std::string actionId;
    ActionPayload payload;
};

enum class ActionRunStatus {
    Ok,
    Forbidden,
    RunFailed
};

//==========================================================================================================
// ActionRunResult
// Purpose: Raw backend outcome.
// Fields:
//   status: Ok, Forbidden, or RunFailed.
//   result: Backend output text when Ok (expected to be JSON but not required to be).
//   message: Failure description when RunFailed.
//==========================================================================================================
struct ActionRunResult {
    ActionRunStatus status{ActionRunStatus::RunFailed};
    std::string result;
    std::string message;

    static ActionRunResult Ok(std::string output) { return ActionRunResult{ActionRunStatus::Ok, std::move(output), {}}; }
    static ActionRunResult Forbidden() { return ActionRunResult{ActionRunStatus::Forbidden, {}, {}}; }
    static ActionRunResult RunFailed(std::string msg) { return ActionRunResult{ActionRunStatus::RunFailed, {}, std::move(msg)}; }
};

//==========================================================================================================
// IActionBackend
// Purpose: Executes the action bound to a tool. Called synchronously; Run may block.
//==========================================================================================================
class IActionBackend {
public:
    virtual ~IActionBackend() = default;
    virtual ActionRunResult Run(const ActionRunInput& input) = 0;
};

// Action outcome as seen by the tool executor
struct ActionResponse {
    bool success{false};
    std::optional<JSONValue> data;    // backend output parsed as JSON; empty when unparsable
    std::optional<std::string> error;
};

//==========================================================================================================
// ExecuteMappedAction
// Purpose: Runs actionId on the backend with the serialized arguments and normalizes the outcome.
// Notes:
//   Forbidden yields error "Action forbidden: insufficient permissions"; RunFailed (and a backend
//   that throws) yields "Action execution failed: {message}".
//==========================================================================================================
ActionResponse ExecuteMappedAction(IActionBackend& backend, const std::string& actionId, const JSONValue& arguments);

//==========================================================================================================
// ParseActionOutput
// Purpose: Translates an ActionResponse into content blocks.
// Rules:
//   failure        -> text "Error: {error or 'Unknown error'}"
//   string data    -> that text
//   {text: s}      -> s
//   {content: [..]}-> text items with "text", image items with "data" and "mimeType"; others skipped
//   other data     -> pretty-printed JSON
//   no data        -> "Action completed successfully"
//==========================================================================================================
std::vector<ContentBlock> ParseActionOutput(const ActionResponse& response);

} // namespace actions
} // namespace mcpgw
