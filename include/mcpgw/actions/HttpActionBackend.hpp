//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpActionBackend.hpp
// Purpose: IActionBackend that runs actions through an HTTP(S) action service (Boost.Beast client)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcpgw/actions/ActionBackend.h"

namespace mcpgw {
namespace actions {

//==========================================================================================================
// HttpActionBackend
// Purpose: POSTs {"input": ..., "configurations": ...} to {baseUrl}/actions/{actionId}/run.
// Status mapping:
//   2xx -> Ok (response body is the action output)
//   401/403 -> Forbidden
//   other statuses, connection and TLS failures -> RunFailed
//==========================================================================================================
class HttpActionBackend : public IActionBackend {
public:
    struct Options {
        std::string baseUrl{"http://127.0.0.1:8081"};
        std::string bearerToken;        // optional; sent as "Authorization: Bearer ..."
        std::string caFile;             // https only; system defaults when both are empty
        std::string caPath;
        unsigned int connectTimeoutMs{5000};
        unsigned int readTimeoutMs{30000};
    };

    explicit HttpActionBackend(const Options& opts);
    ~HttpActionBackend() override;

    ActionRunResult Run(const ActionRunInput& input) override;

    // Target URL for an action id (the id is percent-encoded as one path segment).
    std::string RunUrl(const std::string& actionId) const;

    // Request body sent for an input.
    static std::string BuildRequestBody(const ActionRunInput& input);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace actions
} // namespace mcpgw
