//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/ServerAuth.cpp
// Purpose: Bearer header checking, request authenticator, and per-request TokenInfo context
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>

#include "mcpgw/auth/ServerAuth.hpp"
#include "logging/Logger.h"

namespace mcpgw::auth {

namespace {
    // Thread-local storage for per-request TokenInfo.
    thread_local const TokenInfo* gCurrentTokenInfo = nullptr;

    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    static bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    static bool containsAllScopes(const std::vector<std::string>& have, const std::vector<std::string>& need) {
        return std::all_of(need.begin(), need.end(), [&](const std::string& s) {
            return std::find(have.begin(), have.end(), s) != have.end();
        });
    }

    BearerCheckResult fail(int status, const char* message) {
        BearerCheckResult r;
        r.ok = false;
        r.httpStatus = status;
        r.errorMessage = message;
        return r;
    }
}

std::string FindHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() && std::equal(key.begin(), key.end(), name.begin(), icaseEqual)) {
            return value;
        }
    }
    return std::string();
}

const TokenInfo* CurrentTokenInfo() {
    return gCurrentTokenInfo;
}

TokenInfoScope::TokenInfoScope(const TokenInfo* info) : prev(gCurrentTokenInfo) {
    gCurrentTokenInfo = info;
}

TokenInfoScope::~TokenInfoScope() {
    gCurrentTokenInfo = prev;
}

BearerCheckResult CheckBearerAuth(
    const std::string& authHeader,
    ITokenVerifier& verifier,
    const RequireBearerTokenOptions& opts,
    TokenInfo& outInfo) {

    // Validate header shape
    if (authHeader.empty() || !startsWithBearer(authHeader)) {
        return fail(401, "no bearer token");
    }
    std::string token = authHeader.substr(7);
    // Trim leading spaces on token
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0) {
        token.erase(token.begin());
    }
    if (token.empty()) {
        return fail(401, "no bearer token");
    }

    // Verify token via callback
    std::string err;
    TokenInfo info;
    if (!verifier.Verify(token, info, err)) {
        BearerCheckResult r = fail(401, "invalid token");
        if (!err.empty()) {
            r.errorMessage = err;
        }
        return r;
    }

    // Check scopes
    if (!opts.requiredScopes.empty() && !containsAllScopes(info.scopes, opts.requiredScopes)) {
        return fail(403, "insufficient scope");
    }

    // Check expiration
    if (info.expiration.time_since_epoch().count() == 0) {
        return fail(401, "token missing expiration");
    }
    if (info.expiration <= std::chrono::system_clock::now()) {
        return fail(401, "token expired");
    }

    // Success
    outInfo = std::move(info);
    BearerCheckResult r;
    r.ok = true;
    r.httpStatus = 200;
    return r;
}

BearerAuthenticator::BearerAuthenticator(std::shared_ptr<ITokenVerifier> verifier, RequireBearerTokenOptions opts)
    : verifier_(std::move(verifier)), opts_(std::move(opts)) {}

bool BearerAuthenticator::Validate(const HeaderList& headers, TokenInfo& outInfo, std::string& errorMessage) {
    if (!verifier_) {
        errorMessage = "no token verifier configured";
        return false;
    }
    BearerCheckResult r = CheckBearerAuth(FindHeader(headers, "Authorization"), *verifier_, opts_, outInfo);
    if (!r.ok) {
        LOG_DEBUG("Bearer authentication rejected ({}): {}", r.httpStatus, r.errorMessage);
        errorMessage = r.errorMessage;
        return false;
    }
    return true;
}

std::string BearerAuthenticator::Challenge() const {
    if (opts_.resourceMetadataUrl.empty()) {
        return std::string("Bearer");
    }
    return std::string("Bearer resource_metadata=\"") + opts_.resourceMetadataUrl + "\"";
}

} // namespace mcpgw::auth
