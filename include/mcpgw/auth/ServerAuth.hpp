//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerAuth.hpp
// Purpose: Request authentication for the gateway transport (bearer tokens, per-request TokenInfo)
//==========================================================================================================

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <utility>
#include <chrono>

namespace mcpgw::auth {

// HTTP header name/value pairs in arrival order
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive lookup of the first header named name; empty when absent.
std::string FindHeader(const HeaderList& headers, const std::string& name);

//==========================================================================================================
// TokenInfo
// Purpose: Information extracted from a bearer token (subject, scopes, expiration, extra claims).
//==========================================================================================================
struct TokenInfo {
    std::string subject;
    std::vector<std::string> scopes;
    std::chrono::system_clock::time_point expiration;
    std::unordered_map<std::string, std::string> extra;
};

//==========================================================================================================
// ITokenVerifier
// Purpose: Interface to validate a bearer token and populate TokenInfo when valid.
// Returns: true on success (TokenInfo populated); false on failure (set errorMessage).
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) = 0;
};

//==========================================================================================================
// RequireBearerTokenOptions
// Purpose: Options controlling server-side bearer enforcement.
// Fields:
//   resourceMetadataUrl: URL to include in WWW-Authenticate header when returning 401.
//   requiredScopes: All listed scopes must be present in the token.
//==========================================================================================================
struct RequireBearerTokenOptions {
    std::string resourceMetadataUrl;
    std::vector<std::string> requiredScopes;
};

//==========================================================================================================
// BearerCheckResult
// Purpose: Result of checking a bearer Authorization header.
// Fields:
//   ok: True if authorization passed.
//   httpStatus: HTTP status suggested on failure (401 or 403).
//   errorMessage: Failure reason (for logs; never sent to the caller).
//==========================================================================================================
struct BearerCheckResult {
    bool ok{false};
    int httpStatus{401};
    std::string errorMessage;
};

//==========================================================================================================
// CheckBearerAuth
// Purpose: Validate an Authorization header value using the supplied verifier and options.
// Args:
//   authHeader: Value of the Authorization header (may be empty).
//   verifier: Token verifier.
//   opts: Enforcement options (required scopes).
//   outInfo: Populated on success with token information.
// Returns:
//   BearerCheckResult indicating success or failure details.
//==========================================================================================================
BearerCheckResult CheckBearerAuth(
    const std::string& authHeader,
    ITokenVerifier& verifier,
    const RequireBearerTokenOptions& opts,
    TokenInfo& outInfo);

//==========================================================================================================
// IRequestAuthenticator
// Purpose: Transport-facing authentication seam, consulted before any protocol-level parsing.
// Returns: true when the request may proceed (outInfo populated); false when it must be rejected with 401.
//==========================================================================================================
class IRequestAuthenticator {
public:
    virtual ~IRequestAuthenticator() = default;
    virtual bool Validate(const HeaderList& headers, TokenInfo& outInfo, std::string& errorMessage) = 0;

    // Value for a WWW-Authenticate header on rejection; empty to omit it.
    virtual std::string Challenge() const { return std::string(); }
};

//==========================================================================================================
// BearerAuthenticator
// Purpose: IRequestAuthenticator that requires "Authorization: Bearer <token>" accepted by a verifier.
//==========================================================================================================
class BearerAuthenticator : public IRequestAuthenticator {
public:
    BearerAuthenticator(std::shared_ptr<ITokenVerifier> verifier, RequireBearerTokenOptions opts);

    bool Validate(const HeaderList& headers, TokenInfo& outInfo, std::string& errorMessage) override;
    std::string Challenge() const override;

private:
    std::shared_ptr<ITokenVerifier> verifier_;
    RequireBearerTokenOptions opts_;
};

//==========================================================================================================
// Per-request TokenInfo context accessors
// Purpose: Provide access to the current request's TokenInfo while the dispatcher runs.
//==========================================================================================================
const TokenInfo* CurrentTokenInfo();

// RAII helper: sets the current TokenInfo for the lifetime of this object, then restores the previous one.
class TokenInfoScope {
public:
    explicit TokenInfoScope(const TokenInfo* info);
    ~TokenInfoScope();
private:
    const TokenInfo* prev{nullptr};
};

} // namespace mcpgw::auth
