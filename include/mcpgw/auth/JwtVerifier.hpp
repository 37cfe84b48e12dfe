//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JwtVerifier.hpp
// Purpose: HS256 JSON Web Token verifier (OpenSSL HMAC-SHA256) for bearer authentication
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgw/auth/ServerAuth.hpp"

namespace mcpgw::auth {

//==========================================================================================================
// JwtHs256Verifier
// Purpose: Validates compact JWS tokens signed with HMAC-SHA256 and extracts TokenInfo.
// Checks:
//   - three base64url segments, header "alg" == "HS256"
//   - signature (constant-time comparison)
//   - "exp" present and in the future; "nbf" (when present) not in the future
//   - "iss" / "aud" when configured
// Claims:
//   "sub" -> subject; "scope" (space separated) or "scopes" (array) -> scopes;
//   other string claims -> extra.
//==========================================================================================================
class JwtHs256Verifier : public ITokenVerifier {
public:
    struct Options {
        std::string secret;
        std::string issuer;        // required "iss" when non-empty
        std::string audience;      // required "aud" (string or array member) when non-empty
        long leewaySeconds{0};
    };

    explicit JwtHs256Verifier(Options opts);

    bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) override;

private:
    Options opts_;
};

// Base64url without padding.
std::string Base64UrlEncode(const std::string& data);

// Accepts input with or without padding; nullopt on invalid characters or length.
std::optional<std::string> Base64UrlDecode(const std::string& text);

// Signs a claims JSON document as an HS256 compact token.
std::string CreateHs256Token(const std::string& claimsJson, const std::string& secret);

} // namespace mcpgw::auth
