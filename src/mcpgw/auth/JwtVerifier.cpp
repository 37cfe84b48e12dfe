//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/JwtVerifier.cpp
// Purpose: HS256 JWT verification and signing helpers backed by OpenSSL
//==========================================================================================================

#include "mcpgw/auth/JwtVerifier.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "mcpgw/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace mcpgw::auth {

namespace {

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (::HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
               reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &outLen) == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(out), outLen);
}

bool splitToken(const std::string& token, std::string& header, std::string& payload, std::string& signature) {
    std::size_t d1 = token.find('.');
    if (d1 == std::string::npos) return false;
    std::size_t d2 = token.find('.', d1 + 1);
    if (d2 == std::string::npos) return false;
    if (token.find('.', d2 + 1) != std::string::npos) return false;
    header = token.substr(0, d1);
    payload = token.substr(d1 + 1, d2 - d1 - 1);
    signature = token.substr(d2 + 1);
    return !header.empty() && !payload.empty() && !signature.empty();
}

bool decodeJsonSegment(const std::string& segment, JSONValue& out) {
    auto raw = Base64UrlDecode(segment);
    if (!raw.has_value()) return false;
    std::string err;
    return tryParseJSON(raw.value(), out, err) && out.isObject();
}

// Half the clock's range in seconds, leaving headroom for leeway arithmetic.
const double kMaxClaimSeconds = static_cast<double>(
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()).count() / 2);

// NumericDate claim; nullopt when absent, non-numeric, or outside the clock's range.
std::optional<std::chrono::system_clock::time_point> timeClaim(const JSONValue& claims, const char* name) {
    const JSONValue* v = findMember(claims, name);
    if (v == nullptr) return std::nullopt;
    auto seconds = asDouble(*v);
    if (!seconds.has_value() || !std::isfinite(seconds.value())) return std::nullopt;
    const double whole = std::floor(seconds.value());
    if (whole > kMaxClaimSeconds || whole < -kMaxClaimSeconds) return std::nullopt;
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(static_cast<long long>(whole))));
}

bool audienceMatches(const JSONValue& claims, const std::string& audience) {
    const JSONValue* aud = findMember(claims, "aud");
    if (aud == nullptr) return false;
    if (aud->isString()) return std::get<std::string>(aud->value) == audience;
    if (aud->isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(aud->value)) {
            if (item && item->isString() && std::get<std::string>(item->value) == audience) return true;
        }
    }
    return false;
}

std::vector<std::string> splitScopes(const std::string& s) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && s[i] == ' ') ++i;
        std::size_t j = i;
        while (j < s.size() && s[j] != ' ') ++j;
        if (j > i) out.push_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

} // namespace

std::string Base64UrlEncode(const std::string& data) {
    if (data.empty()) return std::string();
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    while (!out.empty() && out.back() == '=') out.pop_back();
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::optional<std::string> Base64UrlDecode(const std::string& text) {
    std::string s = text;
    while (!s.empty() && s.back() == '=') s.pop_back();
    for (char& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (!std::isalnum(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (s.size() % 4 == 1) return std::nullopt;
    std::size_t padding = (4 - s.size() % 4) % 4;
    s.append(padding, '=');
    if (s.empty()) return std::string();
    std::string out(s.size() / 4 * 3, '\0');
    int n = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(s.data()), static_cast<int>(s.size()));
    if (n < 0) return std::nullopt;
    // EVP_DecodeBlock counts the bytes produced by padding characters
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

std::string CreateHs256Token(const std::string& claimsJson, const std::string& secret) {
    const std::string signingInput = Base64UrlEncode(R"({"alg":"HS256","typ":"JWT"})") + "." + Base64UrlEncode(claimsJson);
    return signingInput + "." + Base64UrlEncode(hmacSha256(secret, signingInput));
}

JwtHs256Verifier::JwtHs256Verifier(Options opts) : opts_(std::move(opts)) {}

bool JwtHs256Verifier::Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) {
    FUNC_SCOPE();
    if (opts_.secret.empty()) {
        errorMessage = "verifier has no secret";
        return false;
    }
    std::string headerB64, payloadB64, signatureB64;
    if (!splitToken(token, headerB64, payloadB64, signatureB64)) {
        errorMessage = "malformed token";
        return false;
    }

    JSONValue header;
    if (!decodeJsonSegment(headerB64, header)) {
        errorMessage = "malformed token header";
        return false;
    }
    const JSONValue* alg = findMember(header, "alg");
    if (alg == nullptr || !alg->isString() || std::get<std::string>(alg->value) != "HS256") {
        errorMessage = "unsupported token algorithm";
        return false;
    }

    auto signature = Base64UrlDecode(signatureB64);
    const std::string expected = hmacSha256(opts_.secret, headerB64 + "." + payloadB64);
    if (!signature.has_value() || expected.empty() || signature->size() != expected.size() ||
        ::CRYPTO_memcmp(signature->data(), expected.data(), expected.size()) != 0) {
        errorMessage = "invalid token signature";
        return false;
    }

    JSONValue claims;
    if (!decodeJsonSegment(payloadB64, claims)) {
        errorMessage = "malformed token payload";
        return false;
    }

    const auto now = std::chrono::system_clock::now();
    const auto leeway = std::chrono::seconds(opts_.leewaySeconds);
    auto exp = timeClaim(claims, "exp");
    if (!exp.has_value()) {
        errorMessage = findMember(claims, "exp") != nullptr ? "token has invalid expiration" : "token missing expiration";
        return false;
    }
    if (exp.value() + leeway <= now) {
        errorMessage = "token expired";
        return false;
    }
    auto nbf = timeClaim(claims, "nbf");
    if (!nbf.has_value() && findMember(claims, "nbf") != nullptr) {
        errorMessage = "token has invalid not-before";
        return false;
    }
    if (nbf.has_value() && nbf.value() - leeway > now) {
        errorMessage = "token not yet valid";
        return false;
    }
    if (!opts_.issuer.empty()) {
        const JSONValue* iss = findMember(claims, "iss");
        if (iss == nullptr || !iss->isString() || std::get<std::string>(iss->value) != opts_.issuer) {
            errorMessage = "token issuer mismatch";
            return false;
        }
    }
    if (!opts_.audience.empty() && !audienceMatches(claims, opts_.audience)) {
        errorMessage = "token audience mismatch";
        return false;
    }

    TokenInfo info;
    info.expiration = exp.value() + leeway;
    for (const auto& [name, value] : std::get<JSONValue::Object>(claims.value)) {
        if (!value) continue;
        if (name == "sub" && value->isString()) {
            info.subject = std::get<std::string>(value->value);
        } else if (name == "scope" && value->isString()) {
            info.scopes = splitScopes(std::get<std::string>(value->value));
        } else if (name == "scopes" && value->isArray() && info.scopes.empty()) {
            for (const auto& s : std::get<JSONValue::Array>(value->value)) {
                if (s && s->isString()) info.scopes.push_back(std::get<std::string>(s->value));
            }
        } else if (value->isString()) {
            info.extra[name] = std::get<std::string>(value->value);
        }
    }
    outInfo = std::move(info);
    return true;
}

} // namespace mcpgw::auth
