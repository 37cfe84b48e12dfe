//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/GatewayOptions.cpp
// Purpose: Gateway process option loading and validation
//==========================================================================================================

#include "mcpgw/GatewayOptions.h"

#include <algorithm>
#include <cctype>
#include <cstddef>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace mcpgw {

namespace {

void overlay(std::string& field, const char* envName, int argc, char** argv, const std::string& key) {
    if (auto v = GetEnvOptional(envName); v.has_value()) {
        field = v.value();
    }
    if (auto v = GetArgValue(argc, argv, key); v.has_value()) {
        field = v.value();
    }
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

bool HasFlag(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        if (argv[i] != nullptr && key == argv[i]) {
            return true;
        }
    }
    return false;
}

bool ValidatePort(const std::string& port, std::string& errorMessage) {
    if (port.empty()) {
        errorMessage = "invalid port: empty";
        return false;
    }
    bool allDigits = std::all_of(port.begin(), port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
    if (!allDigits) {
        errorMessage = std::string("invalid port (non-numeric): ") + port;
        return false;
    }
    if (port.size() > 5 || std::stoul(port) > 65535ul) {
        errorMessage = std::string("invalid port (out of range): ") + port;
        return false;
    }
    return true;
}

bool ValidateGatewayOptions(const GatewayOptions& opts, std::string& errorMessage) {
    if (!ValidatePort(opts.port, errorMessage)) {
        return false;
    }
    if (opts.scheme != "http" && opts.scheme != "https") {
        errorMessage = std::string("invalid scheme (expected http or https): ") + opts.scheme;
        return false;
    }
    if (opts.scheme == "https" && (opts.certFile.empty() || opts.keyFile.empty())) {
        errorMessage = "https requires both --cert and --key";
        return false;
    }
    return true;
}

bool LoadGatewayOptions(int argc, char** argv, GatewayOptions& out, std::string& errorMessage) {
    GatewayOptions opts;
    overlay(opts.address, "MCPGW_ADDRESS", argc, argv, "--address");
    overlay(opts.port, "MCPGW_PORT", argc, argv, "--port");
    overlay(opts.scheme, "MCPGW_SCHEME", argc, argv, "--scheme");
    overlay(opts.certFile, "MCPGW_CERT_FILE", argc, argv, "--cert");
    overlay(opts.keyFile, "MCPGW_KEY_FILE", argc, argv, "--key");
    overlay(opts.serversFile, "MCPGW_SERVERS_FILE", argc, argv, "--servers-file");
    overlay(opts.actionUrl, "MCPGW_ACTION_URL", argc, argv, "--action-url");
    overlay(opts.actionToken, "MCPGW_ACTION_TOKEN", argc, argv, "--action-token");
    overlay(opts.jwtSecret, "MCPGW_JWT_SECRET", argc, argv, "--jwt-secret");
    overlay(opts.logLevel, "MCPGW_LOG_LEVEL", argc, argv, "--log-level");
    overlay(opts.logFile, "MCPGW_LOG_FILE", argc, argv, "--log-file");

    std::string useDefaults = opts.useDefaultServers ? "true" : "false";
    overlay(useDefaults, "MCPGW_USE_DEFAULT_SERVERS", argc, argv, "--use-default-servers");
    opts.useDefaultServers = IsTruthy(useDefaults) || HasFlag(argc, argv, "--use-default-servers");

    if (!ValidateGatewayOptions(opts, errorMessage)) {
        LOG_ERROR("Invalid gateway options: {}", errorMessage);
        return false;
    }
    out = std::move(opts);
    return true;
}

} // namespace mcpgw
