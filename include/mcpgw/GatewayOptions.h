//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayOptions.h
// Purpose: Gateway process options from --key=value arguments layered over MCPGW_* environment variables
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace mcpgw {

//==========================================================================================================
// GatewayOptions
// Fields (CLI option / environment variable / default):
//   address           --address / MCPGW_ADDRESS / 0.0.0.0
//   port              --port / MCPGW_PORT / 8080
//   scheme            --scheme / MCPGW_SCHEME / http
//   certFile, keyFile --cert, --key / MCPGW_CERT_FILE, MCPGW_KEY_FILE (required for https)
//   serversFile       --servers-file / MCPGW_SERVERS_FILE (empty: read MCPGW_MCP_SERVERS)
//   actionUrl         --action-url / MCPGW_ACTION_URL / http://127.0.0.1:8081
//   actionToken       --action-token / MCPGW_ACTION_TOKEN (bearer token for the action service)
//   jwtSecret         --jwt-secret / MCPGW_JWT_SECRET (empty: no authentication)
//   logLevel          --log-level / MCPGW_LOG_LEVEL / INFO
//   logFile           --log-file / MCPGW_LOG_FILE
//   useDefaultServers --use-default-servers / MCPGW_USE_DEFAULT_SERVERS / false
//==========================================================================================================
struct GatewayOptions {
    std::string address{"0.0.0.0"};
    std::string port{"8080"};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;
    std::string serversFile;
    std::string actionUrl{"http://127.0.0.1:8081"};
    std::string actionToken;
    std::string jwtSecret;
    std::string logLevel{"INFO"};
    std::string logFile;
    bool useDefaultServers{false};
};

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--port")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

// True when the bare flag (e.g. "--use-default-servers") appears without a value.
bool HasFlag(int argc, char** argv, const std::string& key);

// Numeric and within [0, 65535].
bool ValidatePort(const std::string& port, std::string& errorMessage);

// Port, scheme, and https certificate/key presence.
bool ValidateGatewayOptions(const GatewayOptions& opts, std::string& errorMessage);

//==========================================================================================================
// LoadGatewayOptions
// Purpose: Fills out from the environment, then from the command line, then validates.
// Returns:
//   false with errorMessage when the resulting options are invalid.
//==========================================================================================================
bool LoadGatewayOptions(int argc, char** argv, GatewayOptions& out, std::string& errorMessage);

} // namespace mcpgw
