//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigStore.cpp
// Purpose: Configuration stores and server configuration lookup
//==========================================================================================================

#include "mcpgw/config/ConfigStore.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace mcpgw {
namespace config {

namespace {

const char* kDefaultServersJson = R"({
    "mcp-servers": [
        {
            "id": "weather-server-001",
            "tools": [
                {
                    "action-id": "action-weather-get",
                    "name": "get_weather",
                    "description": "Gets the current weather conditions for a specific location.",
                    "inputSchema": {
                        "type": "object",
                        "properties": {
                            "location": {
                                "type": "string",
                                "description": "City and region, e.g. Amsterdam, NH"
                            },
                            "unit": {
                                "type": "string",
                                "enum": ["celsius", "fahrenheit"],
                                "description": "Temperature unit to use."
                            }
                        },
                        "required": ["location"]
                    }
                }
            ]
        },
        {
            "id": "calculator-server-001",
            "tools": [
                {
                    "action-id": "action-calc-add",
                    "name": "add_numbers",
                    "description": "Adds two numbers together",
                    "inputSchema": {
                        "type": "object",
                        "properties": {
                            "a": { "type": "number", "description": "First number" },
                            "b": { "type": "number", "description": "Second number" }
                        },
                        "required": ["a", "b"]
                    }
                }
            ]
        }
    ]
})";

bool hasKey(const ConfigEntries& entries, const std::string& key) {
    return std::any_of(entries.begin(), entries.end(), [&](const auto& kv){ return kv.first == key; });
}

} // namespace

bool LoadServerConfig(IConfigStore& store, const std::string& serverId, ServerConfig& out, std::string& errorMessage) {
    FUNC_SCOPE();
    ConfigEntries entries;
    std::string storeError;
    if (!store.GetAll(entries, storeError)) {
        errorMessage = "Failed to retrieve runtime configuration: " + storeError;
        return false;
    }

    // First matching key wins
    auto it = std::find_if(entries.begin(), entries.end(), [](const auto& kv){ return kv.first == kMcpServersKey; });
    if (it == entries.end()) {
        errorMessage = "mcp_servers key not found in runtime configuration";
        return false;
    }

    JSONValue doc;
    std::string parseError;
    if (!tryParseJSON(it->second, doc, parseError)) {
        errorMessage = "Failed to parse mcp_servers config: " + parseError;
        return false;
    }
    ServersConfig servers;
    if (!ParseServersConfig(doc, servers, parseError)) {
        errorMessage = "Failed to parse mcp_servers config: " + parseError;
        return false;
    }

    for (auto& server : servers.servers) {
        if (server.id == serverId) {
            LOG_DEBUG("Loaded configuration for server {} ({} tools)", serverId, server.tools.size());
            out = std::move(server);
            return true;
        }
    }
    errorMessage = "MCP server '" + serverId + "' not found in configuration";
    return false;
}

ServersConfig DefaultServersConfig() {
    ServersConfig config;
    std::string err;
    JSONValue doc;
    if (!tryParseJSON(kDefaultServersJson, doc, err) || !ParseServersConfig(doc, config, err)) {
        LOG_ERROR("Built-in server configuration is invalid: {}", err);
        return ServersConfig{};
    }
    return config;
}

//----------------------------------------------------------------------------------------------------------
// InMemoryConfigStore
//----------------------------------------------------------------------------------------------------------
void InMemoryConfigStore::Set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : entries_) {
        if (kv.first == key) {
            kv.second = value;
            return;
        }
    }
    entries_.emplace_back(key, value);
}

void InMemoryConfigStore::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const auto& kv){ return kv.first == key; }),
                   entries_.end());
}

bool InMemoryConfigStore::GetAll(ConfigEntries& out, std::string& /*errorMessage*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    out = entries_;
    return true;
}

//----------------------------------------------------------------------------------------------------------
// EnvConfigStore
//----------------------------------------------------------------------------------------------------------
bool EnvConfigStore::GetAll(ConfigEntries& out, std::string& /*errorMessage*/) {
    out.clear();
    if (auto value = GetEnvOptional(variable_.c_str())) {
        out.emplace_back(kMcpServersKey, *value);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------
// FileConfigStore
//----------------------------------------------------------------------------------------------------------
bool FileConfigStore::GetAll(ConfigEntries& out, std::string& errorMessage) {
    out.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LOG_DEBUG("Servers file {} does not exist", path_);
        return true;
    }
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        errorMessage = "cannot open " + path_ + ": " + std::strerror(errno);
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        errorMessage = "failed reading " + path_;
        return false;
    }
    out.emplace_back(kMcpServersKey, ss.str());
    return true;
}

//----------------------------------------------------------------------------------------------------------
// DefaultServersConfigStore
//----------------------------------------------------------------------------------------------------------
bool DefaultServersConfigStore::GetAll(ConfigEntries& out, std::string& errorMessage) {
    if (!inner_) {
        out.clear();
    } else if (!inner_->GetAll(out, errorMessage)) {
        return false;
    }
    if (!hasKey(out, kMcpServersKey)) {
        LOG_DEBUG("No {} entry in configuration; serving built-in sample servers", kMcpServersKey);
        out.emplace_back(kMcpServersKey, serializeJSONValue(ServersConfigToJSON(DefaultServersConfig())));
    }
    return true;
}

} // namespace config
} // namespace mcpgw
