//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigStore.h
// Purpose: Runtime configuration store interface, stock stores, and per-request server config loading
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "mcpgw/Protocol.h"

namespace mcpgw {
namespace config {

// Configuration key holding the JSON-encoded {"mcp-servers": [...]} document
constexpr const char* kMcpServersKey = "mcp_servers";

using ConfigEntries = std::vector<std::pair<std::string, std::string>>;

//==========================================================================================================
// IConfigStore
// Purpose: Source of runtime configuration as ordered key/value pairs.
// Returns: true with out populated; false with errorMessage when the store cannot be read.
//==========================================================================================================
class IConfigStore {
public:
    virtual ~IConfigStore() = default;
    virtual bool GetAll(ConfigEntries& out, std::string& errorMessage) = 0;
};

//==========================================================================================================
// LoadServerConfig
// Purpose: Reads kMcpServersKey from the store and returns the configuration of serverId.
// Errors (errorMessage):
//   "mcp_servers key not found in runtime configuration"
//   "Failed to parse mcp_servers config: {detail}"
//   "MCP server '{id}' not found in configuration"
//==========================================================================================================
bool LoadServerConfig(IConfigStore& store, const std::string& serverId, ServerConfig& out, std::string& errorMessage);

// Built-in sample servers: weather-server-001 (get_weather) and calculator-server-001 (add_numbers).
ServersConfig DefaultServersConfig();

//==========================================================================================================
// InMemoryConfigStore
// Purpose: Thread-safe store backed by a vector; Set replaces an existing key in place.
//==========================================================================================================
class InMemoryConfigStore : public IConfigStore {
public:
    InMemoryConfigStore() = default;
    explicit InMemoryConfigStore(ConfigEntries entries) : entries_(std::move(entries)) {}

    void Set(const std::string& key, const std::string& value);
    void Remove(const std::string& key);
    bool GetAll(ConfigEntries& out, std::string& errorMessage) override;

private:
    std::mutex mutex_;
    ConfigEntries entries_;
};

// Publishes the MCPGW_MCP_SERVERS environment variable (when set) as kMcpServersKey.
class EnvConfigStore : public IConfigStore {
public:
    explicit EnvConfigStore(std::string variable = "MCPGW_MCP_SERVERS") : variable_(std::move(variable)) {}
    bool GetAll(ConfigEntries& out, std::string& errorMessage) override;

private:
    std::string variable_;
};

//==========================================================================================================
// FileConfigStore
// Purpose: Publishes the whole content of a file as kMcpServersKey. The file is re-read on every call.
// Notes:
//   A missing file yields an empty entry list; an unreadable existing file is an error.
//==========================================================================================================
class FileConfigStore : public IConfigStore {
public:
    explicit FileConfigStore(std::string path) : path_(std::move(path)) {}
    bool GetAll(ConfigEntries& out, std::string& errorMessage) override;

private:
    std::string path_;
};

//==========================================================================================================
// DefaultServersConfigStore
// Purpose: Decorator that adds the built-in sample servers when the wrapped store has no
//   kMcpServersKey entry. Entries of the wrapped store are passed through unchanged.
//==========================================================================================================
class DefaultServersConfigStore : public IConfigStore {
public:
    explicit DefaultServersConfigStore(std::shared_ptr<IConfigStore> inner) : inner_(std::move(inner)) {}
    bool GetAll(ConfigEntries& out, std::string& errorMessage) override;

private:
    std::shared_ptr<IConfigStore> inner_;
};

} // namespace config
} // namespace mcpgw
