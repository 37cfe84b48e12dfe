//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config_store.cpp
// Purpose: GoogleTests for server configuration parsing, lookup and the configuration stores
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/config/ConfigStore.h"

using namespace mcpgw;
using namespace mcpgw::config;

namespace {

const char* kOneServer = R"({"mcp-servers":[{"id":"s1","tools":[
    {"name":"echo","action-id":"act-echo","inputSchema":{"type":"object"}}]}]})";

std::filesystem::path tempFile(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

} // namespace

TEST(ServersConfig, ParsesToolsAndOptionalDescription) {
    ServersConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseServersConfig(parseJSON(kOneServer), cfg, err)) << err;
    ASSERT_EQ(cfg.servers.size(), 1u);
    ASSERT_EQ(cfg.servers[0].tools.size(), 1u);
    const ToolDefinition* def = cfg.servers[0].FindTool("echo");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->actionId, "act-echo");
    EXPECT_EQ(def->tool.description, "");
    EXPECT_EQ(cfg.servers[0].FindTool("nope"), nullptr);
}

TEST(ServersConfig, ReportsShapeViolations) {
    ServersConfig cfg;
    std::string err;
    EXPECT_FALSE(ParseServersConfig(parseJSON(R"({"mcp-servers":{}})"), cfg, err));
    EXPECT_EQ(err, "mcp-servers must be an array");
    EXPECT_FALSE(ParseServersConfig(parseJSON(R"({"mcp-servers":[{"id":"s","tools":[
        {"name":"a","action-id":"x","inputSchema":{}},{"name":1,"action-id":"y","inputSchema":{}}]}]})"), cfg, err));
    EXPECT_EQ(err, "mcp-servers[0].tools[1].name must be a string");
    EXPECT_FALSE(ParseServersConfig(parseJSON(R"({"mcp-servers":[{"id":"s","tools":[{"name":"a","inputSchema":{}}]}]})"), cfg, err));
    EXPECT_EQ(err, "mcp-servers[0].tools[0].action-id must be a string");
}

TEST(LoadServerConfig, FindsServerById) {
    InMemoryConfigStore store(ConfigEntries{{kMcpServersKey, kOneServer}});
    ServerConfig out;
    std::string err;
    ASSERT_TRUE(LoadServerConfig(store, "s1", out, err)) << err;
    EXPECT_EQ(out.id, "s1");
    EXPECT_FALSE(LoadServerConfig(store, "s2", out, err));
    EXPECT_EQ(err, "MCP server 's2' not found in configuration");
}

TEST(LoadServerConfig, MissingKeyAndBadDocument) {
    InMemoryConfigStore store;
    ServerConfig out;
    std::string err;
    EXPECT_FALSE(LoadServerConfig(store, "s1", out, err));
    EXPECT_EQ(err, "mcp_servers key not found in runtime configuration");

    store.Set(kMcpServersKey, "{not json");
    EXPECT_FALSE(LoadServerConfig(store, "s1", out, err));
    EXPECT_EQ(err.rfind("Failed to parse mcp_servers config: ", 0), 0u);

    store.Set(kMcpServersKey, R"({"servers":[]})");
    EXPECT_FALSE(LoadServerConfig(store, "s1", out, err));
    EXPECT_EQ(err, "Failed to parse mcp_servers config: mcp-servers must be an array");
}

TEST(InMemoryConfigStore, SetReplacesAndRemoveDeletes) {
    InMemoryConfigStore store;
    store.Set("a", "1");
    store.Set("b", "2");
    store.Set("a", "3");
    ConfigEntries entries;
    std::string err;
    ASSERT_TRUE(store.GetAll(entries, err));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0], (std::pair<std::string, std::string>{"a", "3"}));
    store.Remove("a");
    ASSERT_TRUE(store.GetAll(entries, err));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "b");
}

TEST(EnvConfigStore, PublishesVariableWhenSet) {
    const char* var = "MCPGW_TEST_SERVERS_ENV";
    ::unsetenv(var);
    EnvConfigStore store(var);
    ConfigEntries entries;
    std::string err;
    ASSERT_TRUE(store.GetAll(entries, err));
    EXPECT_TRUE(entries.empty());

    ::setenv(var, kOneServer, 1);
    ASSERT_TRUE(store.GetAll(entries, err));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, kMcpServersKey);
    EXPECT_EQ(entries[0].second, kOneServer);
    ::unsetenv(var);
}

TEST(FileConfigStore, ReadsWholeFileAndToleratesAbsence) {
    const auto path = tempFile("mcpgw_test_servers.json");
    std::filesystem::remove(path);
    FileConfigStore store(path.string());
    ConfigEntries entries;
    std::string err;
    ASSERT_TRUE(store.GetAll(entries, err)) << err;
    EXPECT_TRUE(entries.empty());

    {
        std::ofstream out(path);
        out << kOneServer;
    }
    ASSERT_TRUE(store.GetAll(entries, err)) << err;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].second, kOneServer);

    ServerConfig cfg;
    EXPECT_TRUE(LoadServerConfig(store, "s1", cfg, err)) << err;
    std::filesystem::remove(path);
}

TEST(DefaultServersConfigStore, AppliesOnlyWhenKeyMissing) {
    auto inner = std::make_shared<InMemoryConfigStore>();
    DefaultServersConfigStore store(inner);
    ServerConfig cfg;
    std::string err;
    ASSERT_TRUE(LoadServerConfig(store, "weather-server-001", cfg, err)) << err;
    ASSERT_NE(cfg.FindTool("get_weather"), nullptr);
    EXPECT_EQ(cfg.FindTool("get_weather")->actionId, "action-weather-get");
    ASSERT_TRUE(LoadServerConfig(store, "calculator-server-001", cfg, err)) << err;
    EXPECT_NE(cfg.FindTool("add_numbers"), nullptr);

    inner->Set(kMcpServersKey, kOneServer);
    EXPECT_FALSE(LoadServerConfig(store, "weather-server-001", cfg, err));
    EXPECT_TRUE(LoadServerConfig(store, "s1", cfg, err)) << err;
}

TEST(DefaultServersConfigStore, NullInnerStoreServesDefaults) {
    DefaultServersConfigStore store(nullptr);
    ConfigEntries entries;
    std::string err;
    ASSERT_TRUE(store.GetAll(entries, err));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, kMcpServersKey);
}

TEST(DefaultServersConfig, SampleServersRoundTrip) {
    ServersConfig defaults = DefaultServersConfig();
    ASSERT_EQ(defaults.servers.size(), 2u);
    ServersConfig again;
    std::string err;
    ASSERT_TRUE(ParseServersConfig(ServersConfigToJSON(defaults), again, err)) << err;
    EXPECT_EQ(again.servers[0].tools[0].actionId, defaults.servers[0].tools[0].actionId);
}
