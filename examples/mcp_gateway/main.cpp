//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: MCP gateway executable (HTTP/HTTPS front end over the RPC dispatcher)
//==========================================================================================================

#include <csignal>
#include <future>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "mcpgw/GatewayHTTPServer.hpp"
#include "mcpgw/GatewayOptions.h"
#include "mcpgw/RpcDispatcher.h"
#include "mcpgw/actions/HttpActionBackend.hpp"
#include "mcpgw/auth/JwtVerifier.hpp"
#include "mcpgw/auth/ServerAuth.hpp"
#include "mcpgw/config/ConfigStore.h"
#include "mcpgw/version.h"

using namespace mcpgw;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    GatewayOptions opts;
    std::string err;
    if (!LoadGatewayOptions(argc, argv, opts, err)) {
        std::cerr << "mcp_gateway: " << err << std::endl;
        return 2;
    }

    Logger::setLogLevelFromString(opts.logLevel);
    if (!opts.logFile.empty()) {
        Logger::setLogFile(opts.logFile);
    }
    LOG_INFO("mcp-gateway {} starting", getVersionString());

    // Server definitions: a file when configured, otherwise MCPGW_MCP_SERVERS
    std::shared_ptr<config::IConfigStore> store;
    if (!opts.serversFile.empty()) {
        LOG_INFO("Reading server definitions from {}", opts.serversFile);
        store = std::make_shared<config::FileConfigStore>(opts.serversFile);
    } else {
        store = std::make_shared<config::EnvConfigStore>();
    }
    if (opts.useDefaultServers) {
        LOG_INFO("Built-in sample servers enabled");
        store = std::make_shared<config::DefaultServersConfigStore>(store);
    }

    actions::HttpActionBackend::Options backendOpts;
    backendOpts.baseUrl = opts.actionUrl;
    backendOpts.bearerToken = opts.actionToken;
    auto backend = std::make_shared<actions::HttpActionBackend>(backendOpts);

    auto dispatcher = std::make_shared<RpcDispatcher>(store, backend);

    GatewayHTTPServer::Options httpOpts;
    httpOpts.address = opts.address;
    httpOpts.port = opts.port;
    httpOpts.scheme = opts.scheme;
    httpOpts.certFile = opts.certFile;
    httpOpts.keyFile = opts.keyFile;

    std::unique_ptr<GatewayHTTPServer> server;
    try {
        server = std::make_unique<GatewayHTTPServer>(httpOpts, dispatcher);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create HTTP server: {}", e.what());
        return 1;
    }

    if (!opts.jwtSecret.empty()) {
        auth::JwtHs256Verifier::Options jwtOpts;
        jwtOpts.secret = opts.jwtSecret;
        auto verifier = std::make_shared<auth::JwtHs256Verifier>(jwtOpts);
        server->SetAuthenticator(std::make_shared<auth::BearerAuthenticator>(verifier, auth::RequireBearerTokenOptions{}));
        LOG_INFO("Bearer authentication enabled");
    } else {
        LOG_WARN("No JWT secret configured; requests are not authenticated");
    }

    server->SetErrorHandler([](const std::string& msg) {
        LOG_DEBUG("Gateway transport error: {}", msg);
    });

    try {
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start gateway: {}", e.what());
        return 1;
    }

    // Block until SIGINT/SIGTERM
    boost::asio::io_context signals;
    boost::asio::signal_set sigs(signals, SIGINT, SIGTERM);
    sigs.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
    });
    signals.run();

    server->Stop().get();
    LOG_INFO("mcp-gateway stopped");
    return 0;
}
