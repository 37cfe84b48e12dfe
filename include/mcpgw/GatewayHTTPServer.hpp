//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayHTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS front end for the gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <functional>
#include <memory>
#include "mcpgw/RpcDispatcher.h"
#include "mcpgw/auth/ServerAuth.hpp"

namespace mcpgw {

// Transport-neutral view of one HTTP request
struct GatewayHttpRequest {
    std::string method;
    std::string target;
    auth::HeaderList headers;
    std::string body;
};

struct GatewayHttpResponse {
    unsigned int status{200};
    std::string body;             // always a JSON document
    std::string wwwAuthenticate;  // set on 401 when the authenticator provides a challenge
};

//==========================================================================================================
// ExtractServerId
// Purpose: Reads the server identity from "/mcp/{server-id}[/...][?query]".
// Returns:
//   false with errorMessage when the target does not carry a non-empty identity.
//==========================================================================================================
bool ExtractServerId(const std::string& target, std::string& serverId, std::string& errorMessage);

// {"jsonrpc":"2.0","error":{"code":-32000,"message":...},"id":null}
std::string TransportErrorBody(const std::string& message);

class GatewayHTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8080)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    // Throws std::exception when https is requested and the certificate or key cannot be loaded.
    GatewayHTTPServer(const Options& opts, std::shared_ptr<const RpcDispatcher> dispatcher);
    ~GatewayHTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound; it holds an exception when the port is
    //   invalid or cannot be bound.
    //==========================================================================================================
    std::future<void> Start();

    // Closes the acceptor, stops the I/O context, and joins the background thread.
    std::future<void> Stop();

    //==========================================================================================================
    // SetAuthenticator
    // Purpose: Requests to /mcp/{id} must pass the authenticator before the body is looked at.
    //   Without one every request is accepted.
    //==========================================================================================================
    void SetAuthenticator(std::shared_ptr<auth::IRequestAuthenticator> authenticator);

    void SetErrorHandler(ErrorHandler handler);

    //==========================================================================================================
    // Handle
    // Purpose: Routing and validation for one request, independent of the socket layer:
    //   405 wrong method/route, 400 empty server id / content type / invalid UTF-8 body,
    //   401 authentication failure, 200 dispatcher envelope, 500 when the dispatcher throws.
    //==========================================================================================================
    GatewayHttpResponse Handle(const GatewayHttpRequest& req) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
