//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/GatewayHTTPServer.cpp
// Purpose: HTTP/HTTPS gateway front end using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <mutex>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/GatewayHTTPServer.hpp"
#include "mcpgw/GatewayOptions.h"

#include <openssl/ssl.h>

namespace mcpgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kRoutePrefix = "/mcp/";

GatewayHttpResponse transportError(unsigned int status, const std::string& message) {
    GatewayHttpResponse res;
    res.status = status;
    res.body = TransportErrorBody(message);
    return res;
}

} // namespace

bool ExtractServerId(const std::string& target, std::string& serverId, std::string& errorMessage) {
    std::string path = target.substr(0, target.find('?'));
    if (path.rfind(kRoutePrefix, 0) != 0) {
        errorMessage = "Method Not Allowed. Expected POST to /mcp/{server-id}";
        return false;
    }
    std::string rest = path.substr(std::string(kRoutePrefix).size());
    serverId = rest.substr(0, rest.find('/'));
    if (serverId.empty()) {
        errorMessage = "Server ID cannot be empty. Expected /mcp/{server-id}";
        return false;
    }
    return true;
}

std::string TransportErrorBody(const std::string& message) {
    JSONRPCId id = nullptr;
    return errors::makeErrorResponse(id, errors::makeError(JSONRPCErrorCodes::ServerError, sanitizeUtf8(message)))
        ->Serialize();
}

class GatewayHTTPServer::Impl {
public:
    GatewayHTTPServer::Options opts;
    std::shared_ptr<const RpcDispatcher> dispatcher;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::mutex handlersMutex;
    std::shared_ptr<auth::IRequestAuthenticator> authenticator;
    GatewayHTTPServer::ErrorHandler errorHandler;

    Impl(const GatewayHTTPServer::Options& o, std::shared_ptr<const RpcDispatcher> d)
        : opts(o), dispatcher(std::move(d)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("GatewayHTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        running.store(false);
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        GatewayHTTPServer::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            handler = errorHandler;
        }
        LOG_ERROR("{}", msg);
        if (handler) { handler(msg); }
    }

    std::shared_ptr<auth::IRequestAuthenticator> currentAuthenticator() {
        std::lock_guard<std::mutex> lock(handlersMutex);
        return authenticator;
    }

    GatewayHttpResponse handle(const GatewayHttpRequest& req) {
        FUNC_SCOPE();
        if (req.method != "POST" || req.target.rfind(kRoutePrefix, 0) != 0) {
            return transportError(405, "Method Not Allowed. Expected POST to /mcp/{server-id}");
        }

        std::string serverId;
        std::string err;
        if (!ExtractServerId(req.target, serverId, err)) {
            return transportError(errors::httpStatusForCategory(errors::ErrorCategory::Transport), err);
        }

        if (auth::FindHeader(req.headers, "Content-Type").find("application/json") == std::string::npos) {
            return transportError(errors::httpStatusForCategory(errors::ErrorCategory::Transport),
                                  "Content-Type must be application/json");
        }

        auto authn = currentAuthenticator();
        auth::TokenInfo info;
        if (authn) {
            std::string reason;
            if (!authn->Validate(req.headers, info, reason)) {
                LOG_INFO("Rejected request for server '{}': {}", serverId, reason);
                auto res = transportError(errors::httpStatusForCategory(errors::ErrorCategory::Auth), "Unauthorized");
                res.wwwAuthenticate = authn->Challenge();
                return res;
            }
        }

        if (!isValidUtf8(req.body)) {
            return transportError(errors::httpStatusForCategory(errors::ErrorCategory::Transport),
                                  "Invalid UTF-8 in body");
        }

        if (!dispatcher) {
            return transportError(errors::httpStatusForCategory(errors::ErrorCategory::Unknown),
                                  "No dispatcher configured");
        }

        GatewayHttpResponse res;
        try {
            auth::TokenInfoScope scope(authn ? &info : nullptr);
            res.body = dispatcher->Process(serverId, req.body)->Serialize();
        } catch (const std::exception& e) {
            LOG_ERROR("Request for server '{}' failed: {}", serverId, e.what());
            JSONRPCId id = nullptr;
            res.status = errors::httpStatusForCategory(errors::ErrorCategory::Unknown);
            res.body = errors::makeErrorResponse(
                id, errors::makeError(JSONRPCErrorCodes::InternalError,
                                      sanitizeUtf8(std::string("Internal error: ") + e.what())))->Serialize();
        }
        return res;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        GatewayHttpRequest in;
        in.method = std::string(req.method_string());
        in.target = std::string(req.target());
        for (const auto& field : req) {
            in.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
        }
        in.body = req.body();

        GatewayHttpResponse out = handle(in);

        http::response<http::string_body> res{static_cast<http::status>(out.status), req.version()};
        res.set(http::field::content_type, "application/json");
        if (!out.wwwAuthenticate.empty()) {
            res.set(http::field::www_authenticate, out.wwwAuthenticate);
        }
        res.keep_alive(false);
        res.body() = std::move(out.body);
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            // close after single request
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("GatewayHTTPServer plain session ended during shutdown: {}", e.what());
            } else {
                setError(std::string("GatewayHTTPServer plain session error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = makeResponse(req);
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("GatewayHTTPServer TLS session ended during shutdown: {}", e.what());
            } else {
                setError(std::string("GatewayHTTPServer TLS session error: ") + e.what());
            }
        }
        co_return;
    }

    // Throws on invalid port or bind failure.
    void bind() {
        std::string err;
        if (!ValidatePort(opts.port, err)) {
            throw std::invalid_argument(err);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        LOG_INFO("Gateway listening on {}://{}:{}", opts.scheme, opts.address, acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("GatewayHTTPServer accept ended during shutdown: {}", e.what());
            } else {
                setError(std::string("GatewayHTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

GatewayHTTPServer::GatewayHTTPServer(const Options& opts, std::shared_ptr<const RpcDispatcher> dispatcher)
    : pImpl(std::make_unique<Impl>(opts, std::move(dispatcher))) {}

GatewayHTTPServer::~GatewayHTTPServer() = default;

std::future<void> GatewayHTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("GatewayHTTPServer failed to start: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this]() {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("GatewayHTTPServer I/O thread error: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> GatewayHTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void GatewayHTTPServer::SetAuthenticator(std::shared_ptr<auth::IRequestAuthenticator> authenticator) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->authenticator = std::move(authenticator);
}

void GatewayHTTPServer::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->errorHandler = std::move(handler);
}

GatewayHttpResponse GatewayHTTPServer::Handle(const GatewayHttpRequest& req) const {
    return pImpl->handle(req);
}

} // namespace mcpgw
