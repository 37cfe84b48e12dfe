//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpActionBackend.cpp
// Purpose: Boost.Beast HTTP/HTTPS client for the action execution service
//==========================================================================================================

#include "mcpgw/actions/HttpActionBackend.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <openssl/err.h>

#include <chrono>
#include <sstream>

#include "logging/Logger.h"

namespace mcpgw {
namespace actions {

namespace net = boost::asio;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

// Small parser adequate for http(s)://host[:port][/base]
UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

std::string encodePathSegment(const std::string& s) {
    std::ostringstream oss;
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

// Embeds serialized JSON as a value; falls back to a string when it does not parse.
std::shared_ptr<JSONValue> embedJson(const std::string& text) {
    JSONValue v;
    std::string err;
    if (tryParseJSON(text, v, err)) {
        return makeJSON(std::move(v));
    }
    return makeJSON(JSONValue(text));
}

struct HttpReply {
    unsigned int status{0};
    std::string body;
};

} // namespace

class HttpActionBackend::Impl {
public:
    Options opts;
    std::unique_ptr<ssl::context> sslCtx;
    bool caInitOk{true};

    explicit Impl(const Options& o) : opts(o) {
        if (parseUrl(opts.baseUrl).scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::ERR_clear_error();
            try {
                if (!opts.caFile.empty() || !opts.caPath.empty()) {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } else {
                    sslCtx->set_default_verify_paths();
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Action backend: failed to load CA material: {}", e.what());
                caInitOk = false;
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    template <typename Stream>
    net::awaitable<HttpReply> exchange(Stream& stream, const UrlParts& u, const std::string& body) {
        http::request<http::string_body> req{http::verb::post, u.path, 11};
        req.set(http::field::host, u.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        if (!opts.bearerToken.empty()) {
            req.set(http::field::authorization, std::string("Bearer ") + opts.bearerToken);
        }
        req.body() = body;
        req.prepare_payload();
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        co_return HttpReply{res.result_int(), res.body()};
    }

    net::awaitable<HttpReply> coPost(const std::string& url, const std::string& body) {
        UrlParts u = parseUrl(url);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        LOG_DEBUG("Action backend: resolved {}:{} path={}", u.host, u.port, u.path);

        if (u.scheme == "https") {
            if (!sslCtx || !caInitOk) {
                throw std::runtime_error("HTTPS action backend is not configured");
            }
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                LOG_WARN("Action backend: failed to set SNI hostname {}", u.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            HttpReply reply = co_await exchange(stream, u, body);
            boost::system::error_code ec;
            stream.shutdown(ec);
            co_return reply;
        }
        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await stream.async_connect(results, net::use_awaitable);
        stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        HttpReply reply = co_await exchange(stream, u, body);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return reply;
    }
};

HttpActionBackend::HttpActionBackend(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

HttpActionBackend::~HttpActionBackend() = default;

std::string HttpActionBackend::RunUrl(const std::string& actionId) const {
    std::string base = pImpl->opts.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/actions/" + encodePathSegment(actionId) + "/run";
}

std::string HttpActionBackend::BuildRequestBody(const ActionRunInput& input) {
    JSONValue::Object o;
    o["input"] = embedJson(input.payload.input);
    o["configurations"] = embedJson(input.payload.configurations);
    return serializeJSONValue(JSONValue(std::move(o)));
}

ActionRunResult HttpActionBackend::Run(const ActionRunInput& input) {
    FUNC_SCOPE();
    const std::string url = RunUrl(input.actionId);
    const std::string body = BuildRequestBody(input);
    HttpReply reply;
    try {
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, pImpl->coPost(url, body), net::use_future);
        ioc.run();
        reply = fut.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Action backend request to {} failed: {}", url, e.what());
        return ActionRunResult::RunFailed(std::string("request to action service failed: ") + e.what());
    }

    if (reply.status >= 200 && reply.status < 300) {
        return ActionRunResult::Ok(std::move(reply.body));
    }
    if (reply.status == 401 || reply.status == 403) {
        return ActionRunResult::Forbidden();
    }
    return ActionRunResult::RunFailed("HTTP " + std::to_string(reply.status) + ": " + reply.body);
}

} // namespace actions
} // namespace mcpgw
