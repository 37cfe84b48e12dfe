//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_action_backend.cpp
// Purpose: GoogleTests for the HTTP action backend (URL/body construction and status mapping)
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/actions/HttpActionBackend.hpp"

using namespace mcpgw;
using namespace mcpgw::actions;
namespace http = boost::beast::http;

namespace {

//==========================================================================================================
// OneShotActionService
// Purpose: Accepts a single connection on an ephemeral port, records the request and replies with a
//   canned status and body.
//==========================================================================================================
class OneShotActionService {
public:
    OneShotActionService(unsigned int status, std::string body)
        : acceptor_(ioc_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, status, body = std::move(body)]() {
            boost::system::error_code ec;
            boost::asio::ip::tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec) return;
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec) return;
            target = std::string(req.target());
            requestBody = req.body();
            authorization = std::string(req[http::field::authorization]);

            http::response<http::string_body> res{static_cast<http::status>(status), 11};
            res.set(http::field::content_type, "application/json");
            res.body() = body;
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        });
    }

    ~OneShotActionService() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (thread_.joinable()) thread_.join();
    }

    // Call after the backend request has completed.
    void join() {
        if (thread_.joinable()) thread_.join();
    }

    unsigned short port{0};
    std::string target;
    std::string requestBody;
    std::string authorization;

private:
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
};

ActionRunInput weatherInput() {
    ActionRunInput in;
    in.actionId = "action-weather-get";
    in.payload.input = R"({"location":"Amsterdam"})";
    in.payload.configurations = "{}";
    return in;
}

//==========================================================================================================
// findFreePort
// Purpose: Obtain an available local TCP port by binding to port 0 temporarily.
//==========================================================================================================
static unsigned short findFreePort() {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::acceptor acc(ioc);
    tcp::endpoint ep(tcp::v4(), 0);
    acc.open(ep.protocol());
    acc.set_option(tcp::acceptor::reuse_address(true));
    acc.bind(ep);
    auto port = acc.local_endpoint().port();
    acc.close();
    return port;
}

} // namespace

TEST(HttpActionBackend, RunUrlEncodesActionId) {
    HttpActionBackend::Options opts;
    opts.baseUrl = "http://actions.local:8081/api/";
    HttpActionBackend backend(opts);
    EXPECT_EQ(backend.RunUrl("action-weather-get"), "http://actions.local:8081/api/actions/action-weather-get/run");
    EXPECT_EQ(backend.RunUrl("a/b c"), "http://actions.local:8081/api/actions/a%2Fb%20c/run");
}

TEST(HttpActionBackend, RequestBodyEmbedsJson) {
    JSONValue body = parseJSON(HttpActionBackend::BuildRequestBody(weatherInput()));
    const JSONValue* input = findMember(body, "input");
    ASSERT_NE(input, nullptr);
    EXPECT_EQ(std::get<std::string>(findMember(*input, "location")->value), "Amsterdam");
    EXPECT_TRUE(findMember(body, "configurations")->isObject());

    ActionRunInput raw = weatherInput();
    raw.payload.input = "not json";
    JSONValue fallback = parseJSON(HttpActionBackend::BuildRequestBody(raw));
    EXPECT_EQ(std::get<std::string>(findMember(fallback, "input")->value), "not json");
}

TEST(HttpActionBackend, SuccessReturnsBody) {
    OneShotActionService service(200, R"({"text":"sunny"})");
    HttpActionBackend::Options opts;
    opts.baseUrl = "http://127.0.0.1:" + std::to_string(service.port);
    opts.bearerToken = "svc-token";
    HttpActionBackend backend(opts);

    ActionRunResult r = backend.Run(weatherInput());
    service.join();
    ASSERT_EQ(r.status, ActionRunStatus::Ok) << r.message;
    EXPECT_EQ(r.result, R"({"text":"sunny"})");
    EXPECT_EQ(service.target, "/actions/action-weather-get/run");
    EXPECT_EQ(service.authorization, "Bearer svc-token");
    EXPECT_TRUE(jsonEquals(parseJSON(service.requestBody),
                           parseJSON(R"({"input":{"location":"Amsterdam"},"configurations":{}})")));
}

TEST(HttpActionBackend, ForbiddenStatus) {
    OneShotActionService service(403, R"({"error":"denied"})");
    HttpActionBackend::Options opts;
    opts.baseUrl = "http://127.0.0.1:" + std::to_string(service.port);
    HttpActionBackend backend(opts);
    ActionRunResult r = backend.Run(weatherInput());
    service.join();
    EXPECT_EQ(r.status, ActionRunStatus::Forbidden);
}

TEST(HttpActionBackend, ServerErrorIsRunFailed) {
    OneShotActionService service(500, "boom");
    HttpActionBackend::Options opts;
    opts.baseUrl = "http://127.0.0.1:" + std::to_string(service.port);
    HttpActionBackend backend(opts);
    ActionRunResult r = backend.Run(weatherInput());
    service.join();
    EXPECT_EQ(r.status, ActionRunStatus::RunFailed);
    EXPECT_EQ(r.message, "HTTP 500: boom");
}

TEST(HttpActionBackend, ConnectionFailureIsRunFailed) {
    HttpActionBackend::Options opts;
    opts.baseUrl = "http://127.0.0.1:" + std::to_string(findFreePort());
    opts.connectTimeoutMs = 2000;
    HttpActionBackend backend(opts);
    ActionRunResult r = backend.Run(weatherInput());
    EXPECT_EQ(r.status, ActionRunStatus::RunFailed);
    EXPECT_EQ(r.message.rfind("request to action service failed: ", 0), 0u);
}
