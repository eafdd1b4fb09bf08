// SPDX-License-Identifier: Apache-2.0
#include "HttpServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <httplib.h>

#include <format>

namespace replbridge
{

namespace
{

    constexpr auto JsonContentType = "application/json";

    void sendJson(httplib::Response& res, const nlohmann::json& body, int status = 200)
    {
        res.status = status;
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_content(json::serialize(body), JsonContentType);
    }

} // namespace

struct HttpServer::Impl
{
    Impl(const Dispatcher& owner, HttpServerConfig settings): dispatcher(owner), config(std::move(settings))
    {
    }

    const Dispatcher& dispatcher;
    HttpServerConfig config;
    httplib::Server server;
    int boundPort = -1;

    void setupRoutes();
    void handlePost(const httplib::Request& req, httplib::Response& res);
};

void HttpServer::Impl::setupRoutes()
{
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        sendJson(res, nlohmann::json { { "status", "ok" } });
    });

    server.Get(".*", [](const httplib::Request&, httplib::Response& res) {
        sendJson(res,
                 jsonrpc::makeErrorResponse(
                     nullptr, jsonrpc::errc::InvalidRequest, "Use POST for JSON-RPC requests"),
                 400);
    });

    server.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "POST, GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    server.Post(".*", [this](const httplib::Request& req, httplib::Response& res) { handlePost(req, res); });

    // SO_REUSEADDR only: a port held by another process must fail to bind.
    server.set_socket_options([](socket_t sock) {
        auto yes = 1;
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log::trace("{} {} -> {}", req.method, req.path, res.status);
    });
}

void HttpServer::Impl::handlePost(const httplib::Request& req, httplib::Response& res)
{
    try
    {
        if (req.body.empty())
        {
            sendJson(res,
                     jsonrpc::makeErrorResponse(nullptr, jsonrpc::errc::InvalidRequest, "Empty request body"),
                     400);
            return;
        }

        auto request = json::parse(req.body);
        if (!request)
        {
            sendJson(res,
                     jsonrpc::makeErrorResponse(nullptr,
                                                jsonrpc::errc::ParseError,
                                                std::format("Parse error: {}", request.error().message)),
                     400);
            return;
        }

        auto const response = dispatcher.dispatch(*request);
        if (!response)
        {
            // Notifications have no response envelope.
            res.status = 204;
            res.set_header("Access-Control-Allow-Origin", "*");
            return;
        }

        sendJson(res, *response);
    }
    catch (const std::exception& e)
    {
        log::error("Internal error while handling HTTP request: {}", e.what());
        sendJson(res,
                 jsonrpc::makeErrorResponse(
                     nullptr, jsonrpc::errc::InternalError, std::format("Internal error: {}", e.what())),
                 500);
    }
}

HttpServer::HttpServer(const Dispatcher& dispatcher, HttpServerConfig config):
    _impl(std::make_unique<Impl>(dispatcher, std::move(config)))
{
    _impl->setupRoutes();
}

HttpServer::~HttpServer()
{
    stop();
}

auto HttpServer::bind() -> Result<int>
{
    auto const& config = _impl->config;

    if (config.port == 0)
        _impl->boundPort = _impl->server.bind_to_any_port(config.host);
    else if (_impl->server.bind_to_port(config.host, config.port))
        _impl->boundPort = config.port;
    else
        _impl->boundPort = -1;

    if (_impl->boundPort <= 0)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to bind HTTP server to {}:{}", config.host, config.port));

    return _impl->boundPort;
}

auto HttpServer::listen() -> VoidResult
{
    if (_impl->boundPort <= 0)
        return makeError(ErrorCode::IoError, "HTTP server is not bound");

    log::info("MCP Julia REPL Adapter running on http://{}:{}", _impl->config.host, _impl->boundPort);

    if (!_impl->server.listen_after_bind())
        return makeError(ErrorCode::IoError, "HTTP listener stopped unexpectedly");

    log::info("Shutting down HTTP server");
    return {};
}

void HttpServer::stop()
{
    _impl->server.stop();
}

void HttpServer::waitUntilReady() const
{
    _impl->server.wait_until_ready();
}

} // namespace replbridge
