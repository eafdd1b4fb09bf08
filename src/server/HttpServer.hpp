// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Dispatcher.hpp>

#include <memory>
#include <string>

namespace replbridge
{

/// @brief Listener settings for the HTTP front end.
struct HttpServerConfig
{
    std::string host = "127.0.0.1";

    /// @brief Port to listen on; 0 binds an ephemeral port.
    int port = 3000;
};

/// @brief Serves JSON-RPC over HTTP POST with permissive CORS.
///
/// Routes: `GET /health`, `OPTIONS *` (preflight) and `POST *` (JSON-RPC).
/// Requests may be handled concurrently; the dispatcher holds no mutable state.
class HttpServer
{
  public:
    HttpServer(const Dispatcher& dispatcher, HttpServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Binds the listening socket.
    /// @return The bound port, or an IoError if the address cannot be bound.
    [[nodiscard]] auto bind() -> Result<int>;

    /// @brief Serves requests until stop() is called. Requires a successful bind().
    [[nodiscard]] auto listen() -> VoidResult;

    /// @brief Stops the listener. Safe to call from another thread.
    void stop();

    /// @brief Blocks until a listen() running on another thread accepts connections.
    void waitUntilReady() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace replbridge
