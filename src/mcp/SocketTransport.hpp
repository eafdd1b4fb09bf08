// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <memory>
#include <string_view>

namespace replbridge
{

/// @brief Transport over a Unix domain stream socket.
///
/// The socket is owned exclusively by this object and closed on destruction.
/// All failures are reported with ErrorCode::CommunicationError.
class SocketTransport: public Transport
{
  public:
    SocketTransport();
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    /// @brief Connects to the Unix domain socket at the given path.
    [[nodiscard]] auto connect(std::string_view socketPath) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace replbridge
