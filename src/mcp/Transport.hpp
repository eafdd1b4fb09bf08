// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace replbridge
{

/// @brief Abstract interface for a newline-delimited JSON message channel.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends one JSON message, serialized onto a single line.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives one JSON message (blocking until a full line arrives).
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Closes the channel. Safe to call more than once.
    virtual void close() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace replbridge
