// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Dispatcher.hpp>

#include <iosfwd>
#include <optional>
#include <string_view>

namespace replbridge
{

/// @brief Handles one line of stdio input.
/// @param dispatcher The dispatcher to route the request to.
/// @param line One input line, without its terminator.
/// @return The response envelope, or std::nullopt if nothing is to be written.
[[nodiscard]] auto handleStdioLine(const Dispatcher& dispatcher, std::string_view line)
    -> std::optional<nlohmann::json>;

/// @brief Serves newline-delimited JSON-RPC until @p input reaches end of stream.
///
/// Requests are processed one at a time; each response is written as one
/// line and flushed immediately.
/// @return The process exit code (0 on end of input).
[[nodiscard]] auto runStdioServer(const Dispatcher& dispatcher, std::istream& input, std::ostream& output) -> int;

} // namespace replbridge
