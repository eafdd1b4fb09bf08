// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace replbridge::jsonrpc
{

/// @brief Reserved JSON-RPC 2.0 error codes.
namespace errc
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
} // namespace errc

/// @brief Id used for every request forwarded to a backend.
///
/// Each backend connection carries exactly one request, so the id never
/// needs to vary.
constexpr int64_t BackendRequestId = 1;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
/// @param id The id of the request being answered (may be null).
/// @param result The result payload.
[[nodiscard]] auto makeResult(nlohmann::json id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
/// @param id The id of the request being answered (null when unknown).
/// @param code One of the errc codes.
/// @param message A human-readable description.
[[nodiscard]] auto makeErrorResponse(nlohmann::json id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or a ProtocolError.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace replbridge::jsonrpc
