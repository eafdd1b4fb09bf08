// SPDX-License-Identifier: Apache-2.0
#include "BackendClient.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/SocketTransport.hpp>

namespace replbridge::backend
{

auto call(const std::filesystem::path& socketPath, const nlohmann::json& request) -> Result<nlohmann::json>
{
    auto transport = SocketTransport();

    auto response = transport.connect(socketPath.string())
                        .and_then([&]() { return transport.send(request); })
                        .and_then([&]() { return transport.receive(); });

    transport.close();

    if (!response)
        log::debug("Backend call to {} failed: {}", socketPath.string(), response.error().message);
    else if (!response->is_object())
        return makeError(ErrorCode::CommunicationError, "Invalid response from server: not a JSON object");

    return response;
}

auto makeToolRequest(std::string_view operation, nlohmann::json arguments) -> nlohmann::json
{
    return jsonrpc::makeRequest(jsonrpc::BackendRequestId,
                                "tools/call",
                                nlohmann::json {
                                    { "name", operation },
                                    { "arguments", std::move(arguments) },
                                });
}

} // namespace replbridge::backend
