// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace replbridge::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(nlohmann::json id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(nlohmann::json id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "error",
          {
              { "code", code },
              { "message", message },
          } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = err.contains("code") && err["code"].is_number_integer() ? err["code"].get<int>() : 0,
                .message = json::getStringOr(err, "message", "Unknown error"),
                .data = err.contains("data") ? err["data"] : nlohmann::json {},
            };
        }
        else
        {
            response.error = RpcError { .code = 0, .message = json::serialize(err), .data = {} };
        }
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has neither result nor error");
    }

    return response;
}

} // namespace replbridge::jsonrpc
