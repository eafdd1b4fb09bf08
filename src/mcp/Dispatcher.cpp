// SPDX-License-Identifier: Apache-2.0
#include "Dispatcher.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <tools/ToolHandlers.hpp>

#include <format>

namespace replbridge
{

Dispatcher::Dispatcher(const ToolRegistry& registry):
    Dispatcher(registry, [](const ToolDescriptor& tool, const nlohmann::json& arguments) {
        return invokeTool(tool.kind, arguments);
    })
{
}

Dispatcher::Dispatcher(const ToolRegistry& registry, ToolInvoker invoker):
    _registry(registry), _invoker(std::move(invoker))
{
}

auto Dispatcher::dispatch(const nlohmann::json& request) const -> std::optional<nlohmann::json>
{
    if (!request.is_object())
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::errc::InvalidRequest, "Invalid Request");

    auto const id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
    auto const method = json::getStringOr(request, "method", "");

    log::debug("Dispatching '{}'", method);

    if (method == "initialize")
        return handleInitialize(id);

    if (method == "notifications/initialized")
        return std::nullopt;

    if (method == "tools/list")
        return handleToolsList(id);

    if (method == "tools/call")
        return handleToolsCall(id, json::getObjectOr(request, "params"));

    return jsonrpc::makeErrorResponse(
        id, jsonrpc::errc::MethodNotFound, std::format("Method not found: {}", method));
}

auto Dispatcher::handleInitialize(const nlohmann::json& id) const -> nlohmann::json
{
    return jsonrpc::makeResult(id,
                               nlohmann::json {
                                   { "protocolVersion", McpProtocolVersion },
                                   { "capabilities", { { "tools", nlohmann::json::object() } } },
                                   { "serverInfo",
                                     {
                                         { "name", ServerName },
                                         { "version", ServerVersion },
                                     } },
                               });
}

auto Dispatcher::handleToolsList(const nlohmann::json& id) const -> nlohmann::json
{
    return jsonrpc::makeResult(id, nlohmann::json { { "tools", _registry.toJson() } });
}

auto Dispatcher::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) const -> nlohmann::json
{
    auto const name = json::getStringOr(params, "name", "");
    auto const* const tool = _registry.find(name);
    if (!tool)
        return jsonrpc::makeErrorResponse(id, jsonrpc::errc::InvalidParams, std::format("Tool not found: {}", name));

    auto const arguments = json::getObjectOr(params, "arguments");

    try
    {
        auto text = _invoker(*tool, arguments);
        log::debug("Tool '{}' returned {} bytes", name, text.size());
        return jsonrpc::makeResult(id,
                                   nlohmann::json {
                                       { "content",
                                         nlohmann::json::array({ {
                                             { "type", "text" },
                                             { "text", std::move(text) },
                                         } }) },
                                   });
    }
    catch (const std::exception& e)
    {
        log::error("Tool '{}' failed: {}", name, e.what());
        return jsonrpc::makeErrorResponse(
            id, jsonrpc::errc::InternalError, std::format("Tool execution error: {}", e.what()));
    }
}

} // namespace replbridge
