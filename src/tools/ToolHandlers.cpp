// SPDX-License-Identifier: Apache-2.0
#include "ToolHandlers.hpp"

#include <backend/BackendClient.hpp>
#include <backend/Locator.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace replbridge
{

namespace
{

    constexpr auto StartHint = std::string_view {
        "Start the server with:\n  julia --project -e 'using MCPRepl; MCPRepl.start!()'"
    };

    auto forward(ToolKind kind, const std::string& projectDir, nlohmann::json backendArguments) -> std::string
    {
        auto const backendRef = backend::locate(projectDir);
        if (!backendRef)
            return std::format("Error: MCP REPL server not found in {}. {}", projectDir, StartHint);

        if (!backend::isAlive(backendRef->socketPath))
            return std::format("Error: MCP REPL server not running (socket exists but process dead). {}",
                               StartHint);

        auto const operation = backendOperation(kind);
        log::debug("Forwarding {} to {}", operation, backendRef->socketPath.string());

        auto const response =
            backend::call(backendRef->socketPath, backend::makeToolRequest(operation, std::move(backendArguments)));
        if (!response)
            return std::format("Error communicating with Julia server: {}", response.error().message);

        if (response->contains("error"))
        {
            auto const& error = (*response)["error"];
            auto const message = error.is_object() ? json::getStringOr(error, "message", json::serialize(error))
                                                   : json::serialize(error);
            return std::format("Error from Julia server: {}", message);
        }

        if (!response->contains("result"))
            return {};

        return unwrapBackendResult((*response)["result"]);
    }

} // namespace

auto unwrapBackendResult(const nlohmann::json& result) -> std::string
{
    if (result.is_object() && result.contains("content"))
    {
        auto const& content = result["content"];
        if (content.is_array() && !content.empty() && content.front().is_object())
        {
            auto const& item = content.front();
            if (!item.contains("text"))
                return {};
            if (item["text"].is_string())
                return item["text"].get<std::string>();
            return json::serialize(item["text"]);
        }
    }

    if (result.is_string())
        return result.get<std::string>();
    if (result.is_null())
        return {};
    return json::serialize(result);
}

auto invokeTool(ToolKind kind, const nlohmann::json& arguments) -> std::string
{
    auto const projectDir = json::getStringOr(arguments, "project_dir", "");
    if (projectDir.empty())
        return "Error: project_dir parameter is required";

    switch (kind)
    {
        case ToolKind::ExecuteExpression: {
            auto expression = json::getStringOr(arguments, "expression", "");
            if (expression.empty())
                return "Error: expression parameter is required";
            return forward(kind, projectDir, nlohmann::json { { "expression", std::move(expression) } });
        }
        case ToolKind::InvestigateEnvironment:
        case ToolKind::UsageInstructions: return forward(kind, projectDir, nlohmann::json::object());
    }

    return std::format("Error: unsupported tool {}", static_cast<int>(kind));
}

} // namespace replbridge
