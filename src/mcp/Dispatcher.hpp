// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ToolRegistry.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace replbridge
{

/// @brief Protocol version reported by `initialize`.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief Server identity reported by `initialize`.
constexpr auto ServerName = std::string_view { "julia-mcp-adapter" };
constexpr auto ServerVersion = std::string_view { "1.0.0" };

/// @brief Routes MCP requests to the tool registry.
///
/// Stateless apart from the registry it reads, so one instance may serve
/// concurrent requests.
class Dispatcher
{
  public:
    /// @brief Runs a tool and returns its text output.
    using ToolInvoker = std::function<std::string(const ToolDescriptor& tool, const nlohmann::json& arguments)>;

    /// @brief Constructs a dispatcher that forwards tool calls to the backend.
    explicit Dispatcher(const ToolRegistry& registry);

    /// @brief Constructs a dispatcher with a custom tool invoker.
    Dispatcher(const ToolRegistry& registry, ToolInvoker invoker);

    /// @brief Handles one JSON-RPC request.
    /// @param request The parsed request envelope.
    /// @return The response envelope, or std::nullopt for notifications.
    [[nodiscard]] auto dispatch(const nlohmann::json& request) const -> std::optional<nlohmann::json>;

  private:
    const ToolRegistry& _registry;
    ToolInvoker _invoker;

    [[nodiscard]] auto handleInitialize(const nlohmann::json& id) const -> nlohmann::json;
    [[nodiscard]] auto handleToolsList(const nlohmann::json& id) const -> nlohmann::json;
    [[nodiscard]] auto handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) const
        -> nlohmann::json;
};

} // namespace replbridge
