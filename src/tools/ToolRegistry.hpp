// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace replbridge
{

/// @brief The closed set of operations the adapter exposes.
enum class ToolKind
{
    ExecuteExpression,
    InvestigateEnvironment,
    UsageInstructions,
};

/// @brief A tool as advertised through `tools/list`.
struct ToolDescriptor
{
    ToolKind kind = ToolKind::ExecuteExpression;
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Immutable catalog of the tools this adapter serves.
///
/// Built once at startup and shared by const reference.
class ToolRegistry
{
  public:
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    /// @brief Creates the registry with the three REPL tools.
    [[nodiscard]] static auto createDefault() -> ToolRegistry;

    /// @brief Looks up a tool by exact name.
    /// @return The descriptor, or nullptr if no tool has that name.
    [[nodiscard]] auto find(std::string_view name) const -> const ToolDescriptor*;

    [[nodiscard]] auto tools() const -> const std::vector<ToolDescriptor>&;

    /// @brief Returns the `tools` array for a `tools/list` result.
    [[nodiscard]] auto toJson() const -> nlohmann::json;

  private:
    std::vector<ToolDescriptor> _tools;
};

} // namespace replbridge
