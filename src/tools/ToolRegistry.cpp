// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <algorithm>

namespace replbridge
{

namespace
{

    constexpr auto ExecReplDescription = std::string_view {
        "Execute Julia code in a shared, persistent REPL session.\n"
        "\n"
        "**PREREQUISITE**: Before using this tool, you MUST first call the `usage_instructions` tool.\n"
        "\n"
        "The tool returns raw text output containing: all printed content from stdout and stderr streams, "
        "plus the mime text/plain representation of the expression's return value (unless the expression "
        "ends with a semicolon).\n"
        "\n"
        "You may use this REPL to execute julia code, run test sets, get function documentation, etc."
    };

    constexpr auto InvestigateEnvironmentDescription = std::string_view {
        "Investigate the current Julia environment including pwd, active project, packages, and "
        "development packages with their paths.\n"
        "\n"
        "This tool provides comprehensive information about:\n"
        "- Current working directory\n"
        "- Active project and its details\n"
        "- All packages in the environment with development status\n"
        "- Development packages with their file system paths\n"
        "- Current environment package status\n"
        "- Revise.jl status for hot reloading"
    };

    constexpr auto UsageInstructionsDescription = std::string_view {
        "Get detailed instructions for proper Julia REPL usage, best practices, and workflow guidelines."
    };

    auto projectDirProperty(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json {
            { "type", "string" },
            { "description", description },
        };
    }

    auto projectOnlySchema() -> nlohmann::json
    {
        return nlohmann::json {
            { "type", "object" },
            { "properties",
              { { "project_dir", projectDirProperty("Directory where the Julia project is located") } } },
            { "required", nlohmann::json::array({ "project_dir" }) },
        };
    }

} // namespace

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools): _tools(std::move(tools))
{
}

auto ToolRegistry::createDefault() -> ToolRegistry
{
    auto execSchema = nlohmann::json {
        { "type", "object" },
        { "properties",
          {
              { "project_dir",
                projectDirProperty(
                    "Directory where the Julia project is located (used to find the REPL socket)") },
              { "expression",
                {
                    { "type", "string" },
                    { "description",
                      "Julia expression to evaluate (e.g., '2 + 3 * 4' or `import Pkg; Pkg.status()`)" },
                } },
          } },
        { "required", nlohmann::json::array({ "project_dir", "expression" }) },
    };

    auto tools = std::vector<ToolDescriptor> {};
    tools.push_back(ToolDescriptor {
        .kind = ToolKind::ExecuteExpression,
        .name = "exec_repl",
        .description = std::string(ExecReplDescription),
        .inputSchema = std::move(execSchema),
    });
    tools.push_back(ToolDescriptor {
        .kind = ToolKind::InvestigateEnvironment,
        .name = "investigate_environment",
        .description = std::string(InvestigateEnvironmentDescription),
        .inputSchema = projectOnlySchema(),
    });
    tools.push_back(ToolDescriptor {
        .kind = ToolKind::UsageInstructions,
        .name = "usage_instructions",
        .description = std::string(UsageInstructionsDescription),
        .inputSchema = projectOnlySchema(),
    });

    return ToolRegistry(std::move(tools));
}

auto ToolRegistry::find(std::string_view name) const -> const ToolDescriptor*
{
    auto const it = std::ranges::find_if(_tools, [name](const ToolDescriptor& tool) { return tool.name == name; });
    return it != _tools.end() ? &*it : nullptr;
}

auto ToolRegistry::tools() const -> const std::vector<ToolDescriptor>&
{
    return _tools;
}

auto ToolRegistry::toJson() const -> nlohmann::json
{
    auto list = nlohmann::json::array();
    for (const auto& tool: _tools)
    {
        list.push_back(nlohmann::json {
            { "name", tool.name },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema },
        });
    }
    return list;
}

} // namespace replbridge
