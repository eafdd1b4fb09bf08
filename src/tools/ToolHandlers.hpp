// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ToolRegistry.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace replbridge
{

/// @brief Returns the backend operation a tool forwards to.
[[nodiscard]] constexpr auto backendOperation(ToolKind kind) -> std::string_view
{
    switch (kind)
    {
        case ToolKind::ExecuteExpression: return "exec_repl";
        case ToolKind::InvestigateEnvironment: return "investigate_environment";
        case ToolKind::UsageInstructions: return "usage_instructions";
    }
    return "unknown";
}

/// @brief Runs a tool against the backend serving `arguments.project_dir`.
///
/// Tool-level problems (missing arguments, no backend, dead backend, backend
/// errors, communication faults) come back as descriptive text starting with
/// "Error", never as exceptions.
/// @param kind The tool to run.
/// @param arguments The `arguments` object of the `tools/call` request.
/// @return The tool output text.
[[nodiscard]] auto invokeTool(ToolKind kind, const nlohmann::json& arguments) -> std::string;

/// @brief Extracts the text of a backend `tools/call` result.
///
/// Uses the first `content` item's `text` when present and falls back to the
/// serialized result otherwise.
[[nodiscard]] auto unwrapBackendResult(const nlohmann::json& result) -> std::string;

} // namespace replbridge
