// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace replbridge::backend
{

/// @brief Sends one request to a backend and returns its response.
///
/// Opens a fresh connection to @p socketPath, writes @p request as a single
/// line, reads a single response line, and closes the connection on every
/// path. Blocks without a timeout.
/// @return The parsed response envelope, or a CommunicationError.
[[nodiscard]] auto call(const std::filesystem::path& socketPath, const nlohmann::json& request)
    -> Result<nlohmann::json>;

/// @brief Builds the `tools/call` request forwarded to a backend.
/// @param operation The backend operation name (e.g. "exec_repl").
/// @param arguments The operation arguments.
[[nodiscard]] auto makeToolRequest(std::string_view operation, nlohmann::json arguments) -> nlohmann::json;

} // namespace replbridge::backend
