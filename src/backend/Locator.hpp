// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace replbridge::backend
{

/// @brief Name of the socket marker a backend creates in its project directory.
constexpr auto SocketFileName = std::string_view { ".mcp-repl.sock" };

/// @brief Name of the PID file the backend writes next to its socket.
constexpr auto PidFileName = std::string_view { ".mcp-repl.pid" };

/// @brief Location of a backend discovered for one tool call.
///
/// Resolved fresh for every call and never cached.
struct BackendReference
{
    std::filesystem::path socketPath;
    std::filesystem::path pidFilePath;
};

/// @brief Walks upward from @p startDir looking for the socket marker.
///
/// The start directory is made absolute first. The search stops at the
/// filesystem root.
/// @return Path of the nearest socket marker, or std::nullopt if none exists.
[[nodiscard]] auto findSocket(const std::filesystem::path& startDir) -> std::optional<std::filesystem::path>;

/// @brief Returns the PID file path that belongs to a socket marker.
[[nodiscard]] auto pidFileFor(const std::filesystem::path& socketPath) -> std::filesystem::path;

/// @brief Checks whether the process recorded next to @p socketPath is alive.
///
/// Returns false when the PID file is missing or malformed, when the process
/// does not exist, or when probing it is not permitted. Never throws.
[[nodiscard]] auto isAlive(const std::filesystem::path& socketPath) noexcept -> bool;

/// @brief Resolves the backend serving @p projectDir.
/// @return The reference, or std::nullopt if no socket marker was found.
[[nodiscard]] auto locate(const std::filesystem::path& projectDir) -> std::optional<BackendReference>;

} // namespace replbridge::backend
