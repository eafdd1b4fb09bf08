// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace CLI
{
class App;
}

namespace replbridge
{

/// @brief Front end the adapter serves on.
enum class TransportMode : std::uint8_t
{
    Stdio,
    Http,
};

/// @brief Returns the command-line name of a transport mode.
[[nodiscard]] constexpr auto transportModeName(TransportMode mode) -> std::string_view
{
    switch (mode)
    {
        case TransportMode::Stdio: return "stdio";
        case TransportMode::Http: return "http";
    }
    return "unknown";
}

/// @brief Parses "stdio" or "http".
[[nodiscard]] auto transportModeFromString(std::string_view name) -> Result<TransportMode>;

/// @brief Runtime configuration, taken from the command line and REPLBRIDGE_LOG_LEVEL.
struct AdapterConfig
{
    TransportMode transport = TransportMode::Stdio;

    /// @brief Interface the HTTP front end binds to.
    std::string host = "127.0.0.1";
    int port = 3000;
    log::Level logLevel = log::Level::Info;
};

/// @brief Options as typed on the command line, before validation.
struct CommandLineOptions
{
    std::string transport = "stdio";
    int port = 3000;
};

/// @brief Environment variable holding the log level name. The command line has no logging flags.
constexpr auto LogLevelVariable = "REPLBRIDGE_LOG_LEVEL";

/// @brief Registers --transport and --port on a CLI11 application.
void addCommandLineOptions(CLI::App& app, CommandLineOptions& options);

/// @brief Returns the value of REPLBRIDGE_LOG_LEVEL, or an empty string when unset.
[[nodiscard]] auto logLevelFromEnvironment() -> std::string;

/// @brief Validates parsed command-line options into an AdapterConfig.
///
/// @param logLevelName log level name, empty for the default (info).
[[nodiscard]] auto makeConfig(const CommandLineOptions& options, std::string_view logLevelName = {})
    -> Result<AdapterConfig>;

} // namespace replbridge
