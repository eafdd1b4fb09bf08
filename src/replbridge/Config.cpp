// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <format>

namespace replbridge
{

auto transportModeFromString(std::string_view name) -> Result<TransportMode>
{
    if (name == "stdio")
        return TransportMode::Stdio;
    if (name == "http")
        return TransportMode::Http;
    return makeError(ErrorCode::ConfigError, std::format("Unknown transport '{}' (expected stdio or http)", name));
}

void addCommandLineOptions(CLI::App& app, CommandLineOptions& options)
{
    app.add_option("--transport", options.transport, "Transport mode (default: stdio)")
        ->check(CLI::IsMember({ "stdio", "http" }))
        ->capture_default_str();
    app.add_option("--port", options.port, "Port for HTTP mode (default: 3000)")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();
}

auto logLevelFromEnvironment() -> std::string
{
    auto const* value = std::getenv(LogLevelVariable);
    return value ? std::string(value) : std::string();
}

auto makeConfig(const CommandLineOptions& options, std::string_view logLevelName) -> Result<AdapterConfig>
{
    auto config = AdapterConfig {};

    auto transport = transportModeFromString(options.transport);
    if (!transport)
        return std::unexpected(transport.error());
    config.transport = *transport;

    if (options.port < 1 || options.port > 65535)
        return makeError(ErrorCode::ConfigError, std::format("Port out of range: {}", options.port));
    config.port = options.port;

    if (!logLevelName.empty())
    {
        auto const level = log::parseLevel(logLevelName);
        if (!level)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown log level in {}: {}", LogLevelVariable, logLevelName));
        config.logLevel = *level;
    }

    return config;
}

} // namespace replbridge
