// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/Dispatcher.hpp>
#include <replbridge/Config.hpp>
#include <server/HttpServer.hpp>
#include <server/StdioServer.hpp>
#include <tools/ToolRegistry.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <iostream>

namespace
{

replbridge::HttpServer* activeHttpServer = nullptr;

void handleShutdownSignal(int /*signal*/)
{
    if (activeHttpServer)
        activeHttpServer->stop();
}

auto runHttp(const replbridge::Dispatcher& dispatcher, const replbridge::AdapterConfig& config) -> int
{
    auto server = replbridge::HttpServer(dispatcher, { .host = config.host, .port = config.port });

    auto const bound = server.bind();
    if (!bound)
    {
        replbridge::log::error("HTTP startup failed: {}", bound.error());
        return 1;
    }

    activeHttpServer = &server;
    std::signal(SIGINT, handleShutdownSignal);
    std::signal(SIGTERM, handleShutdownSignal);

    auto const result = server.listen();
    activeHttpServer = nullptr;

    if (!result)
    {
        replbridge::log::error("HTTP server failed: {}", result.error());
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "MCP Julia REPL Adapter - MCP server that forwards to Julia REPL servers" };

    auto options = replbridge::CommandLineOptions {};
    replbridge::addCommandLineOptions(app, options);

    CLI11_PARSE(app, argc, argv);

    auto const config = replbridge::makeConfig(options, replbridge::logLevelFromEnvironment());
    if (!config)
    {
        replbridge::log::error("Invalid configuration: {}", config.error());
        return 2;
    }

    replbridge::log::setLevel(config->logLevel);

    auto const registry = replbridge::ToolRegistry::createDefault();
    auto const dispatcher = replbridge::Dispatcher(registry);

    switch (config->transport)
    {
        case replbridge::TransportMode::Stdio: return replbridge::runStdioServer(dispatcher, std::cin, std::cout);
        case replbridge::TransportMode::Http: return runHttp(dispatcher, *config);
    }

    return 1;
}
