// SPDX-License-Identifier: Apache-2.0
#include "StdioServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>
#include <istream>
#include <ostream>
#include <string>

namespace replbridge
{

namespace
{
    auto isBlank(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
    }
} // namespace

auto handleStdioLine(const Dispatcher& dispatcher, std::string_view line) -> std::optional<nlohmann::json>
{
    if (isBlank(line))
        return std::nullopt;

    auto request = json::parse(line);
    if (!request)
        return jsonrpc::makeErrorResponse(
            nullptr, jsonrpc::errc::ParseError, std::format("Parse error: {}", request.error().message));

    try
    {
        return dispatcher.dispatch(*request);
    }
    catch (const std::exception& e)
    {
        log::error("Internal error while handling request: {}", e.what());
        return jsonrpc::makeErrorResponse(
            nullptr, jsonrpc::errc::InternalError, std::format("Internal error: {}", e.what()));
    }
}

auto runStdioServer(const Dispatcher& dispatcher, std::istream& input, std::ostream& output) -> int
{
    log::info("MCP Julia REPL Adapter running on stdio");

    auto line = std::string {};
    while (std::getline(input, line))
    {
        auto const response = handleStdioLine(dispatcher, line);
        if (!response)
            continue;

        output << json::serialize(*response) << '\n';
        output.flush();
    }

    log::info("Input closed, shutting down");
    return 0;
}

} // namespace replbridge
