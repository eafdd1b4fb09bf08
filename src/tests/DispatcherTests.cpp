// SPDX-License-Identifier: Apache-2.0
#include <mcp/Dispatcher.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace replbridge;

namespace
{

auto request(nlohmann::json id, std::string_view method, nlohmann::json params = nullptr) -> nlohmann::json
{
    auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "id", std::move(id) }, { "method", method } };
    if (!params.is_null())
        msg["params"] = std::move(params);
    return msg;
}

} // namespace

TEST_CASE("initialize reports protocol version, capabilities and identity", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(request(1, "initialize"));
    REQUIRE(response.has_value());
    CHECK((*response)["jsonrpc"] == "2.0");
    CHECK((*response)["id"] == 1);

    auto const& result = (*response)["result"];
    CHECK(result["protocolVersion"] == "2024-11-05");
    CHECK(result["capabilities"]["tools"] == nlohmann::json::object());
    CHECK(result["serverInfo"]["name"] == "julia-mcp-adapter");
    CHECK(result["serverInfo"]["version"] == "1.0.0");
}

TEST_CASE("notifications/initialized produces no response", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const notification = nlohmann::json { { "jsonrpc", "2.0" }, { "method", "notifications/initialized" } };
    CHECK(!dispatcher.dispatch(notification).has_value());
}

TEST_CASE("tools/list returns the registry without handlers", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(request("list-1", "tools/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == "list-1");
    CHECK((*response)["result"]["tools"] == registry.toJson());
}

TEST_CASE("tools/call wraps handler text into a content list", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto received = nlohmann::json {};
    auto const dispatcher =
        Dispatcher(registry, [&received](const ToolDescriptor& tool, const nlohmann::json& arguments) {
            received = arguments;
            return std::string("ran ") + tool.name;
        });

    auto const response = dispatcher.dispatch(request(
        7,
        "tools/call",
        { { "name", "exec_repl" }, { "arguments", { { "project_dir", "/p" }, { "expression", "1+1" } } } }));

    REQUIRE(response.has_value());
    CHECK(!response->contains("error"));
    CHECK((*response)["id"] == 7);
    CHECK((*response)["result"]["content"]
          == nlohmann::json::array({ { { "type", "text" }, { "text", "ran exec_repl" } } }));
    CHECK(received["expression"] == "1+1");
}

TEST_CASE("tools/call defaults arguments to an empty object", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto received = nlohmann::json {};
    auto const dispatcher = Dispatcher(registry, [&received](const ToolDescriptor&, const nlohmann::json& arguments) {
        received = arguments;
        return std::string {};
    });

    REQUIRE(dispatcher.dispatch(request(1, "tools/call", { { "name", "usage_instructions" } })).has_value());
    CHECK(received == nlohmann::json::object());
}

TEST_CASE("tools/call with missing expression is a successful result", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(
        request(3, "tools/call", { { "name", "exec_repl" }, { "arguments", { { "project_dir", "/tmp" } } } }));

    REQUIRE(response.has_value());
    CHECK(!response->contains("error"));
    auto const text = (*response)["result"]["content"][0]["text"].get<std::string>();
    CHECK(text.find("expression parameter is required") != std::string::npos);
}

TEST_CASE("tools/call with an unknown tool is an invalid-params error", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(request(4, "tools/call", { { "name", "nonexistent" } }));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 4);
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Tool not found: nonexistent");
}

TEST_CASE("tools/call converts handler exceptions to internal errors", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry, [](const ToolDescriptor&, const nlohmann::json&) -> std::string {
        throw std::runtime_error("kaput");
    });

    auto const response = dispatcher.dispatch(request(5, "tools/call", { { "name", "usage_instructions" } }));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32603);
    CHECK((*response)["error"]["message"] == "Tool execution error: kaput");
}

TEST_CASE("Unknown methods are method-not-found errors", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(request(6, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK((*response)["error"]["message"] == "Method not found: resources/list");
}

TEST_CASE("Requests without an id are answered with a null id", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(nlohmann::json { { "jsonrpc", "2.0" }, { "method", "tools/list" } });
    REQUIRE(response.has_value());
    CHECK((*response)["id"].is_null());
}

TEST_CASE("Non-object requests are invalid", "[dispatcher]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const dispatcher = Dispatcher(registry);

    auto const response = dispatcher.dispatch(nlohmann::json::array({ 1 }));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32600);
}
