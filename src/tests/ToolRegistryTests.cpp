// SPDX-License-Identifier: Apache-2.0
#include <tools/ToolRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace replbridge;

TEST_CASE("Default registry holds the three REPL tools in order", "[registry]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const& tools = registry.tools();

    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "exec_repl");
    CHECK(tools[0].kind == ToolKind::ExecuteExpression);
    CHECK(tools[1].name == "investigate_environment");
    CHECK(tools[1].kind == ToolKind::InvestigateEnvironment);
    CHECK(tools[2].name == "usage_instructions");
    CHECK(tools[2].kind == ToolKind::UsageInstructions);

    auto names = std::set<std::string> {};
    for (const auto& tool: tools)
        names.insert(tool.name);
    CHECK(names.size() == tools.size());
}

TEST_CASE("find matches names exactly", "[registry]")
{
    auto const registry = ToolRegistry::createDefault();

    auto const* tool = registry.find("usage_instructions");
    REQUIRE(tool != nullptr);
    CHECK(tool->kind == ToolKind::UsageInstructions);

    CHECK(registry.find("nonexistent") == nullptr);
    CHECK(registry.find("EXEC_REPL") == nullptr);
    CHECK(registry.find("exec_repl ") == nullptr);
}

TEST_CASE("exec_repl schema requires project_dir and expression", "[registry]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const& schema = registry.find("exec_repl")->inputSchema;

    CHECK(schema["type"] == "object");
    CHECK(schema["properties"]["project_dir"]["type"] == "string");
    CHECK(schema["properties"]["expression"]["type"] == "string");
    CHECK(schema["required"] == nlohmann::json::array({ "project_dir", "expression" }));
}

TEST_CASE("Project-only tools require project_dir alone", "[registry]")
{
    auto const registry = ToolRegistry::createDefault();
    for (auto const* name: { "investigate_environment", "usage_instructions" })
    {
        auto const& schema = registry.find(name)->inputSchema;
        CHECK(schema["required"] == nlohmann::json::array({ "project_dir" }));
        CHECK(!schema["properties"].contains("expression"));
    }
}

TEST_CASE("toJson lists name, description and inputSchema only", "[registry]")
{
    auto const registry = ToolRegistry::createDefault();
    auto const list = registry.toJson();

    REQUIRE(list.is_array());
    REQUIRE(list.size() == 3);
    for (const auto& entry: list)
    {
        CHECK(entry.size() == 3);
        CHECK(entry.contains("name"));
        CHECK(entry.contains("description"));
        CHECK(entry.contains("inputSchema"));
    }
    CHECK(list[2]["description"]
          == "Get detailed instructions for proper Julia REPL usage, best practices, and workflow guidelines.");
}
