// SPDX-License-Identifier: Apache-2.0
#include <mcp/SocketTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestBackend.hpp"

using namespace replbridge;
using replbridge::test::TempDir;
using replbridge::test::TestBackend;

TEST_CASE("SocketTransport starts disconnected", "[transport]")
{
    auto transport = SocketTransport();
    CHECK(!transport.isConnected());
}

TEST_CASE("SocketTransport send fails when not connected", "[transport]")
{
    auto transport = SocketTransport();
    auto result = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CommunicationError);
}

TEST_CASE("SocketTransport receive fails when not connected", "[transport]")
{
    auto transport = SocketTransport();
    auto result = transport.receive();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CommunicationError);
}

TEST_CASE("SocketTransport fails to connect to a missing socket", "[transport]")
{
    auto const tmp = TempDir();
    auto transport = SocketTransport();

    auto result = transport.connect((tmp.path() / "missing.sock").string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CommunicationError);
    CHECK(!transport.isConnected());
}

TEST_CASE("SocketTransport rejects over-long socket paths", "[transport]")
{
    auto transport = SocketTransport();
    auto result = transport.connect(std::string(200, 'x'));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CommunicationError);
}

TEST_CASE("SocketTransport exchanges one line with a backend", "[transport]")
{
    auto const tmp = TempDir();
    auto backend = TestBackend(tmp.path(), [](const nlohmann::json& request) {
        return nlohmann::json { { "echo", request["value"] } }.dump() + "\n";
    });

    auto transport = SocketTransport();
    REQUIRE(transport.connect(backend.socketPath().string()).has_value());
    CHECK(transport.isConnected());

    REQUIRE(transport.send(nlohmann::json { { "value", "hello" } }).has_value());

    auto reply = transport.receive();
    REQUIRE(reply.has_value());
    CHECK((*reply)["echo"] == "hello");

    transport.close();
    CHECK(!transport.isConnected());
    transport.close();
}

TEST_CASE("SocketTransport reports a connection closed mid-line", "[transport]")
{
    auto const tmp = TempDir();
    auto backend = TestBackend(tmp.path(), [](const nlohmann::json&) { return std::string(R"({"partial":)"); });

    auto transport = SocketTransport();
    REQUIRE(transport.connect(backend.socketPath().string()).has_value());
    REQUIRE(transport.send(nlohmann::json::object()).has_value());

    auto reply = transport.receive();
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::CommunicationError);
    CHECK(reply.error().message == "Server closed connection");
}

TEST_CASE("SocketTransport reports an unparseable line", "[transport]")
{
    auto const tmp = TempDir();
    auto backend = TestBackend(tmp.path(), [](const nlohmann::json&) { return std::string("not json\n"); });

    auto transport = SocketTransport();
    REQUIRE(transport.connect(backend.socketPath().string()).has_value());
    REQUIRE(transport.send(nlohmann::json::object()).has_value());

    auto reply = transport.receive();
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::CommunicationError);
}
