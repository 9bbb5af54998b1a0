// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClient.hpp>

#include <tests/TestDoubles.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpbridge;
using mcpbridge::test::MockTransport;

namespace
{

auto initializeResponse(int id = 1) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result",
          {
              { "protocolVersion", "2024-11-05" },
              { "serverInfo", { { "name", "test-server" }, { "version", "1.0" } } },
              { "capabilities", { { "tools", nlohmann::json::object() } } },
          } },
    };
}

} // namespace

TEST_CASE("McpClient initialize handshake", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();
    mock->queueResponse(initializeResponse());

    auto client = McpClient(std::move(transport));
    auto result = client.initialize();

    REQUIRE(result.has_value());
    CHECK(result->serverName == "test-server");
    CHECK(result->serverVersion == "1.0");
    CHECK(result->hasTools);
    CHECK(!result->hasResources);
    CHECK(client.isInitialized());

    // The initialize request is followed by the initialized notification.
    auto const sent = mock->sentMessages();
    REQUIRE(sent.size() == 2);
    CHECK(sent[0]["method"] == "initialize");
    CHECK(sent[0]["params"]["clientInfo"]["name"] == "mcp-bridge");
    CHECK(sent[1]["method"] == "notifications/initialized");
    CHECK(!sent[1].contains("id"));
}

TEST_CASE("McpClient listTools", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(initializeResponse());
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 2 },
        { "result",
          { { "tools",
              nlohmann::json::array({
                  { { "name", "read_file" },
                    { "description", "Read a file" },
                    { "inputSchema", { { "type", "object" } } } },
                  { { "name", "write_file" },
                    { "description", "Write a file" },
                    { "inputSchema", nlohmann::json::object() },
                    { "outputSchema", { { "type", "string" } } } },
              }) } } },
    });

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());

    auto toolsResult = client.listTools();
    REQUIRE(toolsResult.has_value());
    REQUIRE(toolsResult->size() == 2);
    CHECK((*toolsResult)[0].name == "read_file");
    CHECK((*toolsResult)[0].inputSchema["type"] == "object");
    CHECK(!(*toolsResult)[0].outputSchema.has_value());
    CHECK((*toolsResult)[1].name == "write_file");
    REQUIRE((*toolsResult)[1].outputSchema.has_value());
    CHECK((*(*toolsResult)[1].outputSchema)["type"] == "string");
}

TEST_CASE("McpClient listTools follows pagination cursors", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(initializeResponse());
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 2 },
        { "result", { { "tools", nlohmann::json::array({ { { "name", "first" } } }) }, { "nextCursor", "page-2" } } },
    });
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "result", { { "tools", nlohmann::json::array({ { { "name", "second" } } }) } } },
    });

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());

    auto tools = client.listTools();
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[1].name == "second");

    auto const sent = mock->sentMessages();
    CHECK(sent.back()["params"]["cursor"] == "page-2");
}

TEST_CASE("McpClient callTool", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(initializeResponse());
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 2 },
        { "result",
          {
              { "content",
                nlohmann::json::array({
                    { { "type", "text" }, { "text", "Hello" } },
                    { { "type", "image" }, { "data", "AAAA" }, { "mimeType", "image/png" } },
                }) },
              { "isError", false },
          } },
    });

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());

    auto result = client.callTool("read_file", { { "path", "/tmp/test.txt" } });
    REQUIRE(result.has_value());
    CHECK(!result->isError);
    REQUIRE(result->content.size() == 2);
    CHECK(result->content[0].text == "Hello");
    CHECK(result->content[1].type == "image");
    CHECK(result->content[1].text.find("image/png") != std::string::npos);

    auto const sent = mock->sentMessages();
    CHECK(sent.back()["params"]["name"] == "read_file");
    CHECK(sent.back()["params"]["arguments"]["path"] == "/tmp/test.txt");
}

TEST_CASE("McpClient skips notifications and unrelated responses", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(jsonrpc::makeNotification("notifications/message", { { "level", "info" } }));
    mock->queueResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 99 }, { "result", {} } });
    mock->queueResponse(initializeResponse());

    auto client = McpClient(std::move(transport));
    auto result = client.initialize();
    REQUIRE(result.has_value());
    CHECK(result->serverName == "test-server");
}

TEST_CASE("McpClient reports RPC errors", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>(test::fakeMcpServer("srv", {}));

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());

    auto result = client.callTool("fail", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(result.error().message.find("tool exploded") != std::string::npos);
}

TEST_CASE("McpClient times out when no response arrives", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();

    auto client = McpClient(std::move(transport), std::chrono::milliseconds(50));
    auto result = client.initialize();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(!client.isInitialized());
}

TEST_CASE("McpClient rejects operations before initialization", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto client = McpClient(std::move(transport));

    auto toolsResult = client.listTools();
    REQUIRE(!toolsResult.has_value());
    CHECK(toolsResult.error().code == ErrorCode::ProtocolError);

    auto callResult = client.callTool("test", nlohmann::json::object());
    REQUIRE(!callResult.has_value());
    CHECK(callResult.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("McpClient close disconnects the transport", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>(test::fakeMcpServer("srv", {}));
    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());
    CHECK(client.isConnected());

    REQUIRE(client.close().has_value());
    CHECK(!client.isConnected());
    CHECK(!client.isInitialized());
}
