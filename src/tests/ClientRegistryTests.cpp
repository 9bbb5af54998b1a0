// SPDX-License-Identifier: Apache-2.0
#include <mcp/ClientRegistry.hpp>

#include <tests/TestDoubles.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <future>
#include <thread>

using namespace mcpbridge;
using mcpbridge::test::MockTransport;

namespace
{

auto descriptorFor(std::string name) -> ServerDescriptor
{
    return ServerDescriptor {
        .name = std::move(name),
        .command = "fake-server",
        .args = {},
        .env = { { "TOKEN", "t" } },
        .mode = TransportMode::Pipe,
        .port = std::nullopt,
        .eventStream = std::nullopt,
        .disabled = false,
        .autoApprove = {},
    };
}

auto fastOptions() -> RegistryOptions
{
    return RegistryOptions {
        .connectRetry = { .maxAttempts = 3, .delay = std::chrono::milliseconds(0) },
        .catalogueRetry = { .maxAttempts = 2, .delay = std::chrono::milliseconds(0) },
        .requestTimeout = std::chrono::milliseconds(500),
    };
}

} // namespace

TEST_CASE("ClientRegistry connects once and reuses the client", "[registry]")
{
    auto factoryCalls = std::atomic<int> { 0 };
    auto launchedWith = ProcessConfig {};
    auto registry = ClientRegistry(
        [&](const ServerDescriptor& descriptor, const ProcessConfig& launch) -> Result<std::unique_ptr<Transport>> {
            ++factoryCalls;
            launchedWith = launch;
            return std::make_unique<MockTransport>(
                test::fakeMcpServer(descriptor.name, { test::makeTool("echo") }));
        },
        fastOptions());

    auto const descriptor = descriptorFor("files");
    auto first = registry.ensureClient(descriptor);
    REQUIRE(first.has_value());
    CHECK((*first)->isInitialized());
    CHECK((*first)->capabilities().serverName == "files");
    CHECK(launchedWith.command == "fake-server");
    CHECK(launchedWith.env.at("TOKEN") == "t");

    auto second = registry.ensureClient(descriptor);
    REQUIRE(second.has_value());
    CHECK(first->get() == second->get());
    CHECK(factoryCalls == 1);
    CHECK(registry.client("files") == *first);

    auto tools = registry.listTools("files");
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "echo");
}

TEST_CASE("ClientRegistry retries while the launcher is missing", "[registry]")
{
    auto factoryCalls = std::atomic<int> { 0 };
    auto registry = ClientRegistry(
        [&](const ServerDescriptor& descriptor, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            if (++factoryCalls < 3)
                return makeError(ErrorCode::LauncherNotFound, "npx: command not found");
            return std::make_unique<MockTransport>(test::fakeMcpServer(descriptor.name, {}));
        },
        fastOptions());

    auto client = registry.ensureClient(descriptorFor("slow"));
    REQUIRE(client.has_value());
    CHECK(factoryCalls == 3);
}

TEST_CASE("ClientRegistry reports the last error after exhausting attempts", "[registry]")
{
    auto factoryCalls = std::atomic<int> { 0 };
    auto registry = ClientRegistry(
        [&](const ServerDescriptor&, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            ++factoryCalls;
            return makeError(ErrorCode::LaunchError, std::format("attempt {} failed", factoryCalls.load()));
        },
        fastOptions());

    auto client = registry.ensureClient(descriptorFor("broken"));
    REQUIRE(!client.has_value());
    CHECK(client.error().code == ErrorCode::LaunchError);
    CHECK(client.error().message == "attempt 3 failed");
    CHECK(factoryCalls == 3);
    CHECK(registry.client("broken") == nullptr);
}

TEST_CASE("ClientRegistry closes clients whose handshake fails", "[registry]")
{
    auto transports = std::vector<MockTransport*> {};
    auto registry = ClientRegistry(
        [&](const ServerDescriptor&, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            // No responder: initialize times out.
            auto transport = std::make_unique<MockTransport>();
            transports.push_back(transport.get());
            return transport;
        },
        RegistryOptions {
            .connectRetry = { .maxAttempts = 1, .delay = std::chrono::milliseconds(0) },
            .catalogueRetry = {},
            .requestTimeout = std::chrono::milliseconds(20),
        });

    auto client = registry.ensureClient(descriptorFor("mute"));
    REQUIRE(!client.has_value());
    CHECK(client.error().code == ErrorCode::TimeoutError);
    CHECK(transports.size() == 1);
}

TEST_CASE("ClientRegistry shares one connection attempt between concurrent callers", "[registry]")
{
    auto factoryCalls = std::atomic<int> { 0 };
    auto registry = ClientRegistry(
        [&](const ServerDescriptor& descriptor, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            ++factoryCalls;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return std::make_unique<MockTransport>(test::fakeMcpServer(descriptor.name, {}));
        },
        fastOptions());

    auto const descriptor = descriptorFor("shared");
    auto callers = std::vector<std::future<Result<std::shared_ptr<McpClient>>>> {};
    for (auto i = 0; i < 4; ++i)
        callers.push_back(std::async(std::launch::async, [&] { return registry.ensureClient(descriptor); }));

    auto clients = std::vector<std::shared_ptr<McpClient>> {};
    for (auto& caller: callers)
    {
        auto result = caller.get();
        REQUIRE(result.has_value());
        clients.push_back(*result);
    }

    CHECK(factoryCalls == 1);
    for (const auto& client: clients)
        CHECK(client == clients.front());
}

TEST_CASE("ClientRegistry listTools requires a connected client", "[registry]")
{
    auto registry = ClientRegistry(
        [](const ServerDescriptor&, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            return makeError(ErrorCode::LaunchError, "unused");
        },
        fastOptions());

    auto tools = registry.listTools("nobody");
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::NotRunning);
}

TEST_CASE("ClientRegistry wraps catalogue failures", "[registry]")
{
    auto registry = ClientRegistry(
        [](const ServerDescriptor& descriptor, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            auto server = test::fakeMcpServer(descriptor.name, {});
            return std::make_unique<MockTransport>(
                [server](const nlohmann::json& request) -> std::optional<nlohmann::json> {
                    if (request.value("method", "") == "tools/list")
                        return nlohmann::json { { "jsonrpc", "2.0" },
                                                { "id", request["id"] },
                                                { "error", { { "code", -32603 }, { "message", "boom" } } } };
                    return server(request);
                });
        },
        fastOptions());

    REQUIRE(registry.ensureClient(descriptorFor("flaky")).has_value());

    auto tools = registry.listTools("flaky");
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::CatalogueError);
    CHECK(tools.error().message.find("boom") != std::string::npos);
}

TEST_CASE("ClientRegistry closeAll continues past failures", "[registry]")
{
    auto registry = ClientRegistry(
        [](const ServerDescriptor& descriptor, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            auto transport = std::make_unique<MockTransport>(test::fakeMcpServer(descriptor.name, {}));
            transport->failOnClose = descriptor.name == "stubborn";
            return transport;
        },
        fastOptions());

    REQUIRE(registry.ensureClient(descriptorFor("good")).has_value());
    REQUIRE(registry.ensureClient(descriptorFor("stubborn")).has_value());

    auto closed = registry.closeAll();
    REQUIRE(!closed.has_value());
    CHECK(closed.error().code == ErrorCode::TransportError);
    CHECK(closed.error().message == "Failed to close MCP clients:\n  stubborn: close failed");
    CHECK(registry.client("good") == nullptr);
    CHECK(registry.client("stubborn") == nullptr);

    // Nothing left to close.
    CHECK(registry.closeAll().has_value());
}

TEST_CASE("ClientRegistry reconnects after the transport disconnects", "[registry]")
{
    auto factoryCalls = std::atomic<int> { 0 };
    auto registry = ClientRegistry(
        [&](const ServerDescriptor& descriptor, const ProcessConfig&) -> Result<std::unique_ptr<Transport>> {
            ++factoryCalls;
            return std::make_unique<MockTransport>(test::fakeMcpServer(descriptor.name, {}));
        },
        fastOptions());

    auto first = registry.ensureClient(descriptorFor("again"));
    REQUIRE(first.has_value());
    REQUIRE(registry.close("again").has_value());
    CHECK(registry.client("again") == nullptr);

    auto second = registry.ensureClient(descriptorFor("again"));
    REQUIRE(second.has_value());
    CHECK(first->get() != second->get());
    CHECK(factoryCalls == 2);
}
