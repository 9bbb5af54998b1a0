// SPDX-License-Identifier: Apache-2.0
#include <supervisor/EventStreamSession.hpp>
#include <supervisor/LocalPortSession.hpp>
#include <supervisor/PipeSession.hpp>
#include <supervisor/ServerSupervisor.hpp>

#include <tests/TestDoubles.hpp>

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <set>

using namespace mcpbridge;
using mcpbridge::test::FakeSession;

namespace
{

auto makeDescriptor(std::string name, std::string command, std::vector<std::string> args = {}) -> ServerDescriptor
{
    return ServerDescriptor {
        .name = std::move(name),
        .command = std::move(command),
        .args = std::move(args),
        .env = {},
        .mode = TransportMode::Pipe,
        .port = std::nullopt,
        .eventStream = std::nullopt,
        .disabled = false,
        .autoApprove = {},
    };
}

auto configOf(std::initializer_list<ServerDescriptor> descriptors) -> ServersConfig
{
    auto config = ServersConfig {};
    for (const auto& descriptor: descriptors)
        config.servers.emplace(descriptor.name, descriptor);
    return config;
}

auto fastSessionOptions() -> SessionOptions
{
    return SessionOptions {
        .settleInterval = std::chrono::milliseconds(300),
        .healthInterval = std::chrono::milliseconds(10),
        .healthAttempts = 2,
        .connectionTimeout = std::chrono::milliseconds(500),
        .reconnectAttempts = 3,
        .reconnectInterval = std::chrono::milliseconds(10),
        .stopGracePeriod = std::chrono::milliseconds(500),
    };
}

/// Session factory handing out FakeSessions that share one Control per server name.
struct FakeSessions
{
    std::map<std::string, std::shared_ptr<FakeSession::Control>> controls;
    std::mutex mutex;
    std::vector<FakeSession*> created;

    auto control(const std::string& name) -> std::shared_ptr<FakeSession::Control>
    {
        auto lock = std::lock_guard(mutex);
        auto& entry = controls[name];
        if (!entry)
            entry = std::make_shared<FakeSession::Control>();
        return entry;
    }

    auto factory() -> SessionFactory
    {
        return [this](const ServerDescriptor& descriptor) -> std::unique_ptr<TransportSession> {
            auto session = std::make_unique<FakeSession>(control(descriptor.name));
            auto lock = std::lock_guard(mutex);
            created.push_back(session.get());
            return session;
        };
    }
};

auto findFreePort() -> std::uint16_t
{
    for (auto port = std::uint16_t { 39000 }; port < 40000; ++port)
    {
        if (isLocalPortFree(port))
            return port;
    }
    return 0;
}

} // namespace

TEST_CASE("ServerSupervisor never spawns disabled servers", "[supervisor]")
{
    auto sessions = FakeSessions {};
    auto supervisor = ServerSupervisor(sessions.factory());

    auto disabled = makeDescriptor("off", "unused");
    disabled.disabled = true;
    auto const config = configOf({ makeDescriptor("on", "unused"), disabled });

    auto const report = supervisor.startAll(config);
    CHECK(report.outcomes.at("on").status == StartStatus::Started);
    CHECK(report.outcomes.at("off").status == StartStatus::NotStarted);
    REQUIRE(report.outcomes.at("off").error.has_value());
    CHECK(report.outcomes.at("off").error->code == ErrorCode::Disabled);
    CHECK(!report.allFailed());
    CHECK(report.startedNames() == std::vector<std::string> { "on" });

    CHECK(sessions.control("on")->starts == 1);
    CHECK(sessions.control("off")->starts == 0);
    CHECK(supervisor.runningNames() == std::set<std::string> { "on" });
    CHECK(supervisor.status("on") == HealthStatus::Ready);

    auto direct = supervisor.start("off");
    REQUIRE(!direct.has_value());
    CHECK(direct.error().code == ErrorCode::Disabled);
    CHECK(sessions.control("off")->starts == 0);
}

TEST_CASE("ServerSupervisor reports unknown servers", "[supervisor]")
{
    auto sessions = FakeSessions {};
    auto supervisor = ServerSupervisor(sessions.factory());
    supervisor.setConfiguration(configOf({ makeDescriptor("known", "unused") }));

    auto result = supervisor.start("ghost");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NotFound);
    CHECK(result.error().message == "Server 'ghost' not found in configuration");
}

TEST_CASE("ServerSupervisor shares concurrent starts of one server", "[supervisor]")
{
    auto sessions = FakeSessions {};
    sessions.control("slow")->startDelay = std::chrono::milliseconds(100);
    auto supervisor = ServerSupervisor(sessions.factory());
    supervisor.setConfiguration(configOf({ makeDescriptor("slow", "unused") }));

    auto first = std::async(std::launch::async, [&] { return supervisor.start("slow"); });
    auto second = std::async(std::launch::async, [&] { return supervisor.start("slow"); });

    CHECK(first.get().has_value());
    CHECK(second.get().has_value());
    CHECK(sessions.control("slow")->starts == 1);

    // Starting a running server does not relaunch it.
    CHECK(supervisor.start("slow").has_value());
    CHECK(sessions.control("slow")->starts == 1);
}

TEST_CASE("ServerSupervisor forgets servers that fail to start", "[supervisor]")
{
    auto sessions = FakeSessions {};
    sessions.control("bad")->startError = Error { ErrorCode::LaunchError, "no luck" };
    auto supervisor = ServerSupervisor(sessions.factory());

    auto const report = supervisor.startAll(configOf({ makeDescriptor("bad", "unused") }));
    CHECK(report.allFailed());
    CHECK(report.outcomes.at("bad").status == StartStatus::Failed);
    CHECK(report.outcomes.at("bad").error->message == "no luck");
    CHECK(!supervisor.isRunning("bad"));
    CHECK(supervisor.session("bad") == nullptr);
}

TEST_CASE("ServerSupervisor stop and stopAll release sessions", "[supervisor]")
{
    auto sessions = FakeSessions {};
    auto supervisor = ServerSupervisor(sessions.factory());
    auto const report = supervisor.startAll(configOf({ makeDescriptor("a", "x"), makeDescriptor("b", "x") }));
    REQUIRE(report.startedNames().size() == 2);

    auto const statuses = supervisor.statuses();
    REQUIRE(statuses.size() == 2);
    CHECK(statuses[0].name == "a");
    CHECK(statuses[0].status == HealthStatus::Ready);

    supervisor.stop("a");
    CHECK(!supervisor.isRunning("a"));
    CHECK(sessions.control("a")->stops == 1);

    // Stopping an unknown or stopped server is harmless.
    supervisor.stop("a");
    supervisor.stop("nobody");

    supervisor.stopAll();
    CHECK(supervisor.runningNames().empty());
    CHECK(sessions.control("b")->stops == 1);
}

TEST_CASE("ServerSupervisor removes lost sessions and notifies listeners", "[supervisor]")
{
    auto sessions = FakeSessions {};
    auto notifications = test::Notifications {};
    auto supervisor = ServerSupervisor(sessions.factory());
    supervisor.subscribe(notifications.listener());

    REQUIRE(supervisor.startAll(configOf({ makeDescriptor("fragile", "x") })).startedNames().size() == 1);
    REQUIRE(sessions.created.size() == 1);

    sessions.created.front()->lose("Process exited with code 1");

    CHECK(test::eventually([&] { return !supervisor.isRunning("fragile"); }));
    CHECK(test::eventually([&] { return notifications.count(ServerChange::Lost) == 1; }));
    CHECK(notifications.last().detail == "Process exited with code 1");
    CHECK(sessions.control("fragile")->stops == 1);
}

TEST_CASE("PipeSession fails when the process exits during startup", "[supervisor]")
{
    auto session = PipeSession(makeDescriptor("crash", "sh", { "-c", "echo broken >&2; exit 3" }), fastSessionOptions());

    auto result = session.start();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LaunchError);
    CHECK(result.error().message.find("exited during startup with code 3") != std::string::npos);
    CHECK(result.error().message.find("broken") != std::string::npos);
    CHECK(!session.isAlive());
}

TEST_CASE("PipeSession reports unknown commands", "[supervisor]")
{
    auto session = PipeSession(makeDescriptor("missing", "/nonexistent/mcp-server"), fastSessionOptions());

    auto result = session.start();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LauncherNotFound);
}

TEST_CASE("PipeSession forwards stderr and detects exit", "[supervisor]")
{
    auto session = PipeSession(makeDescriptor("chatty", "sh", { "-c", "sleep 0.5; echo hello >&2; sleep 0.5; exit 4" }),
                               fastSessionOptions());
    REQUIRE(session.start().has_value());
    CHECK(session.isAlive());

    auto transport = session.openProtocolTransport();
    REQUIRE(transport.has_value());
    CHECK((*transport)->isConnected());

    auto events = session.events();
    auto first = events->receiveFor(std::chrono::seconds(5));
    REQUIRE(first.has_value());
    CHECK(first->kind == SessionEvent::Kind::Stderr);
    CHECK(first->text == "hello");

    auto second = events->receiveFor(std::chrono::seconds(5));
    REQUIRE(second.has_value());
    CHECK(second->kind == SessionEvent::Kind::Lost);
    CHECK(second->text == "Process exited with code 4");

    CHECK(session.stop().has_value());
}

TEST_CASE("ServerSupervisor isolates a failing pipe server", "[supervisor]")
{
    auto supervisor = ServerSupervisor(makeSessionFactory(fastSessionOptions()));

    auto const report = supervisor.startAll(configOf({
        makeDescriptor("good", "sleep", { "30" }),
        makeDescriptor("bad", "sh", { "-c", "exit 3" }),
    }));

    CHECK(report.outcomes.at("good").status == StartStatus::Started);
    CHECK(report.outcomes.at("bad").status == StartStatus::Failed);
    CHECK(report.outcomes.at("bad").error->code == ErrorCode::LaunchError);
    CHECK(supervisor.runningNames() == std::set<std::string> { "good" });

    supervisor.stopAll();
    CHECK(supervisor.runningNames().empty());
}

TEST_CASE("LocalPortSession gives up when the health check never passes", "[supervisor]")
{
    auto const port = findFreePort();
    REQUIRE(port != 0);

    auto const pidFile = std::filesystem::temp_directory_path() / std::format("mcpbridge_web_{}.pid", port);
    std::filesystem::remove(pidFile);

    auto descriptor =
        makeDescriptor("web", "sh", { "-c", std::format("echo $$ > '{}'; exec sleep 30", pidFile.string()) });
    descriptor.mode = TransportMode::LocalPort;
    descriptor.port = port;

    // Leaves the shell enough time to record its pid before the health budget runs out.
    auto options = fastSessionOptions();
    options.healthInterval = std::chrono::milliseconds(200);

    auto supervisor = ServerSupervisor(makeSessionFactory(options));
    supervisor.setConfiguration(configOf({ descriptor }));

    auto result = supervisor.start("web");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::HealthCheckTimeout);
    CHECK(result.error().message.find(std::format("did not become healthy on port {} after 2 attempts", port))
          != std::string::npos);
    CHECK(!supervisor.isRunning("web"));
    CHECK(supervisor.runningNames().empty());
    CHECK(supervisor.session("web") == nullptr);

    // The spawned server has been killed and reaped.
    auto pid = pid_t { 0 };
    std::ifstream(pidFile) >> pid;
    std::filesystem::remove(pidFile);
    REQUIRE(pid > 0);
    CHECK(::kill(pid, 0) == -1);
    CHECK(errno == ESRCH);
}

TEST_CASE("LocalPortSession refuses a port that is already bound", "[supervisor]")
{
    auto const port = findFreePort();
    REQUIRE(port != 0);

    auto const fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    auto address = sockaddr_in {};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) == 0);
    REQUIRE(::listen(fd, 1) == 0);

    auto descriptor = makeDescriptor("web", "sleep", { "30" });
    descriptor.mode = TransportMode::LocalPort;
    descriptor.port = port;

    auto session = LocalPortSession(descriptor, fastSessionOptions());
    auto result = session.start();
    ::close(fd);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LaunchError);
    CHECK(result.error().message == std::format("Port {} is already in use", port));

    SECTION("a missing port is a configuration error")
    {
        descriptor.port.reset();
        auto unconfigured = LocalPortSession(descriptor, fastSessionOptions());
        auto missing = unconfigured.start();
        REQUIRE(!missing.has_value());
        CHECK(missing.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("EventStreamSession removes a server after exhausting reconnects", "[supervisor]")
{
    auto control = std::make_shared<test::FakeStreamControl>();
    auto descriptor = makeDescriptor("remote", "");
    descriptor.mode = TransportMode::EventStream;
    descriptor.eventStream = EventStreamOptions {
        .endpoint = "https://example.com/sse",
        .headers = {},
        .reconnectInterval = std::chrono::milliseconds(10),
    };

    auto notifications = test::Notifications {};
    auto supervisor = ServerSupervisor(makeSessionFactory(fastSessionOptions(), test::fakeStreamFactory(control)));
    supervisor.subscribe(notifications.listener());
    supervisor.setConfiguration(configOf({ descriptor }));

    REQUIRE(supervisor.start("remote").has_value());
    CHECK(supervisor.isRunning("remote"));

    SECTION("a connected stream offers a protocol transport")
    {
        auto session = supervisor.session("remote");
        REQUIRE(session != nullptr);
        auto transport = session->openProtocolTransport();
        REQUIRE(transport.has_value());
        CHECK((*transport)->isConnected());
    }

    SECTION("a drop followed by failed reconnects loses the server")
    {
        control->drop();

        CHECK(test::eventually([&] { return !supervisor.isRunning("remote"); }));
        CHECK(test::eventually([&] { return notifications.count(ServerChange::Lost) == 1; }));
        CHECK(notifications.last().detail == "Event stream lost after 3 reconnect attempts");
        // One initial open plus three reconnect attempts.
        CHECK(control->opens == 4);
    }

    SECTION("a drop followed by a successful reconnect keeps the server")
    {
        control->allowedOpens = 2;
        control->drop();

        CHECK(test::eventually([&] { return notifications.count(ServerChange::Reconnected) == 1; }));
        CHECK(supervisor.isRunning("remote"));
        CHECK(supervisor.status("remote") == HealthStatus::Ready);
        CHECK(control->opens == 2);
    }
}

TEST_CASE("StartReport treats an empty or disabled-only start as failed", "[supervisor]")
{
    auto report = StartReport {};
    CHECK(report.allFailed());

    report.outcomes["off"] = StartOutcome { .status = StartStatus::NotStarted, .error = std::nullopt };
    CHECK(report.allFailed());
    CHECK(report.startedNames().empty());

    report.outcomes["on"] = StartOutcome { .status = StartStatus::Started, .error = std::nullopt };
    CHECK(!report.allFailed());
}
