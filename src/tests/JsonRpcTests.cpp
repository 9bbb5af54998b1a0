// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpbridge;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "tools/list");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "tools/list");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "name", "search" } };
    auto request = jsonrpc::makeRequest(42, "tools/call", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["name"] == "search");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("responseId identifies responses", "[jsonrpc]")
{
    SECTION("numeric id")
    {
        CHECK(jsonrpc::responseId({ { "jsonrpc", "2.0" }, { "id", 7 }, { "result", {} } }) == 7);
    }

    SECTION("numeric id echoed as string")
    {
        CHECK(jsonrpc::responseId({ { "jsonrpc", "2.0" }, { "id", "12" }, { "result", {} } }) == 12);
    }

    SECTION("non-numeric string id")
    {
        CHECK(!jsonrpc::responseId({ { "jsonrpc", "2.0" }, { "id", "abc" }, { "result", {} } }).has_value());
    }

    SECTION("notification")
    {
        CHECK(!jsonrpc::responseId(jsonrpc::makeNotification("notifications/progress")).has_value());
    }

    SECTION("server-initiated request")
    {
        CHECK(!jsonrpc::responseId(jsonrpc::makeRequest(3, "sampling/createMessage")).has_value());
    }

    SECTION("non-object")
    {
        CHECK(!jsonrpc::responseId(nlohmann::json::array()).has_value());
    }
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto result = jsonrpc::parseResponse(nlohmann::json { { "version", "1.0" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);

    CHECK(!jsonrpc::parseResponse(nlohmann::json("text")).has_value());
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}
