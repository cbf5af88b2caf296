// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include <tests/MockTransport.hpp>

#include <future>
#include <thread>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace
{

auto npxConfig(std::string name = "fake") -> ServerConfig
{
    return ServerConfig {
        .id = name + "-id",
        .name = name,
        .enabled = true,
        .deploymentMethod = DeploymentMethod::Npx,
        .args = { "-y", "@example/fake-mcp" },
        .env = {},
        .description = std::nullopt,
    };
}

auto fixtureOptions() -> ClientOptions
{
    auto options = ClientOptions {};
    options.requestTimeout = 5s;
    options.launchers[DeploymentMethod::Npx] = "sh";
    return options;
}

auto fixtureConfig(std::string name = "fixture") -> ServerConfig
{
    auto config = npxConfig(std::move(name));
    config.args = { MCPHUB_TEST_FIXTURES_DIR "/fake_mcp_server.sh" };
    return config;
}

} // namespace

TEST_CASE("buildStdioCommand prefixes the launcher", "[mcp][client]")
{
    auto const options = ClientOptions {};

    auto docker = npxConfig();
    docker.deploymentMethod = DeploymentMethod::Docker;
    docker.args = { "run", "-i", "--rm", "mcp/fetch" };
    docker.env = { { "TOKEN", "t" } };

    auto command = buildStdioCommand(docker, options);
    REQUIRE(command.has_value());
    CHECK(command->name == "fake");
    CHECK(command->command == "docker");
    CHECK(command->args == docker.args);
    CHECK(command->env.at("TOKEN") == "t");

    auto uvx = npxConfig();
    uvx.deploymentMethod = DeploymentMethod::Uvx;
    CHECK(buildStdioCommand(uvx, options)->command == "uvx");
    CHECK(buildStdioCommand(npxConfig(), options)->command == "npx");
}

TEST_CASE("buildStdioCommand honours launcher overrides", "[mcp][client]")
{
    auto options = ClientOptions {};
    options.launchers[DeploymentMethod::Npx] = "/opt/node/bin/npx";

    auto command = buildStdioCommand(npxConfig(), options);
    REQUIRE(command.has_value());
    CHECK(command->command == "/opt/node/bin/npx");
}

TEST_CASE("buildStdioCommand rejects unusable configurations", "[mcp][client]")
{
    auto empty = npxConfig();
    empty.args.clear();
    auto noArgs = buildStdioCommand(empty, ClientOptions {});
    REQUIRE(!noArgs.has_value());
    CHECK(noArgs.error().code == ErrorCode::ConfigurationError);
    CHECK(noArgs.error().field == "args");

    auto http = npxConfig();
    http.deploymentMethod = DeploymentMethod::Http;
    auto notSpawned = buildStdioCommand(http, ClientOptions {});
    REQUIRE(!notSpawned.has_value());
    CHECK(notSpawned.error().field == "command");
}

TEST_CASE("McpClient connects over an injected transport", "[mcp][client]")
{
    auto client = McpClient(npxConfig(), makeFakeServerTransport("fake"));
    CHECK(!client.isConnected());
    CHECK(client.status() == ServerStatus::Stopped);

    REQUIRE(client.connect().has_value());

    CHECK(client.isConnected());
    CHECK(client.status() == ServerStatus::Running);
    CHECK(client.tools().size() == 2);
    REQUIRE(client.serverInfo().has_value());
    CHECK(client.serverInfo()->name == "fake");
    CHECK(client.isProcessAlive());
}

TEST_CASE("McpClient refuses a second connect", "[mcp][client]")
{
    auto client = McpClient(npxConfig(), makeFakeServerTransport());
    REQUIRE(client.connect().has_value());

    auto again = client.connect();
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::ConfigurationError);
    CHECK(again.error().field == "connection");
}

TEST_CASE("McpClient refuses a connect while another is in progress", "[mcp][client]")
{
    auto entered = std::promise<void> {};
    auto release = std::promise<void> {};
    auto released = release.get_future().share();

    auto transport = makeFakeServerTransport();
    auto fallback = transport->responder;
    transport->responder = [fallback, &entered, released](const nlohmann::json& request) {
        if (request.value("method", "") == "initialize")
        {
            entered.set_value();
            released.wait();
        }
        return fallback(request);
    };

    auto client = McpClient(npxConfig(), std::move(transport));
    auto first = VoidResult {};
    auto connecting = std::jthread([&] { first = client.connect(); });

    entered.get_future().wait();
    CHECK(client.status() == ServerStatus::Starting);

    auto second = client.connect();
    REQUIRE(!second.has_value());
    CHECK(second.error().field == "connection");

    release.set_value();
    connecting.join();

    CHECK(first.has_value());
    CHECK(client.isConnected());
    CHECK(client.status() == ServerStatus::Running);
}

TEST_CASE("McpClient returns a single content item as an object", "[mcp][client]")
{
    auto client = McpClient(npxConfig(), makeFakeServerTransport());
    REQUIRE(client.connect().has_value());

    auto result = client.callTool("echo", { { "q", "hi" } });
    REQUIRE(result.has_value());
    CHECK(result->success);
    CHECK(!result->error.has_value());
    REQUIRE(result->content.is_object());
    CHECK(result->content["type"] == "text");
    CHECK(result->content["text"] == R"(echo: {"q":"hi"})");
}

TEST_CASE("McpClient returns several content items as an array", "[mcp][client]")
{
    auto transport = makeFakeServerTransport();
    auto fallback = transport->responder;
    transport->responder = [fallback](const nlohmann::json& request) -> std::vector<nlohmann::json> {
        if (request.value("method", "") != "tools/call")
            return fallback(request);
        return { jsonrpc::makeResponse(
            request["id"],
            { { "content",
                nlohmann::json::array({
                    { { "type", "text" }, { "text", "first" } },
                    { { "type", "image" }, { "data", "aGk=" }, { "mimeType", "image/png" } },
                }) } }) };
    };

    auto client = McpClient(npxConfig(), std::move(transport));
    REQUIRE(client.connect().has_value());

    auto result = client.callTool("screenshot", {});
    REQUIRE(result.has_value());
    REQUIRE(result->content.is_array());
    REQUIRE(result->content.size() == 2);
    CHECK(result->content[0]["text"] == "first");
    CHECK(result->content[1]["mimeType"] == "image/png");

    auto text = client.callToolText("screenshot", {});
    REQUIRE(text.has_value());
    CHECK(*text == "first");
}

TEST_CASE("McpClient reports a tool-side error as unsuccessful", "[mcp][client]")
{
    auto client = McpClient(npxConfig(), makeFakeServerTransport());
    REQUIRE(client.connect().has_value());

    auto result = client.callTool("fail", {});
    REQUIRE(result.has_value());
    CHECK(!result->success);
    CHECK(result->error == "Tool returned an error");
    CHECK(result->content["text"] == "boom");
}

TEST_CASE("McpClient without a connection reports ServerNotRunning", "[mcp][client]")
{
    auto client = McpClient(npxConfig("offline"));

    auto result = client.callTool("echo", {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ServerNotRunning);
    CHECK(result.error().message.find("offline") != std::string::npos);

    CHECK(!client.refreshTools().has_value());
    CHECK(!client.isProcessAlive());
    CHECK(client.tools().empty());
}

TEST_CASE("McpClient disconnect is idempotent", "[mcp][client]")
{
    auto closes = 0;
    auto transport = makeFakeServerTransport();
    transport->onClose = [&closes] { ++closes; };
    auto client = McpClient(npxConfig(), std::move(transport));
    REQUIRE(client.connect().has_value());

    client.disconnect();
    client.disconnect();

    CHECK(!client.isConnected());
    CHECK(client.status() == ServerStatus::Stopped);
    CHECK(closes == 1);
}

TEST_CASE("McpClient rejects an HTTP server without a URL", "[mcp][client]")
{
    auto config = npxConfig();
    config.deploymentMethod = DeploymentMethod::Http;
    config.args.clear();

    auto client = McpClient(config);
    auto result = client.connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigurationError);
    CHECK(result.error().field == "args");
}

TEST_CASE("McpClient talks to a stdio server process", "[mcp][client][process]")
{
    auto client = McpClient(fixtureConfig(), fixtureOptions());
    REQUIRE(client.connect().has_value());

    CHECK(client.serverInfo()->name == "fake-mcp-server");
    REQUIRE(client.tools().size() == 2);
    CHECK(client.tools()[0].name == "echo");

    auto text = client.callToolText("echo", { { "x", 1 } });
    REQUIRE(text.has_value());
    CHECK(*text == "pong");

    auto failed = client.callTool("fail", {});
    REQUIRE(failed.has_value());
    CHECK(!failed->success);

    client.disconnect();
    CHECK(!client.isProcessAlive());
}

TEST_CASE("testConnection reports tools and latency", "[mcp][client][process]")
{
    auto const result = McpClient::testConnection(fixtureConfig(), fixtureOptions());

    CHECK(result.success);
    CHECK(result.tools.size() == 2);
    CHECK(result.message == "Connected successfully. Found 2 tools and 0 resources.");
}

TEST_CASE("testConnection reports a launcher that cannot be spawned", "[mcp][client][process]")
{
    auto options = ClientOptions {};
    options.launchers[DeploymentMethod::Npx] = "/nonexistent/mcphub-launcher";

    auto const result = McpClient::testConnection(npxConfig(), options);

    CHECK(!result.success);
    CHECK(!result.message.empty());
    CHECK(result.tools.empty());
}
