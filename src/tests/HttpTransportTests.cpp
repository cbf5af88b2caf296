// SPDX-License-Identifier: Apache-2.0
#include <mcp/HttpTransport.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

/// @brief In-process MCP server answering JSON-RPC POSTs on 127.0.0.1.
class LocalMcpServer
{
  public:
    LocalMcpServer()
    {
        _server.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
            {
                auto lock = std::lock_guard(_mutex);
                _authorization.push_back(req.get_header_value("Authorization"));
                _tenant.push_back(req.get_header_value("x-tenant"));
            }

            auto const message = nlohmann::json::parse(req.body);
            if (!message.contains("id"))
            {
                res.status = 202;
                return;
            }

            auto const method = message.value("method", "");
            auto result = nlohmann::json::object();
            if (method == "initialize")
                result = { { "protocolVersion", "2025-06-18" },
                           { "serverInfo", { { "name", "remote" }, { "version", "2.0" } } },
                           { "capabilities", { { "tools", nlohmann::json::object() } } } };
            else if (method == "tools/list")
                result = { { "tools", nlohmann::json::array({ { { "name", "search" }, { "description", "Web search" } } }) } };
            else if (method == "tools/call")
                result = { { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "3 results" } } }) } };

            res.set_content(jsonrpc::makeResponse(message["id"], result).dump(), "application/json");
        });

        _port = _server.bind_to_any_port("127.0.0.1");
        _thread = std::thread([this] { _server.listen_after_bind(); });
        while (!_server.is_running())
            std::this_thread::sleep_for(5ms);
    }

    ~LocalMcpServer()
    {
        _server.stop();
        _thread.join();
    }

    LocalMcpServer(const LocalMcpServer&) = delete;
    LocalMcpServer& operator=(const LocalMcpServer&) = delete;

    [[nodiscard]] auto url() const -> std::string { return std::format("http://127.0.0.1:{}/mcp", _port); }

    [[nodiscard]] auto authorizationHeaders() -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_mutex);
        return _authorization;
    }

    [[nodiscard]] auto tenantHeaders() -> std::vector<std::string>
    {
        auto lock = std::lock_guard(_mutex);
        return _tenant;
    }

  private:
    httplib::Server _server;
    int _port = 0;
    std::thread _thread;
    std::mutex _mutex;
    std::vector<std::string> _authorization;
    std::vector<std::string> _tenant;
};

} // namespace

TEST_CASE("parseHttpUrl splits scheme, host, port and path", "[http]")
{
    auto parsed = parseHttpUrl("remote", "https://mcp.example.com/v1/mcp");
    REQUIRE(parsed.has_value());
    CHECK(parsed->scheme == "https");
    CHECK(parsed->host == "mcp.example.com");
    CHECK(parsed->port == 443);
    CHECK(parsed->path == "/v1/mcp");
    CHECK(parsed->origin() == "https://mcp.example.com:443");

    auto local = parseHttpUrl("local", "http://localhost:8931");
    REQUIRE(local.has_value());
    CHECK(local->port == 8931);
    CHECK(local->path == "/");
}

TEST_CASE("parseHttpUrl keeps a query string out of the host", "[http]")
{
    auto query = parseHttpUrl("remote", "https://mcp.example.com:8443?token=abc");
    REQUIRE(query.has_value());
    CHECK(query->host == "mcp.example.com");
    CHECK(query->port == 8443);
    CHECK(query->path == "/?token=abc");

    auto fragment = parseHttpUrl("remote", "http://localhost#top");
    REQUIRE(fragment.has_value());
    CHECK(fragment->host == "localhost");
    CHECK(fragment->path == "/");

    auto full = parseHttpUrl("remote", "http://localhost/mcp?x=1#frag");
    REQUIRE(full.has_value());
    CHECK(full->path == "/mcp?x=1");
}

TEST_CASE("parseHttpUrl rejects other schemes and bad ports", "[http]")
{
    auto ws = parseHttpUrl("remote", "ws://mcp.example.com");
    REQUIRE(!ws.has_value());
    CHECK(ws.error().code == ErrorCode::ConfigurationError);
    CHECK(ws.error().field == "args[0]");

    auto port = parseHttpUrl("remote", "http://mcp.example.com:99999/");
    REQUIRE(!port.has_value());
    CHECK(port.error().field == "args[0]");

    auto host = parseHttpUrl("remote", "http:///path");
    REQUIRE(!host.has_value());
    CHECK(host.error().field == "args[0]");
}

TEST_CASE("buildHttpHeaders maps API_KEY and HEADER_ entries", "[http]")
{
    auto headers = buildHttpHeaders("remote",
                                    {
                                        { "API_KEY", "sk-test" },
                                        { "HEADER_X_TENANT", "acme" },
                                        { "UNRELATED", "ignored" },
                                    });

    REQUIRE(headers.has_value());
    REQUIRE(headers->size() == 2);
    CHECK(std::ranges::find(*headers, std::pair<std::string, std::string> { "Authorization", "Bearer sk-test" })
          != headers->end());
    CHECK(std::ranges::find(*headers, std::pair<std::string, std::string> { "x-tenant", "acme" }) != headers->end());
}

TEST_CASE("buildHttpHeaders rejects an empty API key", "[http]")
{
    auto headers = buildHttpHeaders("remote", { { "API_KEY", "" } });

    REQUIRE(!headers.has_value());
    CHECK(headers.error().code == ErrorCode::ConfigurationError);
    CHECK(headers.error().field == "env.API_KEY");
}

TEST_CASE("HttpTransport send fails when not connected", "[http]")
{
    auto transport = HttpTransport();

    auto result = transport.send(jsonrpc::makeRequest(1, "tools/list"));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionFailed);
}

TEST_CASE("HttpTransport connect fails for an unreachable server", "[http]")
{
    auto transport = HttpTransport();

    // Port 9 (discard) on loopback is closed on any sane test machine.
    auto result = transport.connect(HttpTransportConfig {
        .name = "nowhere",
        .url = "http://127.0.0.1:9/mcp",
        .env = {},
        .timeout = 500ms,
    });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionFailed);
    CHECK(!transport.isConnected());
}

TEST_CASE("HttpTransport posts requests and hands out replies in order", "[http]")
{
    auto server = LocalMcpServer();
    auto transport = HttpTransport();

    REQUIRE(transport.connect(HttpTransportConfig {
                                  .name = "remote",
                                  .url = server.url(),
                                  .env = { { "API_KEY", "sk-test" } },
                                  .timeout = 2s,
                              })
                .has_value());
    CHECK(transport.isConnected());

    REQUIRE(transport.send(jsonrpc::makeRequest(1, "tools/list")).has_value());
    REQUIRE(transport.send(jsonrpc::makeNotification("notifications/initialized")).has_value());

    auto reply = transport.receive(1s);
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 1);
    CHECK((*reply)["result"]["tools"][0]["name"] == "search");

    auto none = transport.receive(1s);
    REQUIRE(!none.has_value());
    CHECK(none.error().code == ErrorCode::ProtocolError);

    transport.close();
    CHECK(!transport.isConnected());

    auto const auth = server.authorizationHeaders();
    REQUIRE(!auth.empty());
    CHECK(std::ranges::all_of(auth, [](const std::string& value) { return value == "Bearer sk-test"; }));
}

TEST_CASE("McpClient connects to an HTTP server and calls a tool", "[http]")
{
    auto server = LocalMcpServer();

    auto client = McpClient(ServerConfig {
        .id = "remote-1",
        .name = "remote",
        .enabled = true,
        .deploymentMethod = DeploymentMethod::Http,
        .args = { server.url() },
        .env = { { "HEADER_X_TENANT", "acme" } },
        .description = std::nullopt,
    });

    REQUIRE(client.connect().has_value());
    CHECK(client.status() == ServerStatus::Running);
    REQUIRE(client.serverInfo().has_value());
    CHECK(client.serverInfo()->name == "remote");
    REQUIRE(client.tools().size() == 1);
    CHECK(client.tools()[0].name == "search");

    auto text = client.callToolText("search", { { "query", "mcp" } });
    REQUIRE(text.has_value());
    CHECK(*text == "3 results");

    client.disconnect();
    CHECK(!client.isConnected());

    auto const tenants = server.tenantHeaders();
    REQUIRE(!tenants.empty());
    CHECK(std::ranges::all_of(tenants, [](const std::string& value) { return value == "acme"; }));
}

TEST_CASE("McpClient rejects an HTTP server without URL", "[http]")
{
    auto client = McpClient(ServerConfig {
        .id = "remote-1",
        .name = "remote",
        .enabled = true,
        .deploymentMethod = DeploymentMethod::Http,
        .args = {},
        .env = {},
        .description = std::nullopt,
    });

    auto result = client.connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigurationError);
    CHECK(result.error().field == "args");
}
