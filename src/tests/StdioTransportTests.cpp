// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <format>
#include <fstream>
#include <string>
#include <thread>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

/// Zombies count as gone: nothing may reap them in a minimal container.
auto isProcessRunning(int pid) -> bool
{
    auto stat = std::ifstream(std::format("/proc/{}/stat", pid));
    auto line = std::string {};
    if (!std::getline(stat, line))
        return false;
    auto const end = line.rfind(')');
    return end != std::string::npos && end + 2 < line.size() && line[end + 2] != 'Z';
}

} // namespace

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport();
    CHECK(!transport.isConnected());
    CHECK(transport.pid() == -1);
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionFailed);
}

TEST_CASE("StdioTransport receive fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.receive(100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionFailed);
}

TEST_CASE("StdioTransport exchanges newline-delimited JSON with a child", "[transport]")
{
    auto transport = StdioTransport();

    auto startResult = transport.start(StdioTransportConfig {
        .name = "echo",
        .command = "cat",
        .args = {},
        .env = {},
    });
    REQUIRE(startResult.has_value());
    CHECK(transport.isConnected());
    CHECK(transport.pid() > 0);
    CHECK(transport.isAlive());

    // cat echoes stdin to stdout
    REQUIRE(transport.send(nlohmann::json { { "test", "hello" } }).has_value());
    REQUIRE(transport.send(nlohmann::json { { "test", "world" } }).has_value());

    auto first = transport.receive(2s);
    REQUIRE(first.has_value());
    CHECK((*first)["test"] == "hello");

    auto second = transport.receive(2s);
    REQUIRE(second.has_value());
    CHECK((*second)["test"] == "world");

    transport.close();
    CHECK(!transport.isConnected());
    CHECK(transport.pid() == -1);

    // close() is idempotent
    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport receive times out on a silent child", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig {
                                .name = "sleeper",
                                .command = "sleep",
                                .args = { "5" },
                                .env = {},
                            })
                .has_value());

    auto const start = std::chrono::steady_clock::now();
    auto result = transport.receive(200ms);
    auto const elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(result.error().timeoutMs == 200);
    CHECK(elapsed >= 150ms);
    CHECK(elapsed < 3s);
    CHECK(transport.isConnected());

    transport.close();
}

TEST_CASE("StdioTransport reports ConnectionFailed when the child exits", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig {
                                .name = "quitter",
                                .command = "true",
                                .args = {},
                                .env = {},
                            })
                .has_value());

    auto result = transport.receive(2s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionFailed);

    // Give the child a moment to be reapable, then the liveness probe notices.
    std::this_thread::sleep_for(50ms);
    CHECK(!transport.isAlive());
}

TEST_CASE("StdioTransport passes configured environment to the child", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig {
                                .name = "env",
                                .command = "sh",
                                .args = { "-c", R"(printf '{"value":"%s"}\n' "$MCPHUB_TEST_VALUE")" },
                                .env = { { "MCPHUB_TEST_VALUE", "forty-two" } },
                            })
                .has_value());

    auto result = transport.receive(2s);
    REQUIRE(result.has_value());
    CHECK((*result)["value"] == "forty-two");
}

TEST_CASE("StdioTransport reports a line that is not JSON and continues with the next", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig {
                                .name = "noisy",
                                .command = "sh",
                                .args = { "-c", R"(echo 'starting up...'; echo '{"ready":true}'; sleep 1)" },
                                .env = {},
                            })
                .has_value());

    auto banner = transport.receive(2s);
    REQUIRE(!banner.has_value());
    CHECK(banner.error().code == ErrorCode::SerializationError);

    auto result = transport.receive(2s);
    REQUIRE(result.has_value());
    CHECK((*result)["ready"] == true);
}

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto transport = StdioTransport();

    auto result = transport.start(StdioTransportConfig {
        .name = "missing",
        .command = "/nonexistent/command/that/does/not/exist",
        .args = {},
        .env = {},
    });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessSpawnFailed);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport close terminates processes left in the group", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport
                .start(StdioTransportConfig {
                    .name = "orphaning",
                    .command = "sh",
                    .args = { "-c", R"(sleep 30 </dev/null >/dev/null 2>&1 & echo "{\"pid\":$!}")" },
                    .env = {},
                })
                .has_value());

    auto announced = transport.receive(2s);
    REQUIRE(announced.has_value());
    auto const orphan = (*announced)["pid"].get<int>();
    REQUIRE(isProcessRunning(orphan));

    // The shell exits right away; isAlive() reaps it.
    auto const deadline = std::chrono::steady_clock::now() + 2s;
    while (transport.isAlive() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);
    REQUIRE(!transport.isAlive());
    CHECK(transport.pid() == -1);

    transport.close();

    auto const gone = std::chrono::steady_clock::now() + 2s;
    while (isProcessRunning(orphan) && std::chrono::steady_clock::now() < gone)
        std::this_thread::sleep_for(10ms);
    CHECK(!isProcessRunning(orphan));
}
