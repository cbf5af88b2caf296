// SPDX-License-Identifier: Apache-2.0
#include <mcp/ConfigValidation.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mcphub;

namespace
{

auto validConfig() -> ServerConfig
{
    return ServerConfig {
        .id = "s1",
        .name = "serena",
        .enabled = true,
        .deploymentMethod = DeploymentMethod::Docker,
        .args = { "run", "-i", "serena:latest" },
        .env = { { "LOG_LEVEL", "debug" } },
        .description = "Semantic code tools",
    };
}

} // namespace

TEST_CASE("validateServerConfig accepts a valid configuration", "[validation]")
{
    auto result = validation::validateServerConfig(validConfig());
    REQUIRE(result.has_value());
    CHECK(*result == validConfig());
}

TEST_CASE("validateServerConfig trims id, name and description", "[validation]")
{
    auto config = validConfig();
    config.id = "  s1 ";
    config.name = "\tserena  ";
    config.description = "   ";

    auto result = validation::validateServerConfig(config);
    REQUIRE(result.has_value());
    CHECK(result->id == "s1");
    CHECK(result->name == "serena");
    CHECK(!result->description.has_value());
}

TEST_CASE("validateServerId rejects empty, long and non-identifier ids", "[validation]")
{
    auto const expectIdError = [](std::string_view id) {
        auto result = validation::validateServerId(id);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigurationError);
        CHECK(result.error().field == "id");
    };

    expectIdError("");
    expectIdError("   ");
    expectIdError(std::string(validation::MaxServerIdLength + 1, 'a'));
    expectIdError("has space");
    expectIdError("slash/id");

    CHECK(validation::validateServerId("mcp_server-01").has_value());
    CHECK(validation::validateServerId(std::string(validation::MaxServerIdLength, 'a')).has_value());
}

TEST_CASE("validateServerName rejects names that cannot be routed", "[validation]")
{
    CHECK(validation::validateServerName("").error().field == "name");
    CHECK(validation::validateServerName(std::string(validation::MaxServerNameLength + 1, 'n')).error().field
          == "name");
    CHECK(validation::validateServerName("bad\x01name").error().field == "name");
    CHECK(validation::validateServerName("a__b").error().field == "name");
    CHECK(validation::validateServerName("trailing_").error().field == "name");
    CHECK(validation::validateServerName("snake_case_server").has_value());

    auto spaced = validation::validateServerName("My Server (beta)");
    REQUIRE(spaced.has_value());
    CHECK(*spaced == "My Server (beta)");
}

TEST_CASE("validateServerConfig reports the offending arg", "[validation]")
{
    auto config = validConfig();
    config.args.push_back(std::string(validation::MaxArgLength + 1, 'x'));

    auto result = validation::validateServerConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigurationError);
    CHECK(result.error().field == "args[3]");

    config = validConfig();
    config.args.assign(validation::MaxArgsCount + 1, "x");
    CHECK(validation::validateServerConfig(config).error().field == "args");

    config = validConfig();
    config.args[1] = std::string("a\0b", 3);
    CHECK(validation::validateServerConfig(config).error().field == "args[1]");
}

TEST_CASE("validateServerConfig reports the offending environment variable", "[validation]")
{
    auto config = validConfig();
    config.env["BAD-NAME"] = "x";
    auto result = validation::validateServerConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().field == "env.BAD-NAME");

    config = validConfig();
    config.env["API_KEY"] = std::string(validation::MaxEnvValueLength + 1, 'k');
    CHECK(validation::validateServerConfig(config).error().field == "env.API_KEY");

    config = validConfig();
    config.env["TOKEN"] = std::string("a\0b", 3);
    CHECK(validation::validateServerConfig(config).error().field == "env.TOKEN");

    config = validConfig();
    for (auto i = std::size_t { 0 }; i <= validation::MaxEnvCount; ++i)
        config.env["VAR_" + std::to_string(i)] = "v";
    CHECK(validation::validateServerConfig(config).error().field == "env");
}

TEST_CASE("validateServerConfig rejects an overlong description", "[validation]")
{
    auto config = validConfig();
    config.description = std::string(validation::MaxDescriptionLength + 1, 'd');

    auto result = validation::validateServerConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().field == "description");
}

TEST_CASE("validateToolName accepts namespaced names", "[validation]")
{
    CHECK(validation::validateToolName("read_file").has_value());
    CHECK(validation::validateToolName("github:create-issue").has_value());
    CHECK(validation::validateToolName("fs/read").has_value());
    CHECK(*validation::validateToolName("  search ") == "search");
}

TEST_CASE("validateToolName rejects empty, long and unusual names", "[validation]")
{
    CHECK(validation::validateToolName("").error().code == ErrorCode::InvalidArgument);
    CHECK(validation::validateToolName(std::string(validation::MaxToolNameLength + 1, 't')).error().code
          == ErrorCode::InvalidArgument);
    CHECK(validation::validateToolName("rm -rf").error().code == ErrorCode::InvalidArgument);
    CHECK(validation::validateToolName("tool;drop").error().code == ErrorCode::InvalidArgument);
}
