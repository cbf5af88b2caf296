// SPDX-License-Identifier: Apache-2.0
#include <mcp/Protocol.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mcphub;

TEST_CASE("makeInitializeParams announces protocol version and client", "[protocol]")
{
    auto params = protocol::makeInitializeParams();

    CHECK(params["protocolVersion"].get<std::string>() == protocol::ProtocolVersion);
    CHECK(params["capabilities"].is_object());
    CHECK(params["clientInfo"]["name"].get<std::string>() == protocol::ClientName);
    CHECK(params["clientInfo"]["version"].get<std::string>() == protocol::ClientVersion);
}

TEST_CASE("parseInitializeResult reads server info and capabilities", "[protocol]")
{
    auto result = protocol::parseInitializeResult(nlohmann::json {
        { "protocolVersion", "2025-06-18" },
        { "serverInfo", { { "name", "filesystem" }, { "version", "0.6.2" } } },
        { "capabilities", { { "tools", nlohmann::json::object() }, { "resources", { { "subscribe", true } } } } },
    });

    REQUIRE(result.has_value());
    CHECK(result->protocolVersion == "2025-06-18");
    CHECK(result->serverInfo.name == "filesystem");
    CHECK(result->serverInfo.version == "0.6.2");
    CHECK(result->capabilities.hasTools);
    CHECK(result->capabilities.hasResources);
    CHECK(!result->capabilities.hasPrompts);
}

TEST_CASE("parseInitializeResult accepts a server advertising nothing", "[protocol]")
{
    auto result = protocol::parseInitializeResult(nlohmann::json::object());

    REQUIRE(result.has_value());
    CHECK(result->serverInfo.name == "unknown");
    CHECK(!result->capabilities.hasTools);
    CHECK(!result->capabilities.hasResources);
}

TEST_CASE("parseInitializeResult rejects a non-object result", "[protocol]")
{
    auto result = protocol::parseInitializeResult(nlohmann::json("ready"));

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InitializationFailed);
}

TEST_CASE("parseToolList preserves server order and defaults the schema", "[protocol]")
{
    auto result = protocol::parseToolList(nlohmann::json {
        { "tools",
          nlohmann::json::array({
              { { "name", "write_file" }, { "description", "Writes a file" } },
              { { "name", "read_file" },
                { "inputSchema",
                  { { "type", "object" }, { "properties", { { "path", { { "type", "string" } } } } } } } },
          }) },
    });

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    CHECK(result->at(0).name == "write_file");
    CHECK(result->at(0).description == "Writes a file");
    CHECK(result->at(0).inputSchema == nlohmann::json::object());
    CHECK(result->at(1).name == "read_file");
    CHECK(result->at(1).description.empty());
    CHECK(result->at(1).inputSchema["properties"].contains("path"));
}

TEST_CASE("parseToolList rejects a result without tools array", "[protocol]")
{
    auto result = protocol::parseToolList(nlohmann::json { { "items", nlohmann::json::array() } });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SerializationError);
}

TEST_CASE("parseResourceList reads optional fields", "[protocol]")
{
    auto result = protocol::parseResourceList(nlohmann::json {
        { "resources",
          nlohmann::json::array({
              { { "uri", "file:///tmp/notes.txt" }, { "name", "notes" }, { "mimeType", "text/plain" } },
              { { "uri", "db://users" }, { "name", "users" }, { "description", "User table" } },
          }) },
    });

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    CHECK(result->at(0).uri == "file:///tmp/notes.txt");
    CHECK(result->at(0).mimeType == "text/plain");
    CHECK(!result->at(0).description.has_value());
    CHECK(result->at(1).description == "User table");
    CHECK(!result->at(1).mimeType.has_value());
}

TEST_CASE("parseToolCallResponse handles mixed content", "[protocol]")
{
    auto result = protocol::parseToolCallResponse(nlohmann::json {
        { "content",
          nlohmann::json::array({
              { { "type", "text" }, { "text", "first" } },
              { { "type", "image" }, { "data", "aGVsbG8=" }, { "mimeType", "image/png" } },
              { { "type", "resource" },
                { "resource", { { "uri", "file:///a.txt" }, { "text", "second" } } } },
          }) },
    });

    REQUIRE(result.has_value());
    CHECK(!result->isError);
    REQUIRE(result->content.size() == 3);
    CHECK(std::holds_alternative<protocol::TextContent>(result->content[0]));
    REQUIRE(std::holds_alternative<protocol::ImageContent>(result->content[1]));
    CHECK(std::get<protocol::ImageContent>(result->content[1]).mimeType == "image/png");
    CHECK(std::holds_alternative<protocol::ResourceContent>(result->content[2]));

    CHECK(protocol::contentText(*result) == "first\nsecond");
}

TEST_CASE("parseToolCallResponse keeps the isError flag", "[protocol]")
{
    auto result = protocol::parseToolCallResponse(nlohmann::json {
        { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "no such file" } } }) },
        { "isError", true },
    });

    REQUIRE(result.has_value());
    CHECK(result->isError);
    CHECK(protocol::contentText(*result) == "no such file");
}

TEST_CASE("parseToolCallResponse treats a null result as empty success", "[protocol]")
{
    auto result = protocol::parseToolCallResponse(nullptr);

    REQUIRE(result.has_value());
    CHECK(result->content.empty());
    CHECK(!result->isError);
}

TEST_CASE("parseContent rejects unknown content types", "[protocol]")
{
    auto result = protocol::parseContent(nlohmann::json { { "type", "audio" }, { "data", "..." } });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SerializationError);
}

TEST_CASE("contentToJson writes the wire form", "[protocol]")
{
    auto const wire = protocol::contentToJson(protocol::ImageContent { .data = "abc", .mimeType = "image/jpeg" });

    CHECK(wire["type"] == "image");
    CHECK(wire["data"] == "abc");
    CHECK(wire["mimeType"] == "image/jpeg");
}
