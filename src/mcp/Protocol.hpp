// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpTypes.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcphub::protocol
{

/// @brief MCP protocol revision announced in @c initialize.
constexpr auto ProtocolVersion = std::string_view { "2025-06-18" };

constexpr auto ClientName = std::string_view { "mcphub" };
constexpr auto ClientVersion = std::string_view { "0.1.0" };

/// @brief Server identity reported in the @c initialize result.
struct ServerInfo
{
    std::string name;
    std::string version;
};

/// @brief Capabilities advertised by a server during @c initialize.
struct ServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
};

/// @brief Parsed @c initialize result.
struct InitializeResult
{
    std::string protocolVersion;
    ServerInfo serverInfo;
    ServerCapabilities capabilities;
};

/// @brief @c {type:"text"} content item.
struct TextContent
{
    std::string text;
};

/// @brief @c {type:"image"} content item (base64 data).
struct ImageContent
{
    std::string data;
    std::string mimeType;
};

/// @brief @c {type:"resource"} content item; @c resource holds the embedded resource object verbatim.
struct ResourceContent
{
    nlohmann::json resource;
};

using Content = std::variant<TextContent, ImageContent, ResourceContent>;

/// @brief Raw result of @c tools/call.
struct ToolCallResponse
{
    std::vector<Content> content;
    bool isError = false;
};

/// @brief Builds the @c initialize parameters: protocol version, empty capabilities and client info.
[[nodiscard]] auto makeInitializeParams() -> nlohmann::json;

/// @brief Parses an @c initialize result.
/// @return The result, or InitializationFailed if it is not an object.
[[nodiscard]] auto parseInitializeResult(const nlohmann::json& result) -> Result<InitializeResult>;

/// @brief Parses a @c tools/list result, preserving server order.
[[nodiscard]] auto parseToolList(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>;

/// @brief Parses a @c resources/list result, preserving server order.
[[nodiscard]] auto parseResourceList(const nlohmann::json& result) -> Result<std::vector<Resource>>;

/// @brief Parses a @c tools/call result. A null result is an empty, successful response.
[[nodiscard]] auto parseToolCallResponse(const nlohmann::json& result) -> Result<ToolCallResponse>;

/// @brief Parses a single content item.
[[nodiscard]] auto parseContent(const nlohmann::json& item) -> Result<Content>;

/// @brief Serializes a content item back to its wire form.
[[nodiscard]] auto contentToJson(const Content& content) -> nlohmann::json;

/// @brief Concatenates the text items of a response, separated by newlines.
///
/// Embedded resources contribute their @c text member when present.
[[nodiscard]] auto contentText(const ToolCallResponse& response) -> std::string;

} // namespace mcphub::protocol
