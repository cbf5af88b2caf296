// SPDX-License-Identifier: Apache-2.0
#include "Protocol.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphub::protocol
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

auto makeInitializeParams() -> nlohmann::json
{
    return nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };
}

auto parseInitializeResult(const nlohmann::json& result) -> Result<InitializeResult>
{
    if (!result.is_object())
        return makeError(ErrorCode::InitializationFailed,
                         std::format("initialize returned a non-object result: {}", result.dump()));

    auto const serverInfo = result.value("serverInfo", nlohmann::json::object());

    auto init = InitializeResult {
        .protocolVersion = json::getStringOr(result, "protocolVersion", ""),
        .serverInfo =
            ServerInfo {
                .name = json::getStringOr(serverInfo, "name", "unknown"),
                .version = json::getStringOr(serverInfo, "version", "unknown"),
            },
        .capabilities = {},
    };

    if (result.contains("capabilities") && result["capabilities"].is_object())
    {
        auto const& caps = result["capabilities"];
        init.capabilities.hasTools = caps.contains("tools") && !caps["tools"].is_null();
        init.capabilities.hasResources = caps.contains("resources") && !caps["resources"].is_null();
        init.capabilities.hasPrompts = caps.contains("prompts") && !caps["prompts"].is_null();
    }

    return init;
}

auto parseToolList(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>
{
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        return makeError(ErrorCode::SerializationError, "tools/list result has no 'tools' array");

    auto tools = std::vector<ToolDefinition> {};
    for (const auto& toolJson: result["tools"])
    {
        auto name = json::getString(toolJson, "name");
        if (!name)
            return makeError(ErrorCode::SerializationError, "tools/list entry without a name");

        auto tool = ToolDefinition {
            .name = std::move(*name),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
        };
        tools.push_back(std::move(tool));
    }

    return tools;
}

auto parseResourceList(const nlohmann::json& result) -> Result<std::vector<Resource>>
{
    if (!result.is_object() || !result.contains("resources") || !result["resources"].is_array())
        return makeError(ErrorCode::SerializationError, "resources/list result has no 'resources' array");

    auto resources = std::vector<Resource> {};
    for (const auto& item: result["resources"])
    {
        auto uri = json::getString(item, "uri");
        if (!uri)
            return makeError(ErrorCode::SerializationError, "resources/list entry without a uri");

        resources.push_back(Resource {
            .uri = std::move(*uri),
            .name = json::getStringOr(item, "name", ""),
            .description = json::getOptionalString(item, "description"),
            .mimeType = json::getOptionalString(item, "mimeType"),
        });
    }

    return resources;
}

auto parseContent(const nlohmann::json& item) -> Result<Content>
{
    auto const type = json::getStringOr(item, "type", "");

    if (type == "text")
        return TextContent { .text = json::getStringOr(item, "text", "") };

    if (type == "image")
    {
        return ImageContent {
            .data = json::getStringOr(item, "data", ""),
            .mimeType = json::getStringOr(item, "mimeType", json::getStringOr(item, "mime_type", "")),
        };
    }

    if (type == "resource")
        return ResourceContent { .resource = item.value("resource", nlohmann::json::object()) };

    return makeError(ErrorCode::SerializationError, std::format("Unknown content type '{}'", type));
}

auto parseToolCallResponse(const nlohmann::json& result) -> Result<ToolCallResponse>
{
    auto response = ToolCallResponse {};
    if (result.is_null())
        return response;

    if (!result.is_object())
        return makeError(ErrorCode::SerializationError, "tools/call result is not an object");

    response.isError = json::getBoolOr(result, "isError", false);

    if (result.contains("content") && result["content"].is_array())
    {
        for (const auto& item: result["content"])
        {
            auto content = parseContent(item);
            if (!content)
                return std::unexpected(content.error());
            response.content.push_back(std::move(*content));
        }
    }

    return response;
}

auto contentToJson(const Content& content) -> nlohmann::json
{
    return std::visit(Overloaded {
                          [](const TextContent& c) -> nlohmann::json {
                              return { { "type", "text" }, { "text", c.text } };
                          },
                          [](const ImageContent& c) -> nlohmann::json {
                              return { { "type", "image" }, { "data", c.data }, { "mimeType", c.mimeType } };
                          },
                          [](const ResourceContent& c) -> nlohmann::json {
                              return { { "type", "resource" }, { "resource", c.resource } };
                          },
                      },
                      content);
}

auto contentText(const ToolCallResponse& response) -> std::string
{
    auto text = std::string {};
    auto const append = [&text](std::string_view part) {
        if (!text.empty())
            text += "\n";
        text += part;
    };

    for (const auto& item: response.content)
    {
        if (auto const* t = std::get_if<TextContent>(&item))
            append(t->text);
        else if (auto const* r = std::get_if<ResourceContent>(&item); r && r->resource.contains("text"))
            append(json::getStringOr(r->resource, "text", ""));
    }

    return text;
}

} // namespace mcphub::protocol
