// SPDX-License-Identifier: Apache-2.0
#include "McpTypes.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace mcphub
{

auto deploymentMethodFromString(std::string_view name) -> std::optional<DeploymentMethod>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "docker")
        return DeploymentMethod::Docker;
    if (lower == "npx")
        return DeploymentMethod::Npx;
    if (lower == "uvx")
        return DeploymentMethod::Uvx;
    if (lower == "http")
        return DeploymentMethod::Http;
    return std::nullopt;
}

auto serverConfigToJson(const ServerConfig& config) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "id", config.id },
        { "name", config.name },
        { "enabled", config.enabled },
        { "command", deploymentMethodToString(config.deploymentMethod) },
        { "args", config.args },
        { "env", config.env },
    };
    if (config.description)
        obj["description"] = *config.description;
    return obj;
}

auto serverConfigFromJson(std::string_view name, const nlohmann::json& obj) -> Result<ServerConfig>
{
    if (!obj.is_object())
        return makeError(ErrorCode::SerializationError, std::format("Server '{}' is not a JSON object", name));

    auto config = ServerConfig {};
    config.name = json::getStringOr(obj, "name", name);
    config.id = json::getStringOr(obj, "id", config.name);
    config.enabled = json::getBoolOr(obj, "enabled", true);
    config.args = json::getStringArray(obj, "args");
    config.description = json::getOptionalString(obj, "description");

    if (obj.contains("env"))
        config.env = json::toStringMap(obj["env"]);

    auto const methodName = json::getStringOr(obj, "command", json::getStringOr(obj, "deploymentMethod", ""));
    auto const method = deploymentMethodFromString(methodName);
    if (!method)
        return makeConfigError(config.name, "command", std::format("unknown deployment method '{}'", methodName));
    config.deploymentMethod = *method;

    return config;
}

auto toolDefinitionToJson(const ToolDefinition& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
}

auto resourceToJson(const Resource& resource) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "uri", resource.uri },
        { "name", resource.name },
    };
    if (resource.description)
        obj["description"] = *resource.description;
    if (resource.mimeType)
        obj["mimeType"] = *resource.mimeType;
    return obj;
}

auto mcpServerToJson(const McpServer& server) -> nlohmann::json
{
    auto tools = nlohmann::json::array();
    for (const auto& tool: server.tools)
        tools.push_back(toolDefinitionToJson(tool));

    auto resources = nlohmann::json::array();
    for (const auto& resource: server.resources)
        resources.push_back(resourceToJson(resource));

    return nlohmann::json {
        { "config", serverConfigToJson(server.config) },
        { "status", serverStatusToString(server.status) },
        { "tools", std::move(tools) },
        { "resources", std::move(resources) },
        { "createdAt", server.createdAt },
        { "updatedAt", server.updatedAt },
    };
}

} // namespace mcphub
