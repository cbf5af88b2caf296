// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief How an MCP server is launched or reached.
enum class DeploymentMethod
{
    Docker,
    Npx,
    Uvx,
    Http,
};

/// @brief Returns the lowercase persisted name of a deployment method ("docker", "npx", "uvx", "http").
[[nodiscard]] constexpr auto deploymentMethodToString(DeploymentMethod method) -> std::string_view
{
    switch (method)
    {
        case DeploymentMethod::Docker: return "docker";
        case DeploymentMethod::Npx: return "npx";
        case DeploymentMethod::Uvx: return "uvx";
        case DeploymentMethod::Http: return "http";
    }
    return "docker";
}

/// @brief Parses a deployment method name (case-insensitive).
/// @return The method, or std::nullopt for an unknown name.
[[nodiscard]] auto deploymentMethodFromString(std::string_view name) -> std::optional<DeploymentMethod>;

/// @brief Lifecycle state of a server.
enum class ServerStatus
{
    Starting,
    Running,
    Stopped,
    Disconnected,
    Error,
};

[[nodiscard]] constexpr auto serverStatusToString(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Disconnected: return "disconnected";
        case ServerStatus::Error: return "error";
    }
    return "error";
}

/// @brief Persisted configuration of one MCP server.
///
/// For Http, @c args[0] is the base URL. In @c env, @c API_KEY becomes a bearer
/// credential and every @c HEADER_<NAME> key becomes a custom request header.
struct ServerConfig
{
    std::string id;
    std::string name;
    bool enabled = true;
    DeploymentMethod deploymentMethod = DeploymentMethod::Docker;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> description;

    auto operator==(const ServerConfig&) const -> bool = default;
};

/// @brief A remote artifact advertised by @c resources/list.
struct Resource
{
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

/// @brief Live (or persisted-but-stopped) server record.
struct McpServer
{
    ServerConfig config;
    ServerStatus status = ServerStatus::Stopped;
    std::vector<ToolDefinition> tools;
    std::vector<Resource> resources;
    std::string createdAt;
    std::string updatedAt;
};

/// @brief Outcome of a connection probe.
struct TestResult
{
    bool success = false;
    std::string message;
    std::vector<ToolDefinition> tools;
    std::vector<Resource> resources;
    uint64_t latencyMs = 0;
};

/// @brief Structured outcome of a tool call made through the client facade.
///
/// @c content holds the single content item, or an array when the server returned several.
struct ToolCallResult
{
    bool success = false;
    nlohmann::json content;
    std::optional<std::string> error;
    uint64_t durationMs = 0;
};

/// @brief One row of the append-only call log.
struct CallLogEntry
{
    std::string id;
    std::optional<std::string> workflowId;
    std::string serverName;
    std::string toolName;
    nlohmann::json params;
    nlohmann::json result;
    bool success = false;
    uint64_t durationMs = 0;
    std::string timestamp;
};

/// @brief Latency percentiles for one server, computed from the call log.
struct LatencyMetrics
{
    std::string serverName;
    uint64_t p50Ms = 0;
    uint64_t p95Ms = 0;
    uint64_t p99Ms = 0;
    uint64_t totalCalls = 0;
};

/// @brief Serializes a server configuration into its JSON form.
[[nodiscard]] auto serverConfigToJson(const ServerConfig& config) -> nlohmann::json;

/// @brief Parses a server configuration from JSON.
///
/// Accepts both @c command and @c deploymentMethod as the method key.
/// @param name The server name, used when the object carries no @c name field.
/// @param obj The JSON object.
[[nodiscard]] auto serverConfigFromJson(std::string_view name, const nlohmann::json& obj) -> Result<ServerConfig>;

[[nodiscard]] auto toolDefinitionToJson(const ToolDefinition& tool) -> nlohmann::json;
[[nodiscard]] auto resourceToJson(const Resource& resource) -> nlohmann::json;
[[nodiscard]] auto mcpServerToJson(const McpServer& server) -> nlohmann::json;

} // namespace mcphub
