// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpTypes.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/ServerHandle.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Connection options shared by all clients of a manager.
struct ClientOptions
{
    /// @brief Deadline for each JSON-RPC reply.
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(30);

    /// @brief Timeout of the HTTP client (connect, read and write).
    std::chrono::milliseconds httpTimeout = std::chrono::seconds(30);

    /// @brief Executable used for each stdio deployment method.
    std::map<DeploymentMethod, std::string> launchers = {
        { DeploymentMethod::Docker, "docker" },
        { DeploymentMethod::Npx, "npx" },
        { DeploymentMethod::Uvx, "uvx" },
    };
};

/// @brief Builds the child process command line for a stdio deployment.
///
/// The launcher of the deployment method is followed by the configured args verbatim.
/// @return The spawn configuration, or a ConfigurationError for empty args (field @c args)
///         or an Http deployment (field @c command).
[[nodiscard]] auto buildStdioCommand(const ServerConfig& config, const ClientOptions& options)
    -> Result<StdioTransportConfig>;

/// @brief Transport-agnostic client for one MCP server.
///
/// Chooses a StdioTransport or HttpTransport from the deployment method, owns the
/// resulting ServerHandle and exposes a uniform tool-call surface.
class McpClient
{
  public:
    /// @brief Constructs an unconnected client.
    explicit McpClient(ServerConfig config, ClientOptions options = {});

    /// @brief Constructs a client over a caller-provided transport; connect() then only runs the handshake.
    McpClient(ServerConfig config, std::unique_ptr<Transport> transport, ClientOptions options = {});

    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Spawns or reaches the server and performs the MCP handshake.
    /// @return Success, or the first error (ConfigurationError, ProcessSpawnFailed,
    ///         ConnectionFailed, InitializationFailed, Timeout).
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Disconnects from the server. Calling it again is a no-op.
    void disconnect();

    [[nodiscard]] auto isConnected() const -> bool;
    [[nodiscard]] auto status() const -> ServerStatus;
    [[nodiscard]] auto config() const -> ServerConfig;

    /// @brief Replaces the stored configuration; a live connection keeps its transport.
    void updateConfig(ServerConfig config);

    [[nodiscard]] auto tools() const -> std::vector<ToolDefinition>;
    [[nodiscard]] auto resources() const -> std::vector<Resource>;
    [[nodiscard]] auto serverInfo() const -> std::optional<protocol::ServerInfo>;

    /// @brief Calls a tool and returns a structured result with timing.
    ///
    /// A server-side tool error (@c isError) yields @c success=false with the content
    /// preserved. Transport and protocol failures are returned as errors.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>;

    /// @brief Calls a tool and returns the raw MCP content.
    [[nodiscard]] auto callToolRaw(std::string_view name, const nlohmann::json& arguments)
        -> Result<protocol::ToolCallResponse>;

    /// @brief Calls a tool and returns its text content joined by newlines.
    [[nodiscard]] auto callToolText(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>;

    /// @brief Re-fetches the tool list from the server.
    [[nodiscard]] auto refreshTools() -> Result<std::vector<ToolDefinition>>;

    /// @brief Returns false if the server is gone (or was never connected).
    [[nodiscard]] auto isProcessAlive() -> bool;

    /// @brief Connects, measures latency, collects tools and resources, then disconnects.
    /// @return A TestResult describing the outcome; never an error.
    [[nodiscard]] static auto testConnection(const ServerConfig& config, const ClientOptions& options = {})
        -> TestResult;

  private:
    [[nodiscard]] auto openHandle(const ServerConfig& config) -> Result<std::shared_ptr<ServerHandle>>;
    [[nodiscard]] auto handle() const -> std::shared_ptr<ServerHandle>;
    [[nodiscard]] auto notConnectedError() const -> std::unexpected<Error>;

    ClientOptions _options;
    std::unique_ptr<Transport> _injectedTransport;

    mutable std::mutex _mutex;
    ServerConfig _config;
    std::shared_ptr<ServerHandle> _handle;
    bool _connecting = false;
};

} // namespace mcphub
