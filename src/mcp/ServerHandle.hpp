// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpTypes.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief One MCP session over one transport.
///
/// Performs the MCP lifecycle (initialize, list tools and resources, call tools),
/// allocates request ids and caches what the server advertised. A request's
/// write-then-read runs under a mutex, so concurrent calls on the same handle are
/// serialized while status and cache reads never wait on I/O.
class ServerHandle
{
  public:
    /// @brief Constructs a handle over a connected transport.
    /// @param serverName The server name used in log and error messages.
    /// @param transport The transport to use for communication.
    /// @param requestTimeout Deadline for each request's reply.
    ServerHandle(std::string serverName,
                 std::unique_ptr<Transport> transport,
                 std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));
    ~ServerHandle();

    ServerHandle(const ServerHandle&) = delete;
    ServerHandle& operator=(const ServerHandle&) = delete;

    /// @brief Performs the MCP handshake and fills the tool and resource caches.
    ///
    /// Sends @c initialize, then @c notifications/initialized, then @c tools/list and
    /// @c resources/list when advertised. A failing list call is logged and leaves its
    /// cache empty. On success the status becomes Running.
    /// @return Success, InitializationFailed, or the transport error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Calls a tool on the server. Requires status Running.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return The raw content and @c isError flag, or an error.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<protocol::ToolCallResponse>;

    /// @brief Re-issues @c tools/list and replaces the tool cache.
    [[nodiscard]] auto refreshTools() -> Result<std::vector<ToolDefinition>>;

    /// @brief Sends a request and waits for its reply.
    ///
    /// Replies carrying another id (late answers to timed-out requests) are
    /// discarded. Server-initiated requests are answered (@c ping) or rejected
    /// with MethodNotFound.
    /// @return The @c result member (JSON null when absent) or an error.
    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;

    /// @brief Sends a notification (no reply expected).
    [[nodiscard]] auto sendNotification(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Closes the transport, clears the caches and sets status Stopped. Idempotent.
    void disconnect();

    /// @brief Non-blocking liveness check; a dead server moves to status Disconnected.
    [[nodiscard]] auto isProcessAlive() -> bool;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto status() const -> ServerStatus;
    [[nodiscard]] auto tools() const -> std::vector<ToolDefinition>;
    [[nodiscard]] auto resources() const -> std::vector<Resource>;
    [[nodiscard]] auto serverInfo() const -> std::optional<protocol::ServerInfo>;
    [[nodiscard]] auto capabilities() const -> protocol::ServerCapabilities;

    /// @brief Returns the id the next request will carry.
    [[nodiscard]] auto nextRequestId() const -> int64_t { return _nextId.load(); }

  private:
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;
    [[nodiscard]] auto listResources() -> Result<std::vector<Resource>>;
    void answerServerRequest(const nlohmann::json& message);
    void setStatus(ServerStatus status);
    [[nodiscard]] auto requireRunning() const -> VoidResult;

    std::string _name;
    std::unique_ptr<Transport> _transport;
    std::chrono::milliseconds _requestTimeout;
    std::atomic<int64_t> _nextId = 1;

    /// Guards transport I/O (write-then-read).
    std::mutex _ioMutex;

    /// Guards status, server info and the caches.
    mutable std::mutex _stateMutex;
    ServerStatus _status = ServerStatus::Starting;
    std::optional<protocol::ServerInfo> _serverInfo;
    protocol::ServerCapabilities _capabilities;
    std::vector<ToolDefinition> _tools;
    std::vector<Resource> _resources;
};

} // namespace mcphub
