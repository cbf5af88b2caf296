// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/CircuitBreaker.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/McpTypes.hpp>
#include <store/McpStore.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcphub
{

/// @brief Creates the (unconnected) client for a server configuration.
using ClientFactory = std::function<std::unique_ptr<McpClient>(const ServerConfig&, const ClientOptions&)>;

/// @brief Tunables of a ServerManager.
struct ManagerConfig
{
    ClientOptions client {};
    CircuitBreakerConfig circuitBreaker {};
    std::chrono::seconds healthCheckInterval = std::chrono::minutes(5);

    /// @brief Overrides how clients are constructed; defaults to a plain McpClient.
    ClientFactory clientFactory {};
};

/// @brief Owns the live MCP clients, routes tool calls and persists configurations.
///
/// Clients are keyed by server name. Each server has a circuit breaker that
/// short-circuits calls after repeated transport failures. Every dispatched tool
/// call is appended to the call log of the store.
class ServerManager
{
  public:
    explicit ServerManager(store::McpStore& store, ManagerConfig config = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Spawns every enabled persisted server. Failures are logged and skipped.
    /// @return The number of servers that came up.
    auto loadFromStore() -> std::size_t;

    /// @brief Validates, persists and spawns a new server.
    ///
    /// The name is reserved and the configuration persisted before connecting. If
    /// the connection fails the configuration stays persisted and getServer()
    /// reports status Error until the server is restarted. A disabled configuration
    /// is persisted only.
    /// @return The live server record, ConfigurationError, ServerAlreadyExists or the connect error.
    [[nodiscard]] auto spawnServer(const ServerConfig& config) -> Result<McpServer>;

    /// @brief Connects a client for @p config and registers it under its name.
    [[nodiscard]] auto spawnServerInternal(const ServerConfig& config) -> Result<McpServer>;

    /// @brief Disconnects a live server. Its configuration remains persisted.
    [[nodiscard]] auto stopServer(std::string_view name) -> VoidResult;

    /// @brief Stops (if running) and spawns a server again from its live or persisted configuration.
    /// A successful restart closes the server's circuit.
    [[nodiscard]] auto restartServer(std::string_view name) -> Result<McpServer>;

    [[nodiscard]] auto getServer(std::string_view name) -> Result<McpServer>;

    /// @brief Returns live servers plus persisted servers that are not running.
    [[nodiscard]] auto listServers() -> Result<std::vector<McpServer>>;

    /// @brief Calls a tool on a live server.
    ///
    /// Rejected with CircuitOpen while the server's breaker is open. A dispatched
    /// call is always logged; Timeout, ConnectionFailed and IoError count as breaker
    /// failures.
    [[nodiscard]] auto callTool(std::string_view serverName, std::string_view toolName, const nlohmann::json& arguments)
        -> Result<ToolCallResult>;

    /// @brief Executes an LLM function call named @c mcp__<server>__<tool>.
    [[nodiscard]] auto executeFunctionCall(const FunctionCall& call) -> FunctionCallResult;

    /// @brief Returns the tools of all live servers, renamed @c mcp__<server>__<tool>.
    [[nodiscard]] auto agentToolDefinitions() const -> std::vector<ToolDefinition>;

    /// @brief Returns the cached tools of one server (empty if it is not live).
    [[nodiscard]] auto listServerTools(std::string_view name) const -> std::vector<ToolDefinition>;

    [[nodiscard]] auto listAllTools() const -> std::map<std::string, std::vector<ToolDefinition>>;

    /// @brief Probes a configuration without persisting or registering it.
    [[nodiscard]] auto testServer(const ServerConfig& config) const -> TestResult;

    /// @brief Updates a persisted configuration (matched by id) and the live client's copy.
    [[nodiscard]] auto updateServerConfig(const ServerConfig& config) -> Result<McpServer>;

    /// @brief Deletes a persisted configuration, stopping the server bearing its name.
    [[nodiscard]] auto deleteServerConfig(std::string_view id) -> VoidResult;

    [[nodiscard]] auto circuitState(std::string_view name) const -> std::optional<CircuitBreakerStats>;

    /// @return false if the server has no breaker.
    auto resetCircuitBreaker(std::string_view name) -> bool;

    /// @brief Starts the background health checker. Restarts it if already running.
    void startHealthChecks(std::optional<std::chrono::seconds> interval = std::nullopt);
    void stopHealthChecks();

    /// @brief Probes every live server once with @c tools/list and feeds the breakers.
    void checkAllServersHealth();

    [[nodiscard]] auto latencyMetrics(std::string_view name) -> Result<LatencyMetrics>;
    [[nodiscard]] auto recentCalls(std::optional<std::string_view> name, std::size_t limit)
        -> Result<std::vector<CallLogEntry>>;

    [[nodiscard]] auto serverNames() const -> std::vector<std::string>;
    [[nodiscard]] auto connectedCount() const -> std::size_t;

    /// @brief Stops health checks and disconnects every server. Safe to call repeatedly.
    void shutdown();

  private:
    [[nodiscard]] auto findClient(std::string_view name) const -> std::shared_ptr<McpClient>;
    [[nodiscard]] auto findBreaker(std::string_view name) const -> std::shared_ptr<CircuitBreaker>;
    [[nodiscard]] auto liveRecord(const McpClient& client) -> McpServer;
    [[nodiscard]] auto storedRecord(const store::StoredServer& stored) const -> McpServer;
    void checkServerHealth(const std::string& name);
    void logCall(CallLogEntry entry);

    store::McpStore& _store;
    ManagerConfig _config;

    mutable std::shared_mutex _mutex;
    std::map<std::string, std::shared_ptr<McpClient>, std::less<>> _clients;
    std::map<std::string, std::shared_ptr<CircuitBreaker>, std::less<>> _breakers;
    std::set<std::string, std::less<>> _reserved;
    std::map<std::string, std::string, std::less<>> _failures;

    std::mutex _healthMutex;
    std::condition_variable_any _healthCv;
    std::jthread _healthThread;
};

} // namespace mcphub
