// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpTypes.hpp>
#include <store/Database.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub::store
{

/// @brief A persisted server configuration with its row timestamps.
struct StoredServer
{
    ServerConfig config;
    std::string createdAt;
    std::string updatedAt;
};

/// @brief Persistence of MCP server configurations and the tool call log.
///
/// Backed by the @c mcp_server and @c mcp_call_log tables. All operations are
/// safe to call from several threads.
class McpStore
{
  public:
    explicit McpStore(std::unique_ptr<Database> database);

    /// @brief Opens the database at @p path and creates the schema if needed.
    [[nodiscard]] static auto open(const std::string& path) -> Result<std::unique_ptr<McpStore>>;

    /// @brief Creates tables and indices. Safe to run on an existing database.
    [[nodiscard]] auto migrate() -> VoidResult;

    [[nodiscard]] auto listServers() -> Result<std::vector<StoredServer>>;
    [[nodiscard]] auto getServerByName(std::string_view name) -> Result<std::optional<StoredServer>>;
    [[nodiscard]] auto getServerById(std::string_view id) -> Result<std::optional<StoredServer>>;

    /// @brief Inserts a new configuration.
    /// @return The stored row, or ServerAlreadyExists if the id or name is taken.
    [[nodiscard]] auto insertServer(const ServerConfig& config) -> Result<StoredServer>;

    /// @brief Replaces the configuration with the same id.
    /// @return The stored row, ServerNotFound for an unknown id, or ServerAlreadyExists
    ///         if the new name belongs to another server.
    [[nodiscard]] auto updateServer(const ServerConfig& config) -> Result<StoredServer>;

    /// @brief Deletes a configuration by id.
    /// @return The deleted configuration, or ServerNotFound.
    [[nodiscard]] auto deleteServer(std::string_view id) -> Result<ServerConfig>;

    /// @brief Appends one entry to the call log.
    [[nodiscard]] auto appendCallLog(const CallLogEntry& entry) -> VoidResult;

    /// @brief Returns the most recent call log entries, newest first.
    /// @param serverName Restricts the result to one server when set.
    [[nodiscard]] auto listCallLogs(std::optional<std::string_view> serverName, std::size_t limit)
        -> Result<std::vector<CallLogEntry>>;

    /// @brief Computes nearest-rank latency percentiles over all logged calls of a server.
    [[nodiscard]] auto latencyMetrics(std::string_view serverName) -> Result<LatencyMetrics>;

    [[nodiscard]] auto database() -> Database& { return *_database; }

  private:
    [[nodiscard]] auto queryServers(std::string_view sql, std::optional<std::string_view> key)
        -> Result<std::vector<StoredServer>>;

    std::unique_ptr<Database> _database;
};

} // namespace mcphub::store
