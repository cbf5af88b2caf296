// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/CircuitBreaker.hpp>
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/McpTypes.hpp>
#include <mcp/ServerManager.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief MCP section of the configuration file.
struct McpSettings
{
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(30);
    std::chrono::milliseconds testConnectionTimeout = std::chrono::seconds(30);
    std::chrono::seconds healthCheckInterval = std::chrono::minutes(5);

    /// @brief Executable per stdio deployment method; missing entries use the method name.
    std::map<DeploymentMethod, std::string> launchers = ClientOptions {}.launchers;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    log::Level logLevel = log::Level::Info;

    /// @brief SQLite database file; empty selects defaultDatabasePath().
    std::string databasePath;

    McpSettings mcp;
    CircuitBreakerConfig circuitBreaker;

    /// @brief Servers seeded into the store when no stored server has the same name.
    std::vector<ServerConfig> mcpServers;
};

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file.
/// @return The configuration, or a ConfigurationError naming the offending field.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration from its JSON document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Saves the configuration, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/mcphub, or ~/.config/mcphub.
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief $XDG_DATA_HOME/mcphub, or ~/.local/share/mcphub.
[[nodiscard]] auto defaultDataDir() -> std::string;

[[nodiscard]] auto defaultDatabasePath() -> std::string;

/// @brief Returns the database path to use: the configured one or the default.
[[nodiscard]] auto resolveDatabasePath(const AppConfig& config) -> std::string;

/// @brief Derives the manager tunables from the application configuration.
[[nodiscard]] auto makeManagerConfig(const AppConfig& config) -> ManagerConfig;

} // namespace mcphub
