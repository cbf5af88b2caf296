// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerManager.hpp>
#include <mcphub/Config.hpp>
#include <store/McpStore.hpp>

#include <memory>

namespace mcphub
{

/// @brief Wires the store and the server manager together from an AppConfig.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the database and seeds servers from the configuration file.
    ///
    /// Servers are only seeded when no stored server has the same name. No server
    /// is started; use ServerManager::loadFromStore() or restartServer() for that.
    /// @return Success or the first error.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto config() const -> const AppConfig&;
    [[nodiscard]] auto store() -> store::McpStore&;
    [[nodiscard]] auto manager() -> ServerManager&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Inserts every configured server whose name is not yet stored.
/// @return The number of servers inserted.
[[nodiscard]] auto seedServers(store::McpStore& store, const std::vector<ServerConfig>& servers)
    -> Result<std::size_t>;

} // namespace mcphub
