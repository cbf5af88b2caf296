// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <mcp/ConfigValidation.hpp>

#include <filesystem>
#include <format>

namespace mcphub
{

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<store::McpStore> store;
    std::unique_ptr<ServerManager> manager;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    ~Impl()
    {
        // The manager must release its clients before the store it logs to goes away.
        if (manager)
            manager->shutdown();
        manager.reset();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
    log::setLevel(_impl->config.logLevel);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const path = resolveDatabasePath(_impl->config);
    if (path != ":memory:")
    {
        auto const dir = std::filesystem::path(path).parent_path();
        auto ec = std::error_code {};
        if (!dir.empty())
            std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create data directory '{}': {}", dir.string(), ec.message()));
    }

    auto opened = store::McpStore::open(path);
    if (!opened)
        return std::unexpected(opened.error());
    _impl->store = std::move(*opened);

    auto seeded = seedServers(*_impl->store, _impl->config.mcpServers);
    if (!seeded)
        return std::unexpected(seeded.error());
    if (*seeded > 0)
        log::info("Seeded {} MCP servers from the configuration file", *seeded);

    _impl->manager = std::make_unique<ServerManager>(*_impl->store, makeManagerConfig(_impl->config));
    return {};
}

auto App::config() const -> const AppConfig&
{
    return _impl->config;
}

auto App::store() -> store::McpStore&
{
    return *_impl->store;
}

auto App::manager() -> ServerManager&
{
    return *_impl->manager;
}

auto seedServers(store::McpStore& store, const std::vector<ServerConfig>& servers) -> Result<std::size_t>
{
    auto inserted = std::size_t { 0 };
    for (const auto& server: servers)
    {
        auto existing = store.getServerByName(server.name);
        if (!existing)
            return std::unexpected(existing.error());
        if (*existing)
            continue;

        auto validated = validation::validateServerConfig(server);
        if (!validated)
        {
            log::warning("Skipping configured MCP server '{}': {}", server.name, validated.error());
            continue;
        }

        auto stored = store.insertServer(*validated);
        if (!stored)
        {
            log::warning("Failed to seed MCP server '{}': {}", server.name, stored.error());
            continue;
        }
        ++inserted;
    }
    return inserted;
}

} // namespace mcphub
