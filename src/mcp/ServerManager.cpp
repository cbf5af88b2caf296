// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <mcp/ConfigValidation.hpp>
#include <mcp/ToolName.hpp>

#include <format>

namespace mcphub
{

namespace
{

    auto elapsedMs(std::chrono::steady_clock::time_point start) -> uint64_t
    {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
    }

    auto notFound(std::string_view name) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ServerNotFound, std::format("MCP server '{}' not found", name));
    }

    auto alreadyExists(std::string_view name) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ServerAlreadyExists, std::format("MCP server '{}' already exists", name));
    }

} // namespace

ServerManager::ServerManager(store::McpStore& store, ManagerConfig config): _store(store), _config(std::move(config))
{
    if (!_config.clientFactory)
    {
        _config.clientFactory = [](const ServerConfig& serverConfig, const ClientOptions& options) {
            return std::make_unique<McpClient>(serverConfig, options);
        };
    }
}

ServerManager::~ServerManager()
{
    shutdown();
}

auto ServerManager::loadFromStore() -> std::size_t
{
    auto stored = _store.listServers();
    if (!stored)
    {
        log::error("Failed to load MCP server configurations: {}", stored.error());
        return 0;
    }

    auto started = std::size_t { 0 };
    for (const auto& server: *stored)
    {
        if (!server.config.enabled)
        {
            log::debug("Skipping disabled MCP server '{}'", server.config.name);
            continue;
        }

        auto spawned = spawnServerInternal(server.config);
        if (!spawned)
        {
            log::warning("Failed to start MCP server '{}': {}", server.config.name, spawned.error());
            continue;
        }
        ++started;
    }

    log::info("Started {} of {} configured MCP servers", started, stored->size());
    return started;
}

auto ServerManager::spawnServer(const ServerConfig& config) -> Result<McpServer>
{
    auto validated = validation::validateServerConfig(config);
    if (!validated)
        return std::unexpected(validated.error());

    auto const& name = validated->name;
    auto stored = store::StoredServer {};
    {
        auto lock = std::unique_lock(_mutex);
        if (_clients.contains(name) || _reserved.contains(name))
            return alreadyExists(name);

        auto inserted = _store.insertServer(*validated);
        if (!inserted)
            return std::unexpected(inserted.error());
        stored = std::move(*inserted);

        if (validated->enabled)
            _reserved.insert(name);
    }

    log::info("Saved MCP server configuration '{}' ({})", name, stored.config.id);

    if (!validated->enabled)
        return storedRecord(stored);

    auto server = spawnServerInternal(*validated);

    auto lock = std::unique_lock(_mutex);
    _reserved.erase(name);
    if (!server)
        return std::unexpected(server.error());
    return server;
}

auto ServerManager::spawnServerInternal(const ServerConfig& config) -> Result<McpServer>
{
    auto client = std::shared_ptr<McpClient>(_config.clientFactory(config, _config.client));
    if (auto connected = client->connect(); !connected)
    {
        auto lock = std::unique_lock(_mutex);
        _failures.insert_or_assign(config.name, connected.error().message);
        return std::unexpected(connected.error());
    }

    {
        auto lock = std::unique_lock(_mutex);
        if (_clients.contains(config.name))
        {
            lock.unlock();
            client->disconnect();
            return alreadyExists(config.name);
        }
        _clients.emplace(config.name, client);
        _failures.erase(config.name);
        if (!_breakers.contains(config.name))
            _breakers.emplace(config.name, std::make_shared<CircuitBreaker>(config.name, _config.circuitBreaker));
    }

    log::info("MCP server '{}' running with {} tools and {} resources",
              config.name,
              client->tools().size(),
              client->resources().size());
    return liveRecord(*client);
}

auto ServerManager::stopServer(std::string_view name) -> VoidResult
{
    auto client = std::shared_ptr<McpClient> {};
    {
        auto lock = std::unique_lock(_mutex);
        auto const it = _clients.find(name);
        if (it == _clients.end())
            return notFound(name);
        client = std::move(it->second);
        _clients.erase(it);
        _failures.erase(std::string(name));
    }

    client->disconnect();
    log::info("Stopped MCP server '{}'", name);
    return {};
}

auto ServerManager::restartServer(std::string_view name) -> Result<McpServer>
{
    auto config = std::optional<ServerConfig> {};
    if (auto client = findClient(name))
        config = client->config();
    else
    {
        auto stored = _store.getServerByName(name);
        if (!stored)
            return std::unexpected(stored.error());
        if (*stored)
            config = (*stored)->config;
    }

    if (!config)
        return notFound(name);

    log::info("Restarting MCP server '{}'", name);
    if (findClient(name))
    {
        if (auto stopped = stopServer(name); !stopped)
            return std::unexpected(stopped.error());
    }

    auto server = spawnServerInternal(*config);
    if (!server)
        return server;

    if (auto breaker = findBreaker(name))
        breaker->reset();
    return server;
}

auto ServerManager::getServer(std::string_view name) -> Result<McpServer>
{
    if (auto client = findClient(name))
        return liveRecord(*client);

    auto stored = _store.getServerByName(name);
    if (!stored)
        return std::unexpected(stored.error());
    if (!*stored)
        return notFound(name);
    return storedRecord(**stored);
}

auto ServerManager::listServers() -> Result<std::vector<McpServer>>
{
    auto stored = _store.listServers();
    if (!stored)
        return std::unexpected(stored.error());

    auto live = std::map<std::string, std::shared_ptr<McpClient>, std::less<>> {};
    {
        auto lock = std::shared_lock(_mutex);
        live = _clients;
    }

    auto servers = std::vector<McpServer> {};
    for (const auto& server: *stored)
    {
        auto const it = live.find(server.config.name);
        if (it == live.end())
        {
            servers.push_back(storedRecord(server));
            continue;
        }

        auto record = McpServer {
            .config = it->second->config(),
            .status = it->second->status(),
            .tools = it->second->tools(),
            .resources = it->second->resources(),
            .createdAt = server.createdAt,
            .updatedAt = server.updatedAt,
        };
        servers.push_back(std::move(record));
        live.erase(it);
    }

    // Servers registered without a persisted configuration.
    for (const auto& [name, client]: live)
        servers.push_back(liveRecord(*client));

    return servers;
}

auto ServerManager::callTool(std::string_view serverName, std::string_view toolName, const nlohmann::json& arguments)
    -> Result<ToolCallResult>
{
    log::debug("Calling MCP tool {}/{}", serverName, toolName);

    auto const client = findClient(serverName);
    if (!client)
        return notFound(serverName);

    auto const breaker = findBreaker(serverName);
    if (breaker && !breaker->isAvailable())
    {
        auto const remaining = breaker->stats().cooldownRemaining.value_or(std::chrono::milliseconds(0));
        log::warning("Rejected call to {}/{}: circuit breaker is open", serverName, toolName);
        return makeError(ErrorCode::CircuitOpen,
                         std::format("Circuit breaker open for MCP server '{}' (retry in {}s)",
                                     serverName,
                                     std::chrono::ceil<std::chrono::seconds>(remaining).count()));
    }

    auto validTool = validation::validateToolName(toolName);
    if (!validTool)
        return std::unexpected(validTool.error());

    auto const start = std::chrono::steady_clock::now();
    auto result = client->callTool(*validTool, arguments);
    auto const durationMs = elapsedMs(start);

    logCall(CallLogEntry {
        .id = generateUuid(),
        .workflowId = std::nullopt,
        .serverName = std::string(serverName),
        .toolName = *validTool,
        .params = arguments,
        .result = result ? result->content : nlohmann::json(nullptr),
        .success = result && result->success,
        .durationMs = durationMs,
        .timestamp = currentTimestamp(),
    });

    if (breaker)
    {
        if (result)
            breaker->recordSuccess();
        else if (isTransportFailure(result.error()))
            breaker->recordFailure();
    }

    if (!result)
    {
        log::warning("MCP tool {}/{} failed after {}ms: {}", serverName, toolName, durationMs, result.error());
        return std::unexpected(result.error());
    }

    result->durationMs = durationMs;
    return result;
}

auto ServerManager::executeFunctionCall(const FunctionCall& call) -> FunctionCallResult
{
    auto const target = parseMcpToolName(call.name);
    if (!target)
        return FunctionCallResult::failed(call.id, call.name, std::format("Unknown tool: {}", call.name));

    auto result = callTool(target->server, target->tool, call.arguments);
    if (!result)
        return FunctionCallResult::failed(call.id, call.name, result.error().message);

    if (!result->success)
    {
        auto failed = FunctionCallResult::failed(call.id, call.name, result->error.value_or("Tool returned an error"));
        failed.result = std::move(result->content);
        return failed;
    }

    return FunctionCallResult::ok(call.id, call.name, std::move(result->content));
}

auto ServerManager::agentToolDefinitions() const -> std::vector<ToolDefinition>
{
    auto definitions = std::vector<ToolDefinition> {};
    for (auto& [server, tools]: listAllTools())
    {
        for (auto& tool: tools)
        {
            tool.name = makeMcpToolName(server, tool.name);
            definitions.push_back(std::move(tool));
        }
    }
    return definitions;
}

auto ServerManager::listServerTools(std::string_view name) const -> std::vector<ToolDefinition>
{
    auto const client = findClient(name);
    return client ? client->tools() : std::vector<ToolDefinition> {};
}

auto ServerManager::listAllTools() const -> std::map<std::string, std::vector<ToolDefinition>>
{
    auto lock = std::shared_lock(_mutex);
    auto tools = std::map<std::string, std::vector<ToolDefinition>> {};
    for (const auto& [name, client]: _clients)
        tools.emplace(name, client->tools());
    return tools;
}

auto ServerManager::testServer(const ServerConfig& config) const -> TestResult
{
    log::info("Testing MCP server connection '{}'", config.name);
    return McpClient::testConnection(config, _config.client);
}

auto ServerManager::updateServerConfig(const ServerConfig& config) -> Result<McpServer>
{
    auto validated = validation::validateServerConfig(config);
    if (!validated)
        return std::unexpected(validated.error());

    auto previous = _store.getServerById(validated->id);
    if (!previous)
        return std::unexpected(previous.error());
    if (!*previous)
        return makeError(ErrorCode::ServerNotFound, std::format("MCP server id '{}' not found", validated->id));

    auto const oldName = (*previous)->config.name;
    auto const& newName = validated->name;

    auto lock = std::unique_lock(_mutex);
    if (oldName != newName && (_clients.contains(newName) || _reserved.contains(newName)))
        return alreadyExists(newName);

    auto updated = _store.updateServer(*validated);
    if (!updated)
        return std::unexpected(updated.error());

    if (auto const it = _clients.find(oldName); it != _clients.end())
    {
        it->second->updateConfig(*validated);
        if (oldName != newName)
        {
            auto client = std::move(it->second);
            _clients.erase(it);
            _clients.emplace(newName, std::move(client));
            if (auto node = _breakers.extract(oldName))
            {
                node.key() = newName;
                _breakers.insert(std::move(node));
            }
        }
    }
    lock.unlock();

    log::info("Updated MCP server configuration '{}'", newName);
    return getServer(newName);
}

auto ServerManager::deleteServerConfig(std::string_view id) -> VoidResult
{
    auto stored = _store.getServerById(id);
    if (!stored)
        return std::unexpected(stored.error());
    if (!*stored)
        return makeError(ErrorCode::ServerNotFound, std::format("MCP server id '{}' not found", id));

    auto const name = (*stored)->config.name;
    if (findClient(name))
    {
        if (auto stopped = stopServer(name); !stopped)
            log::warning("Failed to stop MCP server '{}' before deletion: {}", name, stopped.error());
    }

    auto deleted = _store.deleteServer(id);
    if (!deleted)
        return std::unexpected(deleted.error());

    {
        auto lock = std::unique_lock(_mutex);
        _breakers.erase(name);
        _failures.erase(name);
    }

    log::info("Deleted MCP server configuration '{}' ({})", name, id);
    return {};
}

auto ServerManager::circuitState(std::string_view name) const -> std::optional<CircuitBreakerStats>
{
    auto const breaker = findBreaker(name);
    if (!breaker)
        return std::nullopt;
    return breaker->stats();
}

auto ServerManager::resetCircuitBreaker(std::string_view name) -> bool
{
    auto const breaker = findBreaker(name);
    if (!breaker)
        return false;
    breaker->reset();
    return true;
}

void ServerManager::startHealthChecks(std::optional<std::chrono::seconds> interval)
{
    stopHealthChecks();

    auto const period = interval.value_or(_config.healthCheckInterval);
    log::info("Starting MCP health checks every {}s", period.count());

    _healthThread = std::jthread([this, period](const std::stop_token& stopToken) {
        while (!stopToken.stop_requested())
        {
            {
                auto lock = std::unique_lock(_healthMutex);
                if (_healthCv.wait_for(lock, stopToken, period, [] { return false; }) || stopToken.stop_requested())
                    break;
            }
            checkAllServersHealth();
        }
        log::debug("MCP health check thread stopped");
    });
}

void ServerManager::stopHealthChecks()
{
    if (!_healthThread.joinable())
        return;

    _healthThread.request_stop();
    _healthCv.notify_all();
    _healthThread.join();
    _healthThread = std::jthread {};
}

void ServerManager::checkAllServersHealth()
{
    auto const names = serverNames();
    if (names.empty())
    {
        log::debug("No MCP servers to health check");
        return;
    }

    log::debug("Running health checks for {} MCP servers", names.size());
    for (const auto& name: names)
        checkServerHealth(name);
}

void ServerManager::checkServerHealth(const std::string& name)
{
    auto const client = findClient(name);
    if (!client)
        return;

    auto const breaker = findBreaker(name);
    auto tools = client->refreshTools();
    if (tools)
    {
        log::debug("Health check of '{}' passed ({} tools)", name, tools->size());
        if (breaker)
            breaker->recordSuccess();
        return;
    }

    log::warning("Health check of '{}' failed: {}", name, tools.error());
    if (breaker)
        breaker->recordFailure();
}

auto ServerManager::latencyMetrics(std::string_view name) -> Result<LatencyMetrics>
{
    return _store.latencyMetrics(name);
}

auto ServerManager::recentCalls(std::optional<std::string_view> name, std::size_t limit)
    -> Result<std::vector<CallLogEntry>>
{
    return _store.listCallLogs(name, limit);
}

auto ServerManager::serverNames() const -> std::vector<std::string>
{
    auto lock = std::shared_lock(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_clients.size());
    for (const auto& [name, client]: _clients)
        names.push_back(name);
    return names;
}

auto ServerManager::connectedCount() const -> std::size_t
{
    auto lock = std::shared_lock(_mutex);
    return _clients.size();
}

void ServerManager::shutdown()
{
    stopHealthChecks();

    auto clients = std::map<std::string, std::shared_ptr<McpClient>, std::less<>> {};
    {
        auto lock = std::unique_lock(_mutex);
        clients.swap(_clients);
    }

    if (clients.empty())
        return;

    log::info("Shutting down {} MCP servers", clients.size());
    for (auto& [name, client]: clients)
    {
        client->disconnect();
        log::debug("Disconnected MCP server '{}'", name);
    }
    log::info("MCP manager shutdown complete");
}

auto ServerManager::findClient(std::string_view name) const -> std::shared_ptr<McpClient>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _clients.find(name);
    return it != _clients.end() ? it->second : nullptr;
}

auto ServerManager::findBreaker(std::string_view name) const -> std::shared_ptr<CircuitBreaker>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _breakers.find(name);
    return it != _breakers.end() ? it->second : nullptr;
}

auto ServerManager::liveRecord(const McpClient& client) -> McpServer
{
    auto record = McpServer {
        .config = client.config(),
        .status = client.status(),
        .tools = client.tools(),
        .resources = client.resources(),
        .createdAt = {},
        .updatedAt = {},
    };

    if (auto stored = _store.getServerByName(record.config.name); stored && *stored)
    {
        record.createdAt = (*stored)->createdAt;
        record.updatedAt = (*stored)->updatedAt;
    }
    return record;
}

auto ServerManager::storedRecord(const store::StoredServer& stored) const -> McpServer
{
    auto failed = false;
    {
        auto lock = std::shared_lock(_mutex);
        failed = _failures.contains(stored.config.name);
    }

    return McpServer {
        .config = stored.config,
        .status = failed ? ServerStatus::Error : ServerStatus::Stopped,
        .tools = {},
        .resources = {},
        .createdAt = stored.createdAt,
        .updatedAt = stored.updatedAt,
    };
}

void ServerManager::logCall(CallLogEntry entry)
{
    if (auto appended = _store.appendCallLog(entry); !appended)
        log::warning("Failed to log MCP call {}/{}: {}", entry.serverName, entry.toolName, appended.error());
}

} // namespace mcphub
