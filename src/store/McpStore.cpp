// SPDX-License-Identifier: Apache-2.0
#include "McpStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>

#include <algorithm>
#include <format>

namespace mcphub::store
{

namespace
{

    constexpr auto SchemaSql = std::string_view {
        "CREATE TABLE IF NOT EXISTS mcp_server ("
        "  id TEXT PRIMARY KEY,"
        "  name TEXT UNIQUE NOT NULL,"
        "  enabled INTEGER NOT NULL DEFAULT 1,"
        "  command TEXT NOT NULL CHECK(command IN ('docker','npx','uvx','http')),"
        "  args TEXT NOT NULL DEFAULT '[]',"
        "  env TEXT NOT NULL DEFAULT '{}',"
        "  description TEXT NULL,"
        "  created_at TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS mcp_call_log ("
        "  id TEXT PRIMARY KEY,"
        "  workflow_id TEXT NULL,"
        "  server_name TEXT NOT NULL,"
        "  tool_name TEXT NOT NULL,"
        "  params TEXT NOT NULL,"
        "  result TEXT NOT NULL,"
        "  success INTEGER NOT NULL,"
        "  duration_ms INTEGER NOT NULL,"
        "  timestamp TEXT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_mcp_call_log_server ON mcp_call_log(server_name);"
        "CREATE INDEX IF NOT EXISTS idx_mcp_call_log_workflow ON mcp_call_log(workflow_id);"
    };

    constexpr auto ServerColumns =
        std::string_view { "id, name, enabled, command, args, env, description, created_at, updated_at" };

    auto readServer(const Statement& stmt) -> Result<StoredServer>
    {
        auto const name = stmt.columnText(1);
        auto const command = stmt.columnText(3);
        auto method = deploymentMethodFromString(command);
        if (!method)
            return makeError(ErrorCode::DatabaseError,
                             std::format("Stored server '{}' has unknown command '{}'", name, command));

        auto args = json::parse(stmt.columnText(4));
        if (!args)
            return std::unexpected(args.error());
        auto env = json::parse(stmt.columnText(5));
        if (!env)
            return std::unexpected(env.error());

        auto config = ServerConfig {
            .id = stmt.columnText(0),
            .name = name,
            .enabled = stmt.columnInt(2) != 0,
            .deploymentMethod = *method,
            .args = {},
            .env = json::toStringMap(*env),
            .description = stmt.columnOptionalText(6),
        };
        if (args->is_array())
        {
            for (const auto& arg: *args)
                if (arg.is_string())
                    config.args.push_back(arg.get<std::string>());
        }

        return StoredServer {
            .config = std::move(config),
            .createdAt = stmt.columnText(7),
            .updatedAt = stmt.columnText(8),
        };
    }

    auto envToJsonText(const ServerConfig& config) -> std::string
    {
        auto env = nlohmann::json::object();
        for (const auto& [key, value]: config.env)
            env[key] = value;
        return env.dump();
    }

    auto argsToJsonText(const ServerConfig& config) -> std::string
    {
        return nlohmann::json(config.args).dump();
    }

    /// Nearest-rank percentile over an ascending sample.
    auto percentile(const std::vector<uint64_t>& sorted, unsigned p) -> uint64_t
    {
        if (sorted.empty())
            return 0;
        auto const rank = (p * sorted.size() + 99) / 100;
        return sorted[std::clamp<std::size_t>(rank, 1, sorted.size()) - 1];
    }

} // namespace

McpStore::McpStore(std::unique_ptr<Database> database): _database(std::move(database))
{
}

auto McpStore::open(const std::string& path) -> Result<std::unique_ptr<McpStore>>
{
    auto database = Database::open(path);
    if (!database)
        return std::unexpected(database.error());

    auto store = std::make_unique<McpStore>(std::move(*database));
    if (auto migrated = store->migrate(); !migrated)
        return std::unexpected(migrated.error());
    return store;
}

auto McpStore::migrate() -> VoidResult
{
    auto lock = _database->lock();
    return _database->exec(SchemaSql);
}

auto McpStore::queryServers(std::string_view sql, std::optional<std::string_view> key)
    -> Result<std::vector<StoredServer>>
{
    auto stmt = _database->prepare(sql);
    if (!stmt)
        return std::unexpected(stmt.error());
    if (key)
    {
        if (auto bound = stmt->bind(1, *key); !bound)
            return std::unexpected(bound.error());
    }

    auto servers = std::vector<StoredServer> {};
    while (true)
    {
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            break;
        auto server = readServer(*stmt);
        if (!server)
            return std::unexpected(server.error());
        servers.push_back(std::move(*server));
    }
    return servers;
}

auto McpStore::listServers() -> Result<std::vector<StoredServer>>
{
    auto lock = _database->lock();
    return queryServers(std::format("SELECT {} FROM mcp_server ORDER BY name", ServerColumns), std::nullopt);
}

auto McpStore::getServerByName(std::string_view name) -> Result<std::optional<StoredServer>>
{
    auto lock = _database->lock();
    auto servers = queryServers(std::format("SELECT {} FROM mcp_server WHERE name = ?1", ServerColumns), name);
    if (!servers)
        return std::unexpected(servers.error());
    if (servers->empty())
        return std::optional<StoredServer> {};
    return std::optional(std::move(servers->front()));
}

auto McpStore::getServerById(std::string_view id) -> Result<std::optional<StoredServer>>
{
    auto lock = _database->lock();
    auto servers = queryServers(std::format("SELECT {} FROM mcp_server WHERE id = ?1", ServerColumns), id);
    if (!servers)
        return std::unexpected(servers.error());
    if (servers->empty())
        return std::optional<StoredServer> {};
    return std::optional(std::move(servers->front()));
}

auto McpStore::insertServer(const ServerConfig& config) -> Result<StoredServer>
{
    auto lock = _database->lock();

    auto byName = getServerByName(config.name);
    if (!byName)
        return std::unexpected(byName.error());
    if (*byName)
        return makeError(ErrorCode::ServerAlreadyExists, std::format("Server '{}' already exists", config.name));

    auto byId = getServerById(config.id);
    if (!byId)
        return std::unexpected(byId.error());
    if (*byId)
        return makeError(ErrorCode::ServerAlreadyExists, std::format("Server id '{}' already exists", config.id));

    auto stmt = _database->prepare("INSERT INTO mcp_server (id, name, enabled, command, args, env, description, "
                                   "created_at, updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?8)");
    if (!stmt)
        return std::unexpected(stmt.error());

    auto const now = currentTimestamp();
    for (auto bound: { stmt->bind(1, config.id),
                       stmt->bind(2, config.name),
                       stmt->bind(3, int64_t { config.enabled ? 1 : 0 }),
                       stmt->bind(4, deploymentMethodToString(config.deploymentMethod)),
                       stmt->bind(5, argsToJsonText(config)),
                       stmt->bind(6, envToJsonText(config)),
                       stmt->bind(7, config.description),
                       stmt->bind(8, now) })
    {
        if (!bound)
            return std::unexpected(bound.error());
    }
    if (auto done = stmt->execute(); !done)
        return std::unexpected(done.error());

    log::debug("Stored MCP server '{}' ({} env vars)", config.name, config.env.size());
    return StoredServer { .config = config, .createdAt = now, .updatedAt = now };
}

auto McpStore::updateServer(const ServerConfig& config) -> Result<StoredServer>
{
    auto lock = _database->lock();

    auto existing = getServerById(config.id);
    if (!existing)
        return std::unexpected(existing.error());
    if (!*existing)
        return makeError(ErrorCode::ServerNotFound, std::format("Server id '{}' not found", config.id));

    auto byName = getServerByName(config.name);
    if (!byName)
        return std::unexpected(byName.error());
    if (*byName && (*byName)->config.id != config.id)
        return makeError(ErrorCode::ServerAlreadyExists, std::format("Server '{}' already exists", config.name));

    auto stmt = _database->prepare("UPDATE mcp_server SET name = ?2, enabled = ?3, command = ?4, args = ?5, "
                                   "env = ?6, description = ?7, updated_at = ?8 WHERE id = ?1");
    if (!stmt)
        return std::unexpected(stmt.error());

    auto const now = currentTimestamp();
    for (auto bound: { stmt->bind(1, config.id),
                       stmt->bind(2, config.name),
                       stmt->bind(3, int64_t { config.enabled ? 1 : 0 }),
                       stmt->bind(4, deploymentMethodToString(config.deploymentMethod)),
                       stmt->bind(5, argsToJsonText(config)),
                       stmt->bind(6, envToJsonText(config)),
                       stmt->bind(7, config.description),
                       stmt->bind(8, now) })
    {
        if (!bound)
            return std::unexpected(bound.error());
    }
    if (auto done = stmt->execute(); !done)
        return std::unexpected(done.error());

    return StoredServer { .config = config, .createdAt = (*existing)->createdAt, .updatedAt = now };
}

auto McpStore::deleteServer(std::string_view id) -> Result<ServerConfig>
{
    auto lock = _database->lock();

    auto existing = getServerById(id);
    if (!existing)
        return std::unexpected(existing.error());
    if (!*existing)
        return makeError(ErrorCode::ServerNotFound, std::format("Server id '{}' not found", id));

    auto stmt = _database->prepare("DELETE FROM mcp_server WHERE id = ?1");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = stmt->bind(1, id); !bound)
        return std::unexpected(bound.error());
    if (auto done = stmt->execute(); !done)
        return std::unexpected(done.error());

    return std::move((*existing)->config);
}

auto McpStore::appendCallLog(const CallLogEntry& entry) -> VoidResult
{
    auto lock = _database->lock();

    auto stmt = _database->prepare("INSERT INTO mcp_call_log (id, workflow_id, server_name, tool_name, params, "
                                   "result, success, duration_ms, timestamp) "
                                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
    if (!stmt)
        return std::unexpected(stmt.error());

    for (auto bound: { stmt->bind(1, entry.id),
                       stmt->bind(2, entry.workflowId),
                       stmt->bind(3, entry.serverName),
                       stmt->bind(4, entry.toolName),
                       stmt->bind(5, entry.params.dump()),
                       stmt->bind(6, entry.result.dump()),
                       stmt->bind(7, int64_t { entry.success ? 1 : 0 }),
                       stmt->bind(8, static_cast<int64_t>(entry.durationMs)),
                       stmt->bind(9, entry.timestamp) })
    {
        if (!bound)
            return std::unexpected(bound.error());
    }
    return stmt->execute();
}

auto McpStore::listCallLogs(std::optional<std::string_view> serverName, std::size_t limit)
    -> Result<std::vector<CallLogEntry>>
{
    auto lock = _database->lock();

    auto const sql = std::format("SELECT id, workflow_id, server_name, tool_name, params, result, success, "
                                 "duration_ms, timestamp FROM mcp_call_log {} ORDER BY timestamp DESC, rowid DESC "
                                 "LIMIT ?2",
                                 serverName ? "WHERE server_name = ?1" : "WHERE ?1 IS NULL");
    auto stmt = _database->prepare(sql);
    if (!stmt)
        return std::unexpected(stmt.error());

    auto bound = serverName ? stmt->bind(1, *serverName) : stmt->bindNull(1);
    if (!bound)
        return std::unexpected(bound.error());
    if (auto boundLimit = stmt->bind(2, static_cast<int64_t>(limit)); !boundLimit)
        return std::unexpected(boundLimit.error());

    auto entries = std::vector<CallLogEntry> {};
    while (true)
    {
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            break;

        auto params = json::parse(stmt->columnText(4));
        auto result = json::parse(stmt->columnText(5));
        entries.push_back(CallLogEntry {
            .id = stmt->columnText(0),
            .workflowId = stmt->columnOptionalText(1),
            .serverName = stmt->columnText(2),
            .toolName = stmt->columnText(3),
            .params = params ? std::move(*params) : nlohmann::json(nullptr),
            .result = result ? std::move(*result) : nlohmann::json(nullptr),
            .success = stmt->columnInt(6) != 0,
            .durationMs = static_cast<uint64_t>(stmt->columnInt(7)),
            .timestamp = stmt->columnText(8),
        });
    }
    return entries;
}

auto McpStore::latencyMetrics(std::string_view serverName) -> Result<LatencyMetrics>
{
    auto lock = _database->lock();

    auto stmt = _database->prepare("SELECT duration_ms FROM mcp_call_log WHERE server_name = ?1 ORDER BY duration_ms");
    if (!stmt)
        return std::unexpected(stmt.error());
    if (auto bound = stmt->bind(1, serverName); !bound)
        return std::unexpected(bound.error());

    auto durations = std::vector<uint64_t> {};
    while (true)
    {
        auto row = stmt->step();
        if (!row)
            return std::unexpected(row.error());
        if (!*row)
            break;
        durations.push_back(static_cast<uint64_t>(stmt->columnInt(0)));
    }

    return LatencyMetrics {
        .serverName = std::string(serverName),
        .p50Ms = percentile(durations, 50),
        .p95Ms = percentile(durations, 95),
        .p99Ms = percentile(durations, 99),
        .totalCalls = durations.size(),
    };
}

} // namespace mcphub::store
