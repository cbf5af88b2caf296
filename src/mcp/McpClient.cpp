// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/Log.hpp>
#include <mcp/HttpTransport.hpp>

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

} // namespace

auto buildStdioCommand(const ServerConfig& config, const ClientOptions& options) -> Result<StdioTransportConfig>
{
    if (config.deploymentMethod == DeploymentMethod::Http)
        return makeConfigError(config.name, "command", "HTTP servers are not spawned as processes");

    if (config.args.empty())
        return makeConfigError(config.name, "args", "arguments must not be empty");

    auto const it = options.launchers.find(config.deploymentMethod);
    auto launcher = it != options.launchers.end() ? it->second
                                                  : std::string(deploymentMethodToString(config.deploymentMethod));

    return StdioTransportConfig {
        .name = config.name,
        .command = std::move(launcher),
        .args = config.args,
        .env = config.env,
    };
}

McpClient::McpClient(ServerConfig config, ClientOptions options):
    _options(std::move(options)), _config(std::move(config))
{
}

McpClient::McpClient(ServerConfig config, std::unique_ptr<Transport> transport, ClientOptions options):
    _options(std::move(options)), _injectedTransport(std::move(transport)), _config(std::move(config))
{
}

McpClient::~McpClient()
{
    disconnect();
}

auto McpClient::connect() -> VoidResult
{
    auto const config = this->config();

    {
        auto lock = std::lock_guard(_mutex);
        if (_handle || _connecting)
            return makeConfigError(
                config.name, "connection", _handle ? "client is already connected" : "client is already connecting");
        _connecting = true;
    }

    log::info("Connecting MCP client '{}' ({})", config.name, deploymentMethodToString(config.deploymentMethod));

    auto handle = openHandle(config);

    auto lock = std::lock_guard(_mutex);
    _connecting = false;
    if (!handle)
        return std::unexpected(handle.error());
    _handle = std::move(*handle);
    log::info("MCP client '{}' connected", config.name);
    return {};
}

auto McpClient::openHandle(const ServerConfig& config) -> Result<std::shared_ptr<ServerHandle>>
{
    auto transport = std::unique_ptr<Transport> {};
    if (_injectedTransport)
    {
        transport = std::move(_injectedTransport);
    }
    else if (config.deploymentMethod == DeploymentMethod::Http)
    {
        if (config.args.empty())
            return makeConfigError(config.name, "args", "HTTP servers need a URL as first argument");

        auto http = std::make_unique<HttpTransport>();
        auto connected = http->connect(HttpTransportConfig {
            .name = config.name,
            .url = config.args.front(),
            .env = config.env,
            .timeout = _options.httpTimeout,
        });
        if (!connected)
            return std::unexpected(connected.error());
        transport = std::move(http);
    }
    else
    {
        auto command = buildStdioCommand(config, _options);
        if (!command)
            return std::unexpected(command.error());

        auto stdio = std::make_unique<StdioTransport>();
        if (auto started = stdio->start(*command); !started)
            return std::unexpected(started.error());
        transport = std::move(stdio);
    }

    auto handle = std::make_shared<ServerHandle>(config.name, std::move(transport), _options.requestTimeout);
    if (auto initialized = handle->initialize(); !initialized)
    {
        handle->disconnect();
        return std::unexpected(initialized.error());
    }
    return handle;
}

void McpClient::disconnect()
{
    auto handle = std::shared_ptr<ServerHandle> {};
    {
        auto lock = std::lock_guard(_mutex);
        handle = std::move(_handle);
    }

    if (handle)
        handle->disconnect();
}

auto McpClient::isConnected() const -> bool
{
    return handle() != nullptr;
}

auto McpClient::status() const -> ServerStatus
{
    auto h = std::shared_ptr<ServerHandle> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (!_handle)
            return _connecting ? ServerStatus::Starting : ServerStatus::Stopped;
        h = _handle;
    }
    return h->status();
}

auto McpClient::config() const -> ServerConfig
{
    auto lock = std::lock_guard(_mutex);
    return _config;
}

void McpClient::updateConfig(ServerConfig config)
{
    auto lock = std::lock_guard(_mutex);
    _config = std::move(config);
}

auto McpClient::tools() const -> std::vector<ToolDefinition>
{
    auto const h = handle();
    return h ? h->tools() : std::vector<ToolDefinition> {};
}

auto McpClient::resources() const -> std::vector<Resource>
{
    auto const h = handle();
    return h ? h->resources() : std::vector<Resource> {};
}

auto McpClient::serverInfo() const -> std::optional<protocol::ServerInfo>
{
    auto const h = handle();
    return h ? h->serverInfo() : std::nullopt;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>
{
    auto const start = std::chrono::steady_clock::now();

    return callToolRaw(name, arguments).transform([&](const protocol::ToolCallResponse& response) {
        auto content = nlohmann::json::array();
        for (const auto& item: response.content)
            content.push_back(protocol::contentToJson(item));
        if (content.size() == 1)
            content = content[0];

        return ToolCallResult {
            .success = !response.isError,
            .content = std::move(content),
            .error = response.isError ? std::optional<std::string>("Tool returned an error") : std::nullopt,
            .durationMs = elapsedMs(start),
        };
    });
}

auto McpClient::callToolRaw(std::string_view name, const nlohmann::json& arguments)
    -> Result<protocol::ToolCallResponse>
{
    auto const h = handle();
    if (!h)
        return notConnectedError();
    return h->callTool(name, arguments);
}

auto McpClient::callToolText(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>
{
    return callToolRaw(name, arguments).transform([](const protocol::ToolCallResponse& response) {
        return protocol::contentText(response);
    });
}

auto McpClient::refreshTools() -> Result<std::vector<ToolDefinition>>
{
    auto const h = handle();
    if (!h)
        return notConnectedError();
    return h->refreshTools();
}

auto McpClient::isProcessAlive() -> bool
{
    auto const h = handle();
    return h && h->isProcessAlive();
}

auto McpClient::testConnection(const ServerConfig& config, const ClientOptions& options) -> TestResult
{
    auto const start = std::chrono::steady_clock::now();
    auto client = McpClient(config, options);

    auto connected = client.connect();
    auto const latencyMs = elapsedMs(start);

    if (!connected)
    {
        log::info("Connection test for '{}' failed: {}", config.name, connected.error().message);
        return TestResult {
            .success = false,
            .message = connected.error().message,
            .tools = {},
            .resources = {},
            .latencyMs = latencyMs,
        };
    }

    auto result = TestResult {
        .success = true,
        .message = {},
        .tools = client.tools(),
        .resources = client.resources(),
        .latencyMs = latencyMs,
    };
    result.message = std::format("Connected successfully. Found {} tools and {} resources.",
                                 result.tools.size(),
                                 result.resources.size());

    client.disconnect();
    return result;
}

auto McpClient::handle() const -> std::shared_ptr<ServerHandle>
{
    auto lock = std::lock_guard(_mutex);
    return _handle;
}

auto McpClient::notConnectedError() const -> std::unexpected<Error>
{
    return makeError(ErrorCode::ServerNotRunning,
                     std::format("Server '{}' is not running (status: disconnected)", config().name));
}

} // namespace mcphub
