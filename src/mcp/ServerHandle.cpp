// SPDX-License-Identifier: Apache-2.0
#include "ServerHandle.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace mcphub
{

ServerHandle::ServerHandle(std::string serverName,
                           std::unique_ptr<Transport> transport,
                           std::chrono::milliseconds requestTimeout):
    _name(std::move(serverName)), _transport(std::move(transport)), _requestTimeout(requestTimeout)
{
}

ServerHandle::~ServerHandle()
{
    disconnect();
}

auto ServerHandle::initialize() -> VoidResult
{
    setStatus(ServerStatus::Starting);

    auto init = sendRequest("initialize", protocol::makeInitializeParams())
                    .and_then([](const nlohmann::json& result) { return protocol::parseInitializeResult(result); });

    if (!init)
    {
        setStatus(ServerStatus::Error);
        auto error = init.error();
        if (error.code == ErrorCode::ProtocolError || error.code == ErrorCode::SerializationError)
        {
            error.code = ErrorCode::InitializationFailed;
            error.message = std::format("Server '{}' initialization failed: {}", _name, error.message);
        }
        return std::unexpected(std::move(error));
    }

    {
        auto lock = std::lock_guard(_stateMutex);
        _serverInfo = init->serverInfo;
        _capabilities = init->capabilities;
    }

    if (auto notified = sendNotification("notifications/initialized"); !notified)
    {
        setStatus(ServerStatus::Error);
        return notified;
    }

    auto tools = std::vector<ToolDefinition> {};
    if (init->capabilities.hasTools)
    {
        auto listed = listTools();
        if (listed)
            tools = std::move(*listed);
        else
            log::warning("Failed to list tools for server '{}': {}", _name, listed.error().message);
    }

    auto resources = std::vector<Resource> {};
    if (init->capabilities.hasResources)
    {
        auto listed = listResources();
        if (listed)
            resources = std::move(*listed);
        else
            log::warning("Failed to list resources for server '{}': {}", _name, listed.error().message);
    }

    if (!init->capabilities.hasTools && !init->capabilities.hasResources)
        log::info("MCP server '{}' advertises neither tools nor resources", _name);

    {
        auto lock = std::lock_guard(_stateMutex);
        _tools = std::move(tools);
        _resources = std::move(resources);
        _status = ServerStatus::Running;
    }

    log::info("MCP server '{}' initialized: {} v{} ({} tools, {} resources)",
              _name,
              init->serverInfo.name,
              init->serverInfo.version,
              this->tools().size(),
              this->resources().size());
    return {};
}

auto ServerHandle::callTool(std::string_view name, const nlohmann::json& arguments)
    -> Result<protocol::ToolCallResponse>
{
    if (auto running = requireRunning(); !running)
        return std::unexpected(running.error());

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return sendRequest("tools/call", std::move(params))
        .and_then([this, name](const nlohmann::json& result) -> Result<protocol::ToolCallResponse> {
            auto response = protocol::parseToolCallResponse(result);
            if (response)
                log::debug("Tool '{}' on server '{}' returned {} content item(s) (isError: {})",
                           name,
                           _name,
                           response->content.size(),
                           response->isError);
            return response;
        });
}

auto ServerHandle::refreshTools() -> Result<std::vector<ToolDefinition>>
{
    if (auto running = requireRunning(); !running)
        return std::unexpected(running.error());

    return listTools().transform([this](std::vector<ToolDefinition> tools) {
        auto lock = std::lock_guard(_stateMutex);
        _tools = tools;
        return tools;
    });
}

auto ServerHandle::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_ioMutex);

    auto const id = _nextId++;
    auto const request = jsonrpc::makeRequest(id, method, std::move(params));

    auto const failed = [this, method](Error error) -> Result<nlohmann::json> {
        if (error.code == ErrorCode::Timeout)
            return makeTimeoutError(std::format("{} on server '{}'", method, _name),
                                    static_cast<uint64_t>(_requestTimeout.count()));
        if (error.code == ErrorCode::ConnectionFailed && !_transport->isConnected())
            setStatus(ServerStatus::Disconnected);
        return std::unexpected(std::move(error));
    };

    if (auto sent = _transport->send(request); !sent)
        return failed(sent.error());

    auto const deadline = std::chrono::steady_clock::now() + _requestTimeout;
    while (true)
    {
        auto const remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return failed(Error { .code = ErrorCode::Timeout, .message = "deadline passed" });

        auto message = _transport->receive(remaining);
        if (!message)
            return failed(message.error());

        if (message->is_object() && message->contains("method"))
        {
            answerServerRequest(*message);
            continue;
        }

        if (message->is_object() && message->contains("id") && !(*message)["id"].is_null()
            && (*message)["id"] != id)
        {
            log::debug("Server '{}': discarding reply to request {} while waiting for {}",
                       _name,
                       (*message)["id"].dump(),
                       id);
            continue;
        }

        return jsonrpc::parseResponse(*message).and_then(
            [](const jsonrpc::Response& response) { return jsonrpc::resultOf(response); });
    }
}

auto ServerHandle::sendNotification(std::string_view method, nlohmann::json params) -> VoidResult
{
    auto lock = std::lock_guard(_ioMutex);
    return _transport->send(jsonrpc::makeNotification(method, std::move(params)));
}

void ServerHandle::disconnect()
{
    {
        auto lock = std::lock_guard(_stateMutex);
        if (_status == ServerStatus::Stopped)
            return;
        _status = ServerStatus::Stopped;
        _tools.clear();
        _resources.clear();
    }

    auto lock = std::lock_guard(_ioMutex);
    _transport->close();
    log::info("MCP server '{}' stopped", _name);
}

auto ServerHandle::isProcessAlive() -> bool
{
    auto alive = false;
    {
        auto lock = std::lock_guard(_ioMutex);
        alive = _transport->isAlive();
    }

    if (!alive)
    {
        auto lock = std::lock_guard(_stateMutex);
        if (_status == ServerStatus::Running || _status == ServerStatus::Starting)
            _status = ServerStatus::Disconnected;
    }
    return alive;
}

auto ServerHandle::status() const -> ServerStatus
{
    auto lock = std::lock_guard(_stateMutex);
    return _status;
}

auto ServerHandle::tools() const -> std::vector<ToolDefinition>
{
    auto lock = std::lock_guard(_stateMutex);
    return _tools;
}

auto ServerHandle::resources() const -> std::vector<Resource>
{
    auto lock = std::lock_guard(_stateMutex);
    return _resources;
}

auto ServerHandle::serverInfo() const -> std::optional<protocol::ServerInfo>
{
    auto lock = std::lock_guard(_stateMutex);
    return _serverInfo;
}

auto ServerHandle::capabilities() const -> protocol::ServerCapabilities
{
    auto lock = std::lock_guard(_stateMutex);
    return _capabilities;
}

auto ServerHandle::listTools() -> Result<std::vector<ToolDefinition>>
{
    return sendRequest("tools/list").and_then([](const nlohmann::json& result) {
        return protocol::parseToolList(result);
    });
}

auto ServerHandle::listResources() -> Result<std::vector<Resource>>
{
    return sendRequest("resources/list").and_then([](const nlohmann::json& result) {
        return protocol::parseResourceList(result);
    });
}

void ServerHandle::answerServerRequest(const nlohmann::json& message)
{
    auto const method = json::getStringOr(message, "method", "");
    if (!message.contains("id"))
    {
        log::debug("Server '{}' sent notification '{}'", _name, method);
        return;
    }

    auto const reply = method == "ping"
                           ? jsonrpc::makeResponse(message["id"], nlohmann::json::object())
                           : jsonrpc::makeErrorResponse(message["id"],
                                                        jsonrpc::codes::MethodNotFound,
                                                        std::format("Method not supported: {}", method));

    if (auto sent = _transport->send(reply); !sent)
        log::warning("Failed to answer '{}' from server '{}': {}", method, _name, sent.error().message);
}

void ServerHandle::setStatus(ServerStatus status)
{
    auto lock = std::lock_guard(_stateMutex);
    _status = status;
}

auto ServerHandle::requireRunning() const -> VoidResult
{
    auto const current = status();
    if (current != ServerStatus::Running)
        return makeError(ErrorCode::ServerNotRunning,
                         std::format("Server '{}' is not running (status: {})", _name, serverStatusToString(current)));
    return {};
}

} // namespace mcphub
