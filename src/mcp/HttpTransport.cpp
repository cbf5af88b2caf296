// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <deque>
#include <format>

namespace mcphub
{

namespace
{

    constexpr auto HeaderPrefix = std::string_view { "HEADER_" };

    auto isSuccessStatus(int status) -> bool
    {
        return status >= 200 && status < 300;
    }

} // namespace

auto ParsedUrl::origin() const -> std::string
{
    return std::format("{}://{}:{}", scheme, host, port);
}

auto parseHttpUrl(std::string_view serverName, std::string_view url) -> Result<ParsedUrl>
{
    auto parsed = ParsedUrl {};
    auto rest = std::string_view {};

    if (url.starts_with("https://"))
    {
        parsed.scheme = "https";
        parsed.port = 443;
        rest = url.substr(8);
    }
    else if (url.starts_with("http://"))
    {
        parsed.scheme = "http";
        parsed.port = 80;
        rest = url.substr(7);
    }
    else
    {
        return makeConfigError(serverName, "args[0]", std::format("URL must start with http:// or https://, got '{}'", url));
    }

    auto const authorityEnd = rest.find_first_of("/?#");
    auto const authority = rest.substr(0, authorityEnd);
    auto target = authorityEnd == std::string_view::npos ? std::string_view {} : rest.substr(authorityEnd);
    target = target.substr(0, target.find('#'));
    parsed.path = target.starts_with('/') ? std::string(target) : std::format("/{}", target);

    auto const colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']', colon) == std::string_view::npos)
    {
        auto const portText = authority.substr(colon + 1);
        auto port = 0;
        auto const [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc {} || ptr != portText.data() + portText.size() || port <= 0 || port > 65535)
            return makeConfigError(serverName, "args[0]", std::format("invalid port in URL '{}'", url));
        parsed.port = port;
        parsed.host = std::string(authority.substr(0, colon));
    }
    else
    {
        parsed.host = std::string(authority);
    }

    if (parsed.host.empty())
        return makeConfigError(serverName, "args[0]", std::format("URL '{}' has no host", url));

    return parsed;
}

auto buildHttpHeaders(std::string_view serverName, const std::map<std::string, std::string>& env)
    -> Result<std::vector<std::pair<std::string, std::string>>>
{
    auto headers = std::vector<std::pair<std::string, std::string>> {};

    if (auto const it = env.find("API_KEY"); it != env.end())
    {
        if (it->second.empty())
            return makeConfigError(serverName, "env.API_KEY", "API key is empty");
        headers.emplace_back("Authorization", std::format("Bearer {}", it->second));
    }

    for (const auto& [key, value]: env)
    {
        if (!key.starts_with(HeaderPrefix) || key.size() == HeaderPrefix.size())
            continue;

        auto name = key.substr(HeaderPrefix.size());
        // Environment names cannot carry '-', so HEADER_X_API_TOKEN becomes x-api-token.
        std::ranges::transform(name, name.begin(), [](unsigned char c) {
            return c == '_' ? '-' : static_cast<char>(std::tolower(c));
        });
        headers.emplace_back(std::move(name), value);
    }

    return headers;
}

struct HttpTransport::Impl
{
    std::string name;
    ParsedUrl url;
    std::chrono::milliseconds timeout {};
    std::vector<std::pair<std::string, std::string>> headers;
    std::unique_ptr<httplib::Client> client;
    std::deque<std::string> pendingBodies;
    std::atomic<bool> connected = false;

    /// @brief POSTs one JSON body; returns the response or a ConnectionFailed / Timeout error.
    auto post(const nlohmann::json& message) -> Result<httplib::Response>
    {
        auto res = client->Post(url.path, message.dump(), "application/json");
        if (!res)
        {
            auto const err = res.error();
            if (err == httplib::Error::Read)
                return makeTimeoutError(std::format("waiting for response from server '{}'", name),
                                        static_cast<uint64_t>(timeout.count()));
            return makeError(ErrorCode::ConnectionFailed,
                             std::format("POST to server '{}' failed: {}", name, httplib::to_string(err)));
        }
        return *res;
    }
};

HttpTransport::HttpTransport(): _impl(std::make_unique<Impl>())
{
}

HttpTransport::~HttpTransport()
{
    if (_impl->connected)
        log::warning("HTTP MCP server '{}' dropped without disconnect()", _impl->name);
}

auto HttpTransport::connect(const HttpTransportConfig& config) -> VoidResult
{
    _impl->name = config.name;
    _impl->timeout = config.timeout;

    auto url = parseHttpUrl(config.name, config.url);
    if (!url)
        return std::unexpected(url.error());
    _impl->url = std::move(*url);

    auto headers = buildHttpHeaders(config.name, config.env);
    if (!headers)
        return std::unexpected(headers.error());
    _impl->headers = std::move(*headers);

    _impl->client = std::make_unique<httplib::Client>(_impl->url.origin());
    if (!_impl->client->is_valid())
        return makeError(ErrorCode::ConnectionFailed,
                         std::format("Cannot create HTTP client for '{}' (scheme {} unsupported?)",
                                     config.url,
                                     _impl->url.scheme));

    _impl->client->set_connection_timeout(config.timeout);
    _impl->client->set_read_timeout(config.timeout);
    _impl->client->set_write_timeout(config.timeout);

    auto defaultHeaders = httplib::Headers {};
    for (const auto& [key, value]: _impl->headers)
        defaultHeaders.emplace(key, value);
    _impl->client->set_default_headers(std::move(defaultHeaders));

    auto res = _impl->client->Head(_impl->url.path);
    if (!res)
        return makeError(ErrorCode::ConnectionFailed,
                         std::format("Server '{}' at {} is unreachable: {}",
                                     config.name,
                                     config.url,
                                     httplib::to_string(res.error())));

    auto const status = res->status;
    if (!isSuccessStatus(status) && !(status >= 400 && status < 500))
        return makeError(ErrorCode::ConnectionFailed,
                         std::format("Server '{}' at {} answered HEAD with HTTP {}", config.name, config.url, status));

    _impl->pendingBodies.clear();
    _impl->connected = true;
    log::info("HTTP MCP server '{}' reachable at {} (HEAD {})", config.name, config.url, status);
    return {};
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected || !_impl->client)
        return makeError(ErrorCode::ConnectionFailed, std::format("Server '{}' is not connected", _impl->name));

    auto const isNotification = !message.contains("id");
    auto const method = json::getStringOr(message, "method", "");

    auto res = _impl->post(message);
    if (!res)
    {
        if (isNotification)
        {
            log::warning("Notification '{}' to server '{}' failed: {}", method, _impl->name, res.error().message);
            return {};
        }
        return std::unexpected(res.error());
    }

    if (!isSuccessStatus(res->status))
    {
        if (isNotification)
        {
            log::warning("Notification '{}' to server '{}' returned HTTP {}", method, _impl->name, res->status);
            return {};
        }
        return makeError(ErrorCode::ConnectionFailed,
                         std::format("HTTP {} - {}", res->status, res->body));
    }

    if (!isNotification)
        _impl->pendingBodies.push_back(std::move(res->body));

    return {};
}

auto HttpTransport::receive(std::chrono::milliseconds /*timeout*/) -> Result<nlohmann::json>
{
    if (_impl->pendingBodies.empty())
        return makeError(ErrorCode::ProtocolError,
                         std::format("No pending response from server '{}'", _impl->name));

    auto body = std::move(_impl->pendingBodies.front());
    _impl->pendingBodies.pop_front();
    return json::parse(body);
}

void HttpTransport::close()
{
    if (!_impl->connected)
        return;

    auto result = send(jsonrpc::makeNotification("shutdown", nlohmann::json::object()));
    if (!result)
        log::warning("Shutdown notification to server '{}' failed: {}", _impl->name, result.error().message);

    _impl->connected = false;
    _impl->pendingBodies.clear();
    log::debug("HTTP MCP server '{}' disconnected", _impl->name);
}

auto HttpTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto HttpTransport::headers() const -> const std::vector<std::pair<std::string, std::string>>&
{
    return _impl->headers;
}

} // namespace mcphub
