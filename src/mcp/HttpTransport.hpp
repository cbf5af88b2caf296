// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Configuration for reaching an MCP server over HTTP.
struct HttpTransportConfig
{
    /// @brief Server name used in log and error messages.
    std::string name;

    /// @brief Base URL; every JSON-RPC body is POSTed here.
    std::string url;

    /// @brief Server environment; @c API_KEY and @c HEADER_* entries become request headers.
    std::map<std::string, std::string> env;

    std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

/// @brief Components of a validated http(s) URL.
struct ParsedUrl
{
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;

    /// @brief Returns "scheme://host:port".
    [[nodiscard]] auto origin() const -> std::string;
};

/// @brief Parses and validates an http:// or https:// URL.
/// @return The components, or a ConfigurationError for field @c args[0].
[[nodiscard]] auto parseHttpUrl(std::string_view serverName, std::string_view url) -> Result<ParsedUrl>;

/// @brief Builds the default request headers from a server environment.
///
/// @c API_KEY yields @c Authorization: Bearer <key>; each @c HEADER_<NAME> yields
/// header @c <name> in lowercase with '_' turned into '-'. An empty API key is a ConfigurationError.
[[nodiscard]] auto buildHttpHeaders(std::string_view serverName, const std::map<std::string, std::string>& env)
    -> Result<std::vector<std::pair<std::string, std::string>>>;

/// @brief Transport that POSTs JSON-RPC messages to a remote MCP server.
///
/// The reply to a request is the body of its POST response and is handed out by
/// the next receive(). Notifications that get a non-2xx status are only logged.
class HttpTransport: public Transport
{
  public:
    HttpTransport();
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /// @brief Validates the configuration, builds the client and probes the URL with HEAD.
    ///
    /// Any 2xx or 4xx status (405 included) counts as reachable.
    /// @return Success, ConfigurationError or ConnectionFailed.
    [[nodiscard]] auto connect(const HttpTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;

    /// @brief Sends a best-effort @c shutdown notification and marks the transport disconnected.
    void close() override;

    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the default headers attached to every request.
    [[nodiscard]] auto headers() const -> const std::vector<std::pair<std::string, std::string>>&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
