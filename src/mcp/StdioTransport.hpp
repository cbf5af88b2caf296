// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    /// @brief Server name used in log and error messages.
    std::string name;
    std::string command;
    std::vector<std::string> args;

    /// @brief Variables added to (or overriding) the parent environment.
    std::map<std::string, std::string> env;
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process with piped stdin, stdout and stderr and exchanges
/// newline-delimited JSON over stdin/stdout. Stderr lines are forwarded to the
/// debug log. POSIX only.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The process configuration.
    /// @return Success or ProcessSpawnFailed.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Performs a non-blocking wait on the child; reaps it and disconnects if it exited.
    [[nodiscard]] auto isAlive() -> bool override;

    /// @brief Returns the child's process id, or -1 when no child is running.
    [[nodiscard]] auto pid() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
