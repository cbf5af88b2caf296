// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace mcphub
{

/// @brief Abstract interface for MCP transport communication.
///
/// A transport moves whole JSON-RPC messages. Requests are followed by exactly one
/// receive() for their reply; notifications are sent without a reply.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the server.
    /// @param timeout Maximum time to wait before failing with ErrorCode::Timeout.
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection. Safe to call more than once.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Checks whether the remote end is still alive without blocking.
    ///
    /// Transports without a liveness notion report isConnected().
    [[nodiscard]] virtual auto isAlive() -> bool { return isConnected(); }
};

} // namespace mcphub
