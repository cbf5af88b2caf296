// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcphub::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    constexpr auto ParseError = -32700;
    constexpr auto InvalidRequest = -32600;
    constexpr auto MethodNotFound = -32601;
    constexpr auto InvalidParams = -32602;
    constexpr auto InternalError = -32603;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return !error.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 success response, used to answer server-initiated requests.
[[nodiscard]] auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// A response with neither @c result nor @c error is a success with a null result.
/// @param message The JSON message to parse.
/// @return The parsed response or a ProtocolError for malformed envelopes.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Unwraps a response into its result, mapping an error envelope to a ProtocolError.
///
/// A missing result is returned as JSON null.
[[nodiscard]] auto resultOf(const Response& response) -> Result<nlohmann::json>;

} // namespace mcphub::jsonrpc
