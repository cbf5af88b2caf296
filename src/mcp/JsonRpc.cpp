// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcphub::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("error") && !message["error"].is_null())
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("method"))
    {
        // A server-initiated request or notification, never a reply.
        return makeError(ErrorCode::ProtocolError,
                         std::format("Expected a response, got method call '{}'",
                                     message["method"].is_string() ? message["method"].get<std::string>() : ""));
    }

    return response;
}

auto resultOf(const Response& response) -> Result<nlohmann::json>
{
    if (response.error)
        return makeRpcError(response.error->code, response.error->message);
    return response.result.value_or(nlohmann::json {});
}

} // namespace mcphub::jsonrpc
