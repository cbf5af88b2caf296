// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Defines a tool that an LLM can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

/// @brief A function call requested by an LLM, normalised across providers.
///
/// MCP tools are addressed as @c mcp__<server>__<tool> (see ToolName.hpp).
struct FunctionCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief The outcome of executing a FunctionCall, ready to be fed back to the LLM.
struct FunctionCallResult
{
    std::string callId;
    std::string functionName;
    bool success = false;
    nlohmann::json result;
    std::optional<std::string> error;

    /// @brief Builds a successful result.
    [[nodiscard]] static auto ok(std::string callId, std::string functionName, nlohmann::json result)
        -> FunctionCallResult
    {
        return FunctionCallResult {
            .callId = std::move(callId),
            .functionName = std::move(functionName),
            .success = true,
            .result = std::move(result),
            .error = std::nullopt,
        };
    }

    /// @brief Builds a failed result with a human-readable error.
    [[nodiscard]] static auto failed(std::string callId, std::string functionName, std::string error)
        -> FunctionCallResult
    {
        return FunctionCallResult {
            .callId = std::move(callId),
            .functionName = std::move(functionName),
            .success = false,
            .result = nullptr,
            .error = std::move(error),
        };
    }
};

/// @brief How a model is instructed to pick tools.
enum class ToolChoiceMode
{
    Auto,
    None,
    Required,
};

/// @brief Token usage reported by a provider response.
struct TokenUsage
{
    uint64_t inputTokens = 0;
    uint64_t outputTokens = 0;

    auto operator==(const TokenUsage&) const -> bool = default;
};

} // namespace mcphub
