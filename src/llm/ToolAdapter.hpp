// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcphub::llm
{

/// @brief The LLM provider families whose tool-calling dialects are supported.
enum class ProviderKind
{
    OpenAiCompatible,
    Mistral,
    Ollama,
};

/// @brief Parses "openai", "openai_compatible", "mistral" or "ollama" (case-insensitive).
[[nodiscard]] auto providerKindFromString(std::string_view name) -> std::optional<ProviderKind>;

/// @brief Tool dialect of OpenAI-compatible chat completion APIs.
///
/// Tool calls live at @c choices[0].message.tool_calls, carry their own id and
/// encode arguments as a JSON string.
struct OpenAiToolAdapter
{
    [[nodiscard]] auto providerName() const -> std::string_view { return "openai_compatible"; }
    [[nodiscard]] auto parseToolCalls(const nlohmann::json& response) const -> std::vector<FunctionCall>;
    [[nodiscard]] auto formatToolResult(const FunctionCallResult& result) const -> nlohmann::json;
    [[nodiscard]] auto toolChoice(ToolChoiceMode mode) const -> nlohmann::json;
    [[nodiscard]] auto extractContent(const nlohmann::json& response) const -> std::optional<std::string>;
    [[nodiscard]] auto hasToolCalls(const nlohmann::json& response) const -> bool;
    [[nodiscard]] auto isFinished(const nlohmann::json& response) const -> bool;
    [[nodiscard]] auto buildAssistantMessage(const nlohmann::json& response) const -> nlohmann::json;
    [[nodiscard]] auto extractUsage(const nlohmann::json& response) const -> TokenUsage;
};

/// @brief Mistral speaks the OpenAI dialect but names the "required" tool choice "any".
struct MistralToolAdapter: OpenAiToolAdapter
{
    [[nodiscard]] auto providerName() const -> std::string_view { return "mistral"; }
    [[nodiscard]] auto toolChoice(ToolChoiceMode mode) const -> nlohmann::json;
};

/// @brief Tool dialect of the Ollama chat API.
///
/// Tool calls live at @c message.tool_calls without ids (one is synthesised as
/// @c ollama_<uuid>) and arguments are JSON objects. Tool choice is not supported.
struct OllamaToolAdapter
{
    [[nodiscard]] auto providerName() const -> std::string_view { return "ollama"; }
    [[nodiscard]] auto parseToolCalls(const nlohmann::json& response) const -> std::vector<FunctionCall>;
    [[nodiscard]] auto formatToolResult(const FunctionCallResult& result) const -> nlohmann::json;
    [[nodiscard]] auto toolChoice(ToolChoiceMode mode) const -> nlohmann::json;
    [[nodiscard]] auto extractContent(const nlohmann::json& response) const -> std::optional<std::string>;
    [[nodiscard]] auto hasToolCalls(const nlohmann::json& response) const -> bool;
    [[nodiscard]] auto isFinished(const nlohmann::json& response) const -> bool;
    [[nodiscard]] auto buildAssistantMessage(const nlohmann::json& response) const -> nlohmann::json;
    [[nodiscard]] auto extractUsage(const nlohmann::json& response) const -> TokenUsage;
};

using ToolAdapter = std::variant<OpenAiToolAdapter, MistralToolAdapter, OllamaToolAdapter>;

[[nodiscard]] auto makeToolAdapter(ProviderKind kind) -> ToolAdapter;

/// @brief Wraps each tool as @c {type:"function", function:{name, description, parameters}}.
///
/// The format is the same for every provider family.
[[nodiscard]] auto formatTools(const std::vector<ToolDefinition>& tools) -> nlohmann::json;

/// @brief Returns the tool result as the string carried in a @c tool message.
///
/// The JSON-encoded result on success, otherwise @c {"error": "<message>"} encoded.
[[nodiscard]] auto resultToString(const FunctionCallResult& result) -> std::string;

/// @brief Normalises the @c arguments of a tool call into a JSON object.
///
/// Objects are taken as is and strings are parsed. Anything else, including a
/// string that is not valid JSON, yields an empty object and a warning.
[[nodiscard]] auto parseToolArguments(std::string_view toolName, const nlohmann::json* arguments) -> nlohmann::json;

[[nodiscard]] auto providerName(const ToolAdapter& adapter) -> std::string_view;
[[nodiscard]] auto parseToolCalls(const ToolAdapter& adapter, const nlohmann::json& response)
    -> std::vector<FunctionCall>;
[[nodiscard]] auto formatToolResult(const ToolAdapter& adapter, const FunctionCallResult& result) -> nlohmann::json;
[[nodiscard]] auto toolChoice(const ToolAdapter& adapter, ToolChoiceMode mode) -> nlohmann::json;
[[nodiscard]] auto extractContent(const ToolAdapter& adapter, const nlohmann::json& response)
    -> std::optional<std::string>;
[[nodiscard]] auto hasToolCalls(const ToolAdapter& adapter, const nlohmann::json& response) -> bool;
[[nodiscard]] auto isFinished(const ToolAdapter& adapter, const nlohmann::json& response) -> bool;
[[nodiscard]] auto buildAssistantMessage(const ToolAdapter& adapter, const nlohmann::json& response)
    -> nlohmann::json;
[[nodiscard]] auto extractUsage(const ToolAdapter& adapter, const nlohmann::json& response) -> TokenUsage;

} // namespace mcphub::llm
