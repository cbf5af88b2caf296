// SPDX-License-Identifier: Apache-2.0
#include "ToolAdapter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>

#include <format>

namespace mcphub::llm
{

namespace
{

    auto toolCallsOf(const nlohmann::json& response) -> const nlohmann::json*
    {
        auto const* calls = json::pointer(response, "/message/tool_calls");
        return calls && calls->is_array() ? calls : nullptr;
    }

} // namespace

auto OllamaToolAdapter::parseToolCalls(const nlohmann::json& response) const -> std::vector<FunctionCall>
{
    auto calls = std::vector<FunctionCall> {};
    auto const* toolCalls = toolCallsOf(response);
    if (!toolCalls)
        return calls;

    for (const auto& toolCall: *toolCalls)
    {
        auto const* name = json::pointer(toolCall, "/function/name");
        if (!name || !name->is_string())
        {
            log::warning("Skipping Ollama tool call without a function name");
            continue;
        }

        // Ollama does not assign call ids.
        auto const functionName = name->get<std::string>();
        calls.push_back(FunctionCall {
            .id = std::format("ollama_{}", generateUuid()),
            .name = functionName,
            .arguments = parseToolArguments(functionName, json::pointer(toolCall, "/function/arguments")),
        });
        log::debug("Parsed Ollama tool call {} ({})", calls.back().name, calls.back().id);
    }
    return calls;
}

auto OllamaToolAdapter::formatToolResult(const FunctionCallResult& result) const -> nlohmann::json
{
    return nlohmann::json {
        { "role", "tool" },
        { "content", resultToString(result) },
    };
}

auto OllamaToolAdapter::toolChoice(ToolChoiceMode /*mode*/) const -> nlohmann::json
{
    return nullptr;
}

auto OllamaToolAdapter::extractContent(const nlohmann::json& response) const -> std::optional<std::string>
{
    auto const* content = json::pointer(response, "/message/content");
    if (!content || !content->is_string())
        return std::nullopt;
    return content->get<std::string>();
}

auto OllamaToolAdapter::hasToolCalls(const nlohmann::json& response) const -> bool
{
    auto const* toolCalls = toolCallsOf(response);
    return toolCalls && !toolCalls->empty();
}

auto OllamaToolAdapter::isFinished(const nlohmann::json& response) const -> bool
{
    if (hasToolCalls(response))
        return false;
    return json::getBoolOr(response, "done", false);
}

auto OllamaToolAdapter::buildAssistantMessage(const nlohmann::json& response) const -> nlohmann::json
{
    if (response.is_object() && response.contains("message"))
        return response["message"];
    return nlohmann::json { { "role", "assistant" }, { "content", "" } };
}

auto OllamaToolAdapter::extractUsage(const nlohmann::json& response) const -> TokenUsage
{
    return TokenUsage {
        .inputTokens = json::getUint64Or(response, "prompt_eval_count", 0),
        .outputTokens = json::getUint64Or(response, "eval_count", 0),
    };
}

} // namespace mcphub::llm
