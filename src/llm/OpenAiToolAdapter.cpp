// SPDX-License-Identifier: Apache-2.0
#include "ToolAdapter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace mcphub::llm
{

namespace
{

    auto toolCallsOf(const nlohmann::json& response) -> const nlohmann::json*
    {
        auto const* calls = json::pointer(response, "/choices/0/message/tool_calls");
        return calls && calls->is_array() ? calls : nullptr;
    }

    auto tokenCount(const nlohmann::json& response, const char* path) -> uint64_t
    {
        auto const* value = json::pointer(response, path);
        if (!value || !value->is_number_integer() || value->get<int64_t>() < 0)
            return 0;
        return static_cast<uint64_t>(value->get<int64_t>());
    }

} // namespace

auto OpenAiToolAdapter::parseToolCalls(const nlohmann::json& response) const -> std::vector<FunctionCall>
{
    auto calls = std::vector<FunctionCall> {};
    auto const* toolCalls = toolCallsOf(response);
    if (!toolCalls)
        return calls;

    for (const auto& toolCall: *toolCalls)
    {
        auto const* id = json::pointer(toolCall, "/id");
        auto const* name = json::pointer(toolCall, "/function/name");
        if (!id || !id->is_string() || !name || !name->is_string())
        {
            log::warning("Skipping tool call without id or name");
            continue;
        }

        auto const functionName = name->get<std::string>();
        calls.push_back(FunctionCall {
            .id = id->get<std::string>(),
            .name = functionName,
            .arguments = parseToolArguments(functionName, json::pointer(toolCall, "/function/arguments")),
        });
        log::debug("Parsed tool call {} ({})", calls.back().name, calls.back().id);
    }
    return calls;
}

auto OpenAiToolAdapter::formatToolResult(const FunctionCallResult& result) const -> nlohmann::json
{
    return nlohmann::json {
        { "role", "tool" },
        { "tool_call_id", result.callId },
        { "name", result.functionName },
        { "content", resultToString(result) },
    };
}

auto OpenAiToolAdapter::toolChoice(ToolChoiceMode mode) const -> nlohmann::json
{
    switch (mode)
    {
        case ToolChoiceMode::Auto: return "auto";
        case ToolChoiceMode::None: return "none";
        case ToolChoiceMode::Required: return "required";
    }
    return "auto";
}

auto OpenAiToolAdapter::extractContent(const nlohmann::json& response) const -> std::optional<std::string>
{
    auto const* content = json::pointer(response, "/choices/0/message/content");
    if (!content || !content->is_string())
        return std::nullopt;
    return content->get<std::string>();
}

auto OpenAiToolAdapter::hasToolCalls(const nlohmann::json& response) const -> bool
{
    auto const* toolCalls = toolCallsOf(response);
    return toolCalls && !toolCalls->empty();
}

auto OpenAiToolAdapter::isFinished(const nlohmann::json& response) const -> bool
{
    auto const* reason = json::pointer(response, "/choices/0/finish_reason");
    if (!reason || !reason->is_string())
        return !hasToolCalls(response);

    // "stop", "end_turn", "length" and anything unknown end the turn.
    return reason->get<std::string>() != "tool_calls";
}

auto OpenAiToolAdapter::buildAssistantMessage(const nlohmann::json& response) const -> nlohmann::json
{
    if (auto const* message = json::pointer(response, "/choices/0/message"))
        return *message;
    return nlohmann::json { { "role", "assistant" }, { "content", "" } };
}

auto OpenAiToolAdapter::extractUsage(const nlohmann::json& response) const -> TokenUsage
{
    return TokenUsage {
        .inputTokens = tokenCount(response, "/usage/prompt_tokens"),
        .outputTokens = tokenCount(response, "/usage/completion_tokens"),
    };
}

auto MistralToolAdapter::toolChoice(ToolChoiceMode mode) const -> nlohmann::json
{
    if (mode == ToolChoiceMode::Required)
        return "any";
    return OpenAiToolAdapter::toolChoice(mode);
}

} // namespace mcphub::llm
