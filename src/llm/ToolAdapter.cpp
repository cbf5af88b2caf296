// SPDX-License-Identifier: Apache-2.0
#include "ToolAdapter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>

namespace mcphub::llm
{

auto providerKindFromString(std::string_view name) -> std::optional<ProviderKind>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "openai" || lower == "openai_compatible")
        return ProviderKind::OpenAiCompatible;
    if (lower == "mistral")
        return ProviderKind::Mistral;
    if (lower == "ollama")
        return ProviderKind::Ollama;
    return std::nullopt;
}

auto makeToolAdapter(ProviderKind kind) -> ToolAdapter
{
    switch (kind)
    {
        case ProviderKind::OpenAiCompatible: return OpenAiToolAdapter {};
        case ProviderKind::Mistral: return MistralToolAdapter {};
        case ProviderKind::Ollama: return OllamaToolAdapter {};
    }
    return OpenAiToolAdapter {};
}

auto formatTools(const std::vector<ToolDefinition>& tools) -> nlohmann::json
{
    auto result = nlohmann::json::array();
    for (const auto& tool: tools)
    {
        result.push_back({
            { "type", "function" },
            { "function",
              {
                  { "name", tool.name },
                  { "description", tool.description },
                  { "parameters", tool.inputSchema },
              } },
        });
    }
    return result;
}

auto resultToString(const FunctionCallResult& result) -> std::string
{
    if (result.success)
        return result.result.dump();
    return nlohmann::json { { "error", result.error.value_or("Unknown error") } }.dump();
}

auto parseToolArguments(std::string_view toolName, const nlohmann::json* arguments) -> nlohmann::json
{
    if (!arguments)
    {
        log::warning("Missing arguments in tool call '{}'", toolName);
        return nlohmann::json::object();
    }
    if (arguments->is_object())
        return *arguments;
    if (arguments->is_string())
    {
        auto parsed = json::parse(arguments->get<std::string>());
        if (parsed && parsed->is_object())
            return std::move(*parsed);
        log::warning("Failed to parse arguments of tool call '{}': {}",
                     toolName,
                     parsed ? std::string("not a JSON object") : parsed.error().message);
        return nlohmann::json::object();
    }
    log::warning("Unexpected arguments type in tool call '{}': {}", toolName, arguments->type_name());
    return nlohmann::json::object();
}

auto providerName(const ToolAdapter& adapter) -> std::string_view
{
    return std::visit([](const auto& a) { return a.providerName(); }, adapter);
}

auto parseToolCalls(const ToolAdapter& adapter, const nlohmann::json& response) -> std::vector<FunctionCall>
{
    return std::visit([&](const auto& a) { return a.parseToolCalls(response); }, adapter);
}

auto formatToolResult(const ToolAdapter& adapter, const FunctionCallResult& result) -> nlohmann::json
{
    return std::visit([&](const auto& a) { return a.formatToolResult(result); }, adapter);
}

auto toolChoice(const ToolAdapter& adapter, ToolChoiceMode mode) -> nlohmann::json
{
    return std::visit([&](const auto& a) { return a.toolChoice(mode); }, adapter);
}

auto extractContent(const ToolAdapter& adapter, const nlohmann::json& response) -> std::optional<std::string>
{
    return std::visit([&](const auto& a) { return a.extractContent(response); }, adapter);
}

auto hasToolCalls(const ToolAdapter& adapter, const nlohmann::json& response) -> bool
{
    return std::visit([&](const auto& a) { return a.hasToolCalls(response); }, adapter);
}

auto isFinished(const ToolAdapter& adapter, const nlohmann::json& response) -> bool
{
    return std::visit([&](const auto& a) { return a.isFinished(response); }, adapter);
}

auto buildAssistantMessage(const ToolAdapter& adapter, const nlohmann::json& response) -> nlohmann::json
{
    return std::visit([&](const auto& a) { return a.buildAssistantMessage(response); }, adapter);
}

auto extractUsage(const ToolAdapter& adapter, const nlohmann::json& response) -> TokenUsage
{
    return std::visit([&](const auto& a) { return a.extractUsage(response); }, adapter);
}

} // namespace mcphub::llm
