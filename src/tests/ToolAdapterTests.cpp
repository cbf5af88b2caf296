// SPDX-License-Identifier: Apache-2.0
#include <llm/ToolAdapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace mcphub;
using namespace mcphub::llm;

namespace
{

auto openAiResponse(nlohmann::json toolCalls, nlohmann::json finishReason = "tool_calls") -> nlohmann::json
{
    return nlohmann::json {
        { "choices",
          nlohmann::json::array({
              { { "message", { { "role", "assistant" }, { "content", nullptr }, { "tool_calls", std::move(toolCalls) } } },
                { "finish_reason", std::move(finishReason) } },
          }) },
    };
}

} // namespace

TEST_CASE("providerKindFromString accepts the supported families", "[llm]")
{
    CHECK(providerKindFromString("openai") == ProviderKind::OpenAiCompatible);
    CHECK(providerKindFromString("openai_compatible") == ProviderKind::OpenAiCompatible);
    CHECK(providerKindFromString("Mistral") == ProviderKind::Mistral);
    CHECK(providerKindFromString("OLLAMA") == ProviderKind::Ollama);
    CHECK(!providerKindFromString("anthropic").has_value());
}

TEST_CASE("makeToolAdapter selects the dialect", "[llm]")
{
    CHECK(providerName(makeToolAdapter(ProviderKind::OpenAiCompatible)) == "openai_compatible");
    CHECK(providerName(makeToolAdapter(ProviderKind::Mistral)) == "mistral");
    CHECK(providerName(makeToolAdapter(ProviderKind::Ollama)) == "ollama");
}

TEST_CASE("formatTools wraps definitions as functions", "[llm]")
{
    auto const tools = std::vector<ToolDefinition> {
        { .name = "mcp__fs__read_file",
          .description = "Reads a file",
          .inputSchema = { { "type", "object" }, { "required", { "path" } } } },
    };

    auto const formatted = formatTools(tools);

    REQUIRE(formatted.is_array());
    REQUIRE(formatted.size() == 1);
    CHECK(formatted[0]["type"] == "function");
    CHECK(formatted[0]["function"]["name"] == "mcp__fs__read_file");
    CHECK(formatted[0]["function"]["description"] == "Reads a file");
    CHECK(formatted[0]["function"]["parameters"]["required"][0] == "path");
}

TEST_CASE("Mistral adapter parses a tool call with string arguments", "[llm]")
{
    auto const adapter = makeToolAdapter(ProviderKind::Mistral);
    auto const response = openAiResponse(nlohmann::json::array({
        { { "id", "call_9" },
          { "type", "function" },
          { "function", { { "name", "MemoryTool" }, { "arguments", R"({"operation":"add"})" } } } },
    }));

    auto const calls = parseToolCalls(adapter, response);

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].id == "call_9");
    CHECK(calls[0].name == "MemoryTool");
    CHECK(calls[0].arguments == nlohmann::json { { "operation", "add" } });
    CHECK(hasToolCalls(adapter, response));
    CHECK(!isFinished(adapter, response));
}

TEST_CASE("OpenAI adapter normalises unusable arguments to an empty object", "[llm]")
{
    auto const adapter = makeToolAdapter(ProviderKind::OpenAiCompatible);
    auto const response = openAiResponse(nlohmann::json::array({
        { { "id", "call_1" }, { "function", { { "name", "broken" }, { "arguments", "{not json" } } } },
        { { "id", "call_2" }, { "function", { { "name", "array" }, { "arguments", "[1,2]" } } } },
        { { "id", "call_3" }, { "function", { { "name", "object" }, { "arguments", { { "x", 1 } } } } } },
        { { "id", "call_4" }, { "function", { { "name", "missing" } } } },
    }));

    auto const calls = parseToolCalls(adapter, response);

    REQUIRE(calls.size() == 4);
    CHECK(calls[0].arguments == nlohmann::json::object());
    CHECK(calls[1].arguments == nlohmann::json::object());
    CHECK(calls[2].arguments == nlohmann::json { { "x", 1 } });
    CHECK(calls[3].arguments == nlohmann::json::object());
}

TEST_CASE("OpenAI adapter skips tool calls without id or name", "[llm]")
{
    auto const adapter = makeToolAdapter(ProviderKind::OpenAiCompatible);
    auto const response = openAiResponse(nlohmann::json::array({
        { { "function", { { "name", "no_id" }, { "arguments", "{}" } } } },
        { { "id", "call_2" }, { "function", { { "arguments", "{}" } } } },
        { { "id", "call_3" }, { "function", { { "name", "ok" }, { "arguments", "{}" } } } },
    }));

    auto const calls = parseToolCalls(adapter, response);

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].id == "call_3");
}

TEST_CASE("Tool calls round-trip through an OpenAI-style response", "[llm]")
{
    auto const tool = ToolDefinition { .name = "mcp__notes__add", .description = "Adds a note", .inputSchema = {} };
    auto const arguments = nlohmann::json { { "title", "groceries" }, { "tags", { "home", "weekly" } } };

    auto const response = openAiResponse(nlohmann::json::array({
        { { "id", "call_rt" },
          { "type", "function" },
          { "function", { { "name", tool.name }, { "arguments", arguments.dump() } } } },
    }));

    for (auto const kind: { ProviderKind::OpenAiCompatible, ProviderKind::Mistral })
    {
        auto const calls = parseToolCalls(makeToolAdapter(kind), response);
        REQUIRE(calls.size() == 1);
        CHECK(calls[0].name == tool.name);
        CHECK(calls[0].arguments == arguments);
    }
}

TEST_CASE("Ollama adapter synthesises call ids", "[llm]")
{
    auto const adapter = makeToolAdapter(ProviderKind::Ollama);
    auto const response = nlohmann::json {
        { "message",
          { { "role", "assistant" },
            { "content", "" },
            { "tool_calls",
              nlohmann::json::array({
                  { { "function", { { "name", "TodoTool" }, { "arguments", { { "action", "add" }, { "title", "x" } } } } } },
                  { { "function", { { "name", "TodoTool" }, { "arguments", { { "action", "list" } } } } } },
              }) } } },
        { "done", true },
    };

    auto const calls = parseToolCalls(adapter, response);

    REQUIRE(calls.size() == 2);
    CHECK(calls[0].id.starts_with("ollama_"));
    CHECK(calls[0].name == "TodoTool");
    CHECK(calls[0].arguments == nlohmann::json { { "action", "add" }, { "title", "x" } });
    CHECK(calls[0].id != calls[1].id);

    // Pending tool calls keep the turn open even though Ollama reports done.
    CHECK(hasToolCalls(adapter, response));
    CHECK(!isFinished(adapter, response));
}

TEST_CASE("Ollama call ids do not collide", "[llm]")
{
    auto const adapter = makeToolAdapter(ProviderKind::Ollama);
    auto const response = nlohmann::json {
        { "message",
          { { "tool_calls",
              nlohmann::json::array({ { { "function", { { "name", "ping" }, { "arguments", nlohmann::json::object() } } } } }) } } },
    };

    auto ids = std::set<std::string> {};
    for (auto i = 0; i < 100; ++i)
        ids.insert(parseToolCalls(adapter, response).at(0).id);
    CHECK(ids.size() == 100);
}

TEST_CASE("Tool choice per dialect", "[llm]")
{
    auto const openAi = makeToolAdapter(ProviderKind::OpenAiCompatible);
    auto const mistral = makeToolAdapter(ProviderKind::Mistral);
    auto const ollama = makeToolAdapter(ProviderKind::Ollama);

    CHECK(toolChoice(openAi, ToolChoiceMode::Required) == "required");
    CHECK(toolChoice(openAi, ToolChoiceMode::Auto) == "auto");
    CHECK(toolChoice(openAi, ToolChoiceMode::None) == "none");
    CHECK(toolChoice(mistral, ToolChoiceMode::Required) == "any");
    CHECK(toolChoice(mistral, ToolChoiceMode::Auto) == "auto");
    CHECK(toolChoice(ollama, ToolChoiceMode::Required).is_null());
}

TEST_CASE("Tool results are formatted per dialect", "[llm]")
{
    auto const ok = FunctionCallResult::ok("call_9", "MemoryTool", { { "stored", true } });
    auto const failed = FunctionCallResult::failed("call_10", "MemoryTool", "disk full");

    auto const openAi = formatToolResult(makeToolAdapter(ProviderKind::OpenAiCompatible), ok);
    CHECK(openAi["role"] == "tool");
    CHECK(openAi["tool_call_id"] == "call_9");
    CHECK(openAi["name"] == "MemoryTool");
    CHECK(openAi["content"] == R"({"stored":true})");

    auto const ollama = formatToolResult(makeToolAdapter(ProviderKind::Ollama), failed);
    CHECK(ollama["role"] == "tool");
    CHECK(!ollama.contains("tool_call_id"));
    CHECK(ollama["content"] == R"({"error":"disk full"})");
}

TEST_CASE("resultToString falls back to a generic error", "[llm]")
{
    auto result = FunctionCallResult::failed("call_1", "x", "boom");
    result.error.reset();
    CHECK(resultToString(result) == R"({"error":"Unknown error"})");
}

TEST_CASE("extractUsage reads provider-specific token counts", "[llm]")
{
    auto const openAi = makeToolAdapter(ProviderKind::OpenAiCompatible);
    auto const ollama = makeToolAdapter(ProviderKind::Ollama);

    auto const openAiUsage =
        extractUsage(openAi, nlohmann::json { { "usage", { { "prompt_tokens", 120 }, { "completion_tokens", 45 } } } });
    CHECK(openAiUsage.inputTokens == 120);
    CHECK(openAiUsage.outputTokens == 45);

    auto const ollamaUsage = extractUsage(ollama, nlohmann::json { { "prompt_eval_count", 33 }, { "eval_count", 7 } });
    CHECK(ollamaUsage.inputTokens == 33);
    CHECK(ollamaUsage.outputTokens == 7);

    CHECK(extractUsage(openAi, nlohmann::json::object()) == TokenUsage {});
    CHECK(extractUsage(ollama, nlohmann::json::object()) == TokenUsage {});
}

TEST_CASE("extractContent and isFinished for plain answers", "[llm]")
{
    auto const openAi = makeToolAdapter(ProviderKind::OpenAiCompatible);
    auto const answer = nlohmann::json {
        { "choices",
          nlohmann::json::array({ { { "message", { { "role", "assistant" }, { "content", "Done." } } },
                                    { "finish_reason", "stop" } } }) },
    };
    CHECK(extractContent(openAi, answer) == "Done.");
    CHECK(!hasToolCalls(openAi, answer));
    CHECK(isFinished(openAi, answer));
    CHECK(buildAssistantMessage(openAi, answer)["content"] == "Done.");

    auto const ollama = makeToolAdapter(ProviderKind::Ollama);
    auto const streaming = nlohmann::json { { "message", { { "role", "assistant" }, { "content", "Do" } } }, { "done", false } };
    CHECK(extractContent(ollama, streaming) == "Do");
    CHECK(!isFinished(ollama, streaming));

    CHECK(!extractContent(openAi, nlohmann::json::object()).has_value());
    CHECK(buildAssistantMessage(ollama, nlohmann::json::object())["role"] == "assistant");
}
