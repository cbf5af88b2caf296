// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Uuid.hpp>
#include <llm/ToolAdapter.hpp>
#include <mcp/ToolName.hpp>
#include <mcphub/App.hpp>
#include <mcphub/Config.hpp>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <print>
#include <string>
#include <vector>

using namespace mcphub;

namespace
{

auto fail(const Error& error) -> int
{
    std::println(stderr, "Error: {}", error);
    return 1;
}

auto parseEnvAssignments(const std::vector<std::string>& assignments) -> Result<std::map<std::string, std::string>>
{
    auto env = std::map<std::string, std::string> {};
    for (const auto& assignment: assignments)
    {
        auto const eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Environment assignment '{}' is not of the form KEY=VALUE", assignment));
        env[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }
    return env;
}

auto findStored(App& app, const std::string& name) -> Result<store::StoredServer>
{
    auto stored = app.store().getServerByName(name);
    if (!stored)
        return std::unexpected(stored.error());
    if (!*stored)
        return makeError(ErrorCode::ServerNotFound, std::format("MCP server '{}' not found", name));
    return std::move(**stored);
}

void printServer(const McpServer& server)
{
    std::println("{:<24} {:<8} {:<13} {:>3} tools  {}",
                 server.config.name,
                 deploymentMethodToString(server.config.deploymentMethod),
                 serverStatusToString(server.status),
                 server.tools.size(),
                 server.config.enabled ? "" : "(disabled)");
}

auto setEnabled(App& app, const std::string& name, bool enabled) -> int
{
    auto stored = findStored(app, name);
    if (!stored)
        return fail(stored.error());

    auto config = stored->config;
    config.enabled = enabled;
    auto updated = app.manager().updateServerConfig(config);
    if (!updated)
        return fail(updated.error());

    std::println("{} {}", enabled ? "Enabled" : "Disabled", name);
    return 0;
}

/// Reads one provider response per line, executes its tool calls and answers each
/// with the provider-formatted tool message.
auto serve(App& app, const llm::ToolAdapter& adapter) -> int
{
    auto& manager = app.manager();
    manager.loadFromStore();
    manager.startHealthChecks();

    std::println("{}", llm::formatTools(manager.agentToolDefinitions()).dump());
    std::fflush(stdout);

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;

        auto response = json::parse(line);
        if (!response || !response->is_object())
        {
            log::warning("Ignoring malformed response line");
            continue;
        }

        if (!llm::hasToolCalls(adapter, *response))
        {
            log::debug("{} response without tool calls", llm::providerName(adapter));
            continue;
        }

        for (const auto& call: llm::parseToolCalls(adapter, *response))
        {
            auto const result = manager.executeFunctionCall(call);
            std::println("{}", llm::formatToolResult(adapter, result).dump());
        }
        std::fflush(stdout);
    }

    manager.shutdown();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphub - MCP server manager and tool router" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* serversCmd = app.add_subcommand("servers", "List configured MCP servers");
    auto connectAll = false;
    serversCmd->add_flag("--connect", connectAll, "Start enabled servers to report live status");

    auto* addCmd = app.add_subcommand("add", "Add (and start) an MCP server");
    auto addName = std::string {};
    auto addId = std::string {};
    auto addMethod = std::string {};
    auto addArgs = std::vector<std::string> {};
    auto addEnv = std::vector<std::string> {};
    auto addDescription = std::string {};
    auto addDisabled = false;
    addCmd->add_option("name", addName, "Server name")->required();
    addCmd->add_option("-m,--method", addMethod, "Deployment method (docker|npx|uvx|http)")->required();
    addCmd->add_option("--id", addId, "Server id (defaults to a generated id)");
    addCmd->add_option("-a,--arg", addArgs, "Launcher argument, or the URL for http (repeatable)");
    addCmd->add_option("-e,--env", addEnv, "Environment variable KEY=VALUE (repeatable)");
    addCmd->add_option("-d,--description", addDescription, "Description");
    addCmd->add_flag("--disabled", addDisabled, "Store the server without starting it");

    auto* removeCmd = app.add_subcommand("remove", "Delete an MCP server configuration");
    auto removeName = std::string {};
    removeCmd->add_option("name", removeName, "Server name")->required();

    auto* enableCmd = app.add_subcommand("enable", "Enable an MCP server");
    auto enableName = std::string {};
    enableCmd->add_option("name", enableName, "Server name")->required();

    auto* disableCmd = app.add_subcommand("disable", "Disable an MCP server");
    auto disableName = std::string {};
    disableCmd->add_option("name", disableName, "Server name")->required();

    auto* testCmd = app.add_subcommand("test", "Probe an MCP server without registering it");
    auto testName = std::string {};
    testCmd->add_option("name", testName, "Server name")->required();

    auto* toolsCmd = app.add_subcommand("tools", "List the tools of one or all enabled servers");
    auto toolsName = std::string {};
    auto toolsFormat = std::string {};
    toolsCmd->add_option("name", toolsName, "Server name");
    toolsCmd->add_option("--format", toolsFormat, "Print as LLM tool definitions (openai|mistral|ollama)");

    auto* callCmd = app.add_subcommand("call", "Call a tool");
    auto callServer = std::string {};
    auto callTool = std::string {};
    auto callArgs = std::string { "{}" };
    callCmd->add_option("server", callServer, "Server name")->required();
    callCmd->add_option("tool", callTool, "Tool name")->required();
    callCmd->add_option("--args", callArgs, "Tool arguments as a JSON object");

    auto* logsCmd = app.add_subcommand("logs", "Show recent tool calls");
    auto logsServer = std::string {};
    auto logsLimit = std::size_t { 20 };
    logsCmd->add_option("server", logsServer, "Restrict to one server");
    logsCmd->add_option("-n,--limit", logsLimit, "Number of entries");

    auto* metricsCmd = app.add_subcommand("metrics", "Show latency percentiles of a server");
    auto metricsName = std::string {};
    metricsCmd->add_option("name", metricsName, "Server name")->required();

    auto* serveCmd = app.add_subcommand("serve", "Start all enabled servers and execute tool calls of LLM responses read from stdin");
    auto serveProvider = std::string { "openai" };
    serveCmd->add_option("--provider", serveProvider, "Tool message dialect (openai|mistral|ollama)");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    if (!configResult)
        return fail(configResult.error());
    if (verbose)
        configResult->logLevel = log::Level::Debug;

    auto application = mcphub::App(std::move(*configResult));
    if (auto initResult = application.initialize(); !initResult)
        return fail(initResult.error());

    auto& manager = application.manager();

    if (*serversCmd)
    {
        if (connectAll)
            manager.loadFromStore();
        auto servers = manager.listServers();
        if (!servers)
            return fail(servers.error());
        for (const auto& server: *servers)
            printServer(server);
        return 0;
    }

    if (*addCmd)
    {
        auto method = deploymentMethodFromString(addMethod);
        if (!method)
            return fail(makeConfigError(addName, "command", std::format("unknown deployment method '{}'", addMethod))
                            .error());
        auto env = parseEnvAssignments(addEnv);
        if (!env)
            return fail(env.error());

        auto config = ServerConfig {
            .id = addId.empty() ? generateUuid() : addId,
            .name = addName,
            .enabled = !addDisabled,
            .deploymentMethod = *method,
            .args = addArgs,
            .env = std::move(*env),
            .description = addDescription.empty() ? std::nullopt : std::optional(addDescription),
        };

        auto server = manager.spawnServer(config);
        if (!server)
            return fail(server.error());
        printServer(*server);
        return 0;
    }

    if (*removeCmd)
    {
        auto stored = findStored(application, removeName);
        if (!stored)
            return fail(stored.error());
        if (auto deleted = manager.deleteServerConfig(stored->config.id); !deleted)
            return fail(deleted.error());
        std::println("Removed {}", removeName);
        return 0;
    }

    if (*enableCmd)
        return setEnabled(application, enableName, true);

    if (*disableCmd)
        return setEnabled(application, disableName, false);

    if (*testCmd)
    {
        auto stored = findStored(application, testName);
        if (!stored)
            return fail(stored.error());

        auto options = makeManagerConfig(application.config()).client;
        options.requestTimeout = application.config().mcp.testConnectionTimeout;
        auto const result = McpClient::testConnection(stored->config, options);
        std::println("{} ({}ms): {}", result.success ? "OK" : "FAILED", result.latencyMs, result.message);
        return result.success ? 0 : 1;
    }

    if (*toolsCmd)
    {
        if (toolsName.empty())
            manager.loadFromStore();
        else if (auto restarted = manager.restartServer(toolsName); !restarted)
            return fail(restarted.error());

        if (!toolsFormat.empty())
        {
            if (!llm::providerKindFromString(toolsFormat))
                return fail(Error { .code = ErrorCode::InvalidArgument,
                                    .message = std::format("Unknown provider '{}'", toolsFormat) });
            std::println("{}", llm::formatTools(manager.agentToolDefinitions()).dump(2));
            return 0;
        }

        for (const auto& [server, tools]: manager.listAllTools())
        {
            for (const auto& tool: tools)
                std::println("{:<48} {}", makeMcpToolName(server, tool.name), tool.description);
        }
        return 0;
    }

    if (*callCmd)
    {
        auto arguments = json::parse(callArgs);
        if (!arguments)
            return fail(arguments.error());

        if (auto restarted = manager.restartServer(callServer); !restarted)
            return fail(restarted.error());

        auto result = manager.callTool(callServer, callTool, *arguments);
        if (!result)
            return fail(result.error());

        std::println("{}", result->content.dump(2));
        if (!result->success)
            std::println(stderr, "Tool reported an error ({}ms)", result->durationMs);
        return result->success ? 0 : 1;
    }

    if (*logsCmd)
    {
        auto const server = logsServer.empty() ? std::nullopt : std::optional<std::string_view>(logsServer);
        auto calls = manager.recentCalls(server, logsLimit);
        if (!calls)
            return fail(calls.error());
        for (const auto& call: *calls)
            std::println("{} {:<20} {:<24} {:<5} {}ms",
                         call.timestamp,
                         call.serverName,
                         call.toolName,
                         call.success ? "ok" : "fail",
                         call.durationMs);
        return 0;
    }

    if (*metricsCmd)
    {
        auto metrics = manager.latencyMetrics(metricsName);
        if (!metrics)
            return fail(metrics.error());
        std::println("{}: {} calls, p50 {}ms, p95 {}ms, p99 {}ms",
                     metrics->serverName,
                     metrics->totalCalls,
                     metrics->p50Ms,
                     metrics->p95Ms,
                     metrics->p99Ms);
        return 0;
    }

    if (*serveCmd)
    {
        auto const kind = llm::providerKindFromString(serveProvider);
        if (!kind)
            return fail(Error { .code = ErrorCode::InvalidArgument,
                                .message = std::format("Unknown provider '{}'", serveProvider) });
        return serve(application, llm::makeToolAdapter(*kind));
    }

    return 0;
}
