// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphub
{

namespace
{

    constexpr auto ConfigSubject = std::string_view { "config" };

    auto parseBreaker(const nlohmann::json& obj, CircuitBreakerConfig defaults) -> CircuitBreakerConfig
    {
        return CircuitBreakerConfig {
            .failureThreshold = static_cast<uint32_t>(
                json::getUint64Or(obj, "failureThreshold", defaults.failureThreshold)),
            .cooldown = std::chrono::seconds(json::getUint64Or(
                obj,
                "cooldownSeconds",
                static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(defaults.cooldown).count()))),
            .successThreshold = static_cast<uint32_t>(
                json::getUint64Or(obj, "successThreshold", defaults.successThreshold)),
        };
    }

    auto breakerToJson(const CircuitBreakerConfig& config) -> nlohmann::json
    {
        return nlohmann::json {
            { "failureThreshold", config.failureThreshold },
            { "cooldownSeconds", std::chrono::duration_cast<std::chrono::seconds>(config.cooldown).count() },
            { "successThreshold", config.successThreshold },
        };
    }

    auto homeRelative(const char* xdgVariable, std::string_view homeSuffix) -> std::string
    {
        if (auto const* const xdg = std::getenv(xdgVariable); xdg && *xdg)
            return std::format("{}/mcphub", xdg);
        if (auto const* const home = std::getenv("HOME"); home && *home)
            return std::format("{}/{}/mcphub", home, homeSuffix);
        return ".";
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    return homeRelative("XDG_CONFIG_HOME", ".config");
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultDataDir() -> std::string
{
    return homeRelative("XDG_DATA_HOME", ".local/share");
}

auto defaultDatabasePath() -> std::string
{
    return defaultDataDir() + "/mcphub.db";
}

auto resolveDatabasePath(const AppConfig& config) -> std::string
{
    return config.databasePath.empty() ? defaultDatabasePath() : config.databasePath;
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeConfigError(ConfigSubject, "", "top level must be a JSON object");

    auto config = AppConfig {};

    if (root.contains("log"))
    {
        auto const levelName = json::getStringOr(root["log"], "level", "info");
        auto const level = log::levelFromString(levelName);
        if (!level)
            return makeConfigError(ConfigSubject, "log.level", std::format("unknown log level '{}'", levelName));
        config.logLevel = *level;
    }

    if (root.contains("database"))
        config.databasePath = json::getStringOr(root["database"], "path", "");

    if (root.contains("mcp"))
    {
        auto const& mcp = root["mcp"];
        config.mcp.requestTimeout = std::chrono::milliseconds(
            json::getUint64Or(mcp, "requestTimeoutMs", static_cast<uint64_t>(config.mcp.requestTimeout.count())));
        config.mcp.testConnectionTimeout = std::chrono::milliseconds(json::getUint64Or(
            mcp, "testConnectionTimeoutMs", static_cast<uint64_t>(config.mcp.testConnectionTimeout.count())));
        config.mcp.healthCheckInterval = std::chrono::seconds(json::getUint64Or(
            mcp, "healthCheckIntervalSeconds", static_cast<uint64_t>(config.mcp.healthCheckInterval.count())));

        if (config.mcp.requestTimeout.count() == 0)
            return makeConfigError(ConfigSubject, "mcp.requestTimeoutMs", "must be greater than zero");
        if (config.mcp.healthCheckInterval.count() == 0)
            return makeConfigError(ConfigSubject, "mcp.healthCheckIntervalSeconds", "must be greater than zero");

        if (mcp.contains("launchers"))
        {
            for (const auto& [methodName, launcher]: json::toStringMap(mcp["launchers"]))
            {
                auto const method = deploymentMethodFromString(methodName);
                if (!method || *method == DeploymentMethod::Http)
                    return makeConfigError(ConfigSubject,
                                           std::format("mcp.launchers.{}", methodName),
                                           "only docker, npx and uvx have launchers");
                config.mcp.launchers[*method] = launcher;
            }
        }
    }

    if (root.contains("circuitBreaker"))
    {
        config.circuitBreaker = parseBreaker(root["circuitBreaker"], config.circuitBreaker);
        if (config.circuitBreaker.failureThreshold == 0 || config.circuitBreaker.successThreshold == 0)
            return makeConfigError(ConfigSubject, "circuitBreaker", "thresholds must be greater than zero");
    }

    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto server = serverConfigFromJson(name, serverJson);
            if (!server)
                return std::unexpected(server.error());
            config.mcpServers.push_back(std::move(*server));
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeConfigError(ConfigSubject, "", std::format("cannot open config file {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    return configFromJson(*parseResult);
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["log"] = { { "level", std::string(log::levelToString(config.logLevel)) } };
    root["database"] = { { "path", resolveDatabasePath(config) } };

    auto launchers = nlohmann::json::object();
    for (const auto& [method, launcher]: config.mcp.launchers)
        launchers[std::string(deploymentMethodToString(method))] = launcher;

    root["mcp"] = {
        { "requestTimeoutMs", config.mcp.requestTimeout.count() },
        { "testConnectionTimeoutMs", config.mcp.testConnectionTimeout.count() },
        { "healthCheckIntervalSeconds", config.mcp.healthCheckInterval.count() },
        { "launchers", std::move(launchers) },
    };
    root["circuitBreaker"] = breakerToJson(config.circuitBreaker);

    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (const auto& server: config.mcpServers)
        {
            auto entry = serverConfigToJson(server);
            entry.erase("name");
            servers[server.name] = std::move(entry);
        }
        root["mcpServers"] = std::move(servers);
    }

    return root;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto makeManagerConfig(const AppConfig& config) -> ManagerConfig
{
    return ManagerConfig {
        .client =
            ClientOptions {
                .requestTimeout = config.mcp.requestTimeout,
                .httpTimeout = config.mcp.requestTimeout,
                .launchers = config.mcp.launchers,
            },
        .circuitBreaker = config.circuitBreaker,
        .healthCheckInterval = config.mcp.healthCheckInterval,
        .clientFactory = {},
    };
}

} // namespace mcphub
