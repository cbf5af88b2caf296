// SPDX-License-Identifier: Apache-2.0
#include "ConfigValidation.hpp"

#include <mcp/ToolName.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace mcphub::validation
{

namespace
{

    auto trim(std::string_view text) -> std::string_view
    {
        auto const isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!text.empty() && isSpace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto isAsciiAlnum(char c) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }

    auto hasControlCharacter(std::string_view text) -> bool
    {
        return std::ranges::any_of(text, [](char c) {
            auto const u = static_cast<unsigned char>(c);
            return (u < 0x20 && c != '\n') || u == 0x7F;
        });
    }

} // namespace

auto validateServerId(std::string_view id) -> Result<std::string>
{
    auto const trimmed = trim(id);
    if (trimmed.empty())
        return makeConfigError(id, "id", "server id cannot be empty");
    if (trimmed.size() > MaxServerIdLength)
        return makeConfigError(trimmed, "id", std::format("server id exceeds {} characters", MaxServerIdLength));
    if (!std::ranges::all_of(trimmed, [](char c) { return isAsciiAlnum(c) || c == '_' || c == '-'; }))
        return makeConfigError(trimmed, "id", "server id may only contain letters, digits, '_' and '-'");
    return std::string(trimmed);
}

auto validateServerName(std::string_view name) -> Result<std::string>
{
    auto const trimmed = trim(name);
    if (trimmed.empty())
        return makeConfigError(name, "name", "server name cannot be empty");
    if (trimmed.size() > MaxServerNameLength)
        return makeConfigError(trimmed, "name", std::format("server name exceeds {} characters", MaxServerNameLength));
    if (hasControlCharacter(trimmed))
        return makeConfigError(trimmed, "name", "server name cannot contain control characters");
    // Routed tool names split on the first separator after the server name.
    if (trimmed.contains(McpToolSeparator) || trimmed.ends_with('_'))
        return makeConfigError(
            trimmed, "name", std::format("server name cannot contain '{}' or end with '_'", McpToolSeparator));
    return std::string(trimmed);
}

auto validateToolName(std::string_view name) -> Result<std::string>
{
    auto const trimmed = trim(name);
    if (trimmed.empty())
        return makeError(ErrorCode::InvalidArgument, "Tool name cannot be empty");
    if (trimmed.size() > MaxToolNameLength)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Tool name exceeds {} characters", MaxToolNameLength));
    if (!std::ranges::all_of(
            trimmed, [](char c) { return isAsciiAlnum(c) || c == '_' || c == '-' || c == ':' || c == '/'; }))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Tool name '{}' may only contain letters, digits, '_', '-', ':' and '/'", trimmed));
    return std::string(trimmed);
}

auto validateServerConfig(const ServerConfig& config) -> Result<ServerConfig>
{
    auto id = validateServerId(config.id);
    if (!id)
        return std::unexpected(id.error());

    auto name = validateServerName(config.name);
    if (!name)
        return std::unexpected(name.error());

    auto validated = config;
    validated.id = std::move(*id);
    validated.name = std::move(*name);

    if (config.description)
    {
        auto const description = trim(*config.description);
        if (description.size() > MaxDescriptionLength)
            return makeConfigError(validated.name,
                                   "description",
                                   std::format("description exceeds {} characters", MaxDescriptionLength));
        if (hasControlCharacter(description))
            return makeConfigError(validated.name, "description", "description cannot contain control characters");
        validated.description =
            description.empty() ? std::nullopt : std::optional<std::string>(std::string(description));
    }

    if (config.args.size() > MaxArgsCount)
        return makeConfigError(validated.name, "args", std::format("too many arguments (max {})", MaxArgsCount));

    for (auto i = std::size_t { 0 }; i < config.args.size(); ++i)
    {
        auto const& arg = config.args[i];
        if (arg.size() > MaxArgLength)
            return makeConfigError(validated.name,
                                   std::format("args[{}]", i),
                                   std::format("argument exceeds {} characters", MaxArgLength));
        if (arg.find('\0') != std::string::npos)
            return makeConfigError(validated.name, std::format("args[{}]", i), "argument contains a NUL character");
    }

    if (config.env.size() > MaxEnvCount)
        return makeConfigError(validated.name, "env", std::format("too many environment variables (max {})", MaxEnvCount));

    for (const auto& [key, value]: config.env)
    {
        auto const field = std::format("env.{}", key);
        if (key.empty())
            return makeConfigError(validated.name, "env", "environment variable name cannot be empty");
        if (key.size() > MaxEnvNameLength)
            return makeConfigError(validated.name,
                                   field,
                                   std::format("variable name exceeds {} characters", MaxEnvNameLength));
        if (!std::ranges::all_of(key, [](char c) { return isAsciiAlnum(c) || c == '_'; }))
            return makeConfigError(validated.name, field, "variable name may only contain letters, digits and '_'");
        if (value.size() > MaxEnvValueLength)
            return makeConfigError(validated.name,
                                   field,
                                   std::format("value exceeds {} characters", MaxEnvValueLength));
        if (value.find('\0') != std::string::npos)
            return makeConfigError(validated.name, field, "value contains a NUL character");
    }

    return validated;
}

} // namespace mcphub::validation
