// SPDX-License-Identifier: Apache-2.0
#include "ToolName.hpp"

#include <format>

namespace mcphub
{

auto makeMcpToolName(std::string_view server, std::string_view tool) -> std::string
{
    return std::format("{}{}{}{}", McpToolPrefix, server, McpToolSeparator, tool);
}

auto parseMcpToolName(std::string_view name) -> std::optional<McpToolName>
{
    if (!isMcpToolName(name))
        return std::nullopt;

    auto const rest = name.substr(McpToolPrefix.size());
    auto const sep = rest.find(McpToolSeparator);
    if (sep == std::string_view::npos || sep == 0 || sep + McpToolSeparator.size() >= rest.size())
        return std::nullopt;

    return McpToolName {
        .server = std::string(rest.substr(0, sep)),
        .tool = std::string(rest.substr(sep + McpToolSeparator.size())),
    };
}

auto isMcpToolName(std::string_view name) -> bool
{
    return name.starts_with(McpToolPrefix);
}

} // namespace mcphub
