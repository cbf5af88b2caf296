// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Prefix that marks a function name as an MCP tool routed through the manager.
constexpr auto McpToolPrefix = std::string_view { "mcp__" };

/// @brief Separator between server and tool in a routed function name.
constexpr auto McpToolSeparator = std::string_view { "__" };

/// @brief A routed tool address.
struct McpToolName
{
    std::string server;
    std::string tool;
};

/// @brief Builds @c mcp__<server>__<tool>.
[[nodiscard]] auto makeMcpToolName(std::string_view server, std::string_view tool) -> std::string;

/// @brief Splits @c mcp__<server>__<tool> at the first separator after the prefix.
///
/// Tool names may themselves contain @c __; server names may not.
/// @return The address, or std::nullopt if the name is not a routed MCP name.
[[nodiscard]] auto parseMcpToolName(std::string_view name) -> std::optional<McpToolName>;

/// @brief Returns true if @p name carries the MCP routing prefix.
[[nodiscard]] auto isMcpToolName(std::string_view name) -> bool;

} // namespace mcphub
