// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpTypes.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcphub::validation
{

constexpr auto MaxServerIdLength = std::size_t { 64 };
constexpr auto MaxServerNameLength = std::size_t { 64 };
constexpr auto MaxDescriptionLength = std::size_t { 1024 };
constexpr auto MaxArgsCount = std::size_t { 50 };
constexpr auto MaxArgLength = std::size_t { 512 };
constexpr auto MaxEnvCount = std::size_t { 50 };
constexpr auto MaxEnvNameLength = std::size_t { 128 };
constexpr auto MaxEnvValueLength = std::size_t { 4096 };
constexpr auto MaxToolNameLength = std::size_t { 128 };

/// @brief Validates a server id: non-empty, at most 64 characters, [A-Za-z0-9_-] only.
/// @return The trimmed id or a ConfigurationError for field @c id.
[[nodiscard]] auto validateServerId(std::string_view id) -> Result<std::string>;

/// @brief Validates a server name: non-empty, at most 64 characters, no control characters.
/// @return The trimmed name or a ConfigurationError for field @c name.
[[nodiscard]] auto validateServerName(std::string_view name) -> Result<std::string>;

/// @brief Validates a tool name: non-empty, at most 128 characters, [A-Za-z0-9_-:/] only.
/// @return The trimmed name or an InvalidArgument error.
[[nodiscard]] auto validateToolName(std::string_view name) -> Result<std::string>;

/// @brief Validates a whole server configuration.
///
/// Checks id and name, description length, args count and length (no NUL bytes),
/// env count, env names ([A-Za-z0-9_], at most 128) and values (at most 4096, no NUL).
/// @return A normalised copy (trimmed id, name and description) or a ConfigurationError.
[[nodiscard]] auto validateServerConfig(const ServerConfig& config) -> Result<ServerConfig>;

} // namespace mcphub::validation
