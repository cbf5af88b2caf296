// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

namespace mcphub
{

/// @brief Generates a random RFC 4122 version 4 UUID in canonical textual form.
[[nodiscard]] auto generateUuid() -> std::string;

/// @brief Returns the current UTC time as an RFC 3339 timestamp with millisecond precision.
[[nodiscard]] auto currentTimestamp() -> std::string;

} // namespace mcphub
