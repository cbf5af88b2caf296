// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcphub::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or a SerializationError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::SerializationError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional string field, returning std::nullopt when absent or not a string.
[[nodiscard]] inline auto getOptionalString(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::string>
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::nullopt;
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional unsigned 64-bit integer field from a JSON object.
///
/// Negative values are treated as missing.
[[nodiscard]] inline auto getUint64Or(const nlohmann::json& obj, std::string_view key, uint64_t defaultValue)
    -> uint64_t
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr))
    {
        auto const& value = obj[keyStr];
        if (value.is_number_unsigned())
            return value.get<uint64_t>();
        if (value.is_number_integer() && value.get<int64_t>() >= 0)
            return static_cast<uint64_t>(value.get<int64_t>());
    }
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts the string elements of an array field, skipping non-string elements.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return result;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Converts a JSON object of string values into a map, skipping non-string values.
[[nodiscard]] inline auto toStringMap(const nlohmann::json& obj) -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    if (!obj.is_object())
        return result;

    for (const auto& [key, value]: obj.items())
    {
        if (value.is_string())
            result[key] = value.get<std::string>();
    }
    return result;
}

/// @brief Looks up a value by JSON pointer (e.g. "/choices/0/message"), returning nullptr when absent.
[[nodiscard]] inline auto pointer(const nlohmann::json& obj, const char* path) -> const nlohmann::json*
{
    auto const ptr = nlohmann::json::json_pointer(path);
    if (!obj.contains(ptr))
        return nullptr;
    return &obj.at(ptr);
}

} // namespace mcphub::json
