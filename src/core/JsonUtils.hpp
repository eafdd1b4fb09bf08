// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "Error.hpp"

namespace replbridge::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError carrying the parser's message.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, e.what());
    }
}

/// @brief Serializes a JSON value onto a single line.
///
/// Invalid UTF-8 inside strings is replaced with U+FFFD instead of throwing.
/// Error messages may quote raw input bytes, so every outgoing message is
/// written through this function.
[[nodiscard]] inline auto serialize(const nlohmann::json& value) -> std::string
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional object field from a JSON object.
/// @return The field value, or an empty object if it is missing or not an object.
[[nodiscard]] inline auto getObjectOr(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_object())
        return obj[keyStr];
    return nlohmann::json::object();
}

} // namespace replbridge::json
