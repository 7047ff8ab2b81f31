// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcphub::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Looks up a member of a JSON object.
///
/// A non-object @p obj has no members.
/// @return The member, or nullptr if @p obj is not an object or lacks @p key.
[[nodiscard]] inline auto member(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(key);
    return it != obj.end() ? &*it : nullptr;
}

/// @brief Extracts a required string field from a JSON object.
/// @return The string value, or a ProtocolError naming the field.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const* value = member(obj, key);
    if (!value || !value->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return value->get<std::string>();
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const* value = member(obj, key);
    return value && value->is_string() ? value->get<std::string>() : std::string(defaultValue);
}

/// @brief Extracts an optional integer field. Values outside the int range and
///        non-integral numbers yield @p defaultValue.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const* value = member(obj, key);
    if (!value || !value->is_number_integer())
        return defaultValue;

    auto const wide = value->get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max())
        return defaultValue;
    return static_cast<int>(wide);
}

/// @brief Extracts an optional numeric field, integral or not.
[[nodiscard]] inline auto getDoubleOr(const nlohmann::json& obj, std::string_view key, double defaultValue)
    -> double
{
    auto const* value = member(obj, key);
    return value && value->is_number() ? value->get<double>() : defaultValue;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const* value = member(obj, key);
    return value && value->is_boolean() ? value->get<bool>() : defaultValue;
}

/// @brief Extracts the string elements of an optional array field, skipping non-strings.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    auto const* array = member(obj, key);
    if (!array || !array->is_array())
        return values;

    for (auto const& item: *array)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts the string members of an optional object field, skipping non-strings.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    auto const* table = member(obj, key);
    if (!table || !table->is_object())
        return values;

    for (auto const& [name, value]: table->items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

} // namespace mcphub::json
