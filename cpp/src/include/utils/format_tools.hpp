// Tools for formatting string
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "relayhub_utils_export.h"

namespace relayhub::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
RELAYHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a time_point as an ISO-8601 UTC timestamp with millisecond precision.
 * @return A string in the format "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
RELAYHUB_UTILS_EXPORT std::string iso8601_utc(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Extracts a value from a dictionary-like string.
 *
 * Parses a string containing key-value pairs (e.g. "type=caller&channel=AB12CD34")
 * and returns the value for a specified key. Whitespace around separators and
 * assignment symbols is trimmed. The first occurrence of @p keyword wins.
 *
 * @param keyword The key to search for.
 * @param input The string_view to parse.
 * @param separator The character separating key-value pairs.
 * @param assignment_symbol The character separating a key from its value.
 * @return The value if found, otherwise std::nullopt.
 */
RELAYHUB_UTILS_EXPORT std::optional<std::string>
extract_value_from_string(std::string_view keyword, std::string_view input, char separator = ';',
                          char assignment_symbol = '=');

/// Returns @p sv with leading and trailing ASCII whitespace removed.
RELAYHUB_UTILS_EXPORT std::string_view trim_whitespace(std::string_view sv) noexcept;

} // namespace relayhub::format_tools
