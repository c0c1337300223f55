#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace util {

using timestamp_t = std::chrono::system_clock::time_point;

/**
 * @brief Formats a timestamp as RFC 3339 in UTC with microsecond precision
 */
[[nodiscard]] std::string format_timestamp(timestamp_t tp);

/**
 * @brief Parses an RFC 3339 timestamp
 *
 * Accepts optional fractional seconds and either a 'Z' suffix or a numeric offset.
 * A timestamp without zone designator is taken as UTC.
 *
 * @throws std::invalid_argument if the text is not a valid timestamp
 */
[[nodiscard]] timestamp_t parse_timestamp(std::string_view text);

// formats the UTC calendar time of tp with a strftime-like pattern
[[nodiscard]] std::string format_utc(timestamp_t tp, std::string_view pattern);

} // namespace util
