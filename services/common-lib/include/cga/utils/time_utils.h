/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * ISO 8601 formatting/parsing and calendar arithmetic on
 * std::chrono::system_clock time points. All formatting is UTC.
 *
 * @version 1.0.0
 * @date 2026-02-02
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace cga {
namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Format time_point as ISO 8601 string
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56.789Z")
 */
std::string formatIso8601(const TimePoint& tp, bool includeMilliseconds = true);

/**
 * @brief Parse ISO 8601 UTC string to time_point
 *
 * Accepts "YYYY-MM-DDTHH:MM:SSZ" and "YYYY-MM-DDTHH:MM:SS.fffZ".
 * A space separator (PostgreSQL text output) is accepted in place of 'T'.
 *
 * @param iso8601 ISO 8601 formatted string
 * @return std::chrono time_point, or std::nullopt on error
 */
std::optional<TimePoint> parseIso8601(const std::string& iso8601);

/**
 * @brief Truncate a time_point to millisecond precision
 *
 * Values that round-trip through formatIso8601 compare equal after this.
 */
TimePoint truncateToMillis(const TimePoint& tp);

/**
 * @brief Add days to time_point
 *
 * @param tp Time point
 * @param days Number of days to add (can be negative)
 * @return New time_point
 */
TimePoint addDays(const TimePoint& tp, int days);

inline TimePoint addSeconds(const TimePoint& tp, int64_t seconds) {
    return tp + std::chrono::seconds(seconds);
}

/**
 * @brief Milliseconds since epoch
 */
int64_t toUnixMillis(const TimePoint& tp);

TimePoint fromUnixMillis(int64_t millis);

} // namespace utils
} // namespace cga
